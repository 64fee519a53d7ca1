#pragma once

#include <ast/array_literal.hpp>
#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/boolean_literal.hpp>
#include <ast/call_expression.hpp>
#include <ast/comma_expression.hpp>
#include <ast/conditional_expression.hpp>
#include <ast/expression.hpp>
#include <ast/function_literal.hpp>
#include <ast/identifier.hpp>
#include <ast/new_expression.hpp>
#include <ast/null_literal.hpp>
#include <ast/number_literal.hpp>
#include <ast/object_literal.hpp>
#include <ast/property_access.hpp>
#include <ast/statements.hpp>
#include <ast/string_literal.hpp>
#include <ast/this_expression.hpp>
#include <ast/unary_expression.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const array_literal& expr) = 0;
    virtual void visit(const assign_expression& expr) = 0;
    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const block_statement& expr) = 0;
    virtual void visit(const boolean_literal& expr) = 0;
    virtual void visit(const break_statement& expr) = 0;
    virtual void visit(const call_expression& expr) = 0;
    virtual void visit(const comma_expression& expr) = 0;
    virtual void visit(const conditional_expression& expr) = 0;
    virtual void visit(const continue_statement& expr) = 0;
    virtual void visit(const debugger_statement& expr) = 0;
    virtual void visit(const do_while_statement& expr) = 0;
    virtual void visit(const empty_statement& expr) = 0;
    virtual void visit(const expression_statement& expr) = 0;
    virtual void visit(const function_literal& expr) = 0;
    virtual void visit(const identifier& expr) = 0;
    virtual void visit(const if_statement& expr) = 0;
    virtual void visit(const new_expression& expr) = 0;
    virtual void visit(const null_literal& expr) = 0;
    virtual void visit(const number_literal& expr) = 0;
    virtual void visit(const object_literal& expr) = 0;
    virtual void visit(const property_access& expr) = 0;
    virtual void visit(const return_statement& expr) = 0;
    virtual void visit(const string_literal& expr) = 0;
    virtual void visit(const this_expression& expr) = 0;
    virtual void visit(const unary_expression& expr) = 0;
    virtual void visit(const var_declaration& expr) = 0;
    virtual void visit(const var_statement& expr) = 0;
    virtual void visit(const while_statement& expr) = 0;
};
