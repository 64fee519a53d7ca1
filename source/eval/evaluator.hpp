#pragma once

#include <variant>
#include <vector>

#include <ast/expression.hpp>
#include <ast/statements.hpp>
#include <ast/visitor.hpp>

#include "completion.hpp"
#include "environment.hpp"
#include "reference.hpp"
#include "value.hpp"

/// tree walking evaluator, expressions leave a value or reference behind, statements a completion
struct evaluator final : visitor
{
    using result_type = std::variant<value, reference>;

    explicit evaluator(environment* env);

    auto execute(const statement* stmt) -> completion;
    auto evaluate(const expression* expr) -> result_type;
    auto evaluate_value(const expression* expr) -> value;

    /// calls a script or native function with an already evaluated `this` and argument list
    static auto apply_function(const value& callee, const value& this_value, std::vector<value>&& arguments)
        -> value;

  protected:
    void visit(const array_literal& expr) final;
    void visit(const assign_expression& expr) final;
    void visit(const binary_expression& expr) final;
    void visit(const block_statement& expr) final;
    void visit(const boolean_literal& expr) final;
    void visit(const break_statement& expr) final;
    void visit(const call_expression& expr) final;
    void visit(const comma_expression& expr) final;
    void visit(const conditional_expression& expr) final;
    void visit(const continue_statement& expr) final;
    void visit(const debugger_statement& expr) final;
    void visit(const do_while_statement& expr) final;
    void visit(const empty_statement& expr) final;
    void visit(const expression_statement& expr) final;
    void visit(const function_literal& expr) final;
    void visit(const identifier& expr) final;
    void visit(const if_statement& expr) final;
    void visit(const new_expression& expr) final;
    void visit(const null_literal& expr) final;
    void visit(const number_literal& expr) final;
    void visit(const object_literal& expr) final;
    void visit(const property_access& expr) final;
    void visit(const return_statement& expr) final;
    void visit(const string_literal& expr) final;
    void visit(const this_expression& expr) final;
    void visit(const unary_expression& expr) final;
    void visit(const var_declaration& expr) final;
    void visit(const var_statement& expr) final;
    void visit(const while_statement& expr) final;

  private:
    auto evaluate_reference(const expression* expr) -> reference;
    auto evaluate_arguments(const expressions& exprs) -> std::vector<value>;

    result_type m_result;
    completion m_completion;
    environment* m_env;
};
