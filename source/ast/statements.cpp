#include <set>
#include <string>

#include "statements.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

namespace
{
template<typename Statements>
auto union_of_declared_vars(const Statements& stmts) -> std::set<std::string>
{
    std::set<std::string> vars;
    for (const auto* stmt : stmts) {
        vars.merge(stmt->declared_vars());
    }
    return vars;
}
}  // namespace

auto block_statement::string() const -> std::string
{
    if (statements.empty()) {
        return "{}";
    }
    return fmt::format("{{ {} }}", join(statements, " "));
}

void block_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto block_statement::declared_vars() const -> std::set<std::string>
{
    return union_of_declared_vars(statements);
}

auto block_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const block_statement*>(other);
    return rhs != nullptr && ast_equal(statements, rhs->statements);
}

auto var_declaration::string() const -> std::string
{
    if (value == nullptr) {
        return name->string();
    }
    return fmt::format("{} = {}", name->string(), value->string());
}

void var_declaration::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto var_declaration::declared_vars() const -> std::set<std::string>
{
    return {name->value};
}

auto var_declaration::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const var_declaration*>(other);
    return rhs != nullptr && ast_equal(name, rhs->name) && ast_equal(value, rhs->value);
}

auto var_statement::string() const -> std::string
{
    return fmt::format("var {};", join(declarations, ", "));
}

void var_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto var_statement::declared_vars() const -> std::set<std::string>
{
    return union_of_declared_vars(declarations);
}

auto var_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const var_statement*>(other);
    return rhs != nullptr && ast_equal(declarations, rhs->declarations);
}

auto empty_statement::string() const -> std::string
{
    return ";";
}

void empty_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto empty_statement::equals_to(const expression* other) const -> bool
{
    return dynamic_cast<const empty_statement*>(other) != nullptr;
}

auto expression_statement::string() const -> std::string
{
    return fmt::format("{};", expr->string());
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto expression_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const expression_statement*>(other);
    return rhs != nullptr && ast_equal(expr, rhs->expr);
}

auto if_statement::string() const -> std::string
{
    if (alternative == nullptr) {
        return fmt::format("if ({}) {}", condition->string(), consequence->string());
    }
    return fmt::format("if ({}) {} else {}", condition->string(), consequence->string(), alternative->string());
}

void if_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto if_statement::declared_vars() const -> std::set<std::string>
{
    auto vars = consequence->declared_vars();
    if (alternative != nullptr) {
        vars.merge(alternative->declared_vars());
    }
    return vars;
}

auto if_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const if_statement*>(other);
    return rhs != nullptr && ast_equal(condition, rhs->condition) && ast_equal(consequence, rhs->consequence)
        && ast_equal(alternative, rhs->alternative);
}

auto while_statement::string() const -> std::string
{
    return fmt::format("while ({}) {}", condition->string(), body->string());
}

void while_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto while_statement::declared_vars() const -> std::set<std::string>
{
    return body->declared_vars();
}

auto while_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const while_statement*>(other);
    return rhs != nullptr && ast_equal(condition, rhs->condition) && ast_equal(body, rhs->body);
}

auto do_while_statement::string() const -> std::string
{
    return fmt::format("do {} while ({});", body->string(), condition->string());
}

void do_while_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto do_while_statement::declared_vars() const -> std::set<std::string>
{
    return body->declared_vars();
}

auto do_while_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const do_while_statement*>(other);
    return rhs != nullptr && ast_equal(body, rhs->body) && ast_equal(condition, rhs->condition);
}

auto continue_statement::string() const -> std::string
{
    return "continue;";
}

void continue_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto continue_statement::equals_to(const expression* other) const -> bool
{
    return dynamic_cast<const continue_statement*>(other) != nullptr;
}

auto break_statement::string() const -> std::string
{
    return "break;";
}

void break_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto break_statement::equals_to(const expression* other) const -> bool
{
    return dynamic_cast<const break_statement*>(other) != nullptr;
}

auto return_statement::string() const -> std::string
{
    if (value == nullptr) {
        return "return;";
    }
    return fmt::format("return {};", value->string());
}

void return_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto return_statement::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const return_statement*>(other);
    return rhs != nullptr && ast_equal(value, rhs->value);
}

auto debugger_statement::string() const -> std::string
{
    return "debugger;";
}

void debugger_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto debugger_statement::equals_to(const expression* other) const -> bool
{
    return dynamic_cast<const debugger_statement*>(other) != nullptr;
}
