#include <string>

#include "unary_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto unary_expression::string() const -> std::string
{
    using enum token_type;
    if (postfix) {
        return fmt::format("({}{})", operand->string(), op);
    }
    switch (op) {
        case delet:
        case voyd:
        case tipeof:
            return fmt::format("({} {})", op, operand->string());
        default:
            return fmt::format("({}{})", op, operand->string());
    }
}

void unary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto unary_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const unary_expression*>(other);
    return rhs != nullptr && op == rhs->op && postfix == rhs->postfix && ast_equal(operand, rhs->operand);
}
