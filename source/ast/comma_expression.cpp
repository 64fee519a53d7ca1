#include <string>

#include "comma_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto comma_expression::string() const -> std::string
{
    return fmt::format("({}, {})", left->string(), right->string());
}

void comma_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto comma_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const comma_expression*>(other);
    return rhs != nullptr && ast_equal(left, rhs->left) && ast_equal(right, rhs->right);
}
