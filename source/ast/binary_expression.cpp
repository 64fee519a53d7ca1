#include <string>

#include "binary_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto binary_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", left->string(), op, right->string());
}

void binary_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto binary_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const binary_expression*>(other);
    return rhs != nullptr && op == rhs->op && ast_equal(left, rhs->left) && ast_equal(right, rhs->right);
}
