#include <string>

#include "assign_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto assign_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", target->string(), op, value->string());
}

void assign_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto assign_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const assign_expression*>(other);
    return rhs != nullptr && op == rhs->op && ast_equal(target, rhs->target) && ast_equal(value, rhs->value);
}
