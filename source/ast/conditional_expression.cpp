#include <string>

#include "conditional_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto conditional_expression::string() const -> std::string
{
    return fmt::format("({} ? {} : {})", condition->string(), consequence->string(), alternative->string());
}

void conditional_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto conditional_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const conditional_expression*>(other);
    return rhs != nullptr && ast_equal(condition, rhs->condition) && ast_equal(consequence, rhs->consequence)
        && ast_equal(alternative, rhs->alternative);
}
