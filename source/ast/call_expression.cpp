#include <string>

#include "call_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto call_expression::string() const -> std::string
{
    return fmt::format("{}({})", callee->string(), join(arguments, ", "));
}

void call_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto call_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const call_expression*>(other);
    return rhs != nullptr && ast_equal(callee, rhs->callee) && ast_equal(arguments, rhs->arguments);
}
