#include <string>

#include "new_expression.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto new_expression::string() const -> std::string
{
    return fmt::format("(new {}({}))", constructor->string(), join(arguments, ", "));
}

void new_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto new_expression::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const new_expression*>(other);
    return rhs != nullptr && ast_equal(constructor, rhs->constructor) && ast_equal(arguments, rhs->arguments);
}
