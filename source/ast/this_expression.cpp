#include <string>

#include "this_expression.hpp"

#include "visitor.hpp"

auto this_expression::string() const -> std::string
{
    return "this";
}

void this_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto this_expression::equals_to(const expression* other) const -> bool
{
    return dynamic_cast<const this_expression*>(other) != nullptr;
}
