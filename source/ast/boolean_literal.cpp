#include <string>

#include "boolean_literal.hpp"

#include "visitor.hpp"

auto boolean_literal::string() const -> std::string
{
    return value ? "true" : "false";
}

void boolean_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto boolean_literal::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const boolean_literal*>(other);
    return rhs != nullptr && rhs->value == value;
}
