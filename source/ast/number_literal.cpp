#include <string>

#include "number_literal.hpp"

#include "util.hpp"
#include "visitor.hpp"

auto number_literal::string() const -> std::string
{
    return number_to_string(value);
}

void number_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto number_literal::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const number_literal*>(other);
    return rhs != nullptr && rhs->value == value;
}
