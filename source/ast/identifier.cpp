#include <string>

#include "identifier.hpp"

#include "visitor.hpp"

auto identifier::string() const -> std::string
{
    return value;
}

void identifier::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto identifier::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const identifier*>(other);
    return rhs != nullptr && rhs->value == value;
}
