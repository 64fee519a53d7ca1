#include <string>

#include "string_literal.hpp"

#include "util.hpp"
#include "visitor.hpp"

auto string_literal::string() const -> std::string
{
    return quote_string(value);
}

void string_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto string_literal::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const string_literal*>(other);
    return rhs != nullptr && rhs->value == value;
}
