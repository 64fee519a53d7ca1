#include <string>

#include "property_access.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto property_access::string() const -> std::string
{
    return fmt::format("{}[{}]", object->string(), key->string());
}

void property_access::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto property_access::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const property_access*>(other);
    return rhs != nullptr && ast_equal(object, rhs->object) && ast_equal(key, rhs->key);
}
