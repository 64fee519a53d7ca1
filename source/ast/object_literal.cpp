#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include "object_literal.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "util.hpp"
#include "visitor.hpp"

auto object_literal::string() const -> std::string
{
    std::vector<std::string> strpairs;
    std::transform(properties.cbegin(),
                   properties.cend(),
                   std::back_inserter(strpairs),
                   [](const auto& pair) { return fmt::format("{}: {}", quote_string(pair.first), pair.second->string()); });
    return fmt::format("({{{}}})", fmt::join(strpairs, ", "));
}

void object_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto object_literal::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const object_literal*>(other);
    return rhs != nullptr
        && std::equal(properties.cbegin(),
                      properties.cend(),
                      rhs->properties.cbegin(),
                      rhs->properties.cend(),
                      [](const auto& left, const auto& right)
                      { return left.first == right.first && ast_equal(left.second, right.second); });
}
