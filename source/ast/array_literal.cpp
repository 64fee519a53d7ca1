#include <algorithm>
#include <iterator>
#include <string>
#include <vector>

#include "array_literal.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "util.hpp"
#include "visitor.hpp"

auto array_literal::string() const -> std::string
{
    std::vector<std::string> strs;
    std::transform(elements.cbegin(),
                   elements.cend(),
                   std::back_inserter(strs),
                   [](const expression* element) { return element != nullptr ? element->string() : std::string(); });
    return fmt::format("[{}]", fmt::join(strs, ", "));
}

void array_literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto array_literal::equals_to(const expression* other) const -> bool
{
    const auto* rhs = dynamic_cast<const array_literal*>(other);
    return rhs != nullptr && ast_equal(elements, rhs->elements);
}
