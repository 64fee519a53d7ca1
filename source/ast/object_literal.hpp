#pragma once

#include <string>
#include <utility>
#include <vector>

#include "expression.hpp"

struct object_literal final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    /// property names are already normalised to their string key
    std::vector<std::pair<std::string, const expression*>> properties;
};
