#pragma once

#include "expression.hpp"

struct array_literal final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    /// one entry per comma separated slot, an elided slot is a nullptr
    expressions elements;
};
