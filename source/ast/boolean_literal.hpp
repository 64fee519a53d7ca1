#pragma once

#include <lexer/location.hpp>

#include "expression.hpp"

struct boolean_literal final : expression
{
    boolean_literal(bool val, location loc)
        : expression {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    bool value {};
};
