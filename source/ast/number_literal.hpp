#pragma once

#include <lexer/location.hpp>

#include "expression.hpp"

struct number_literal final : expression
{
    number_literal(double val, location loc)
        : expression {loc}
        , value {val}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    double value {};
};
