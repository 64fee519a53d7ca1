#pragma once

#include <string>
#include <utility>
#include <vector>

#include <lexer/location.hpp>

#include "expression.hpp"

struct identifier final : expression
{
    identifier(std::string val, location loc)
        : expression {loc}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    std::string value;
};

using identifiers = std::vector<const identifier*>;
