#pragma once

#include <lexer/token_type.hpp>

#include "expression.hpp"

struct binary_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* left {};
    token_type op {};
    const expression* right {};
};
