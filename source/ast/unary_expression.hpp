#pragma once

#include <lexer/token_type.hpp>

#include "expression.hpp"

struct unary_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    token_type op {};
    const expression* operand {};
    bool postfix {};
};
