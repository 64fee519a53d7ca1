#pragma once

#include <lexer/token_type.hpp>

#include "expression.hpp"

struct assign_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* target {};
    token_type op {token_type::assign};
    const expression* value {};
};
