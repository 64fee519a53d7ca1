#pragma once

#include "expression.hpp"

struct call_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;
    [[nodiscard]] auto equals_to(const expression* other) const -> bool final;

    const expression* callee {};
    expressions arguments;
};
