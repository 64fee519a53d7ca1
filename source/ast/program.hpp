#pragma once

#include "statements.hpp"

/// root block of a parsed source text, printed without the surrounding braces
struct program final : block_statement
{
    using block_statement::block_statement;
    [[nodiscard]] auto string() const -> std::string final;
};
