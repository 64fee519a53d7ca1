#pragma once

#include <ostream>
#include <string_view>

#include "location.hpp"
#include "token_type.hpp"

/// lexeme of the source text, `literal` views into the lexer input
struct token final
{
    token_type type;
    std::string_view literal;
    location loc;

    /// same token reported at another position, used for table driven operators
    [[nodiscard]] auto with_loc(location loc) const -> token;
    auto operator==(const token& other) const -> bool;
};

auto operator<<(std::ostream& ostream, const token& token) -> std::ostream&;
