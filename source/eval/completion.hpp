#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "value.hpp"

enum class completion_type : std::uint8_t
{
    normal,
    brake,
    cont,
    ret,
};

/// result of executing a statement, an empty `val` is distinct from undefined
struct completion final
{
    [[nodiscard]] auto is_abrupt() const -> bool { return type != completion_type::normal; }

    completion_type type {completion_type::normal};
    std::optional<value> val;
    std::optional<std::string> target;
};
