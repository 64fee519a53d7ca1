#pragma once

#include <string>
#include <variant>

#include "environment.hpp"
#include "value.hpp"

struct unresolvable final
{
};

/// assignable location, either a binding of an environment or a property of a value
struct reference final
{
    std::string name;
    std::variant<unresolvable, environment*, value> base;
};

[[nodiscard]] auto get_value(const reference& ref) -> value;
auto put_value(const reference& ref, value val) -> void;

/// reads a property of any value, `undefined` for missing keys
[[nodiscard]] auto get_property(const value& base, const std::string& key) -> value;
auto put_property(const value& base, const std::string& key, value val) -> void;
