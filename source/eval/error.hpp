#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

/// unresolved names and writes to things that are not references
struct reference_error final : std::runtime_error
{
    explicit reference_error(const std::string& message)
        : std::runtime_error {"ReferenceError: " + message}
    {
    }
};

struct type_error final : std::runtime_error
{
    explicit type_error(const std::string& message)
        : std::runtime_error {"TypeError: " + message}
    {
    }
};

/// raised for operator tokens the evaluator has no rule for
struct syntax_error final : std::runtime_error
{
    explicit syntax_error(const std::string& message)
        : std::runtime_error {"SyntaxError: " + message}
    {
    }
};

template<typename Error, typename... T>
[[noreturn]] auto throw_error(fmt::format_string<T...> fmt, T&&... args) -> void
{
    throw Error {fmt::format(fmt, std::forward<T>(args)...)};
}
