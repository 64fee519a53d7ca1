#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <ostream>
#include <set>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <ast/identifier.hpp>
#include <ast/statements.hpp>
#include <fmt/ostream.h>

struct environment;
struct object_value;
struct array_value;
struct function_value;
struct native_function_value;

struct undefined_type
{
    auto operator==(const undefined_type& /*other*/) const -> bool = default;
};

struct null_type
{
    auto operator==(const null_type& /*other*/) const -> bool = default;
};

using value_type = std::variant<undefined_type,
                                null_type,
                                bool,
                                double,
                                std::string,
                                object_value*,
                                array_value*,
                                const function_value*,
                                const native_function_value*>;

constexpr auto default_display_limit = static_cast<std::size_t>(10000);

struct value final
{
    value() = default;
    value(undefined_type /*undefined*/) {}  // NOLINT(*-explicit-constructor)
    value(null_type nul)  // NOLINT(*-explicit-constructor)
        : data {nul}
    {
    }
    value(bool val)  // NOLINT(*-explicit-constructor)
        : data {val}
    {
    }
    value(double val)  // NOLINT(*-explicit-constructor)
        : data {val}
    {
    }
    value(int val)  // NOLINT(*-explicit-constructor)
        : data {static_cast<double>(val)}
    {
    }
    value(std::string val)  // NOLINT(*-explicit-constructor)
        : data {std::move(val)}
    {
    }
    value(const char* val)  // NOLINT(*-explicit-constructor)
        : data {std::string {val}}
    {
    }
    value(object_value* val)  // NOLINT(*-explicit-constructor)
        : data {val}
    {
    }
    value(array_value* val)  // NOLINT(*-explicit-constructor)
        : data {val}
    {
    }
    value(const function_value* val)  // NOLINT(*-explicit-constructor)
        : data {val}
    {
    }
    value(const native_function_value* val)  // NOLINT(*-explicit-constructor)
        : data {val}
    {
    }

    template<typename T>
    [[nodiscard]] auto is() const -> bool
    {
        return std::holds_alternative<T>(data);
    }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        if (!is<T>()) {
            throw std::runtime_error("Error trying to convert " + type_name() + " value " + inspect());
        }
        return std::get<T>(data);
    }

    [[nodiscard]] auto is_undefined() const -> bool { return is<undefined_type>(); }
    [[nodiscard]] auto is_null() const -> bool { return is<null_type>(); }
    [[nodiscard]] auto is_callable() const -> bool
    {
        return is<const function_value*>() || is<const native_function_value*>();
    }

    [[nodiscard]] auto is_truthy() const -> bool;
    [[nodiscard]] auto to_number() const -> double;
    [[nodiscard]] auto to_int32() const -> std::int32_t;
    [[nodiscard]] auto to_string() const -> std::string;

    /// display form, cut to `limit` characters followed by `...` when longer
    [[nodiscard]] auto inspect(std::size_t limit = default_display_limit) const -> std::string;
    [[nodiscard]] auto type_name() const -> std::string;

    value_type data {};
};

/// structural for objects and arrays, identity for functions
auto operator==(const value& lhs, const value& rhs) -> bool;

auto operator<<(std::ostream& ostream, const value& val) -> std::ostream&;

template<>
struct fmt::formatter<value> : ostream_formatter
{
};

/// string keyed map that remembers insertion order for display
struct property_map final
{
    using entry = std::pair<std::string, value>;

    [[nodiscard]] auto get(const std::string& key) const -> std::optional<value>;
    auto set(const std::string& key, value val) -> void;
    [[nodiscard]] auto contains(const std::string& key) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t { return entries.size(); }
    [[nodiscard]] auto empty() const -> bool { return entries.empty(); }
    [[nodiscard]] auto begin() const { return entries.cbegin(); }
    [[nodiscard]] auto end() const { return entries.cend(); }

    std::vector<entry> entries;
    std::unordered_map<std::string, std::size_t> index;
};

auto operator==(const property_map& lhs, const property_map& rhs) -> bool;

struct object_value final
{
    property_map properties;
};

struct array_value final
{
    using elements_type = std::map<std::size_t, value>;

    array_value() = default;
    explicit array_value(std::vector<value>&& items);

    /// one past the highest occupied index
    [[nodiscard]] auto length() const -> std::size_t;
    auto truncate(std::size_t new_length) -> void;
    [[nodiscard]] auto at(std::size_t index) const -> value;

    elements_type elements;
    property_map properties;
};

struct function_value final
{
    identifiers parameters;
    const block_statement* body {};
    environment* closure_env {};
    std::set<std::string> declared_vars;
};

struct native_function_value final
{
    using body_type = std::function<value(const value& this_value, std::vector<value>&& arguments)>;

    std::string name;
    body_type body;
};

/// canonical property key of a value, `2` for the number 2.0
auto property_key(const value& key) -> std::string;

constexpr auto max_array_index = static_cast<std::size_t>(4294967294U);

/// array element index denoted by a canonical key, empty for named properties
auto array_index(const std::string& key) -> std::optional<std::size_t>;
