#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <iterator>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "value.hpp"

#include <ast/util.hpp>
#include <doctest/doctest.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gc.hpp>
#include <overloaded.hpp>

namespace
{
constexpr auto two_to_32 = 4294967296.0;
constexpr auto two_to_31 = 2147483648.0;

auto is_js_space(char chr) -> bool
{
    return chr == ' ' || chr == '\t' || chr == '\n' || chr == '\r' || chr == '\v' || chr == '\f';
}

auto trim(std::string_view str) -> std::string_view
{
    while (!str.empty() && is_js_space(str.front())) {
        str.remove_prefix(1);
    }
    while (!str.empty() && is_js_space(str.back())) {
        str.remove_suffix(1);
    }
    return str;
}

auto string_to_number(std::string_view str) -> double
{
    const auto trimmed = trim(str);
    if (trimmed.empty()) {
        return 0;
    }
    if (trimmed == "Infinity" || trimmed == "+Infinity") {
        return std::numeric_limits<double>::infinity();
    }
    if (trimmed == "-Infinity") {
        return -std::numeric_limits<double>::infinity();
    }
    const auto decimal_chars = [](char chr)
    { return std::isdigit(static_cast<unsigned char>(chr)) != 0 || chr == '.' || chr == 'e' || chr == 'E' || chr == '+' || chr == '-'; };
    if (!std::all_of(trimmed.cbegin(), trimmed.cend(), decimal_chars)) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    const std::string text {trimmed};
    char* end = nullptr;
    const auto result = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return result;
}

/// appends the display form of a value while the output is shorter than the limit
struct display_writer final
{
    auto write(const value& val) -> void
    {
        if (full()) {
            return;
        }
        std::visit(overloaded {[&](const std::string& str) { out += quote_string(str); },
                               [&](object_value* obj) { write_object(*obj); },
                               [&](array_value* arr) { write_array(*arr); },
                               [&](const auto& /*primitive*/) { out += val.to_string(); }},
                   val.data);
    }

    auto write_object(const object_value& obj) -> void
    {
        out += '{';
        for (bool first = true; const auto& [key, prop] : obj.properties) {
            if (full()) {
                return;
            }
            if (!first) {
                out += ", ";
            }
            first = false;
            out += key;
            out += ": ";
            write(prop);
        }
        out += '}';
    }

    auto write_array(const array_value& arr) -> void
    {
        out += '[';
        const auto length = arr.length();
        for (std::size_t idx = 0; idx < length; ++idx) {
            if (full()) {
                return;
            }
            if (idx != 0) {
                out += ", ";
            }
            write(arr.at(idx));
        }
        out += ']';
    }

    [[nodiscard]] auto full() const -> bool { return out.size() > limit; }

    std::size_t limit {};
    std::string out;
};

auto function_signature(const function_value& func) -> std::string
{
    std::vector<std::string> names;
    std::transform(func.parameters.cbegin(),
                   func.parameters.cend(),
                   std::back_inserter(names),
                   [](const identifier* param) { return param->value; });
    return fmt::format("function ({}) {{...}}", fmt::join(names, ", "));
}
}  // namespace

auto value::is_truthy() const -> bool
{
    return std::visit(overloaded {[](const undefined_type /*undefined*/) { return false; },
                                  [](const null_type /*null*/) { return false; },
                                  [](const bool val) { return val; },
                                  [](const double val) { return val != 0 && !std::isnan(val); },
                                  [](const std::string& val) { return !val.empty(); },
                                  [](const auto& /*reference*/) { return true; }},
                      data);
}

auto value::to_number() const -> double
{
    return std::visit(overloaded {[](const undefined_type /*undefined*/) { return std::numeric_limits<double>::quiet_NaN(); },
                                  [](const null_type /*null*/) { return 0.0; },
                                  [](const bool val) { return val ? 1.0 : 0.0; },
                                  [](const double val) { return val; },
                                  [](const std::string& val) { return string_to_number(val); },
                                  [](const auto& /*reference*/) { return std::numeric_limits<double>::quiet_NaN(); }},
                      data);
}

auto value::to_int32() const -> std::int32_t
{
    const auto number = to_number();
    if (!std::isfinite(number)) {
        return 0;
    }
    auto wrapped = std::fmod(std::trunc(number), two_to_32);
    if (wrapped < 0) {
        wrapped += two_to_32;
    }
    if (wrapped >= two_to_31) {
        wrapped -= two_to_32;
    }
    return static_cast<std::int32_t>(wrapped);
}

auto value::to_string() const -> std::string
{
    return std::visit(
        overloaded {[](const undefined_type /*undefined*/) -> std::string { return "undefined"; },
                    [](const null_type /*null*/) -> std::string { return "null"; },
                    [](const bool val) -> std::string { return val ? "true" : "false"; },
                    [](const double val) { return number_to_string(val); },
                    [](const std::string& val) { return val; },
                    [this](object_value* /*obj*/) { return inspect(); },
                    [this](array_value* /*arr*/) { return inspect(); },
                    [](const function_value* func) { return function_signature(*func); },
                    [](const native_function_value* native)
                    { return fmt::format("function {}() {{ [native code] }}", native->name); }},
        data);
}

auto value::inspect(std::size_t limit) const -> std::string
{
    display_writer writer {.limit = limit, .out = {}};
    writer.write(*this);
    if (writer.out.size() > limit) {
        writer.out.resize(limit);
        writer.out += "...";
    }
    return writer.out;
}

auto value::type_name() const -> std::string
{
    return std::visit(overloaded {[](const undefined_type /*undefined*/) { return "undefined"; },
                                  [](const null_type /*null*/) { return "null"; },
                                  [](const bool /*val*/) { return "boolean"; },
                                  [](const double /*val*/) { return "number"; },
                                  [](const std::string& /*val*/) { return "string"; },
                                  [](object_value* /*obj*/) { return "object"; },
                                  [](array_value* /*arr*/) { return "array"; },
                                  [](const function_value* /*func*/) { return "function"; },
                                  [](const native_function_value* /*native*/) { return "native function"; }},
                      data);
}

auto operator==(const value& lhs, const value& rhs) -> bool
{
    return std::visit(overloaded {[](const undefined_type /*lhs*/, const undefined_type /*rhs*/) { return true; },
                                  [](const null_type /*lhs*/, const null_type /*rhs*/) { return true; },
                                  [](const bool val1, const bool val2) { return val1 == val2; },
                                  [](const double val1, const double val2) { return val1 == val2; },
                                  [](const std::string& val1, const std::string& val2) { return val1 == val2; },
                                  [](object_value* obj1, object_value* obj2)
                                  { return obj1 == obj2 || obj1->properties == obj2->properties; },
                                  [](array_value* arr1, array_value* arr2)
                                  {
                                      return arr1 == arr2
                                          || (arr1->elements == arr2->elements && arr1->properties == arr2->properties);
                                  },
                                  [](const function_value* fn1, const function_value* fn2) { return fn1 == fn2; },
                                  [](const native_function_value* fn1, const native_function_value* fn2)
                                  { return fn1 == fn2; },
                                  [](const auto& /*lhs*/, const auto& /*rhs*/) { return false; }},
                      lhs.data,
                      rhs.data);
}

auto operator<<(std::ostream& ostream, const value& val) -> std::ostream&
{
    return ostream << val.inspect();
}

auto property_map::get(const std::string& key) const -> std::optional<value>
{
    if (const auto itr = index.find(key); itr != index.end()) {
        return entries[itr->second].second;
    }
    return std::nullopt;
}

auto property_map::set(const std::string& key, value val) -> void
{
    if (const auto itr = index.find(key); itr != index.end()) {
        entries[itr->second].second = std::move(val);
        return;
    }
    index.emplace(key, entries.size());
    entries.emplace_back(key, std::move(val));
}

auto property_map::contains(const std::string& key) const -> bool
{
    return index.contains(key);
}

auto operator==(const property_map& lhs, const property_map& rhs) -> bool
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return std::all_of(lhs.begin(),
                       lhs.end(),
                       [&rhs](const auto& entry)
                       {
                           const auto other = rhs.get(entry.first);
                           return other.has_value() && entry.second == other.value();
                       });
}

array_value::array_value(std::vector<value>&& items)
{
    for (std::size_t idx = 0; auto& item : items) {
        elements.emplace(idx++, std::move(item));
    }
}

auto array_value::length() const -> std::size_t
{
    if (elements.empty()) {
        return 0;
    }
    return elements.rbegin()->first + 1;
}

auto array_value::truncate(std::size_t new_length) -> void
{
    elements.erase(elements.lower_bound(new_length), elements.end());
}

auto array_value::at(std::size_t index) const -> value
{
    if (const auto itr = elements.find(index); itr != elements.end()) {
        return itr->second;
    }
    return {};
}

auto property_key(const value& key) -> std::string
{
    return key.to_string();
}

auto array_index(const std::string& key) -> std::optional<std::size_t>
{
    if (key.empty() || (key.size() > 1 && key.front() == '0')) {
        return std::nullopt;
    }
    std::size_t index = 0;
    for (const auto chr : key) {
        if (std::isdigit(static_cast<unsigned char>(chr)) == 0) {
            return std::nullopt;
        }
        index = index * 10 + static_cast<std::size_t>(chr - '0');
        if (index > max_array_index) {
            return std::nullopt;
        }
    }
    return index;
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("value");

TEST_CASE("truthiness")
{
    CHECK_FALSE(value {}.is_truthy());
    CHECK_FALSE(value {null_type {}}.is_truthy());
    CHECK_FALSE(value {false}.is_truthy());
    CHECK_FALSE(value {0}.is_truthy());
    CHECK_FALSE(value {-0.0}.is_truthy());
    CHECK_FALSE(value {std::numeric_limits<double>::quiet_NaN()}.is_truthy());
    CHECK_FALSE(value {""}.is_truthy());
    CHECK(value {true}.is_truthy());
    CHECK(value {1}.is_truthy());
    CHECK(value {"0"}.is_truthy());
    CHECK(value {make<object_value>()}.is_truthy());
    CHECK(value {make<array_value>()}.is_truthy());
}

TEST_CASE("toNumber")
{
    struct nt
    {
        value input;
        double expected;
    };
    std::array tests {
        nt {null_type {}, 0},
        nt {true, 1},
        nt {false, 0},
        nt {42, 42},
        nt {"", 0},
        nt {"   ", 0},
        nt {" 12 ", 12},
        nt {"\t3.5\n", 3.5},
        nt {"1e3", 1000},
        nt {"-7", -7},
        nt {"Infinity", std::numeric_limits<double>::infinity()},
    };
    for (const auto& [input, expected] : tests) {
        INFO(input.inspect());
        CHECK_EQ(input.to_number(), expected);
    }

    CHECK(std::isnan(value {}.to_number()));
    CHECK(std::isnan(value {"12px"}.to_number()));
    CHECK(std::isnan(value {"0x10"}.to_number()));
    CHECK(std::isnan(value {"inf"}.to_number()));
    CHECK(std::isnan(value {make<object_value>()}.to_number()));
}

TEST_CASE("toInt32")
{
    struct it
    {
        double input;
        std::int32_t expected;
    };
    std::array tests {
        it {0, 0},
        it {1.9, 1},
        it {-1.9, -1},
        it {2147483647, 2147483647},
        it {2147483648.0, -2147483647 - 1},
        it {4294967296.0, 0},
        it {4294967297.0, 1},
        it {-4294967297.0, -1},
        it {std::numeric_limits<double>::infinity(), 0},
        it {std::numeric_limits<double>::quiet_NaN(), 0},
    };
    for (const auto& [input, expected] : tests) {
        INFO(input);
        CHECK_EQ(value {input}.to_int32(), expected);
    }
}

TEST_CASE("toString")
{
    CHECK_EQ(value {}.to_string(), "undefined");
    CHECK_EQ(value {null_type {}}.to_string(), "null");
    CHECK_EQ(value {true}.to_string(), "true");
    CHECK_EQ(value {2.0}.to_string(), "2");
    CHECK_EQ(value {0.5}.to_string(), "0.5");
    CHECK_EQ(value {"raw"}.to_string(), "raw");
    auto* arr = make<array_value>(std::vector<value> {1, "two", 3});
    CHECK_EQ(value {arr}.to_string(), R"([1, "two", 3])");
}

TEST_CASE("inspect")
{
    CHECK_EQ(value {"str"}.inspect(), R"("str")");
    CHECK_EQ(value {make<array_value>()}.inspect(), "[]");
    CHECK_EQ(value {make<object_value>()}.inspect(), "{}");

    auto* obj = make<object_value>();
    obj->properties.set("b", 1);
    obj->properties.set("a", make<array_value>(std::vector<value> {true, null_type {}}));
    CHECK_EQ(value {obj}.inspect(), "{b: 1, a: [true, null]}");

    auto* sparse = make<array_value>();
    sparse->elements.emplace(2, value {"x"});
    CHECK_EQ(value {sparse}.inspect(), R"([undefined, undefined, "x"])");

    auto* native = make<native_function_value>(native_function_value {.name = "log", .body = {}});
    CHECK_EQ(value {native}.inspect(), "function log() { [native code] }");
}

TEST_CASE("inspectLimit")
{
    auto* arr = make<array_value>(std::vector<value> {1, 2, 3, 4, 5});
    CHECK_EQ(value {arr}.inspect(6), "[1, 2,...");
    CHECK_EQ(value {"abcdef"}.inspect(3), R"("ab...)");

    auto* self = make<array_value>();
    self->elements.emplace(0, value {self});
    const auto shown = value {self}.inspect(20);
    CHECK_EQ(shown.size(), 23U);
    CHECK(shown.ends_with("..."));
}

TEST_CASE("typeName")
{
    CHECK_EQ(value {}.type_name(), "undefined");
    CHECK_EQ(value {null_type {}}.type_name(), "null");
    CHECK_EQ(value {false}.type_name(), "boolean");
    CHECK_EQ(value {1}.type_name(), "number");
    CHECK_EQ(value {"s"}.type_name(), "string");
    CHECK_EQ(value {make<object_value>()}.type_name(), "object");
    CHECK_EQ(value {make<array_value>()}.type_name(), "array");
}

TEST_CASE("equality")
{
    CHECK(value {} == value {});
    CHECK(value {null_type {}} == value {null_type {}});
    CHECK(value {1} == value {1.0});
    CHECK(value {"a"} == value {"a"});
    CHECK_FALSE(value {1} == value {"1"});
    CHECK_FALSE(value {} == value {null_type {}});
    CHECK_FALSE(value {std::numeric_limits<double>::quiet_NaN()} == value {std::numeric_limits<double>::quiet_NaN()});

    auto* lhs = make<object_value>();
    lhs->properties.set("x", 1);
    lhs->properties.set("y", "two");
    auto* rhs = make<object_value>();
    rhs->properties.set("y", "two");
    rhs->properties.set("x", 1);
    CHECK(value {lhs} == value {rhs});
    rhs->properties.set("x", 2);
    CHECK_FALSE(value {lhs} == value {rhs});

    auto* arr1 = make<array_value>(std::vector<value> {1, 2});
    auto* arr2 = make<array_value>(std::vector<value> {1, 2});
    CHECK(value {arr1} == value {arr2});
    arr2->elements.emplace(5, value {3});
    CHECK_FALSE(value {arr1} == value {arr2});

    auto* fn1 = make<native_function_value>(native_function_value {.name = "f", .body = {}});
    auto* fn2 = make<native_function_value>(native_function_value {.name = "f", .body = {}});
    CHECK(value {fn1} == value {fn1});
    CHECK_FALSE(value {fn1} == value {fn2});
}

TEST_CASE("propertyMapKeepsInsertionOrder")
{
    property_map props;
    props.set("z", 1);
    props.set("a", 2);
    props.set("z", 3);
    REQUIRE_EQ(props.size(), 2U);
    CHECK_EQ(props.entries[0].first, "z");
    CHECK_EQ(props.entries[0].second, value {3});
    CHECK_EQ(props.entries[1].first, "a");
    CHECK(props.contains("a"));
    CHECK_FALSE(props.get("missing").has_value());
}

TEST_CASE("arrayLengthAndTruncate")
{
    auto arr = array_value {std::vector<value> {1, 2, 3}};
    CHECK_EQ(arr.length(), 3U);
    arr.elements.emplace(9, value {10});
    CHECK_EQ(arr.length(), 10U);
    CHECK(arr.at(5).is_undefined());
    arr.truncate(2);
    CHECK_EQ(arr.length(), 2U);
    CHECK_EQ(arr.at(1), value {2});
}

TEST_CASE("propertyKeys")
{
    CHECK_EQ(property_key(2.0), "2");
    CHECK_EQ(property_key(1.5), "1.5");
    CHECK_EQ(property_key(true), "true");
    CHECK_EQ(property_key("name"), "name");

    CHECK_EQ(array_index("0"), std::optional<std::size_t> {0});
    CHECK_EQ(array_index("42"), std::optional<std::size_t> {42});
    CHECK_FALSE(array_index("").has_value());
    CHECK_FALSE(array_index("01").has_value());
    CHECK_FALSE(array_index("1.5").has_value());
    CHECK_FALSE(array_index("-1").has_value());
    CHECK_FALSE(array_index("length").has_value());
    CHECK_FALSE(array_index("4294967295").has_value());
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
