#include <array>
#include <cmath>
#include <cstddef>
#include <string>
#include <string_view>

#include "util.hpp"

#include <doctest/doctest.h>
#include <fmt/format.h>

namespace
{
constexpr auto max_fixed_integer = 1e21;

constexpr auto min_fixed_exponent = -6;

auto strip_exponent_zeros(std::string str) -> std::string
{
    const auto exp = str.find('e');
    if (exp == std::string::npos) {
        return str;
    }
    auto digits = exp + 2;
    while (digits + 1 < str.size() && str[digits] == '0') {
        str.erase(digits, 1);
    }
    return str;
}

// small magnitudes the shortest form renders with an exponent down to 1e-6 are spelled out
auto expand_small_exponent(const std::string& shortest) -> std::string
{
    const auto exp = shortest.find('e');
    if (exp == std::string::npos || shortest[exp + 1] != '-') {
        return shortest;
    }
    const auto exponent = std::stoi(shortest.substr(exp + 1));
    if (exponent < min_fixed_exponent) {
        return shortest;
    }
    std::string sign;
    std::string digits;
    for (const auto chr : std::string_view {shortest}.substr(0, exp)) {
        if (chr == '-') {
            sign = "-";
        } else if (chr != '.') {
            digits += chr;
        }
    }
    return fmt::format("{}0.{}{}", sign, std::string(static_cast<std::size_t>(-exponent - 1), '0'), digits);
}
}  // namespace

auto number_to_string(double number) -> std::string
{
    if (std::isnan(number)) {
        return "NaN";
    }
    if (std::isinf(number)) {
        return number > 0 ? "Infinity" : "-Infinity";
    }
    if (number == 0) {
        return "0";
    }
    if (number == std::trunc(number) && std::abs(number) < max_fixed_integer) {
        return fmt::format("{:.0f}", number);
    }
    return strip_exponent_zeros(expand_small_exponent(fmt::format("{}", number)));
}

auto quote_string(std::string_view str) -> std::string
{
    std::string quoted {"\""};
    for (const auto chr : str) {
        switch (chr) {
            case '"':
                quoted += R"(\")";
                break;
            case '\\':
                quoted += R"(\\)";
                break;
            case '\n':
                quoted += R"(\n)";
                break;
            case '\t':
                quoted += R"(\t)";
                break;
            case '\r':
                quoted += R"(\r)";
                break;
            case '\b':
                quoted += R"(\b)";
                break;
            case '\f':
                quoted += R"(\f)";
                break;
            case '\v':
                quoted += R"(\v)";
                break;
            case '\0':
                quoted += R"(\0)";
                break;
            default:
                quoted += chr;
        }
    }
    quoted += '"';
    return quoted;
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("util");

TEST_CASE("numberToString")
{
    struct nt
    {
        double input;
        std::string_view expected;
    };

    std::array tests {
        nt {0.0, "0"},
        nt {-0.0, "0"},
        nt {2.0, "2"},
        nt {-17.0, "-17"},
        nt {3.25, "3.25"},
        nt {0.1 + 0.2, "0.30000000000000004"},
        nt {1e20, "100000000000000000000"},
        nt {1e21, "1e+21"},
        nt {1.5e-9, "1.5e-9"},
        nt {0.00001, "0.00001"},
        nt {0.0000015, "0.0000015"},
        nt {-0.000001, "-0.000001"},
        nt {1e-7, "1e-7"},
        nt {0.001, "0.001"},
        nt {NAN, "NaN"},
        nt {INFINITY, "Infinity"},
        nt {-INFINITY, "-Infinity"},
    };
    for (const auto& [input, expected] : tests) {
        INFO("formatting ", input);
        CHECK_EQ(number_to_string(input), expected);
    }
}

TEST_CASE("quoteString")
{
    CHECK_EQ(quote_string("abc"), R"("abc")");
    CHECK_EQ(quote_string("say \"hi\"\n"), R"("say \"hi\"\n")");
    CHECK_EQ(quote_string("a\\b\tc"), R"("a\\b\tc")");
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
