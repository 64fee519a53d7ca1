#include <cstddef>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "console.hpp"

#include <doctest/doctest.h>
#include <eval/value.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <gc.hpp>

namespace
{
auto log_form(const value& arg, std::size_t display_limit) -> std::string
{
    if (arg.is<std::string>()) {
        return arg.as<std::string>();
    }
    return arg.inspect(display_limit);
}
}  // namespace

auto make_console(std::ostream& out, std::size_t display_limit) -> value
{
    const auto* log = make<native_function_value>(native_function_value {
        .name = "log",
        .body = [&out, display_limit](const value& /*this_value*/, std::vector<value>&& arguments) -> value
        {
            for (bool first = true; const auto& arg : arguments) {
                if (!first) {
                    fmt::print(out, " ");
                }
                fmt::print(out, "{}", log_form(arg, display_limit));
                first = false;
            }
            fmt::print(out, "\n");
            return {};
        },
    });
    auto* console = make<object_value>();
    console->properties.set("log", log);
    return console;
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("console");

auto call_log(const value& console, std::vector<value>&& arguments) -> value
{
    const auto log = console.as<object_value*>()->properties.get("log");
    REQUIRE(log.has_value());
    REQUIRE(log->is<const native_function_value*>());
    return log->as<const native_function_value*>()->body(value {}, std::move(arguments));
}

TEST_CASE("logJoinsArguments")
{
    std::ostringstream out;
    const auto console = make_console(out);
    const auto result = call_log(console, {1, "two", true, value {}, null_type {}});
    CHECK(result.is_undefined());
    CHECK_EQ(out.str(), "1 two true undefined null\n");
}

TEST_CASE("logWithoutArguments")
{
    std::ostringstream out;
    const auto console = make_console(out);
    (void)call_log(console, {});
    CHECK_EQ(out.str(), "\n");
}

TEST_CASE("logAggregates")
{
    std::ostringstream out;
    const auto console = make_console(out);
    auto* arr = make<array_value>(std::vector<value> {1, "a"});
    (void)call_log(console, {arr, 2.5});
    CHECK_EQ(out.str(), "[1, \"a\"] 2.5\n");
}

TEST_CASE("logHonoursDisplayLimit")
{
    std::ostringstream out;
    const auto console = make_console(out, 4);
    auto* arr = make<array_value>(std::vector<value> {1, 2, 3});
    (void)call_log(console, {arr, "long string stays"});
    CHECK_EQ(out.str(), "[1, ... long string stays\n");
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
