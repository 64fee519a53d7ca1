#include <string>
#include <string_view>
#include <vector>

#include "interpreter.hpp"

#include <doctest/doctest.h>
#include <gc.hpp>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

#include "evaluator.hpp"

auto make_global_environment(const host_bindings& bindings) -> environment*
{
    auto* globals = make<environment>();
    globals->declare("this", value {});
    globals->declare("undefined", value {});
    for (const auto& [name, val] : bindings) {
        globals->declare(name, val);
    }
    return globals;
}

auto execute_program(const program* prgrm, environment* globals) -> execution_result
{
    for (const auto& name : prgrm->declared_vars()) {
        if (!globals->has_own(name)) {
            globals->declare(name, value {});
        }
    }
    evaluator ev {globals};
    return {.result = ev.execute(prgrm), .globals = globals};
}

namespace
{
// NOLINTBEGIN(*)
TEST_SUITE_BEGIN("interpreter");

auto parse(std::string_view input) -> program*
{
    auto prsr = parser {lexer {input}};
    auto* prgrm = prsr.parse_program();
    REQUIRE(prsr.errors().empty());
    return prgrm;
}

TEST_CASE("globalEnvironment")
{
    auto* globals = make_global_environment({{"answer", 42}});
    CHECK(globals->has_own("this"));
    CHECK(globals->get("undefined").is_undefined());
    CHECK_EQ(globals->get("answer"), value {42});
    CHECK(globals->parent == nullptr);
}

TEST_CASE("hoistingKeepsHostBindings")
{
    auto* globals = make_global_environment({{"x", 5}});
    const auto [result, env] = execute_program(parse("var y = x; var x;"), globals);
    CHECK_EQ(env, globals);
    CHECK_EQ(globals->get("y"), value {5});
    CHECK_EQ(globals->get("x"), value {5});
}

TEST_CASE("programsShareOneEnvironment")
{
    auto* globals = make_global_environment();
    (void)execute_program(parse("var counter = 1;"), globals);
    (void)execute_program(parse("var counter; counter += 1;"), globals);
    const auto [result, env] = execute_program(parse("counter * 10;"), globals);
    REQUIRE(result.val.has_value());
    CHECK_EQ(result.val.value(), value {20});
}

TEST_CASE("functionsSurviveTheirSource")
{
    auto* globals = make_global_environment();
    {
        const std::string source {"var twice = function (n) { return n * 2; };"};
        (void)execute_program(parse(source), globals);
    }
    const auto [result, env] = execute_program(parse("twice(21);"), globals);
    REQUIRE(result.val.has_value());
    CHECK_EQ(result.val.value(), value {42});
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
