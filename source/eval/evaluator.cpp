#include <array>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "evaluator.hpp"

#include <ast/program.hpp>
#include <builtin/console.hpp>
#include <doctest/doctest.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <gc.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token_type.hpp>
#include <overloaded.hpp>
#include <parser/parser.hpp>

#include "error.hpp"
#include "interpreter.hpp"

evaluator::evaluator(environment* env)
    : m_env {env}
{
}

auto evaluator::execute(const statement* stmt) -> completion
{
    stmt->accept(*this);
    return m_completion;
}

auto evaluator::evaluate(const expression* expr) -> result_type
{
    expr->accept(*this);
    return m_result;
}

auto evaluator::evaluate_value(const expression* expr) -> value
{
    return std::visit(overloaded {[](const value& val) { return val; },
                                  [](const reference& ref) { return get_value(ref); }},
                      evaluate(expr));
}

auto evaluator::evaluate_reference(const expression* expr) -> reference
{
    auto result = evaluate(expr);
    if (auto* ref = std::get_if<reference>(&result); ref != nullptr) {
        return std::move(*ref);
    }
    throw_error<reference_error>("invalid assignment target {}", expr->string());
}

auto evaluator::evaluate_arguments(const expressions& exprs) -> std::vector<value>
{
    std::vector<value> result;
    result.reserve(exprs.size());
    for (const auto* expr : exprs) {
        result.push_back(evaluate_value(expr));
    }
    return result;
}

void evaluator::visit(const number_literal& expr)
{
    m_result = value {expr.value};
}

void evaluator::visit(const string_literal& expr)
{
    m_result = value {expr.value};
}

void evaluator::visit(const boolean_literal& expr)
{
    m_result = value {expr.value};
}

void evaluator::visit(const null_literal& /*expr*/)
{
    m_result = value {null_type {}};
}

void evaluator::visit(const identifier& expr)
{
    m_result = reference {.name = expr.value, .base = m_env};
}

void evaluator::visit(const this_expression& /*expr*/)
{
    m_result = m_env->this_value();
}

void evaluator::visit(const array_literal& expr)
{
    std::vector<value> items;
    items.reserve(expr.elements.size());
    for (const auto* element : expr.elements) {
        items.push_back(element != nullptr ? evaluate_value(element) : value {});
    }
    if (!expr.elements.empty() && expr.elements.back() == nullptr) {
        items.pop_back();
    }
    m_result = value {make<array_value>(std::move(items))};
}

void evaluator::visit(const object_literal& expr)
{
    auto* obj = make<object_value>();
    for (const auto& [key, val] : expr.properties) {
        obj->properties.set(key, evaluate_value(val));
    }
    m_result = value {obj};
}

void evaluator::visit(const property_access& expr)
{
    auto base = evaluate_value(expr.object);
    const auto key = evaluate_value(expr.key);
    m_result = reference {.name = property_key(key), .base = std::move(base)};
}

void evaluator::visit(const function_literal& expr)
{
    const auto* func = make<function_value>(function_value {
        .parameters = expr.parameters,
        .body = expr.body,
        .closure_env = m_env,
        .declared_vars = expr.body->declared_vars(),
    });
    m_result = value {func};
}

void evaluator::visit(const call_expression& expr)
{
    auto callee = evaluate(expr.callee);
    value this_value;
    if (const auto* ref = std::get_if<reference>(&callee); ref != nullptr) {
        if (const auto* base = std::get_if<value>(&ref->base); base != nullptr) {
            this_value = *base;
        }
    }
    const auto func = std::visit(overloaded {[](value& val) { return std::move(val); },
                                             [](const reference& ref) { return get_value(ref); }},
                                 callee);
    auto arguments = evaluate_arguments(expr.arguments);
    if (!func.is_callable()) {
        throw_error<type_error>("{} is not a function", expr.callee->string());
    }
    m_result = apply_function(func, this_value, std::move(arguments));
}

void evaluator::visit(const new_expression& /*expr*/)
{
    m_result = value {make<object_value>()};
}

auto evaluator::apply_function(const value& callee, const value& this_value, std::vector<value>&& arguments) -> value
{
    if (callee.is<const native_function_value*>()) {
        return callee.as<const native_function_value*>()->body(this_value, std::move(arguments));
    }
    if (!callee.is<const function_value*>()) {
        throw_error<type_error>("{} is not a function", callee.type_name());
    }
    const auto* func = callee.as<const function_value*>();
    auto* locals = make<environment>(func->closure_env);
    for (const auto& name : func->declared_vars) {
        locals->declare(name, value {});
    }
    locals->declare("this", this_value);
    locals->declare("arguments", value {make<array_value>(std::vector<value>(arguments))});
    for (const auto* parameter : func->parameters) {
        locals->declare(parameter->value, value {});
    }
    for (auto arg_itr = arguments.begin(); const auto* parameter : func->parameters) {
        if (arg_itr == arguments.end()) {
            break;
        }
        locals->declare(parameter->value, std::move(*(arg_itr++)));
    }

    evaluator local(locals);
    auto result = local.execute(func->body);
    if (result.type == completion_type::ret && result.val.has_value()) {
        return std::move(result.val).value();
    }
    return {};
}

namespace
{
auto number_binary_operator(token_type oper, double left, double right) -> std::optional<double>
{
    using enum token_type;
    switch (oper) {
        case asterisk:
            return left * right;
        case slash:
            return left / right;
        case percent:
            return std::fmod(left, right);
        case minus:
            return left - right;
        default:
            return std::nullopt;
    }
}

auto int32_binary_operator(token_type oper, std::int32_t left, std::int32_t right) -> std::optional<double>
{
    using enum token_type;
    const auto shift = static_cast<std::uint32_t>(right) & 0x1FU;
    switch (oper) {
        case shift_left:
            return static_cast<std::int32_t>(static_cast<std::uint32_t>(left) << shift);
        case shift_right:
            return left >> shift;
        case ampersand:
            return left & right;
        case caret:
            return left ^ right;
        case pipe:
            return left | right;
        default:
            return std::nullopt;
    }
}

auto compare(token_type oper, const value& left, const value& right) -> std::optional<bool>
{
    using enum token_type;
    if (left.is<std::string>() && right.is<std::string>()) {
        const auto& lhs = left.as<std::string>();
        const auto& rhs = right.as<std::string>();
        switch (oper) {
            case less_than:
                return lhs < rhs;
            case less_equal:
                return lhs <= rhs;
            case greater_than:
                return lhs > rhs;
            case greater_equal:
                return lhs >= rhs;
            default:
                return std::nullopt;
        }
    }
    const auto lhs = left.to_number();
    const auto rhs = right.to_number();
    switch (oper) {
        case less_than:
            return lhs < rhs;
        case less_equal:
            return lhs <= rhs;
        case greater_than:
            return lhs > rhs;
        case greater_equal:
            return lhs >= rhs;
        default:
            return std::nullopt;
    }
}

auto apply_binary_operator(token_type oper, const value& left, const value& right) -> value
{
    using enum token_type;
    switch (oper) {
        case plus:
            if (left.is<std::string>() || right.is<std::string>()) {
                return left.to_string() + right.to_string();
            }
            return left.to_number() + right.to_number();
        case equals:
        case strict_equals:
            return left == right;
        case not_equals:
        case strict_not_equals:
            return !(left == right);
        case in:
        case instanceof:
            return false;
        default:
            break;
    }
    if (const auto result = number_binary_operator(oper, left.to_number(), right.to_number()); result.has_value()) {
        return result.value();
    }
    if (const auto result = int32_binary_operator(oper, left.to_int32(), right.to_int32()); result.has_value()) {
        return result.value();
    }
    if (const auto result = compare(oper, left, right); result.has_value()) {
        return result.value();
    }
    throw_error<syntax_error>("unknown binary operator {}", oper);
}

auto compound_operator(token_type oper) -> token_type
{
    using enum token_type;
    switch (oper) {
        case asterisk_assign:
            return asterisk;
        case slash_assign:
            return slash;
        case percent_assign:
            return percent;
        case plus_assign:
            return plus;
        case minus_assign:
            return minus;
        case shift_left_assign:
            return shift_left;
        case shift_right_assign:
            return shift_right;
        case ampersand_assign:
            return ampersand;
        case caret_assign:
            return caret;
        case pipe_assign:
            return pipe;
        default:
            throw_error<syntax_error>("unknown assignment operator {}", oper);
    }
}
}  // namespace

void evaluator::visit(const unary_expression& expr)
{
    auto operand = evaluate(expr.operand);
    const auto val = std::visit(overloaded {[](const value& res) { return res; },
                                            [](const reference& ref) { return get_value(ref); }},
                                operand);
    using enum token_type;
    switch (expr.op) {
        case plus:
            m_result = value {val.to_number()};
            return;
        case minus:
            m_result = value {-val.to_number()};
            return;
        case tilde:
            m_result = value {static_cast<double>(~val.to_int32())};
            return;
        case exclamation:
            m_result = value {!val.is_truthy()};
            return;
        case delet:
            m_result = value {true};
            return;
        case voyd:
            m_result = value {};
            return;
        case tipeof:
            m_result = value {"object"};
            return;
        case plus_plus:
        case minus_minus: {
            const auto* ref = std::get_if<reference>(&operand);
            if (ref == nullptr) {
                throw_error<reference_error>("invalid {} operand {}", expr.op, expr.operand->string());
            }
            const auto old_value = val.to_number();
            const auto new_value = expr.op == plus_plus ? old_value + 1 : old_value - 1;
            put_value(*ref, new_value);
            m_result = value {expr.postfix ? old_value : new_value};
            return;
        }
        default:
            throw_error<syntax_error>("unknown unary operator {}", expr.op);
    }
}

void evaluator::visit(const binary_expression& expr)
{
    using enum token_type;
    auto left = evaluate_value(expr.left);
    if (expr.op == logical_and) {
        m_result = left.is_truthy() ? evaluate_value(expr.right) : std::move(left);
        return;
    }
    if (expr.op == logical_or) {
        m_result = left.is_truthy() ? std::move(left) : evaluate_value(expr.right);
        return;
    }
    const auto right = evaluate_value(expr.right);
    m_result = apply_binary_operator(expr.op, left, right);
}

void evaluator::visit(const conditional_expression& expr)
{
    const auto condition = evaluate_value(expr.condition);
    m_result = evaluate_value(condition.is_truthy() ? expr.consequence : expr.alternative);
}

void evaluator::visit(const assign_expression& expr)
{
    const auto target = evaluate_reference(expr.target);
    auto val = evaluate_value(expr.value);
    if (expr.op != token_type::assign) {
        val = apply_binary_operator(compound_operator(expr.op), get_value(target), val);
    }
    put_value(target, val);
    m_result = std::move(val);
}

void evaluator::visit(const comma_expression& expr)
{
    (void)evaluate(expr.left);
    m_result = evaluate(expr.right);
}

void evaluator::visit(const block_statement& expr)
{
    completion result;
    for (const auto* stmt : expr.statements) {
        auto partial = execute(stmt);
        if (partial.is_abrupt()) {
            m_completion = std::move(partial);
            return;
        }
        if (partial.val.has_value()) {
            result = std::move(partial);
        }
    }
    m_completion = std::move(result);
}

void evaluator::visit(const var_statement& expr)
{
    for (const auto* declaration : expr.declarations) {
        declaration->accept(*this);
    }
    m_completion = {};
}

void evaluator::visit(const var_declaration& expr)
{
    if (expr.value != nullptr) {
        put_value(reference {.name = expr.name->value, .base = m_env}, evaluate_value(expr.value));
    }
    m_completion = {};
}

void evaluator::visit(const empty_statement& /*expr*/)
{
    m_completion = {};
}

void evaluator::visit(const expression_statement& expr)
{
    m_completion = {.type = completion_type::normal, .val = evaluate_value(expr.expr), .target = {}};
}

void evaluator::visit(const if_statement& expr)
{
    if (evaluate_value(expr.condition).is_truthy()) {
        expr.consequence->accept(*this);
        return;
    }
    if (expr.alternative != nullptr) {
        expr.alternative->accept(*this);
        return;
    }
    m_completion = {};
}

void evaluator::visit(const while_statement& expr)
{
    std::optional<value> last;
    while (evaluate_value(expr.condition).is_truthy()) {
        auto result = execute(expr.body);
        if (result.val.has_value()) {
            last = std::move(result.val);
        }
        if (result.type == completion_type::brake) {
            break;
        }
        if (result.type == completion_type::ret) {
            m_completion = {.type = completion_type::ret, .val = std::move(last), .target = {}};
            return;
        }
    }
    m_completion = {.type = completion_type::normal, .val = std::move(last), .target = {}};
}

void evaluator::visit(const do_while_statement& expr)
{
    std::optional<value> last;
    do {
        auto result = execute(expr.body);
        if (result.val.has_value()) {
            last = std::move(result.val);
        }
        if (result.type == completion_type::brake) {
            break;
        }
        if (result.type == completion_type::ret) {
            m_completion = {.type = completion_type::ret, .val = std::move(last), .target = {}};
            return;
        }
    } while (evaluate_value(expr.condition).is_truthy());
    m_completion = {.type = completion_type::normal, .val = std::move(last), .target = {}};
}

void evaluator::visit(const continue_statement& /*expr*/)
{
    m_completion = {.type = completion_type::cont, .val = {}, .target = {}};
}

void evaluator::visit(const break_statement& /*expr*/)
{
    m_completion = {.type = completion_type::brake, .val = {}, .target = {}};
}

void evaluator::visit(const return_statement& expr)
{
    m_completion = {.type = completion_type::ret,
                    .val = expr.value != nullptr ? evaluate_value(expr.value) : value {},
                    .target = {}};
}

void evaluator::visit(const debugger_statement& /*expr*/)
{
    m_completion = {};
}

namespace
{
// NOLINTBEGIN(*)
using host_values = std::vector<std::pair<std::string, value>>;

auto check_no_parse_errors(const parser& prsr) -> bool
{
    INFO("expected no errors, got:\n", fmt::format("{}", fmt::join(prsr.errors(), "\n")));
    CHECK(prsr.errors().empty());
    return prsr.errors().empty();
}

auto check_program(std::string_view input) -> program*
{
    auto prsr = parser {lexer {input}};
    auto* prgrm = prsr.parse_program();
    INFO("while parsing: `", input, "`");
    CHECK(check_no_parse_errors(prsr));
    return prgrm;
}

struct run_result
{
    completion result;
    environment* globals {};
    std::string output;
};

auto run(std::string_view input, host_values hosts = {}) -> run_result
{
    auto* prgrm = check_program(input);
    std::ostringstream out;
    hosts.emplace_back("console", make_console(out));
    auto [result, globals] = execute_program(prgrm, make_global_environment(hosts));
    return {.result = std::move(result), .globals = globals, .output = out.str()};
}

auto eval(std::string_view input, host_values hosts = {}) -> value
{
    auto [result, globals, output] = run(input, std::move(hosts));
    INFO(input);
    REQUIRE_FALSE(result.is_abrupt());
    REQUIRE(result.val.has_value());
    return result.val.value();
}

auto require_number(const value& val, double expected, std::string_view input) -> void
{
    INFO(input, " expected: number with: ", expected, " got: ", val.type_name(), " with: ", val.inspect());
    REQUIRE(val.is<double>());
    REQUIRE_EQ(val.as<double>(), doctest::Approx(expected));
}

auto require_global(const run_result& ran, const std::string& name, const value& expected) -> void
{
    INFO("global ", name, " expected: ", expected.inspect());
    const auto actual = ran.globals->find(name);
    REQUIRE(actual.has_value());
    REQUIRE_EQ(actual.value(), expected);
}

TEST_SUITE_BEGIN("eval");

TEST_CASE("numberExpressions")
{
    struct et
    {
        std::string_view input;
        double expected;
    };

    std::array tests {
        et {"5", 5},
        et {"-5", -5},
        et {"+-1", -1},
        et {"1 + 2 * 7", 15},
        et {"(1 + 2) * 7", 21},
        et {"2.5 + 0.25", 2.75},
        et {"7 / 2", 3.5},
        et {"7 % 3", 1},
        et {"-7 % 3", -1},
        et {"5.5 % 2", 1.5},
        et {"10 - 4 - 3", 3},
        et {"2 << 3", 16},
        et {"-16 >> 2", -4},
        et {"6 & 3", 2},
        et {"6 | 3", 7},
        et {"6 ^ 3", 5},
        et {"~5", -6},
        et {"1 << 32", 1},
        et {"4294967295 | 0", -1},
        et {"true + 1", 2},
        et {"null + 1", 1},
        et {"\"3\" * \"4\"", 12},
        et {"\" 8 \" - 1", 7},
        et {"+\"\"", 0},
        et {"x + y * 3", 9},
    };
    for (const auto& [input, expected] : tests) {
        require_number(eval(input, {{"x", 3}, {"y", 2}}), expected, input);
    }
}

TEST_CASE("numericCoercionFailuresYieldNaN")
{
    std::array inputs {"+\"abc\"", "-undefined", "\"a\" * 2", "({}) - 1", "[1] * 2"};
    for (const auto* input : inputs) {
        const auto result = eval(input);
        INFO(input);
        REQUIRE(result.is<double>());
        CHECK(std::isnan(result.as<double>()));
    }
}

TEST_CASE("divisionByZero")
{
    CHECK(std::isinf(eval("1 / 0").as<double>()));
    CHECK(std::isnan(eval("0 / 0").as<double>()));
    CHECK(std::isnan(eval("1 % 0").as<double>()));
}

TEST_CASE("stringExpressions")
{
    struct et
    {
        std::string_view input;
        std::string_view expected;
    };

    std::array tests {
        et {R"("Hello" + " " + "World!")", "Hello World!"},
        et {R"("n" + 1)", "n1"},
        et {R"(1 + "n")", "1n"},
        et {R"(1.5 + "")", "1.5"},
        et {R"(0.00001 + "")", "0.00001"},
        et {R"(1e-7 + "")", "1e-7"},
        et {R"("v" + true)", "vtrue"},
        et {R"("v" + undefined)", "vundefined"},
        et {R"("v" + [1, 2])", "v[1, 2]"},
        et {R"('it\'s')", "it's"},
        et {R"("tab\tend")", "tab\tend"},
        et {R"("ham" === "spam" ? "SPAMSPAMSPAM" : "no spam")", "no spam"},
        et {R"(typeof 1)", "object"},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = eval(input);
        INFO(input);
        REQUIRE(result.is<std::string>());
        CHECK_EQ(result.as<std::string>(), expected);
    }
}

TEST_CASE("booleanExpressions")
{
    struct et
    {
        std::string_view input;
        bool expected;
    };

    std::array tests {
        et {"true", true},
        et {"!true", false},
        et {"!0", true},
        et {"!\"\"", true},
        et {"![]", false},
        et {"1 < 2", true},
        et {"2 <= 2", true},
        et {"3 > 4", false},
        et {"3 >= 4", false},
        et {"\"a\" < \"b\"", true},
        et {"\"10\" < \"9\"", true},
        et {"10 < \"9\"", false},
        et {"1 < undefined", false},
        et {"undefined >= 1", false},
        et {"1 == 1", true},
        et {"1 === 1", true},
        et {"1 == \"1\"", false},
        et {"1 != 2", true},
        et {"\"a\" !== \"a\"", false},
        et {"null == null", true},
        et {"undefined == null", false},
        et {"[1, [2]] == [1, [2]]", true},
        et {"({a: 1}) === ({a: 1})", true},
        et {"({a: 1}) == ({a: 2})", false},
        et {"1 in 2", false},
        et {"1 instanceof 2", false},
        et {"delete x", true},
        et {"(2 + 2 == 4) && !false", true},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = eval(input, {{"x", 1}});
        INFO(input);
        REQUIRE(result.is<bool>());
        CHECK_EQ(result.as<bool>(), expected);
    }
}

TEST_CASE("logicalOperatorsReturnDecidingOperand")
{
    CHECK_EQ(eval("0 || \"fallback\""), value {"fallback"});
    CHECK_EQ(eval("\"first\" || \"second\""), value {"first"});
    CHECK_EQ(eval("\"\" && 1"), value {""});
    CHECK_EQ(eval("1 && null"), value {null_type {}});
    CHECK(eval("void 0").is_undefined());
}

TEST_CASE("logicalOperatorsShortCircuit")
{
    const auto run_and = run("var called = false; var sideEffect = function () { called = true; }; false && sideEffect();");
    require_global(run_and, "called", false);
    const auto run_or = run("var called = false; var sideEffect = function () { called = true; }; true || sideEffect();");
    require_global(run_or, "called", false);
    const auto run_taken = run("var called = false; var sideEffect = function () { called = true; }; true && sideEffect();");
    require_global(run_taken, "called", true);
}

TEST_CASE("conditionalEvaluatesOneBranch")
{
    const auto result = run("var a = 0, b = 0; true ? ++a : ++b; false ? ++a : ++b;");
    require_global(result, "a", 1);
    require_global(result, "b", 1);
}

TEST_CASE("prefixAndPostfix")
{
    struct et
    {
        std::string_view input;
        double expected;
        double x;
    };

    std::array tests {
        et {"++x", 4, 4},
        et {"--x", 2, 2},
        et {"x++", 3, 4},
        et {"x--", 3, 2},
        et {"x++ + x", 7, 4},
        et {"o.n++", 5, 3},
    };
    for (const auto& [input, expected, x] : tests) {
        auto* obj = make<object_value>();
        obj->properties.set("n", 5);
        const auto result = run(input, {{"x", 3}, {"o", obj}});
        INFO(input);
        REQUIRE(result.result.val.has_value());
        require_number(result.result.val.value(), expected, input);
        require_global(result, "x", x);
    }
}

TEST_CASE("incrementCoercesToNumber")
{
    const auto result = run("var s = \"41\"; var old = s++; var u; ++u;");
    require_global(result, "s", 42);
    require_global(result, "old", 41);
    const auto u = result.globals->find("u");
    REQUIRE(u.has_value());
    CHECK(std::isnan(u->as<double>()));
}

TEST_CASE("incrementNeedsReference")
{
    CHECK_THROWS_AS(run("++1;"), reference_error);
    CHECK_THROWS_WITH(run("(1 + 2)++;"), "ReferenceError: invalid ++ operand (1 + 2)");
}

TEST_CASE("assignments")
{
    struct et
    {
        std::string_view input;
        double expected;
        double x;
    };

    std::array tests {
        et {"x = 7, x", 7, 7},
        et {"x = 7", 7, 7},
        et {"x /= 5 - 2", 5, 5},
        et {"x += 1", 16, 16},
        et {"x -= 1", 14, 14},
        et {"x *= 2", 30, 30},
        et {"x %= 4", 3, 3},
        et {"x <<= 1", 30, 30},
        et {"x >>= 1", 7, 7},
        et {"x &= 6", 6, 6},
        et {"x |= 16", 31, 31},
        et {"x ^= 1", 14, 14},
        et {"y = x = 2", 2, 2},
    };
    for (const auto& [input, expected, x] : tests) {
        const auto result = run(input, {{"x", 15}});
        INFO(input);
        REQUIRE(result.result.val.has_value());
        require_number(result.result.val.value(), expected, input);
        require_global(result, "x", x);
    }
}

TEST_CASE("compoundStringAssignment")
{
    const auto result = run("var s = \"a\"; s += 1; s += \"b\";");
    require_global(result, "s", "a1b");
}

TEST_CASE("assignmentNeedsReference")
{
    CHECK_THROWS_WITH(run("1 = 2;"), "ReferenceError: invalid assignment target 1");
    const auto* noop = make<native_function_value>(native_function_value {
        .name = "noop",
        .body = [](const value& /*this_value*/, std::vector<value>&& /*arguments*/) { return value {}; },
    });
    CHECK_THROWS_AS(run("noop() = 2;", {{"noop", noop}}), reference_error);
}

TEST_CASE("undeclaredAssignmentCreatesGlobal")
{
    const auto result = run("var f = function () { leaked = 5; }; f();");
    require_global(result, "leaked", 5);
}

TEST_CASE("unresolvedIdentifier")
{
    CHECK_THROWS_AS(run("missing;"), reference_error);
    CHECK_THROWS_WITH(run("missing + 1;"), "ReferenceError: missing is not defined");
}

TEST_CASE("propertyAccess")
{
    CHECK_EQ(eval("({cheese: 7, ham: 3}).cheese"), value {7});
    CHECK_EQ(eval("({cheese: 7, ham: 3})['ham']"), value {3});
    CHECK(eval("({cheese: 7}).spam").is_undefined());
    CHECK_EQ(eval("({1: \"one\"})[1]"), value {"one"});
    CHECK_EQ(eval("({\"2\": \"two\"})[1 + 1]"), value {"two"});
    CHECK_EQ(eval("[9, 10, 11][1]"), value {10});
    CHECK_EQ(eval("[9, 10, 11][\"2\"]"), value {11});
    CHECK_EQ(eval("[9, 10, 11].length"), value {3});
    CHECK_EQ(eval("\"abc\".length"), value {3});
    CHECK_EQ(eval("\"abc\"[1]"), value {"b"});
    CHECK(eval("(5).foo").is_undefined());
}

TEST_CASE("propertyAccessOnNothing")
{
    CHECK_THROWS_WITH(run("undefined.foo;"), "TypeError: cannot read property 'foo' of undefined");
    CHECK_THROWS_AS(run("null[0];"), type_error);
    CHECK_THROWS_AS(run("var s = \"str\"; s.x = 1;"), type_error);
}

TEST_CASE("objectSetProperty")
{
    auto* obj = make<object_value>();
    obj->properties.set("cheese", 7);
    obj->properties.set("ham", 3);

    const auto set_existing = eval("x[\"cheese\"] = 4", {{"x", obj}});
    CHECK_EQ(set_existing, value {4});
    CHECK_EQ(obj->properties.get("cheese"), std::optional<value> {4});

    const auto set_new = eval("x[\"spam\"] = 2", {{"x", obj}});
    CHECK_EQ(set_new, value {2});
    CHECK_EQ(obj->properties.get("spam"), std::optional<value> {2});
    CHECK_EQ(obj->properties.size(), 3U);
}

TEST_CASE("arraySetIndex")
{
    auto* arr = make<array_value>(std::vector<value> {9, 10, "ala ma kota"});
    CHECK_EQ(eval("x[2] = 11", {{"x", arr}}), value {11});
    const auto expected = value {make<array_value>(std::vector<value> {9, 10, 11})};
    CHECK_EQ(value {arr}, expected);

    CHECK_EQ(eval("x[5] = 1, x.length", {{"x", arr}}), value {6});
    CHECK(arr->at(4).is_undefined());
}

TEST_CASE("nestedPropertyWrites")
{
    const auto result = run("var o = {inner: {list: []}}; o.inner.list[0] = \"x\"; o.inner.count = 1; o.inner.list[0];");
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {"x"});
    const auto o = result.globals->find("o");
    REQUIRE(o.has_value());
    CHECK_EQ(o->inspect(), R"({inner: {list: ["x"], count: 1}})");
}

TEST_CASE("arrayLiterals")
{
    struct et
    {
        std::string_view input;
        std::string_view expected;
        double length;
    };

    std::array tests {
        et {"[9, 10, \"ala ma kota\"]", R"([9, 10, "ala ma kota"])", 3},
        et {"[]", "[]", 0},
        et {"[,]", "[undefined]", 1},
        et {"[,,]", "[undefined, undefined]", 2},
        et {"[,,,]", "[undefined, undefined, undefined]", 3},
        et {"[1, 2,]", "[1, 2]", 2},
        et {"[1, 2,,]", "[1, 2, undefined]", 3},
        et {"[1,,2]", "[1, undefined, 2]", 3},
        et {"[1,,,2]", "[1, undefined, undefined, 2]", 4},
        et {"[1 + 1, [3]]", "[2, [3]]", 2},
    };
    for (const auto& [input, expected, length] : tests) {
        const auto result = eval(input);
        INFO(input);
        REQUIRE(result.is<array_value*>());
        CHECK_EQ(result.inspect(), expected);
        CHECK_EQ(static_cast<double>(result.as<array_value*>()->length()), length);
    }
}

TEST_CASE("objectLiterals")
{
    CHECK_EQ(eval("({})").inspect(), "{}");
    CHECK_EQ(eval("({a: 1, \"b c\": 2, 3: [4]})").inspect(), "{a: 1, b c: 2, 3: [4]}");
    CHECK_EQ(eval("({a: 1, a: 2})").inspect(), "{a: 2}");
    CHECK_EQ(eval("({1.50: \"x\"})").inspect(), R"({1.5: "x"})");
}

TEST_CASE("newReturnsEmptyObject")
{
    const auto result = run("var called = false; var F = function () { called = true; }; var o = new F(1, 2);");
    require_global(result, "called", false);
    const auto o = result.globals->find("o");
    REQUIRE(o.has_value());
    CHECK_EQ(o->inspect(), "{}");
}

TEST_CASE("statementCompletions")
{
    struct et
    {
        std::string_view input;
        std::optional<double> expected;
    };

    std::array tests {
        et {";", std::nullopt},
        et {"1 + 2 * 7;", 15},
        et {"{ 1; 3; }", 3},
        et {"{ 1; {3; 2;}}", 2},
        et {"{7;;}", 7},
        et {"{}", std::nullopt},
        et {"var x = 7;", std::nullopt},
        et {"1; var x = 7;", 1},
        et {"if (2 + 2 == 4) 3;", 3},
        et {"if (false) 3;", std::nullopt},
        et {"if (false) 3; else 5;", 5},
        et {"if (false) if (true) 3; else 5;", std::nullopt},
        et {"if (true) if (true) 3; else 5;", 3},
        et {"debugger;", std::nullopt},
        et {"4; debugger;", 4},
        et {"while (false) 1;", std::nullopt},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = run(input);
        INFO(input);
        CHECK_EQ(result.result.type, completion_type::normal);
        REQUIRE_EQ(result.result.val.has_value(), expected.has_value());
        if (expected.has_value()) {
            require_number(result.result.val.value(), expected.value(), input);
        }
    }
}

TEST_CASE("variableDeclarations")
{
    const auto single = run("var x = 7;");
    require_global(single, "x", 7);

    const auto list = run("var x = 7, y = 5;");
    require_global(list, "x", 7);
    require_global(list, "y", 5);

    const auto uninitialised = run("var z;");
    const auto z = uninitialised.globals->find("z");
    REQUIRE(z.has_value());
    CHECK(z->is_undefined());
}

TEST_CASE("hoisting")
{
    const auto result = run("var before = x; if (false) { var x = 1; } var after = x;");
    const auto before = result.globals->find("before");
    REQUIRE(before.has_value());
    CHECK(before->is_undefined());

    const auto in_function = run("var f = function () { var seen = inner; var inner = 2; return seen; }; var r = f();");
    const auto r = in_function.globals->find("r");
    REQUIRE(r.has_value());
    CHECK(r->is_undefined());
    CHECK_FALSE(in_function.globals->find("inner").has_value());
}

TEST_CASE("whileStatement")
{
    const auto result = run("while (x < 5) ++x;", {{"x", 3}});
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {5});
    require_global(result, "x", 5);
}

TEST_CASE("doWhileStatement")
{
    const auto result = run("do ++x; while (x < 3);", {{"x", 3}});
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {4});
    require_global(result, "x", 4);
}

TEST_CASE("continueStatement")
{
    const auto* input = R"(
        while (x < 10) {
            ++x;
            if (x % 2 == 0)
                continue;
            ++y;
        })";
    const auto result = run(input, {{"x", 0}, {"y", 0}});
    CHECK_EQ(result.result.type, completion_type::normal);
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {5});
    require_global(result, "x", 10);
    require_global(result, "y", 5);
}

TEST_CASE("breakStatement")
{
    const auto* input = R"(
        while (x < 10) {
            ++x;
            if (x % 3 == 0)
                break;
            ++y;
        })";
    const auto result = run(input, {{"x", 0}, {"y", 0}});
    CHECK_EQ(result.result.type, completion_type::normal);
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {2});
    require_global(result, "x", 3);
    require_global(result, "y", 2);
}

TEST_CASE("doWhileBreakAndContinue")
{
    const auto result = run("var i = 0, odd = 0; do { ++i; if (i % 2 == 0) continue; if (i > 6) break; ++odd; } while (i < 10);");
    require_global(result, "i", 7);
    require_global(result, "odd", 3);
}

TEST_CASE("topLevelAbruptCompletion")
{
    const auto result = run("1; break; 2;");
    CHECK_EQ(result.result.type, completion_type::brake);
    CHECK_FALSE(result.result.val.has_value());
}

TEST_CASE("returnStatements")
{
    struct et
    {
        std::string_view input;
        double expected;
    };

    std::array tests {
        et {"function () { return 4; 7; } ();", 4},
        et {"var f = function () { return 42; }; f();", 42},
        et {"var sqr = function (x) { return x * x; }; sqr(7);", 49},
        et {"var double = function (f, x) { return f(f(x)); }; double(function (x) { return x * x; }, 2);", 16},
        et {"var f = function () { while (true) { { return 10; } } }; f();", 10},
        et {"var f = function () { do { if (true) return 3; } while (true); }; f();", 3},
        et {"var f = function (n) { var i = 0; while (true) { if (i == n) return i * 2; ++i; } }; f(4);", 8},
    };
    for (const auto& [input, expected] : tests) {
        const auto result = run(input);
        INFO(input);
        CHECK_EQ(result.result.type, completion_type::normal);
        REQUIRE(result.result.val.has_value());
        require_number(result.result.val.value(), expected, input);
    }
}

TEST_CASE("functionsReturnUndefinedByDefault")
{
    CHECK(eval("function () {} ()").is_undefined());
    CHECK(eval("function () { 5; } ()").is_undefined());
    CHECK(eval("function () { return; } ()").is_undefined());
}

TEST_CASE("argumentBinding")
{
    CHECK(eval("function (a, b) { return b; } (1)").is_undefined());
    CHECK_EQ(eval("function (a) { return a; } (1, 2)"), value {1});
    CHECK_EQ(eval("function (a, b) { return arguments; } (1, 2, 3)").inspect(), "[1, 2, 3]");
    CHECK_EQ(eval("function () { return arguments.length; } ()"), value {0});
    CHECK_EQ(eval("function (a, a) { return a; } (1, 2)"), value {2});
    CHECK_EQ(eval("function (x) { var x; return x; } (9)"), value {9});
}

TEST_CASE("thisBinding")
{
    CHECK(eval("this").is_undefined());
    CHECK(eval("function () { return this; } ()").is_undefined());
    CHECK_EQ(eval("var o = {name: \"o\", who: function () { return this.name; }}; o.who();"), value {"o"});
    CHECK_EQ(eval("var o = {f: function () { return this; }}; o[\"f\"]() === o;"), value {true});
    CHECK(eval("var o = {f: function () { return this; }}; var g = o.f; g();").is_undefined());
}

TEST_CASE("callingNonFunctions")
{
    CHECK_THROWS_WITH(run("var x = 1; x();"), "TypeError: x is not a function");
    CHECK_THROWS_AS(run("({}).missing();"), type_error);
    CHECK_THROWS_AS(run("\"str\"(1);"), type_error);
}

TEST_CASE("argumentsEvaluatedLeftToRight")
{
    const auto result = run("var log = \"\"; var f = function () {}; var note = function (s) { log += s; return s; }; f(note(\"a\"), note(\"b\"), note(\"c\"));");
    require_global(result, "log", "abc");
}

TEST_CASE("modifyGlobalVariable")
{
    const auto result = run("var x = 1, incrementX = function () { x += 1; }; incrementX(); incrementX(); x;");
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {3});
}

TEST_CASE("shadowing")
{
    const auto* input = R"(
        var x = 1;
        var shadow = function () {
            var x = 3; x += 1; return x;
        };
        shadow();)";
    const auto result = run(input);
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {4});
    require_global(result, "x", 1);
}

TEST_CASE("closures")
{
    const auto* input = R"(
        var fibgen = function () {
            var a = 0, b = 1;
            return function () {
                var old = a;
                a = b;
                b = b + old;
                return old;
            };
        };

        var fib = fibgen();
        var f1 = fib();
        var f2 = fib();
        fib(); fib(); fib(); fib();
        var f7 = fib();
        fib(); fib(); fib(); fib();

        var fib2 = fibgen();
        fib2(); fib2(); fib2(); fib2();
        var f5 = fib2();

        fib(); // f12
    )";
    const auto result = run(input);
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {89});
    require_global(result, "f1", 0);
    require_global(result, "f2", 1);
    require_global(result, "f5", 3);
    require_global(result, "f7", 8);
}

TEST_CASE("closuresShareTheirScope")
{
    const auto* input = R"(
        var counter = function () {
            var count = 0;
            return {inc: function () { return ++count; }, get: function () { return count; }};
        };
        var c = counter();
        c.inc(); c.inc();
        var seen = c.get();
        var other = counter().get();
    )";
    const auto result = run(input);
    require_global(result, "seen", 2);
    require_global(result, "other", 0);
}

TEST_CASE("recursion")
{
    const auto result = run("var fact = function (n) { if (n <= 1) return 1; return n * fact(n - 1); }; fact(10);");
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {3628800});
}

TEST_CASE("functionDisplay")
{
    CHECK_EQ(eval("function (a, b) { return a; }").inspect(), "function (a, b) {...}");
    CHECK_EQ(eval("console.log").inspect(), "function log() { [native code] }");
    CHECK_EQ(eval("var f = function () {}; f == f;"), value {true});
    CHECK_EQ(eval("function () {} == function () {}"), value {false});
}

TEST_CASE("consoleObject")
{
    const auto* input = R"(
        var i = 0;
        while (i < 10) {
            console.log(i);
            i++;
        }
    )";
    const auto result = run(input);
    REQUIRE(result.result.val.has_value());
    CHECK_EQ(result.result.val.value(), value {9});
    CHECK_EQ(result.output, "0\n1\n2\n3\n4\n5\n6\n7\n8\n9\n");
}

TEST_CASE("consoleLogReturnsUndefined")
{
    const auto result = run("console.log(\"a\", 1, [true], {k: \"v\"});");
    REQUIRE(result.result.val.has_value());
    CHECK(result.result.val->is_undefined());
    CHECK_EQ(result.output, "a 1 [true] {k: \"v\"}\n");
}

TEST_CASE("fibonacciTable")
{
    const auto* input = R"(
        // Generates Fibonacci numbers from F_0 to F_20
        var fibgen = function () {
            var a = 0, b = 1;
            return function () {
                var old = a;
                a = b;
                b = b + old;
                return old;
            };
        };

        var fibonacciNumbers = [], count = 21, i = 0, fib = fibgen();

        while (i < count) {
            fibonacciNumbers[i] = fib();
            ++i;
        }
    )";
    const auto result = run(input);
    const auto numbers = result.globals->find("fibonacciNumbers");
    REQUIRE(numbers.has_value());
    CHECK_EQ(numbers->inspect(),
             "[0, 1, 1, 2, 3, 5, 8, 13, 21, 34, 55, 89, 144, 233, 377, 610, 987, 1597, 2584, 4181, 6765]");
}

TEST_CASE("firstTwentyPrimes")
{
    const auto* input = R"(
        // Print first 20 prime numbers
        var isPrime = function (n) {
            var i = 2;
            while (i * i <= n) {
                if (n % i === 0) {
                    return false;
                }
                ++i;
            }
            return true;
        };

        var printPrimes = function (count) {
            var i = 0, n = 2;
            while (true) {
                if (isPrime(n)) {
                    console.log(n);
                    ++i;
                    if (i >= count) {
                        break;
                    }
                }
                ++n;
            }
        };

        printPrimes(20);
    )";
    const auto result = run(input);
    CHECK_EQ(result.output, "2\n3\n5\n7\n11\n13\n17\n19\n23\n29\n31\n37\n41\n43\n47\n53\n59\n61\n67\n71\n");
}

TEST_CASE("pascalTriangle")
{
    const auto* input = R"(
        var sierpinski = function(rowCount) {
            var row = [1], length = 1, i = 0;
            var nextRow = function() {
                var result = [1], i = 0;
                while (i < length - 1) {
                    result[i + 1] = row[i] + row[i + 1];
                    ++i;
                }
                result[i + 1] = 1;
                return result;
            };

            while (i < rowCount) {
                console.log(row);
                row = nextRow();
                ++length;
                ++i;
            }
        };

        sierpinski(10);
    )";
    const auto result = run(input);
    CHECK_EQ(result.output,
             "[1]\n"
             "[1, 1]\n"
             "[1, 2, 1]\n"
             "[1, 3, 3, 1]\n"
             "[1, 4, 6, 4, 1]\n"
             "[1, 5, 10, 10, 5, 1]\n"
             "[1, 6, 15, 20, 15, 6, 1]\n"
             "[1, 7, 21, 35, 35, 21, 7, 1]\n"
             "[1, 8, 28, 56, 70, 56, 28, 8, 1]\n"
             "[1, 9, 36, 84, 126, 126, 84, 36, 9, 1]\n");
}

TEST_CASE("applyFunctionDirectly")
{
    const auto result = run("var add = function (a, b) { return a + b + this; };");
    const auto add = result.globals->find("add");
    REQUIRE(add.has_value());
    const auto sum = evaluator::apply_function(add.value(), 100, {1, 2});
    CHECK_EQ(sum, value {103});
    CHECK_THROWS_AS((void)evaluator::apply_function(value {1}, value {}, {}), type_error);
}

TEST_CASE("smallNumberPropertyKeys")
{
    const auto val = eval(R"(var o = {}; o[0.0000015] = "small"; o["0.0000015"])");
    CHECK_EQ(val, value {"small"});
}

TEST_CASE("unknownOperatorsAreSyntaxErrors")
{
    auto* globals = make_global_environment({{"x", 1}});
    evaluator evltr {globals};
    const auto loc = location {};

    auto* bin = make<binary_expression>(loc);
    bin->left = make<number_literal>(1.0, loc);
    bin->op = token_type::comma;
    bin->right = make<number_literal>(2.0, loc);
    CHECK_THROWS_AS((void)evltr.evaluate(bin), syntax_error);
    CHECK_THROWS_WITH((void)evltr.evaluate(bin), "SyntaxError: unknown binary operator ,");

    auto* unary = make<unary_expression>(loc);
    unary->op = token_type::comma;
    unary->operand = make<number_literal>(1.0, loc);
    CHECK_THROWS_AS((void)evltr.evaluate(unary), syntax_error);
    CHECK_THROWS_WITH((void)evltr.evaluate(unary), "SyntaxError: unknown unary operator ,");

    auto* assign = make<assign_expression>(loc);
    assign->target = make<identifier>("x", loc);
    assign->op = token_type::comma;
    assign->value = make<number_literal>(2.0, loc);
    CHECK_THROWS_AS((void)evltr.evaluate(assign), syntax_error);
    CHECK_THROWS_WITH((void)evltr.evaluate(assign), "SyntaxError: unknown assignment operator ,");
    require_number(globals->get("x"), 1, "x after a rejected assignment");
}

TEST_SUITE_END();
// NOLINTEND(*)
}  // namespace
