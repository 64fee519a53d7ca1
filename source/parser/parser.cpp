#include <array>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "parser.hpp"

#include <ast/array_literal.hpp>
#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/boolean_literal.hpp>
#include <ast/call_expression.hpp>
#include <ast/comma_expression.hpp>
#include <ast/conditional_expression.hpp>
#include <ast/expression.hpp>
#include <ast/function_literal.hpp>
#include <ast/identifier.hpp>
#include <ast/new_expression.hpp>
#include <ast/null_literal.hpp>
#include <ast/number_literal.hpp>
#include <ast/object_literal.hpp>
#include <ast/program.hpp>
#include <ast/property_access.hpp>
#include <ast/statements.hpp>
#include <ast/string_literal.hpp>
#include <ast/this_expression.hpp>
#include <ast/unary_expression.hpp>
#include <ast/util.hpp>
#include <doctest/doctest.h>
#include <fmt/ranges.h>
#include <gc.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <overloaded.hpp>

namespace
{
enum precedence : std::uint8_t
{
    lowest,
    sequence,
    assignment,
    ternary,
    or_else,
    and_also,
    bit_or,
    bit_xor,
    bit_and,
    equality,
    relational,
    shift,
    sum,
    product,
    prefix,
    postfix,
    call,
    member,
};

auto precedence_of_token(token_type type) -> std::uint8_t
{
    switch (type) {
        case token_type::comma:
            return sequence;
        case token_type::assign:
        case token_type::plus_assign:
        case token_type::minus_assign:
        case token_type::asterisk_assign:
        case token_type::slash_assign:
        case token_type::percent_assign:
        case token_type::ampersand_assign:
        case token_type::pipe_assign:
        case token_type::caret_assign:
        case token_type::shift_left_assign:
        case token_type::shift_right_assign:
            return assignment;
        case token_type::question:
            return ternary;
        case token_type::logical_or:
            return or_else;
        case token_type::logical_and:
            return and_also;
        case token_type::pipe:
            return bit_or;
        case token_type::caret:
            return bit_xor;
        case token_type::ampersand:
            return bit_and;
        case token_type::equals:
        case token_type::not_equals:
        case token_type::strict_equals:
        case token_type::strict_not_equals:
            return equality;
        case token_type::less_than:
        case token_type::greater_than:
        case token_type::less_equal:
        case token_type::greater_equal:
        case token_type::in:
        case token_type::instanceof:
            return relational;
        case token_type::shift_left:
        case token_type::shift_right:
            return shift;
        case token_type::plus:
        case token_type::minus:
            return sum;
        case token_type::asterisk:
        case token_type::slash:
        case token_type::percent:
            return product;
        case token_type::plus_plus:
        case token_type::minus_minus:
            return postfix;
        case token_type::lparen:
            return call;
        case token_type::lbracket:
        case token_type::dot:
            return member;
        default:
            return lowest;
    }
}

auto hex_digit(char chr) -> std::optional<unsigned>
{
    if (chr >= '0' && chr <= '9') {
        return static_cast<unsigned>(chr - '0');
    }
    if (chr >= 'a' && chr <= 'f') {
        return static_cast<unsigned>(chr - 'a' + 10);
    }
    if (chr >= 'A' && chr <= 'F') {
        return static_cast<unsigned>(chr - 'A' + 10);
    }
    return std::nullopt;
}

auto append_utf8(std::string& out, unsigned code_unit) -> void
{
    if (code_unit < 0x80U) {
        out += static_cast<char>(code_unit);
    } else if (code_unit < 0x800U) {
        out += static_cast<char>(0xC0U | (code_unit >> 6U));
        out += static_cast<char>(0x80U | (code_unit & 0x3FU));
    } else {
        out += static_cast<char>(0xE0U | (code_unit >> 12U));
        out += static_cast<char>(0x80U | ((code_unit >> 6U) & 0x3FU));
        out += static_cast<char>(0x80U | (code_unit & 0x3FU));
    }
}

// \xHH and \uHHHH need exactly that many hex digits, any other escaped character stands for itself
auto unescape(std::string_view raw) -> std::optional<std::string>
{
    std::string result;
    result.reserve(raw.size());
    for (std::string_view::size_type idx = 0; idx < raw.size(); ++idx) {
        const auto chr = raw[idx];
        if (chr != '\\' || idx + 1 == raw.size()) {
            result += chr;
            continue;
        }
        switch (const auto escaped = raw[++idx]) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case 'r':
                result += '\r';
                break;
            case 'b':
                result += '\b';
                break;
            case 'f':
                result += '\f';
                break;
            case 'v':
                result += '\v';
                break;
            case '0':
                result += '\0';
                break;
            case 'x':
            case 'u': {
                const auto width = std::string_view::size_type {escaped == 'x' ? 2U : 4U};
                if (idx + width >= raw.size()) {
                    return std::nullopt;
                }
                unsigned code_unit = 0;
                for (std::string_view::size_type digit = 1; digit <= width; ++digit) {
                    const auto nibble = hex_digit(raw[idx + digit]);
                    if (!nibble.has_value()) {
                        return std::nullopt;
                    }
                    code_unit = (code_unit << 4U) | nibble.value();
                }
                append_utf8(result, code_unit);
                idx += width;
                break;
            }
            default:
                result += escaped;
        }
    }
    return result;
}

auto parse_number(std::string_view literal) -> double
{
    const auto str = std::string {literal};
    return std::strtod(str.c_str(), nullptr);
}
}  // namespace

parser::parser(lexer lxr)
    : m_lxr(lxr)
{
    next_token();
    next_token();
    using enum token_type;
    register_unary(ident, [this] { return parse_identifier(); });
    register_unary(number, [this] { return parse_number_literal(); });
    register_unary(string, [this] { return parse_string_literal(); });
    register_unary(tru, [this] { return parse_boolean_literal(); });
    register_unary(fals, [this] { return parse_boolean_literal(); });
    register_unary(null, [this] { return parse_null_literal(); });
    register_unary(thiz, [this] { return parse_this_expression(); });
    register_unary(exclamation, [this] { return parse_unary_expression(); });
    register_unary(tilde, [this] { return parse_unary_expression(); });
    register_unary(minus, [this] { return parse_unary_expression(); });
    register_unary(plus, [this] { return parse_unary_expression(); });
    register_unary(plus_plus, [this] { return parse_unary_expression(); });
    register_unary(minus_minus, [this] { return parse_unary_expression(); });
    register_unary(delet, [this] { return parse_unary_expression(); });
    register_unary(voyd, [this] { return parse_unary_expression(); });
    register_unary(tipeof, [this] { return parse_unary_expression(); });
    register_unary(lparen, [this] { return parse_grouped_expression(); });
    register_unary(function, [this] { return parse_function_literal(); });
    register_unary(neu, [this] { return parse_new_expression(); });
    register_unary(lbracket, [this] { return parse_array_literal(); });
    register_unary(lsquirly, [this] { return parse_object_literal(); });
    for (const auto type : {plus,
                            minus,
                            asterisk,
                            slash,
                            percent,
                            shift_left,
                            shift_right,
                            less_than,
                            greater_than,
                            less_equal,
                            greater_equal,
                            in,
                            instanceof,
                            equals,
                            not_equals,
                            strict_equals,
                            strict_not_equals,
                            ampersand,
                            caret,
                            pipe,
                            logical_and,
                            logical_or})
    {
        register_binary(type, [this](expression* left) { return parse_binary_expression(left); });
    }
    for (const auto type : {assign,
                            plus_assign,
                            minus_assign,
                            asterisk_assign,
                            slash_assign,
                            percent_assign,
                            shift_left_assign,
                            shift_right_assign,
                            ampersand_assign,
                            caret_assign,
                            pipe_assign})
    {
        register_binary(type, [this](expression* target) { return parse_assign_expression(target); });
    }
    register_binary(plus_plus, [this](expression* operand) { return parse_postfix_expression(operand); });
    register_binary(minus_minus, [this](expression* operand) { return parse_postfix_expression(operand); });
    register_binary(question, [this](expression* condition) { return parse_conditional_expression(condition); });
    register_binary(comma, [this](expression* left) { return parse_comma_expression(left); });
    register_binary(lparen, [this](expression* callee) { return parse_call_expression(callee); });
    register_binary(lbracket, [this](expression* object) { return parse_index_expression(object); });
    register_binary(dot, [this](expression* object) { return parse_dot_expression(object); });
}

auto parser::parse_program() -> program*
{
    auto* prog = make<program>(m_current_token.loc);
    while (m_current_token.type != token_type::eof) {
        auto* stmt = parse_statement();
        if (stmt != nullptr) {
            prog->statements.push_back(stmt);
        }
        next_token();
    }
    return prog;
}

auto parser::errors() const -> const std::vector<std::string>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_current_token = m_peek_token;
    m_peek_token = m_lxr.next_token();
}

auto parser::parse_statement() -> statement*
{
    using enum token_type;
    switch (m_current_token.type) {
        case lsquirly:
            return parse_block_statement();
        case var:
            return parse_var_statement();
        case semicolon:
            return make<empty_statement>(m_current_token.loc);
        case eef:
            return parse_if_statement();
        case hwile:
            return parse_while_statement();
        case doo:
            return parse_do_while_statement();
        case cont:
            return parse_keyword_statement<continue_statement>();
        case brake:
            return parse_keyword_statement<break_statement>();
        case debugger:
            return parse_keyword_statement<debugger_statement>();
        case ret:
            return parse_return_statement();
        case fore:
        case swich:
        case caze:
        case defawlt:
        case thro:
        case tri:
        case katch:
        case finaly:
        case wiz:
            return parse_unsupported_statement();
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_block_statement() -> block_statement*
{
    using enum token_type;
    auto* block = make<block_statement>(m_current_token.loc);
    next_token();
    while (!current_token_is(rsquirly) && !current_token_is(eof)) {
        auto* stmt = parse_statement();
        if (stmt != nullptr) {
            block->statements.push_back(stmt);
        }
        next_token();
    }
    if (current_token_is(eof)) {
        new_error("expected next token to be {}, got {} instead", rsquirly, eof);
    }
    return block;
}

auto parser::parse_var_statement() -> statement*
{
    using enum token_type;
    auto* stmt = make<var_statement>(m_current_token.loc);
    while (true) {
        if (!get(ident)) {
            return {};
        }
        auto* decl = make<var_declaration>(m_current_token.loc);
        decl->name = parse_identifier();
        if (peek_token_is(assign)) {
            next_token();
            next_token();
            decl->value = parse_expression(sequence);
            if (decl->value == nullptr) {
                return {};
            }
        }
        stmt->declarations.push_back(decl);
        if (!peek_token_is(comma)) {
            break;
        }
        next_token();
    }
    skip_optional_semicolon();
    return stmt;
}

auto parser::parse_if_statement() -> statement*
{
    using enum token_type;
    auto* stmt = make<if_statement>(m_current_token.loc);
    if (!get(lparen)) {
        return {};
    }
    next_token();
    stmt->condition = parse_expression(lowest);
    if (stmt->condition == nullptr || !get(rparen)) {
        return {};
    }
    next_token();
    stmt->consequence = parse_statement();
    if (stmt->consequence == nullptr) {
        return {};
    }
    if (peek_token_is(elze)) {
        next_token();
        next_token();
        stmt->alternative = parse_statement();
        if (stmt->alternative == nullptr) {
            return {};
        }
    }
    return stmt;
}

auto parser::parse_while_statement() -> statement*
{
    using enum token_type;
    auto* stmt = make<while_statement>(m_current_token.loc);
    if (!get(lparen)) {
        return {};
    }
    next_token();
    stmt->condition = parse_expression(lowest);
    if (stmt->condition == nullptr || !get(rparen)) {
        return {};
    }
    next_token();
    stmt->body = parse_statement();
    if (stmt->body == nullptr) {
        return {};
    }
    return stmt;
}

auto parser::parse_do_while_statement() -> statement*
{
    using enum token_type;
    auto* stmt = make<do_while_statement>(m_current_token.loc);
    next_token();
    stmt->body = parse_statement();
    if (stmt->body == nullptr || !get(hwile) || !get(lparen)) {
        return {};
    }
    next_token();
    stmt->condition = parse_expression(lowest);
    if (stmt->condition == nullptr || !get(rparen)) {
        return {};
    }
    skip_optional_semicolon();
    return stmt;
}

auto parser::parse_return_statement() -> statement*
{
    using enum token_type;
    auto* stmt = make<return_statement>(m_current_token.loc);
    if (!peek_token_is(semicolon) && !peek_token_is(rsquirly) && !peek_token_is(eof)) {
        next_token();
        stmt->value = parse_expression(lowest);
        if (stmt->value == nullptr) {
            return {};
        }
    }
    skip_optional_semicolon();
    return stmt;
}

template<typename Statement>
auto parser::parse_keyword_statement() -> statement*
{
    auto* stmt = make<Statement>(m_current_token.loc);
    skip_optional_semicolon();
    return stmt;
}

auto parser::parse_expression_statement() -> statement*
{
    auto* expr_stmt = make<expression_statement>(m_current_token.loc);
    expr_stmt->expr = parse_expression(lowest);
    if (expr_stmt->expr == nullptr) {
        return {};
    }
    skip_optional_semicolon();
    return expr_stmt;
}

auto parser::parse_unsupported_statement() -> statement*
{
    new_error("{} statements are not supported", m_current_token.type);
    return {};
}

auto parser::parse_expression(int precedence) -> expression*
{
    auto unary = m_unary_parsers[m_current_token.type];
    if (!unary) {
        no_unary_expression_error(m_current_token.type);
        return {};
    }
    auto* left_expr = unary();
    while (left_expr != nullptr && !peek_token_is(token_type::semicolon) && precedence < peek_precedence()) {
        auto binary = m_binary_parsers[m_peek_token.type];
        if (!binary) {
            return left_expr;
        }
        next_token();

        left_expr = binary(left_expr);
    }
    return left_expr;
}

auto parser::parse_identifier() const -> identifier*
{
    return make<identifier>(std::string {m_current_token.literal}, m_current_token.loc);
}

auto parser::parse_number_literal() -> expression*
{
    return make<number_literal>(parse_number(m_current_token.literal), m_current_token.loc);
}

auto parser::parse_string_literal() -> expression*
{
    auto text = unescape(m_current_token.literal);
    if (!text.has_value()) {
        new_error("invalid escape sequence in string \"{}\"", m_current_token.literal);
        return {};
    }
    return make<string_literal>(std::move(text.value()), m_current_token.loc);
}

auto parser::parse_boolean_literal() const -> expression*
{
    return make<boolean_literal>(current_token_is(token_type::tru), m_current_token.loc);
}

auto parser::parse_null_literal() const -> expression*
{
    return make<null_literal>(m_current_token.loc);
}

auto parser::parse_this_expression() const -> expression*
{
    return make<this_expression>(m_current_token.loc);
}

auto parser::parse_unary_expression() -> expression*
{
    auto* unary = make<unary_expression>(m_current_token.loc);
    unary->op = m_current_token.type;

    next_token();
    unary->operand = parse_expression(prefix);
    if (unary->operand == nullptr) {
        return {};
    }
    return unary;
}

auto parser::parse_postfix_expression(expression* operand) -> expression*
{
    auto* unary = make<unary_expression>(m_current_token.loc);
    unary->op = m_current_token.type;
    unary->operand = operand;
    unary->postfix = true;
    return unary;
}

auto parser::parse_binary_expression(expression* left) -> expression*
{
    auto* bin_expr = make<binary_expression>(m_current_token.loc);
    bin_expr->op = m_current_token.type;
    bin_expr->left = left;

    auto precedence = current_precedence();
    next_token();
    bin_expr->right = parse_expression(precedence);
    if (bin_expr->right == nullptr) {
        return {};
    }
    return bin_expr;
}

auto parser::parse_assign_expression(expression* target) -> expression*
{
    auto* assign = make<assign_expression>(m_current_token.loc);
    assign->op = m_current_token.type;
    assign->target = target;

    next_token();
    assign->value = parse_expression(sequence);
    if (assign->value == nullptr) {
        return {};
    }
    return assign;
}

auto parser::parse_conditional_expression(expression* condition) -> expression*
{
    auto* cond = make<conditional_expression>(m_current_token.loc);
    cond->condition = condition;
    next_token();
    cond->consequence = parse_expression(sequence);
    if (cond->consequence == nullptr || !get(token_type::colon)) {
        return {};
    }
    next_token();
    cond->alternative = parse_expression(sequence);
    if (cond->alternative == nullptr) {
        return {};
    }
    return cond;
}

auto parser::parse_comma_expression(expression* left) -> expression*
{
    auto* comma = make<comma_expression>(m_current_token.loc);
    comma->left = left;
    next_token();
    comma->right = parse_expression(sequence);
    if (comma->right == nullptr) {
        return {};
    }
    return comma;
}

auto parser::parse_grouped_expression() -> expression*
{
    next_token();
    auto* exp = parse_expression(lowest);
    if (exp == nullptr || !get(token_type::rparen)) {
        return {};
    }
    return exp;
}

auto parser::parse_function_literal() -> expression*
{
    using enum token_type;
    const auto loc = m_current_token.loc;
    if (!get(lparen)) {
        return {};
    }
    auto parameters = parse_function_parameters();
    if (!get(rparen) || !get(lsquirly)) {
        return {};
    }
    auto* body = parse_block_statement();
    return make<function_literal>(std::move(parameters), body, loc);
}

auto parser::parse_function_parameters() -> identifiers
{
    using enum token_type;
    identifiers parameters;
    if (peek_token_is(rparen)) {
        return parameters;
    }
    if (!get(ident)) {
        return parameters;
    }
    parameters.push_back(parse_identifier());
    while (peek_token_is(comma)) {
        next_token();
        if (!get(ident)) {
            return parameters;
        }
        parameters.push_back(parse_identifier());
    }
    return parameters;
}

auto parser::parse_call_expression(expression* callee) -> expression*
{
    auto* call = make<call_expression>(m_current_token.loc);
    call->callee = callee;
    call->arguments = parse_expression_list(token_type::rparen);
    return call;
}

auto parser::parse_new_expression() -> expression*
{
    auto* expr = make<new_expression>(m_current_token.loc);
    next_token();
    expr->constructor = parse_expression(call);
    if (expr->constructor == nullptr) {
        return {};
    }
    if (peek_token_is(token_type::lparen)) {
        next_token();
        expr->arguments = parse_expression_list(token_type::rparen);
    }
    return expr;
}

auto parser::parse_array_literal() -> expression*
{
    using enum token_type;
    auto* array = make<array_literal>(m_current_token.loc);
    while (true) {
        if (peek_token_is(comma) || peek_token_is(rbracket)) {
            array->elements.push_back(nullptr);
        } else {
            next_token();
            auto* element = parse_expression(sequence);
            if (element == nullptr) {
                return {};
            }
            array->elements.push_back(element);
        }
        if (!peek_token_is(comma)) {
            break;
        }
        next_token();
    }
    if (!get(rbracket)) {
        return {};
    }
    // `[]` is a single empty slot
    if (array->elements.size() == 1 && array->elements.front() == nullptr) {
        array->elements.clear();
    }
    return array;
}

auto parser::parse_object_literal() -> expression*
{
    using enum token_type;
    auto* object = make<object_literal>(m_current_token.loc);
    while (!peek_token_is(rsquirly)) {
        next_token();
        auto key = parse_property_name();
        if (!key || !get(colon)) {
            return {};
        }
        next_token();
        auto* value = parse_expression(sequence);
        if (value == nullptr) {
            return {};
        }
        object->properties.emplace_back(std::move(key.value()), value);
        if (!peek_token_is(comma)) {
            break;
        }
        next_token();
    }
    if (!get(rsquirly)) {
        return {};
    }
    return object;
}

auto parser::parse_property_name() -> std::optional<std::string>
{
    using enum token_type;
    switch (m_current_token.type) {
        case ident:
            return std::string {m_current_token.literal};
        case string: {
            auto name = unescape(m_current_token.literal);
            if (!name.has_value()) {
                new_error("invalid escape sequence in string \"{}\"", m_current_token.literal);
            }
            return name;
        }
        case number:
            return number_to_string(parse_number(m_current_token.literal));
        default:
            new_error("invalid property name {}", m_current_token.type);
            return std::nullopt;
    }
}

auto parser::parse_index_expression(expression* object) -> expression*
{
    auto* index_expr = make<property_access>(m_current_token.loc);
    index_expr->object = object;
    next_token();
    index_expr->key = parse_expression(lowest);

    if (index_expr->key == nullptr || !get(token_type::rbracket)) {
        return {};
    }

    return index_expr;
}

auto parser::parse_dot_expression(expression* object) -> expression*
{
    auto* access = make<property_access>(m_current_token.loc);
    access->object = object;
    if (!get(token_type::ident)) {
        return {};
    }
    access->key = make<string_literal>(std::string {m_current_token.literal}, m_current_token.loc);
    return access;
}

auto parser::parse_expression_list(token_type end) -> expressions
{
    using enum token_type;
    auto list = expressions();
    if (peek_token_is(end)) {
        next_token();
        return list;
    }
    next_token();
    list.push_back(parse_expression(sequence));

    while (peek_token_is(comma)) {
        next_token();
        next_token();
        list.push_back(parse_expression(sequence));
    }

    if (!get(end)) {
        return {};
    }

    return list;
}

auto parser::skip_optional_semicolon() -> void
{
    if (peek_token_is(token_type::semicolon)) {
        next_token();
    }
}

auto parser::get(token_type type) -> bool
{
    if (m_peek_token.type == type) {
        next_token();
        return true;
    }
    peek_error(type);
    return false;
}

auto parser::peek_error(token_type type) -> void
{
    new_error("expected next token to be {}, got {} instead", type, m_peek_token.type);
}

auto parser::register_binary(token_type type, binary_parser binary) -> void
{
    m_binary_parsers[type] = std::move(binary);
}

auto parser::register_unary(token_type type, unary_parser unary) -> void
{
    m_unary_parsers[type] = std::move(unary);
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::peek_token_is(token_type type) const -> bool
{
    return m_peek_token.type == type;
}

auto parser::no_unary_expression_error(token_type type) -> void
{
    new_error("no prefix parse function for {} found", type);
}

auto parser::peek_precedence() const -> int
{
    return precedence_of_token(m_peek_token.type);
}

auto parser::current_precedence() const -> int
{
    return precedence_of_token(m_current_token.type);
}

namespace
{
// NOLINTBEGIN(*)
using expected_value_type = std::variant<double, std::string, bool>;

auto check_no_parse_errors(const parser& prsr) -> bool
{
    INFO("expected no errors, got:", fmt::format("{}", fmt::join(prsr.errors(), ", ")));
    CHECK(prsr.errors().empty());
    return prsr.errors().empty();
}

using parsed_program = std::pair<program*, parser>;

auto check_program(std::string_view input) -> parsed_program
{
    auto prsr = parser {lexer {input}};
    auto prgrm = prsr.parse_program();
    INFO("while parsing: `", input, "`");
    CHECK(check_no_parse_errors(prsr));
    return {prgrm, std::move(prsr)};
}

auto require_boolean_literal(const expression* expr, bool value) -> void
{
    auto* bool_expr = dynamic_cast<const boolean_literal*>(expr);
    INFO("expected boolean, got:", expr->string());
    REQUIRE(bool_expr);
    REQUIRE_EQ(bool_expr->value, value);
}

auto require_identifier(const expression* expr, const std::string& value) -> void
{
    auto* ident = dynamic_cast<const identifier*>(expr);
    INFO("expected identifier, got:", expr->string());
    REQUIRE(ident);
    REQUIRE_EQ(ident->value, value);
}

auto require_string_literal(const expression* expr, const std::string& value) -> void
{
    auto* string_lit = dynamic_cast<const string_literal*>(expr);
    INFO("expected string_literal, got:", expr->string());
    REQUIRE(string_lit);
    REQUIRE_EQ(string_lit->value, value);
}

auto require_number_literal(const expression* expr, double value) -> void
{
    auto* number_lit = dynamic_cast<const number_literal*>(expr);
    INFO("expected number_literal, got:", expr->string());
    REQUIRE(number_lit);
    REQUIRE_EQ(number_lit->value, value);
}

auto require_literal_expression(const expression* expr, const expected_value_type& expected) -> void
{
    std::visit(
        overloaded {
            [&](double val) { require_number_literal(expr, val); },
            [&](const std::string& val) { require_identifier(expr, val); },
            [&](bool val) { require_boolean_literal(expr, val); },
        },
        expected);
}

auto require_binary_expression(const expression* expr,
                               const expected_value_type& left,
                               const token_type oprtr,
                               const expected_value_type& right) -> void
{
    auto* binary = dynamic_cast<const binary_expression*>(expr);
    INFO("expected binary expression, got: ", expr->string());
    REQUIRE(binary);
    require_literal_expression(binary->left, left);
    REQUIRE_EQ(binary->op, oprtr);
    require_literal_expression(binary->right, right);
}

auto require_expression_statement(const program* prgrm) -> const expression_statement*
{
    INFO("expected one statement, got: ", prgrm->statements.size());
    REQUIRE_EQ(prgrm->statements.size(), 1);
    auto* stmt = prgrm->statements[0];
    auto* expr_stmt = dynamic_cast<const expression_statement*>(stmt);
    INFO("expected expression statement, got: ", stmt->string());
    REQUIRE(expr_stmt);
    return expr_stmt;
}

template<typename E>
auto require_expression(const program* prgrm) -> const E*
{
    auto* expr_stmt = require_expression_statement(prgrm);
    auto* expr = dynamic_cast<const E*>(expr_stmt->expr);
    INFO("expected expression, got: ", expr_stmt->expr->string());
    REQUIRE(expr);
    return expr;
}

template<typename S>
auto require_statement(const statement* stmt) -> const S*
{
    auto* typed = dynamic_cast<const S*>(stmt);
    INFO("unexpected statement kind: ", stmt->string());
    REQUIRE(typed);
    return typed;
}

TEST_SUITE_BEGIN("parsing");

TEST_CASE("varStatements")
{
    struct vt
    {
        std::string_view input;
        std::string expected_identifier;
        expected_value_type expected_value;
    };

    std::array tests {
        vt {"var x = 5;", "x", 5.0},
        vt {"var y = true;", "y", true},
        vt {"var foobar = y", "foobar", "y"},
    };

    for (const auto& [input, expected_identifier, expected_value] : tests) {
        auto [prgrm, _] = check_program(input);
        REQUIRE_EQ(prgrm->statements.size(), 1);
        auto* var_stmt = require_statement<var_statement>(prgrm->statements[0]);
        REQUIRE_EQ(var_stmt->declarations.size(), 1);
        REQUIRE_EQ(var_stmt->declarations[0]->name->value, expected_identifier);
        require_literal_expression(var_stmt->declarations[0]->value, expected_value);
    }
}

TEST_CASE("varStatementList")
{
    auto [prgrm, _] = check_program("var x, y = 5;");
    auto* var_stmt = require_statement<var_statement>(prgrm->statements[0]);
    REQUIRE_EQ(var_stmt->declarations.size(), 2);
    CHECK_EQ(var_stmt->declarations[0]->name->value, "x");
    CHECK_EQ(var_stmt->declarations[0]->value, nullptr);
    CHECK_EQ(var_stmt->declarations[1]->name->value, "y");
    require_number_literal(var_stmt->declarations[1]->value, 5);
}

TEST_CASE("parseError")
{
    auto prsr = parser {lexer {
        R"(
var x = 5;
var = 10;
var 838383;
        )"}};
    prsr.parse_program();
    auto errors = prsr.errors();
    REQUIRE_FALSE(errors.empty());
    CHECK_EQ(errors[0], "expected next token to be identifier, got = instead");
}

TEST_CASE("unsupportedStatements")
{
    struct ut
    {
        std::string_view input;
        std::string_view expected_error;
    };

    std::array tests {
        ut {"for (;;) {}", "for statements are not supported"},
        ut {"throw 1;", "throw statements are not supported"},
        ut {"try {} catch (e) {}", "try statements are not supported"},
        ut {"switch (x) {}", "switch statements are not supported"},
        ut {"with (x) {}", "with statements are not supported"},
    };
    for (const auto& [input, expected_error] : tests) {
        auto prsr = parser {lexer {input}};
        prsr.parse_program();
        INFO("while parsing: `", input, "`");
        REQUIRE_FALSE(prsr.errors().empty());
        CHECK_EQ(prsr.errors()[0], expected_error);
    }
}

TEST_CASE("missingPrefixParser")
{
    auto prsr = parser {lexer {"var x = ;"}};
    prsr.parse_program();
    REQUIRE_FALSE(prsr.errors().empty());
    CHECK_EQ(prsr.errors()[0], "no prefix parse function for ; found");
}

TEST_CASE("unterminatedBlock")
{
    auto prsr = parser {lexer {"while (x) { x--;"}};
    prsr.parse_program();
    REQUIRE_FALSE(prsr.errors().empty());
    CHECK_EQ(prsr.errors()[0], "expected next token to be }, got eof instead");
}

TEST_CASE("returnStatement")
{
    auto [prgrm, _] = check_program(
        R"(
return 5;
return 10
return;
        )");
    REQUIRE_EQ(prgrm->statements.size(), 3);
    require_literal_expression(require_statement<return_statement>(prgrm->statements[0])->value, 5.0);
    require_literal_expression(require_statement<return_statement>(prgrm->statements[1])->value, 10.0);
    CHECK_EQ(require_statement<return_statement>(prgrm->statements[2])->value, nullptr);
}

TEST_CASE("string")
{
    auto* name = make<identifier>("myVar", location {});
    auto* value = make<identifier>("anotherVar", location {});

    program prgrm {location {}};

    auto* decl = make<var_declaration>(location {});
    decl->name = name;
    decl->value = value;
    auto* var_stmt = make<var_statement>(location {});
    var_stmt->declarations.push_back(decl);
    prgrm.statements.push_back(var_stmt);

    REQUIRE_EQ(prgrm.string(), "var myVar = anotherVar;");
}

TEST_CASE("identifierExpression")
{
    auto [prgrm, _] = check_program("foobar;");
    auto* expr_stmt = require_expression_statement(prgrm);

    require_literal_expression(expr_stmt->expr, "foobar");
}

TEST_CASE("numberExpression")
{
    struct nt
    {
        std::string_view input;
        double expected;
    };

    std::array tests {
        nt {"5;", 5.0},
        nt {"0.5", 0.5},
        nt {"1e3", 1000.0},
        nt {"2.5E-1", 0.25},
    };
    for (const auto& [input, expected] : tests) {
        auto [prgrm, _] = check_program(input);
        require_literal_expression(require_expression_statement(prgrm)->expr, expected);
    }
}

TEST_CASE("stringExpression")
{
    auto [prgrm, _] = check_program(R"("hello\tworld\n" + 'it\'s')");
    auto* binary = require_expression<binary_expression>(prgrm);
    require_string_literal(binary->left, "hello\tworld\n");
    require_string_literal(binary->right, "it's");
}

TEST_CASE("stringEscapes")
{
    struct st
    {
        std::string_view input;
        std::string expected;
    };

    std::array tests {
        st {R"('a\x41')", "aA"},
        st {R"("\u0041\u00e9")", "A\xC3\xA9"},
        st {R"("\u20AC")", "\xE2\x82\xAC"},
        st {R"('\q\'\\')", "q'\\"},
    };
    for (const auto& [input, expected] : tests) {
        auto [prgrm, _] = check_program(input);
        require_string_literal(require_expression<string_literal>(prgrm), expected);
    }
}

TEST_CASE("malformedHexEscapes")
{
    for (const auto* input : {R"("\x4")", R"("\xZZ")", R"("\u12G4")", R"(({"\x1": 1}))"}) {
        auto prsr = parser {lexer {input}};
        prsr.parse_program();
        INFO("while parsing: `", input, "`");
        REQUIRE_FALSE(prsr.errors().empty());
        CHECK(prsr.errors().front().starts_with("invalid escape sequence in string"));
    }
}

TEST_CASE("unaryExpressions")
{
    using enum token_type;

    struct ut
    {
        std::string_view input;
        token_type op;
        double number_value;
    };

    std::array tests {
        ut {"!5;", exclamation, 5},
        ut {"-15;", minus, 15},
        ut {"+15;", plus, 15},
        ut {"~15;", tilde, 15},
        ut {"typeof 1", tipeof, 1},
        ut {"void 0", voyd, 0},
        ut {"delete 2", delet, 2},
    };

    for (const auto& [input, op, val] : tests) {
        auto [prgrm, _] = check_program(input);
        auto unary = require_expression<unary_expression>(prgrm);
        REQUIRE_EQ(op, unary->op);
        REQUIRE_FALSE(unary->postfix);
        require_literal_expression(unary->operand, val);
    }
}

TEST_CASE("prefixAndPostfix")
{
    using enum token_type;

    struct pt
    {
        std::string_view input;
        token_type op;
        bool postfix;
    };

    std::array tests {
        pt {"++x", plus_plus, false},
        pt {"--x", minus_minus, false},
        pt {"x++", plus_plus, true},
        pt {"x--", minus_minus, true},
    };

    for (const auto& [input, op, postfix] : tests) {
        auto [prgrm, _] = check_program(input);
        auto unary = require_expression<unary_expression>(prgrm);
        CHECK_EQ(unary->op, op);
        CHECK_EQ(unary->postfix, postfix);
        require_identifier(unary->operand, "x");
    }
}

TEST_CASE("binaryExpressions")
{
    using enum token_type;

    struct bt
    {
        std::string_view input;
        double left_value;
        token_type op;
        double right_value;
    };

    std::array tests {
        bt {"5 + 5;", 5, plus, 5},
        bt {"5 - 5;", 5, minus, 5},
        bt {"5 * 5;", 5, asterisk, 5},
        bt {"5 / 5;", 5, slash, 5},
        bt {"5 % 5;", 5, percent, 5},
        bt {"5 > 5;", 5, greater_than, 5},
        bt {"5 < 5;", 5, less_than, 5},
        bt {"5 >= 5;", 5, greater_equal, 5},
        bt {"5 <= 5;", 5, less_equal, 5},
        bt {"5 == 5;", 5, equals, 5},
        bt {"5 != 5;", 5, not_equals, 5},
        bt {"5 === 5;", 5, strict_equals, 5},
        bt {"5 !== 5;", 5, strict_not_equals, 5},
        bt {"5 & 5;", 5, ampersand, 5},
        bt {"5 | 5;", 5, pipe, 5},
        bt {"5 ^ 5;", 5, caret, 5},
        bt {"5 << 5;", 5, shift_left, 5},
        bt {"5 >> 5;", 5, shift_right, 5},
        bt {"5 && 5;", 5, logical_and, 5},
        bt {"5 || 5;", 5, logical_or, 5},
        bt {"5 in 5;", 5, in, 5},
        bt {"5 instanceof 5;", 5, instanceof, 5},
    };

    for (const auto& [input, left, op, right] : tests) {
        auto [prgrm, _] = check_program(input);
        auto* expr_stmt = require_expression_statement(prgrm);

        require_binary_expression(expr_stmt->expr, left, op, right);
    }
}

TEST_CASE("operatorPrecedence")
{
    struct op
    {
        std::string_view input;
        std::string_view expected;
    };

    std::array tests {
        op {"-a * b", "((-a) * b);"},
        op {"!-a", "(!(-a));"},
        op {"a + b + c", "((a + b) + c);"},
        op {"a + b - c", "((a + b) - c);"},
        op {"a * b / c % d", "(((a * b) / c) % d);"},
        op {"a + b * c + d / e - f", "(((a + (b * c)) + (d / e)) - f);"},
        op {"3 + 4; -5 * 5", "(3 + 4); ((-5) * 5);"},
        op {"5 > 4 == 3 < 4", "((5 > 4) == (3 < 4));"},
        op {"a >= b != c <= d", "((a >= b) != (c <= d));"},
        op {"x === y !== z", "((x === y) !== z);"},
        op {"a || b && c", "(a || (b && c));"},
        op {"a | b ^ c & d", "(a | (b ^ (c & d)));"},
        op {"a == b < c << d + e", "(a == (b < (c << (d + e))));"},
        op {"a >> 1 << 2", "((a >> 1) << 2);"},
        op {"a in b instanceof c", "((a in b) instanceof c);"},
        op {"a = b = c", "(a = (b = c));"},
        op {"a += b ? c : d", "(a += (b ? c : d));"},
        op {"a ? b : c ? d : e", "(a ? b : (c ? d : e));"},
        op {"a || b ? c : d", "((a || b) ? c : d);"},
        op {"a, b = c, d", "((a, (b = c)), d);"},
        op {"-a++", "(-(a++));"},
        op {"++a.b", "(++a[\"b\"]);"},
        op {"a.b(c)[d]", "a[\"b\"](c)[d];"},
        op {"f(a, b + c)(d)", "f(a, (b + c))(d);"},
        op {"typeof a + 1", "((typeof a) + 1);"},
        op {"void 0", "(void 0);"},
        op {"new Foo(1).bar", "(new Foo(1))[\"bar\"];"},
        op {"new Foo", "(new Foo());"},
        op {"!(a && b)", "(!(a && b));"},
        op {"(1 + 2) * 7", "((1 + 2) * 7);"},
        op {"x /= 5 - 2", "(x /= (5 - 2));"},
        op {"a <<= 1, b >>= 2", "((a <<= 1), (b >>= 2));"},
    };

    for (const auto& [input, expected] : tests) {
        auto [prgrm, _] = check_program(input);
        INFO("while parsing: `", input, "`");
        CHECK_EQ(prgrm->string(), expected);
    }
}

TEST_CASE("statementStrings")
{
    struct st
    {
        std::string_view input;
        std::string_view expected;
    };

    std::array tests {
        st {"var x = 1, y;", "var x = 1, y;"},
        st {"if (a) b; else c;", "if (a) b; else c;"},
        st {"if (a) { b }", "if (a) { b; }"},
        st {"while (x < 3) { x++; }", "while ((x < 3)) { (x++); }"},
        st {"do x--; while (x)", "do (x--); while (x);"},
        st {"{ 1; 3; }", "{ 1; 3; }"},
        st {"{}", "{}"},
        st {";", ";"},
        st {"debugger", "debugger;"},
        st {"while (true) { break; continue; }", "while (true) { break; continue; }"},
        st {"function (a, b) { return a + b; };", "function(a, b) { return (a + b); };"},
        st {"x = {a: 1, 'b c': [1, , 2]};", "(x = ({\"a\": 1, \"b c\": [1, , 2]}));"},
        st {"[1, 2, ]", "[1, 2, ];"},
    };

    for (const auto& [input, expected] : tests) {
        auto [prgrm, _] = check_program(input);
        INFO("while parsing: `", input, "`");
        CHECK_EQ(prgrm->string(), expected);
    }
}

TEST_CASE("ifStatement")
{
    auto [prgrm, _] = check_program("if (x < y) { x }");
    REQUIRE_EQ(prgrm->statements.size(), 1);
    auto* stmt = require_statement<if_statement>(prgrm->statements[0]);
    require_binary_expression(stmt->condition, "x", token_type::less_than, "y");
    auto* consequence = require_statement<block_statement>(stmt->consequence);
    REQUIRE_EQ(consequence->statements.size(), 1);
    auto* inner = require_statement<expression_statement>(consequence->statements[0]);
    require_identifier(inner->expr, "x");
    CHECK_EQ(stmt->alternative, nullptr);
}

TEST_CASE("danglingElse")
{
    auto [prgrm, _] = check_program("if (a) if (b) 3; else 5;");
    auto* outer = require_statement<if_statement>(prgrm->statements[0]);
    CHECK_EQ(outer->alternative, nullptr);
    auto* inner = require_statement<if_statement>(outer->consequence);
    REQUIRE(inner->alternative);
    auto* alternative = require_statement<expression_statement>(inner->alternative);
    require_number_literal(alternative->expr, 5);
}

TEST_CASE("whileAndDoWhile")
{
    auto [prgrm, _] = check_program("while (x < 3) ++x; do { x--; } while (x > 0);");
    REQUIRE_EQ(prgrm->statements.size(), 2);
    auto* loop = require_statement<while_statement>(prgrm->statements[0]);
    require_binary_expression(loop->condition, "x", token_type::less_than, 3.0);
    require_statement<expression_statement>(loop->body);
    auto* do_loop = require_statement<do_while_statement>(prgrm->statements[1]);
    require_statement<block_statement>(do_loop->body);
    require_binary_expression(do_loop->condition, "x", token_type::greater_than, 0.0);
}

TEST_CASE("functionLiteral")
{
    auto [prgrm, _] = check_program("function(x, y) { x + y; }");
    auto* function = require_expression<function_literal>(prgrm);
    REQUIRE_EQ(function->parameters.size(), 2);
    require_identifier(function->parameters[0], "x");
    require_identifier(function->parameters[1], "y");
    REQUIRE_EQ(function->body->statements.size(), 1);
    auto* body_stmt = require_statement<expression_statement>(function->body->statements[0]);
    require_binary_expression(body_stmt->expr, "x", token_type::plus, "y");
}

TEST_CASE("functionParameters")
{
    struct ft
    {
        std::string_view input;
        std::vector<std::string> expected;
    };

    std::array tests {
        ft {"function() {};", {}},
        ft {"function(x) {};", {"x"}},
        ft {"function(x, y, z) {};", {"x", "y", "z"}},
    };
    for (const auto& [input, expected] : tests) {
        auto [prgrm, _] = check_program(input);
        auto* function = require_expression<function_literal>(prgrm);
        REQUIRE_EQ(function->parameters.size(), expected.size());
        for (size_t idx = 0; idx < expected.size(); ++idx) {
            require_identifier(function->parameters[idx], expected[idx]);
        }
    }
}

TEST_CASE("callExpression")
{
    auto [prgrm, _] = check_program("add(1, 2 * 3, 4 + 5);");
    auto* call = require_expression<call_expression>(prgrm);
    require_identifier(call->callee, "add");
    REQUIRE_EQ(call->arguments.size(), 3);
    require_literal_expression(call->arguments[0], 1.0);
    require_binary_expression(call->arguments[1], 2.0, token_type::asterisk, 3.0);
    require_binary_expression(call->arguments[2], 4.0, token_type::plus, 5.0);
}

TEST_CASE("newExpression")
{
    auto [prgrm, _] = check_program("new Point(1, 2)");
    auto* expr = require_expression<new_expression>(prgrm);
    require_identifier(expr->constructor, "Point");
    REQUIRE_EQ(expr->arguments.size(), 2);
}

TEST_CASE("arrayLiteral")
{
    auto [prgrm, _] = check_program("[1, 2 * 2, 3 + 3]");
    auto* array = require_expression<array_literal>(prgrm);
    REQUIRE_EQ(array->elements.size(), 3);
    require_number_literal(array->elements[0], 1);
    require_binary_expression(array->elements[1], 2.0, token_type::asterisk, 2.0);
    require_binary_expression(array->elements[2], 3.0, token_type::plus, 3.0);
}

TEST_CASE("arrayElision")
{
    struct at
    {
        std::string_view input;
        std::vector<bool> present;
    };

    std::array tests {
        at {"[]", {}},
        at {"[,]", {false, false}},
        at {"[1, 2,]", {true, true, false}},
        at {"[1, 2,,]", {true, true, false, false}},
        at {"[1,,2]", {true, false, true}},
    };
    for (const auto& [input, present] : tests) {
        auto [prgrm, _] = check_program(input);
        auto* array = require_expression<array_literal>(prgrm);
        INFO("while parsing: `", input, "`");
        REQUIRE_EQ(array->elements.size(), present.size());
        for (size_t idx = 0; idx < present.size(); ++idx) {
            CHECK_EQ(array->elements[idx] != nullptr, present[idx]);
        }
    }
}

TEST_CASE("objectLiteral")
{
    auto [prgrm, _] = check_program(R"(x = {one: 1, "two": 2, 3: 'three', 1.50: 4, };)");
    auto* assign = require_expression<assign_expression>(prgrm);
    auto* object = dynamic_cast<const object_literal*>(assign->value);
    REQUIRE(object);
    REQUIRE_EQ(object->properties.size(), 4);
    CHECK_EQ(object->properties[0].first, "one");
    CHECK_EQ(object->properties[1].first, "two");
    CHECK_EQ(object->properties[2].first, "3");
    CHECK_EQ(object->properties[3].first, "1.5");
    require_number_literal(object->properties[0].second, 1);
    require_string_literal(object->properties[2].second, "three");
}

TEST_CASE("blockAtStatementStart")
{
    auto prsr = parser {lexer {"{ a: 1 }"}};
    auto* prgrm = prsr.parse_program();
    REQUIRE_FALSE(prgrm->statements.empty());
    require_statement<block_statement>(prgrm->statements[0]);
    REQUIRE_FALSE(prsr.errors().empty());
    CHECK_EQ(prsr.errors()[0], "no prefix parse function for : found");
}

TEST_CASE("propertyAccess")
{
    auto [prgrm, _] = check_program("a.b['c'];");
    auto* outer = require_expression<property_access>(prgrm);
    require_string_literal(outer->key, "c");
    auto* inner = dynamic_cast<const property_access*>(outer->object);
    REQUIRE(inner);
    require_identifier(inner->object, "a");
    require_string_literal(inner->key, "b");
}

TEST_CASE("declaredVars")
{
    auto [prgrm, _] = check_program(
        R"(
var a = 1, b;
if (a) { var c; } else var d = 2;
while (a) { var e; do { var f; } while (false); }
var g = function () { var hidden; };
{ var h; }
a = 3;
)");
    const auto expected = std::set<std::string> {"a", "b", "c", "d", "e", "f", "g", "h"};
    CHECK_EQ(prgrm->declared_vars(), expected);
    auto* decl = require_statement<var_statement>(prgrm->statements[3]);
    auto* function = dynamic_cast<const function_literal*>(decl->declarations[0]->value);
    REQUIRE(function);
    const auto expected_local = std::set<std::string> {"hidden"};
    CHECK_EQ(function->body->declared_vars(), expected_local);
}

TEST_CASE("structuralEquality")
{
    auto [first, p1] = check_program("var x = [1, 2]; x[0] += f(3, 'a');");
    auto [second, p2] = check_program("var   x = [1,2];\n x[0] += f(3, \"a\")");
    auto [third, p3] = check_program("var x = [1, 2]; x[0] -= f(3, 'a');");
    CHECK(first->equals_to(second));
    CHECK_FALSE(first->equals_to(third));
    CHECK_FALSE(first->statements[0]->equals_to(first->statements[1]));
}

TEST_CASE("printedFormReparses")
{
    std::array inputs {
        R"(var fibgen = function () {
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
})",
        R"(var isPrime = function (n) {
    var i = 2;
    while (i * i <= n) {
        if (n % i === 0) {
            return false;
        }
        ++i;
    }
    return true;
};)",
        R"(if (a) if (b) c; else d; else { e; }
do { x--; continue; } while (x > 0 && !done)
var o = {name: "it's \"quoted\"\n", 12: [1, , 3, ,], nested: {deep: null}};
o.name = typeof o ? void 0 : delete o.x, this;
x = -y++ + ~z - +w;
new F(1)[2];
function () { debugger; return; }();
;)",
    };
    for (const auto* input : inputs) {
        auto [prgrm, _] = check_program(input);
        const auto printed = prgrm->string();
        auto [reparsed, __] = check_program(printed);
        INFO("printed: ", printed);
        INFO("reprinted: ", reparsed->string());
        CHECK(prgrm->equals_to(reparsed));
        CHECK_EQ(reparsed->string(), printed);
    }
}

TEST_SUITE_END();

// NOLINTEND(*)
}  // namespace
