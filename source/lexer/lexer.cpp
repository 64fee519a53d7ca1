#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include <doctest/doctest.h>

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(illegal);
    arr['&'] = ampersand;
    arr['='] = assign;
    arr['*'] = asterisk;
    arr['^'] = caret;
    arr[':'] = colon;
    arr[','] = comma;
    arr['.'] = dot;
    arr['!'] = exclamation;
    arr['>'] = greater_than;
    arr['['] = lbracket;
    arr['<'] = less_than;
    arr['('] = lparen;
    arr['-'] = minus;
    arr['{'] = lsquirly;
    arr['%'] = percent;
    arr['|'] = pipe;
    arr['+'] = plus;
    arr['?'] = question;
    arr[']'] = rbracket;
    arr[')'] = rparen;
    arr['}'] = rsquirly;
    arr[';'] = semicolon;
    arr['/'] = slash;
    arr['~'] = tilde;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 37;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"var", token_type::var},
        std::pair {"function", token_type::function},
        std::pair {"true", token_type::tru},
        std::pair {"false", token_type::fals},
        std::pair {"null", token_type::null},
        std::pair {"if", token_type::eef},
        std::pair {"else", token_type::elze},
        std::pair {"while", token_type::hwile},
        std::pair {"do", token_type::doo},
        std::pair {"return", token_type::ret},
        std::pair {"break", token_type::brake},
        std::pair {"continue", token_type::cont},
        std::pair {"debugger", token_type::debugger},
        std::pair {"this", token_type::thiz},
        std::pair {"new", token_type::neu},
        std::pair {"delete", token_type::delet},
        std::pair {"void", token_type::voyd},
        std::pair {"typeof", token_type::tipeof},
        std::pair {"in", token_type::in},
        std::pair {"instanceof", token_type::instanceof},
        std::pair {"for", token_type::fore},
        std::pair {"switch", token_type::swich},
        std::pair {"case", token_type::caze},
        std::pair {"default", token_type::defawlt},
        std::pair {"throw", token_type::thro},
        std::pair {"try", token_type::tri},
        std::pair {"catch", token_type::katch},
        std::pair {"finally", token_type::finaly},
        std::pair {"with", token_type::wiz},
        // reserved for future use, no grammar support
        std::pair {"class", token_type::illegal},
        std::pair {"const", token_type::illegal},
        std::pair {"enum", token_type::illegal},
        std::pair {"export", token_type::illegal},
        std::pair {"extends", token_type::illegal},
        std::pair {"import", token_type::illegal},
        std::pair {"super", token_type::illegal},
        std::pair {"let", token_type::illegal},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

using token_pair = std::pair<token_type, token_type>;

struct token_pair_hash
{
    auto operator()(const token_pair& pair) const -> size_t
    {
        constexpr auto shift = 8U;
        return (static_cast<size_t>(pair.first) << shift) | static_cast<size_t>(pair.second);
    }
};

using multi_token_lookup = std::unordered_map<token_pair, token, token_pair_hash>;

auto build_two_token_lookup() -> multi_token_lookup
{
    using enum token_type;
    multi_token_lookup lookup;
    lookup.insert({{assign, assign}, {.type = equals, .literal = "=="}});
    lookup.insert({{exclamation, assign}, {.type = not_equals, .literal = "!="}});
    lookup.insert({{less_than, assign}, {.type = less_equal, .literal = "<="}});
    lookup.insert({{greater_than, assign}, {.type = greater_equal, .literal = ">="}});
    lookup.insert({{less_than, less_than}, {.type = shift_left, .literal = "<<"}});
    lookup.insert({{greater_than, greater_than}, {.type = shift_right, .literal = ">>"}});
    lookup.insert({{ampersand, ampersand}, {.type = logical_and, .literal = "&&"}});
    lookup.insert({{pipe, pipe}, {.type = logical_or, .literal = "||"}});
    lookup.insert({{plus, plus}, {.type = plus_plus, .literal = "++"}});
    lookup.insert({{minus, minus}, {.type = minus_minus, .literal = "--"}});
    lookup.insert({{plus, assign}, {.type = plus_assign, .literal = "+="}});
    lookup.insert({{minus, assign}, {.type = minus_assign, .literal = "-="}});
    lookup.insert({{asterisk, assign}, {.type = asterisk_assign, .literal = "*="}});
    lookup.insert({{slash, assign}, {.type = slash_assign, .literal = "/="}});
    lookup.insert({{percent, assign}, {.type = percent_assign, .literal = "%="}});
    lookup.insert({{ampersand, assign}, {.type = ampersand_assign, .literal = "&="}});
    lookup.insert({{pipe, assign}, {.type = pipe_assign, .literal = "|="}});
    lookup.insert({{caret, assign}, {.type = caret_assign, .literal = "^="}});
    return lookup;
}

auto build_three_token_lookup() -> multi_token_lookup
{
    using enum token_type;
    multi_token_lookup lookup;
    lookup.insert({{equals, assign}, {.type = strict_equals, .literal = "==="}});
    lookup.insert({{not_equals, assign}, {.type = strict_not_equals, .literal = "!=="}});
    lookup.insert({{shift_left, assign}, {.type = shift_left_assign, .literal = "<<="}});
    lookup.insert({{shift_right, assign}, {.type = shift_right_assign, .literal = ">>="}});
    return lookup;
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_' || chr == '$';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

inline auto char_token_type(char chr) -> token_type
{
    return char_literal_tokens[static_cast<unsigned char>(chr)];
}

}  // namespace

lexer::lexer(std::string_view input, std::string_view filename)
    : m_input {input}
    , m_filename {filename}
{
    read_char();
}

auto lexer::next_token() -> token
{
    skip_whitespace_and_comments();
    if (m_byte == '\0') {
        return token {.type = token_type::eof, .literal = "", .loc = current_loc()};
    }
    if (m_byte == '"' || m_byte == '\'') {
        return read_string();
    }
    if (is_letter(m_byte)) {
        return read_identifier_or_keyword();
    }
    if (is_digit(m_byte)) {
        return read_number();
    }
    return read_operator();
}

auto lexer::read_char() -> void
{
    if (m_byte == '\n') {
        m_row++;
        m_bol = m_read_position;
    }
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
    } else {
        m_byte = m_input[m_read_position];
    }
    m_position = m_read_position;
    m_read_position++;
}

auto lexer::skip_whitespace_and_comments() -> void
{
    while (true) {
        while (m_byte == ' ' || m_byte == '\t' || m_byte == '\n' || m_byte == '\r') {
            read_char();
        }
        if (m_byte == '/' && peek_char() == '/') {
            while (m_byte != '\n' && m_byte != '\0') {
                read_char();
            }
            continue;
        }
        if (m_byte == '/' && peek_char() == '*') {
            read_char();
            read_char();
            while (m_byte != '\0' && !(m_byte == '*' && peek_char() == '/')) {
                read_char();
            }
            if (m_byte != '\0') {
                read_char();
                read_char();
            }
            continue;
        }
        return;
    }
}

auto lexer::peek_char(std::string_view::size_type offset) const -> std::string_view::value_type
{
    if (m_read_position + offset >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position + offset];
}

auto lexer::read_operator() -> token
{
    const auto loc = current_loc();
    const static auto two_token = build_two_token_lookup();
    const static auto three_token = build_three_token_lookup();
    const auto first = char_token_type(m_byte);
    if (first == token_type::illegal) {
        const auto position = m_position;
        return read_char(), token {.type = token_type::illegal, .literal = m_input.substr(position, 1), .loc = loc};
    }
    if (const auto two = two_token.find({first, char_token_type(peek_char())}); two != two_token.end()) {
        if (const auto three = three_token.find({two->second.type, char_token_type(peek_char(1))});
            three != three_token.end())
        {
            return read_char(), read_char(), read_char(), three->second.with_loc(loc);
        }
        return read_char(), read_char(), two->second.with_loc(loc);
    }
    const auto position = m_position;
    return read_char(), token {.type = first, .literal = m_input.substr(position, 1), .loc = loc};
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (is_letter(m_byte) || is_digit(m_byte)) {
        read_char();
    }
    const auto count = m_position - position;
    const auto identifier_or_keyword = m_input.substr(position, count);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        return token {.type = itr->second, .literal = identifier_or_keyword, .loc = loc};
    }
    // NOLINTEND(*-qualified-auto)
    return token {.type = token_type::ident, .literal = identifier_or_keyword, .loc = loc};
}

auto lexer::read_number() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (is_digit(m_byte)) {
        read_char();
    }
    if (m_byte == '.' && is_digit(peek_char())) {
        read_char();
        while (is_digit(m_byte)) {
            read_char();
        }
    }
    if ((m_byte == 'e' || m_byte == 'E')
        && (is_digit(peek_char()) || ((peek_char() == '+' || peek_char() == '-') && is_digit(peek_char(1)))))
    {
        read_char();
        read_char();
        while (is_digit(m_byte)) {
            read_char();
        }
    }
    const auto count = m_position - position;
    if (is_letter(m_byte)) {
        return token {.type = token_type::illegal, .literal = m_input.substr(position, count + 1), .loc = loc};
    }
    return token {.type = token_type::number, .literal = m_input.substr(position, count), .loc = loc};
}

auto lexer::read_string() -> token
{
    const auto loc = current_loc();
    const auto quote = m_byte;
    const auto position = m_position + 1;
    while (true) {
        read_char();
        if (m_byte == '\\') {
            read_char();
            if (m_byte == '\0') {
                break;
            }
            continue;
        }
        if (m_byte == quote || m_byte == '\0' || m_byte == '\n') {
            break;
        }
    }
    const auto count = m_position - position;
    if (m_byte != quote) {
        return token {.type = token_type::illegal, .literal = m_input.substr(position - 1, count + 1), .loc = loc};
    }
    return read_char(), token {.type = token_type::string, .literal = m_input.substr(position, count), .loc = loc};
}

auto lexer::current_loc() const -> location
{
    return location {.filename = m_filename, .line = m_row + 1, .column = m_position - m_bol + 1};
}

namespace
{
// NOLINTBEGIN(*)
struct expected_token
{
    token_type type;
    std::string_view literal;
};

auto lex_all(std::string_view input) -> std::vector<token>
{
    auto lxr = lexer {input};
    std::vector<token> tokens;
    while (true) {
        auto tok = lxr.next_token();
        tokens.push_back(tok);
        if (tok.type == token_type::eof) {
            break;
        }
    }
    return tokens;
}

auto require_tokens(std::string_view input, const std::vector<expected_token>& expected) -> void
{
    const auto actual = lex_all(input);
    INFO("while lexing: `", input, "`");
    REQUIRE_EQ(actual.size(), expected.size());
    for (size_t idx = 0; idx < expected.size(); ++idx) {
        INFO("token #", idx, " got: ", actual[idx]);
        CHECK_EQ(actual[idx].type, expected[idx].type);
        CHECK_EQ(actual[idx].literal, expected[idx].literal);
    }
}

TEST_SUITE_BEGIN("lexing");

TEST_CASE("program")
{
    using enum token_type;
    require_tokens(
        R"(var five = 5;
var add = function(x, y) {
  return x + y;
};
var result = add(five, 10.5);
if (result >= 15) { result; } else { "no"; }
)",
        {
            {var, "var"},        {ident, "five"},    {assign, "="},      {number, "5"},       {semicolon, ";"},
            {var, "var"},        {ident, "add"},     {assign, "="},      {function, "function"},
            {lparen, "("},       {ident, "x"},       {comma, ","},       {ident, "y"},        {rparen, ")"},
            {lsquirly, "{"},     {ret, "return"},    {ident, "x"},       {plus, "+"},         {ident, "y"},
            {semicolon, ";"},    {rsquirly, "}"},    {semicolon, ";"},   {var, "var"},        {ident, "result"},
            {assign, "="},       {ident, "add"},     {lparen, "("},      {ident, "five"},     {comma, ","},
            {number, "10.5"},    {rparen, ")"},      {semicolon, ";"},   {eef, "if"},         {lparen, "("},
            {ident, "result"},   {greater_equal, ">="}, {number, "15"},  {rparen, ")"},       {lsquirly, "{"},
            {ident, "result"},   {semicolon, ";"},   {rsquirly, "}"},    {elze, "else"},      {lsquirly, "{"},
            {string, "no"},      {semicolon, ";"},   {rsquirly, "}"},    {eof, ""},
        });
}

TEST_CASE("operators")
{
    using enum token_type;
    require_tokens(
        "! ~ * / % + - << >> < > <= >= == != === !== & ^ | && || ? : = *= /= %= += -= <<= >>= &= ^= |= ++ -- . [ ]",
        {
            {exclamation, "!"},
            {tilde, "~"},
            {asterisk, "*"},
            {slash, "/"},
            {percent, "%"},
            {plus, "+"},
            {minus, "-"},
            {shift_left, "<<"},
            {shift_right, ">>"},
            {less_than, "<"},
            {greater_than, ">"},
            {less_equal, "<="},
            {greater_equal, ">="},
            {equals, "=="},
            {not_equals, "!="},
            {strict_equals, "==="},
            {strict_not_equals, "!=="},
            {ampersand, "&"},
            {caret, "^"},
            {pipe, "|"},
            {logical_and, "&&"},
            {logical_or, "||"},
            {question, "?"},
            {colon, ":"},
            {assign, "="},
            {asterisk_assign, "*="},
            {slash_assign, "/="},
            {percent_assign, "%="},
            {plus_assign, "+="},
            {minus_assign, "-="},
            {shift_left_assign, "<<="},
            {shift_right_assign, ">>="},
            {ampersand_assign, "&="},
            {caret_assign, "^="},
            {pipe_assign, "|="},
            {plus_plus, "++"},
            {minus_minus, "--"},
            {dot, "."},
            {lbracket, "["},
            {rbracket, "]"},
            {eof, ""},
        });
}

TEST_CASE("adjacentOperators")
{
    using enum token_type;
    require_tokens("x+++y", {{ident, "x"}, {plus_plus, "++"}, {plus, "+"}, {ident, "y"}, {eof, ""}});
    require_tokens("a=-1", {{ident, "a"}, {assign, "="}, {minus, "-"}, {number, "1"}, {eof, ""}});
    require_tokens("a!==b", {{ident, "a"}, {strict_not_equals, "!=="}, {ident, "b"}, {eof, ""}});
}

TEST_CASE("keywords")
{
    using enum token_type;
    require_tokens("do while this new delete void typeof in instanceof debugger null true false for try",
                   {
                       {doo, "do"},
                       {hwile, "while"},
                       {thiz, "this"},
                       {neu, "new"},
                       {delet, "delete"},
                       {voyd, "void"},
                       {tipeof, "typeof"},
                       {in, "in"},
                       {instanceof, "instanceof"},
                       {debugger, "debugger"},
                       {null, "null"},
                       {tru, "true"},
                       {fals, "false"},
                       {fore, "for"},
                       {tri, "try"},
                       {eof, ""},
                   });
}

TEST_CASE("identifiers")
{
    using enum token_type;
    require_tokens("a_b $x fib2 _ variable doer",
                   {
                       {ident, "a_b"},
                       {ident, "$x"},
                       {ident, "fib2"},
                       {ident, "_"},
                       {ident, "variable"},
                       {ident, "doer"},
                       {eof, ""},
                   });
}

TEST_CASE("numbers")
{
    using enum token_type;
    require_tokens("0 42 3.25 1e3 2.5E-2 7.",
                   {
                       {number, "0"},
                       {number, "42"},
                       {number, "3.25"},
                       {number, "1e3"},
                       {number, "2.5E-2"},
                       {number, "7"},
                       {dot, "."},
                       {eof, ""},
                   });
    require_tokens("12abc", {{illegal, "12a"}, {ident, "bc"}, {eof, ""}});
}

TEST_CASE("strings")
{
    using enum token_type;
    require_tokens(R"("foobar" 'foo bar' "" "say \"hi\"" 'it\'s')",
                   {
                       {string, "foobar"},
                       {string, "foo bar"},
                       {string, ""},
                       {string, R"(say \"hi\")"},
                       {string, R"(it\'s)"},
                       {eof, ""},
                   });
    require_tokens(R"("unterminated)", {{illegal, R"("unterminated)"}, {eof, ""}});
}

TEST_CASE("comments")
{
    using enum token_type;
    require_tokens(
        R"(// Generates numbers
var a = 1; /* block
comment */ a / 2; // trailing)",
        {
            {var, "var"},
            {ident, "a"},
            {assign, "="},
            {number, "1"},
            {semicolon, ";"},
            {ident, "a"},
            {slash, "/"},
            {number, "2"},
            {semicolon, ";"},
            {eof, ""},
        });
}

TEST_CASE("locations")
{
    auto lxr = lexer {"var x = 1;\n  x++;", "test.js"};
    auto tok = lxr.next_token();
    CHECK_EQ(tok.loc, location {.filename = "test.js", .line = 1, .column = 1});
    tok = lxr.next_token();
    CHECK_EQ(tok.loc, location {.filename = "test.js", .line = 1, .column = 5});
    for (int i = 0; i < 3; ++i) {
        tok = lxr.next_token();
    }
    CHECK_EQ(tok.type, token_type::semicolon);
    CHECK_EQ(tok.loc, location {.filename = "test.js", .line = 1, .column = 10});
    tok = lxr.next_token();
    CHECK_EQ(tok.literal, "x");
    CHECK_EQ(tok.loc, location {.filename = "test.js", .line = 2, .column = 3});
}

TEST_CASE("illegal")
{
    using enum token_type;
    require_tokens("a # b", {{ident, "a"}, {illegal, "#"}, {ident, "b"}, {eof, ""}});
    require_tokens("let", {{illegal, "let"}, {eof, ""}});
}

TEST_SUITE_END();

// NOLINTEND(*)
}  // namespace
