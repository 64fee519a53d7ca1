#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    illegal,
    eof,

    // single character tokens
    ampersand,
    assign,
    asterisk,
    caret,
    colon,
    comma,
    dot,
    exclamation,
    greater_than,
    lbracket,
    less_than,
    lparen,
    minus,
    lsquirly,
    percent,
    pipe,
    plus,
    question,
    rbracket,
    rparen,
    rsquirly,
    semicolon,
    slash,
    tilde,

    // two character tokens
    equals,
    not_equals,
    less_equal,
    greater_equal,
    shift_left,
    shift_right,
    logical_and,
    logical_or,
    plus_plus,
    minus_minus,
    plus_assign,
    minus_assign,
    asterisk_assign,
    slash_assign,
    percent_assign,
    ampersand_assign,
    pipe_assign,
    caret_assign,

    // three character tokens
    strict_equals,
    strict_not_equals,
    shift_left_assign,
    shift_right_assign,

    // multi character tokens
    ident,
    number,
    string,

    // keywords
    var,
    function,
    tru,
    fals,
    null,
    eef,
    elze,
    hwile,
    doo,
    ret,
    brake,
    cont,
    debugger,
    thiz,
    neu,
    delet,
    voyd,
    tipeof,
    in,
    instanceof,

    // reserved keywords without grammar support
    fore,
    swich,
    caze,
    defawlt,
    thro,
    tri,
    katch,
    finaly,
    wiz,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
