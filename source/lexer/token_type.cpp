#include <ostream>
#include <stdexcept>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case illegal:
            return ostream << "illegal";
        case eof:
            return ostream << "eof";
        case ampersand:
            return ostream << "&";
        case assign:
            return ostream << "=";
        case asterisk:
            return ostream << "*";
        case caret:
            return ostream << "^";
        case colon:
            return ostream << ":";
        case comma:
            return ostream << ",";
        case dot:
            return ostream << ".";
        case exclamation:
            return ostream << "!";
        case greater_than:
            return ostream << ">";
        case lbracket:
            return ostream << "[";
        case less_than:
            return ostream << "<";
        case lparen:
            return ostream << "(";
        case minus:
            return ostream << "-";
        case lsquirly:
            return ostream << "{";
        case percent:
            return ostream << "%";
        case pipe:
            return ostream << "|";
        case plus:
            return ostream << "+";
        case question:
            return ostream << "?";
        case rbracket:
            return ostream << "]";
        case rparen:
            return ostream << ")";
        case rsquirly:
            return ostream << "}";
        case semicolon:
            return ostream << ";";
        case slash:
            return ostream << "/";
        case tilde:
            return ostream << "~";
        case equals:
            return ostream << "==";
        case not_equals:
            return ostream << "!=";
        case less_equal:
            return ostream << "<=";
        case greater_equal:
            return ostream << ">=";
        case shift_left:
            return ostream << "<<";
        case shift_right:
            return ostream << ">>";
        case logical_and:
            return ostream << "&&";
        case logical_or:
            return ostream << "||";
        case plus_plus:
            return ostream << "++";
        case minus_minus:
            return ostream << "--";
        case plus_assign:
            return ostream << "+=";
        case minus_assign:
            return ostream << "-=";
        case asterisk_assign:
            return ostream << "*=";
        case slash_assign:
            return ostream << "/=";
        case percent_assign:
            return ostream << "%=";
        case ampersand_assign:
            return ostream << "&=";
        case pipe_assign:
            return ostream << "|=";
        case caret_assign:
            return ostream << "^=";
        case strict_equals:
            return ostream << "===";
        case strict_not_equals:
            return ostream << "!==";
        case shift_left_assign:
            return ostream << "<<=";
        case shift_right_assign:
            return ostream << ">>=";
        case ident:
            return ostream << "identifier";
        case number:
            return ostream << "number";
        case string:
            return ostream << "string";
        case var:
            return ostream << "var";
        case function:
            return ostream << "function";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case null:
            return ostream << "null";
        case eef:
            return ostream << "if";
        case elze:
            return ostream << "else";
        case hwile:
            return ostream << "while";
        case doo:
            return ostream << "do";
        case ret:
            return ostream << "return";
        case brake:
            return ostream << "break";
        case cont:
            return ostream << "continue";
        case debugger:
            return ostream << "debugger";
        case thiz:
            return ostream << "this";
        case neu:
            return ostream << "new";
        case delet:
            return ostream << "delete";
        case voyd:
            return ostream << "void";
        case tipeof:
            return ostream << "typeof";
        case in:
            return ostream << "in";
        case instanceof:
            return ostream << "instanceof";
        case fore:
            return ostream << "for";
        case swich:
            return ostream << "switch";
        case caze:
            return ostream << "case";
        case defawlt:
            return ostream << "default";
        case thro:
            return ostream << "throw";
        case tri:
            return ostream << "try";
        case katch:
            return ostream << "catch";
        case finaly:
            return ostream << "finally";
        case wiz:
            return ostream << "with";
    }
    throw std::invalid_argument("invalid token_type");
}
