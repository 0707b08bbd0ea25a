#include <ostream>

#include "token_type.hpp"

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&
{
    using enum token_type;
    switch (type) {
        case lparen:
            return ostream << "(";
        case rparen:
            return ostream << ")";
        case lbracket:
            return ostream << "[";
        case rbracket:
            return ostream << "]";
        case lsquirly:
            return ostream << "{";
        case rsquirly:
            return ostream << "}";
        case dot:
            return ostream << ".";
        case comma:
            return ostream << ",";
        case assign:
            return ostream << "=";
        case less_than:
            return ostream << "<";
        case greater_than:
            return ostream << ">";
        case plus:
            return ostream << "+";
        case minus:
            return ostream << "-";
        case asterisk:
            return ostream << "*";
        case slash:
            return ostream << "/";
        case less_equal:
            return ostream << "<=";
        case greater_equal:
            return ostream << ">=";
        case plus_plus:
            return ostream << "++";
        case minus_minus:
            return ostream << "--";
        case plus_assign:
            return ostream << "+=";
        case minus_assign:
            return ostream << "-=";
        case print:
            return ostream << "$<";
        case dollar_greater:
            return ostream << "$>";
        case ident:
            return ostream << "identifier";
        case number:
            return ostream << "number";
        case string:
            return ostream << "string";
        case offering:
            return ostream << "offering";
        case ritual:
            return ostream << "ritual";
        case end:
            return ostream << "end";
        case ret:
            return ostream << "return";
        case is:
            return ostream << "is";
        case logical_not:
            return ostream << "not";
        case logical_and:
            return ostream << "and";
        case logical_or:
            return ostream << "or";
        case klass:
            return ostream << "class";
        case self:
            return ostream << "this";
        case super:
            return ostream << "super";
        case hwile:
            return ostream << "while";
        case phor:
            return ostream << "for";
        case eef:
            return ostream << "if";
        case elze:
            return ostream << "else";
        case tru:
            return ostream << "true";
        case fals:
            return ostream << "false";
        case none:
            return ostream << "none";
        case statement_end:
            return ostream << "statement end";
        case eof:
            return ostream << "end of file";
    }
    return ostream << "unknown token_type(" << static_cast<int>(type) << ")";
}
