#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // single character tokens
    lparen,
    rparen,
    lbracket,
    rbracket,
    lsquirly,
    rsquirly,
    dot,
    comma,
    assign,
    less_than,
    greater_than,
    plus,
    minus,
    asterisk,
    slash,

    // two character tokens
    less_equal,
    greater_equal,
    plus_plus,
    minus_minus,
    plus_assign,
    minus_assign,
    print,
    dollar_greater,

    // literals
    ident,
    number,
    string,

    // keywords
    offering,
    ritual,
    end,
    ret,
    is,
    logical_not,
    logical_and,
    logical_or,
    klass,
    self,
    super,
    hwile,
    phor,
    eef,
    elze,
    tru,
    fals,
    none,

    // special tokens
    statement_end,
    eof,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
