#pragma once

#include <cstdint>
#include <ostream>

#include <fmt/ostream.h>

enum class token_type : std::uint8_t
{
    // special tokens
    eof,

    // single character tokens
    asterisk,
    assign,
    comma,
    dot,
    exclamation,
    greater_than,
    less_than,
    lparen,
    lsquirly,
    minus,
    plus,
    rparen,
    rsquirly,
    semicolon,
    slash,

    // two character tokens
    equals,
    not_equals,
    greater_equal,
    less_equal,

    // multi character tokens
    ident,
    number,
    string,

    // keywords
    logical_and,
    logical_or,
    eef,
    elze,
    hwile,
    fore,
    var,
    print,
    tru,
    fals,
    nil,
};

auto operator<<(std::ostream& ostream, token_type type) -> std::ostream&;

template<>
struct fmt::formatter<token_type> : ostream_formatter
{
};
