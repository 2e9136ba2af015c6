#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include <object/object.hpp>

#include "location.hpp"
#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table = std::array<token_type, std::numeric_limits<unsigned char>::max() + 1>;

namespace
{
// eof doubles as "no single character token"
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr.fill(eof);
    arr['*'] = asterisk;
    arr['='] = assign;
    arr[','] = comma;
    arr['.'] = dot;
    arr['!'] = exclamation;
    arr['>'] = greater_than;
    arr['<'] = less_than;
    arr['('] = lparen;
    arr['{'] = lsquirly;
    arr['-'] = minus;
    arr['+'] = plus;
    arr[')'] = rparen;
    arr['}'] = rsquirly;
    arr[';'] = semicolon;
    arr['/'] = slash;
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 11;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"and", token_type::logical_and},
        std::pair {"or", token_type::logical_or},
        std::pair {"if", token_type::eef},
        std::pair {"else", token_type::elze},
        std::pair {"while", token_type::hwile},
        std::pair {"for", token_type::fore},
        std::pair {"var", token_type::var},
        std::pair {"print", token_type::print},
        std::pair {"true", token_type::tru},
        std::pair {"false", token_type::fals},
        std::pair {"nil", token_type::nil},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

using token_pair = std::pair<token_type, token_type>;

struct token_pair_hash
{
    auto operator()(const token_pair& pair) const -> size_t
    {
        return static_cast<uint8_t>(pair.first) ^ static_cast<size_t>(static_cast<size_t>(pair.second) << 8U);
    }
};

using two_token_lookup = std::unordered_map<token_pair, token_type, token_pair_hash>;

auto build_two_token_lookup() -> two_token_lookup
{
    using enum token_type;
    two_token_lookup lookup;
    lookup.insert({{assign, assign}, equals});
    lookup.insert({{exclamation, assign}, not_equals});
    lookup.insert({{greater_than, assign}, greater_equal});
    lookup.insert({{less_than, assign}, less_equal});
    return lookup;
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

// number of bytes announced by a UTF-8 lead byte, 1 for ASCII and stray bytes
inline auto utf8_sequence_length(char chr) -> std::size_t
{
    const auto byte = static_cast<unsigned char>(chr);
    if ((byte & 0xE0U) == 0xC0U) {
        return 2;
    }
    if ((byte & 0xF0U) == 0xE0U) {
        return 3;
    }
    if ((byte & 0xF8U) == 0xF0U) {
        return 4;
    }
    return 1;
}

inline auto is_utf8_continuation(char chr) -> bool
{
    return (static_cast<unsigned char>(chr) & 0xC0U) == 0x80U;
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
    using enum token_type;
    const static auto two_token = build_two_token_lookup();
    while (true) {
        skip_whitespace_and_comments();
        const auto loc = current_loc();
        if (at_end()) {
            return token {.type = eof, .lexeme = "", .loc = loc};
        }
        const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(m_byte)];
        if (char_token_type != eof) {
            const auto peek_token_type = char_literal_tokens[static_cast<unsigned char>(peek_char())];
            if (const auto itr = two_token.find({char_token_type, peek_token_type}); itr != two_token.end()) {
                const auto position = m_position;
                read_char();
                read_char();
                return token {.type = itr->second, .lexeme = m_input.substr(position, 2), .loc = loc};
            }
            const auto position = m_position;
            read_char();
            return token {.type = char_token_type, .lexeme = m_input.substr(position, 1), .loc = loc};
        }
        if (m_byte == '"') {
            if (auto tok = read_string(); tok.has_value()) {
                return *tok;
            }
            continue;
        }
        if (is_letter(m_byte)) {
            return read_identifier_or_keyword();
        }
        if (is_digit(m_byte)) {
            return read_number();
        }
        new_error(loc, "unexpected character '{}'", read_unexpected_character());
    }
}

auto lexer::scan_tokens() -> std::vector<token>
{
    std::vector<token> tokens;
    while (true) {
        auto tok = next_token();
        const auto done = tok.type == token_type::eof;
        tokens.push_back(std::move(tok));
        if (done) {
            return tokens;
        }
    }
}

auto lexer::errors() const -> const std::vector<syntax_error>&
{
    return m_errors;
}

auto lexer::read_char() -> void
{
    if (m_byte == '\n') {
        m_line++;
        m_bol = m_read_position;
    }
    if (m_read_position >= m_input.size()) {
        m_byte = '\0';
        m_position = m_input.size();
        return;
    }
    m_byte = m_input[m_read_position];
    m_position = m_read_position;
    m_read_position++;
}

auto lexer::skip_whitespace_and_comments() -> void
{
    while (!at_end()) {
        if (m_byte == ' ' || m_byte == '\t' || m_byte == '\n' || m_byte == '\r') {
            read_char();
        } else if (m_byte == '/' && peek_char() == '/') {
            while (!at_end() && m_byte != '\n') {
                read_char();
            }
        } else {
            return;
        }
    }
}

auto lexer::at_end() const -> bool
{
    return m_position >= m_input.size();
}

auto lexer::peek_char() const -> std::string_view::value_type
{
    if (m_read_position >= m_input.size()) {
        return '\0';
    }
    return m_input[m_read_position];
}

auto lexer::read_identifier_or_keyword() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (!at_end() && (is_letter(m_byte) || is_digit(m_byte))) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(position, m_position - position);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    if (itr != keyword_tokens.end()) {
        return token {.type = itr->second, .lexeme = identifier_or_keyword, .loc = loc};
    }
    // NOLINTEND(*-qualified-auto)
    return token {.type = token_type::ident, .lexeme = identifier_or_keyword, .loc = loc};
}

auto lexer::read_number() -> token
{
    const auto loc = current_loc();
    const auto position = m_position;
    while (!at_end() && is_digit(m_byte)) {
        read_char();
    }
    if (!at_end() && m_byte == '.' && is_digit(peek_char())) {
        read_char();
        while (!at_end() && is_digit(m_byte)) {
            read_char();
        }
    }
    const auto lexeme = m_input.substr(position, m_position - position);
    auto tok = token {.type = token_type::number, .lexeme = lexeme, .loc = loc};
    try {
        tok.literal = object {std::stod(std::string {lexeme})};
    } catch (const std::out_of_range&) {
        new_error(loc, "could not parse {} as number", lexeme);
        tok.literal = object {number_value {}};
    }
    return tok;
}

auto lexer::read_string() -> std::optional<token>
{
    const auto loc = current_loc();
    const auto position = m_position;
    read_char();
    while (!at_end() && m_byte != '"') {
        read_char();
    }
    if (at_end()) {
        new_error(loc, "unterminated string");
        return std::nullopt;
    }
    read_char();
    const auto lexeme = m_input.substr(position, m_position - position);
    return token {
        .type = token_type::string,
        .lexeme = lexeme,
        .literal = object {string_value {lexeme.substr(1, lexeme.size() - 2)}},
        .loc = loc,
    };
}

auto lexer::read_unexpected_character() -> std::string_view
{
    const auto position = m_position;
    const auto length = utf8_sequence_length(m_byte);
    read_char();
    for (std::size_t idx = 1; idx < length && !at_end() && is_utf8_continuation(m_byte); ++idx) {
        read_char();
    }
    return m_input.substr(position, m_position - position);
}

auto lexer::current_loc() const -> location
{
    return location {.filename = m_filename, .line = m_line, .column = m_position - m_bol + 1};
}
