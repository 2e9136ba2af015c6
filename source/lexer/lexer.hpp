#pragma once
#include <string_view>
#include <vector>

#include <diagnostic/diagnostic.hpp>
#include <fmt/format.h>

#include "location.hpp"
#include "token.hpp"

class lexer final
{
  public:
    explicit lexer(std::string_view input, std::string_view filename = "<stdin>");

    auto next_token() -> token;
    auto scan_tokens() -> std::vector<token>;
    [[nodiscard]] auto errors() const -> const std::vector<syntax_error>&;

  private:
    auto read_char() -> void;
    auto skip_whitespace_and_comments() -> void;
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto peek_char() const -> std::string_view::value_type;
    auto read_identifier_or_keyword() -> token;
    auto read_number() -> token;
    auto read_string() -> std::optional<token>;
    auto read_unexpected_character() -> std::string_view;
    [[nodiscard]] auto current_loc() const -> location;

    template<typename... T>
    auto new_error(location loc, fmt::format_string<T...> fmt, T&&... args)
    {
        m_errors.push_back(syntax_error {.loc = loc, .message = fmt::format(fmt, std::forward<T>(args)...)});
    }

    std::string_view m_input;
    std::string_view m_filename;
    std::string_view::size_type m_position {0};
    std::string_view::size_type m_read_position {0};
    std::string_view::value_type m_byte {0};
    std::string_view::size_type m_line {1};
    std::string_view::size_type m_bol {0};
    std::vector<syntax_error> m_errors;
};
