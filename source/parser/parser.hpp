#pragma once

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string_view>
#include <utility>
#include <vector>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <diagnostic/diagnostic.hpp>
#include <fmt/format.h>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>

class parser final
{
  public:
    explicit parser(lexer lxr);
    auto parse_program() -> program_ptr;
    [[nodiscard]] auto errors() const -> const std::vector<syntax_error>&;

  private:
    using operand_parser = auto (parser::*)() -> expression_ptr;

    auto next_token() -> void;
    auto parse_declaration() -> statement_ptr;
    auto parse_var_statement() -> statement_ptr;
    auto parse_statement() -> statement_ptr;
    auto parse_print_statement() -> statement_ptr;
    auto parse_expression_statement() -> statement_ptr;
    auto parse_block_statement() -> statement_ptr;
    auto parse_if_statement() -> statement_ptr;
    auto parse_while_statement() -> statement_ptr;
    auto parse_for_statement() -> statement_ptr;
    auto parse_loop_body() -> statement_ptr;

    auto parse_expression() -> expression_ptr;
    auto parse_assignment() -> expression_ptr;
    auto parse_logical_or() -> expression_ptr;
    auto parse_logical_and() -> expression_ptr;
    auto parse_equality() -> expression_ptr;
    auto parse_comparison() -> expression_ptr;
    auto parse_term() -> expression_ptr;
    auto parse_factor() -> expression_ptr;
    auto parse_unary() -> expression_ptr;
    auto parse_primary() -> expression_ptr;

    template<typename Node>
    auto parse_left_associative(operand_parser operand, std::initializer_list<token_type> operators)
        -> expression_ptr;

    auto get(token_type type, std::string_view what) -> token;
    [[nodiscard]] auto current_token_is(token_type type) const -> bool;
    [[nodiscard]] auto current_token_is_any(std::initializer_list<token_type> types) const -> bool;
    auto synchronize() -> void;

    template<typename... T>
    auto new_error(location loc, fmt::format_string<T...> fmt, T&&... args)
    {
        m_errors.push_back(syntax_error {.loc = loc, .message = fmt::format(fmt, std::forward<T>(args)...)});
    }

    lexer m_lxr;
    token m_current_token {};
    token m_previous_token {};
    std::vector<syntax_error> m_errors;
    std::size_t m_lexer_errors_seen {0};
};
