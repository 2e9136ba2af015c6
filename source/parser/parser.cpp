#include <algorithm>
#include <exception>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/logical_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable_expression.hpp>
#include <lexer/lexer.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

namespace
{
// Unwinds the statement being parsed. The diagnostic is already recorded when this is thrown.
struct parse_error final : std::exception
{
    [[nodiscard]] auto what() const noexcept -> const char* final { return "parse error"; }
};
}  // namespace

parser::parser(lexer lxr)
    : m_lxr(std::move(lxr))
{
    next_token();
}

auto parser::parse_program() -> program_ptr
{
    auto prog = std::make_unique<program>();
    while (!current_token_is(token_type::eof)) {
        if (auto stmt = parse_declaration(); stmt != nullptr) {
            prog->statements.push_back(std::move(stmt));
        }
    }
    return prog;
}

auto parser::errors() const -> const std::vector<syntax_error>&
{
    return m_errors;
}

auto parser::next_token() -> void
{
    m_previous_token = m_current_token;
    m_current_token = m_lxr.next_token();
    const auto& lexer_errors = m_lxr.errors();
    for (; m_lexer_errors_seen < lexer_errors.size(); ++m_lexer_errors_seen) {
        m_errors.push_back(lexer_errors[m_lexer_errors_seen]);
    }
}

auto parser::parse_declaration() -> statement_ptr
{
    try {
        if (current_token_is(token_type::var)) {
            return parse_var_statement();
        }
        return parse_statement();
    } catch (const parse_error&) {
        synchronize();
        return {};
    }
}

auto parser::parse_var_statement() -> statement_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<var_statement>(m_current_token.loc);
    next_token();
    stmt->name = std::string {get(ident, "variable name").lexeme};
    if (current_token_is(assign)) {
        next_token();
        stmt->initializer = parse_expression();
    }
    get(semicolon, "';' after variable declaration");
    return stmt;
}

auto parser::parse_statement() -> statement_ptr
{
    using enum token_type;
    switch (m_current_token.type) {
        case print:
            return parse_print_statement();
        case lsquirly:
            return parse_block_statement();
        case eef:
            return parse_if_statement();
        case hwile:
            return parse_while_statement();
        case fore:
            return parse_for_statement();
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_print_statement() -> statement_ptr
{
    auto stmt = std::make_unique<print_statement>(m_current_token.loc);
    next_token();
    stmt->value = parse_expression();
    get(token_type::semicolon, "';' after value");
    return stmt;
}

auto parser::parse_expression_statement() -> statement_ptr
{
    auto stmt = std::make_unique<expression_statement>(m_current_token.loc);
    stmt->expr = parse_expression();
    get(token_type::semicolon, "';' after expression");
    return stmt;
}

auto parser::parse_block_statement() -> statement_ptr
{
    using enum token_type;
    auto block = std::make_unique<block_statement>(m_current_token.loc);
    next_token();
    while (!current_token_is(rsquirly) && !current_token_is(eof)) {
        if (auto stmt = parse_declaration(); stmt != nullptr) {
            block->statements.push_back(std::move(stmt));
        }
    }
    get(rsquirly, "'}' after block");
    return block;
}

auto parser::parse_if_statement() -> statement_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<if_statement>(m_current_token.loc);
    next_token();
    get(lparen, "'(' after 'if'");
    stmt->condition = parse_expression();
    get(rparen, "')' after if condition");
    stmt->consequence = parse_statement();
    // an else always belongs to the innermost if still waiting for one
    if (current_token_is(elze)) {
        next_token();
        stmt->alternative = parse_statement();
    }
    return stmt;
}

auto parser::parse_while_statement() -> statement_ptr
{
    using enum token_type;
    auto stmt = std::make_unique<while_statement>(m_current_token.loc);
    next_token();
    get(lparen, "'(' after 'while'");
    stmt->condition = parse_expression();
    get(rparen, "')' after condition");
    stmt->body = parse_loop_body();
    return stmt;
}

// for (init; cond; incr) body  =>  { init; while (cond) { body; incr; } }
auto parser::parse_for_statement() -> statement_ptr
{
    using enum token_type;
    const auto loc = m_current_token.loc;
    next_token();
    get(lparen, "'(' after 'for'");

    statement_ptr initializer;
    if (current_token_is(semicolon)) {
        next_token();
    } else if (current_token_is(var)) {
        initializer = parse_var_statement();
    } else {
        initializer = parse_expression_statement();
    }

    expression_ptr condition;
    if (!current_token_is(semicolon)) {
        condition = parse_expression();
    }
    get(semicolon, "';' after loop condition");

    expression_ptr increment;
    if (!current_token_is(rparen)) {
        increment = parse_expression();
    }
    get(rparen, "')' after for clauses");

    auto body = parse_loop_body();
    if (increment != nullptr) {
        auto increment_stmt = std::make_unique<expression_statement>(increment->loc());
        increment_stmt->expr = std::move(increment);
        auto wrapped = std::make_unique<block_statement>(body->loc());
        wrapped->statements.push_back(std::move(body));
        wrapped->statements.push_back(std::move(increment_stmt));
        body = std::move(wrapped);
    }
    if (condition == nullptr) {
        condition = std::make_unique<literal_expression>(object {true}, loc);
    }

    auto loop = std::make_unique<while_statement>(loc);
    loop->condition = std::move(condition);
    loop->body = std::move(body);

    auto block = std::make_unique<block_statement>(loc);
    if (initializer != nullptr) {
        block->statements.push_back(std::move(initializer));
    }
    block->statements.push_back(std::move(loop));
    return block;
}

auto parser::parse_loop_body() -> statement_ptr
{
    using enum token_type;
    switch (m_current_token.type) {
        case lsquirly:
            return parse_block_statement();
        case print:
            return parse_print_statement();
        case var:
        case eef:
        case hwile:
        case fore:
            new_error(m_current_token.loc,
                      "loop body must be a block, print or expression statement, got {} instead",
                      m_current_token.type);
            throw parse_error {};
        default:
            return parse_expression_statement();
    }
}

auto parser::parse_expression() -> expression_ptr
{
    return parse_assignment();
}

auto parser::parse_assignment() -> expression_ptr
{
    auto expr = parse_logical_or();
    if (!current_token_is(token_type::assign)) {
        return expr;
    }
    const auto equals_loc = m_current_token.loc;
    next_token();
    auto value = parse_assignment();

    if (const auto* var = dynamic_cast<const variable_expression*>(expr.get()); var != nullptr) {
        auto assign = std::make_unique<assign_expression>(var->loc());
        assign->name = var->name;
        assign->value = std::move(value);
        return assign;
    }
    // reported without unwinding: the parser is not confused about where it is
    new_error(equals_loc, "invalid assignment target");
    return expr;
}

template<typename Node>
auto parser::parse_left_associative(operand_parser operand, std::initializer_list<token_type> operators)
    -> expression_ptr
{
    auto left = (this->*operand)();
    while (current_token_is_any(operators)) {
        auto node = std::make_unique<Node>(m_current_token.loc);
        node->op = m_current_token.type;
        next_token();
        node->left = std::move(left);
        node->right = (this->*operand)();
        left = std::move(node);
    }
    return left;
}

auto parser::parse_logical_or() -> expression_ptr
{
    return parse_left_associative<logical_expression>(&parser::parse_logical_and, {token_type::logical_or});
}

auto parser::parse_logical_and() -> expression_ptr
{
    return parse_left_associative<logical_expression>(&parser::parse_equality, {token_type::logical_and});
}

auto parser::parse_equality() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>(&parser::parse_comparison, {equals, not_equals});
}

auto parser::parse_comparison() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>(&parser::parse_term,
                                                     {greater_than, greater_equal, less_than, less_equal});
}

auto parser::parse_term() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>(&parser::parse_factor, {minus, plus});
}

auto parser::parse_factor() -> expression_ptr
{
    using enum token_type;
    return parse_left_associative<binary_expression>(&parser::parse_unary, {slash, asterisk});
}

auto parser::parse_unary() -> expression_ptr
{
    using enum token_type;
    if (!current_token_is_any({exclamation, minus})) {
        return parse_primary();
    }
    auto unary = std::make_unique<unary_expression>(m_current_token.loc);
    unary->op = m_current_token.type;
    next_token();
    unary->right = parse_unary();
    return unary;
}

auto parser::parse_primary() -> expression_ptr
{
    using enum token_type;
    const auto tok = m_current_token;
    switch (tok.type) {
        case fals:
            next_token();
            return std::make_unique<literal_expression>(object {false}, tok.loc);
        case tru:
            next_token();
            return std::make_unique<literal_expression>(object {true}, tok.loc);
        case nil:
            next_token();
            return std::make_unique<literal_expression>(object {}, tok.loc);
        case number:
        case string:
            next_token();
            return std::make_unique<literal_expression>(tok.literal.value_or(object {}), tok.loc);
        case ident:
            next_token();
            return std::make_unique<variable_expression>(std::string {tok.lexeme}, tok.loc);
        case lparen: {
            next_token();
            auto group = std::make_unique<grouping_expression>(tok.loc);
            group->inner = parse_expression();
            get(rparen, "')' after expression");
            return group;
        }
        default:
            new_error(tok.loc, "expected expression, got {} instead", tok.type);
            throw parse_error {};
    }
}

auto parser::get(token_type type, std::string_view what) -> token
{
    if (current_token_is(type)) {
        next_token();
        return m_previous_token;
    }
    new_error(m_current_token.loc, "expected {}, got {} instead", what, m_current_token.type);
    throw parse_error {};
}

auto parser::current_token_is(token_type type) const -> bool
{
    return m_current_token.type == type;
}

auto parser::current_token_is_any(std::initializer_list<token_type> types) const -> bool
{
    return std::find(types.begin(), types.end(), m_current_token.type) != types.end();
}

// Skips to the next statement boundary: just past a ';' or at a keyword that starts a statement.
// The failed statement always consumed its own leading keyword, so stopping on a keyword makes progress.
auto parser::synchronize() -> void
{
    using enum token_type;
    if (current_token_is_any({var, fore, eef, hwile, print})) {
        return;
    }
    next_token();
    while (!current_token_is(eof)) {
        if (m_previous_token.type == semicolon || current_token_is_any({var, fore, eef, hwile, print})) {
            return;
        }
        next_token();
    }
}
