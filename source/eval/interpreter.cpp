#include <optional>
#include <ostream>
#include <utility>

#include "interpreter.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/logical_expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable_expression.hpp>
#include <diagnostic/diagnostic.hpp>
#include <fmt/ostream.h>
#include <lexer/token_type.hpp>
#include <object/object.hpp>

#include "environment.hpp"

namespace
{
// Makes `next` the current scope and restores the previous one on every exit path.
class scoped_environment final
{
  public:
    scoped_environment(environment*& current, environment& next)
        : m_current {current}
        , m_previous {current}
    {
        m_current = &next;
    }

    ~scoped_environment() { m_current = m_previous; }

    scoped_environment(const scoped_environment&) = delete;
    scoped_environment(scoped_environment&&) = delete;
    auto operator=(const scoped_environment&) -> scoped_environment& = delete;
    auto operator=(scoped_environment&&) -> scoped_environment& = delete;

  private:
    environment*& m_current;
    environment* m_previous;
};

auto type_mismatch(const binary_expression& expr, const object& left, const object& right) -> runtime_error
{
    return make_runtime_error(runtime_error_kind::type_mismatch,
                              expr.loc(),
                              "type mismatch: {} {} {}",
                              left.type_name(),
                              expr.op,
                              right.type_name());
}

auto apply_arithmetic(const binary_expression& expr, number_value lhs, number_value rhs) -> object
{
    using enum token_type;
    switch (expr.op) {
        case plus:
            return {lhs + rhs};
        case minus:
            return {lhs - rhs};
        case asterisk:
            return {lhs * rhs};
        case slash:
            if (rhs == 0.0) {
                throw make_runtime_error(runtime_error_kind::division_by_zero, expr.loc(), "division by zero");
            }
            return {lhs / rhs};
        case greater_than:
            return {lhs > rhs};
        case greater_equal:
            return {lhs >= rhs};
        case less_than:
            return {lhs < rhs};
        case less_equal:
            return {lhs <= rhs};
        default:
            throw make_runtime_error(runtime_error_kind::type_mismatch,
                                     expr.loc(),
                                     "unknown operator: number {} number",
                                     expr.op);
    }
}

}  // namespace

interpreter::interpreter(environment& globals, std::ostream& out)
    : m_env {&globals}
    , m_out {out}
{
}

auto interpreter::run(const program& prgrm) -> std::optional<runtime_error>
{
    try {
        for (const auto& stmt : prgrm.statements) {
            execute(*stmt);
        }
    } catch (const runtime_error& err) {
        return err;
    }
    return std::nullopt;
}

auto interpreter::evaluate(const expression& expr) -> object
{
    expr.accept(*this);
    return m_result;
}

auto interpreter::execute(const statement& stmt) -> void
{
    stmt.accept(*this);
}

void interpreter::visit(const assign_expression& expr)
{
    auto val = evaluate(*expr.value);
    m_result = m_env->assign(expr.name, std::move(val), expr.loc());
}

void interpreter::visit(const binary_expression& expr)
{
    const auto left = evaluate(*expr.left);
    const auto right = evaluate(*expr.right);

    using enum token_type;
    switch (expr.op) {
        case equals:
            m_result = {left == right};
            return;
        case not_equals:
            m_result = {!(left == right)};
            return;
        case plus:
            if (left.is<string_value>() && right.is<string_value>()) {
                m_result = {left.as<string_value>() + right.as<string_value>()};
                return;
            }
            break;
        default:
            break;
    }
    if (!left.is<number_value>() || !right.is<number_value>()) {
        throw type_mismatch(expr, left, right);
    }
    m_result = apply_arithmetic(expr, left.as<number_value>(), right.as<number_value>());
}

void interpreter::visit(const grouping_expression& expr)
{
    expr.inner->accept(*this);
}

void interpreter::visit(const literal_expression& expr)
{
    m_result = expr.value;
}

void interpreter::visit(const logical_expression& expr)
{
    expr.left->accept(*this);
    const auto left_is_truthy = m_result.is_truthy();
    if (expr.op == token_type::logical_or ? left_is_truthy : !left_is_truthy) {
        return;
    }
    expr.right->accept(*this);
}

void interpreter::visit(const unary_expression& expr)
{
    const auto right = evaluate(*expr.right);
    using enum token_type;
    switch (expr.op) {
        case minus:
            if (!right.is<number_value>()) {
                throw make_runtime_error(
                    runtime_error_kind::type_mismatch, expr.loc(), "type mismatch: -{}", right.type_name());
            }
            m_result = {-right.as<number_value>()};
            return;
        case exclamation:
            m_result = {!right.is_truthy()};
            return;
        default:
            throw make_runtime_error(
                runtime_error_kind::type_mismatch, expr.loc(), "unknown operator: {}{}", expr.op, right.type_name());
    }
}

void interpreter::visit(const variable_expression& expr)
{
    m_result = m_env->get(expr.name, expr.loc());
}

void interpreter::visit(const block_statement& stmt)
{
    environment block_env {m_env};
    const scoped_environment scope {m_env, block_env};
    for (const auto& inner : stmt.statements) {
        execute(*inner);
    }
}

void interpreter::visit(const expression_statement& stmt)
{
    stmt.expr->accept(*this);
}

void interpreter::visit(const if_statement& stmt)
{
    if (evaluate(*stmt.condition).is_truthy()) {
        execute(*stmt.consequence);
    } else if (stmt.alternative != nullptr) {
        execute(*stmt.alternative);
    }
}

void interpreter::visit(const print_statement& stmt)
{
    fmt::print(m_out, "{}\n", evaluate(*stmt.value).inspect());
}

void interpreter::visit(const var_statement& stmt)
{
    auto val = stmt.initializer != nullptr ? evaluate(*stmt.initializer) : object {};
    m_env->define(stmt.name, std::move(val));
}

void interpreter::visit(const while_statement& stmt)
{
    while (evaluate(*stmt.condition).is_truthy()) {
        execute(*stmt.body);
    }
}
