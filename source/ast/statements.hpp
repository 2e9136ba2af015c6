#pragma once

#include <memory>
#include <string>
#include <vector>

#include <lexer/location.hpp>

#include "expression.hpp"

struct statement
{
    explicit statement(location loc)
        : l {loc}
    {
    }

    virtual ~statement() = default;
    statement(const statement&) = delete;
    statement(statement&&) = delete;
    auto operator=(const statement&) -> statement& = delete;
    auto operator=(statement&&) -> statement& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;

    [[nodiscard]] auto loc() const { return l; }

    location l;
};

using statement_ptr = std::unique_ptr<statement>;
using statements = std::vector<statement_ptr>;

struct expression_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct print_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr value;
};

struct var_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    expression_ptr initializer;
};

struct block_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    ::statements statements;
};

struct if_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    statement_ptr consequence;
    statement_ptr alternative;
};

struct while_statement final : statement
{
    using statement::statement;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    statement_ptr body;
};
