#pragma once

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal_expression.hpp>
#include <ast/logical_expression.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable_expression.hpp>

struct visitor
{
    visitor(const visitor&) = delete;
    visitor(visitor&&) = delete;
    auto operator=(const visitor&) -> visitor& = delete;
    auto operator=(visitor&&) -> visitor& = delete;
    visitor() = default;
    virtual ~visitor() = default;

    virtual void visit(const assign_expression& expr) = 0;
    virtual void visit(const binary_expression& expr) = 0;
    virtual void visit(const grouping_expression& expr) = 0;
    virtual void visit(const literal_expression& expr) = 0;
    virtual void visit(const logical_expression& expr) = 0;
    virtual void visit(const unary_expression& expr) = 0;
    virtual void visit(const variable_expression& expr) = 0;

    virtual void visit(const block_statement& stmt) = 0;
    virtual void visit(const expression_statement& stmt) = 0;
    virtual void visit(const if_statement& stmt) = 0;
    virtual void visit(const print_statement& stmt) = 0;
    virtual void visit(const var_statement& stmt) = 0;
    virtual void visit(const while_statement& stmt) = 0;
};
