#pragma once

#include <optional>
#include <ostream>

#include <ast/expression.hpp>
#include <ast/program.hpp>
#include <ast/statements.hpp>
#include <ast/visitor.hpp>
#include <diagnostic/diagnostic.hpp>
#include <object/object.hpp>

#include "environment.hpp"

struct interpreter final : visitor
{
    interpreter(environment& globals, std::ostream& out);

    /// Executes the statements of prgrm in order. The first runtime error aborts the run and is returned.
    auto run(const program& prgrm) -> std::optional<runtime_error>;
    auto evaluate(const expression& expr) -> object;
    auto execute(const statement& stmt) -> void;

  protected:
    void visit(const assign_expression& expr) final;
    void visit(const binary_expression& expr) final;
    void visit(const grouping_expression& expr) final;
    void visit(const literal_expression& expr) final;
    void visit(const logical_expression& expr) final;
    void visit(const unary_expression& expr) final;
    void visit(const variable_expression& expr) final;

    void visit(const block_statement& stmt) final;
    void visit(const expression_statement& stmt) final;
    void visit(const if_statement& stmt) final;
    void visit(const print_statement& stmt) final;
    void visit(const var_statement& stmt) final;
    void visit(const while_statement& stmt) final;

  private:
    object m_result {};
    environment* m_env;
    std::ostream& m_out;
};
