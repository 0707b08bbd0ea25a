#pragma once

#include <ostream>

#include <ast/expression.hpp>
#include <ast/statements.hpp>
#include <ast/visitor.hpp>
#include <diagnostics/diagnostics.hpp>
#include <value/value.hpp>

#include "environment.hpp"

struct interpreter final : visitor
{
    interpreter(std::ostream& out, diagnostics& diag);

    /// Executes the statements in order. An evaluation error is reported and
    /// only aborts the statement it was raised in.
    auto interpret(const statements& stmts) -> void;
    auto evaluate(const expression& expr) -> value;
    auto execute(const statement& stmt) -> void;

    [[nodiscard]] auto globals() const -> const environment&;

  protected:
    void visit(const assign_expression& expr) final;
    void visit(const binary_expression& expr) final;
    void visit(const grouping_expression& expr) final;
    void visit(const literal& expr) final;
    void visit(const logical_expression& expr) final;
    void visit(const postfix_expression& expr) final;
    void visit(const unary_expression& expr) final;
    void visit(const variable& expr) final;

    void visit(const block_statement& stmt) final;
    void visit(const expression_statement& stmt) final;
    void visit(const if_statement& stmt) final;
    void visit(const print_statement& stmt) final;
    void visit(const var_statement& stmt) final;
    void visit(const while_statement& stmt) final;

  private:
    auto execute_block(const statements& body, environment* env) -> void;

    std::ostream& m_out;
    diagnostics& m_diag;
    environment m_globals;
    environment* m_env {&m_globals};
    value m_result {};
};
