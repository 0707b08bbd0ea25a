#include <ostream>
#include <string_view>
#include <utility>

#include "interpreter.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal.hpp>
#include <ast/logical_expression.hpp>
#include <ast/postfix_expression.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

#include "environment.hpp"
#include "evaluation_error.hpp"

namespace
{
// makes `next` the current frame for its lifetime
class environment_scope final
{
  public:
    environment_scope(environment*& current, environment* next)
        : m_current {current}
        , m_previous {current}
    {
        m_current = next;
    }

    ~environment_scope() { m_current = m_previous; }

    environment_scope(const environment_scope&) = delete;
    environment_scope(environment_scope&&) = delete;
    auto operator=(const environment_scope&) -> environment_scope& = delete;
    auto operator=(environment_scope&&) -> environment_scope& = delete;

  private:
    environment*& m_current;
    environment* m_previous;
};

auto type_mismatch(const token& oprtr, const value& left, const value& right) -> evaluation_error
{
    return evaluation_error {
        evaluation_error_kind::type_mismatch,
        oprtr,
        fmt::format("type mismatch: {} {} {}", left.type_name(), oprtr.lexeme, right.type_name()),
    };
}

auto number_operands(const token& oprtr, const value& left, const value& right)
    -> std::pair<number_value, number_value>
{
    if (!left.is<number_value>() || !right.is<number_value>()) {
        throw type_mismatch(oprtr, left, right);
    }
    return {left.as<number_value>(), right.as<number_value>()};
}

auto add(const token& oprtr, const value& left, const value& right) -> value
{
    if (left.is<string_value>()) {
        return value {left.as<string_value>() + right.inspect()};
    }
    const auto [lhs, rhs] = number_operands(oprtr, left, right);
    return value {lhs + rhs};
}

auto subtract(const token& oprtr, const value& left, const value& right) -> value
{
    const auto [lhs, rhs] = number_operands(oprtr, left, right);
    return value {lhs - rhs};
}

auto apply_binary_operator(const token& oprtr, const value& left, const value& right) -> value
{
    using enum token_type;
    switch (oprtr.type) {
        case plus:
            return add(oprtr, left, right);
        case minus:
            return subtract(oprtr, left, right);
        case asterisk: {
            const auto [lhs, rhs] = number_operands(oprtr, left, right);
            return value {lhs * rhs};
        }
        case slash: {
            const auto [lhs, rhs] = number_operands(oprtr, left, right);
            return value {lhs / rhs};
        }
        case greater_than: {
            const auto [lhs, rhs] = number_operands(oprtr, left, right);
            return value {lhs > rhs};
        }
        case greater_equal: {
            const auto [lhs, rhs] = number_operands(oprtr, left, right);
            return value {lhs >= rhs};
        }
        case less_than: {
            const auto [lhs, rhs] = number_operands(oprtr, left, right);
            return value {lhs < rhs};
        }
        case less_equal: {
            const auto [lhs, rhs] = number_operands(oprtr, left, right);
            return value {lhs <= rhs};
        }
        case is:
            return value {left == right};
        case logical_not:
            return value {left != right};
        default:
            throw evaluation_error {
                evaluation_error_kind::unknown_operator, oprtr, fmt::format("unknown operator: {}", oprtr.lexeme)};
    }
}

}  // namespace

interpreter::interpreter(std::ostream& out, diagnostics& diag)
    : m_out {out}
    , m_diag {diag}
{
}

auto interpreter::interpret(const statements& stmts) -> void
{
    for (const auto& stmt : stmts) {
        try {
            execute(*stmt);
        } catch (const evaluation_error& err) {
            m_diag.report(err.where.line, std::string_view {err.what()});
        }
    }
}

auto interpreter::evaluate(const expression& expr) -> value
{
    expr.accept(*this);
    return m_result;
}

auto interpreter::execute(const statement& stmt) -> void
{
    stmt.accept(*this);
}

auto interpreter::globals() const -> const environment&
{
    return m_globals;
}

void interpreter::visit(const assign_expression& expr)
{
    using enum token_type;
    auto val = evaluate(*expr.value);
    if (expr.op.type == plus_assign) {
        val = add(expr.op, m_env->get(expr.name), val);
    } else if (expr.op.type == minus_assign) {
        val = subtract(expr.op, m_env->get(expr.name), val);
    }
    m_env->assign(expr.name, val);
    m_result = std::move(val);
}

void interpreter::visit(const binary_expression& expr)
{
    const auto left = evaluate(*expr.left);
    const auto right = evaluate(*expr.right);
    m_result = apply_binary_operator(expr.op, left, right);
}

void interpreter::visit(const grouping_expression& expr)
{
    m_result = evaluate(*expr.expr);
}

void interpreter::visit(const literal& expr)
{
    m_result = expr.val;
}

void interpreter::visit(const logical_expression& expr)
{
    auto left = evaluate(*expr.left);
    if (expr.op.type == token_type::logical_or ? left.is_truthy() : !left.is_truthy()) {
        m_result = std::move(left);
        return;
    }
    m_result = evaluate(*expr.right);
}

void interpreter::visit(const postfix_expression& expr)
{
    const auto* target = dynamic_cast<const variable*>(expr.target.get());
    if (target == nullptr) {
        throw evaluation_error {
            evaluation_error_kind::invalid_target,
            expr.op,
            fmt::format("invalid {} target: {}", expr.op.lexeme, expr.target->string()),
        };
    }
    const auto& current = m_env->get(target->name);
    if (!current.is<number_value>()) {
        throw evaluation_error {
            evaluation_error_kind::type_mismatch,
            expr.op,
            fmt::format("type mismatch: {}{}", current.type_name(), expr.op.lexeme),
        };
    }
    const auto step = expr.op.type == token_type::plus_plus ? 1.0 : -1.0;
    auto updated = value {current.as<number_value>() + step};
    m_env->assign(target->name, updated);
    m_result = std::move(updated);
}

void interpreter::visit(const unary_expression& expr)
{
    const auto right = evaluate(*expr.right);
    if (expr.op.type == token_type::logical_not) {
        m_result = value {!right.is_truthy()};
        return;
    }
    if (!right.is<number_value>()) {
        throw evaluation_error {
            evaluation_error_kind::type_mismatch,
            expr.op,
            fmt::format("type mismatch: {}{}", expr.op.lexeme, right.type_name()),
        };
    }
    m_result = value {-right.as<number_value>()};
}

void interpreter::visit(const variable& expr)
{
    m_result = m_env->get(expr.name);
}

void interpreter::visit(const block_statement& stmt)
{
    auto block_env = environment {m_env};
    execute_block(stmt.body, &block_env);
}

void interpreter::visit(const expression_statement& stmt)
{
    evaluate(*stmt.expr);
}

void interpreter::visit(const if_statement& stmt)
{
    if (evaluate(*stmt.condition).is_truthy()) {
        execute(*stmt.consequence);
        return;
    }
    if (stmt.alternative) {
        execute(*stmt.alternative);
    }
}

void interpreter::visit(const print_statement& stmt)
{
    fmt::print(m_out, "{}\n", evaluate(*stmt.expr).inspect());
}

void interpreter::visit(const var_statement& stmt)
{
    m_env->define(stmt.name.lexeme, stmt.initializer ? evaluate(*stmt.initializer) : value {});
}

void interpreter::visit(const while_statement& stmt)
{
    while (evaluate(*stmt.condition).is_truthy()) {
        execute(*stmt.body);
    }
}

auto interpreter::execute_block(const statements& body, environment* env) -> void
{
    const auto scope = environment_scope {m_env, env};
    for (const auto& stmt : body) {
        execute(*stmt);
    }
}
