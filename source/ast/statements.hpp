#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <lexer/token.hpp>

#include "expression.hpp"

struct statement
{
    statement() = default;
    virtual ~statement() = default;
    statement(const statement&) = delete;
    statement(statement&&) = delete;
    auto operator=(const statement&) -> statement& = delete;
    auto operator=(statement&&) -> statement& = delete;

    [[nodiscard]] virtual auto string() const -> std::string = 0;
    virtual void accept(struct visitor& visitor) const = 0;
};

using statement_ptr = std::unique_ptr<statement>;
using statements = std::vector<statement_ptr>;

struct expression_statement final : statement
{
    explicit expression_statement(expression_ptr expr)
        : expr {std::move(expr)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct print_statement final : statement
{
    explicit print_statement(expression_ptr expr)
        : expr {std::move(expr)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};

struct var_statement final : statement
{
    var_statement(token name, expression_ptr initializer)
        : name {std::move(name)}
        , initializer {std::move(initializer)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
    expression_ptr initializer;
};

struct block_statement final : statement
{
    explicit block_statement(statements&& stmts)
        : body {std::move(stmts)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    statements body;
};

using block_ptr = std::unique_ptr<block_statement>;

struct if_statement final : statement
{
    if_statement(expression_ptr condition, block_ptr consequence, block_ptr alternative)
        : condition {std::move(condition)}
        , consequence {std::move(consequence)}
        , alternative {std::move(alternative)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    block_ptr consequence;
    block_ptr alternative;
};

struct while_statement final : statement
{
    while_statement(expression_ptr condition, block_ptr body)
        : condition {std::move(condition)}
        , body {std::move(body)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr condition;
    block_ptr body;
};
