#pragma once

#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

// `and` / `or`, the right operand is only evaluated when needed
struct logical_expression final : expression
{
    logical_expression(expression_ptr left, token oprtr, expression_ptr right)
        : left {std::move(left)}
        , op {std::move(oprtr)}
        , right {std::move(right)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr left;
    token op;
    expression_ptr right;
};
