#pragma once

#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct binary_expression final : expression
{
    binary_expression(expression_ptr left, token oprtr, expression_ptr right)
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
