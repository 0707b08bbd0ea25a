#pragma once

#include <utility>

#include "expression.hpp"

struct grouping_expression final : expression
{
    explicit grouping_expression(expression_ptr expr)
        : expr {std::move(expr)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr expr;
};
