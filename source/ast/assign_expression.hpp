#pragma once

#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

/// `name = value`, `name += value` or `name -= value`; op holds which one.
struct assign_expression final : expression
{
    assign_expression(token name, token oprtr, expression_ptr val)
        : name {std::move(name)}
        , op {std::move(oprtr)}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
    token op;
    expression_ptr value;
};
