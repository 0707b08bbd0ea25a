#pragma once

#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct postfix_expression final : expression
{
    postfix_expression(expression_ptr target, token oprtr)
        : target {std::move(target)}
        , op {std::move(oprtr)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    expression_ptr target;
    token op;
};
