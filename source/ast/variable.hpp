#pragma once

#include <utility>

#include <lexer/token.hpp>

#include "expression.hpp"

struct variable final : expression
{
    explicit variable(token name)
        : name {std::move(name)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    token name;
};
