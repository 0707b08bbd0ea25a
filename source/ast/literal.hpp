#pragma once

#include <utility>

#include <value/value.hpp>

#include "expression.hpp"

struct literal final : expression
{
    explicit literal(value val)
        : val {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    value val;
};
