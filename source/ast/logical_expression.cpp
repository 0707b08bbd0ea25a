#include <string>

#include "logical_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto logical_expression::string() const -> std::string
{
    return fmt::format("({} {} {})", left->string(), op.lexeme, right->string());
}

void logical_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
