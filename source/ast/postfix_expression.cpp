#include <string>

#include "postfix_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto postfix_expression::string() const -> std::string
{
    return fmt::format("({}{})", target->string(), op.lexeme);
}

void postfix_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
