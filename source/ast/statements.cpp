#include <string>

#include "statements.hpp"

#include <fmt/format.h>

#include "util.hpp"
#include "visitor.hpp"

auto expression_statement::string() const -> std::string
{
    return expr->string();
}

void expression_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto print_statement::string() const -> std::string
{
    return fmt::format("$< {}", expr->string());
}

void print_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto var_statement::string() const -> std::string
{
    if (initializer) {
        return fmt::format("offering {} = {}", name.lexeme, initializer->string());
    }
    return fmt::format("offering {}", name.lexeme);
}

void var_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto block_statement::string() const -> std::string
{
    if (body.empty()) {
        return "{ }";
    }
    return fmt::format("{{ {} }}", join(body, "; "));
}

void block_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto if_statement::string() const -> std::string
{
    if (alternative) {
        return fmt::format(
            "if {} {} else {}", condition->string(), consequence->string(), alternative->string());
    }
    return fmt::format("if {} {}", condition->string(), consequence->string());
}

void if_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}

auto while_statement::string() const -> std::string
{
    return fmt::format("while {} {}", condition->string(), body->string());
}

void while_statement::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
