#include <string>

#include "literal.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto literal::string() const -> std::string
{
    return fmt::format("{}", val);
}

void literal::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
