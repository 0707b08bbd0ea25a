#include <string>

#include "variable.hpp"

#include "visitor.hpp"

auto variable::string() const -> std::string
{
    return name.lexeme;
}

void variable::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
