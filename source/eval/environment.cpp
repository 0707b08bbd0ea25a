#include <map>
#include <string>
#include <utility>

#include "environment.hpp"

#include <fmt/format.h>

#include "evaluation_error.hpp"

namespace
{
auto undefined_variable(const token& name) -> evaluation_error
{
    return evaluation_error {
        evaluation_error_kind::undefined_variable, name, fmt::format("undefined variable '{}'", name.lexeme)};
}
}  // namespace

environment::environment(environment* outer_env)
    : outer(outer_env)
{
}

auto environment::define(const std::string& name, value val) -> void
{
    store[name] = std::move(val);
}

auto environment::get(const token& name) const -> const value&
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name.lexeme); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    throw undefined_variable(name);
}

auto environment::assign(const token& name, value val) -> void
{
    for (auto* ptr = this; ptr != nullptr; ptr = ptr->outer) {
        if (const auto itr = ptr->store.find(name.lexeme); itr != ptr->store.end()) {
            itr->second = std::move(val);
            return;
        }
    }
    throw undefined_variable(name);
}

auto environment::debug() const -> void
{
    const auto sorted = std::map<std::string, value> {store.cbegin(), store.cend()};
    for (const auto& [k, v] : sorted) {
        fmt::print("[{}] = {}\n", k, v);
    }
}
