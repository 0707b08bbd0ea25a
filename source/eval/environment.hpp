#pragma once

#include <string>
#include <unordered_map>

#include <lexer/token.hpp>
#include <value/value.hpp>

/// One lexical scope. Lookups and assignments walk the outer chain, define
/// only touches this frame.
struct environment final
{
    explicit environment(environment* outer_env = nullptr);

    auto define(const std::string& name, value val) -> void;
    [[nodiscard]] auto get(const token& name) const -> const value&;
    auto assign(const token& name, value val) -> void;

    void debug() const;

    std::unordered_map<std::string, value> store;
    environment* outer {};
};
