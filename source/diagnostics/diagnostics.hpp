#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

struct diagnostic final
{
    std::size_t line;
    std::string message;
    auto operator==(const diagnostic& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const diagnostic& diag) -> std::ostream&;

template<>
struct fmt::formatter<diagnostic> : ostream_formatter
{
};

/// Collects recoverable problems found by the lexer, the parser and the
/// interpreter. Every report is kept and, if a sink is set, echoed to it.
class diagnostics final
{
  public:
    explicit diagnostics(std::ostream* sink = nullptr);

    auto report(std::size_t line, std::string_view message) -> void;

    template<typename... T>
    auto report(std::size_t line, fmt::format_string<T...> fmt, T&&... args) -> void
    {
        report(line, std::string_view {fmt::format(fmt, std::forward<T>(args)...)});
    }

    [[nodiscard]] auto entries() const -> const std::vector<diagnostic>&;
    [[nodiscard]] auto empty() const -> bool;
    [[nodiscard]] auto count() const -> std::size_t;
    auto clear() -> void;

  private:
    std::ostream* m_sink {};
    std::vector<diagnostic> m_entries;
};
