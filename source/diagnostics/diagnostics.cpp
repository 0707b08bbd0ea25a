#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "diagnostics.hpp"

#include <fmt/ostream.h>

auto operator<<(std::ostream& ostream, const diagnostic& diag) -> std::ostream&
{
    return ostream << diag.message << " at line " << diag.line;
}

diagnostics::diagnostics(std::ostream* sink)
    : m_sink {sink}
{
}

auto diagnostics::report(std::size_t line, std::string_view message) -> void
{
    m_entries.push_back(diagnostic {.line = line, .message = std::string {message}});
    if (m_sink != nullptr) {
        fmt::print(*m_sink, "{}\n", m_entries.back());
    }
}

auto diagnostics::entries() const -> const std::vector<diagnostic>&
{
    return m_entries;
}

auto diagnostics::empty() const -> bool
{
    return m_entries.empty();
}

auto diagnostics::count() const -> std::size_t
{
    return m_entries.size();
}

auto diagnostics::clear() -> void
{
    m_entries.clear();
}
