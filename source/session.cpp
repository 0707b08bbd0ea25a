#include <ostream>
#include <string_view>
#include <utility>

#include "session.hpp"

#include <diagnostics/diagnostics.hpp>
#include <eval/environment.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

session::session(std::ostream& out, diagnostics& diag, bool debug)
    : m_out {out}
    , m_diag {diag}
    , m_debug {debug}
    , m_interpreter {out, diag}
{
}

auto session::run(std::string_view source) -> void
{
    auto lxr = lexer {source, m_diag};
    auto tokens = lxr.scan();
    if (m_debug) {
        fmt::print(m_out, "Tokens:\n  {}\n", fmt::join(tokens, "\n  "));
    }
    auto prsr = parser {std::move(tokens), m_diag};
    const auto program = prsr.parse();
    if (m_debug) {
        fmt::print(m_out, "Statements:\n");
        for (const auto& stmt : program) {
            fmt::print(m_out, "  {}\n", stmt->string());
        }
    }
    m_interpreter.interpret(program);
}

auto session::globals() const -> const environment&
{
    return m_interpreter.globals();
}
