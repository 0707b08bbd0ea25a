#pragma once

#include <ostream>
#include <string_view>

#include <diagnostics/diagnostics.hpp>
#include <eval/environment.hpp>
#include <eval/interpreter.hpp>

/// Runs source text through lexer, parser and interpreter. Global bindings
/// survive between calls to run().
class session final
{
  public:
    session(std::ostream& out, diagnostics& diag, bool debug = false);

    auto run(std::string_view source) -> void;

    [[nodiscard]] auto globals() const -> const environment&;

  private:
    std::ostream& m_out;
    diagnostics& m_diag;
    bool m_debug {};
    interpreter m_interpreter;
};
