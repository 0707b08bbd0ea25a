#pragma once

#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

#include <diagnostics/diagnostics.hpp>
#include <value/value.hpp>

#include "token.hpp"
#include "token_type.hpp"

class lexer final
{
  public:
    lexer(std::string_view input, diagnostics& diag);

    /// Scans the whole input. Malformed literals are reported and dropped, the
    /// result always ends with one statement_end followed by one eof.
    auto scan() -> std::vector<token>;

  private:
    auto scan_token() -> void;
    auto at_end() const -> bool;
    auto read_char() -> char;
    auto peek_char() const -> char;
    auto peek_next_char() const -> char;
    auto read_newline() -> void;
    auto skip_comment() -> void;
    auto read_dollar() -> void;
    auto read_string() -> void;
    auto read_number() -> void;
    auto read_identifier_or_keyword() -> void;
    auto add_token(token_type type, std::optional<value> literal = std::nullopt) -> void;

    std::string_view m_input;
    diagnostics& m_diag;
    std::vector<token> m_tokens;
    std::string_view::size_type m_start {0};
    std::string_view::size_type m_current {0};
    std::size_t m_line {1};
    std::size_t m_start_line {1};
    std::size_t m_bracket_depth {0};
};
