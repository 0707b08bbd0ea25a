#pragma once

#include <cstddef>
#include <initializer_list>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <ast/expression.hpp>
#include <ast/statements.hpp>
#include <diagnostics/diagnostics.hpp>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>

struct parse_error final : std::runtime_error
{
    parse_error(token where, const std::string& message);

    token where;
};

/// Recursive descent parser. Errors are reported to the diagnostics and the
/// offending statement is replaced by a no-op, so parse() always returns the
/// whole program.
class parser final
{
  public:
    parser(std::vector<token> tokens, diagnostics& diag);
    auto parse() -> statements;

  private:
    using operand_parser = auto (parser::*)() -> expression_ptr;

    auto parse_declaration() -> statement_ptr;
    auto parse_var_declaration() -> statement_ptr;
    auto parse_statement() -> statement_ptr;
    auto parse_print_statement() -> statement_ptr;
    auto parse_block_statement() -> statement_ptr;
    auto parse_if_statement() -> statement_ptr;
    auto parse_while_statement() -> statement_ptr;
    auto parse_expression_statement() -> statement_ptr;
    auto parse_block() -> statements;

    auto parse_expression() -> expression_ptr;
    auto parse_assignment() -> expression_ptr;
    auto parse_logical() -> expression_ptr;
    auto parse_equality() -> expression_ptr;
    auto parse_comparison() -> expression_ptr;
    auto parse_term() -> expression_ptr;
    auto parse_factor() -> expression_ptr;
    auto parse_unary() -> expression_ptr;
    auto parse_postfix() -> expression_ptr;
    auto parse_primary() -> expression_ptr;
    auto parse_binary(operand_parser operand, std::initializer_list<token_type> types) -> expression_ptr;

    auto consume_if(token_type type, std::string_view message) -> const token&;
    auto match(std::initializer_list<token_type> types) -> bool;
    [[nodiscard]] auto check(token_type type) const -> bool;
    [[nodiscard]] auto at_end() const -> bool;
    [[nodiscard]] auto peek() const -> const token&;
    [[nodiscard]] auto peek_next() const -> const token&;
    [[nodiscard]] auto previous() const -> const token&;
    auto advance() -> const token&;
    auto synchronize() -> void;
    auto descend(std::string_view message) -> void;
    auto error(const token& where, std::string_view message) -> parse_error;

    std::vector<token> m_tokens;
    std::size_t m_current {0};
    std::size_t m_depth {0};
    diagnostics& m_diag;
};
