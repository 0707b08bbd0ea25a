#include <algorithm>
#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "parser.hpp"

#include <ast/assign_expression.hpp>
#include <ast/binary_expression.hpp>
#include <ast/expression.hpp>
#include <ast/grouping_expression.hpp>
#include <ast/literal.hpp>
#include <ast/logical_expression.hpp>
#include <ast/postfix_expression.hpp>
#include <ast/statements.hpp>
#include <ast/unary_expression.hpp>
#include <ast/variable.hpp>
#include <diagnostics/diagnostics.hpp>
#include <fmt/format.h>
#include <lexer/token.hpp>
#include <lexer/token_type.hpp>
#include <value/value.hpp>

namespace
{
constexpr auto max_nesting_depth = std::size_t {256};
constexpr auto expression_too_deep = std::string_view {"Expression nested too deeply."};

// restores the nesting depth when a parse function returns or throws
class depth_scope final
{
  public:
    explicit depth_scope(std::size_t& depth)
        : m_depth {depth}
        , m_saved {depth}
    {
    }

    depth_scope(const depth_scope&) = delete;
    depth_scope(depth_scope&&) = delete;
    auto operator=(const depth_scope&) -> depth_scope& = delete;
    auto operator=(depth_scope&&) -> depth_scope& = delete;

    ~depth_scope() { m_depth = m_saved; }

  private:
    std::size_t& m_depth;
    std::size_t m_saved;
};

// keywords which are lexed but have no statement form yet
auto is_reserved(token_type type) -> bool
{
    using enum token_type;
    switch (type) {
        case ritual:
        case klass:
        case self:
        case super:
        case ret:
        case end:
        case phor:
        case dollar_greater:
            return true;
        default:
            return false;
    }
}

auto make_no_op() -> statement_ptr
{
    return std::make_unique<expression_statement>(std::make_unique<literal>(value {}));
}

}  // namespace

parse_error::parse_error(token where, const std::string& message)
    : std::runtime_error {message}
    , where {std::move(where)}
{
}

parser::parser(std::vector<token> tokens, diagnostics& diag)
    : m_tokens {std::move(tokens)}
    , m_diag {diag}
{
    if (m_tokens.empty() || m_tokens.back().type != token_type::eof) {
        const auto line = m_tokens.empty() ? std::size_t {1} : m_tokens.back().line;
        m_tokens.push_back(token {.type = token_type::statement_end, .lexeme = "", .line = line});
        m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .line = line});
    }
}

auto parser::parse() -> statements
{
    statements stmts;
    while (!at_end()) {
        if (match({token_type::statement_end})) {
            continue;
        }
        stmts.push_back(parse_declaration());
    }
    return stmts;
}

auto parser::parse_declaration() -> statement_ptr
{
    try {
        if (match({token_type::offering})) {
            return parse_var_declaration();
        }
        return parse_statement();
    } catch (const parse_error&) {
        // already reported where it was raised
        synchronize();
        return make_no_op();
    }
}

auto parser::parse_var_declaration() -> statement_ptr
{
    using enum token_type;
    auto name = consume_if(ident, "Expected variable name.");
    expression_ptr initializer;
    if (match({assign})) {
        initializer = parse_expression();
    }
    consume_if(statement_end, "Expected statement end after variable declaration.");
    return std::make_unique<var_statement>(std::move(name), std::move(initializer));
}

auto parser::parse_statement() -> statement_ptr
{
    using enum token_type;
    if (match({print})) {
        return parse_print_statement();
    }
    if (match({lsquirly})) {
        return parse_block_statement();
    }
    if (match({eef})) {
        return parse_if_statement();
    }
    if (match({hwile})) {
        return parse_while_statement();
    }
    if (is_reserved(peek().type)) {
        throw error(peek(), fmt::format("'{}' is reserved and not supported.", peek().lexeme));
    }
    return parse_expression_statement();
}

auto parser::parse_print_statement() -> statement_ptr
{
    auto expr = parse_expression();
    consume_if(token_type::statement_end, "Expected statement end after expression.");
    return std::make_unique<print_statement>(std::move(expr));
}

auto parser::parse_block_statement() -> statement_ptr
{
    auto body = parse_block();
    consume_if(token_type::statement_end, "Expected statement end after block.");
    return std::make_unique<block_statement>(std::move(body));
}

auto parser::parse_if_statement() -> statement_ptr
{
    using enum token_type;
    auto condition = parse_expression();
    consume_if(lsquirly, "Expected '{' after if condition.");
    auto consequence = std::make_unique<block_statement>(parse_block());
    block_ptr alternative;
    // `}` and `else` may be split by a line break
    if (check(statement_end) && peek_next().type == elze) {
        advance();
    }
    if (match({elze})) {
        consume_if(lsquirly, "Expected '{' after else.");
        alternative = std::make_unique<block_statement>(parse_block());
    }
    consume_if(statement_end, "Expected statement end after if statement.");
    return std::make_unique<if_statement>(std::move(condition), std::move(consequence), std::move(alternative));
}

auto parser::parse_while_statement() -> statement_ptr
{
    using enum token_type;
    auto condition = parse_expression();
    consume_if(lsquirly, "Expected '{' after while condition.");
    auto body = std::make_unique<block_statement>(parse_block());
    consume_if(statement_end, "Expected statement end after while statement.");
    return std::make_unique<while_statement>(std::move(condition), std::move(body));
}

auto parser::parse_expression_statement() -> statement_ptr
{
    auto expr = parse_expression();
    consume_if(token_type::statement_end, "Expected statement end after expression.");
    return std::make_unique<expression_statement>(std::move(expr));
}

auto parser::parse_block() -> statements
{
    using enum token_type;
    const auto scope = depth_scope {m_depth};
    descend("Block nested too deeply.");
    statements body;
    while (!check(rsquirly) && !at_end()) {
        if (match({statement_end})) {
            continue;
        }
        body.push_back(parse_declaration());
    }
    consume_if(rsquirly, "Expected '}' after block.");
    return body;
}

auto parser::parse_expression() -> expression_ptr
{
    return parse_assignment();
}

auto parser::parse_assignment() -> expression_ptr
{
    using enum token_type;
    const auto scope = depth_scope {m_depth};
    auto expr = parse_logical();
    if (match({assign, plus_assign, minus_assign})) {
        auto oprtr = previous();
        descend(expression_too_deep);
        auto val = parse_assignment();
        if (const auto* var = dynamic_cast<const variable*>(expr.get()); var != nullptr) {
            return std::make_unique<assign_expression>(var->name, std::move(oprtr), std::move(val));
        }
        // not fatal, keep parsing with the left hand side
        m_diag.report(oprtr.line, "Invalid assignment target.");
    }
    return expr;
}

auto parser::parse_logical() -> expression_ptr
{
    using enum token_type;
    const auto scope = depth_scope {m_depth};
    auto expr = parse_equality();
    while (match({logical_and, logical_or})) {
        auto oprtr = previous();
        descend(expression_too_deep);
        auto right = parse_equality();
        expr = std::make_unique<logical_expression>(std::move(expr), std::move(oprtr), std::move(right));
    }
    return expr;
}

auto parser::parse_equality() -> expression_ptr
{
    return parse_binary(&parser::parse_comparison, {token_type::is, token_type::logical_not});
}

auto parser::parse_comparison() -> expression_ptr
{
    using enum token_type;
    return parse_binary(&parser::parse_term, {greater_than, greater_equal, less_than, less_equal});
}

auto parser::parse_term() -> expression_ptr
{
    return parse_binary(&parser::parse_factor, {token_type::minus, token_type::plus});
}

auto parser::parse_factor() -> expression_ptr
{
    return parse_binary(&parser::parse_unary, {token_type::slash, token_type::asterisk});
}

auto parser::parse_binary(operand_parser operand, std::initializer_list<token_type> types) -> expression_ptr
{
    const auto scope = depth_scope {m_depth};
    auto expr = (this->*operand)();
    while (match(types)) {
        auto oprtr = previous();
        // every fold deepens the left operand
        descend(expression_too_deep);
        auto right = (this->*operand)();
        expr = std::make_unique<binary_expression>(std::move(expr), std::move(oprtr), std::move(right));
    }
    return expr;
}

auto parser::parse_unary() -> expression_ptr
{
    const auto scope = depth_scope {m_depth};
    if (match({token_type::logical_not, token_type::minus})) {
        auto oprtr = previous();
        descend(expression_too_deep);
        auto right = parse_unary();
        return std::make_unique<unary_expression>(std::move(oprtr), std::move(right));
    }
    return parse_postfix();
}

auto parser::parse_postfix() -> expression_ptr
{
    const auto scope = depth_scope {m_depth};
    auto expr = parse_primary();
    while (match({token_type::plus_plus, token_type::minus_minus})) {
        descend(expression_too_deep);
        expr = std::make_unique<postfix_expression>(std::move(expr), previous());
    }
    return expr;
}

auto parser::parse_primary() -> expression_ptr
{
    using enum token_type;
    if (match({fals})) {
        return std::make_unique<literal>(value {false});
    }
    if (match({tru})) {
        return std::make_unique<literal>(value {true});
    }
    if (match({none})) {
        return std::make_unique<literal>(value {});
    }
    if (match({number, string})) {
        return std::make_unique<literal>(previous().literal.value_or(value {}));
    }
    if (match({ident})) {
        return std::make_unique<variable>(previous());
    }
    if (match({lparen})) {
        const auto scope = depth_scope {m_depth};
        descend(expression_too_deep);
        auto expr = parse_expression();
        consume_if(rparen, "Expected ')' after expression.");
        return std::make_unique<grouping_expression>(std::move(expr));
    }
    throw error(peek(), "Expected an expression.");
}

auto parser::consume_if(token_type type, std::string_view message) -> const token&
{
    if (check(type)) {
        return advance();
    }
    throw error(peek(), message);
}

auto parser::match(std::initializer_list<token_type> types) -> bool
{
    if (std::any_of(types.begin(), types.end(), [this](token_type type) { return check(type); })) {
        advance();
        return true;
    }
    return false;
}

auto parser::check(token_type type) const -> bool
{
    if (at_end()) {
        return false;
    }
    return peek().type == type;
}

auto parser::at_end() const -> bool
{
    return peek().type == token_type::eof;
}

auto parser::peek() const -> const token&
{
    return m_tokens[m_current];
}

auto parser::peek_next() const -> const token&
{
    return m_tokens[std::min(m_current + 1, m_tokens.size() - 1)];
}

auto parser::previous() const -> const token&
{
    return m_tokens[m_current - 1];
}

auto parser::advance() -> const token&
{
    if (!at_end()) {
        m_current++;
    }
    return previous();
}

auto parser::synchronize() -> void
{
    while (!at_end()) {
        if (advance().type == token_type::statement_end) {
            return;
        }
    }
}

auto parser::descend(std::string_view message) -> void
{
    if (++m_depth > max_nesting_depth) {
        throw error(peek(), message);
    }
}

auto parser::error(const token& where, std::string_view message) -> parse_error
{
    m_diag.report(where.line, message);
    return parse_error {where, std::string {message}};
}
