#include <algorithm>
#include <array>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "lexer.hpp"

#include <diagnostics/diagnostics.hpp>
#include <value/value.hpp>

#include "token.hpp"
#include "token_type.hpp"

using char_literal_lookup_table =
    std::array<std::optional<token_type>, std::numeric_limits<unsigned char>::max() + std::size_t {1}>;

namespace
{
constexpr auto build_char_to_token_type_map() -> char_literal_lookup_table
{
    auto arr = char_literal_lookup_table {};
    using enum token_type;
    arr['('] = std::optional {lparen};
    arr[')'] = std::optional {rparen};
    arr['['] = std::optional {lbracket};
    arr[']'] = std::optional {rbracket};
    arr['{'] = std::optional {lsquirly};
    arr['}'] = std::optional {rsquirly};
    arr['.'] = std::optional {dot};
    arr[','] = std::optional {comma};
    arr['='] = std::optional {assign};
    arr['<'] = std::optional {less_than};
    arr['>'] = std::optional {greater_than};
    arr['+'] = std::optional {plus};
    arr['-'] = std::optional {minus};
    arr['*'] = std::optional {asterisk};
    arr['/'] = std::optional {slash};
    return arr;
}

constexpr auto char_literal_tokens = build_char_to_token_type_map();
constexpr auto keyword_count = 18;
using keyword_pair = std::pair<std::string_view, token_type>;
using keyword_lookup_table = std::array<keyword_pair, keyword_count>;

constexpr auto build_keyword_to_token_type_map() -> keyword_lookup_table
{
    return {
        std::pair {"and", token_type::logical_and},
        std::pair {"class", token_type::klass},
        std::pair {"else", token_type::elze},
        std::pair {"end", token_type::end},
        std::pair {"false", token_type::fals},
        std::pair {"for", token_type::phor},
        std::pair {"if", token_type::eef},
        std::pair {"is", token_type::is},
        std::pair {"none", token_type::none},
        std::pair {"not", token_type::logical_not},
        std::pair {"offering", token_type::offering},
        std::pair {"or", token_type::logical_or},
        std::pair {"return", token_type::ret},
        std::pair {"ritual", token_type::ritual},
        std::pair {"super", token_type::super},
        std::pair {"this", token_type::self},
        std::pair {"true", token_type::tru},
        std::pair {"while", token_type::hwile},
    };
}

constexpr auto keyword_tokens = build_keyword_to_token_type_map();

using token_pair = std::pair<token_type, token_type>;

struct token_pair_hash
{
    auto operator()(const token_pair& pair) const -> size_t
    {
        return static_cast<uint8_t>(pair.first) ^ static_cast<size_t>(static_cast<size_t>(pair.second) << 8U);
    }
};

using two_token_lookup = std::unordered_map<token_pair, token_type, token_pair_hash>;

auto build_two_token_lookup() -> two_token_lookup
{
    using enum token_type;
    return {
        {{less_than, assign}, less_equal},
        {{greater_than, assign}, greater_equal},
        {{plus, plus}, plus_plus},
        {{minus, minus}, minus_minus},
        {{plus, assign}, plus_assign},
        {{minus, assign}, minus_assign},
    };
}

// kinds after which a newline terminates the statement
auto can_end_statement(token_type type) -> bool
{
    using enum token_type;
    switch (type) {
        case rsquirly:
        case rparen:
        case rbracket:
        case tru:
        case fals:
        case number:
        case string:
        case none:
        case end:
        case ident:
            return true;
        default:
            return false;
    }
}

inline auto is_letter(char chr) -> bool
{
    return std::isalpha(static_cast<unsigned char>(chr)) != 0 || chr == '_';
}

inline auto is_digit(char chr) -> bool
{
    return std::isdigit(static_cast<unsigned char>(chr)) != 0;
}

inline auto is_letter_or_digit(char chr) -> bool
{
    return is_letter(chr) || is_digit(chr);
}

}  // namespace

lexer::lexer(std::string_view input, diagnostics& diag)
    : m_input {input}
    , m_diag {diag}
{
}

auto lexer::scan() -> std::vector<token>
{
    while (!at_end()) {
        m_start = m_current;
        m_start_line = m_line;
        scan_token();
    }
    if (m_tokens.empty() || m_tokens.back().type != token_type::statement_end) {
        m_tokens.push_back(token {.type = token_type::statement_end, .lexeme = "", .line = m_line});
    }
    m_tokens.push_back(token {.type = token_type::eof, .lexeme = "", .line = m_line});
    return std::move(m_tokens);
}

auto lexer::scan_token() -> void
{
    using enum token_type;
    const auto chr = read_char();
    if (const auto char_token_type = char_literal_tokens[static_cast<unsigned char>(chr)]) {
        const static auto two_token = build_two_token_lookup();
        if (const auto peek_token_type = char_literal_tokens[static_cast<unsigned char>(peek_char())]) {
            if (const auto itr = two_token.find({*char_token_type, *peek_token_type}); itr != two_token.end()) {
                read_char();
                add_token(itr->second);
                return;
            }
        }
        if (*char_token_type == lparen || *char_token_type == lbracket) {
            m_bracket_depth++;
        } else if ((*char_token_type == rparen || *char_token_type == rbracket) && m_bracket_depth > 0) {
            m_bracket_depth--;
        }
        add_token(*char_token_type);
        return;
    }
    switch (chr) {
        case ' ':
        case '\r':
        case '\t':
            return;
        case '\n':
            read_newline();
            return;
        case '?':
            skip_comment();
            return;
        case '$':
            read_dollar();
            return;
        case '"':
            read_string();
            return;
        default:
            break;
    }
    if (is_digit(chr)) {
        read_number();
        return;
    }
    if (is_letter(chr)) {
        read_identifier_or_keyword();
        return;
    }
    m_diag.report(m_start_line, "Unexpected character '{}'.", chr);
}

auto lexer::at_end() const -> bool
{
    return m_current >= m_input.size();
}

auto lexer::read_char() -> char
{
    const auto chr = m_input[m_current];
    m_current++;
    if (chr == '\n') {
        m_line++;
    }
    return chr;
}

auto lexer::peek_char() const -> char
{
    if (at_end()) {
        return '\0';
    }
    return m_input[m_current];
}

auto lexer::peek_next_char() const -> char
{
    if (m_current + 1 >= m_input.size()) {
        return '\0';
    }
    return m_input[m_current + 1];
}

auto lexer::read_newline() -> void
{
    if (m_bracket_depth > 0 || m_tokens.empty()) {
        return;
    }
    if (can_end_statement(m_tokens.back().type)) {
        add_token(token_type::statement_end);
    }
}

auto lexer::skip_comment() -> void
{
    while (peek_char() != '\n' && !at_end()) {
        read_char();
    }
}

auto lexer::read_dollar() -> void
{
    if (peek_char() == '<') {
        read_char();
        add_token(token_type::print);
        return;
    }
    if (peek_char() == '>') {
        read_char();
        add_token(token_type::dollar_greater);
        return;
    }
    m_diag.report(m_start_line, "Unexpected character '$'.");
}

auto lexer::read_string() -> void
{
    while (peek_char() != '"' && !at_end()) {
        read_char();
    }
    if (at_end()) {
        m_diag.report(m_start_line, "Unterminated string.");
        return;
    }
    read_char();
    const auto count = m_current - m_start - 2;
    add_token(token_type::string, value {string_value {m_input.substr(m_start + 1, count)}});
}

auto lexer::read_number() -> void
{
    while (is_digit(peek_char())) {
        read_char();
    }
    if (peek_char() == '.' && is_digit(peek_next_char())) {
        read_char();
        while (is_digit(peek_char())) {
            read_char();
        }
    }
    const auto text = std::string {m_input.substr(m_start, m_current - m_start)};
    // out of range literals saturate to inf or underflow towards zero
    add_token(token_type::number, value {std::strtod(text.c_str(), nullptr)});
}

auto lexer::read_identifier_or_keyword() -> void
{
    while (is_letter_or_digit(peek_char())) {
        read_char();
    }
    const auto identifier_or_keyword = m_input.substr(m_start, m_current - m_start);
    // NOLINTBEGIN(*-qualified-auto)
    const auto itr =
        std::find_if(keyword_tokens.cbegin(),
                     keyword_tokens.cend(),
                     [&identifier_or_keyword](auto pair) -> bool { return pair.first == identifier_or_keyword; });
    // NOLINTEND(*-qualified-auto)
    add_token(itr != keyword_tokens.cend() ? itr->second : token_type::ident);
}

auto lexer::add_token(token_type type, std::optional<value> literal) -> void
{
    m_tokens.push_back(token {
        .type = type,
        .lexeme = std::string {m_input.substr(m_start, m_current - m_start)},
        .literal = std::move(literal),
        .line = m_start_line,
    });
}
