#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

#include <fmt/ostream.h>
#include <lexer/token.hpp>

enum class evaluation_error_kind : std::uint8_t
{
    type_mismatch,
    undefined_variable,
    invalid_target,
    unknown_operator,
};

auto operator<<(std::ostream& ostream, evaluation_error_kind kind) -> std::ostream&;

template<>
struct fmt::formatter<evaluation_error_kind> : ostream_formatter
{
};

/// Raised while executing a statement; aborts the current top level statement only.
struct evaluation_error final : std::runtime_error
{
    evaluation_error(evaluation_error_kind kind, token where, const std::string& message);

    evaluation_error_kind kind;
    token where;
};
