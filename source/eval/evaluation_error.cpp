#include <ostream>
#include <string>
#include <utility>

#include "evaluation_error.hpp"

auto operator<<(std::ostream& ostream, evaluation_error_kind kind) -> std::ostream&
{
    using enum evaluation_error_kind;
    switch (kind) {
        case type_mismatch:
            return ostream << "type mismatch";
        case undefined_variable:
            return ostream << "undefined variable";
        case invalid_target:
            return ostream << "invalid target";
        case unknown_operator:
            return ostream << "unknown operator";
    }
    return ostream << "unknown evaluation_error_kind(" << static_cast<int>(kind) << ")";
}

evaluation_error::evaluation_error(evaluation_error_kind kind, token where, const std::string& message)
    : std::runtime_error {message}
    , kind {kind}
    , where {std::move(where)}
{
}
