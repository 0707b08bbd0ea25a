#include <cmath>
#include <cstddef>
#include <ostream>
#include <string>
#include <variant>

#include "value.hpp"

#include <fmt/format.h>
#include <overloaded.hpp>

namespace
{
// shortest round-trip digits, always positional: 1e21 prints all its zeros
auto format_number(number_value val) -> std::string
{
    if (std::isnan(val)) {
        return "NaN";
    }
    auto text = fmt::format("{}", val);
    const auto exp_pos = text.find('e');
    if (exp_pos == std::string::npos) {
        return text;
    }
    const auto exponent = std::stoi(text.substr(exp_pos + 1));
    auto digits = text.substr(0, exp_pos);
    auto sign = std::string {};
    if (digits.front() == '-') {
        sign = "-";
        digits.erase(0, 1);
    }
    auto int_digits = digits.size();
    if (const auto dot = digits.find('.'); dot != std::string::npos) {
        int_digits = dot;
        digits.erase(dot, 1);
    }
    const auto point = static_cast<std::ptrdiff_t>(int_digits) + exponent;
    const auto size = static_cast<std::ptrdiff_t>(digits.size());
    if (point <= 0) {
        return sign + "0." + std::string(static_cast<std::size_t>(-point), '0') + digits;
    }
    if (point >= size) {
        return sign + digits + std::string(static_cast<std::size_t>(point - size), '0');
    }
    const auto split = static_cast<std::size_t>(point);
    return sign + digits.substr(0, split) + "." + digits.substr(split);
}
}  // namespace

auto value::is_truthy() const -> bool
{
    return std::visit(overloaded {[](const none_type& /*none*/) { return false; },
                                  [](const bool val) { return val; },
                                  [](const auto& /*other*/) { return true; }},
                      data);
}

auto value::type_name() const -> std::string
{
    return std::visit(overloaded {[](const none_type& /*none*/) { return "none"; },
                                  [](const bool /*val*/) { return "boolean"; },
                                  [](const number_value /*val*/) { return "number"; },
                                  [](const string_value& /*val*/) { return "string"; }},
                      data);
}

auto value::inspect() const -> std::string
{
    return std::visit(overloaded {[](const none_type& /*none*/) -> std::string { return "none"; },
                                  [](const bool val) -> std::string { return val ? "true" : "false"; },
                                  [](const number_value val) { return format_number(val); },
                                  [](const string_value& val) { return val; }},
                      data);
}

auto operator<<(std::ostream& ostrm, const value& val) -> std::ostream&
{
    if (val.is<string_value>()) {
        return ostrm << '"' << val.as<string_value>() << '"';
    }
    return ostrm << val.inspect();
}
