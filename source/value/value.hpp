#pragma once

#include <ostream>
#include <string>
#include <variant>

#include <fmt/ostream.h>

struct none_type
{
    auto operator==(const none_type& /*other*/) const -> bool = default;
};

using number_value = double;
using string_value = std::string;
using value_type = std::variant<none_type, bool, number_value, string_value>;

struct value final
{
    template<typename T>
    [[nodiscard]] constexpr auto is() const -> bool
    {
        return std::holds_alternative<T>(data);
    }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        return std::get<T>(data);
    }

    [[nodiscard]] constexpr auto is_none() const -> bool { return is<none_type>(); }

    [[nodiscard]] auto is_truthy() const -> bool;
    [[nodiscard]] auto type_name() const -> std::string;

    // canonical rendering used by print and string concatenation
    [[nodiscard]] auto inspect() const -> std::string;

    auto operator==(const value& other) const -> bool = default;

    value_type data {};
};

auto operator<<(std::ostream& ostrm, const value& val) -> std::ostream&;

template<>
struct fmt::formatter<value> : ostream_formatter
{
};
