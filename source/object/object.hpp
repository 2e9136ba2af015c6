#pragma once

#include <ostream>
#include <stdexcept>
#include <string>
#include <variant>

#include <fmt/ostream.h>

// helper type for std::visit
template<typename... T>
struct overloaded : T...
{
    using T::operator()...;
};
template<class... T>
overloaded(T...) -> overloaded<T...>;

using nil_type = std::monostate;
using number_value = double;
using string_value = std::string;

using value_type = std::variant<nil_type, bool, number_value, string_value>;

struct object
{
    template<typename T>
    [[nodiscard]] constexpr auto is() const -> bool
    {
        return std::holds_alternative<T>(value);
    }

    [[nodiscard]] constexpr auto is_nil() const -> bool { return is<nil_type>(); }

    template<typename T>
    [[nodiscard]] auto as() const -> const T&
    {
        if (!is<T>()) {
            throw std::invalid_argument("cannot convert " + type_name() + " to " + object {T {}}.type_name());
        }
        return std::get<T>(value);
    }

    [[nodiscard]] auto is_truthy() const -> bool;
    [[nodiscard]] auto type_name() const -> std::string;
    [[nodiscard]] auto inspect() const -> std::string;
    [[nodiscard]] auto string() const -> std::string;

    value_type value {};
};

auto operator==(const object& lhs, const object& rhs) -> bool;
auto operator<<(std::ostream& ostream, const object& obj) -> std::ostream&;

auto number_to_string(number_value number) -> std::string;

template<>
struct fmt::formatter<object> : ostream_formatter
{
};
