#include <cmath>
#include <ostream>
#include <string>

#include "object.hpp"

#include <fmt/format.h>

namespace
{
// largest magnitude still printed in fixed notation without a fraction
constexpr auto max_fixed_integral = 1e15;
}  // namespace

auto number_to_string(number_value number) -> std::string
{
    if (std::isfinite(number) && std::trunc(number) == number && std::fabs(number) < max_fixed_integral) {
        return fmt::format("{:.0f}", number);
    }
    return fmt::format("{}", number);
}

auto object::is_truthy() const -> bool
{
    return std::visit(overloaded {
                          [](const nil_type) { return false; },
                          [](const bool val) { return val; },
                          [](const number_value val) { return val != 0.0; },
                          [](const string_value&) { return true; },
                      },
                      value);
}

auto object::type_name() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type) { return "nil"; },
                          [](const bool) { return "bool"; },
                          [](const number_value) { return "number"; },
                          [](const string_value&) { return "string"; },
                      },
                      value);
}

auto object::inspect() const -> std::string
{
    return std::visit(overloaded {
                          [](const nil_type) -> std::string { return "nil"; },
                          [](const bool val) -> std::string { return val ? "true" : "false"; },
                          [](const number_value val) -> std::string { return number_to_string(val); },
                          [](const string_value& val) -> std::string { return val; },
                      },
                      value);
}

auto object::string() const -> std::string
{
    if (is<string_value>()) {
        return fmt::format("\"{}\"", as<string_value>());
    }
    return inspect();
}

auto operator==(const object& lhs, const object& rhs) -> bool
{
    return std::visit(overloaded {
                          [](const nil_type, const nil_type) { return true; },
                          [](const bool val1, const bool val2) { return val1 == val2; },
                          [](const number_value val1, const number_value val2) { return val1 == val2; },
                          [](const string_value& val1, const string_value& val2) { return val1 == val2; },
                          [](const auto&, const auto&) { return false; },
                      },
                      lhs.value,
                      rhs.value);
}

auto operator<<(std::ostream& ostream, const object& obj) -> std::ostream&
{
    return ostream << obj.string();
}
