#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <lexer/location.hpp>

struct syntax_error final
{
    location loc;
    std::string message;

    [[nodiscard]] auto string() const -> std::string;
    auto operator==(const syntax_error& other) const -> bool = default;
};

auto operator<<(std::ostream& ostream, const syntax_error& err) -> std::ostream&;

enum class runtime_error_kind : std::uint8_t
{
    type_mismatch,
    division_by_zero,
    undefined_variable,
};

auto operator<<(std::ostream& ostream, runtime_error_kind kind) -> std::ostream&;

class runtime_error final : public std::runtime_error
{
  public:
    runtime_error(runtime_error_kind kind, location loc, const std::string& message);

    [[nodiscard]] auto kind() const -> runtime_error_kind { return m_kind; }
    [[nodiscard]] auto loc() const -> const location& { return m_loc; }
    [[nodiscard]] auto string() const -> std::string;

  private:
    runtime_error_kind m_kind;
    location m_loc;
};

auto operator<<(std::ostream& ostream, const runtime_error& err) -> std::ostream&;

template<typename... T>
auto make_runtime_error(runtime_error_kind kind, location loc, fmt::format_string<T...> fmt, T&&... args)
    -> runtime_error
{
    return {kind, loc, fmt::format(fmt, std::forward<T>(args)...)};
}

template<>
struct fmt::formatter<syntax_error> : ostream_formatter
{
};

template<>
struct fmt::formatter<runtime_error_kind> : ostream_formatter
{
};

template<>
struct fmt::formatter<runtime_error> : ostream_formatter
{
};
