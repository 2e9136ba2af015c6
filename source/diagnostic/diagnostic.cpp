#include <ostream>
#include <stdexcept>
#include <string>

#include "diagnostic.hpp"

#include <fmt/format.h>

auto syntax_error::string() const -> std::string
{
    return fmt::format("[line {}] Error: {}", loc.line, message);
}

auto operator<<(std::ostream& ostream, const syntax_error& err) -> std::ostream&
{
    return ostream << err.string();
}

auto operator<<(std::ostream& ostream, runtime_error_kind kind) -> std::ostream&
{
    using enum runtime_error_kind;
    switch (kind) {
        case type_mismatch:
            return ostream << "type mismatch";
        case division_by_zero:
            return ostream << "division by zero";
        case undefined_variable:
            return ostream << "undefined variable";
    }
    throw std::invalid_argument("invalid runtime_error_kind");
}

runtime_error::runtime_error(runtime_error_kind kind, location loc, const std::string& message)
    : std::runtime_error {message}
    , m_kind {kind}
    , m_loc {loc}
{
}

auto runtime_error::string() const -> std::string
{
    return fmt::format("[line {}] Runtime Error: {}", m_loc.line, what());
}

auto operator<<(std::ostream& ostream, const runtime_error& err) -> std::ostream&
{
    return ostream << err.string();
}
