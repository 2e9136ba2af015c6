#include <string>

#include "grouping_expression.hpp"

#include <fmt/format.h>

#include "visitor.hpp"

auto grouping_expression::string() const -> std::string
{
    return fmt::format("(group {})", inner->string());
}

void grouping_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
