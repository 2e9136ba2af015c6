#include <string>

#include "literal_expression.hpp"

#include "visitor.hpp"

auto literal_expression::string() const -> std::string
{
    return value.string();
}

void literal_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
