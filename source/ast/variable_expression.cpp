#include <string>

#include "variable_expression.hpp"

#include "visitor.hpp"

auto variable_expression::string() const -> std::string
{
    return name;
}

void variable_expression::accept(visitor& visitor) const
{
    visitor.visit(*this);
}
