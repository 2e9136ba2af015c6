#pragma once

#include <string>

#include "expression.hpp"

struct assign_expression final : expression
{
    using expression::expression;
    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    std::string name;
    expression_ptr value;
};
