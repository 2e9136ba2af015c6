#pragma once

#include <utility>

#include <object/object.hpp>

#include "expression.hpp"

struct literal_expression final : expression
{
    literal_expression(object val, location loc)
        : expression {loc}
        , value {std::move(val)}
    {
    }

    [[nodiscard]] auto string() const -> std::string final;
    void accept(struct visitor& visitor) const final;

    object value;
};
