#pragma once

#include <memory>
#include <string>

#include "statements.hpp"

struct program final
{
    [[nodiscard]] auto string() const -> std::string;

    ::statements statements;
};

using program_ptr = std::unique_ptr<program>;
