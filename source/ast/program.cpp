#include <string>

#include "program.hpp"

#include "util.hpp"

auto program::string() const -> std::string
{
    return join(statements, "\n");
}
