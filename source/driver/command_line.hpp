#pragma once

#include <span>
#include <stdexcept>
#include <string_view>

struct command_line_args
{
    bool help {};
    bool debug {};
    std::string_view file;
};

// Invalid command line; the driver prints the usage and exits with 64.
class usage_error final : public std::invalid_argument
{
  public:
    using std::invalid_argument::invalid_argument;
};

// args excludes the program name
auto parse_command_line(std::span<const std::string_view> args) -> command_line_args;
