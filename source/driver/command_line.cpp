#include <span>
#include <string_view>

#include "command_line.hpp"

#include <fmt/format.h>

auto parse_command_line(std::span<const std::string_view> args) -> command_line_args
{
    command_line_args opts {};
    for (const auto arg : args) {
        if (arg.empty()) {
            throw usage_error("empty argument");
        }
        if (arg[0] == '-') {
            if (arg.size() != 2) {
                throw usage_error(fmt::format("invalid option {}", arg));
            }
            switch (arg[1]) {
                case 'h':
                    opts.help = true;
                    break;
                case 'd':
                    opts.debug = true;
                    break;
                default:
                    throw usage_error(fmt::format("invalid option {}", arg));
            }
        } else if (opts.file.empty()) {
            opts.file = arg;
        } else {
            throw usage_error(fmt::format("unexpected argument {}, only one file can be run", arg));
        }
    }
    return opts;
}
