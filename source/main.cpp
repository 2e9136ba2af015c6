#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <driver/command_line.hpp>
#include <fmt/format.h>
#include <fmt/ostream.h>
#include <session/session.hpp>

namespace
{
constexpr auto prompt = "> ";

// sysexits.h
constexpr auto exit_usage = 64;
constexpr auto exit_data_error = 65;
constexpr auto exit_no_input = 66;
constexpr auto exit_software = 70;

[[noreturn]] auto show_usage(std::string_view program, std::string_view error_msg = {})
{
    auto exit_code = EXIT_SUCCESS;
    if (!error_msg.empty()) {
        fmt::print(std::cerr, "Error: {}\n", error_msg);
        exit_code = exit_usage;
    }
    fmt::print("Usage: {} [-d] [-h] [<file>]\n\n", program);
    fmt::print("  -d  dump the parsed program and the global variables\n");
    fmt::print("  -h  show this help\n");
    // NOLINTBEGIN(concurrency-mt-unsafe)
    exit(exit_code);
    // NOLINTEND(concurrency-mt-unsafe)
}

auto run_file(const command_line_args& opts) -> int
{
    std::ifstream ifs(std::string {opts.file});
    if (!ifs) {
        fmt::print(std::cerr, "ERROR: could not open file: {}\n", opts.file);
        return exit_no_input;
    }
    const std::string contents {(std::istreambuf_iterator<char>(ifs)), (std::istreambuf_iterator<char>())};
    auto sess = session {std::cout, std::cerr, {.filename = opts.file, .debug = opts.debug}};
    const auto status = sess.run(contents);
    if (opts.debug) {
        sess.globals().debug(std::cerr);
    }
    switch (status) {
        case run_status::ok:
            return EXIT_SUCCESS;
        case run_status::syntax_error:
            return exit_data_error;
        case run_status::runtime_error:
            return exit_software;
    }
    return exit_software;
}

auto run_repl(const command_line_args& opts) -> int
{
    auto sess = session {std::cout, std::cerr, {.debug = opts.debug}};
    auto show_prompt = []() { std::cout << prompt << std::flush; };
    auto input = std::string {};
    show_prompt();
    while (getline(std::cin, input)) {
        // diagnostics are already on stderr, the prompt keeps going either way
        sess.run(input);
        show_prompt();
    }
    std::cout << '\n';
    return EXIT_SUCCESS;
}
}  // namespace

auto main(int argc, char** argv) -> int
{
    const auto argv_span = std::span(argv, static_cast<std::size_t>(argc));
    const std::vector<std::string_view> args(argv_span.begin() + 1, argv_span.end());
    command_line_args opts {};
    try {
        opts = parse_command_line(args);
    } catch (const usage_error& err) {
        show_usage(argv[0], err.what());
    }
    if (opts.help) {
        show_usage(argv[0]);
    }
    if (!opts.file.empty()) {
        return run_file(opts);
    }
    return run_repl(opts);
}
