#include <ostream>
#include <stdexcept>
#include <string_view>

#include "session.hpp"

#include <ast/program.hpp>
#include <eval/interpreter.hpp>
#include <fmt/ostream.h>
#include <lexer/lexer.hpp>
#include <parser/parser.hpp>

auto operator<<(std::ostream& ostream, run_status status) -> std::ostream&
{
    using enum run_status;
    switch (status) {
        case ok:
            return ostream << "ok";
        case syntax_error:
            return ostream << "syntax error";
        case runtime_error:
            return ostream << "runtime error";
    }
    throw std::invalid_argument("invalid run_status");
}

session::session(std::ostream& out, std::ostream& err, session_options opts)
    : m_out {out}
    , m_err {err}
    , m_opts {opts}
{
}

auto session::run(std::string_view source) -> run_status
{
    auto prsr = parser {lexer {source, m_opts.filename}};
    const auto prgrm = prsr.parse_program();
    if (!prsr.errors().empty()) {
        for (const auto& error : prsr.errors()) {
            fmt::print(m_err, "{}\n", error);
        }
        return run_status::syntax_error;
    }
    if (m_opts.debug) {
        fmt::print(m_err, "{}\n", prgrm->string());
    }
    auto intrprtr = interpreter {m_globals, m_out};
    if (const auto error = intrprtr.run(*prgrm); error.has_value()) {
        fmt::print(m_err, "{}\n", *error);
        return run_status::runtime_error;
    }
    return run_status::ok;
}
