#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>

#include <eval/environment.hpp>
#include <fmt/ostream.h>

enum class run_status : std::uint8_t
{
    ok,
    syntax_error,
    runtime_error,
};

auto operator<<(std::ostream& ostream, run_status status) -> std::ostream&;

template<>
struct fmt::formatter<run_status> : ostream_formatter
{
};

struct session_options
{
    std::string_view filename {"<stdin>"};
    bool debug {};
};

// Runs source text against one global environment that persists between runs.
class session final
{
  public:
    session(std::ostream& out, std::ostream& err, session_options opts = {});

    auto run(std::string_view source) -> run_status;
    [[nodiscard]] auto globals() const -> const environment& { return m_globals; }

  private:
    environment m_globals;
    std::ostream& m_out;
    std::ostream& m_err;
    session_options m_opts;
};
