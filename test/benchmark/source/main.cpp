#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <iostream>
#include <span>
#include <sstream>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <session/session.hpp>

auto main(int argc, char* argv[]) -> int
{
    const char* input = R"(
var a = 0;
var b = 1;
var sum = 0;
for (var i = 0; i < 200000; i = i + 1) {
  var t = a + b;
  a = b;
  b = t;
  if (b > 1000000) {
    a = 0;
    b = 1;
  }
  sum = sum + (i / 2 - i * 3) + b;
}
var text = "";
var n = 0;
while (n < 2000 and text != nil) {
  text = text + "x";
  n = n + 1;
}
print sum;
print n;
    )";

    auto quiet = false;
    for (const std::string_view arg : std::span(++argv, static_cast<std::size_t>(argc - 1))) {
        if (arg == "--quiet") {
            quiet = true;
        }
    }

    std::ostringstream out;
    auto sess = session {out, std::cerr};
    const auto start = std::chrono::steady_clock::now();
    const auto status = sess.run(input);
    const auto end = std::chrono::steady_clock::now();
    const std::chrono::duration<double> duration = end - start;

    if (!quiet) {
        fmt::print("{}", out.str());
    }
    fmt::print("engine=tree-walk, status={}, duration={}\n", status, duration.count());
    return status == run_status::ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
