#include <strata/assert.hpp>

#include <cstdio>
#include <cstdlib>

namespace strata::detail {

namespace {

[[noreturn]] void fail_impl(char const* kind, char const* expr, char const* msg,
                            char const* file, int line, char const* func) noexcept {
  std::fprintf(stderr,
               "[strata] %s failure\n"
               "  expression: %s\n"
               "  message   : %s\n"
               "  location  : %s:%d\n"
               "  function  : %s\n",
               kind, expr ? expr : "(none)", msg ? msg : "(none)", file, line, func);
  std::fflush(stderr);
  std::abort();
}

}  // namespace

void assert_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  fail_impl("ASSERT", expr, msg, file, line, func);
}

void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                        char const* func) noexcept {
  fail_impl("ENSURE", expr, msg, file, line, func);
}

void unreachable_fail(char const* file, int line, char const* func) noexcept {
  fail_impl("UNREACHABLE", nullptr, nullptr, file, line, func);
}

}  // namespace strata::detail
