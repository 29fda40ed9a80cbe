#pragma once

#include <cstdlib>
#include <exception>

#if defined(__GNUC__) || defined(__clang__)
#define STRATA_LIKELY(x) __builtin_expect(!!(x), 1)
#define STRATA_UNLIKELY(x) __builtin_expect(!!(x), 0)
#else
#define STRATA_LIKELY(x) (x)
#define STRATA_UNLIKELY(x) (x)
#endif

namespace strata::detail {

[[noreturn]] void assert_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void ensure_fail(char const* expr, char const* msg, char const* file, int line,
                              char const* func) noexcept;

[[noreturn]] void unreachable_fail(char const* file, int line, char const* func) noexcept;

}  // namespace strata::detail

// ASSERT: debug-only invariant check.
#if !defined(NDEBUG)

#define STRATA_ASSERT_SELECTOR(_1, _2, NAME, ...) NAME

#define STRATA_ASSERT_1(expr)                                                            \
  (STRATA_LIKELY(expr) ? (void)0                                                         \
                       : ::strata::detail::assert_fail(#expr, nullptr, __FILE__, __LINE__, \
                                                        __func__))

#define STRATA_ASSERT_2(expr, msg) \
  (STRATA_LIKELY(expr) ? (void)0   \
                       : ::strata::detail::assert_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define STRATA_ASSERT(...) \
  STRATA_ASSERT_SELECTOR(__VA_ARGS__, STRATA_ASSERT_2, STRATA_ASSERT_1)(__VA_ARGS__)

#else
#define STRATA_ASSERT(...) ((void)0)
#endif

// ENSURE: always-on invariant check.
#define STRATA_ENSURE_SELECTOR(_1, _2, NAME, ...) NAME

#define STRATA_ENSURE_1(expr)                                                            \
  (STRATA_LIKELY(expr) ? (void)0                                                         \
                       : ::strata::detail::ensure_fail(#expr, nullptr, __FILE__, __LINE__, \
                                                        __func__))

#define STRATA_ENSURE_2(expr, msg) \
  (STRATA_LIKELY(expr) ? (void)0   \
                       : ::strata::detail::ensure_fail(#expr, msg, __FILE__, __LINE__, __func__))

#define STRATA_ENSURE(...) \
  STRATA_ENSURE_SELECTOR(__VA_ARGS__, STRATA_ENSURE_2, STRATA_ENSURE_1)(__VA_ARGS__)

#define STRATA_UNREACHABLE() ::strata::detail::unreachable_fail(__FILE__, __LINE__, __func__)
