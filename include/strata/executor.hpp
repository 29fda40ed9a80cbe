#pragma once

#include <strata/detail/unique_function.hpp>

#include <concepts>
#include <cstdint>
#include <utility>

// Minimal, IO-agnostic executor abstraction.
//
// Semantics:
// - post(fn): enqueue fn for later execution; never runs inline.
// - dispatch(fn): may run fn inline when the caller already runs on the executor.
// - Both are noexcept: scheduling failure is handled inside the executor.

namespace strata {

namespace detail {
class reactor;

template <class Ex>
struct executor_traits;
}  // namespace detail

enum class executor_capability : std::uint8_t {
  none = 0,
  io = 1 << 0,
};

inline constexpr auto operator|(executor_capability lhs, executor_capability rhs) noexcept
  -> executor_capability {
  return static_cast<executor_capability>(static_cast<std::uint8_t>(lhs) |
                                          static_cast<std::uint8_t>(rhs));
}

inline constexpr auto operator&(executor_capability lhs, executor_capability rhs) noexcept
  -> executor_capability {
  return static_cast<executor_capability>(static_cast<std::uint8_t>(lhs) &
                                          static_cast<std::uint8_t>(rhs));
}

inline constexpr auto has_capability(executor_capability caps, executor_capability flag) noexcept
  -> bool {
  return (caps & flag) != executor_capability::none;
}

// The interface is checked before copyability: copying a type with an `any_executor`
// constructor must not depend on this concept for that same type.
template <class Ex>
concept executor = requires(Ex& ex, detail::unique_function<void()> fn) {
                     { ex.post(std::move(fn)) } noexcept;
                     { ex.dispatch(std::move(fn)) } noexcept;
                     { std::as_const(ex) == std::as_const(ex) } -> std::convertible_to<bool>;
                   } && std::copy_constructible<Ex>;

namespace detail {

/// Capability lookup for executors. Specialize for executors bound to a reactor.
template <class Ex>
struct executor_traits {
  static auto capabilities(Ex const&) noexcept -> executor_capability {
    return executor_capability::none;
  }

  static auto get_reactor(Ex const&) noexcept -> reactor* { return nullptr; }
};

}  // namespace detail

}  // namespace strata
