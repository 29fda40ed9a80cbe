#pragma once

#include <strata/any_executor.hpp>

#include <utility>

namespace strata::detail {

inline thread_local any_executor current_executor{};

inline auto get_current_executor() noexcept -> any_executor { return current_executor; }

/// Installs `ex` as the executor of the running thread for the guard's lifetime.
struct executor_guard {
  any_executor prev;

  explicit executor_guard(any_executor ex) noexcept : prev(current_executor) {
    current_executor = std::move(ex);
  }

  ~executor_guard() { current_executor = std::move(prev); }

  executor_guard(executor_guard const&) = delete;
  auto operator=(executor_guard const&) -> executor_guard& = delete;
  executor_guard(executor_guard&&) = delete;
  auto operator=(executor_guard&&) -> executor_guard& = delete;
};

}  // namespace strata::detail
