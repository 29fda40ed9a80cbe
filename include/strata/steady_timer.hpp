#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/detail/timer_entry.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <system_error>

namespace strata {

/// A reusable one-shot timer bound to an IO executor.
///
/// - Set the expiry (`expires_at` / `expires_after`), then `async_wait`.
/// - `cancel()` completes a pending wait with `error::operation_aborted`.
/// - A stop request on the awaiting coroutine cancels the wait the same way.
/// - The waiting coroutine is resumed through its own executor, never inline.
///
/// Not thread-safe: use one timer from one coroutine at a time.
class steady_timer {
 public:
  using clock = std::chrono::steady_clock;
  using time_point = clock::time_point;
  using duration = clock::duration;

  explicit steady_timer(any_io_executor ex) noexcept;
  steady_timer(any_io_executor ex, time_point at) noexcept;
  steady_timer(any_io_executor ex, duration after) noexcept;

  steady_timer(steady_timer const&) = delete;
  auto operator=(steady_timer const&) -> steady_timer& = delete;
  steady_timer(steady_timer&&) = delete;
  auto operator=(steady_timer&&) -> steady_timer& = delete;

  ~steady_timer();

  auto get_executor() const noexcept -> any_io_executor { return ex_; }

  auto expiry() const noexcept -> time_point { return expiry_; }

  /// Set the expiry; a pending wait is cancelled. Returns the number of cancelled waits.
  auto expires_at(time_point at) noexcept -> std::size_t;
  auto expires_after(duration d) noexcept -> std::size_t;

  /// Wait until expiry.
  ///
  /// Returns an empty error code on expiry and `error::operation_aborted` when cancelled,
  /// when the awaiting coroutine is asked to stop, or when the reactor is already stopped.
  auto async_wait(use_awaitable_t) -> awaitable<std::error_code>;

  /// Cancel a pending wait. Returns the number of cancelled waits (0 or 1).
  auto cancel() noexcept -> std::size_t;

 private:
  any_io_executor ex_{};
  time_point expiry_{clock::now()};
  std::shared_ptr<detail::timer_entry> entry_{};
};

}  // namespace strata
