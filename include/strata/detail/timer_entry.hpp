#pragma once

#include <strata/detail/unique_function.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <system_error>

namespace strata::detail {

enum class timer_state : std::uint8_t {
  pending,
  fired,
  cancelled,
};

/// One-shot timer registered with a reactor.
///
/// Fields other than `state` are written once before the entry is published. Whoever wins the
/// transition out of `pending` owns `on_complete` and invokes it exactly once: with an empty
/// error code when the timer fires, with `error::operation_aborted` when it is cancelled.
struct timer_entry {
  std::uint64_t id{};
  std::chrono::steady_clock::time_point expiry{};
  unique_function<void(std::error_code)> on_complete{};
  std::atomic<timer_state> state{timer_state::pending};

  timer_entry() = default;

  timer_entry(timer_entry const&) = delete;
  auto operator=(timer_entry const&) -> timer_entry& = delete;
  timer_entry(timer_entry&&) = delete;
  auto operator=(timer_entry&&) -> timer_entry& = delete;

  auto is_pending() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::pending;
  }

  auto is_cancelled() const noexcept -> bool {
    return state.load(std::memory_order_acquire) == timer_state::cancelled;
  }

  auto mark_fired() noexcept -> bool { return transition(timer_state::fired); }

  auto mark_cancelled() noexcept -> bool { return transition(timer_state::cancelled); }

 private:
  auto transition(timer_state to) noexcept -> bool {
    auto expected = timer_state::pending;
    return state.compare_exchange_strong(expected, to, std::memory_order_acq_rel,
                                         std::memory_order_acquire);
  }
};

}  // namespace strata::detail
