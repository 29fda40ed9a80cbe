#pragma once

#include <strata/awaitable.hpp>
#include <strata/notify_event.hpp>
#include <strata/result.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>

namespace strata {

/// Open-connection gauge shared by acceptors; updated with atomics only.
class connection_counter {
 public:
  connection_counter() = default;
  connection_counter(connection_counter const&) = delete;
  auto operator=(connection_counter const&) -> connection_counter& = delete;

  void add() noexcept {
    open_.fetch_add(1, std::memory_order_acq_rel);
    accepted_.fetch_add(1, std::memory_order_relaxed);
  }

  void remove() noexcept {
    open_.fetch_sub(1, std::memory_order_acq_rel);
    // Current waiters are woken; the stored ticket covers one that is about to wait.
    released_.notify_all();
    released_.notify_one();
  }

  auto open() const noexcept -> std::size_t { return open_.load(std::memory_order_acquire); }
  auto accepted() const noexcept -> std::uint64_t {
    return accepted_.load(std::memory_order_relaxed);
  }

  /// Suspend until fewer than `limit` connections are open.
  auto wait_below(std::size_t limit) -> awaitable<result<void>> {
    while (open() >= limit) {
      auto r = co_await released_.async_wait(use_awaitable);
      if (!r) {
        co_return r;
      }
    }
    co_return ok();
  }

 private:
  std::atomic<std::size_t> open_{0};
  std::atomic<std::uint64_t> accepted_{0};
  notify_event released_{1};
};

}  // namespace strata
