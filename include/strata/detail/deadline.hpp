#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/co_sleep.hpp>
#include <strata/co_spawn.hpp>
#include <strata/detail/unique_function.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <utility>

namespace strata::detail {

/// Runs `on_expire` once if the guard is still alive after `d`. A zero duration disables it.
///
/// `on_expire` runs on `ex` and must not outlive what it references; destroying the guard
/// disarms it and stops the timer.
class deadline_guard {
 public:
  deadline_guard(any_io_executor const& ex, std::chrono::steady_clock::duration d,
                 unique_function<void()> on_expire)
      : st_(std::make_shared<state>()) {
    if (d <= std::chrono::steady_clock::duration::zero()) {
      return;
    }
    st_->on_expire = std::move(on_expire);
    co_spawn(ex.as_any_executor(), stop_.get_token(),
             [st = st_, ex, d]() -> awaitable<void> {
               if (co_await co_sleep(ex, d)) {
                 co_return;
               }
               std::scoped_lock lk{st->m};
               if (!st->armed) {
                 co_return;
               }
               st->expired.store(true, std::memory_order_release);
               st->on_expire();
             },
             detached);
  }

  deadline_guard(deadline_guard const&) = delete;
  auto operator=(deadline_guard const&) -> deadline_guard& = delete;
  deadline_guard(deadline_guard&&) = delete;
  auto operator=(deadline_guard&&) -> deadline_guard& = delete;

  ~deadline_guard() {
    {
      std::scoped_lock lk{st_->m};
      st_->armed = false;
    }
    stop_.request_stop();
  }

  auto expired() const noexcept -> bool { return st_->expired.load(std::memory_order_acquire); }

 private:
  struct state {
    std::mutex m{};
    bool armed{true};
    std::atomic<bool> expired{false};
    unique_function<void()> on_expire{};
  };

  std::shared_ptr<state> st_;
  std::stop_source stop_{};
};

}  // namespace strata::detail
