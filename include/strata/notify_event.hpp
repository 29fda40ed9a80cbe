#pragma once

#include <strata/any_executor.hpp>
#include <strata/assert.hpp>
#include <strata/awaitable.hpp>
#include <strata/detail/unique_function.hpp>
#include <strata/error.hpp>
#include <strata/result.hpp>

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <utility>

namespace strata {

/// Auto-reset notification event (stop-aware).
///
/// Semantics:
/// - `notify_one()` wakes exactly one waiter if present; otherwise it stores one ticket, up to
///   the ticket limit given at construction (unbounded by default). A limit of 1 makes the
///   event a coalescing wake-up signal.
/// - `async_wait(use_awaitable)` consumes a ticket if one is stored, otherwise suspends.
/// - A stop request on the waiting coroutine resumes it with `error::operation_aborted`.
/// - Resumption is posted onto the waiting coroutine's executor.
/// - `notify_one()` is safe from any thread.
class notify_event {
 public:
  notify_event() = default;
  explicit notify_event(std::size_t ticket_limit) noexcept : ticket_limit_(ticket_limit) {}

  notify_event(notify_event const&) = delete;
  auto operator=(notify_event const&) -> notify_event& = delete;
  notify_event(notify_event&&) = delete;
  auto operator=(notify_event&&) -> notify_event& = delete;

  ~notify_event() = default;

  void notify_one() noexcept {
    std::shared_ptr<wait_state> st{};
    {
      std::scoped_lock lk{m_};
      if (waiters_.empty()) {
        if (tickets_ < ticket_limit_) {
          ++tickets_;
        }
        return;
      }
      st = std::move(waiters_.front());
      waiters_.pop_front();
    }
    complete(std::move(st), std::error_code{});
  }

  /// Wake every current waiter; stores no ticket.
  void notify_all() noexcept {
    std::deque<std::shared_ptr<wait_state>> local{};
    {
      std::scoped_lock lk{m_};
      local.swap(waiters_);
    }
    for (auto& st : local) {
      complete(std::move(st), std::error_code{});
    }
  }

  auto async_wait(use_awaitable_t) -> awaitable<result<void>> {
    co_return co_await wait_awaiter{this};
  }

 private:
  struct wait_state {
    any_executor ex{};
    // 0 = pending, 1 = notified, 2 = aborted
    std::atomic<int> outcome{0};
    // nullptr: no waiter published yet; done_sentinel(): completed; else coroutine address.
    std::atomic<void*> waiter_addr{nullptr};
    std::shared_ptr<std::stop_callback<detail::unique_function<void()>>> stop_cb{};
  };

  static auto done_sentinel() noexcept -> void* {
    return reinterpret_cast<void*>(static_cast<std::uintptr_t>(1));
  }

  static void complete(std::shared_ptr<wait_state> st, std::error_code ec) noexcept {
    int expected = 0;
    if (!st->outcome.compare_exchange_strong(expected, ec ? 2 : 1, std::memory_order_release,
                                             std::memory_order_relaxed)) {
      return;
    }

    void* addr = st->waiter_addr.exchange(done_sentinel(), std::memory_order_acq_rel);
    if (addr == nullptr || addr == done_sentinel()) {
      // The waiter has not suspended yet and will observe the outcome itself.
      return;
    }

    auto h = std::coroutine_handle<>::from_address(addr);
    auto ex = st->ex;
    ex.post([h]() mutable { h.resume(); });
  }

  void remove_waiter(wait_state const* st) noexcept {
    std::scoped_lock lk{m_};
    for (auto it = waiters_.begin(); it != waiters_.end(); ++it) {
      if (it->get() == st) {
        waiters_.erase(it);
        return;
      }
    }
  }

  struct wait_awaiter {
    notify_event* ev{};
    std::shared_ptr<wait_state> st{std::make_shared<wait_state>()};

    explicit wait_awaiter(notify_event* ev_) noexcept : ev(ev_) {}

    auto await_ready() noexcept -> bool {
      std::scoped_lock lk{ev->m_};
      if (ev->tickets_ > 0) {
        --ev->tickets_;
        st->outcome.store(1, std::memory_order_release);
        return true;
      }
      return false;
    }

    template <class Promise>
      requires requires(Promise& p) { p.get_executor(); }
    auto await_suspend(std::coroutine_handle<Promise> h) noexcept -> bool {
      st->ex = h.promise().get_executor();
      STRATA_ENSURE(st->ex, "notify_event: awaiting coroutine has no executor");

      std::stop_token token{};
      if constexpr (requires { h.promise().get_stop_token(); }) {
        token = h.promise().get_stop_token();
      }
      if (token.stop_requested()) {
        st->outcome.store(2, std::memory_order_release);
        return false;
      }

      {
        std::scoped_lock lk{ev->m_};
        if (ev->tickets_ > 0) {
          --ev->tickets_;
          st->outcome.store(1, std::memory_order_release);
          return false;
        }
        ev->waiters_.push_back(st);
      }

      if (token.stop_possible()) {
        auto weak = std::weak_ptr<wait_state>{st};
        auto* owner = ev;
        st->stop_cb = std::make_shared<std::stop_callback<detail::unique_function<void()>>>(
          token, detail::unique_function<void()>{[weak, owner]() {
            if (auto s = weak.lock()) {
              owner->remove_waiter(s.get());
              notify_event::complete(std::move(s), error::operation_aborted);
            }
          }});
      }

      void* expected = nullptr;
      if (!st->waiter_addr.compare_exchange_strong(expected, h.address(),
                                                   std::memory_order_acq_rel,
                                                   std::memory_order_acquire)) {
        // Completed before the handle was published: continue without suspending.
        return false;
      }
      return true;
    }

    auto await_resume() noexcept -> result<void> {
      st->stop_cb.reset();
      if (st->outcome.load(std::memory_order_acquire) == 2) {
        return fail(error::operation_aborted);
      }
      return ok();
    }
  };

  std::mutex m_{};
  std::deque<std::shared_ptr<wait_state>> waiters_{};
  std::size_t tickets_{0};
  std::size_t ticket_limit_{std::numeric_limits<std::size_t>::max()};
};

}  // namespace strata
