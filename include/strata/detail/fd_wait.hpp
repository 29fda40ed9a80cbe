#pragma once

#include <strata/any_executor.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/reactor.hpp>
#include <strata/detail/unique_function.hpp>

#include <atomic>
#include <coroutine>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <system_error>
#include <utility>

namespace strata::detail {

/// The cancellation handle of the one pending wait per direction on an fd.
class fd_handle_slot {
 public:
  void set(reactor::fd_event_handle h) noexcept {
    std::scoped_lock lk{m_};
    h_ = h;
  }

  auto take() noexcept -> reactor::fd_event_handle {
    std::scoped_lock lk{m_};
    return std::exchange(h_, reactor::fd_event_handle{});
  }

  /// Cancel outside the lock; the abort callback may run inline.
  void cancel() noexcept { take().cancel(); }

 private:
  std::mutex m_{};
  reactor::fd_event_handle h_{};
};

struct fd_wait_state {
  std::mutex m{};
  std::coroutine_handle<> h{};
  any_executor ex{};
  std::error_code ec{};
  std::atomic<bool> done{false};

  static void complete(std::weak_ptr<fd_wait_state> const& w, std::error_code ec) {
    auto st = w.lock();
    if (!st || st->done.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    st->ec = ec;
    auto ex = st->ex;
    ex.post([st]() {
      { std::scoped_lock lk{st->m}; }
      st->h.resume();
    });
  }
};

/// Suspend until `fd` is ready for `kind`, resuming through the waiting coroutine's executor.
class fd_wait_awaiter {
 public:
  fd_wait_awaiter(reactor* r, int fd, reactor::fd_event_kind kind, fd_handle_slot& slot,
                  any_executor fallback, std::stop_token stop)
      : reactor_(r),
        fd_(fd),
        kind_(kind),
        slot_(slot),
        fallback_(std::move(fallback)),
        stop_(std::move(stop)) {}

  fd_wait_awaiter(fd_wait_awaiter const&) = delete;
  auto operator=(fd_wait_awaiter const&) -> fd_wait_awaiter& = delete;

  ~fd_wait_awaiter() {
    stop_cb_.reset();
    st_.reset();
    handle_.cancel();
  }

  auto await_ready() const noexcept -> bool { return false; }

  template <class Promise>
  void await_suspend(std::coroutine_handle<Promise> h) {
    st_ = std::make_shared<fd_wait_state>();
    std::scoped_lock lk{st_->m};
    st_->h = h;
    if constexpr (requires { h.promise().get_executor(); }) {
      st_->ex = h.promise().get_executor();
    }
    if (!st_->ex) {
      st_->ex = get_current_executor();
    }
    if (!st_->ex) {
      st_->ex = fallback_;
    }

    std::weak_ptr<fd_wait_state> w = st_;
    auto op = std::make_unique<reactor_op>();
    op->on_ready = [w]() { fd_wait_state::complete(w, {}); };
    op->on_abort = [w](std::error_code ec) { fd_wait_state::complete(w, ec); };

    handle_ = kind_ == reactor::fd_event_kind::read ? reactor_->register_fd_read(fd_, std::move(op))
                                                    : reactor_->register_fd_write(fd_, std::move(op));
    slot_.set(handle_);

    if (stop_.stop_possible()) {
      stop_cb_.emplace(stop_, unique_function<void()>{[h = handle_]() { h.cancel(); }});
    }
  }

  auto await_resume() -> std::error_code {
    stop_cb_.reset();
    (void)slot_.take();
    return st_->ec;
  }

 private:
  reactor* reactor_;
  int fd_;
  reactor::fd_event_kind kind_;
  fd_handle_slot& slot_;
  any_executor fallback_;
  std::stop_token stop_;
  std::shared_ptr<fd_wait_state> st_{};
  reactor::fd_event_handle handle_{};
  std::optional<std::stop_callback<unique_function<void()>>> stop_cb_{};
};

}  // namespace strata::detail
