#include <strata/assert.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/reactor.hpp>
#include <strata/error.hpp>
#include <strata/steady_timer.hpp>
#include <strata/this_coro.hpp>

#include <coroutine>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <utility>

namespace strata {

namespace detail {

struct timer_wait_state {
  std::mutex m;
  std::coroutine_handle<> h{};
  any_executor ex{};
  std::error_code ec{};
};

class timer_wait_awaiter {
 public:
  timer_wait_awaiter(reactor* r, steady_timer::time_point expiry,
                     std::shared_ptr<timer_entry>& slot, any_executor fallback,
                     std::stop_token stop)
      : reactor_(r),
        expiry_(expiry),
        slot_(slot),
        fallback_(std::move(fallback)),
        stop_(std::move(stop)) {}

  timer_wait_awaiter(timer_wait_awaiter const&) = delete;
  auto operator=(timer_wait_awaiter const&) -> timer_wait_awaiter& = delete;

  ~timer_wait_awaiter() {
    stop_cb_.reset();
    // Frame torn down while suspended: make sure the entry never resumes it.
    st_.reset();
    if (entry_) {
      reactor_->cancel_timer(entry_);
    }
  }

  auto await_ready() const noexcept -> bool { return false; }

  template <class Promise>
  void await_suspend(std::coroutine_handle<Promise> h) {
    st_ = std::make_shared<timer_wait_state>();
    // Completion may race onto another thread; it waits for setup to finish.
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

    std::weak_ptr<timer_wait_state> w = st_;
    entry_ = reactor_->schedule_timer(expiry_, [w](std::error_code ec) {
      auto st = w.lock();
      if (!st) {
        return;
      }
      st->ec = ec;
      auto ex = st->ex;
      ex.post([st]() {
        { std::scoped_lock lk{st->m}; }
        st->h.resume();
      });
    });
    slot_ = entry_;

    if (stop_.stop_possible()) {
      stop_cb_.emplace(stop_, unique_function<void()>{[r = reactor_, e = entry_]() {
                         r->cancel_timer(e);
                       }});
    }
  }

  auto await_resume() -> std::error_code {
    stop_cb_.reset();
    return st_->ec;
  }

 private:
  reactor* reactor_;
  steady_timer::time_point expiry_;
  std::shared_ptr<timer_entry>& slot_;
  any_executor fallback_;
  std::stop_token stop_;
  std::shared_ptr<timer_wait_state> st_{};
  std::shared_ptr<timer_entry> entry_{};
  std::optional<std::stop_callback<unique_function<void()>>> stop_cb_{};
};

}  // namespace detail

inline steady_timer::steady_timer(any_io_executor ex) noexcept : ex_(std::move(ex)) {}

inline steady_timer::steady_timer(any_io_executor ex, time_point at) noexcept
    : ex_(std::move(ex)), expiry_(at) {}

inline steady_timer::steady_timer(any_io_executor ex, duration after) noexcept
    : ex_(std::move(ex)), expiry_(clock::now() + after) {}

inline steady_timer::~steady_timer() { (void)cancel(); }

inline auto steady_timer::expires_at(time_point at) noexcept -> std::size_t {
  expiry_ = at;
  return cancel();
}

inline auto steady_timer::expires_after(duration d) noexcept -> std::size_t {
  expiry_ = clock::now() + d;
  return cancel();
}

inline auto steady_timer::async_wait(use_awaitable_t) -> awaitable<std::error_code> {
  STRATA_ENSURE(ex_, "steady_timer::async_wait: requires a bound executor");
  auto* r = ex_.get_reactor();

  auto stop = co_await this_coro::stop_token;
  if (stop.stop_requested() || r->stopped()) {
    co_return error::operation_aborted;
  }

  detail::timer_wait_awaiter expired{r, expiry_, entry_, ex_.as_any_executor(), std::move(stop)};
  co_return co_await detail::ref_awaiter<detail::timer_wait_awaiter>{&expired};
}

inline auto steady_timer::cancel() noexcept -> std::size_t {
  auto entry = std::exchange(entry_, nullptr);
  if (!entry || !entry->is_pending()) {
    return 0;
  }
  ex_.get_reactor()->cancel_timer(entry);
  return 1;
}

}  // namespace strata
