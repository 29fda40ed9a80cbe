#pragma once

#include <strata/any_executor.hpp>
#include <strata/any_io_executor.hpp>
#include <strata/assert.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/reactor.hpp>
#include <strata/detail/unique_function.hpp>

#include <chrono>
#include <cstddef>
#include <memory>
#include <utility>

namespace strata {

/// Event loop for posted work, timers and socket readiness.
///
/// Semantics:
/// - `run*()` / `poll()` drive completion of posted tasks, timers and readiness callbacks.
/// - At most one thread drives a given `io_context` at a time.
/// - `run()` returns when stopped or when no work remains (see `work_guard`).
///
/// Threading:
/// - `post()` (via the executor) and `stop()` are safe from any thread.
/// - Callbacks run on the thread currently driving the context.
class io_context {
 public:
  class executor_type {
   public:
    executor_type() noexcept = default;
    explicit executor_type(std::shared_ptr<detail::reactor> impl) noexcept
        : impl_(std::move(impl)) {}

    void post(detail::unique_function<void()> f) const noexcept {
      ensure_impl().post([ex = *this, fn = std::move(f)]() mutable {
        detail::executor_guard g{any_executor{ex}};
        fn();
      });
    }

    void dispatch(detail::unique_function<void()> f) const noexcept {
      ensure_impl().dispatch([ex = *this, fn = std::move(f)]() mutable {
        detail::executor_guard g{any_executor{ex}};
        fn();
      });
    }

    auto stopped() const noexcept -> bool { return impl_ == nullptr || impl_->stopped(); }

    explicit operator bool() const noexcept { return impl_ != nullptr; }

    friend auto operator==(executor_type const& a, executor_type const& b) noexcept -> bool {
      return a.impl_.get() == b.impl_.get();
    }

   private:
    friend struct detail::executor_traits<executor_type>;

    auto ensure_impl() const noexcept -> detail::reactor& {
      STRATA_ENSURE(impl_, "io_context::executor_type: empty");
      return *impl_;
    }

    std::shared_ptr<detail::reactor> impl_{};
  };

  io_context() : impl_(std::make_shared<detail::reactor>()) {}
  ~io_context() = default;

  io_context(io_context const&) = delete;
  auto operator=(io_context const&) -> io_context& = delete;
  io_context(io_context&&) = delete;
  auto operator=(io_context&&) -> io_context& = delete;

  /// Run until `stop()` is requested or no work remains.
  /// Returns the number of callbacks executed.
  auto run() -> std::size_t { return impl_->run(); }

  /// Run at most one batch of ready work, blocking if none is ready yet.
  auto run_one() -> std::size_t { return impl_->run_one(); }

  /// Run for at most `timeout`, or until stopped / out of work.
  auto run_for(std::chrono::milliseconds timeout) -> std::size_t { return impl_->run_for(timeout); }

  /// Run whatever is ready right now without blocking.
  auto poll() -> std::size_t { return impl_->poll(); }

  /// Request the loop to stop (idempotent). Pending work is kept until `restart()`.
  void stop() { impl_->stop(); }

  void restart() { impl_->restart(); }

  auto stopped() const noexcept -> bool { return impl_->stopped(); }

  auto get_executor() noexcept -> any_io_executor { return any_io_executor{executor_type{impl_}}; }

 private:
  std::shared_ptr<detail::reactor> impl_;
};

}  // namespace strata

namespace strata::detail {

template <>
struct executor_traits<io_context::executor_type> {
  static auto capabilities(io_context::executor_type const& ex) noexcept -> executor_capability {
    return ex ? executor_capability::io : executor_capability::none;
  }

  static auto get_reactor(io_context::executor_type const& ex) noexcept -> reactor* {
    return ex.impl_.get();
  }
};

}  // namespace strata::detail
