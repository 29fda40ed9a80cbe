#pragma once

#include <strata/any_executor.hpp>
#include <strata/any_io_executor.hpp>
#include <strata/assert.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/unique_function.hpp>
#include <strata/this_coro.hpp>

#include <coroutine>
#include <exception>
#include <memory>
#include <optional>
#include <stop_token>
#include <utility>

namespace strata {
template <class T>
class awaitable;
}  // namespace strata

namespace strata::detail {

/// Copyable handle that forwards to a named, non-copyable awaiter. GCC 12 copies the
/// result of `await_transform` even when it is a reference, so such awaiters are
/// awaited through this handle instead.
template <class Awaiter>
struct ref_awaiter {
  Awaiter* a;

  auto await_ready() -> bool { return a->await_ready(); }

  template <class Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) -> decltype(auto) {
    return a->await_suspend(h);
  }

  auto await_resume() -> decltype(auto) { return a->await_resume(); }
};

struct awaitable_promise_base {
  any_executor ex_{};
  std::coroutine_handle<> continuation_{};
  std::exception_ptr exception_{};
  bool detached_{false};
  std::stop_source stop_source_{};
  std::unique_ptr<std::stop_callback<unique_function<void()>>> parent_stop_cb_{};

  awaitable_promise_base() noexcept = default;

  auto initial_suspend() noexcept -> std::suspend_always { return {}; }

  auto final_suspend() noexcept {
    struct final_awaiter {
      awaitable_promise_base* self;

      auto await_ready() noexcept -> bool { return false; }

      auto await_suspend(std::coroutine_handle<> h) noexcept -> std::coroutine_handle<> {
        self->parent_stop_cb_.reset();
        if (self->detached_) {
          h.destroy();
          return std::noop_coroutine();
        }

        auto cont = std::exchange(self->continuation_, std::coroutine_handle<>{});
        if (!cont) {
          return std::noop_coroutine();
        }

        // Continue inline only when already on the coroutine's executor.
        if (!self->ex_ || get_current_executor() == self->ex_) {
          return cont;
        }

        auto ex = self->ex_;
        ex.post([cont]() mutable { cont.resume(); });
        return std::noop_coroutine();
      }

      void await_resume() noexcept {}
    };

    return final_awaiter{this};
  }

  auto get_executor() const noexcept -> any_executor { return ex_; }
  void set_executor(any_executor ex) noexcept { ex_ = std::move(ex); }

  void inherit_executor(any_executor parent_ex) noexcept {
    if (!ex_) {
      ex_ = std::move(parent_ex);
    }
  }

  auto get_stop_token() const noexcept -> std::stop_token { return stop_source_.get_token(); }

  /// Link this coroutine's stop source to `parent`: a stop request on the parent propagates.
  void inherit_stop_token(std::stop_token parent) {
    if (!parent.stop_possible() || parent_stop_cb_) {
      return;
    }
    if (parent.stop_requested()) {
      request_stop();
      return;
    }
    parent_stop_cb_ = std::make_unique<std::stop_callback<unique_function<void()>>>(
      parent, unique_function<void()>{[this]() { request_stop(); }});
  }

  void request_stop() noexcept { stop_source_.request_stop(); }

  void detach() noexcept {
    STRATA_ENSURE(ex_, "awaitable_promise: detach() requires executor");
    detached_ = true;
  }

  void set_continuation(std::coroutine_handle<> h) noexcept { continuation_ = h; }

  void unhandled_exception() noexcept { exception_ = std::current_exception(); }

  void rethrow_if_exception() {
    if (exception_) {
      std::rethrow_exception(std::exchange(exception_, nullptr));
    }
  }

  template <class Awaitable>
  auto await_transform(Awaitable&& a) noexcept -> Awaitable&& {
    return std::forward<Awaitable>(a);
  }

  auto await_transform(this_coro::executor_t) noexcept {
    struct awaiter {
      any_executor ex;
      auto await_ready() noexcept -> bool { return true; }
      auto await_resume() noexcept -> any_executor { return ex; }
      void await_suspend(std::coroutine_handle<>) noexcept {}
    };
    return awaiter{ex_};
  }

  auto await_transform(this_coro::io_executor_t) noexcept {
    struct awaiter {
      any_executor ex;
      auto await_ready() noexcept -> bool { return true; }
      auto await_resume() noexcept -> any_io_executor { return any_io_executor{ex}; }
      void await_suspend(std::coroutine_handle<>) noexcept {}
    };
    return awaiter{ex_};
  }

  auto await_transform(this_coro::stop_token_t) noexcept {
    struct awaiter {
      std::stop_token token;
      auto await_ready() noexcept -> bool { return true; }
      auto await_resume() noexcept -> std::stop_token { return token; }
      void await_suspend(std::coroutine_handle<>) noexcept {}
    };
    return awaiter{get_stop_token()};
  }
};

template <class T>
struct awaitable_promise final : awaitable_promise_base {
  std::optional<T> value_{};

  awaitable_promise() noexcept = default;

  auto get_return_object() -> awaitable<T>;

  template <class U>
    requires std::convertible_to<U, T>
  void return_value(U&& v) {
    value_.emplace(std::forward<U>(v));
  }

  auto take_value() -> T {
    STRATA_ENSURE(value_.has_value(), "awaitable_promise: no value");
    auto v = std::move(*value_);
    value_.reset();
    return v;
  }
};

template <>
struct awaitable_promise<void> final : awaitable_promise_base {
  awaitable_promise() noexcept = default;

  auto get_return_object() -> awaitable<void>;
  void return_void() noexcept {}

  void take_value() noexcept {}
};

}  // namespace strata::detail
