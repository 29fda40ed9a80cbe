#pragma once

#include <strata/detail/awaitable_promise.hpp>

#include <coroutine>
#include <exception>
#include <stop_token>
#include <utility>

namespace strata {

/// Token for `co_spawn`: nobody waits for the result; an escaping exception is logged.
struct detached_t {};
inline constexpr detached_t detached{};

/// Token for async operations: return an `awaitable` of the result.
struct use_awaitable_t {};
inline constexpr use_awaitable_t use_awaitable{};

/// Lazily started coroutine returning `T`.
///
/// The awaitable owns its frame until it is awaited to completion, released or destroyed.
/// Awaiting it from another `awaitable` inherits the caller's executor and links the callee's
/// stop source to the caller's stop token.
template <class T>
class awaitable {
 public:
  using promise_type = detail::awaitable_promise<T>;
  using handle_type = std::coroutine_handle<promise_type>;

  explicit awaitable(handle_type h) noexcept : coro_(h) {}
  ~awaitable() noexcept {
    if (coro_) {
      coro_.destroy();
    }
  }

  awaitable(awaitable const&) = delete;
  auto operator=(awaitable const&) -> awaitable& = delete;

  awaitable(awaitable&& other) noexcept : coro_(std::exchange(other.coro_, {})) {}
  auto operator=(awaitable&& other) noexcept -> awaitable& {
    if (this != &other) {
      if (coro_) {
        coro_.destroy();
      }
      coro_ = std::exchange(other.coro_, {});
    }
    return *this;
  }

  /// Release ownership of the coroutine handle without destroying it.
  [[nodiscard]] auto release() noexcept -> handle_type { return std::exchange(coro_, {}); }

  [[nodiscard]] auto get_executor() const noexcept -> any_executor {
    if (!coro_) {
      return any_executor{};
    }
    return coro_.promise().get_executor();
  }

  [[nodiscard]] auto get_stop_token() const noexcept -> std::stop_token {
    if (!coro_) {
      return {};
    }
    return coro_.promise().get_stop_token();
  }

  void request_stop() noexcept {
    if (coro_) {
      coro_.promise().request_stop();
    }
  }

  auto await_ready() const noexcept -> bool { return false; }

  template <class Promise>
  auto await_suspend(std::coroutine_handle<Promise> h) -> std::coroutine_handle<> {
    coro_.promise().set_continuation(h);
    if constexpr (requires { h.promise().get_executor(); }) {
      coro_.promise().inherit_executor(h.promise().get_executor());
    }
    if constexpr (requires { h.promise().get_stop_token(); }) {
      coro_.promise().inherit_stop_token(h.promise().get_stop_token());
    }
    return coro_;
  }

  auto await_resume() -> T {
    coro_.promise().rethrow_if_exception();
    return coro_.promise().take_value();
  }

 private:
  handle_type coro_;
};

}  // namespace strata

namespace strata::detail {

template <class T>
auto awaitable_promise<T>::get_return_object() -> awaitable<T> {
  return awaitable<T>{std::coroutine_handle<awaitable_promise<T>>::from_promise(*this)};
}

inline auto awaitable_promise<void>::get_return_object() -> awaitable<void> {
  return awaitable<void>{std::coroutine_handle<awaitable_promise<void>>::from_promise(*this)};
}

}  // namespace strata::detail
