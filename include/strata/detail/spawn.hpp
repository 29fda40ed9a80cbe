#pragma once

#include <strata/assert.hpp>
#include <strata/awaitable.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/unique_function.hpp>
#include <strata/expected.hpp>
#include <strata/log.hpp>

#include <concepts>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace strata::detail {

template <class A>
struct awaitable_traits;

template <class T>
struct awaitable_traits<awaitable<T>> {
  using value_type = T;
};

/// Value type `T` of a callable returning `awaitable<T>`.
template <class F>
using awaitable_value_t =
  typename awaitable_traits<std::remove_cvref_t<std::invoke_result_t<F&>>>::value_type;

/// A nullary callable returning `awaitable<T>` for some `T`.
template <class F>
concept awaitable_factory = std::invocable<F&> && requires { typename awaitable_value_t<F>; };

template <class T>
using spawn_expected = expected<T, std::exception_ptr>;

template <class F, class T>
concept completion_callback_for =
  std::invocable<F&, spawn_expected<T>> && (!std::same_as<std::remove_cvref_t<F>, detached_t>) &&
  (!std::same_as<std::remove_cvref_t<F>, use_awaitable_t>);

/// Owns the user factory for the lifetime of the spawned coroutine.
template <class T>
struct spawn_state {
  unique_function<awaitable<T>()> factory_{};

  template <class F>
  explicit spawn_state(F&& f) : factory_(std::forward<F>(f)) {}
};

template <class T>
struct spawn_state_with_completion {
  unique_function<awaitable<T>()> factory_{};
  unique_function<void(spawn_expected<T>)> completion_{};

  template <class F, class C>
  spawn_state_with_completion(F&& f, C&& c)
      : factory_(std::forward<F>(f)), completion_(std::forward<C>(c)) {}
};

/// Presents an `awaitable<T>` as a nullary callable so both spawn forms share one path.
template <class T>
class awaitable_as_function {
 public:
  explicit awaitable_as_function(awaitable<T>&& a) : awaitable_(std::move(a)) {}

  auto operator()() -> awaitable<T> { return std::move(awaitable_); }

 private:
  awaitable<T> awaitable_;
};

template <class T>
auto spawn_entry_point(std::shared_ptr<spawn_state<T>> state) -> awaitable<void> {
  try {
    co_await state->factory_();
  } catch (...) {
    log::report_exception(std::current_exception(), "co_spawn(detached)");
  }
}

template <class T>
void invoke_completion(spawn_state_with_completion<T>& state, spawn_expected<T> r) {
  try {
    state.completion_(std::move(r));
  } catch (...) {
    log::report_exception(std::current_exception(), "co_spawn completion");
  }
}

template <class T>
auto spawn_entry_point_with_completion(std::shared_ptr<spawn_state_with_completion<T>> state)
  -> awaitable<void> {
  std::optional<spawn_expected<T>> out{};
  try {
    if constexpr (std::is_void_v<T>) {
      co_await state->factory_();
      out.emplace();
    } else {
      out.emplace(co_await state->factory_());
    }
  } catch (...) {
    out.emplace(unexpected(std::current_exception()));
  }
  invoke_completion<T>(*state, std::move(*out));
}

template <class T>
void spawn_detached_impl(any_executor ex, awaitable<T> a, std::stop_token parent = {}) {
  STRATA_ENSURE(ex, "co_spawn: empty executor");
  auto h = a.release();

  h.promise().set_executor(ex);
  h.promise().inherit_stop_token(std::move(parent));
  h.promise().detach();

  ex.post([h, ex]() mutable {
    executor_guard g{ex};
    h.resume();
  });
}

/// Rendezvous between a hot-started child and the coroutine awaiting its result.
template <class T>
struct spawn_wait_state {
  any_executor ex{};
  std::mutex m;
  bool done{false};
  std::coroutine_handle<> waiter{};
  std::exception_ptr ep{};
  std::optional<T> value{};

  explicit spawn_wait_state(any_executor ex_) : ex(std::move(ex_)) {}

  void set_value(T v) {
    std::scoped_lock lk{m};
    value.emplace(std::move(v));
  }

  void set_exception(std::exception_ptr e) {
    std::scoped_lock lk{m};
    ep = std::move(e);
  }

  void complete() {
    std::coroutine_handle<> w{};
    {
      std::scoped_lock lk{m};
      done = true;
      w = std::exchange(waiter, {});
    }
    if (w) {
      ex.post([w, ex = ex]() mutable {
        executor_guard g{ex};
        w.resume();
      });
    }
  }
};

template <>
struct spawn_wait_state<void> {
  any_executor ex{};
  std::mutex m;
  bool done{false};
  std::coroutine_handle<> waiter{};
  std::exception_ptr ep{};

  explicit spawn_wait_state(any_executor ex_) : ex(std::move(ex_)) {}

  void set_value() noexcept {}

  void set_exception(std::exception_ptr e) {
    std::scoped_lock lk{m};
    ep = std::move(e);
  }

  void complete() {
    std::coroutine_handle<> w{};
    {
      std::scoped_lock lk{m};
      done = true;
      w = std::exchange(waiter, {});
    }
    if (w) {
      ex.post([w, ex = ex]() mutable {
        executor_guard g{ex};
        w.resume();
      });
    }
  }
};

template <class T>
struct state_awaiter {
  explicit state_awaiter(std::shared_ptr<spawn_wait_state<T>> st_) : st(std::move(st_)) {}

  std::shared_ptr<spawn_wait_state<T>> st;

  auto await_ready() const noexcept -> bool { return false; }

  void await_suspend(std::coroutine_handle<> h) {
    bool ready = false;
    {
      std::scoped_lock lk{st->m};
      STRATA_ENSURE(!st->waiter, "co_spawn(use_awaitable): multiple awaiters are not supported");
      ready = st->done;
      if (!ready) {
        st->waiter = h;
      }
    }
    if (ready) {
      st->ex.post([h, ex = st->ex]() mutable {
        executor_guard g{ex};
        h.resume();
      });
    }
  }

  auto await_resume() -> T {
    std::scoped_lock lk{st->m};
    if (st->ep) {
      std::rethrow_exception(st->ep);
    }
    if constexpr (!std::is_void_v<T>) {
      STRATA_ENSURE(st->value.has_value(), "co_spawn(use_awaitable): missing value");
      return std::move(*st->value);
    }
  }
};

template <class T>
auto await_state(std::shared_ptr<spawn_wait_state<T>> st) -> awaitable<T> {
  if constexpr (std::is_void_v<T>) {
    co_await state_awaiter<void>{std::move(st)};
  } else {
    co_return co_await state_awaiter<T>{std::move(st)};
  }
}

template <class T>
auto run_to_state(std::shared_ptr<spawn_wait_state<T>> st, std::shared_ptr<spawn_state<T>> state)
  -> awaitable<void> {
  try {
    if constexpr (std::is_void_v<T>) {
      co_await state->factory_();
      st->set_value();
    } else {
      st->set_value(co_await state->factory_());
    }
  } catch (...) {
    st->set_exception(std::current_exception());
  }
  st->complete();
}

}  // namespace strata::detail
