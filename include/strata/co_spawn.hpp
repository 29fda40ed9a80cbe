#pragma once

#include <strata/any_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/detail/spawn.hpp>

#include <memory>
#include <stop_token>
#include <type_traits>
#include <utility>

namespace strata {

/// Start an awaitable on `ex` (fire-and-forget).
///
/// The coroutine frame is destroyed at completion. An exception escaping it is logged.
template <class T>
void co_spawn(any_executor ex, awaitable<T> a, detached_t) {
  auto state =
    std::make_shared<detail::spawn_state<T>>(detail::awaitable_as_function<T>{std::move(a)});
  detail::spawn_detached_impl(std::move(ex), detail::spawn_entry_point<T>(std::move(state)));
}

/// Start a callable returning `awaitable<T>` on `ex` (fire-and-forget).
///
/// Prefer this form for coroutine lambdas with captures: the callable is kept alive until the
/// coroutine completes.
template <class F>
  requires detail::awaitable_factory<std::remove_cvref_t<F>>
void co_spawn(any_executor ex, F&& f, detached_t) {
  using value_type = detail::awaitable_value_t<std::remove_cvref_t<F>>;
  auto state = std::make_shared<detail::spawn_state<value_type>>(std::forward<F>(f));
  detail::spawn_detached_impl(std::move(ex),
                              detail::spawn_entry_point<value_type>(std::move(state)));
}

/// Fire-and-forget spawn whose stop source is linked to `stop`.
template <class F>
  requires detail::awaitable_factory<std::remove_cvref_t<F>>
void co_spawn(any_executor ex, std::stop_token stop, F&& f, detached_t) {
  using value_type = detail::awaitable_value_t<std::remove_cvref_t<F>>;
  auto state = std::make_shared<detail::spawn_state<value_type>>(std::forward<F>(f));
  detail::spawn_detached_impl(std::move(ex),
                              detail::spawn_entry_point<value_type>(std::move(state)),
                              std::move(stop));
}

/// Start a callable on `ex` right away and return an awaitable for its result.
///
/// Exceptions thrown by the child are rethrown from `co_await`.
template <class F>
  requires detail::awaitable_factory<std::remove_cvref_t<F>>
auto co_spawn(any_executor ex, F&& f, use_awaitable_t)
  -> awaitable<detail::awaitable_value_t<std::remove_cvref_t<F>>> {
  using value_type = detail::awaitable_value_t<std::remove_cvref_t<F>>;

  auto st = std::make_shared<detail::spawn_wait_state<value_type>>(ex);
  auto state = std::make_shared<detail::spawn_state<value_type>>(std::forward<F>(f));
  detail::spawn_detached_impl(ex, detail::run_to_state<value_type>(st, std::move(state)));
  return detail::await_state<value_type>(std::move(st));
}

template <class T>
auto co_spawn(any_executor ex, awaitable<T> a, use_awaitable_t) -> awaitable<T> {
  return co_spawn(std::move(ex), detail::awaitable_as_function<T>{std::move(a)}, use_awaitable);
}

/// Start a callable on `ex` and invoke `completion` with its value or exception.
template <class Factory, class Completion>
  requires detail::awaitable_factory<std::remove_cvref_t<Factory>> &&
           detail::completion_callback_for<std::remove_cvref_t<Completion>,
                                           detail::awaitable_value_t<std::remove_cvref_t<Factory>>>
void co_spawn(any_executor ex, Factory&& f, Completion&& completion) {
  using value_type = detail::awaitable_value_t<std::remove_cvref_t<Factory>>;
  auto state = std::make_shared<detail::spawn_state_with_completion<value_type>>(
    std::forward<Factory>(f), std::forward<Completion>(completion));
  detail::spawn_detached_impl(
    std::move(ex), detail::spawn_entry_point_with_completion<value_type>(std::move(state)));
}

template <class T, class Completion>
  requires detail::completion_callback_for<std::remove_cvref_t<Completion>, T>
void co_spawn(any_executor ex, awaitable<T> a, Completion&& completion) {
  co_spawn(std::move(ex), detail::awaitable_as_function<T>{std::move(a)},
           std::forward<Completion>(completion));
}

/// Completion-callback spawn whose stop source is linked to `stop`.
template <class Factory, class Completion>
  requires detail::awaitable_factory<std::remove_cvref_t<Factory>> &&
           detail::completion_callback_for<std::remove_cvref_t<Completion>,
                                           detail::awaitable_value_t<std::remove_cvref_t<Factory>>>
void co_spawn(any_executor ex, std::stop_token stop, Factory&& f, Completion&& completion) {
  using value_type = detail::awaitable_value_t<std::remove_cvref_t<Factory>>;
  auto state = std::make_shared<detail::spawn_state_with_completion<value_type>>(
    std::forward<Factory>(f), std::forward<Completion>(completion));
  detail::spawn_detached_impl(
    std::move(ex), detail::spawn_entry_point_with_completion<value_type>(std::move(state)),
    std::move(stop));
}

}  // namespace strata
