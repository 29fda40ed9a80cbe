#pragma once

#include <strata/log.hpp>

#include <concepts>
#include <exception>
#include <functional>
#include <type_traits>
#include <utility>

namespace strata::detail {

/// Runs `f` when the scope ends unless released.
template <class F>
  requires std::invocable<F&>
class [[nodiscard]] scope_exit {
 public:
  explicit scope_exit(F f) noexcept(std::is_nothrow_move_constructible_v<F>)
      : f_(std::move(f)), active_(true) {}

  scope_exit(scope_exit const&) = delete;
  auto operator=(scope_exit const&) -> scope_exit& = delete;

  scope_exit(scope_exit&& other) noexcept(std::is_nothrow_move_constructible_v<F>)
      : f_(std::move(other.f_)), active_(std::exchange(other.active_, false)) {}

  ~scope_exit() noexcept { run(); }

  void release() noexcept { active_ = false; }

 private:
  void run() noexcept {
    if (!std::exchange(active_, false)) {
      return;
    }
    try {
      std::invoke(f_);
    } catch (...) {
      log::report_exception(std::current_exception(), "scope_exit");
    }
  }

  [[no_unique_address]] F f_;
  bool active_;
};

template <class F>
[[nodiscard]] auto make_scope_exit(F&& f) -> scope_exit<std::decay_t<F>> {
  return scope_exit<std::decay_t<F>>(std::forward<F>(f));
}

}  // namespace strata::detail
