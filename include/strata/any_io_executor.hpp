#pragma once

#include <strata/any_executor.hpp>
#include <strata/assert.hpp>

#include <utility>

namespace strata {

/// Type-erased IO-capable executor.
///
/// Semantics:
/// - Must wrap an executor that supports IO (`supports_io() == true`).
/// - Empty executor is allowed; it compares equal only to other empty executors.
class any_io_executor {
 public:
  any_io_executor() noexcept = default;

  explicit any_io_executor(any_executor ex) noexcept : ex_(std::move(ex)) {
    if (ex_) {
      STRATA_ENSURE(ex_.supports_io(), "any_io_executor: requires IO-capable executor");
      reactor_ = ex_.get_reactor();
      STRATA_ENSURE(reactor_ != nullptr, "any_io_executor: missing reactor");
    }
  }

  template <class Ex>
    requires(!std::is_same_v<std::decay_t<Ex>, any_io_executor> &&
             !std::is_same_v<std::decay_t<Ex>, any_executor> && executor<std::decay_t<Ex>>)
  any_io_executor(Ex ex) noexcept : any_io_executor(any_executor{std::move(ex)}) {}

  void post(detail::unique_function<void()> f) const noexcept { ex_.post(std::move(f)); }

  void dispatch(detail::unique_function<void()> f) const noexcept { ex_.dispatch(std::move(f)); }

  auto capabilities() const noexcept -> executor_capability { return ex_.capabilities(); }

  explicit operator bool() const noexcept { return static_cast<bool>(ex_); }

  auto as_any_executor() const noexcept -> any_executor const& { return ex_; }

  /// Reactor that services readiness waits and timers for this executor.
  auto get_reactor() const noexcept -> detail::reactor* { return reactor_; }

  friend auto operator==(any_io_executor const& a, any_io_executor const& b) noexcept -> bool {
    return a.ex_ == b.ex_;
  }

 private:
  any_executor ex_{};
  detail::reactor* reactor_ = nullptr;
};

inline any_executor::any_executor(any_io_executor const& ex) : any_executor(ex.as_any_executor()) {}

}  // namespace strata

namespace strata::detail {

template <>
struct executor_traits<any_io_executor> {
  static auto capabilities(any_io_executor const& ex) noexcept -> executor_capability {
    return ex.capabilities();
  }

  static auto get_reactor(any_io_executor const& ex) noexcept -> reactor* {
    return ex.get_reactor();
  }
};

}  // namespace strata::detail
