#pragma once

#include <strata/any_executor.hpp>
#include <strata/assert.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/unique_function.hpp>
#include <strata/log.hpp>

#include <memory>
#include <mutex>
#include <queue>
#include <type_traits>
#include <utility>

namespace strata {

/// Executor adapter that never runs two of its tasks concurrently.
///
/// Wraps a (possibly multi-threaded) executor. Tasks posted through the strand run in FIFO
/// order, one at a time, on whichever thread the base executor picks. IO capability and the
/// reactor of the base executor are forwarded.
class strand_executor {
 public:
  strand_executor() = default;

  template <class Base>
    requires(!std::is_same_v<std::decay_t<Base>, strand_executor> &&
             std::is_convertible_v<Base, any_executor>)
  explicit strand_executor(Base base)
      : state_(std::make_shared<state>(any_executor{std::move(base)})) {}

  void post(detail::unique_function<void()> f) const noexcept {
    STRATA_ENSURE(state_, "strand_executor::post: empty strand");
    if (state_->enqueue(std::move(f))) {
      auto st = state_;
      st->base.post([st]() noexcept { strand_executor::drain(st); });
    }
  }

  /// Runs `f` inline when already draining this strand on the calling thread.
  void dispatch(detail::unique_function<void()> f) const noexcept {
    STRATA_ENSURE(state_, "strand_executor::dispatch: empty strand");
    auto const cur_any = detail::get_current_executor();
    auto const* cur = detail::any_executor_access::target<strand_executor>(cur_any);
    if (cur != nullptr && *cur == *this) {
      f();
      return;
    }
    post(std::move(f));
  }

  explicit operator bool() const noexcept { return state_ != nullptr; }

  auto base() const noexcept -> any_executor { return state_ ? state_->base : any_executor{}; }

  friend auto operator==(strand_executor const& a, strand_executor const& b) noexcept -> bool {
    return a.state_.get() == b.state_.get();
  }

 private:
  friend struct detail::executor_traits<strand_executor>;
  struct state;

  explicit strand_executor(std::shared_ptr<state> st) noexcept : state_(std::move(st)) {}

  struct state {
    explicit state(any_executor base_) : base(std::move(base_)) {}

    any_executor base{};
    std::mutex m{};
    std::queue<detail::unique_function<void()>> tasks{};
    bool active{false};  // a drain is scheduled or running

    auto enqueue(detail::unique_function<void()> fn) -> bool {
      std::scoped_lock lk{m};
      tasks.emplace(std::move(fn));
      return !std::exchange(active, true);
    }

    auto try_pop(detail::unique_function<void()>& out) -> bool {
      std::scoped_lock lk{m};
      if (tasks.empty()) {
        active = false;
        return false;
      }
      out = std::move(tasks.front());
      tasks.pop();
      return true;
    }
  };

  static void drain(std::shared_ptr<state> const& st) noexcept {
    strand_executor self{st};
    detail::executor_guard g{any_executor{self}};

    detail::unique_function<void()> fn{};
    while (st->try_pop(fn)) {
      try {
        fn();
      } catch (...) {
        log::report_exception(std::current_exception(), "strand task");
      }
      fn = nullptr;
    }
  }

  std::shared_ptr<state> state_{};
};

inline auto make_strand(any_executor base) -> strand_executor {
  return strand_executor{std::move(base)};
}

}  // namespace strata

namespace strata::detail {

template <>
struct executor_traits<strand_executor> {
  static auto capabilities(strand_executor const& ex) noexcept -> executor_capability {
    return ex.state_ ? ex.state_->base.capabilities() : executor_capability::none;
  }

  static auto get_reactor(strand_executor const& ex) noexcept -> reactor* {
    return ex.state_ ? ex.state_->base.get_reactor() : nullptr;
  }
};

}  // namespace strata::detail
