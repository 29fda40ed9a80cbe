#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/assert.hpp>
#include <strata/detail/reactor.hpp>

#include <type_traits>
#include <utility>

namespace strata {

/// Keeps the reactor behind an IO executor from running out of work while alive.
class work_guard {
 public:
  template <class Ex>
    requires(!std::is_same_v<std::decay_t<Ex>, work_guard> &&
             std::is_convertible_v<Ex, any_io_executor>)
  explicit work_guard(Ex ex) : ex_(std::move(ex)), owns_(true) {
    STRATA_ENSURE(ex_, "work_guard: requires a non-empty executor");
    ex_.get_reactor()->add_work_guard();
  }

  work_guard(work_guard const&) = delete;
  auto operator=(work_guard const&) -> work_guard& = delete;

  work_guard(work_guard&& other) noexcept
      : ex_(std::move(other.ex_)), owns_(std::exchange(other.owns_, false)) {}

  auto operator=(work_guard&& other) noexcept -> work_guard& {
    if (this != &other) {
      reset();
      ex_ = std::move(other.ex_);
      owns_ = std::exchange(other.owns_, false);
    }
    return *this;
  }

  ~work_guard() { reset(); }

  auto get_executor() const noexcept -> any_io_executor { return ex_; }

  auto owns_work() const noexcept -> bool { return owns_; }

  void reset() noexcept {
    if (owns_) {
      ex_.get_reactor()->remove_work_guard();
      owns_ = false;
    }
  }

 private:
  any_io_executor ex_;
  bool owns_ = false;
};

}  // namespace strata
