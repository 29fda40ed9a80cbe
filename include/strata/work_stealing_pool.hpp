#pragma once

#include <strata/any_executor.hpp>
#include <strata/any_io_executor.hpp>
#include <strata/assert.hpp>
#include <strata/detail/executor_guard.hpp>
#include <strata/detail/unique_function.hpp>
#include <strata/io_context.hpp>
#include <strata/work_guard.hpp>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

namespace strata {

/// Thread pool where idle workers steal queued tasks from busy ones.
///
/// - Each worker owns a deque. Tasks posted from a worker go to its own deque and are taken
///   LIFO; tasks posted from outside are spread round-robin. Idle workers steal FIFO.
/// - One extra thread runs an io_context that serves readiness waits and timers. Its
///   callbacks post resumption back to the pool, so coroutines may move between workers.
/// - The executor is IO-capable: its reactor is the pool's io_context.
class work_stealing_pool {
  struct shared_state;

 public:
  class executor_type {
   public:
    executor_type() noexcept = default;
    explicit executor_type(std::shared_ptr<shared_state> st) noexcept : st_(std::move(st)) {}

    void post(detail::unique_function<void()> f) const noexcept;
    void dispatch(detail::unique_function<void()> f) const noexcept;

    explicit operator bool() const noexcept { return st_ != nullptr; }

    friend auto operator==(executor_type const& a, executor_type const& b) noexcept -> bool {
      return a.st_.get() == b.st_.get();
    }

   private:
    friend struct detail::executor_traits<executor_type>;
    std::shared_ptr<shared_state> st_{};
  };

  explicit work_stealing_pool(std::size_t n_workers);

  work_stealing_pool(work_stealing_pool const&) = delete;
  auto operator=(work_stealing_pool const&) -> work_stealing_pool& = delete;
  work_stealing_pool(work_stealing_pool&&) = delete;
  auto operator=(work_stealing_pool&&) -> work_stealing_pool& = delete;

  ~work_stealing_pool();

  auto get_executor() noexcept -> any_io_executor;

  /// Stop workers and the reactor thread (idempotent). Queued tasks are dropped.
  void stop() noexcept;
  void join() noexcept;

  auto size() const noexcept -> std::size_t;

  /// Number of tasks executed by a worker other than the one they were queued on.
  auto steal_count() const noexcept -> std::size_t;

 private:
  struct worker_queue {
    std::mutex m{};
    std::deque<detail::unique_function<void()>> tasks{};
  };

  struct shared_state {
    explicit shared_state(std::size_t n);

    void submit(detail::unique_function<void()> f);
    auto try_take(std::size_t self) -> std::optional<detail::unique_function<void()>>;
    void worker_loop(std::size_t self);
    auto current_worker() const noexcept -> std::optional<std::size_t>;

    std::vector<std::unique_ptr<worker_queue>> queues;
    std::mutex idle_m{};
    std::condition_variable idle_cv{};
    std::atomic<std::size_t> queued{0};
    std::atomic<std::size_t> steals{0};
    std::atomic<std::size_t> rr{0};
    std::atomic<bool> stopped{false};
    io_context reactor_ctx{};
  };

  std::shared_ptr<shared_state> st_;
  std::optional<work_guard> reactor_guard_{};
  std::vector<std::thread> workers_{};
  std::thread reactor_thread_{};
};

}  // namespace strata

namespace strata::detail {

template <>
struct executor_traits<work_stealing_pool::executor_type> {
  static auto capabilities(work_stealing_pool::executor_type const& ex) noexcept
    -> executor_capability {
    return ex ? executor_capability::io : executor_capability::none;
  }

  static auto get_reactor(work_stealing_pool::executor_type const& ex) noexcept -> reactor* {
    return ex ? ex.st_->reactor_ctx.get_executor().get_reactor() : nullptr;
  }
};

}  // namespace strata::detail
