#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/co_spawn.hpp>
#include <strata/io_context.hpp>
#include <strata/result.hpp>
#include <strata/strand.hpp>
#include <strata/thread_pool.hpp>
#include <strata/work_stealing_pool.hpp>
#include <strata/work_guard.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace strata {

enum class runtime_backend : std::uint8_t {
  /// One io_context driven by the thread calling `run()`.
  single_thread,
  /// N io_context shards, one thread each; a connection stays on its shard.
  thread_per_core,
  /// N stealing workers plus a reactor thread; each connection runs on its own strand.
  work_stealing,
};

auto to_string(runtime_backend b) noexcept -> char const*;

struct runtime_config {
  runtime_backend backend = runtime_backend::single_thread;
  /// Worker count for the multi-threaded backends; 0 picks the hardware concurrency.
  std::size_t threads = 0;

  auto validate() const -> std::error_code;
};

namespace detail {

class single_thread_backend {
 public:
  single_thread_backend() = default;

  auto get_executor() noexcept -> any_io_executor { return ctx_.get_executor(); }
  auto connection_executor() noexcept -> any_io_executor { return ctx_.get_executor(); }

  void run();
  void stop() { ctx_.stop(); }
  void join() {}

 private:
  io_context ctx_{};
};

/// Shared by the multi-threaded backends: `run()` parks the caller until `stop()`.
class stop_latch {
 public:
  void wait() {
    std::unique_lock lk{m_};
    cv_.wait(lk, [this] { return stopped_; });
  }

  void release() {
    {
      std::scoped_lock lk{m_};
      stopped_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex m_{};
  std::condition_variable cv_{};
  bool stopped_{false};
};

class thread_per_core_backend {
 public:
  explicit thread_per_core_backend(std::size_t threads) : pool_(threads) {}

  auto get_executor() noexcept -> any_io_executor { return pool_.shard(0); }
  auto connection_executor() noexcept -> any_io_executor { return pool_.pick_executor(); }

  void run() { latch_.wait(); }
  void stop() {
    pool_.stop();
    latch_.release();
  }
  void join() { pool_.join(); }

 private:
  thread_pool pool_;
  stop_latch latch_{};
};

class work_stealing_backend {
 public:
  explicit work_stealing_backend(std::size_t threads) : pool_(threads) {}

  auto get_executor() noexcept -> any_io_executor { return pool_.get_executor(); }

  /// A fresh strand: the connection's steps never run concurrently.
  auto connection_executor() -> any_io_executor {
    return any_io_executor{make_strand(pool_.get_executor())};
  }

  void run() { latch_.wait(); }
  void stop() {
    pool_.stop();
    latch_.release();
  }
  void join() { pool_.join(); }

  auto pool() noexcept -> work_stealing_pool& { return pool_; }

 private:
  work_stealing_pool pool_;
  stop_latch latch_{};
};

}  // namespace detail

/// Process-wide execution capability.
///
/// Exactly one backend is bound at construction. Everything above the runtime uses only the
/// executors it hands out, so dispatcher, IO and service code run unchanged on any backend.
///
/// Surface: `spawn(task)`, `timer(duration)`, `now()`, plus `connection_executor()` for
/// placing a new connection.
class runtime {
 public:
  using clock = std::chrono::steady_clock;

  /// Construct with a configuration that `validate()`s; see `create()` for checked
  /// construction.
  explicit runtime(runtime_config cfg = {});

  runtime(runtime const&) = delete;
  auto operator=(runtime const&) -> runtime& = delete;
  runtime(runtime&&) = delete;
  auto operator=(runtime&&) -> runtime& = delete;

  ~runtime();

  static auto create(runtime_config cfg) -> result<std::unique_ptr<runtime>>;

  auto backend() const noexcept -> runtime_backend { return cfg_.backend; }
  auto config() const noexcept -> runtime_config const& { return cfg_; }

  /// Executor for general tasks.
  auto get_executor() -> any_io_executor;

  /// Executor for a new connection (shard, strand or the single context).
  auto connection_executor() -> any_io_executor;

  /// Start a task (a callable returning `awaitable<T>`) on the runtime executor.
  template <class F>
    requires detail::awaitable_factory<std::remove_cvref_t<F>>
  void spawn(F&& f) {
    co_spawn(get_executor(), std::forward<F>(f), detached);
  }

  /// Wake-up event after `d`; `error::operation_aborted` if the caller is stopped first.
  auto timer(clock::duration d) -> awaitable<std::error_code>;

  static auto now() noexcept -> clock::time_point { return clock::now(); }

  /// Block the calling thread until `stop()` (single_thread: drive the loop until then).
  void run();

  /// Request every backend thread to stop (idempotent, thread-safe).
  void stop();

  /// Join backend threads after `stop()`.
  void join();

 private:
  using backend_variant = std::variant<std::monostate, detail::single_thread_backend,
                                       detail::thread_per_core_backend,
                                       detail::work_stealing_backend>;

  template <class R, class F>
  auto visit(F&& f) -> R {
    return std::visit(
      [&](auto& b) -> R {
        if constexpr (std::is_same_v<std::decay_t<decltype(b)>, std::monostate>) {
          STRATA_UNREACHABLE();
        } else {
          return f(b);
        }
      },
      backend_);
  }

  runtime_config cfg_;
  backend_variant backend_{};
};

}  // namespace strata
