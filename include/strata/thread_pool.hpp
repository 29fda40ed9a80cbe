#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/io_context.hpp>
#include <strata/work_guard.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

namespace strata {

/// Runs N independent io_context shards, one worker thread each.
///
/// `pick_executor()` selects a shard round-robin. Work posted to a shard stays on that shard's
/// thread, so everything bound to one shard executor is single-threaded.
class thread_pool {
 public:
  explicit thread_pool(std::size_t n_threads);

  thread_pool(thread_pool const&) = delete;
  auto operator=(thread_pool const&) -> thread_pool& = delete;
  thread_pool(thread_pool&&) = delete;
  auto operator=(thread_pool&&) -> thread_pool& = delete;

  ~thread_pool();

  /// Stop all shards (idempotent).
  void stop() noexcept;

  /// Join all worker threads (idempotent).
  void join() noexcept;

  auto pick_executor() noexcept -> any_io_executor;

  /// Executor of shard `i`.
  auto shard(std::size_t i) noexcept -> any_io_executor;

  auto size() const noexcept -> std::size_t { return contexts_.size(); }

 private:
  std::vector<std::unique_ptr<io_context>> contexts_{};
  std::vector<work_guard> guards_{};
  std::vector<std::thread> threads_{};
  std::atomic<std::size_t> rr_{0};
};

}  // namespace strata
