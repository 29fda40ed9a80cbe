#include <strata/assert.hpp>
#include <strata/log.hpp>
#include <strata/thread_pool.hpp>

#include <exception>

namespace strata {

inline thread_pool::thread_pool(std::size_t n_threads) {
  STRATA_ENSURE(n_threads > 0, "thread_pool: n_threads must be > 0");

  contexts_.reserve(n_threads);
  guards_.reserve(n_threads);
  threads_.reserve(n_threads);

  for (std::size_t i = 0; i < n_threads; ++i) {
    contexts_.push_back(std::make_unique<io_context>());
    guards_.emplace_back(contexts_.back()->get_executor());
  }

  for (std::size_t i = 0; i < n_threads; ++i) {
    threads_.emplace_back([this, i] {
      try {
        (void)contexts_[i]->run();
      } catch (...) {
        log::report_exception(std::current_exception(), "thread_pool shard");
      }
    });
  }
}

inline thread_pool::~thread_pool() {
  stop();
  join();
}

inline void thread_pool::stop() noexcept {
  for (auto& ctx : contexts_) {
    ctx->stop();
  }
}

inline void thread_pool::join() noexcept {
  for (auto& t : threads_) {
    if (t.joinable()) {
      t.join();
    }
  }
}

inline auto thread_pool::pick_executor() noexcept -> any_io_executor {
  auto const i = rr_.fetch_add(1, std::memory_order_relaxed);
  return contexts_[i % contexts_.size()]->get_executor();
}

inline auto thread_pool::shard(std::size_t i) noexcept -> any_io_executor {
  STRATA_ENSURE(i < contexts_.size(), "thread_pool: shard index out of range");
  return contexts_[i]->get_executor();
}

}  // namespace strata
