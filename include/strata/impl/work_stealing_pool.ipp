#include <strata/assert.hpp>
#include <strata/log.hpp>
#include <strata/work_stealing_pool.hpp>

#include <exception>
#include <utility>

namespace strata {

namespace detail {

struct stealing_worker_tls {
  void const* pool = nullptr;
  std::size_t index = 0;
};

inline thread_local stealing_worker_tls current_stealing_worker{};

}  // namespace detail

inline work_stealing_pool::shared_state::shared_state(std::size_t n) {
  queues.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    queues.push_back(std::make_unique<worker_queue>());
  }
}

inline auto work_stealing_pool::shared_state::current_worker() const noexcept
  -> std::optional<std::size_t> {
  if (detail::current_stealing_worker.pool == this) {
    return detail::current_stealing_worker.index;
  }
  return std::nullopt;
}

inline void work_stealing_pool::shared_state::submit(detail::unique_function<void()> f) {
  auto const target = current_worker().value_or(rr.fetch_add(1, std::memory_order_relaxed) %
                                                queues.size());
  // Count first so a take never observes more tasks than were announced.
  {
    std::scoped_lock lk{idle_m};
    queued.fetch_add(1, std::memory_order_release);
  }
  {
    std::scoped_lock lk{queues[target]->m};
    queues[target]->tasks.push_back(std::move(f));
  }
  idle_cv.notify_one();
}

inline auto work_stealing_pool::shared_state::try_take(std::size_t self)
  -> std::optional<detail::unique_function<void()>> {
  {
    auto& own = *queues[self];
    std::scoped_lock lk{own.m};
    if (!own.tasks.empty()) {
      auto f = std::move(own.tasks.back());
      own.tasks.pop_back();
      queued.fetch_sub(1, std::memory_order_acq_rel);
      return f;
    }
  }

  for (std::size_t k = 1; k < queues.size(); ++k) {
    auto& victim = *queues[(self + k) % queues.size()];
    std::scoped_lock lk{victim.m};
    if (!victim.tasks.empty()) {
      auto f = std::move(victim.tasks.front());
      victim.tasks.pop_front();
      queued.fetch_sub(1, std::memory_order_acq_rel);
      steals.fetch_add(1, std::memory_order_relaxed);
      return f;
    }
  }
  return std::nullopt;
}

inline void work_stealing_pool::shared_state::worker_loop(std::size_t self) {
  detail::current_stealing_worker = detail::stealing_worker_tls{this, self};

  while (!stopped.load(std::memory_order_acquire)) {
    if (auto task = try_take(self)) {
      try {
        (*task)();
      } catch (...) {
        log::report_exception(std::current_exception(), "work_stealing_pool task");
      }
      continue;
    }

    std::unique_lock lk{idle_m};
    idle_cv.wait(lk, [this] {
      return stopped.load(std::memory_order_acquire) ||
             queued.load(std::memory_order_acquire) > 0;
    });
  }

  detail::current_stealing_worker = detail::stealing_worker_tls{};
}

inline void work_stealing_pool::executor_type::post(
  detail::unique_function<void()> f) const noexcept {
  STRATA_ENSURE(st_, "work_stealing_pool::executor_type: empty");
  st_->submit([ex = *this, fn = std::move(f)]() mutable {
    detail::executor_guard g{any_executor{ex}};
    fn();
  });
}

inline void work_stealing_pool::executor_type::dispatch(
  detail::unique_function<void()> f) const noexcept {
  STRATA_ENSURE(st_, "work_stealing_pool::executor_type: empty");
  if (st_->current_worker().has_value()) {
    detail::executor_guard g{any_executor{*this}};
    f();
    return;
  }
  post(std::move(f));
}

inline work_stealing_pool::work_stealing_pool(std::size_t n_workers) {
  STRATA_ENSURE(n_workers > 0, "work_stealing_pool: n_workers must be > 0");
  st_ = std::make_shared<shared_state>(n_workers);
  reactor_guard_.emplace(st_->reactor_ctx.get_executor());

  workers_.reserve(n_workers);
  for (std::size_t i = 0; i < n_workers; ++i) {
    workers_.emplace_back([st = st_, i] { st->worker_loop(i); });
  }
  reactor_thread_ = std::thread{[st = st_] {
    try {
      (void)st->reactor_ctx.run();
    } catch (...) {
      log::report_exception(std::current_exception(), "work_stealing_pool reactor");
    }
  }};
}

inline work_stealing_pool::~work_stealing_pool() {
  stop();
  join();
}

inline auto work_stealing_pool::get_executor() noexcept -> any_io_executor {
  return any_io_executor{executor_type{st_}};
}

inline void work_stealing_pool::stop() noexcept {
  {
    std::scoped_lock lk{st_->idle_m};
    st_->stopped.store(true, std::memory_order_release);
  }
  st_->idle_cv.notify_all();
  st_->reactor_ctx.stop();
}

inline void work_stealing_pool::join() noexcept {
  for (auto& t : workers_) {
    if (t.joinable()) {
      t.join();
    }
  }
  if (reactor_thread_.joinable()) {
    reactor_thread_.join();
  }
  reactor_guard_.reset();
}

inline auto work_stealing_pool::size() const noexcept -> std::size_t { return st_->queues.size(); }

inline auto work_stealing_pool::steal_count() const noexcept -> std::size_t {
  return st_->steals.load(std::memory_order_relaxed);
}

}  // namespace strata
