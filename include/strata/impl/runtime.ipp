#include <strata/error.hpp>
#include <strata/log.hpp>
#include <strata/runtime.hpp>
#include <strata/this_coro.hpp>
#include <strata/co_sleep.hpp>

#include <thread>

namespace strata {

inline auto to_string(runtime_backend b) noexcept -> char const* {
  switch (b) {
    case runtime_backend::single_thread:
      return "single_thread";
    case runtime_backend::thread_per_core:
      return "thread_per_core";
    case runtime_backend::work_stealing:
      return "work_stealing";
  }
  return "unknown";
}

inline auto runtime_config::validate() const -> std::error_code {
  switch (backend) {
    case runtime_backend::single_thread:
      if (threads > 1) {
        return error::invalid_argument;
      }
      return {};
    case runtime_backend::thread_per_core:
    case runtime_backend::work_stealing:
      return {};
  }
  return error::invalid_argument;
}

namespace detail {

inline void single_thread_backend::run() {
  // Keep the loop alive while idle; only stop() ends run().
  work_guard guard{ctx_.get_executor()};
  (void)ctx_.run();
}

inline auto effective_threads(std::size_t requested) noexcept -> std::size_t {
  if (requested != 0) {
    return requested;
  }
  auto const hw = static_cast<std::size_t>(std::thread::hardware_concurrency());
  return hw == 0 ? 1 : hw;
}

}  // namespace detail

inline runtime::runtime(runtime_config cfg) : cfg_(cfg) {
  STRATA_ENSURE(!cfg_.validate(), "runtime: invalid configuration");
  switch (cfg_.backend) {
    case runtime_backend::single_thread:
      backend_.emplace<detail::single_thread_backend>();
      break;
    case runtime_backend::thread_per_core:
      backend_.emplace<detail::thread_per_core_backend>(detail::effective_threads(cfg_.threads));
      break;
    case runtime_backend::work_stealing:
      backend_.emplace<detail::work_stealing_backend>(detail::effective_threads(cfg_.threads));
      break;
  }
  log::logger()->debug("runtime: started backend={}", to_string(cfg_.backend));
}

inline runtime::~runtime() {
  stop();
  join();
}

inline auto runtime::create(runtime_config cfg) -> result<std::unique_ptr<runtime>> {
  if (auto ec = cfg.validate()) {
    log::logger()->warn("runtime: rejected configuration: {}", ec.message());
    return unexpected(ec);
  }
  return std::make_unique<runtime>(cfg);
}

inline auto runtime::get_executor() -> any_io_executor {
  return visit<any_io_executor>([](auto& b) { return b.get_executor(); });
}

inline auto runtime::connection_executor() -> any_io_executor {
  return visit<any_io_executor>([](auto& b) { return b.connection_executor(); });
}

inline auto runtime::timer(clock::duration d) -> awaitable<std::error_code> {
  auto ex = co_await this_coro::executor;
  if (ex && ex.supports_io()) {
    co_return co_await co_sleep(any_io_executor{ex}, d);
  }
  co_return co_await co_sleep(get_executor(), d);
}

inline void runtime::run() {
  visit<void>([](auto& b) { b.run(); });
}

inline void runtime::stop() {
  visit<void>([](auto& b) { b.stop(); });
}

inline void runtime::join() {
  visit<void>([](auto& b) { b.join(); });
}

}  // namespace strata
