#include <strata/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>

namespace strata::log {

namespace detail {

struct logger_slot {
  std::mutex m{};
  std::shared_ptr<spdlog::logger> current{};
};

inline auto slot() -> logger_slot& {
  static logger_slot s;
  return s;
}

inline auto make_default_logger() -> std::shared_ptr<spdlog::logger> {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto l = std::make_shared<spdlog::logger>("strata", std::move(sink));
  l->set_level(spdlog::level::warn);
  l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] [t%t] %v");
  return l;
}

}  // namespace detail

inline auto logger() -> std::shared_ptr<spdlog::logger> {
  auto& s = detail::slot();
  std::scoped_lock lk{s.m};
  if (!s.current) {
    s.current = detail::make_default_logger();
  }
  return s.current;
}

inline void set_logger(std::shared_ptr<spdlog::logger> l) {
  auto& s = detail::slot();
  std::scoped_lock lk{s.m};
  s.current = l ? std::move(l) : detail::make_default_logger();
}

inline void set_level(spdlog::level::level_enum level) { logger()->set_level(level); }

inline void report_exception(std::exception_ptr ep, char const* where) noexcept {
  try {
    std::rethrow_exception(ep);
  } catch (std::exception const& e) {
    logger()->error("{}: unhandled exception: {}", where, e.what());
  } catch (...) {
    logger()->error("{}: unhandled non-standard exception", where);
  }
}

}  // namespace strata::log
