#pragma once

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <memory>

namespace strata::log {

/// Logger used by every strata component.
///
/// Created on first use as a stderr colour logger named "strata" with level `warn`. It is not
/// registered in spdlog's global registry, so applications can install their own logger under
/// the same name and hand it over with `set_logger()`.
auto logger() -> std::shared_ptr<spdlog::logger>;

/// Replace the library logger. A null pointer restores the default logger.
void set_logger(std::shared_ptr<spdlog::logger> l);

void set_level(spdlog::level::level_enum level);

/// Log an exception that escaped a task with no caller to receive it.
void report_exception(std::exception_ptr ep, char const* where) noexcept;

}  // namespace strata::log
