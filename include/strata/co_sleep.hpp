#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/assert.hpp>
#include <strata/awaitable.hpp>
#include <strata/steady_timer.hpp>
#include <strata/this_coro.hpp>

#include <chrono>
#include <system_error>

namespace strata {

/// Suspend the current coroutine for at least `d` on `ex`'s reactor.
///
/// Returns `error::operation_aborted` when the coroutine is asked to stop first.
inline auto co_sleep(any_io_executor ex, std::chrono::steady_clock::duration d)
  -> awaitable<std::error_code> {
  STRATA_ENSURE(ex, "co_sleep: requires a non-empty executor");
  steady_timer t{ex, d};
  co_return co_await t.async_wait(use_awaitable);
}

/// Suspend the current coroutine for at least `d` on its own executor.
inline auto co_sleep(std::chrono::steady_clock::duration d) -> awaitable<std::error_code> {
  auto ex = co_await this_coro::io_executor;
  co_return co_await co_sleep(ex, d);
}

}  // namespace strata
