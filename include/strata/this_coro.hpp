#pragma once

namespace strata::this_coro {

/// `co_await this_coro::executor` yields the executor of the running coroutine.
struct executor_t {};
inline constexpr executor_t executor{};

/// `co_await this_coro::io_executor` yields it as an `any_io_executor`.
struct io_executor_t {};
inline constexpr io_executor_t io_executor{};

/// `co_await this_coro::stop_token` yields the stop token of the running coroutine.
struct stop_token_t {};
inline constexpr stop_token_t stop_token{};

}  // namespace strata::this_coro
