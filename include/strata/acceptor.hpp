#pragma once

#include <strata/address.hpp>
#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/detail/fd_wait.hpp>
#include <strata/result.hpp>

#include <atomic>
#include <system_error>

#include <sys/socket.h>

namespace strata {

/// Listening TCP socket.
///
/// Concurrency:
/// - Only one `async_accept()` may be pending; a second one fails with `error::busy`.
/// - `cancel()` and `close()` are thread-safe.
class acceptor {
 public:
  explicit acceptor(any_io_executor ex) noexcept : ex_(std::move(ex)) {}

  acceptor(acceptor const&) = delete;
  auto operator=(acceptor const&) -> acceptor& = delete;
  acceptor(acceptor&&) = delete;
  auto operator=(acceptor&&) -> acceptor& = delete;

  ~acceptor() { close(); }

  /// Open, bind (with SO_REUSEADDR) and listen.
  auto listen(endpoint const& ep, int backlog = SOMAXCONN) -> std::error_code;

  /// The bound address, e.g. to learn an ephemeral port.
  auto local_endpoint() const -> result<endpoint>;

  /// Accept one connection. Returns a non-blocking, close-on-exec fd owned by the caller.
  auto async_accept() -> awaitable<result<int>>;

  void cancel() noexcept { read_slot_.cancel(); }
  void close() noexcept;

  auto is_open() const noexcept -> bool { return native_handle() >= 0; }
  auto native_handle() const noexcept -> int { return fd_.load(std::memory_order_acquire); }
  auto get_executor() const noexcept -> any_io_executor const& { return ex_; }

 private:
  any_io_executor ex_;
  std::atomic<int> fd_{-1};
  std::atomic<bool> accepting_{false};
  detail::fd_handle_slot read_slot_{};
};

}  // namespace strata
