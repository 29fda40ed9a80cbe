#pragma once

#include <strata/address.hpp>
#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/detail/fd_wait.hpp>
#include <strata/result.hpp>
#include <strata/transport.hpp>

#include <atomic>
#include <cerrno>
#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <system_error>

namespace strata {

/// TCP stream over a non-blocking socket fd registered with the executor's reactor.
///
/// `cancel()` and `close()` are thread-safe. At most one wait per direction may be pending.
class socket_transport final : public transport {
 public:
  /// Adopt a connected socket. The fd is switched to non-blocking mode.
  socket_transport(any_io_executor ex, int fd) noexcept;

  ~socket_transport() override;

  /// Open a socket for `ep`'s family and connect it without blocking.
  ///
  /// Stops with `error::operation_aborted` when the awaiting coroutine is asked to stop.
  static auto connect(any_io_executor ex, endpoint const& ep)
    -> awaitable<result<std::unique_ptr<socket_transport>>>;

  auto read_some(std::span<std::byte> buf) -> result<std::size_t> override;
  auto write_some(std::span<std::byte const> buf) -> result<std::size_t> override;
  auto async_wait(wait_type w) -> awaitable<std::error_code> override;
  auto shutdown_send() -> std::error_code override;
  void cancel() noexcept override;
  void close() noexcept override;
  auto is_open() const noexcept -> bool override { return native_handle() >= 0; }
  auto peer() const -> std::string override;

  auto native_handle() const noexcept -> int { return fd_.load(std::memory_order_acquire); }
  auto get_executor() const noexcept -> any_io_executor { return ex_; }

  auto set_nodelay(bool on) noexcept -> std::error_code;

 private:
  any_io_executor ex_;
  std::atomic<int> fd_;
  detail::fd_handle_slot read_slot_{};
  detail::fd_handle_slot write_slot_{};
};

namespace detail {

/// Set O_NONBLOCK and FD_CLOEXEC.
auto make_nonblocking(int fd) noexcept -> std::error_code;

inline auto last_error() noexcept -> std::error_code {
  return std::error_code(errno, std::generic_category());
}

}  // namespace detail

}  // namespace strata
