#pragma once

#include <strata/awaitable.hpp>
#include <strata/result.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <system_error>

namespace strata {

enum class wait_type : std::uint8_t { read, write };

/// A non-blocking byte stream.
///
/// `read_some` / `write_some` never suspend: they transfer what is possible right now or fail
/// with `error::would_block`. `async_wait` is the only suspension point. `read_some` returning
/// 0 for a non-empty buffer means end of stream.
///
/// Implementations: `socket_transport` (TCP), TLS wrappers produced by a `tls_engine`, and
/// test doubles.
class transport {
 public:
  transport() = default;
  transport(transport const&) = delete;
  auto operator=(transport const&) -> transport& = delete;

  virtual ~transport() = default;

  virtual auto read_some(std::span<std::byte> buf) -> result<std::size_t> = 0;
  virtual auto write_some(std::span<std::byte const> buf) -> result<std::size_t> = 0;

  /// Suspend until the stream is readable or writable.
  ///
  /// Completes with `error::operation_aborted` on `cancel()`, `close()` or a stop request on
  /// the awaiting coroutine.
  virtual auto async_wait(wait_type w) -> awaitable<std::error_code> = 0;

  /// Half-close the sending side.
  virtual auto shutdown_send() -> std::error_code = 0;

  /// Abort pending waits; the stream stays open.
  virtual void cancel() noexcept = 0;

  /// Abort pending waits and release the stream (idempotent).
  virtual void close() noexcept = 0;

  virtual auto is_open() const noexcept -> bool = 0;

  /// Remote address in text form, empty when unknown.
  virtual auto peer() const -> std::string = 0;
};

}  // namespace strata
