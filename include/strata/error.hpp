#pragma once

#include <system_error>
#include <type_traits>

namespace strata {

/// Specific error codes reported by strata.
///
/// Every code belongs to exactly one `error_kind` (see below), except `frame_too_large`,
/// which is both a decode and an encode condition depending on which side produced it.
enum class error {
  /// Operation cancelled (close, stop request, or explicit cancel).
  operation_aborted = 1,

  /// Generic deadline expiry.
  timed_out,

  /// Invalid argument or inconsistent configuration.
  invalid_argument,

  /// The transport (or underlying resource) is not open.
  not_open,

  /// A conflicting operation is in flight.
  busy,

  /// A non-blocking operation could not make progress.
  would_block,

  /// Peer closed the stream.
  eof,
  connection_reset,
  broken_pipe,

  /// Listener is not accepting.
  not_listening,

  /// Name resolution produced no usable candidate.
  host_not_found,

  // Framing.
  malformed_frame,
  frame_too_large,
  unencodable_frame,

  // Timers.
  idle_timeout,
  request_timeout,
  connect_timeout,

  // TLS layering.
  handshake_failed,

  // Service.
  service_unavailable,

  // Graceful shutdown.
  shutdown_timeout,
  rejected_during_shutdown,

  /// `call` invoked without a preceding ready `poll_ready`.
  call_without_ready,
};

/// Error kinds used for propagation decisions.
///
/// `error_kind` is an error condition: compare any `std::error_code` against it, e.g.
/// `ec == error_kind::timeout`.
enum class error_kind {
  io = 1,
  decode,
  encode,
  timeout,
  handshake,
  service,
  shutdown,
  programming,
  cancelled,
};

auto make_error_code(error e) -> std::error_code;
auto make_error_condition(error_kind k) -> std::error_condition;

auto error_category() -> std::error_category const&;
auto error_kind_category() -> std::error_category const&;

/// Primary kind of `ec`.
///
/// Codes from foreign categories are classified as `io` when they are errno values and as
/// `service` otherwise (a service is free to return its own error codes).
auto kind_of(std::error_code const& ec) noexcept -> error_kind;

/// True for kinds that terminate a connection.
auto is_fatal(error_kind k) noexcept -> bool;

}  // namespace strata

namespace std {

template <>
struct is_error_code_enum<strata::error> : std::true_type {};

template <>
struct is_error_condition_enum<strata::error_kind> : std::true_type {};

}  // namespace std
