#include <strata/error.hpp>

#include <string>

namespace strata {

namespace detail {

inline auto kind_of_code(error e) noexcept -> error_kind {
  switch (e) {
    case error::operation_aborted:
      return error_kind::cancelled;

    case error::timed_out:
    case error::idle_timeout:
    case error::request_timeout:
    case error::connect_timeout:
      return error_kind::timeout;

    case error::invalid_argument:
    case error::call_without_ready:
      return error_kind::programming;

    case error::malformed_frame:
    case error::frame_too_large:
      return error_kind::decode;
    case error::unencodable_frame:
      return error_kind::encode;

    case error::handshake_failed:
      return error_kind::handshake;

    case error::service_unavailable:
      return error_kind::service;

    case error::shutdown_timeout:
    case error::rejected_during_shutdown:
      return error_kind::shutdown;

    case error::not_open:
    case error::busy:
    case error::would_block:
    case error::eof:
    case error::connection_reset:
    case error::broken_pipe:
    case error::not_listening:
    case error::host_not_found:
      return error_kind::io;
  }
  return error_kind::io;
}

class error_category_impl final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "strata"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error>(ev)) {
      case error::operation_aborted:
        return "operation aborted";
      case error::timed_out:
        return "timed out";
      case error::invalid_argument:
        return "invalid argument";
      case error::not_open:
        return "resource not open";
      case error::busy:
        return "resource busy";
      case error::would_block:
        return "operation would block";
      case error::eof:
        return "end of file";
      case error::connection_reset:
        return "connection reset";
      case error::broken_pipe:
        return "broken pipe";
      case error::not_listening:
        return "not listening";
      case error::host_not_found:
        return "host not found";
      case error::malformed_frame:
        return "malformed frame";
      case error::frame_too_large:
        return "frame too large";
      case error::unencodable_frame:
        return "frame cannot be encoded";
      case error::idle_timeout:
        return "keep-alive timeout";
      case error::request_timeout:
        return "request timeout";
      case error::connect_timeout:
        return "connect timeout";
      case error::handshake_failed:
        return "tls handshake failed";
      case error::service_unavailable:
        return "service unavailable";
      case error::shutdown_timeout:
        return "shutdown timeout";
      case error::rejected_during_shutdown:
        return "request rejected during shutdown";
      case error::call_without_ready:
        return "call without ready poll_ready";
      default:
        return "unknown error";
    }
  }

  auto default_error_condition(int ev) const noexcept -> std::error_condition override {
    return make_error_condition(kind_of_code(static_cast<error>(ev)));
  }

  auto equivalent(int code, std::error_condition const& cond) const noexcept -> bool override {
    if (cond.category() != error_kind_category()) {
      return std::error_category::equivalent(code, cond);
    }
    auto const e = static_cast<error>(code);
    // frame_too_large is produced by both sides of a codec.
    if (e == error::frame_too_large && cond.value() == static_cast<int>(error_kind::encode)) {
      return true;
    }
    return static_cast<int>(kind_of_code(e)) == cond.value();
  }
};

class error_kind_category_impl final : public std::error_category {
 public:
  auto name() const noexcept -> char const* override { return "strata.kind"; }

  auto message(int ev) const -> std::string override {
    switch (static_cast<error_kind>(ev)) {
      case error_kind::io:
        return "io error";
      case error_kind::decode:
        return "decode error";
      case error_kind::encode:
        return "encode error";
      case error_kind::timeout:
        return "timeout error";
      case error_kind::handshake:
        return "handshake error";
      case error_kind::service:
        return "service error";
      case error_kind::shutdown:
        return "shutdown error";
      case error_kind::programming:
        return "programming error";
      case error_kind::cancelled:
        return "cancelled";
      default:
        return "unknown error kind";
    }
  }

  auto equivalent(std::error_code const& code, int cond) const noexcept -> bool override {
    if (code.category() == strata::error_category()) {
      return code.category().equivalent(code.value(), std::error_condition{cond, *this});
    }
    return static_cast<int>(kind_of(code)) == cond;
  }
};

}  // namespace detail

inline auto error_category() -> std::error_category const& {
  static detail::error_category_impl instance;
  return instance;
}

inline auto error_kind_category() -> std::error_category const& {
  static detail::error_kind_category_impl instance;
  return instance;
}

inline auto make_error_code(error e) -> std::error_code {
  return {static_cast<int>(e), error_category()};
}

inline auto make_error_condition(error_kind k) -> std::error_condition {
  return {static_cast<int>(k), error_kind_category()};
}

inline auto kind_of(std::error_code const& ec) noexcept -> error_kind {
  if (ec.category() == error_category()) {
    return detail::kind_of_code(static_cast<error>(ec.value()));
  }
  if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
    if (ec == std::errc::operation_canceled) {
      return error_kind::cancelled;
    }
    if (ec == std::errc::timed_out) {
      return error_kind::timeout;
    }
    return error_kind::io;
  }
  return error_kind::service;
}

inline auto is_fatal(error_kind k) noexcept -> bool {
  switch (k) {
    case error_kind::io:
    case error_kind::decode:
    case error_kind::encode:
    case error_kind::timeout:
    case error_kind::handshake:
    case error_kind::shutdown:
      return true;
    default:
      return false;
  }
}

}  // namespace strata
