#pragma once

#include <strata/awaitable.hpp>
#include <strata/error.hpp>
#include <strata/io_object.hpp>
#include <strata/result.hpp>
#include <strata/transport.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <system_error>

namespace strata {

enum class tls_role : std::uint8_t { client, server };

enum class tls_verify : std::uint8_t {
  /// Accept any peer certificate.
  none,
  /// Require a certificate chaining to `ca_pem` (or the backend's default store).
  peer,
};

/// Backend-neutral TLS settings. Certificate material is PEM text.
struct tls_config {
  tls_role role = tls_role::client;
  std::string certificate_pem{};
  std::string private_key_pem{};
  std::string ca_pem{};
  tls_verify verify = tls_verify::peer;
  /// SNI and the name checked against the peer certificate (client role).
  std::string server_name{};

  auto validate() const -> std::error_code {
    if (role == tls_role::server && (certificate_pem.empty() || private_key_pem.empty())) {
      return error::invalid_argument;
    }
    return {};
  }
};

enum class handshake_status : std::uint8_t { complete, want_read, want_write, failed };

auto to_string(handshake_status s) noexcept -> char const*;

/// One TLS session's handshake driven over a plain transport.
///
/// `step` performs as much of the handshake as the transport allows without blocking.
/// After `complete`, `wrap` returns a transport that encrypts writes and decrypts reads over
/// the given plain one; the returned transport must not depend on the engine's lifetime.
class tls_engine {
 public:
  tls_engine() = default;
  tls_engine(tls_engine const&) = delete;
  auto operator=(tls_engine const&) -> tls_engine& = delete;
  virtual ~tls_engine() = default;

  virtual void begin(tls_role role) = 0;
  virtual auto step(transport& plain) -> handshake_status = 0;
  virtual auto is_complete() const noexcept -> bool = 0;
  virtual auto wrap(std::unique_ptr<transport> plain) -> std::unique_ptr<transport> = 0;
};

/// Creates engines for a TLS backend.
class tls_provider {
 public:
  tls_provider() = default;
  tls_provider(tls_provider const&) = delete;
  auto operator=(tls_provider const&) -> tls_provider& = delete;
  virtual ~tls_provider() = default;

  virtual auto create_engine(tls_config const& cfg) -> result<std::unique_ptr<tls_engine>> = 0;
};

/// Run the handshake of `engine` over `io`'s transport, then replace that transport with the
/// engine's wrapper.
///
/// Want-read/want-write suspend on the transport. Fails with `error::handshake_failed`, or
/// `error::timed_out` when `timeout` (zero for none) elapses first.
auto async_handshake(io_object& io, tls_engine& engine, tls_role role,
                     std::chrono::steady_clock::duration timeout) -> awaitable<std::error_code>;

}  // namespace strata
