#pragma once

#include <strata/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

#include <netinet/in.h>
#include <sys/socket.h>

namespace strata {

/// A connection target: host name or numeric address, plus port.
struct address {
  std::string host{};
  std::uint16_t port{0};

  /// Parse `host:port` or `[v6]:port`.
  static auto parse(std::string_view s) -> result<address>;

  auto to_string() const -> std::string;

  friend auto operator==(address const&, address const&) -> bool = default;
};

/// A resolved IPv4/IPv6 socket address.
class endpoint {
 public:
  endpoint() noexcept;

  /// Parse a numeric host (no name lookup).
  static auto from_numeric(std::string_view host, std::uint16_t port) -> result<endpoint>;

  /// Copy a native address. Fails for families other than AF_INET / AF_INET6.
  static auto from_native(sockaddr const* addr, socklen_t len) -> result<endpoint>;

  auto data() const noexcept -> sockaddr const* {
    return reinterpret_cast<sockaddr const*>(&storage_);
  }
  auto data() noexcept -> sockaddr* { return reinterpret_cast<sockaddr*>(&storage_); }
  auto size() const noexcept -> socklen_t { return size_; }
  auto family() const noexcept -> int { return static_cast<int>(storage_.ss_family); }

  auto port() const noexcept -> std::uint16_t;

  /// Numeric host only, without port or brackets.
  auto host() const -> std::string;

  /// `a.b.c.d:port` or `[v6]:port`.
  auto to_string() const -> std::string;

  friend auto operator==(endpoint const& a, endpoint const& b) noexcept -> bool;

 private:
  sockaddr_storage storage_{};
  socklen_t size_{0};
};

}  // namespace strata
