#include <strata/address.hpp>
#include <strata/error.hpp>

#include <charconv>
#include <cstring>

#include <arpa/inet.h>

namespace strata {

namespace {

auto parse_port(std::string_view p) -> result<std::uint16_t> {
  if (p.empty()) {
    return unexpected(make_error_code(error::invalid_argument));
  }
  unsigned value = 0;
  auto const* first = p.data();
  auto const* last = p.data() + p.size();
  auto r = std::from_chars(first, last, value);
  if (r.ec != std::errc{} || r.ptr != last || value > 65535u) {
    return unexpected(make_error_code(error::invalid_argument));
  }
  return static_cast<std::uint16_t>(value);
}

}  // namespace

inline auto address::parse(std::string_view s) -> result<address> {
  if (s.empty()) {
    return unexpected(make_error_code(error::invalid_argument));
  }

  if (s.front() == '[') {
    auto const close = s.find(']');
    if (close == std::string_view::npos || close + 2 > s.size() || s[close + 1] != ':') {
      return unexpected(make_error_code(error::invalid_argument));
    }
    auto port = parse_port(s.substr(close + 2));
    if (!port) {
      return unexpected(port.error());
    }
    return address{std::string{s.substr(1, close - 1)}, *port};
  }

  auto const pos = s.rfind(':');
  if (pos == std::string_view::npos || pos == 0 || s.find(':') != pos) {
    return unexpected(make_error_code(error::invalid_argument));
  }
  auto port = parse_port(s.substr(pos + 1));
  if (!port) {
    return unexpected(port.error());
  }
  return address{std::string{s.substr(0, pos)}, *port};
}

inline auto address::to_string() const -> std::string {
  if (host.find(':') != std::string::npos) {
    return "[" + host + "]:" + std::to_string(port);
  }
  return host + ":" + std::to_string(port);
}

inline endpoint::endpoint() noexcept {
  auto* sa = reinterpret_cast<sockaddr_in*>(&storage_);
  sa->sin_family = AF_INET;
  sa->sin_addr.s_addr = htonl(INADDR_ANY);
  size_ = sizeof(sockaddr_in);
}

inline auto endpoint::from_numeric(std::string_view host, std::uint16_t port)
  -> result<endpoint> {
  std::string h{host};
  endpoint ep;

  sockaddr_in v4{};
  if (::inet_pton(AF_INET, h.c_str(), &v4.sin_addr) == 1) {
    v4.sin_family = AF_INET;
    v4.sin_port = htons(port);
    std::memcpy(&ep.storage_, &v4, sizeof(v4));
    ep.size_ = sizeof(v4);
    return ep;
  }

  sockaddr_in6 v6{};
  if (::inet_pton(AF_INET6, h.c_str(), &v6.sin6_addr) == 1) {
    v6.sin6_family = AF_INET6;
    v6.sin6_port = htons(port);
    std::memcpy(&ep.storage_, &v6, sizeof(v6));
    ep.size_ = sizeof(v6);
    return ep;
  }

  return unexpected(make_error_code(error::invalid_argument));
}

inline auto endpoint::from_native(sockaddr const* addr, socklen_t len) -> result<endpoint> {
  if (addr == nullptr) {
    return unexpected(make_error_code(error::invalid_argument));
  }
  if (!(addr->sa_family == AF_INET && len >= static_cast<socklen_t>(sizeof(sockaddr_in))) &&
      !(addr->sa_family == AF_INET6 && len >= static_cast<socklen_t>(sizeof(sockaddr_in6)))) {
    return unexpected(make_error_code(error::invalid_argument));
  }
  endpoint ep;
  auto const n = addr->sa_family == AF_INET ? sizeof(sockaddr_in) : sizeof(sockaddr_in6);
  std::memset(&ep.storage_, 0, sizeof(ep.storage_));
  std::memcpy(&ep.storage_, addr, n);
  ep.size_ = static_cast<socklen_t>(n);
  return ep;
}

inline auto endpoint::port() const noexcept -> std::uint16_t {
  if (family() == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6 const*>(&storage_)->sin6_port);
  }
  return ntohs(reinterpret_cast<sockaddr_in const*>(&storage_)->sin_port);
}

inline auto endpoint::host() const -> std::string {
  char buf[INET6_ADDRSTRLEN]{};
  if (family() == AF_INET6) {
    auto const* sa = reinterpret_cast<sockaddr_in6 const*>(&storage_);
    ::inet_ntop(AF_INET6, &sa->sin6_addr, buf, sizeof(buf));
  } else {
    auto const* sa = reinterpret_cast<sockaddr_in const*>(&storage_);
    ::inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf));
  }
  return std::string{buf};
}

inline auto endpoint::to_string() const -> std::string {
  if (family() == AF_INET6) {
    return "[" + host() + "]:" + std::to_string(port());
  }
  return host() + ":" + std::to_string(port());
}

inline auto operator==(endpoint const& a, endpoint const& b) noexcept -> bool {
  return a.size_ == b.size_ && std::memcmp(&a.storage_, &b.storage_, a.size_) == 0;
}

}  // namespace strata
