#pragma once

#include <strata/address.hpp>
#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/io_object.hpp>
#include <strata/resolver.hpp>
#include <strata/result.hpp>
#include <strata/tls.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace strata {

struct connect_options {
  using duration = std::chrono::steady_clock::duration;

  /// Limit per candidate; zero disables it.
  duration attempt_timeout = std::chrono::seconds{10};
  /// Limit on the TLS handshake; zero disables it.
  duration handshake_timeout = std::chrono::seconds{10};
  io_config io{};
  bool nodelay = true;

  auto validate() const -> std::error_code {
    if (attempt_timeout < duration::zero() || handshake_timeout < duration::zero()) {
      return error::invalid_argument;
    }
    return io.validate();
  }
};

/// Establishes client connections and hands them out as `io_object`s.
///
/// Candidates are tried one after another; the first success wins and when all fail the last
/// error is returned. A candidate exceeding `attempt_timeout` fails with
/// `error::connect_timeout`.
class connector {
 public:
  explicit connector(any_io_executor ex, std::shared_ptr<tls_provider> tls = nullptr,
                     resolver r = {})
      : ex_(std::move(ex)), tls_(std::move(tls)), resolver_(std::move(r)) {}

  auto connect(address const& target, std::optional<tls_config> tls = std::nullopt,
               connect_options opts = {}) const -> awaitable<result<io_object>>;

  /// Connect to already resolved candidates.
  auto connect(std::vector<endpoint> candidates, std::optional<tls_config> tls = std::nullopt,
               connect_options opts = {}) const -> awaitable<result<io_object>>;

  auto get_executor() const noexcept -> any_io_executor const& { return ex_; }

 private:
  any_io_executor ex_;
  std::shared_ptr<tls_provider> tls_;
  resolver resolver_;
};

/// Connect from the current coroutine's executor with `timeout` per attempt.
auto connect(address const& target, std::optional<tls_config> tls,
             std::chrono::steady_clock::duration timeout,
             std::shared_ptr<tls_provider> provider = nullptr) -> awaitable<result<io_object>>;

}  // namespace strata
