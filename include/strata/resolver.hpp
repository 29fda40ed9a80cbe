#pragma once

#include <strata/address.hpp>
#include <strata/any_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/result.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace strata {

/// Turns an `address` into connection candidates.
///
/// Numeric hosts are parsed in place. Names are looked up with `getaddrinfo` on a helper
/// executor (by default a process-wide single-thread pool), and the awaiting coroutine resumes
/// on its own executor. A lookup in progress is not interrupted by a stop request; its result is
/// discarded with `error::operation_aborted`.
class resolver {
 public:
  resolver() = default;
  explicit resolver(any_executor lookup_ex) noexcept : lookup_ex_(std::move(lookup_ex)) {}

  auto resolve(address const& a) const -> awaitable<result<std::vector<endpoint>>>;

  /// Blocking lookup used by `resolve`. Errors map to `error::host_not_found`.
  static auto lookup(std::string const& host, std::uint16_t port)
    -> result<std::vector<endpoint>>;

 private:
  auto lookup_executor() const -> any_executor;

  any_executor lookup_ex_{};
};

}  // namespace strata
