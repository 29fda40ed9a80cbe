#pragma once

#include <strata/expected.hpp>

#include <system_error>

namespace strata {

/// Common result type for strata APIs.
template <class T>
using result = expected<T, std::error_code>;

[[nodiscard]] inline auto ok() noexcept -> result<void> { return {}; }
[[nodiscard]] inline auto fail(std::error_code ec) noexcept -> result<void> {
  return unexpected(ec);
}

}  // namespace strata
