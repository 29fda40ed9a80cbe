#include <strata/error.hpp>
#include <strata/log.hpp>
#include <strata/resolver.hpp>
#include <strata/this_coro.hpp>
#include <strata/thread_pool.hpp>

#include <algorithm>
#include <coroutine>
#include <optional>
#include <utility>

#include <netdb.h>

namespace strata {

namespace detail {

/// Lookup pool shared by every resolver without an explicit executor; lives for the process.
inline auto default_lookup_pool() -> thread_pool& {
  static thread_pool pool{1};
  return pool;
}

struct lookup_awaiter {
  any_executor resume_ex;
  any_executor lookup_ex;
  std::string host;
  std::uint16_t port;
  std::optional<result<std::vector<endpoint>>> res{};

  auto await_ready() const noexcept -> bool { return false; }

  void await_suspend(std::coroutine_handle<> h) {
    lookup_ex.post([this, h]() mutable {
      res.emplace(resolver::lookup(host, port));
      auto ex = resume_ex;
      ex.post([h]() mutable { h.resume(); });
    });
  }

  auto await_resume() -> result<std::vector<endpoint>> { return std::move(*res); }
};

}  // namespace detail

inline auto resolver::lookup_executor() const -> any_executor {
  if (lookup_ex_) {
    return lookup_ex_;
  }
  return any_executor{detail::default_lookup_pool().pick_executor()};
}

inline auto resolver::lookup(std::string const& host, std::uint16_t port)
  -> result<std::vector<endpoint>> {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_ADDRCONFIG | AI_NUMERICSERV;

  auto const service = std::to_string(port);
  addrinfo* list = nullptr;
  int const rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &list);
  if (rc != 0) {
    log::logger()->debug("resolver: {}: {}", host, ::gai_strerror(rc));
    return unexpected(make_error_code(error::host_not_found));
  }

  std::vector<endpoint> out{};
  for (auto* ai = list; ai != nullptr; ai = ai->ai_next) {
    auto ep = endpoint::from_native(ai->ai_addr, ai->ai_addrlen);
    if (ep && std::find(out.begin(), out.end(), *ep) == out.end()) {
      out.push_back(*ep);
    }
  }
  ::freeaddrinfo(list);

  if (out.empty()) {
    return unexpected(make_error_code(error::host_not_found));
  }
  return out;
}

inline auto resolver::resolve(address const& a) const -> awaitable<result<std::vector<endpoint>>> {
  if (a.host.empty()) {
    co_return unexpected(make_error_code(error::invalid_argument));
  }
  if (auto ep = endpoint::from_numeric(a.host, a.port)) {
    co_return std::vector<endpoint>{*ep};
  }

  auto ex = co_await this_coro::executor;
  auto r = co_await detail::lookup_awaiter{std::move(ex), lookup_executor(), a.host, a.port};

  auto stop = co_await this_coro::stop_token;
  if (stop.stop_requested()) {
    co_return unexpected(make_error_code(error::operation_aborted));
  }
  co_return r;
}

}  // namespace strata
