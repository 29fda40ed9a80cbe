#include <strata/connector.hpp>
#include <strata/detail/deadline.hpp>
#include <strata/error.hpp>
#include <strata/log.hpp>
#include <strata/socket_transport.hpp>
#include <strata/this_coro.hpp>

#include <utility>

namespace strata {

inline auto connector::connect(address const& target, std::optional<tls_config> tls,
                               connect_options opts) const -> awaitable<result<io_object>> {
  auto candidates = co_await resolver_.resolve(target);
  if (!candidates) {
    log::logger()->debug("connector: resolving {} failed: {}", target.to_string(),
                         candidates.error().message());
    co_return unexpected(candidates.error());
  }
  if (tls && tls->server_name.empty() && !endpoint::from_numeric(target.host, target.port)) {
    tls->server_name = target.host;
  }
  co_return co_await connect(std::move(*candidates), std::move(tls), opts);
}

inline auto connector::connect(std::vector<endpoint> candidates, std::optional<tls_config> tls,
                               connect_options opts) const -> awaitable<result<io_object>> {
  if (auto ec = opts.validate()) {
    co_return unexpected(ec);
  }
  if (candidates.empty()) {
    co_return unexpected(make_error_code(error::host_not_found));
  }
  if (tls && !tls_) {
    log::logger()->warn("connector: TLS requested without a tls_provider");
    co_return unexpected(make_error_code(error::invalid_argument));
  }
  if (tls) {
    auto ec = tls->role == tls_role::client ? tls->validate()
                                            : make_error_code(error::invalid_argument);
    if (ec) {
      log::logger()->warn("connector: invalid client tls_config: {}", ec.message());
      co_return unexpected(ec);
    }
  }

  std::unique_ptr<socket_transport> conn{};
  std::error_code last{};
  for (auto const& ep : candidates) {
    auto attempt = socket_transport::connect(ex_, ep);
    detail::deadline_guard deadline{ex_, opts.attempt_timeout,
                                    [&attempt] { attempt.request_stop(); }};
    auto r = co_await std::move(attempt);
    if (r) {
      conn = std::move(*r);
      break;
    }

    last = deadline.expired() ? make_error_code(error::connect_timeout) : r.error();
    log::logger()->debug("connector: {} failed: {}", ep.to_string(), last.message());

    auto stop = co_await this_coro::stop_token;
    if (stop.stop_requested()) {
      co_return unexpected(make_error_code(error::operation_aborted));
    }
  }
  if (!conn) {
    co_return unexpected(last);
  }

  if (opts.nodelay) {
    if (auto ec = conn->set_nodelay(true)) {
      log::logger()->debug("connector: TCP_NODELAY: {}", ec.message());
    }
  }

  io_object io{std::move(conn), opts.io};
  if (!tls) {
    co_return std::move(io);
  }

  auto engine = tls_->create_engine(*tls);
  if (!engine) {
    co_return unexpected(engine.error());
  }
  if (auto ec = co_await async_handshake(io, **engine, tls->role, opts.handshake_timeout)) {
    co_return unexpected(ec);
  }
  co_return std::move(io);
}

inline auto connect(address const& target, std::optional<tls_config> tls,
                    std::chrono::steady_clock::duration timeout,
                    std::shared_ptr<tls_provider> provider) -> awaitable<result<io_object>> {
  auto ex = co_await this_coro::io_executor;
  connect_options opts{};
  opts.attempt_timeout = timeout;
  opts.handshake_timeout = timeout;
  connector c{std::move(ex), std::move(provider)};
  co_return co_await c.connect(target, std::move(tls), opts);
}

}  // namespace strata
