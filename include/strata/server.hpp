#pragma once

#include <strata/acceptor.hpp>
#include <strata/address.hpp>
#include <strata/co_sleep.hpp>
#include <strata/co_spawn.hpp>
#include <strata/codec.hpp>
#include <strata/connection_counter.hpp>
#include <strata/detail/scope_exit.hpp>
#include <strata/dispatcher.hpp>
#include <strata/error.hpp>
#include <strata/io_object.hpp>
#include <strata/log.hpp>
#include <strata/resolver.hpp>
#include <strata/runtime.hpp>
#include <strata/service_factory.hpp>
#include <strata/socket_transport.hpp>
#include <strata/tls.hpp>

#include <atomic>
#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <unordered_map>
#include <utility>
#include <vector>

#include <sys/socket.h>

namespace strata {

struct server_config {
  address listen{"127.0.0.1", 0};
  int backlog = SOMAXCONN;
  /// Accepting pauses while this many connections are open.
  std::size_t max_connections = 1024;
  std::chrono::steady_clock::duration handshake_timeout = std::chrono::seconds{10};
  /// Server-side TLS; requires a `tls_provider`.
  std::optional<tls_config> tls{};
  io_config io{};
  dispatcher_config dispatcher{};

  auto validate() const -> std::error_code {
    if (max_connections == 0 || handshake_timeout < std::chrono::steady_clock::duration::zero()) {
      return error::invalid_argument;
    }
    if (tls && (tls->role != tls_role::server || tls->validate())) {
      return error::invalid_argument;
    }
    if (auto ec = io.validate()) {
      return ec;
    }
    return dispatcher.validate();
  }
};

/// Accepts connections and runs one dispatcher per connection on the runtime.
///
/// Each connection gets its own `io_object`, optional server-side TLS handshake, and a service
/// from the factory; a factory failure closes that connection only.
template <codec Codec, service_factory Factory>
  requires std::same_as<typename Factory::service_type::request_type, typename Codec::item_type>
class server {
 public:
  using service_type = typename Factory::service_type;
  using dispatcher_type = dispatcher<Codec, service_type>;

  server(runtime& rt, server_config cfg, Codec codec, Factory factory,
         std::shared_ptr<connection_counter> counter = std::make_shared<connection_counter>(),
         std::shared_ptr<tls_provider> tls = nullptr)
      : rt_(rt),
        st_(std::make_shared<state>(std::move(cfg), std::move(codec), std::move(factory),
                                    std::move(counter), std::move(tls),
                                    rt.connection_executor())) {}

  server(server const&) = delete;
  auto operator=(server const&) -> server& = delete;
  server(server&&) = delete;
  auto operator=(server&&) -> server& = delete;

  ~server() { stop(false); }

  /// Bind, listen and start accepting.
  auto start() -> std::error_code;

  /// Stop accepting; live connections shut down gracefully or are aborted.
  void stop(bool graceful = true);

  auto local_endpoint() const -> result<endpoint> { return st_->acc.local_endpoint(); }
  auto counter() const noexcept -> connection_counter& { return *st_->counter; }

  /// Connections with a running dispatcher.
  auto live_connections() const -> std::size_t {
    std::scoped_lock lk{st_->m};
    return st_->live.size();
  }

 private:
  struct state {
    state(server_config c, Codec cd, Factory f, std::shared_ptr<connection_counter> n,
          std::shared_ptr<tls_provider> t, any_io_executor ex)
        : cfg(std::move(c)),
          codec(std::move(cd)),
          factory(std::move(f)),
          counter(std::move(n)),
          tls(std::move(t)),
          accept_ex(ex),
          acc(std::move(ex)) {}

    server_config cfg;
    Codec codec;
    Factory factory;
    std::shared_ptr<connection_counter> counter;
    std::shared_ptr<tls_provider> tls;
    any_io_executor accept_ex;
    acceptor acc;
    std::stop_source stop{};
    std::atomic<std::uint64_t> next_id{0};

    mutable std::mutex m{};
    bool stopping{false};
    std::unordered_map<std::uint64_t, std::shared_ptr<connection_handle>> live{};
  };

  static auto accept_loop(std::shared_ptr<state> st, runtime* rt) -> awaitable<void>;
  static auto serve(std::shared_ptr<state> st, any_io_executor ex, int fd, std::uint64_t id)
    -> awaitable<void>;

  runtime& rt_;
  std::shared_ptr<state> st_;
  bool started_{false};
};

template <codec Codec, service_factory Factory>
  requires std::same_as<typename Factory::service_type::request_type, typename Codec::item_type>
auto server<Codec, Factory>::start() -> std::error_code {
  if (started_) {
    return error::busy;
  }
  if (auto ec = st_->cfg.validate()) {
    return ec;
  }
  if (st_->cfg.tls && !st_->tls) {
    return error::invalid_argument;
  }

  auto eps = resolver::lookup(st_->cfg.listen.host, st_->cfg.listen.port);
  if (!eps) {
    return eps.error();
  }
  std::error_code ec{};
  for (auto const& ep : *eps) {
    ec = st_->acc.listen(ep, st_->cfg.backlog);
    if (!ec) {
      break;
    }
  }
  if (ec) {
    log::logger()->error("server: cannot listen on {}: {}", st_->cfg.listen.to_string(),
                         ec.message());
    return ec;
  }

  started_ = true;
  if (auto local = st_->acc.local_endpoint()) {
    log::logger()->info("server: listening on {} ({})", local->to_string(),
                        to_string(rt_.backend()));
  }
  co_spawn(st_->accept_ex.as_any_executor(), st_->stop.get_token(),
           [st = st_, rt = &rt_]() { return accept_loop(st, rt); }, detached);
  return {};
}

template <codec Codec, service_factory Factory>
  requires std::same_as<typename Factory::service_type::request_type, typename Codec::item_type>
void server<Codec, Factory>::stop(bool graceful) {
  std::vector<std::shared_ptr<connection_handle>> handles{};
  {
    std::scoped_lock lk{st_->m};
    if (st_->stopping) {
      return;
    }
    st_->stopping = true;
    handles.reserve(st_->live.size());
    for (auto const& [id, h] : st_->live) {
      handles.push_back(h);
    }
  }
  st_->stop.request_stop();
  if (!started_) {
    st_->acc.close();
  }

  log::logger()->debug("server: stopping, {} live connection(s)", handles.size());
  for (auto const& h : handles) {
    if (graceful) {
      h->shutdown();
    } else {
      h->abort();
    }
  }
}

template <codec Codec, service_factory Factory>
  requires std::same_as<typename Factory::service_type::request_type, typename Codec::item_type>
auto server<Codec, Factory>::accept_loop(std::shared_ptr<state> st, runtime* rt)
  -> awaitable<void> {
  auto close_acceptor = detail::make_scope_exit([&st] { st->acc.close(); });
  auto stop = co_await this_coro::stop_token;
  bool paused = false;

  while (!stop.stop_requested()) {
    if (st->counter->open() >= st->cfg.max_connections) {
      if (!paused) {
        log::logger()->info("server: {} connection(s) open, accepting paused",
                            st->counter->open());
        paused = true;
      }
      if (!co_await st->counter->wait_below(st->cfg.max_connections)) {
        break;
      }
      continue;
    }
    if (paused) {
      log::logger()->info("server: accepting resumed");
      paused = false;
    }

    auto fd = co_await st->acc.async_accept();
    if (!fd) {
      if (fd.error() == error::operation_aborted || stop.stop_requested()) {
        break;
      }
      log::logger()->warn("server: accept failed: {}", fd.error().message());
      // Typically EMFILE; give descriptors a chance to be released.
      (void)co_await co_sleep(std::chrono::milliseconds{50});
      continue;
    }

    st->counter->add();
    auto const id = st->next_id.fetch_add(1, std::memory_order_relaxed) + 1;
    auto ex = rt->connection_executor();
    co_spawn(ex.as_any_executor(),
             [st, ex, fd = *fd, id]() { return serve(st, ex, fd, id); }, detached);
  }
  log::logger()->debug("server: accept loop finished");
}

template <codec Codec, service_factory Factory>
  requires std::same_as<typename Factory::service_type::request_type, typename Codec::item_type>
auto server<Codec, Factory>::serve(std::shared_ptr<state> st, any_io_executor ex, int fd,
                                   std::uint64_t id) -> awaitable<void> {
  auto release = detail::make_scope_exit([&st] { st->counter->remove(); });

  auto t = std::make_unique<socket_transport>(ex, fd);
  if (auto ec = t->set_nodelay(true)) {
    log::logger()->debug("server: TCP_NODELAY: {}", ec.message());
  }
  auto const peer = t->peer();
  log::logger()->info("server: accepted #{} from {}", id, peer);

  io_object io{std::move(t), st->cfg.io};

  if (st->cfg.tls) {
    auto engine = st->tls->create_engine(*st->cfg.tls);
    if (!engine) {
      log::logger()->warn("server: #{} TLS engine: {}", id, engine.error().message());
      co_return;
    }
    if (auto ec = co_await async_handshake(io, **engine, tls_role::server,
                                           st->cfg.handshake_timeout)) {
      log::logger()->info("server: #{} handshake failed: {}", id, ec.message());
      co_return;
    }
  }

  connection_info ci{peer, id, st->cfg.tls.has_value()};
  auto svc = co_await st->factory.create(ci);
  if (!svc) {
    log::logger()->warn("server: #{} service factory failed: {}", id, svc.error().message());
    co_return;
  }

  dispatcher_type d{ex, std::move(io), st->codec, std::move(*svc), st->cfg.dispatcher};
  {
    std::scoped_lock lk{st->m};
    if (st->stopping) {
      d.shutdown();
    }
    st->live.emplace(id, d.handle());
  }
  auto unregister = detail::make_scope_exit([&st, id] {
    std::scoped_lock lk{st->m};
    st->live.erase(id);
  });

  auto const reason = co_await d.run();
  if (reason) {
    log::logger()->info("server: #{} closed: {}", id, reason.message());
  } else {
    log::logger()->info("server: #{} closed", id);
  }
}

}  // namespace strata
