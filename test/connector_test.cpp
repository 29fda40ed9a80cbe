#include <gtest/gtest.h>

#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <unistd.h>

#include "test_util.hpp"

namespace strata::test {

using namespace std::chrono_literals;

namespace {

auto loopback() -> endpoint { return *endpoint::from_numeric("127.0.0.1", 0); }

/// An endpoint nobody listens on.
auto refused_endpoint(any_io_executor ex) -> endpoint {
  acceptor a{std::move(ex)};
  EXPECT_FALSE(a.listen(loopback()));
  auto ep = *a.local_endpoint();
  a.close();
  return ep;
}

/// Accepts one connection and keeps the fd.
struct one_accept {
  explicit one_accept(any_io_executor ex) : acc(ex) {
    EXPECT_FALSE(acc.listen(loopback()));
    co_spawn(ex,
             [this]() -> awaitable<void> {
               auto r = co_await acc.async_accept();
               if (r) {
                 fd = *r;
               }
             },
             detached);
  }

  ~one_accept() {
    if (fd >= 0) {
      ::close(fd);
    }
  }

  auto ep() const -> endpoint { return *acc.local_endpoint(); }

  acceptor acc;
  int fd{-1};
};

/// Server side of a toy TLS session: handshake, then collect `want` plaintext bytes.
struct tls_peer {
  std::optional<std::error_code> handshake{};
  std::string received{};
};

auto serve_tls(acceptor& acc, bool refuse, std::size_t want, std::shared_ptr<tls_peer> out)
  -> awaitable<void> {
  auto ex = co_await this_coro::io_executor;
  auto fd = co_await acc.async_accept();
  if (!fd) {
    out->handshake = fd.error();
    co_return;
  }
  io_object io{std::make_unique<socket_transport>(ex, *fd)};
  toy_tls_engine engine{refuse};
  out->handshake = co_await async_handshake(io, engine, tls_role::server, 2s);
  if (*out->handshake) {
    co_return;
  }
  while (io.read_buffer().size() < want) {
    auto r = io.fill();
    if (!r) {
      if (r.error() != error::would_block) {
        co_return;
      }
      if (co_await io.wait_readable()) {
        co_return;
      }
    }
  }
  out->received = io.read_buffer().share(0, want).to_string();
}

}  // namespace

TEST(connector_test, options_validation) {
  connect_options opts{};
  EXPECT_FALSE(opts.validate());
  opts.attempt_timeout = -1ms;
  EXPECT_EQ(opts.validate(), error::invalid_argument);
}

TEST(connector_test, connects_over_loopback) {
  io_context ctx;
  auto ex = ctx.get_executor();
  one_accept server{ex};

  connector c{ex};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{server.ep()}));
  ASSERT_TRUE(io) << io.error().message();
  for (int i = 0; i < 50 && server.fd < 0; ++i) {
    (void)ctx.run_for(10ms);
  }
  ASSERT_GE(server.fd, 0);

  ASSERT_FALSE(io->write_buffer().append("hi"));
  auto w = io->flush();
  ASSERT_TRUE(w);
  EXPECT_EQ(*w, 2U);

  char buf[8]{};
  std::size_t got = 0;
  for (int i = 0; i < 50 && got < 2; ++i) {
    auto const n = ::read(server.fd, buf + got, sizeof(buf) - got);
    if (n > 0) {
      got += static_cast<std::size_t>(n);
    } else {
      (void)ctx.run_for(10ms);
    }
  }
  EXPECT_EQ(std::string(buf, got), "hi");
}

TEST(connector_test, connects_to_a_numeric_address) {
  io_context ctx;
  auto ex = ctx.get_executor();
  one_accept server{ex};

  auto io = sync_wait_for(ctx, 2s, [&]() -> awaitable<result<io_object>> {
    co_return co_await strata::connect(address{"127.0.0.1", server.ep().port()}, std::nullopt,
                                       1s);
  }());
  ASSERT_TRUE(io) << io.error().message();
  EXPECT_TRUE(io->is_open());
}

TEST(connector_test, falls_back_to_the_next_candidate) {
  io_context ctx;
  auto ex = ctx.get_executor();
  auto dead = refused_endpoint(ex);
  one_accept server{ex};

  connector c{ex};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{dead, server.ep()}));
  ASSERT_TRUE(io) << io.error().message();
  EXPECT_TRUE(io->is_open());
}

TEST(connector_test, all_candidates_failing_returns_the_last_error) {
  io_context ctx;
  auto ex = ctx.get_executor();
  auto a = refused_endpoint(ex);
  auto b = refused_endpoint(ex);

  connector c{ex};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{a, b}));
  ASSERT_FALSE(io);
  EXPECT_EQ(io.error(), std::errc::connection_refused);
  EXPECT_EQ(io.error(), error_kind::io);
}

TEST(connector_test, rejects_bad_requests) {
  io_context ctx;
  auto ex = ctx.get_executor();
  connector c{ex};

  auto none = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{}));
  ASSERT_FALSE(none);
  EXPECT_EQ(none.error(), error::host_not_found);

  auto no_provider =
    sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{loopback()}, tls_config{}));
  ASSERT_FALSE(no_provider);
  EXPECT_EQ(no_provider.error(), error::invalid_argument);

  auto provider = std::make_shared<toy_tls_provider>();
  connector secure{ex, provider};
  tls_config server_side{};
  server_side.role = tls_role::server;
  auto wrong_role =
    sync_wait_for(ctx, 2s, secure.connect(std::vector<endpoint>{loopback()}, server_side));
  ASSERT_FALSE(wrong_role);
  EXPECT_EQ(wrong_role.error(), error::invalid_argument);
  EXPECT_EQ(provider->created, 0);
}

TEST(connector_test, tls_session_wraps_the_stream) {
  io_context ctx;
  auto ex = ctx.get_executor();
  acceptor acc{ex};
  ASSERT_FALSE(acc.listen(loopback()));
  auto peer = std::make_shared<tls_peer>();
  co_spawn(ex, serve_tls(acc, false, 4, peer), detached);

  auto provider = std::make_shared<toy_tls_provider>();
  connector c{ex, provider};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{*acc.local_endpoint()},
                                             tls_config{}));
  ASSERT_TRUE(io) << io.error().message();
  EXPECT_EQ(provider->created, 1);

  ASSERT_FALSE(io->write_buffer().append("ping"));
  ASSERT_TRUE(io->flush());
  for (int i = 0; i < 100 && peer->received.empty(); ++i) {
    (void)ctx.run_for(10ms);
  }
  ASSERT_TRUE(peer->handshake);
  EXPECT_FALSE(*peer->handshake);
  EXPECT_EQ(peer->received, "ping");
}

TEST(connector_test, refused_handshake_fails_the_connect) {
  io_context ctx;
  auto ex = ctx.get_executor();
  acceptor acc{ex};
  ASSERT_FALSE(acc.listen(loopback()));
  auto peer = std::make_shared<tls_peer>();
  co_spawn(ex, serve_tls(acc, true, 0, peer), detached);

  connector c{ex, std::make_shared<toy_tls_provider>()};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{*acc.local_endpoint()},
                                             tls_config{}));
  ASSERT_FALSE(io);
  EXPECT_EQ(io.error(), error::handshake_failed);
  EXPECT_EQ(io.error(), error_kind::handshake);
}

TEST(connector_test, silent_peer_times_out_the_handshake) {
  io_context ctx;
  auto ex = ctx.get_executor();
  one_accept server{ex};

  connect_options opts{};
  opts.handshake_timeout = 50ms;
  connector c{ex, std::make_shared<toy_tls_provider>()};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{server.ep()}, tls_config{},
                                             opts));
  ASSERT_FALSE(io);
  EXPECT_EQ(io.error(), error::timed_out);
  EXPECT_EQ(io.error(), error_kind::timeout);
}

}  // namespace strata::test
