#include <gtest/gtest.h>

#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <algorithm>
#include <chrono>
#include <memory>
#include <string>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "test_util.hpp"

namespace strata::test {

using namespace std::chrono_literals;

namespace {

auto echo() {
  return make_service<buffer_view>(
    [](buffer_view req) -> awaitable<result<buffer_view>> { co_return req; });
}

auto frame(std::string_view payload) -> std::string {
  std::string s(1, static_cast<char>(payload.size()));
  s.append(payload);
  return s;
}

/// Blocking loopback client.
class raw_client {
 public:
  explicit raw_client(std::uint16_t port) : fd_(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
    auto ep = *endpoint::from_numeric("127.0.0.1", port);
    connected_ = fd_ >= 0 && ::connect(fd_, ep.data(), ep.size()) == 0;
  }

  raw_client(raw_client const&) = delete;
  auto operator=(raw_client const&) -> raw_client& = delete;

  ~raw_client() { close(); }

  auto connected() const noexcept -> bool { return connected_; }

  void send(std::string const& s) {
    EXPECT_EQ(::write(fd_, s.data(), s.size()), static_cast<ssize_t>(s.size()));
  }

  /// Up to `n` bytes, waiting at most `timeout`.
  auto receive(std::size_t n, std::chrono::milliseconds timeout = 2s) -> std::string {
    std::string out;
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
      pollfd p{fd_, POLLIN, 0};
      if (::poll(&p, 1, 10) <= 0) {
        continue;
      }
      char buf[256];
      auto const r = ::read(fd_, buf, std::min(sizeof(buf), n - out.size()));
      if (r <= 0) {
        break;
      }
      out.append(buf, static_cast<std::size_t>(r));
    }
    return out;
  }

  /// True once the server closed the stream.
  auto sees_eof(std::chrono::milliseconds timeout = 2s) -> bool {
    pollfd p{fd_, POLLIN, 0};
    if (::poll(&p, 1, static_cast<int>(timeout.count())) <= 0) {
      return false;
    }
    char c;
    return ::read(fd_, &c, 1) <= 0;
  }

  void close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
  bool connected_{false};
};

auto local_config() -> server_config {
  server_config cfg{};
  cfg.listen = address{"127.0.0.1", 0};
  return cfg;
}

}  // namespace

TEST(server_test, config_validation) {
  EXPECT_FALSE(local_config().validate());
  auto cfg = local_config();
  cfg.max_connections = 0;
  EXPECT_EQ(cfg.validate(), error::invalid_argument);
}

TEST(server_test, echoes_over_loopback) {
  runtime rt{};
  runtime_thread driver{rt};
  server srv{rt, local_config(), length_prefixed_codec{1}, clone_factory{echo()}};
  ASSERT_FALSE(srv.start());
  auto ep = srv.local_endpoint();
  ASSERT_TRUE(ep);
  EXPECT_NE(ep->port(), 0);

  raw_client c{ep->port()};
  ASSERT_TRUE(c.connected());
  c.send(frame("hello") + frame("world"));
  EXPECT_EQ(c.receive(12), frame("hello") + frame("world"));
  EXPECT_TRUE(wait_until([&] { return srv.live_connections() == 1; }));

  c.close();
  EXPECT_TRUE(wait_until([&] { return srv.counter().open() == 0; }));
  EXPECT_EQ(srv.live_connections(), 0U);
}

TEST(server_test, start_twice_is_rejected) {
  runtime rt{};
  runtime_thread driver{rt};
  server srv{rt, local_config(), length_prefixed_codec{1}, clone_factory{echo()}};
  ASSERT_FALSE(srv.start());
  EXPECT_TRUE(srv.start());
}

TEST(server_test, accepting_pauses_at_max_connections) {
  runtime rt{};
  runtime_thread driver{rt};
  auto cfg = local_config();
  cfg.max_connections = 1;
  server srv{rt, cfg, length_prefixed_codec{1}, clone_factory{echo()}};
  ASSERT_FALSE(srv.start());
  auto const port = srv.local_endpoint()->port();

  raw_client first{port};
  ASSERT_TRUE(first.connected());
  ASSERT_TRUE(wait_until([&] { return srv.counter().accepted() == 1; }));

  // The kernel completes the handshake, but the server must not accept it yet.
  raw_client second{port};
  ASSERT_TRUE(second.connected());
  std::this_thread::sleep_for(100ms);
  EXPECT_EQ(srv.counter().accepted(), 1U);
  EXPECT_EQ(srv.counter().open(), 1U);

  first.close();
  ASSERT_TRUE(wait_until([&] { return srv.counter().accepted() == 2; }));
  second.send(frame("late"));
  EXPECT_EQ(second.receive(5), frame("late"));
}

TEST(server_test, graceful_stop_closes_live_connections) {
  runtime rt{};
  runtime_thread driver{rt};
  server srv{rt, local_config(), length_prefixed_codec{1}, clone_factory{echo()}};
  ASSERT_FALSE(srv.start());
  auto const port = srv.local_endpoint()->port();

  raw_client c{port};
  ASSERT_TRUE(c.connected());
  c.send(frame("x"));
  ASSERT_EQ(c.receive(2), frame("x"));

  srv.stop();
  EXPECT_TRUE(c.sees_eof());
  EXPECT_TRUE(wait_until([&] { return srv.counter().open() == 0; }));

  // The listener goes away once the accept loop has unwound.
  EXPECT_TRUE(wait_until([&] { return !raw_client{port}.connected(); }));
}

TEST(server_test, factory_failure_closes_only_that_connection) {
  runtime rt{};
  runtime_thread driver{rt};
  fn_factory picky{[](connection_info const& ci) -> awaitable<result<decltype(echo())>> {
    if (ci.id == 1) {
      co_return unexpected(make_error_code(error::service_unavailable));
    }
    co_return echo();
  }};
  server srv{rt, local_config(), length_prefixed_codec{1}, std::move(picky)};
  ASSERT_FALSE(srv.start());
  auto const port = srv.local_endpoint()->port();

  raw_client refused{port};
  ASSERT_TRUE(refused.connected());
  EXPECT_TRUE(refused.sees_eof());

  raw_client served{port};
  ASSERT_TRUE(served.connected());
  served.send(frame("ok"));
  EXPECT_EQ(served.receive(3), frame("ok"));
}

TEST(server_test, tls_connections_handshake_before_serving) {
  runtime rt{};
  runtime_thread driver{rt};

  auto cfg = local_config();
  cfg.tls = tls_config{tls_role::server, "cert", "key"};
  auto server_tls = std::make_shared<toy_tls_provider>();
  server srv{rt,
             cfg,
             length_prefixed_codec{1},
             clone_factory{echo()},
             std::make_shared<connection_counter>(),
             server_tls};
  ASSERT_FALSE(srv.start());
  auto const ep = *srv.local_endpoint();

  io_context ctx;
  connector c{ctx.get_executor(), std::make_shared<toy_tls_provider>()};
  auto io = sync_wait_for(ctx, 2s, c.connect(std::vector<endpoint>{ep}, tls_config{}));
  ASSERT_TRUE(io) << io.error().message();
  EXPECT_EQ(server_tls->created, 1);

  length_prefixed_codec codec{1};
  ASSERT_FALSE(io->encode(codec, buffer_view::copy_of(std::string_view{"secret"})));
  ASSERT_TRUE(io->flush());

  std::optional<buffer_view> reply;
  for (int i = 0; i < 200 && !reply; ++i) {
    auto r = io->fill();
    if (r || r.error() == error::would_block) {
      auto d = io->decode(codec);
      ASSERT_TRUE(d);
      if (d->has_value()) {
        reply = **d;
      }
    } else {
      FAIL() << r.error().message();
    }
    std::this_thread::sleep_for(5ms);
  }
  ASSERT_TRUE(reply);
  EXPECT_EQ(*reply, "secret");
}

}  // namespace strata::test
