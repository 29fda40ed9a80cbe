#include <gtest/gtest.h>

#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include "test_util.hpp"

namespace strata::test {

using namespace std::chrono_literals;

namespace {

auto delayed_echo() {
  return make_service<buffer_view>([](buffer_view req) -> awaitable<result<buffer_view>> {
    (void)co_await co_sleep(1ms);
    co_return req;
  });
}

/// Read from a blocking fd until `n` bytes arrived or two seconds passed.
auto read_exactly(int fd, std::size_t n) -> std::string {
  std::string out;
  auto const deadline = std::chrono::steady_clock::now() + 2s;
  while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
    pollfd p{fd, POLLIN, 0};
    if (::poll(&p, 1, 50) <= 0) {
      continue;
    }
    char buf[256];
    auto const r = ::read(fd, buf, sizeof(buf));
    if (r <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(r));
  }
  return out;
}

/// Serve one connection with the delayed echo service and return what the client saw.
auto echo_over(runtime_backend backend) -> std::pair<std::string, std::error_code> {
  runtime rt{runtime_config{backend, 2}};
  runtime_thread driver{rt};

  int fds[2] = {-1, -1};
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    throw std::system_error(errno, std::generic_category(), "socketpair");
  }
  int const client = fds[1];

  auto done = std::make_shared<std::promise<std::error_code>>();
  auto closed = done->get_future();
  auto ex = rt.connection_executor();
  co_spawn(ex,
           [ex, fd = fds[0], done]() -> awaitable<void> {
             dispatcher d{ex, io_object{std::make_unique<socket_transport>(ex, fd)},
                          length_prefixed_codec{1}, delayed_echo()};
             done->set_value(co_await d.run());
           },
           detached);

  std::string request;
  for (char c = 'a'; c <= 'j'; ++c) {
    request.push_back(static_cast<char>(3));
    request.append(3, c);
  }
  // Two writes so that a frame straddles them.
  EXPECT_EQ(::write(client, request.data(), 10), 10);
  EXPECT_EQ(::write(client, request.data() + 10, request.size() - 10),
            static_cast<ssize_t>(request.size() - 10));

  auto seen = read_exactly(client, request.size());
  ::shutdown(client, SHUT_WR);

  std::error_code reason = error::timed_out;
  if (closed.wait_for(2s) == std::future_status::ready) {
    reason = closed.get();
  }
  ::close(client);
  return {seen, reason};
}

}  // namespace

TEST(runtime_test, config_validation) {
  EXPECT_FALSE(runtime_config{}.validate());
  EXPECT_EQ((runtime_config{runtime_backend::single_thread, 4}.validate()),
            error::invalid_argument);
  EXPECT_FALSE((runtime_config{runtime_backend::work_stealing, 0}.validate()));

  auto bad = runtime::create(runtime_config{runtime_backend::single_thread, 2});
  ASSERT_FALSE(bad);
  EXPECT_EQ(bad.error(), error::invalid_argument);

  auto good = runtime::create(runtime_config{runtime_backend::thread_per_core, 1});
  ASSERT_TRUE(good);
  EXPECT_EQ((*good)->backend(), runtime_backend::thread_per_core);
  EXPECT_STREQ(to_string(runtime_backend::work_stealing), "work_stealing");
}

TEST(runtime_test, spawn_and_timer_on_every_backend) {
  for (auto backend : {runtime_backend::single_thread, runtime_backend::thread_per_core,
                       runtime_backend::work_stealing}) {
    runtime rt{runtime_config{backend, 2}};
    runtime_thread driver{rt};

    std::promise<std::chrono::steady_clock::duration> slept;
    auto elapsed = slept.get_future();
    rt.spawn([&]() -> awaitable<void> {
      auto const start = runtime::now();
      auto ec = co_await rt.timer(10ms);
      EXPECT_FALSE(ec);
      slept.set_value(runtime::now() - start);
    });

    ASSERT_EQ(elapsed.wait_for(2s), std::future_status::ready) << to_string(backend);
    EXPECT_GE(elapsed.get(), 10ms) << to_string(backend);
  }
}

TEST(runtime_test, backends_produce_identical_bytes) {
  std::string expected;
  for (char c = 'a'; c <= 'j'; ++c) {
    expected.push_back(static_cast<char>(3));
    expected.append(3, c);
  }

  for (auto backend : {runtime_backend::single_thread, runtime_backend::thread_per_core,
                       runtime_backend::work_stealing}) {
    auto [seen, reason] = echo_over(backend);
    EXPECT_EQ(seen, expected) << to_string(backend);
    EXPECT_EQ(reason, error::eof) << to_string(backend);
  }
}

TEST(runtime_test, connection_executors_spread_over_shards) {
  runtime rt{runtime_config{runtime_backend::thread_per_core, 2}};
  runtime_thread driver{rt};

  auto a = rt.connection_executor();
  auto b = rt.connection_executor();
  EXPECT_TRUE(a);
  EXPECT_TRUE(b);
  EXPECT_FALSE(a == b);
}

TEST(runtime_test, work_stealing_connections_run_serialized) {
  runtime rt{runtime_config{runtime_backend::work_stealing, 4}};
  runtime_thread driver{rt};

  auto ex = rt.connection_executor();
  std::atomic<int> active{0};
  std::atomic<int> overlaps{0};
  std::atomic<int> finished{0};
  constexpr int tasks = 64;

  for (int i = 0; i < tasks; ++i) {
    co_spawn(ex,
             [&]() -> awaitable<void> {
               if (active.fetch_add(1) != 0) {
                 overlaps.fetch_add(1);
               }
               std::this_thread::sleep_for(100us);
               active.fetch_sub(1);
               finished.fetch_add(1);
               co_return;
             },
             detached);
  }

  auto const deadline = std::chrono::steady_clock::now() + 5s;
  while (finished.load() < tasks && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(1ms);
  }
  EXPECT_EQ(finished.load(), tasks);
  EXPECT_EQ(overlaps.load(), 0);
}

}  // namespace strata::test
