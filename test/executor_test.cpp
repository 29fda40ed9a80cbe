#include <gtest/gtest.h>

#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

#include "test_util.hpp"

namespace strata::test {

using namespace std::chrono_literals;

TEST(executor_test, io_context_runs_posted_work_in_order) {
  io_context ctx;
  std::vector<int> seen;
  auto ex = ctx.get_executor();
  ex.post([&] { seen.push_back(1); });
  ex.post([&] { seen.push_back(2); });
  EXPECT_EQ(ctx.run(), 2U);
  EXPECT_EQ(seen, (std::vector<int>{1, 2}));
}

TEST(executor_test, co_sleep_resumes_via_timer_and_executor) {
  io_context ctx;
  auto const start = std::chrono::steady_clock::now();
  auto ec = sync_wait_for(ctx, 1s, [&]() -> awaitable<std::error_code> {
    co_return co_await co_sleep(10ms);
  }());
  EXPECT_FALSE(ec);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 10ms);
}

TEST(executor_test, stop_request_aborts_a_sleep) {
  io_context ctx;
  std::stop_source stop{};
  std::optional<std::error_code> got;

  co_spawn(ctx.get_executor(), stop.get_token(),
           [&]() -> awaitable<void> { got = co_await co_sleep(10s); }, detached);
  ctx.get_executor().post([&] { stop.request_stop(); });

  (void)ctx.run_for(1000ms);
  ASSERT_TRUE(got);
  EXPECT_EQ(*got, error::operation_aborted);
}

TEST(executor_test, steady_timer_cancel_resumes_with_aborted) {
  io_context ctx;
  steady_timer t{ctx.get_executor()};
  t.expires_after(200ms);

  std::optional<std::error_code> got;
  co_spawn(ctx.get_executor(),
           [&]() -> awaitable<void> { got = co_await t.async_wait(use_awaitable); }, detached);

  // Let the coroutine suspend on the timer first.
  (void)ctx.run_one();
  (void)t.cancel();

  (void)ctx.run_for(50ms);
  ASSERT_TRUE(got);
  EXPECT_EQ(*got, error::operation_aborted);
}

TEST(executor_test, notify_before_wait_is_consumed_immediately) {
  io_context ctx;
  auto r = sync_wait(ctx, [&]() -> awaitable<result<void>> {
    notify_event ev{};
    ev.notify_one();
    co_return co_await ev.async_wait(use_awaitable);
  }());
  EXPECT_TRUE(r);
}

TEST(executor_test, notify_event_ticket_limit_coalesces) {
  io_context ctx;
  auto n = sync_wait(ctx, [&]() -> awaitable<int> {
    auto ex = co_await this_coro::io_executor;
    notify_event ev{1};
    ev.notify_one();
    ev.notify_one();
    (void)co_await ev.async_wait(use_awaitable);

    // The second notification was coalesced; this wait needs a fresh one.
    ex.post([&ev] { ev.notify_one(); });
    (void)co_await ev.async_wait(use_awaitable);
    co_return 2;
  }());
  EXPECT_EQ(n, 2);
}

TEST(executor_test, erased_and_adapted_executors_stay_copyable) {
  static_assert(executor<io_context::executor_type>);
  static_assert(executor<any_executor>);
  static_assert(executor<any_io_executor>);
  static_assert(executor<strand_executor>);
  static_assert(std::copy_constructible<strand_executor>);
  static_assert(!std::is_copy_constructible_v<work_guard>);
  static_assert(!executor<work_guard>);
  static_assert(!executor<resolver>);
  static_assert(std::copy_constructible<resolver>);

  io_context ctx;
  auto s = make_strand(any_executor{ctx.get_executor()});
  auto copy = s;
  EXPECT_EQ(copy, s);
  any_executor erased{s};
  EXPECT_EQ(erased, any_executor{copy});

  int ran = 0;
  erased.post([&] { ++ran; });
  (void)ctx.run();
  EXPECT_EQ(ran, 1);
}

TEST(executor_test, strand_serializes_handlers_on_a_pool) {
  work_stealing_pool pool{4};
  auto s = make_strand(any_executor{pool.get_executor()});

  constexpr int n = 2000;
  std::atomic<int> running{0};
  std::atomic<int> overlap{0};
  std::atomic<int> done{0};
  std::promise<void> all;

  for (int i = 0; i < n; ++i) {
    s.post([&] {
      if (running.fetch_add(1) != 0) overlap.fetch_add(1);
      running.fetch_sub(1);
      if (done.fetch_add(1) + 1 == n) all.set_value();
    });
  }
  ASSERT_EQ(all.get_future().wait_for(5s), std::future_status::ready);
  EXPECT_EQ(overlap.load(), 0);
  pool.stop();
  pool.join();
}

TEST(executor_test, thread_pool_shards_run_work) {
  thread_pool pool{2};
  std::promise<std::thread::id> a;
  std::promise<std::thread::id> b;
  pool.shard(0).post([&] { a.set_value(std::this_thread::get_id()); });
  pool.shard(1).post([&] { b.set_value(std::this_thread::get_id()); });

  auto fa = a.get_future();
  auto fb = b.get_future();
  ASSERT_EQ(fa.wait_for(2s), std::future_status::ready);
  ASSERT_EQ(fb.wait_for(2s), std::future_status::ready);
  EXPECT_NE(fa.get(), fb.get());
  pool.stop();
  pool.join();
}

TEST(executor_test, co_spawn_completion_receives_exception) {
  io_context ctx;
  bool got_exception = false;
  co_spawn(
    ctx.get_executor(), []() -> awaitable<int> {
      throw std::runtime_error("boom");
      co_return 1;
    },
    [&](expected<int, std::exception_ptr> r) { got_exception = !r; });
  (void)ctx.run();
  EXPECT_TRUE(got_exception);
}

}  // namespace strata::test
