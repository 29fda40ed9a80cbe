#include <gtest/gtest.h>

#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <cctype>
#include <concepts>
#include <memory>
#include <string>

#include "test_util.hpp"

namespace strata::test {

namespace {

auto echo() {
  return make_service<std::string>(
    [](std::string s) -> awaitable<result<std::string>> { co_return s; });
}

auto failing(error e) {
  return make_service<std::string>(
    [e](std::string) -> awaitable<result<std::string>> { co_return unexpected(make_error_code(e)); });
}

/// Service that is ready only `budget` times.
class counted_ready {
 public:
  using request_type = std::string;
  using response_type = std::string;

  explicit counted_ready(int budget) : budget_(budget) {}

  auto poll_ready(waker const&) -> readiness {
    return budget_ > 0 ? readiness::ready(static_cast<std::size_t>(budget_))
                       : readiness::not_ready();
  }
  auto call(std::string s) -> awaitable<result<std::string>> {
    --budget_;
    co_return s;
  }
  auto poll_shutdown(waker const&) -> shutdown_state { return shutdown_state::done; }

 private:
  int budget_;
};

}  // namespace

TEST(service_test, concepts_hold) {
  static_assert(service<decltype(echo())>);
  static_assert(service<readiness_guard<counted_ready>>);
  static_assert(service<any_service<std::string, std::string>>);
  static_assert(layer_for<in_flight_limit, decltype(echo())>);
  static_assert(!service<int>);
}

TEST(service_test, readiness_guard_rejects_unpolled_call) {
  io_context ctx;
  readiness_guard<decltype(echo())> g{echo()};

  auto r = sync_wait(ctx, g.call("x"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::call_without_ready);
  EXPECT_EQ(r.error(), error_kind::programming);

  ASSERT_TRUE(g.poll_ready(waker{}).is_ready());
  auto ok = sync_wait(ctx, g.call("y"));
  ASSERT_TRUE(ok);
  EXPECT_EQ(*ok, "y");

  // One report admits one call.
  auto again = sync_wait(ctx, g.call("z"));
  ASSERT_FALSE(again);
  EXPECT_EQ(again.error(), error::call_without_ready);
}

TEST(service_test, readiness_guard_disarms_on_not_ready) {
  io_context ctx;
  readiness_guard<counted_ready> g{counted_ready{1}};

  ASSERT_TRUE(g.poll_ready(waker{}).is_ready());
  ASSERT_TRUE(sync_wait(ctx, g.call("a")));
  EXPECT_TRUE(g.poll_ready(waker{}).is_pending());
  EXPECT_FALSE(sync_wait(ctx, g.call("b")));
}

TEST(service_test, combine_readiness_takes_the_weakest) {
  auto const ec = make_error_code(error::service_unavailable);
  EXPECT_EQ(combine_readiness(readiness::ready(3), readiness::ready(5)), readiness::ready(3));
  EXPECT_TRUE(combine_readiness(readiness::ready(), readiness::not_ready()).is_pending());
  EXPECT_EQ(combine_readiness(readiness::not_ready(), readiness::failed(ec)).error(), ec);
  EXPECT_EQ(combine_shutdown(shutdown_state::done, shutdown_state::pending),
            shutdown_state::pending);
}

TEST(service_test, map_transforms_responses) {
  io_context ctx;
  auto s = map_layer{[](std::string const& s) { return s.size(); }}.wrap(echo());
  static_assert(std::same_as<decltype(s)::response_type, std::size_t>);

  auto r = sync_wait(ctx, s.call("four"));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, 4U);
}

TEST(service_test, map_err_transforms_errors_only) {
  io_context ctx;
  auto to_unavailable = map_err_layer{
    [](std::error_code) { return make_error_code(error::service_unavailable); }};

  auto bad = to_unavailable.wrap(failing(error::invalid_argument));
  auto r = sync_wait(ctx, bad.call("x"));
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error(), error::service_unavailable);

  auto good = to_unavailable.wrap(echo());
  auto ok = sync_wait(ctx, good.call("x"));
  ASSERT_TRUE(ok);
  EXPECT_EQ(*ok, "x");
}

TEST(service_test, and_then_chains_and_short_circuits) {
  io_context ctx;
  auto upper = make_service<std::string>([](std::string s) -> awaitable<result<std::string>> {
    for (auto& ch : s) {
      ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    }
    co_return s;
  });

  auto chain = and_then(echo(), upper);
  auto r = sync_wait(ctx, chain.call("abc"));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, "ABC");

  auto broken = and_then(failing(error::malformed_frame), upper);
  auto e = sync_wait(ctx, broken.call("abc"));
  ASSERT_FALSE(e);
  EXPECT_EQ(e.error(), error::malformed_frame);
}

TEST(service_test, in_flight_limit_parks_and_wakes) {
  io_context ctx;
  auto gate = std::make_shared<notify_event>();
  auto slow = make_service<std::string>([gate](std::string s) -> awaitable<result<std::string>> {
    (void)co_await gate->async_wait(use_awaitable);
    co_return s;
  });
  auto s = in_flight_limit{1}.wrap(std::move(slow));

  auto ev = std::make_shared<notify_event>();
  waker w{ev};

  ASSERT_TRUE(s.poll_ready(w).is_ready());
  auto first = s.call("a");
  EXPECT_EQ(s.in_flight(), 1U);
  EXPECT_TRUE(s.poll_ready(w).is_pending());
  EXPECT_EQ(s.poll_shutdown(w), shutdown_state::pending);

  bool woke = false;
  co_spawn(ctx.get_executor(),
           [ev, &woke]() -> awaitable<void> {
             auto r = co_await ev->async_wait(use_awaitable);
             woke = r.has_value();
           },
           detached);
  co_spawn(ctx.get_executor(), std::move(first), detached);
  (void)ctx.poll();
  EXPECT_FALSE(woke);

  gate->notify_one();
  (void)ctx.poll();
  EXPECT_TRUE(woke);
  EXPECT_EQ(s.in_flight(), 0U);
  EXPECT_TRUE(s.poll_ready(w).is_ready());
  EXPECT_EQ(s.poll_shutdown(w), shutdown_state::done);
}

TEST(service_test, dropped_call_releases_its_slot) {
  auto s = in_flight_limit{1}.wrap(echo());
  ASSERT_TRUE(s.poll_ready(waker{}).is_ready());
  {
    auto never_awaited = s.call("a");
    EXPECT_EQ(s.in_flight(), 1U);
  }
  EXPECT_EQ(s.in_flight(), 0U);
}

TEST(service_test, stats_layer_counts_calls) {
  io_context ctx;
  auto counters = std::make_shared<stats_counters>();
  auto ok = stats_layer{counters}.wrap(echo());
  auto bad = stats_layer{counters}.wrap(failing(error::service_unavailable));

  (void)sync_wait(ctx, ok.call("a"));
  (void)sync_wait(ctx, ok.call("b"));
  (void)sync_wait(ctx, bad.call("c"));

  EXPECT_EQ(counters->requests.load(), 3U);
  EXPECT_EQ(counters->responses.load(), 2U);
  EXPECT_EQ(counters->errors.load(), 1U);
  EXPECT_EQ(counters->in_flight.load(), 0);
}

TEST(service_test, any_service_erases_the_type) {
  io_context ctx;
  any_service<std::string, std::string> s{echo()};
  ASSERT_TRUE(s);
  EXPECT_TRUE(s.poll_ready(waker{}).is_ready());
  auto r = sync_wait(ctx, s.call("erased"));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, "erased");
  EXPECT_EQ(s.poll_shutdown(waker{}), shutdown_state::done);

  any_service<std::string, std::string> empty;
  EXPECT_FALSE(empty);
}

TEST(service_test, pipeline_applies_layers_outermost_last) {
  io_context ctx;
  auto trace = std::make_shared<std::string>();
  auto tag = [trace](char c) {
    return map_layer{[trace, c](std::string const& s) {
      trace->push_back(c);
      return s + c;
    }};
  };

  auto p = pipeline{clone_factory{echo()}}.apply(tag('a')).apply(tag('b'));
  static_assert(service_factory<decltype(p)>);

  auto svc = sync_wait(ctx, p.create(connection_info{"peer", 1, false}));
  ASSERT_TRUE(svc);
  auto r = sync_wait(ctx, svc->call("x"));
  ASSERT_TRUE(r);
  // Responses pass inner layers first.
  EXPECT_EQ(*r, "xab");
  EXPECT_EQ(*trace, "ab");
}

TEST(service_test, factories_create_one_service_per_connection) {
  io_context ctx;
  auto made = std::make_shared<int>(0);
  fn_factory f{[made](connection_info const& ci) -> awaitable<result<counted_ready>> {
    if (ci.peer.empty()) {
      co_return unexpected(make_error_code(error::invalid_argument));
    }
    ++*made;
    co_return counted_ready{static_cast<int>(ci.id)};
  }};

  auto a = sync_wait(ctx, f.create(connection_info{"a", 2, false}));
  auto b = sync_wait(ctx, f.create(connection_info{"b", 0, false}));
  ASSERT_TRUE(a);
  ASSERT_TRUE(b);
  EXPECT_EQ(*made, 2);
  EXPECT_TRUE(a->poll_ready(waker{}).is_ready());
  EXPECT_TRUE(b->poll_ready(waker{}).is_pending());

  auto refused = sync_wait(ctx, f.create(connection_info{}));
  ASSERT_FALSE(refused);
  EXPECT_EQ(refused.error(), error::invalid_argument);
}

TEST(service_test, layered_create_outlives_its_argument) {
  io_context ctx;
  fn_factory f{[](connection_info const& ci) -> awaitable<result<counted_ready>> {
    co_return counted_ready{static_cast<int>(ci.id)};
  }};
  auto p = pipeline{f}.apply(in_flight_limit{1});

  // Nothing runs until the awaitable is awaited, long after `ci` went away.
  auto pending = [&p] {
    connection_info ci{"short-lived", 3, false};
    return p.create(ci);
  }();
  auto s = sync_wait(ctx, std::move(pending));
  ASSERT_TRUE(s);
  EXPECT_TRUE(s->poll_ready(waker{}).is_ready());
}

TEST(service_test, boxed_factory_shares_one_implementation) {
  io_context ctx;
  auto boxed = pipeline{clone_factory{echo()}}.apply(in_flight_limit{4}).boxed();
  static_assert(std::same_as<decltype(boxed)::service_type, any_service<std::string, std::string>>);

  auto copy = boxed;
  auto s = sync_wait(ctx, copy.create(connection_info{"p", 7, true}));
  ASSERT_TRUE(s);
  ASSERT_TRUE(s->poll_ready(waker{}).is_ready());
  auto r = sync_wait(ctx, s->call("boxed"));
  ASSERT_TRUE(r);
  EXPECT_EQ(*r, "boxed");
}

}  // namespace strata::test
