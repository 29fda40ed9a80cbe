#include <gtest/gtest.h>

#include <strata/strata.hpp>
#include <strata/src.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "test_util.hpp"

namespace strata::test {

using namespace std::chrono_literals;

namespace {

/// One length-prefixed frame with a 1-byte header.
auto frame(std::string_view payload) -> std::string {
  std::string s(1, static_cast<char>(payload.size()));
  s.append(payload);
  return s;
}

/// Echo, except that payloads starting with 's' wait for `gate`.
auto gated_echo(std::shared_ptr<notify_event> gate) {
  return make_service<buffer_view>(
    [gate](buffer_view req) -> awaitable<result<buffer_view>> {
      if (!req.empty() && req.to_string()[0] == 's') {
        auto r = co_await gate->async_wait(use_awaitable);
        if (!r) {
          co_return unexpected(r.error());
        }
      }
      co_return req;
    });
}

/// Service whose readiness the test controls.
class switchable_service {
 public:
  using request_type = buffer_view;
  using response_type = buffer_view;

  struct control {
    bool ready{false};
    waker parked{};
    int calls{0};
  };

  explicit switchable_service(std::shared_ptr<control> c) : c_(std::move(c)) {}

  auto poll_ready(waker const& w) -> readiness {
    if (!c_->ready) {
      c_->parked = w;
      return readiness::not_ready();
    }
    return readiness::ready();
  }

  auto call(buffer_view req) -> awaitable<result<buffer_view>> {
    ++c_->calls;
    co_return req;
  }

  auto poll_shutdown(waker const&) -> shutdown_state { return shutdown_state::done; }

 private:
  std::shared_ptr<control> c_;
};

/// Step and run posted work until the dispatcher closes or `rounds` is exhausted.
template <class D>
auto pump(D& d, io_context& ctx, int rounds = 8) -> step_result {
  auto r = step_result::done();
  for (int i = 0; i < rounds; ++i) {
    r = d.step();
    (void)ctx.poll();
    if (r.is_done()) {
      break;
    }
  }
  return r;
}

/// Close and let abandoned calls unwind.
template <class D>
void finish(D& d, io_context& ctx) {
  d.handle()->abort();
  (void)d.step();
  (void)ctx.poll();
}

}  // namespace

TEST(dispatcher_test, ordered_mode_preserves_request_order) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(gate)};

  st->push(frame("sa") + frame("b"));
  (void)pump(d, ctx, 3);
  // "b" is done but must wait for "sa".
  EXPECT_EQ(st->written, "");
  EXPECT_EQ(d.in_flight(), 1U);

  gate->notify_one();
  (void)ctx.poll();
  (void)pump(d, ctx, 3);
  EXPECT_EQ(st->written, frame("sa") + frame("b"));
  EXPECT_EQ(d.stats().frames_decoded, 2U);
  EXPECT_EQ(d.stats().responses_written, 2U);

  finish(d, ctx);
}

TEST(dispatcher_test, completion_mode_writes_as_calls_finish) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();

  using codec_type = correlated_codec<length_prefixed_codec>;
  auto svc = make_service<correlated<buffer_view>>(
    [gate](correlated<buffer_view> req) -> awaitable<result<correlated<buffer_view>>> {
      if (req.id == 1) {
        (void)co_await gate->async_wait(use_awaitable);
      }
      co_return req;
    });

  dispatcher_config cfg{};
  cfg.order = dispatch_order::completion;
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, codec_type{length_prefixed_codec{1}},
               std::move(svc), cfg};

  byte_buffer wire;
  codec_type c{length_prefixed_codec{1}};
  ASSERT_FALSE(c.encode({1, buffer_view::copy_of(std::string_view{"a"})}, wire));
  auto const first = wire.share(0, wire.size()).to_string();
  wire.consume(wire.size());
  ASSERT_FALSE(c.encode({2, buffer_view::copy_of(std::string_view{"b"})}, wire));
  auto const second = wire.share(0, wire.size()).to_string();

  st->push(first + second);
  (void)pump(d, ctx, 3);
  EXPECT_EQ(st->written, second);

  gate->notify_one();
  (void)ctx.poll();
  (void)pump(d, ctx, 3);
  EXPECT_EQ(st->written, second + first);

  finish(d, ctx);
}

TEST(dispatcher_test, not_ready_service_suspends_dispatch) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto ctl = std::make_shared<switchable_service::control>();
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               switchable_service{ctl}};

  st->push(frame("x") + frame("y"));
  auto r = pump(d, ctx, 3);
  ASSERT_TRUE(r.is_suspend());
  EXPECT_TRUE(r.waits().has(wait_set::service));
  EXPECT_EQ(ctl->calls, 0);
  EXPECT_TRUE(ctl->parked);

  ctl->ready = true;
  ctl->parked.wake();
  (void)pump(d, ctx, 3);
  EXPECT_EQ(ctl->calls, 2);
  EXPECT_EQ(st->written, frame("x") + frame("y"));

  finish(d, ctx);
}

TEST(dispatcher_test, read_backpressure_stops_transport_reads) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto ctl = std::make_shared<switchable_service::control>();

  io_config io{};
  io.read_chunk = 4;
  io.read_capacity = 64;
  io.read_high_watermark = 16;
  io.read_low_watermark = 4;
  dispatcher d{ctx.get_executor(), io_object{std::move(t), io}, length_prefixed_codec{1},
               switchable_service{ctl}};

  for (int i = 0; i < 8; ++i) {
    st->push(frame("abcd"));
  }
  (void)pump(d, ctx, 4);
  auto const calls_at_high = st->read_calls;
  EXPECT_TRUE(d.io().read_paused());

  // Further steps must not touch the transport while the buffer sits above the low mark.
  (void)pump(d, ctx, 4);
  EXPECT_EQ(st->read_calls, calls_at_high);
  EXPECT_EQ(ctl->calls, 0);

  ctl->ready = true;
  ctl->parked.wake();
  (void)pump(d, ctx, 8);
  EXPECT_GT(st->read_calls, calls_at_high);
  EXPECT_EQ(ctl->calls, 8);
  EXPECT_EQ(st->written.size(), 8U * 5U);

  finish(d, ctx);
}

TEST(dispatcher_test, write_backpressure_blocks_new_calls) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto ctl = std::make_shared<switchable_service::control>();
  ctl->ready = true;

  io_config io{};
  io.write_high_watermark = 8;
  io.write_low_watermark = 2;
  dispatcher d{ctx.get_executor(), io_object{std::move(t), io}, length_prefixed_codec{1},
               switchable_service{ctl}};

  st->set_write_limit(0);
  st->push(frame("1111") + frame("2222"));
  (void)pump(d, ctx, 3);
  EXPECT_EQ(ctl->calls, 2);
  EXPECT_TRUE(d.io().write_paused());

  st->push(frame("3333"));
  (void)pump(d, ctx, 3);
  EXPECT_EQ(ctl->calls, 2);

  st->set_write_limit(static_cast<std::size_t>(-1));
  (void)pump(d, ctx, 4);
  EXPECT_EQ(ctl->calls, 3);
  EXPECT_EQ(st->written, frame("1111") + frame("2222") + frame("3333"));

  finish(d, ctx);
}

TEST(dispatcher_test, graceful_shutdown_drains_and_rejects_pending_frames) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();

  std::optional<std::error_code> rejected_with;
  std::optional<std::error_code> closed_with;
  dispatcher_hooks<buffer_view, buffer_view> hooks{};
  hooks.on_rejected = [&](buffer_view const&, std::error_code ec) -> std::optional<buffer_view> {
    rejected_with = ec;
    return buffer_view::copy_of(std::string_view{"R"});
  };
  hooks.on_close = [&](std::error_code ec) { closed_with = ec; };

  dispatcher d{ctx.get_executor(),
               io_object{std::move(t)},
               length_prefixed_codec{1},
               in_flight_limit{3}.wrap(gated_echo(gate)),
               dispatcher_config{},
               std::move(hooks)};

  st->push(frame("s1") + frame("s2") + frame("s3") + frame("z"));
  (void)pump(d, ctx, 3);
  EXPECT_EQ(d.in_flight(), 3U);

  d.shutdown();
  (void)pump(d, ctx, 2);
  ASSERT_TRUE(rejected_with);
  EXPECT_EQ(*rejected_with, error::rejected_during_shutdown);
  EXPECT_EQ(*rejected_with, error_kind::shutdown);
  EXPECT_FALSE(d.closed());
  EXPECT_EQ(d.io().state(), io_state::shutting_down);

  gate->notify_all();
  (void)ctx.poll();
  auto r = pump(d, ctx, 4);
  EXPECT_TRUE(r.is_done());
  EXPECT_EQ(st->written, frame("s1") + frame("s2") + frame("s3") + frame("R"));
  ASSERT_TRUE(closed_with);
  EXPECT_FALSE(*closed_with);
  EXPECT_EQ(d.stats().rejected_frames, 1U);
  EXPECT_EQ(d.io().state(), io_state::closed);
}

TEST(dispatcher_test, shutdown_timeout_abandons_calls) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();

  dispatcher_config cfg{};
  cfg.shutdown_timeout = 20ms;
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(gate), cfg};

  st->push(frame("slow"));
  (void)pump(d, ctx, 2);
  d.shutdown();
  (void)pump(d, ctx, 2);
  EXPECT_FALSE(d.closed());

  std::this_thread::sleep_for(30ms);
  auto r = pump(d, ctx, 2);
  EXPECT_TRUE(r.is_done());
  EXPECT_EQ(d.stats().close_reason, error::shutdown_timeout);
  EXPECT_EQ(d.stats().close_reason, error_kind::shutdown);
}

TEST(dispatcher_test, request_timeout_drops_the_response_when_configured) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();

  dispatcher_config cfg{};
  cfg.request_timeout = 10ms;
  cfg.close_on_request_timeout = false;
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(gate), cfg};

  st->push(frame("slow") + frame("fast"));
  (void)pump(d, ctx, 2);
  std::this_thread::sleep_for(20ms);
  (void)pump(d, ctx, 3);

  EXPECT_FALSE(d.closed());
  EXPECT_EQ(d.stats().request_timeouts, 1U);
  EXPECT_EQ(st->written, frame("fast"));

  finish(d, ctx);
}

TEST(dispatcher_test, request_timeout_closes_by_default) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();

  dispatcher_config cfg{};
  cfg.request_timeout = 10ms;
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(gate), cfg};

  st->push(frame("slow"));
  (void)pump(d, ctx, 2);
  std::this_thread::sleep_for(20ms);
  auto r = pump(d, ctx, 2);
  EXPECT_TRUE(r.is_done());
  EXPECT_EQ(d.stats().close_reason, error::request_timeout);
  EXPECT_EQ(d.stats().close_reason, error_kind::timeout);
}

TEST(dispatcher_test, keepalive_timeout_shuts_down_idle_connections) {
  io_context ctx;
  auto [t, st] = mock_transport::make();

  dispatcher_config cfg{};
  cfg.keepalive_timeout = 10ms;
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(std::make_shared<notify_event>()), cfg};

  auto r = pump(d, ctx, 1);
  ASSERT_TRUE(r.is_suspend());
  EXPECT_TRUE(r.waits().has(wait_set::timer));

  std::this_thread::sleep_for(20ms);
  r = pump(d, ctx, 2);
  EXPECT_TRUE(r.is_done());
  EXPECT_EQ(d.stats().close_reason, error::idle_timeout);
}

TEST(dispatcher_test, decode_error_is_fatal) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  std::optional<std::error_code> closed_with;
  dispatcher_hooks<buffer_view, buffer_view> hooks{};
  hooks.on_close = [&](std::error_code ec) { closed_with = ec; };

  dispatcher d{ctx.get_executor(),       io_object{std::move(t)},
               length_prefixed_codec{1, 4}, gated_echo(std::make_shared<notify_event>()),
               dispatcher_config{},       std::move(hooks)};

  st->push(frame("toolong"));
  auto r = pump(d, ctx, 2);
  EXPECT_TRUE(r.is_done());
  ASSERT_TRUE(closed_with);
  EXPECT_EQ(*closed_with, error::frame_too_large);
  EXPECT_EQ(*closed_with, error_kind::decode);
  EXPECT_FALSE(st->open);
}

TEST(dispatcher_test, eof_closes_after_flushing_encoded_bytes) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(std::make_shared<notify_event>())};

  st->push(frame("a"));
  (void)pump(d, ctx, 3);
  EXPECT_EQ(st->written, frame("a"));

  st->push_eof();
  auto r = pump(d, ctx, 2);
  EXPECT_TRUE(r.is_done());
  EXPECT_EQ(d.stats().close_reason, error::eof);
}

TEST(dispatcher_test, service_errors_follow_policy) {
  auto failing = [] {
    return make_service<buffer_view>([](buffer_view req) -> awaitable<result<buffer_view>> {
      if (req == "bad") {
        co_return unexpected(make_error_code(error::service_unavailable));
      }
      co_return req;
    });
  };

  {
    io_context ctx;
    auto [t, st] = mock_transport::make();
    dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
                 failing()};
    st->push(frame("bad") + frame("ok"));
    (void)pump(d, ctx, 3);
    EXPECT_EQ(st->written, frame("ok"));
    EXPECT_EQ(d.stats().service_errors, 1U);
    EXPECT_FALSE(d.closed());
    finish(d, ctx);
  }
  {
    io_context ctx;
    auto [t, st] = mock_transport::make();
    dispatcher_config cfg{};
    cfg.close_on_service_error = true;
    dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
                 failing(), cfg};
    st->push(frame("bad"));
    auto r = pump(d, ctx, 3);
    EXPECT_TRUE(r.is_done());
    EXPECT_EQ(d.stats().close_reason, error_kind::service);
  }
}

TEST(dispatcher_test, exception_in_call_becomes_service_error) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto svc = make_service<buffer_view>([](buffer_view req) -> awaitable<result<buffer_view>> {
    if (req == "throw") {
      throw std::runtime_error("handler bug");
    }
    co_return req;
  });
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               std::move(svc)};

  st->push(frame("throw") + frame("fine"));
  (void)pump(d, ctx, 3);
  EXPECT_EQ(st->written, frame("fine"));
  EXPECT_EQ(d.stats().service_errors, 1U);
  finish(d, ctx);
}

TEST(dispatcher_test, abort_cancels_in_flight_calls) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  auto gate = std::make_shared<notify_event>();
  auto seen = std::make_shared<std::optional<std::error_code>>();

  auto svc = make_service<buffer_view>(
    [gate, seen](buffer_view req) -> awaitable<result<buffer_view>> {
      auto r = co_await gate->async_wait(use_awaitable);
      if (!r) {
        *seen = r.error();
        co_return unexpected(r.error());
      }
      co_return req;
    });
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               std::move(svc)};

  st->push(frame("x"));
  (void)pump(d, ctx, 2);
  d.handle()->abort();
  auto r = pump(d, ctx, 2);
  EXPECT_TRUE(r.is_done());
  EXPECT_EQ(d.stats().close_reason, error::operation_aborted);
  ASSERT_TRUE(*seen);
  EXPECT_EQ(**seen, error_kind::cancelled);
  EXPECT_TRUE(d.handle()->closed());
}

TEST(dispatcher_test, run_drives_steps_until_shutdown) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(std::make_shared<notify_event>())};

  std::optional<std::error_code> reason;
  co_spawn(ctx.get_executor(), [&]() -> awaitable<void> { reason = co_await d.run(); },
           detached);

  st->push(frame("ping"));
  for (int i = 0; i < 100 && st->written.size() < 5; ++i) {
    (void)ctx.run_for(10ms);
  }
  EXPECT_EQ(st->written, frame("ping"));

  st->push(frame("pong"));
  for (int i = 0; i < 100 && st->written.size() < 10; ++i) {
    (void)ctx.run_for(10ms);
  }
  EXPECT_EQ(st->written, frame("ping") + frame("pong"));

  d.shutdown();
  for (int i = 0; i < 100 && !reason; ++i) {
    (void)ctx.run_for(10ms);
  }
  ASSERT_TRUE(reason);
  EXPECT_FALSE(*reason);
}

TEST(dispatcher_test, run_sleeps_while_idle_after_traffic) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, length_prefixed_codec{1},
               gated_echo(std::make_shared<notify_event>())};

  std::optional<std::error_code> reason;
  co_spawn(ctx.get_executor(), [&]() -> awaitable<void> { reason = co_await d.run(); },
           detached);

  st->push(frame("ping"));
  for (int i = 0; i < 100 && st->written.size() < 5; ++i) {
    (void)ctx.run_for(10ms);
  }
  ASSERT_EQ(st->written, frame("ping"));

  // With nothing to read the driver parks on the transport instead of polling it.
  auto const reads = st->read_calls;
  (void)ctx.run_for(200ms);
  EXPECT_LT(st->read_calls - reads, 20U);

  d.shutdown();
  for (int i = 0; i < 100 && !reason; ++i) {
    (void)ctx.run_for(10ms);
  }
  ASSERT_TRUE(reason);
  EXPECT_FALSE(*reason);
}

TEST(dispatcher_test, frame_larger_than_read_high_watermark_completes) {
  io_context ctx;
  auto [t, st] = mock_transport::make();
  length_prefixed_codec codec{4, 60000};

  byte_buffer wire{};
  ASSERT_FALSE(codec.encode(buffer_view::copy_of(std::string(40000, 'x')), wire));
  auto const bytes = wire.readable();
  std::string const big(reinterpret_cast<char const*>(bytes.data()), bytes.size());

  dispatcher d{ctx.get_executor(), io_object{std::move(t)}, codec,
               gated_echo(std::make_shared<notify_event>())};
  ASSERT_GT(big.size(), d.io().config().read_high_watermark);

  st->push(big);
  (void)pump(d, ctx, 64);
  EXPECT_EQ(d.stats().frames_decoded, 1U);
  EXPECT_EQ(st->written, big);
  EXPECT_FALSE(d.closed());

  finish(d, ctx);
}

}  // namespace strata::test
