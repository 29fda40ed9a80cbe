#pragma once

#include <strata/any_io_executor.hpp>
#include <strata/awaitable.hpp>
#include <strata/co_sleep.hpp>
#include <strata/co_spawn.hpp>
#include <strata/codec.hpp>
#include <strata/detail/scope_exit.hpp>
#include <strata/error.hpp>
#include <strata/io_object.hpp>
#include <strata/log.hpp>
#include <strata/notify_event.hpp>
#include <strata/result.hpp>
#include <strata/service.hpp>
#include <strata/this_coro.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <concepts>
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <system_error>
#include <utility>

namespace strata {

enum class dispatch_order : std::uint8_t {
  /// Responses are written in request order.
  ordered,
  /// Responses are written as they complete (see `correlated_codec`).
  completion,
};

struct dispatcher_config {
  using duration = std::chrono::steady_clock::duration;

  /// Idle limit with no bytes moved and no calls in flight; zero disables it.
  duration keepalive_timeout = std::chrono::seconds{30};
  /// Limit on one `call`; zero disables it.
  duration request_timeout = duration::zero();
  /// Limit on the graceful drain.
  duration shutdown_timeout = std::chrono::seconds{5};

  /// Bytes read per step at most.
  std::size_t read_budget = 64 * 1024;
  dispatch_order order = dispatch_order::ordered;
  bool close_on_service_error = false;
  bool close_on_request_timeout = true;
  /// Calls running at once at most, independent of the service's own readiness.
  std::size_t max_in_flight = 256;

  auto validate() const -> std::error_code {
    if (read_budget == 0 || max_in_flight == 0 || shutdown_timeout <= duration::zero() ||
        keepalive_timeout < duration::zero() || request_timeout < duration::zero()) {
      return error::invalid_argument;
    }
    return {};
  }
};

/// Events a suspended dispatcher waits for.
class wait_set {
 public:
  enum flag : std::uint8_t {
    readable = 1U << 0,
    writable = 1U << 1,
    service = 1U << 2,
    timer = 1U << 3,
  };

  constexpr wait_set() noexcept = default;
  constexpr explicit wait_set(std::uint8_t bits) noexcept : bits_(bits) {}

  constexpr auto has(flag f) const noexcept -> bool { return (bits_ & f) != 0; }
  constexpr void add(flag f) noexcept { bits_ = static_cast<std::uint8_t>(bits_ | f); }
  constexpr auto empty() const noexcept -> bool { return bits_ == 0; }
  constexpr auto bits() const noexcept -> std::uint8_t { return bits_; }

  friend constexpr auto operator==(wait_set, wait_set) noexcept -> bool = default;

 private:
  std::uint8_t bits_{0};
};

/// Outcome of one `dispatcher::step()`.
class step_result {
 public:
  enum class kind : std::uint8_t { proceed, suspend, done };

  static constexpr auto proceed() noexcept -> step_result { return step_result{kind::proceed, {}}; }
  static constexpr auto suspend_on(wait_set w) noexcept -> step_result {
    return step_result{kind::suspend, w};
  }
  static constexpr auto done() noexcept -> step_result { return step_result{kind::done, {}}; }

  constexpr auto get_kind() const noexcept -> kind { return kind_; }
  constexpr auto is_proceed() const noexcept -> bool { return kind_ == kind::proceed; }
  constexpr auto is_suspend() const noexcept -> bool { return kind_ == kind::suspend; }
  constexpr auto is_done() const noexcept -> bool { return kind_ == kind::done; }
  constexpr auto waits() const noexcept -> wait_set { return waits_; }

 private:
  constexpr step_result(kind k, wait_set w) noexcept : kind_(k), waits_(w) {}

  kind kind_;
  wait_set waits_;
};

struct dispatcher_stats {
  std::size_t frames_decoded = 0;
  std::size_t responses_written = 0;
  std::size_t rejected_frames = 0;
  std::size_t service_errors = 0;
  std::size_t request_timeouts = 0;
  /// Empty for a clean close.
  std::error_code close_reason{};
};

template <class Request, class Response>
struct dispatcher_hooks {
  /// A frame refused during shutdown. A returned response is written in its place.
  std::function<std::optional<Response>(Request const&, std::error_code)> on_rejected{};
  /// Called once when the connection closes.
  std::function<void(std::error_code)> on_close{};
};

/// Thread-safe control of one running dispatcher.
class connection_handle {
 public:
  explicit connection_handle(std::shared_ptr<notify_event> wake) noexcept
      : wake_(std::move(wake)) {}

  /// Begin a graceful shutdown.
  void shutdown() noexcept {
    shutdown_requested_.store(true, std::memory_order_release);
    wake_->notify_one();
  }

  /// Close now, abandoning in-flight calls.
  void abort() noexcept {
    abort_requested_.store(true, std::memory_order_release);
    wake_->notify_one();
  }

  auto shutdown_requested() const noexcept -> bool {
    return shutdown_requested_.load(std::memory_order_acquire);
  }
  auto abort_requested() const noexcept -> bool {
    return abort_requested_.load(std::memory_order_acquire);
  }
  auto closed() const noexcept -> bool { return closed_.load(std::memory_order_acquire); }

  /// Set by the dispatcher.
  void mark_closed() noexcept { closed_.store(true, std::memory_order_release); }

 private:
  std::shared_ptr<notify_event> wake_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> abort_requested_{false};
  std::atomic<bool> closed_{false};
};

namespace detail {

/// Resume on `ex` after everything already queued there.
struct yield_awaiter {
  any_executor ex;

  auto await_ready() const noexcept -> bool { return false; }
  void await_suspend(std::coroutine_handle<> h) {
    ex.post([h]() mutable { h.resume(); });
  }
  void await_resume() const noexcept {}
};

}  // namespace detail

/// One connection's request loop: reads, decodes, calls the service, encodes and writes.
///
/// `step()` performs one non-blocking cycle and tells the caller what to wait for; `run()` is
/// the coroutine driver awaiting exactly those events. All state is touched on the connection
/// executor only; other threads go through `handle()`.
///
/// The service is always wrapped in a `readiness_guard`.
template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
class dispatcher {
 public:
  using request_type = typename Service::request_type;
  using response_type = typename Service::response_type;
  using hooks_type = dispatcher_hooks<request_type, response_type>;
  using clock = std::chrono::steady_clock;

  dispatcher(any_io_executor ex, io_object io, Codec codec, Service svc,
             dispatcher_config cfg = {}, hooks_type hooks = {})
      : ex_(std::move(ex)),
        io_(std::move(io)),
        codec_(std::move(codec)),
        svc_(std::make_shared<readiness_guard<Service>>(std::move(svc))),
        cfg_(cfg),
        hooks_(std::move(hooks)),
        wake_(std::make_shared<notify_event>(1)),
        handle_(std::make_shared<connection_handle>(wake_)),
        waker_(wake_),
        watchers_(std::make_shared<std::size_t>(0)),
        peer_(io_.peer()) {
    STRATA_ENSURE(ex_, "dispatcher: empty executor");
    STRATA_ENSURE(!cfg_.validate(), "dispatcher: invalid dispatcher_config");
  }

  dispatcher(dispatcher const&) = delete;
  auto operator=(dispatcher const&) -> dispatcher& = delete;
  dispatcher(dispatcher&&) = delete;
  auto operator=(dispatcher&&) -> dispatcher& = delete;

  ~dispatcher() {
    if (!closed_) {
      fail(error::operation_aborted);
    }
  }

  /// One non-blocking cycle: read, decode, dispatch, encode, flush.
  auto step() -> step_result;

  /// Drive `step()` until the connection closes. Returns the close reason.
  auto run() -> awaitable<std::error_code>;

  /// Begin a graceful shutdown (same as `handle()->shutdown()`).
  void shutdown() noexcept { handle_->shutdown(); }

  auto handle() const noexcept -> std::shared_ptr<connection_handle> { return handle_; }

  auto stats() const noexcept -> dispatcher_stats const& { return stats_; }
  auto closed() const noexcept -> bool { return closed_; }
  auto shutting_down() const noexcept -> bool { return shutting_down_; }
  auto in_flight() const noexcept -> std::size_t;

  auto io() noexcept -> io_object& { return io_; }
  auto get_executor() const noexcept -> any_io_executor { return ex_; }

  /// Earliest timer the dispatcher needs to observe, if any.
  auto next_deadline() const -> std::optional<clock::time_point>;

 private:
  struct call_slot {
    std::uint64_t seq = 0;
    bool done = false;
    bool timed_out = false;
    std::optional<result<response_type>> response{};
    clock::time_point deadline = clock::time_point::max();
    std::stop_source stop{};
  };

  using slot_ptr = std::shared_ptr<call_slot>;

  static auto call_task(std::shared_ptr<readiness_guard<Service>> svc,
                        awaitable<result<response_type>> call, slot_ptr slot,
                        std::shared_ptr<notify_event> wake) -> awaitable<void>;

  void start_call(request_type req, clock::time_point now);
  void reject(request_type const& req);
  void begin_shutdown(clock::time_point now);

  /// false when the connection closed.
  auto check_timers(clock::time_point now) -> bool;
  auto read_phase(bool& progressed) -> bool;
  auto dispatch_phase(bool& service_blocked) -> bool;
  auto encode_phase(bool& progressed) -> bool;
  auto encode_slot(call_slot& slot, bool& blocked) -> bool;
  auto flush_phase(bool& progressed) -> bool;

  void fail(std::error_code ec) noexcept;
  void finish(std::error_code reason) noexcept;

  auto wait_for(wait_set ws) -> awaitable<void>;

  template <class MakeWait>
  void spawn_watcher(std::stop_token stop, MakeWait make);

  any_io_executor ex_;
  io_object io_;
  Codec codec_;
  std::shared_ptr<readiness_guard<Service>> svc_;
  dispatcher_config cfg_;
  hooks_type hooks_;
  std::shared_ptr<notify_event> wake_;
  std::shared_ptr<connection_handle> handle_;
  waker waker_;
  std::shared_ptr<std::size_t> watchers_;
  std::string peer_;

  std::deque<slot_ptr> slots_{};
  std::optional<request_type> pending_frame_{};
  std::uint64_t next_seq_{0};
  dispatcher_stats stats_{};
  bool shutting_down_{false};
  bool closed_{false};
  std::error_code shutdown_reason_{};
  clock::time_point shutdown_deadline_{clock::time_point::max()};
};

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::in_flight() const noexcept -> std::size_t {
  return static_cast<std::size_t>(
    std::count_if(slots_.begin(), slots_.end(), [](slot_ptr const& s) { return !s->done; }));
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::next_deadline() const -> std::optional<clock::time_point> {
  if (closed_) {
    return std::nullopt;
  }
  auto t = clock::time_point::max();
  if (shutting_down_) {
    t = std::min(t, shutdown_deadline_);
  }
  for (auto const& s : slots_) {
    if (!s->done) {
      t = std::min(t, s->deadline);
    }
  }
  if (!shutting_down_ && cfg_.keepalive_timeout > clock::duration::zero() && slots_.empty() &&
      io_.write_buffer().empty()) {
    t = std::min(t, io_.last_activity() + cfg_.keepalive_timeout);
  }
  if (t == clock::time_point::max()) {
    return std::nullopt;
  }
  return t;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::call_task(std::shared_ptr<readiness_guard<Service>> svc,
                                           awaitable<result<response_type>> call, slot_ptr slot,
                                           std::shared_ptr<notify_event> wake)
  -> awaitable<void> {
  std::optional<result<response_type>> r{};
  try {
    r.emplace(co_await std::move(call));
  } catch (...) {
    log::report_exception(std::current_exception(), "service call");
    r.emplace(unexpected(make_error_code(error::service_unavailable)));
  }
  if (!slot->done) {
    slot->done = true;
    slot->response = std::move(r);
  }
  wake->notify_one();
  (void)svc;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
void dispatcher<Codec, Service>::start_call(request_type req, clock::time_point now) {
  auto slot = std::make_shared<call_slot>();
  slot->seq = next_seq_++;
  if (cfg_.request_timeout > clock::duration::zero()) {
    slot->deadline = now + cfg_.request_timeout;
  }
  slots_.push_back(slot);

  // `call` runs eagerly so the readiness report it consumes is the one just observed.
  auto call = svc_->call(std::move(req));
  co_spawn(ex_.as_any_executor(), slot->stop.get_token(),
           [svc = svc_, c = std::move(call), slot, wake = wake_]() mutable {
             return call_task(std::move(svc), std::move(c), std::move(slot), std::move(wake));
           },
           detached);
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
void dispatcher<Codec, Service>::reject(request_type const& req) {
  ++stats_.rejected_frames;
  auto const ec = make_error_code(error::rejected_during_shutdown);
  log::logger()->debug("dispatcher[{}]: frame rejected: {}", peer_, ec.message());
  if (!hooks_.on_rejected) {
    return;
  }
  auto refusal = hooks_.on_rejected(req, ec);
  if (!refusal) {
    return;
  }
  // A refusal takes the place of a response, in request order.
  auto slot = std::make_shared<call_slot>();
  slot->seq = next_seq_++;
  slot->done = true;
  slot->response.emplace(std::move(*refusal));
  slots_.push_back(std::move(slot));
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
void dispatcher<Codec, Service>::begin_shutdown(clock::time_point now) {
  if (shutting_down_ || closed_) {
    return;
  }
  shutting_down_ = true;
  shutdown_deadline_ = now + cfg_.shutdown_timeout;
  io_.begin_shutdown();
  log::logger()->debug("dispatcher[{}]: shutting down, {} call(s) in flight", peer_,
                       in_flight());
  if (pending_frame_) {
    auto frame = std::move(*pending_frame_);
    pending_frame_.reset();
    reject(frame);
  }
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::check_timers(clock::time_point now) -> bool {
  if (shutting_down_ && now >= shutdown_deadline_) {
    log::logger()->info("dispatcher[{}]: shutdown timeout, abandoning {} call(s)", peer_,
                        in_flight());
    fail(error::shutdown_timeout);
    return false;
  }

  for (auto& s : slots_) {
    if (s->done || now < s->deadline) {
      continue;
    }
    s->done = true;
    s->timed_out = true;
    s->response.emplace(unexpected(make_error_code(error::request_timeout)));
    s->stop.request_stop();
    ++stats_.request_timeouts;
    log::logger()->info("dispatcher[{}]: request timeout", peer_);
    if (cfg_.close_on_request_timeout) {
      fail(error::request_timeout);
      return false;
    }
  }

  if (!shutting_down_ && cfg_.keepalive_timeout > clock::duration::zero() && slots_.empty() &&
      io_.write_buffer().empty() && now - io_.last_activity() >= cfg_.keepalive_timeout) {
    log::logger()->info("dispatcher[{}]: keep-alive timeout", peer_);
    shutdown_reason_ = make_error_code(error::idle_timeout);
    begin_shutdown(now);
  }
  return true;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::read_phase(bool& progressed) -> bool {
  if (shutting_down_) {
    return true;
  }
  std::size_t read = 0;
  while (read < cfg_.read_budget) {
    auto r = io_.fill(cfg_.read_budget - read);
    if (r) {
      read += *r;
      progressed = true;
      continue;
    }
    if (r.error() == error::would_block) {
      break;
    }
    if (r.error() == error::eof) {
      log::logger()->debug("dispatcher[{}]: peer closed the stream", peer_);
    }
    fail(r.error());
    return false;
  }
  return true;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::dispatch_phase(bool& service_blocked) -> bool {
  auto const now = clock::now();
  for (;;) {
    if (!shutting_down_ && (io_.write_paused() || in_flight() >= cfg_.max_in_flight)) {
      return true;
    }

    if (!pending_frame_) {
      auto d = io_.decode(codec_);
      if (!d) {
        log::logger()->warn("dispatcher[{}]: decode failed: {}", peer_, d.error().message());
        fail(d.error());
        return false;
      }
      if (!d->has_value()) {
        return true;
      }
      ++stats_.frames_decoded;
      pending_frame_.emplace(std::move(**d));
    }

    if (shutting_down_) {
      auto frame = std::move(*pending_frame_);
      pending_frame_.reset();
      reject(frame);
      continue;
    }

    auto const rd = svc_->poll_ready(waker_);
    if (rd.is_failed()) {
      log::logger()->warn("dispatcher[{}]: service failed: {}", peer_, rd.error().message());
      fail(rd.error());
      return false;
    }
    if (rd.is_pending()) {
      service_blocked = true;
      return true;
    }

    auto frame = std::move(*pending_frame_);
    pending_frame_.reset();
    start_call(std::move(frame), now);
  }
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::encode_slot(call_slot& slot, bool& blocked) -> bool {
  auto& r = *slot.response;
  if (!r) {
    if (slot.timed_out) {
      return true;
    }
    ++stats_.service_errors;
    log::logger()->debug("dispatcher[{}]: service error: {}", peer_, r.error().message());
    if (cfg_.close_on_service_error) {
      fail(r.error());
      return false;
    }
    return true;
  }

  auto ec = io_.encode(codec_, *r);
  if (ec == error::would_block) {
    blocked = true;
    return true;
  }
  if (ec) {
    log::logger()->warn("dispatcher[{}]: encode failed: {}", peer_, ec.message());
    fail(ec);
    return false;
  }
  ++stats_.responses_written;
  return true;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::encode_phase(bool& progressed) -> bool {
  bool blocked = false;
  if (cfg_.order == dispatch_order::ordered) {
    while (!slots_.empty() && slots_.front()->done) {
      if (!encode_slot(*slots_.front(), blocked)) {
        return false;
      }
      if (blocked) {
        return true;
      }
      slots_.pop_front();
      progressed = true;
    }
    return true;
  }

  for (auto it = slots_.begin(); it != slots_.end();) {
    if (!(*it)->done) {
      ++it;
      continue;
    }
    if (!encode_slot(**it, blocked)) {
      return false;
    }
    if (blocked) {
      return true;
    }
    it = slots_.erase(it);
    progressed = true;
  }
  return true;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::flush_phase(bool& progressed) -> bool {
  if (io_.write_buffer().empty()) {
    return true;
  }
  auto r = io_.flush();
  if (!r) {
    log::logger()->debug("dispatcher[{}]: write failed: {}", peer_, r.error().message());
    fail(r.error());
    return false;
  }
  if (*r != 0) {
    progressed = true;
  }
  return true;
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::step() -> step_result {
  if (closed_) {
    return step_result::done();
  }

  auto const now = clock::now();
  if (handle_->abort_requested()) {
    fail(error::operation_aborted);
    return step_result::done();
  }
  if (handle_->shutdown_requested()) {
    begin_shutdown(now);
  }
  if (!check_timers(now)) {
    return step_result::done();
  }

  bool progressed = false;
  bool service_blocked = false;
  if (!read_phase(progressed) || !dispatch_phase(service_blocked) ||
      !encode_phase(progressed) || !flush_phase(progressed)) {
    return step_result::done();
  }

  if (shutting_down_ && slots_.empty() && io_.write_buffer().empty()) {
    if (svc_->poll_shutdown(waker_) == shutdown_state::done) {
      finish(shutdown_reason_);
      return step_result::done();
    }
    service_blocked = true;
  }

  if (progressed) {
    return step_result::proceed();
  }

  wait_set ws{};
  if (!shutting_down_ && !io_.read_paused()) {
    ws.add(wait_set::readable);
  }
  if (!io_.write_buffer().empty()) {
    ws.add(wait_set::writable);
  }
  if (service_blocked || !slots_.empty()) {
    ws.add(wait_set::service);
  }
  if (next_deadline()) {
    ws.add(wait_set::timer);
  }
  return step_result::suspend_on(ws);
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
void dispatcher<Codec, Service>::fail(std::error_code ec) noexcept {
  if (closed_) {
    return;
  }
  // One best-effort flush of bytes already encoded.
  if (io_.is_open() && !io_.write_buffer().empty()) {
    auto r = io_.flush();
    if (!r) {
      log::logger()->debug("dispatcher[{}]: final flush failed: {}", peer_, r.error().message());
    }
  }
  finish(ec);
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
void dispatcher<Codec, Service>::finish(std::error_code reason) noexcept {
  if (closed_) {
    return;
  }
  closed_ = true;
  stats_.close_reason = reason;
  for (auto& s : slots_) {
    if (!s->done) {
      s->done = true;
      s->stop.request_stop();
    }
  }
  slots_.clear();
  pending_frame_.reset();
  io_.cancel();
  io_.close();
  handle_->mark_closed();

  try {
    if (reason) {
      log::logger()->debug("dispatcher[{}]: closed: {}", peer_, reason.message());
    } else {
      log::logger()->debug("dispatcher[{}]: closed", peer_);
    }
    if (hooks_.on_close) {
      hooks_.on_close(reason);
    }
  } catch (...) {
    log::report_exception(std::current_exception(), "dispatcher on_close");
  }
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
template <class MakeWait>
void dispatcher<Codec, Service>::spawn_watcher(std::stop_token stop, MakeWait make) {
  ++*watchers_;
  auto token = stop;
  co_spawn(ex_.as_any_executor(), std::move(stop),
           [make = std::move(make), cnt = watchers_, wake = wake_,
            token = std::move(token)]() mutable -> awaitable<void> {
             auto done = detail::make_scope_exit([&cnt]() noexcept { --*cnt; });
             (void)co_await make();
             // A watcher unwound by the stop request leaves no ticket behind.
             if (!token.stop_requested()) {
               wake->notify_one();
             }
           },
           detached);
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::wait_for(wait_set ws) -> awaitable<void> {
  std::stop_source stop{};

  if (ws.has(wait_set::readable)) {
    spawn_watcher(stop.get_token(), [this] { return io_.wait_readable(); });
  }
  if (ws.has(wait_set::writable)) {
    spawn_watcher(stop.get_token(), [this] { return io_.wait_writable(); });
  }
  if (ws.has(wait_set::timer)) {
    if (auto deadline = next_deadline()) {
      auto const d = std::max(*deadline - clock::now(), clock::duration::zero());
      spawn_watcher(stop.get_token(), [ex = ex_, d] { return co_sleep(ex, d); });
    }
  }

  // Service readiness, call completion, finished watchers and handle requests all land here.
  auto r = co_await wake_->async_wait(use_awaitable);
  if (!r) {
    fail(r.error());
  }

  stop.request_stop();
  auto ex = co_await this_coro::executor;
  while (*watchers_ != 0) {
    co_await detail::yield_awaiter{ex};
  }
}

template <codec Codec, service Service>
  requires std::same_as<typename Service::request_type, typename Codec::item_type> &&
           encoder<Codec, typename Service::response_type>
auto dispatcher<Codec, Service>::run() -> awaitable<std::error_code> {
  std::size_t streak = 0;
  for (;;) {
    auto r = step();
    if (r.is_done()) {
      break;
    }
    if (r.is_proceed()) {
      // Let other connections on this executor run now and then.
      if (++streak % 16 == 0) {
        co_await detail::yield_awaiter{co_await this_coro::executor};
      }
      continue;
    }
    streak = 0;
    co_await wait_for(r.waits());
  }
  co_return stats_.close_reason;
}

}  // namespace strata
