#pragma once

#include <strata/awaitable.hpp>
#include <strata/detail/scope_exit.hpp>
#include <strata/error.hpp>
#include <strata/result.hpp>
#include <strata/service.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <system_error>
#include <type_traits>
#include <utility>

namespace strata {

// ---- map ----

/// Transforms successful responses with `f`.
template <service S, class F>
class map_service {
 public:
  using request_type = typename S::request_type;
  using response_type =
    std::remove_cvref_t<std::invoke_result_t<F const&, typename S::response_type>>;

  map_service(S inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

  auto poll_ready(waker const& w) -> readiness { return inner_.poll_ready(w); }

  auto call(request_type req) -> awaitable<result<response_type>> {
    auto r = co_await inner_.call(std::move(req));
    if (!r) {
      co_return unexpected(r.error());
    }
    co_return std::invoke(f_, std::move(*r));
  }

  auto poll_shutdown(waker const& w) -> shutdown_state { return inner_.poll_shutdown(w); }

 private:
  S inner_;
  F f_;
};

template <class F>
class map_layer {
 public:
  explicit map_layer(F f) : f_(std::move(f)) {}

  template <service S>
  auto wrap(S inner) const -> map_service<S, F> {
    return map_service<S, F>{std::move(inner), f_};
  }

 private:
  F f_;
};

// ---- map_err ----

/// Transforms errors with `f: error_code -> error_code`.
template <service S, class F>
class map_err_service {
 public:
  using request_type = typename S::request_type;
  using response_type = typename S::response_type;

  map_err_service(S inner, F f) : inner_(std::move(inner)), f_(std::move(f)) {}

  auto poll_ready(waker const& w) -> readiness {
    auto r = inner_.poll_ready(w);
    if (r.is_failed()) {
      return readiness::failed(std::invoke(f_, r.error()));
    }
    return r;
  }

  auto call(request_type req) -> awaitable<result<response_type>> {
    auto r = co_await inner_.call(std::move(req));
    if (!r) {
      co_return unexpected(std::error_code{std::invoke(f_, r.error())});
    }
    co_return std::move(*r);
  }

  auto poll_shutdown(waker const& w) -> shutdown_state { return inner_.poll_shutdown(w); }

 private:
  S inner_;
  F f_;
};

template <class F>
class map_err_layer {
 public:
  explicit map_err_layer(F f) : f_(std::move(f)) {}

  template <service S>
  auto wrap(S inner) const -> map_err_service<S, F> {
    return map_err_service<S, F>{std::move(inner), f_};
  }

 private:
  F f_;
};

// ---- and_then ----

/// Feeds the response of `A` to `B`. Ready only when both are.
template <service A, service B>
  requires std::same_as<typename A::response_type, typename B::request_type>
class and_then_service {
 public:
  using request_type = typename A::request_type;
  using response_type = typename B::response_type;

  and_then_service(A a, B b) : a_(std::move(a)), b_(std::move(b)) {}

  auto poll_ready(waker const& w) -> readiness {
    return combine_readiness(a_.poll_ready(w), b_.poll_ready(w));
  }

  auto call(request_type req) -> awaitable<result<response_type>> {
    auto r = co_await a_.call(std::move(req));
    if (!r) {
      co_return unexpected(r.error());
    }
    co_return co_await b_.call(std::move(*r));
  }

  auto poll_shutdown(waker const& w) -> shutdown_state {
    return combine_shutdown(a_.poll_shutdown(w), b_.poll_shutdown(w));
  }

 private:
  A a_;
  B b_;
};

template <service A, service B>
auto and_then(A a, B b) -> and_then_service<A, B> {
  return and_then_service<A, B>{std::move(a), std::move(b)};
}

// ---- in_flight_limit ----

namespace detail {

struct in_flight_state {
  explicit in_flight_state(std::size_t n) noexcept : limit(n) {}

  std::size_t const limit;
  std::atomic<std::size_t> in_flight{0};
  std::mutex m{};
  waker parked{};

  void park(waker const& w) {
    std::scoped_lock lk{m};
    parked = w;
  }

  void release() noexcept {
    in_flight.fetch_sub(1, std::memory_order_acq_rel);
    waker w{};
    // park() copies a waker under the lock; wake outside it.
    {
      std::scoped_lock lk{m};
      w = std::exchange(parked, waker{});
    }
    w.wake();
  }
};

/// One admitted call; released when the call's frame goes away, whether it ran or not.
class in_flight_ticket {
 public:
  explicit in_flight_ticket(std::shared_ptr<in_flight_state> st) noexcept : st_(std::move(st)) {
    st_->in_flight.fetch_add(1, std::memory_order_acq_rel);
  }
  in_flight_ticket(in_flight_ticket&& other) noexcept : st_(std::move(other.st_)) {}
  in_flight_ticket(in_flight_ticket const&) = delete;
  auto operator=(in_flight_ticket const&) -> in_flight_ticket& = delete;
  auto operator=(in_flight_ticket&&) -> in_flight_ticket& = delete;

  ~in_flight_ticket() {
    if (st_) {
      st_->release();
    }
  }

 private:
  std::shared_ptr<in_flight_state> st_;
};

}  // namespace detail

/// Reports `not_ready` while `limit` calls are outstanding; wakes the parked waker when one
/// finishes.
template <service S>
class in_flight_limit_service {
 public:
  using request_type = typename S::request_type;
  using response_type = typename S::response_type;

  in_flight_limit_service(S inner, std::size_t limit)
      : inner_(std::move(inner)), st_(std::make_shared<detail::in_flight_state>(limit)) {}

  auto poll_ready(waker const& w) -> readiness {
    if (st_->in_flight.load(std::memory_order_acquire) >= st_->limit) {
      st_->park(w);
      // A call may have finished before the waker was parked.
      if (st_->in_flight.load(std::memory_order_acquire) >= st_->limit) {
        return readiness::not_ready();
      }
    }
    auto const free = st_->limit - st_->in_flight.load(std::memory_order_acquire);
    return combine_readiness(readiness::ready(free), inner_.poll_ready(w));
  }

  /// The slot is taken when `call` returns, not when the coroutine first runs.
  auto call(request_type req) -> awaitable<result<response_type>> {
    return run(detail::in_flight_ticket{st_}, inner_.call(std::move(req)));
  }

  auto poll_shutdown(waker const& w) -> shutdown_state {
    if (st_->in_flight.load(std::memory_order_acquire) != 0) {
      st_->park(w);
      if (st_->in_flight.load(std::memory_order_acquire) != 0) {
        return shutdown_state::pending;
      }
    }
    return inner_.poll_shutdown(w);
  }

  auto in_flight() const noexcept -> std::size_t {
    return st_->in_flight.load(std::memory_order_acquire);
  }

 private:
  static auto run(detail::in_flight_ticket, awaitable<result<response_type>> inner)
    -> awaitable<result<response_type>> {
    co_return co_await std::move(inner);
  }

  S inner_;
  std::shared_ptr<detail::in_flight_state> st_;
};

class in_flight_limit {
 public:
  explicit in_flight_limit(std::size_t limit) : limit_(limit) {
    STRATA_ENSURE(limit > 0, "in_flight_limit: limit must be > 0");
  }

  template <service S>
  auto wrap(S inner) const -> in_flight_limit_service<S> {
    return in_flight_limit_service<S>{std::move(inner), limit_};
  }

 private:
  std::size_t limit_;
};

// ---- stats ----

/// Counters shared by every service a `stats_layer` wraps.
struct stats_counters {
  std::atomic<std::uint64_t> requests{0};
  std::atomic<std::uint64_t> responses{0};
  std::atomic<std::uint64_t> errors{0};
  std::atomic<std::int64_t> in_flight{0};
};

template <service S>
class stats_service {
 public:
  using request_type = typename S::request_type;
  using response_type = typename S::response_type;

  stats_service(S inner, std::shared_ptr<stats_counters> c)
      : inner_(std::move(inner)), counters_(std::move(c)) {}

  auto poll_ready(waker const& w) -> readiness { return inner_.poll_ready(w); }

  auto call(request_type req) -> awaitable<result<response_type>> {
    auto c = counters_;
    c->requests.fetch_add(1, std::memory_order_relaxed);
    c->in_flight.fetch_add(1, std::memory_order_relaxed);
    auto guard = detail::make_scope_exit(
      [c]() noexcept { c->in_flight.fetch_sub(1, std::memory_order_relaxed); });

    auto r = co_await inner_.call(std::move(req));
    if (r) {
      c->responses.fetch_add(1, std::memory_order_relaxed);
    } else {
      c->errors.fetch_add(1, std::memory_order_relaxed);
    }
    co_return std::move(r);
  }

  auto poll_shutdown(waker const& w) -> shutdown_state { return inner_.poll_shutdown(w); }

 private:
  S inner_;
  std::shared_ptr<stats_counters> counters_;
};

class stats_layer {
 public:
  explicit stats_layer(std::shared_ptr<stats_counters> c) : counters_(std::move(c)) {
    STRATA_ENSURE(counters_ != nullptr, "stats_layer: null counters");
  }

  template <service S>
  auto wrap(S inner) const -> stats_service<S> {
    return stats_service<S>{std::move(inner), counters_};
  }

 private:
  std::shared_ptr<stats_counters> counters_;
};

/// Wraps with `readiness_guard`.
class readiness_guard_layer {
 public:
  template <service S>
  auto wrap(S inner) const -> readiness_guard<S> {
    return readiness_guard<S>{std::move(inner)};
  }
};

}  // namespace strata
