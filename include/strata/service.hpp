#pragma once

#include <strata/awaitable.hpp>
#include <strata/error.hpp>
#include <strata/notify_event.hpp>
#include <strata/result.hpp>

#include <algorithm>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <memory>
#include <system_error>
#include <type_traits>
#include <utility>

namespace strata {

/// Result of `poll_ready`: ready with a capacity, not ready yet, or failed.
class readiness {
 public:
  static constexpr std::size_t unbounded = std::numeric_limits<std::size_t>::max();

  enum class kind : std::uint8_t { ready, not_ready, failed };

  static auto ready(std::size_t capacity = unbounded) noexcept -> readiness {
    return readiness{kind::ready, capacity, {}};
  }
  static auto not_ready() noexcept -> readiness { return readiness{kind::not_ready, 0, {}}; }
  static auto failed(std::error_code ec) noexcept -> readiness {
    return readiness{kind::failed, 0, ec};
  }

  auto get_kind() const noexcept -> kind { return kind_; }
  auto is_ready() const noexcept -> bool { return kind_ == kind::ready; }
  auto is_pending() const noexcept -> bool { return kind_ == kind::not_ready; }
  auto is_failed() const noexcept -> bool { return kind_ == kind::failed; }

  auto capacity() const noexcept -> std::size_t { return capacity_; }
  auto error() const noexcept -> std::error_code { return ec_; }

  friend auto operator==(readiness const&, readiness const&) noexcept -> bool = default;

 private:
  readiness(kind k, std::size_t cap, std::error_code ec) noexcept
      : kind_(k), capacity_(cap), ec_(ec) {}

  kind kind_;
  std::size_t capacity_;
  std::error_code ec_;
};

/// Readiness of a composite: failed if any part failed, ready only if every part is ready
/// (with the smallest capacity), otherwise not ready.
inline auto combine_readiness(readiness a, readiness b) noexcept -> readiness {
  if (a.is_failed()) {
    return a;
  }
  if (b.is_failed()) {
    return b;
  }
  if (a.is_ready() && b.is_ready()) {
    return readiness::ready(std::min(a.capacity(), b.capacity()));
  }
  return readiness::not_ready();
}

enum class shutdown_state : std::uint8_t { pending, done };

inline auto combine_shutdown(shutdown_state a, shutdown_state b) noexcept -> shutdown_state {
  return a == shutdown_state::done && b == shutdown_state::done ? shutdown_state::done
                                                                 : shutdown_state::pending;
}

/// Signals a dispatcher that a service which reported `not_ready` (or shutdown `pending`) may
/// have made progress. Cheap to copy; `wake()` is safe from any thread.
class waker {
 public:
  waker() noexcept = default;
  explicit waker(std::shared_ptr<notify_event> ev) noexcept : ev_(std::move(ev)) {}

  void wake() const noexcept {
    if (ev_) {
      ev_->notify_one();
    }
  }

  explicit operator bool() const noexcept { return ev_ != nullptr; }

  friend auto operator==(waker const& a, waker const& b) noexcept -> bool {
    return a.ev_ == b.ev_;
  }

 private:
  std::shared_ptr<notify_event> ev_{};
};

/// A request/response handler bound to one connection.
///
/// - `poll_ready(w)` never blocks. After `not_ready` the service must `w.wake()` once it may
///   have become ready.
/// - `call(req)` may only follow a `ready` report.
/// - `poll_shutdown(w)` reports `done` once in-flight work has drained.
template <class S>
concept service = requires(S& s, waker const& w, typename S::request_type req) {
  typename S::request_type;
  typename S::response_type;
  { s.poll_ready(w) } -> std::same_as<readiness>;
  { s.call(std::move(req)) } -> std::same_as<awaitable<result<typename S::response_type>>>;
  { s.poll_shutdown(w) } -> std::same_as<shutdown_state>;
};

/// A service middleware: `wrap(inner)` returns a service owning `inner`.
template <class L, class S>
concept layer_for = service<S> && requires(L const& l, S inner) {
  { l.wrap(std::move(inner)) } -> service;
};

template <class L, class S>
using layered_service_t = decltype(std::declval<L const&>().wrap(std::declval<S>()));

namespace detail {

template <class T>
auto fail_call(std::error_code ec) -> awaitable<result<T>> {
  co_return unexpected(ec);
}

template <class A>
struct call_value;

template <class T>
struct call_value<awaitable<result<T>>> {
  using type = T;
};

}  // namespace detail

/// Adapts a callable `Req -> awaitable<result<Resp>>` into an always-ready service.
template <class Req, class F>
class fn_service {
 public:
  using request_type = Req;
  using response_type =
    typename detail::call_value<std::remove_cvref_t<std::invoke_result_t<F&, Req>>>::type;

  explicit fn_service(F f) : f_(std::move(f)) {}

  auto poll_ready(waker const&) -> readiness { return readiness::ready(); }

  auto call(Req req) -> awaitable<result<response_type>> { return std::invoke(f_, std::move(req)); }

  auto poll_shutdown(waker const&) -> shutdown_state { return shutdown_state::done; }

 private:
  F f_;
};

template <class Req, class F>
auto make_service(F f) -> fn_service<Req, F> {
  return fn_service<Req, F>{std::move(f)};
}

/// Turns a `call` without a preceding ready `poll_ready` into `error::call_without_ready`.
///
/// Each ready report admits exactly one call.
template <service S>
class readiness_guard {
 public:
  using request_type = typename S::request_type;
  using response_type = typename S::response_type;

  explicit readiness_guard(S inner) : inner_(std::move(inner)) {}

  auto poll_ready(waker const& w) -> readiness {
    auto r = inner_.poll_ready(w);
    armed_ = r.is_ready();
    return r;
  }

  auto call(request_type req) -> awaitable<result<response_type>> {
    if (!std::exchange(armed_, false)) {
      return detail::fail_call<response_type>(error::call_without_ready);
    }
    return inner_.call(std::move(req));
  }

  auto poll_shutdown(waker const& w) -> shutdown_state { return inner_.poll_shutdown(w); }

  auto inner() noexcept -> S& { return inner_; }

 private:
  S inner_;
  bool armed_{false};
};

/// Type-erased service.
template <class Req, class Resp>
class any_service {
 public:
  using request_type = Req;
  using response_type = Resp;

  any_service() = default;

  template <service S>
    requires(!std::same_as<std::remove_cvref_t<S>, any_service> &&
             std::same_as<typename S::request_type, Req> &&
             std::same_as<typename S::response_type, Resp>)
  any_service(S s) : impl_(std::make_unique<model<S>>(std::move(s))) {}

  any_service(any_service&&) noexcept = default;
  auto operator=(any_service&&) noexcept -> any_service& = default;

  auto poll_ready(waker const& w) -> readiness { return impl_->poll_ready(w); }
  auto call(Req req) -> awaitable<result<Resp>> { return impl_->call(std::move(req)); }
  auto poll_shutdown(waker const& w) -> shutdown_state { return impl_->poll_shutdown(w); }

  explicit operator bool() const noexcept { return impl_ != nullptr; }

 private:
  struct concept_t {
    virtual ~concept_t() = default;
    virtual auto poll_ready(waker const& w) -> readiness = 0;
    virtual auto call(Req req) -> awaitable<result<Resp>> = 0;
    virtual auto poll_shutdown(waker const& w) -> shutdown_state = 0;
  };

  template <class S>
  struct model final : concept_t {
    explicit model(S s) : svc(std::move(s)) {}
    auto poll_ready(waker const& w) -> readiness override { return svc.poll_ready(w); }
    auto call(Req req) -> awaitable<result<Resp>> override { return svc.call(std::move(req)); }
    auto poll_shutdown(waker const& w) -> shutdown_state override { return svc.poll_shutdown(w); }
    S svc;
  };

  std::unique_ptr<concept_t> impl_{};
};

}  // namespace strata
