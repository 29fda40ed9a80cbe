#pragma once

#include <strata/awaitable.hpp>
#include <strata/result.hpp>
#include <strata/service.hpp>

#include <concepts>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace strata {

/// Per-connection context handed to a factory.
struct connection_info {
  std::string peer{};
  std::uint64_t id{0};
  bool secure{false};
};

/// Asynchronously creates one service per connection.
///
/// Factories are shared read-only by all connections, so `create` is const and may run
/// concurrently on several executors.
template <class F>
concept service_factory = requires(F const& f, connection_info const& ci) {
  typename F::service_type;
  requires service<typename F::service_type>;
  { f.create(ci) } -> std::same_as<awaitable<result<typename F::service_type>>>;
};

namespace detail {

template <class A>
struct created_service;

template <class S>
struct created_service<awaitable<result<S>>> {
  using type = S;
};

}  // namespace detail

/// Adapts a callable `connection_info const& -> awaitable<result<S>>`.
template <class F>
class fn_factory {
 public:
  using service_type = typename detail::created_service<
    std::remove_cvref_t<std::invoke_result_t<F const&, connection_info const&>>>::type;

  explicit fn_factory(F f) : f_(std::move(f)) {}

  auto create(connection_info const& ci) const -> awaitable<result<service_type>> {
    return std::invoke(f_, ci);
  }

 private:
  F f_;
};

/// Hands out copies of a prototype service.
template <service S>
  requires std::copy_constructible<S>
class clone_factory {
 public:
  using service_type = S;

  explicit clone_factory(S prototype) : prototype_(std::move(prototype)) {}

  auto create(connection_info const&) const -> awaitable<result<S>> { co_return S{prototype_}; }

 private:
  S prototype_;
};

/// Creates the inner service, then wraps it with `layer`.
template <service_factory Inner, class Layer>
  requires layer_for<Layer, typename Inner::service_type>
class layered_factory {
 public:
  using service_type = layered_service_t<Layer, typename Inner::service_type>;

  layered_factory(Inner inner, Layer layer) : inner_(std::move(inner)), layer_(std::move(layer)) {}

  // `ci` is copied: the frame may be resumed after the caller's argument is gone.
  auto create(connection_info ci) const -> awaitable<result<service_type>> {
    auto r = co_await inner_.create(ci);
    if (!r) {
      co_return unexpected(r.error());
    }
    co_return layer_.wrap(std::move(*r));
  }

 private:
  Inner inner_;
  Layer layer_;
};

/// Type-erased factory of `any_service<Req, Resp>`; copies share one implementation.
template <class Req, class Resp>
class boxed_factory {
 public:
  using service_type = any_service<Req, Resp>;

  boxed_factory() = default;

  template <service_factory F>
    requires(!std::same_as<std::remove_cvref_t<F>, boxed_factory>)
  explicit boxed_factory(F f) : impl_(std::make_shared<model<F>>(std::move(f))) {}

  auto create(connection_info const& ci) const -> awaitable<result<service_type>> {
    return impl_->create(ci);
  }

  explicit operator bool() const noexcept { return impl_ != nullptr; }

 private:
  struct concept_t {
    virtual ~concept_t() = default;
    virtual auto create(connection_info const& ci) const -> awaitable<result<service_type>> = 0;
  };

  template <class F>
  struct model final : concept_t {
    explicit model(F f) : factory(std::move(f)) {}

    auto create(connection_info const& ci) const -> awaitable<result<service_type>> override {
      return create_boxed(factory, ci);
    }

    // `ci` is copied: the frame outlives the caller's argument.
    static auto create_boxed(F const& f, connection_info ci) -> awaitable<result<service_type>> {
      auto r = co_await f.create(ci);
      if (!r) {
        co_return unexpected(r.error());
      }
      co_return service_type{std::move(*r)};
    }

    F factory;
  };

  std::shared_ptr<concept_t const> impl_{};
};

}  // namespace strata
