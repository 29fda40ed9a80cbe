#pragma once

#include <strata/middleware.hpp>
#include <strata/service.hpp>
#include <strata/service_factory.hpp>

#include <utility>

namespace strata {

/// Immutable middleware onion around a factory.
///
/// `pipeline(f).apply(a).apply(b)` creates services shaped `b(a(f()))`: the layer applied last
/// is outermost, so it sees a request first and its response last. `apply` returns a new
/// pipeline; a built pipeline is shared read-only across connections.
template <service_factory F>
class pipeline {
 public:
  using factory_type = F;
  using service_type = typename F::service_type;

  explicit pipeline(F f) : factory_(std::move(f)) {}

  template <class Layer>
    requires layer_for<Layer, service_type>
  auto apply(Layer layer) const& -> pipeline<layered_factory<F, Layer>> {
    return pipeline<layered_factory<F, Layer>>{layered_factory<F, Layer>{factory_, std::move(layer)}};
  }

  template <class Layer>
    requires layer_for<Layer, service_type>
  auto apply(Layer layer) && -> pipeline<layered_factory<F, Layer>> {
    return pipeline<layered_factory<F, Layer>>{
      layered_factory<F, Layer>{std::move(factory_), std::move(layer)}};
  }

  auto create(connection_info const& ci) const -> awaitable<result<service_type>> {
    return factory_.create(ci);
  }

  auto factory() const noexcept -> F const& { return factory_; }

  /// Erase the layer types.
  auto boxed() const
    -> boxed_factory<typename service_type::request_type, typename service_type::response_type> {
    return boxed_factory<typename service_type::request_type,
                         typename service_type::response_type>{factory_};
  }

 private:
  F factory_;
};

template <class F>
pipeline(F) -> pipeline<F>;

}  // namespace strata
