#pragma once

#include <exception>
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

#include <version>
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L
#include <expected>
#endif

namespace strata {

// Compatibility shim for `std::expected` (C++23).
//
// - If the standard library provides `std::expected`, this header aliases it.
// - Otherwise it provides the subset strata uses.
#if defined(__cpp_lib_expected) && __cpp_lib_expected >= 202211L

template <class E>
using unexpected = std::unexpected<E>;

using unexpect_t = std::unexpect_t;
inline constexpr unexpect_t unexpect = std::unexpect;

template <class E>
using bad_expected_access = std::bad_expected_access<E>;

template <class T, class E>
using expected = std::expected<T, E>;

#else

template <class E>
class bad_expected_access : public std::exception {
 public:
  explicit bad_expected_access(E e) : err_(std::move(e)) {}

  auto error() const& -> E const& { return err_; }
  auto error() & -> E& { return err_; }

  char const* what() const noexcept override { return "bad expected access"; }

 private:
  E err_;
};

template <class E>
class unexpected {
 public:
  constexpr explicit unexpected(E const& e) : error_(e) {}
  constexpr explicit unexpected(E&& e) : error_(std::move(e)) {}

  constexpr auto error() const& noexcept -> E const& { return error_; }
  constexpr auto error() & noexcept -> E& { return error_; }
  constexpr auto error() && noexcept -> E&& { return std::move(error_); }

  friend constexpr auto operator==(unexpected const& a, unexpected const& b) -> bool {
    return a.error_ == b.error_;
  }

 private:
  E error_;
};

template <class E>
unexpected(E) -> unexpected<E>;

struct unexpect_t {
  explicit unexpect_t() = default;
};
inline constexpr unexpect_t unexpect{};

template <class T, class E>
class expected {
 public:
  using value_type = T;
  using error_type = E;
  using unexpected_type = unexpected<E>;

  template <class U>
  using rebind = expected<U, error_type>;

  expected()
    requires std::is_default_constructible_v<T>
      : storage_(std::in_place_index<0>) {}

  template <class U = T>
    requires(!std::is_same_v<std::remove_cvref_t<U>, expected> &&
             !std::is_same_v<std::remove_cvref_t<U>, std::in_place_t> &&
             !std::is_same_v<std::remove_cvref_t<U>, unexpect_t> &&
             std::is_constructible_v<T, U &&>)
  expected(U&& v) : storage_(std::in_place_index<0>, std::forward<U>(v)) {}

  template <class G>
    requires std::is_constructible_v<E, G const&>
  expected(unexpected<G> const& u) : storage_(std::in_place_index<1>, u.error()) {}

  template <class G>
    requires std::is_constructible_v<E, G&&>
  expected(unexpected<G>&& u) : storage_(std::in_place_index<1>, std::move(u).error()) {}

  template <class... Args>
  explicit expected(std::in_place_t, Args&&... args)
      : storage_(std::in_place_index<0>, std::forward<Args>(args)...) {}

  template <class... Args>
  explicit expected(unexpect_t, Args&&... args)
      : storage_(std::in_place_index<1>, std::forward<Args>(args)...) {}

  expected(expected const&) = default;
  expected(expected&&) = default;
  auto operator=(expected const&) -> expected& = default;
  auto operator=(expected&&) -> expected& = default;

  auto has_value() const noexcept -> bool { return storage_.index() == 0; }
  explicit operator bool() const noexcept { return has_value(); }

  auto value() & -> T& {
    throw_if_error();
    return std::get<0>(storage_);
  }
  auto value() const& -> T const& {
    throw_if_error();
    return std::get<0>(storage_);
  }
  auto value() && -> T&& {
    throw_if_error();
    return std::move(std::get<0>(storage_));
  }

  auto error() & noexcept -> E& { return *std::get_if<1>(&storage_); }
  auto error() const& noexcept -> E const& { return *std::get_if<1>(&storage_); }
  auto error() && noexcept -> E&& { return std::move(*std::get_if<1>(&storage_)); }

  auto operator*() & noexcept -> T& { return *std::get_if<0>(&storage_); }
  auto operator*() const& noexcept -> T const& { return *std::get_if<0>(&storage_); }
  auto operator*() && noexcept -> T&& { return std::move(*std::get_if<0>(&storage_)); }

  auto operator->() noexcept -> T* { return std::get_if<0>(&storage_); }
  auto operator->() const noexcept -> T const* { return std::get_if<0>(&storage_); }

  template <class U>
  auto value_or(U&& fallback) const& -> T {
    return has_value() ? **this : static_cast<T>(std::forward<U>(fallback));
  }

  template <class U>
  auto value_or(U&& fallback) && -> T {
    return has_value() ? std::move(**this) : static_cast<T>(std::forward<U>(fallback));
  }

  template <class... Args>
  auto emplace(Args&&... args) -> T& {
    return storage_.template emplace<0>(std::forward<Args>(args)...);
  }

  /// f: T -> expected<U, E>
  template <class F>
  auto and_then(F&& f) & {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T&>>;
    if (has_value()) {
      return std::invoke(std::forward<F>(f), **this);
    }
    return R(unexpect, error());
  }

  template <class F>
  auto and_then(F&& f) && {
    using R = std::remove_cvref_t<std::invoke_result_t<F, T&&>>;
    if (has_value()) {
      return std::invoke(std::forward<F>(f), std::move(**this));
    }
    return R(unexpect, std::move(error()));
  }

  /// f: T -> U
  template <class F>
  auto transform(F&& f) && {
    using U = std::remove_cv_t<std::invoke_result_t<F, T&&>>;
    if constexpr (std::is_void_v<U>) {
      if (has_value()) {
        std::invoke(std::forward<F>(f), std::move(**this));
        return expected<void, E>{};
      }
      return expected<void, E>(unexpect, std::move(error()));
    } else {
      if (has_value()) {
        return expected<U, E>(std::in_place, std::invoke(std::forward<F>(f), std::move(**this)));
      }
      return expected<U, E>(unexpect, std::move(error()));
    }
  }

  /// f: E -> G
  template <class F>
  auto transform_error(F&& f) && {
    using G = std::remove_cv_t<std::invoke_result_t<F, E&&>>;
    if (has_value()) {
      return expected<T, G>(std::in_place, std::move(**this));
    }
    return expected<T, G>(unexpect, std::invoke(std::forward<F>(f), std::move(error())));
  }

  template <class U>
  friend auto operator==(expected const& x, U const& v) -> bool
    requires(!std::is_same_v<U, expected>)
  {
    return x.has_value() && *x == v;
  }

  template <class G>
  friend auto operator==(expected const& x, unexpected<G> const& u) -> bool {
    return !x.has_value() && x.error() == u.error();
  }

 private:
  void throw_if_error() const {
    if (!has_value()) {
      throw bad_expected_access<E>(error());
    }
  }

  std::variant<T, E> storage_;
};

template <class E>
class expected<void, E> {
 public:
  using value_type = void;
  using error_type = E;
  using unexpected_type = unexpected<E>;

  expected() noexcept = default;

  template <class G>
    requires std::is_constructible_v<E, G const&>
  expected(unexpected<G> const& u) : error_(std::in_place, u.error()) {}

  template <class G>
    requires std::is_constructible_v<E, G&&>
  expected(unexpected<G>&& u) : error_(std::in_place, std::move(u).error()) {}

  explicit expected(std::in_place_t) noexcept {}

  template <class... Args>
  explicit expected(unexpect_t, Args&&... args) : error_(std::in_place, std::forward<Args>(args)...) {}

  auto has_value() const noexcept -> bool { return !error_.has_value(); }
  explicit operator bool() const noexcept { return has_value(); }

  void value() const {
    if (error_) {
      throw bad_expected_access<E>(*error_);
    }
  }

  void operator*() const noexcept {}

  auto error() & noexcept -> E& { return *error_; }
  auto error() const& noexcept -> E const& { return *error_; }
  auto error() && noexcept -> E&& { return std::move(*error_); }

  template <class G>
  friend auto operator==(expected const& x, unexpected<G> const& u) -> bool {
    return !x.has_value() && x.error() == u.error();
  }

 private:
  std::optional<E> error_{};
};

#endif

}  // namespace strata
