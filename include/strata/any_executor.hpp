#pragma once

#include <strata/assert.hpp>
#include <strata/detail/unique_function.hpp>
#include <strata/executor.hpp>

#include <cstddef>
#include <memory>
#include <new>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace strata {

class any_io_executor;

namespace detail {
struct any_executor_access;
}  // namespace detail

/// Type-erased, copyable executor.
///
/// Equality is type-sensitive: two erased executors compare equal only if they wrap the same
/// executor type and the wrapped values compare equal.
class any_executor {
 public:
  any_executor() = default;
  ~any_executor() { reset(); }

  // The exclusions come first so copying an executor never re-enters the concept.
  template <class Ex>
    requires(!std::is_same_v<std::decay_t<Ex>, any_executor> &&
             !std::is_same_v<std::decay_t<Ex>, any_io_executor> && executor<std::decay_t<Ex>>)
  any_executor(Ex ex) {
    using executor_type = std::decay_t<Ex>;
    static_assert(std::is_nothrow_move_constructible_v<executor_type>);
    if constexpr (fits_inline<executor_type>) {
      ::new (storage_ptr()) executor_type(std::move(ex));
      ptr_ = storage_ptr();
      is_inline_ = true;
    } else {
      storage_ = std::make_shared<executor_type>(std::move(ex));
      ptr_ = storage_.get();
      is_inline_ = false;
    }
    vtable_ = &vtable_for<executor_type>;
  }

  /// Unwraps to the underlying executor, so equality with it is preserved.
  any_executor(any_io_executor const& ex);

  any_executor(any_executor const& other) { copy_from(other); }

  auto operator=(any_executor const& other) -> any_executor& {
    if (this != &other) {
      reset();
      copy_from(other);
    }
    return *this;
  }

  any_executor(any_executor&& other) noexcept { move_from(other); }

  auto operator=(any_executor&& other) noexcept -> any_executor& {
    if (this != &other) {
      reset();
      move_from(other);
    }
    return *this;
  }

  friend auto operator==(any_executor const& a, any_executor const& b) noexcept -> bool {
    if (a.ptr_ == nullptr || b.ptr_ == nullptr) {
      return a.ptr_ == b.ptr_;
    }
    if (a.vtable_ != b.vtable_) {
      return false;
    }
    return a.vtable_->equals(a.ptr_, b.ptr_);
  }

  void post(detail::unique_function<void()> fn) const noexcept {
    ensure_impl();
    vtable_->post(ptr_, std::move(fn));
  }

  void dispatch(detail::unique_function<void()> fn) const noexcept {
    ensure_impl();
    vtable_->dispatch(ptr_, std::move(fn));
  }

  auto capabilities() const noexcept -> executor_capability {
    if (ptr_ == nullptr) {
      return executor_capability::none;
    }
    return vtable_->capabilities(ptr_);
  }

  auto supports_io() const noexcept -> bool {
    return has_capability(capabilities(), executor_capability::io);
  }

  /// Reactor driving IO readiness for this executor (null if not IO-capable).
  auto get_reactor() const noexcept -> detail::reactor* {
    if (ptr_ == nullptr) {
      return nullptr;
    }
    return vtable_->get_reactor(ptr_);
  }

  explicit operator bool() const noexcept { return ptr_ != nullptr; }

 private:
  friend struct detail::any_executor_access;

  struct vtable {
    void (*post)(void* object, detail::unique_function<void()> fn) noexcept;
    void (*dispatch)(void* object, detail::unique_function<void()> fn) noexcept;
    auto (*equals)(void const* lhs, void const* rhs) noexcept -> bool;
    auto (*target)(void const* object, std::type_info const& ti) noexcept -> void const*;
    auto (*capabilities)(void const* object) noexcept -> executor_capability;
    auto (*get_reactor)(void const* object) noexcept -> detail::reactor*;
    void (*destroy_inline)(void* object) noexcept;
    void (*copy_inline)(void const* src, void* dst);
    void (*move_inline)(void* src, void* dst) noexcept;
  };

  template <class Ex>
  static void post_impl(void* object, detail::unique_function<void()> fn) noexcept {
    static_cast<Ex*>(object)->post(std::move(fn));
  }

  template <class Ex>
  static void dispatch_impl(void* object, detail::unique_function<void()> fn) noexcept {
    static_cast<Ex*>(object)->dispatch(std::move(fn));
  }

  template <class Ex>
  static auto equals_impl(void const* lhs, void const* rhs) noexcept -> bool {
    return *static_cast<Ex const*>(lhs) == *static_cast<Ex const*>(rhs);
  }

  template <class Ex>
  static auto target_impl(void const* object, std::type_info const& ti) noexcept -> void const* {
    if (ti == typeid(Ex)) {
      return object;
    }
    return nullptr;
  }

  template <class Ex>
  static auto capabilities_impl(void const* object) noexcept -> executor_capability {
    return detail::executor_traits<Ex>::capabilities(*static_cast<Ex const*>(object));
  }

  template <class Ex>
  static auto get_reactor_impl(void const* object) noexcept -> detail::reactor* {
    return detail::executor_traits<Ex>::get_reactor(*static_cast<Ex const*>(object));
  }

  template <class Ex>
  static void destroy_inline_impl(void* object) noexcept {
    std::destroy_at(static_cast<Ex*>(object));
  }

  template <class Ex>
  static void copy_inline_impl(void const* src, void* dst) {
    ::new (dst) Ex(*static_cast<Ex const*>(src));
  }

  template <class Ex>
  static void move_inline_impl(void* src, void* dst) noexcept {
    auto* p = static_cast<Ex*>(src);
    ::new (dst) Ex(std::move(*p));
    std::destroy_at(p);
  }

  // Larger or over-aligned executors fall back to shared heap storage.
  static constexpr std::size_t inline_size = 3 * sizeof(void*);
  static constexpr std::size_t inline_align = alignof(std::max_align_t);
  struct alignas(inline_align) inline_storage {
    std::byte data[inline_size];
  };

  template <class Ex>
  static constexpr bool fits_inline = sizeof(Ex) <= inline_size && alignof(Ex) <= inline_align &&
                                      std::is_nothrow_move_constructible_v<Ex> &&
                                      std::is_nothrow_copy_constructible_v<Ex>;

  template <class Ex>
  static inline constexpr vtable vtable_for{
    .post = &post_impl<Ex>,
    .dispatch = &dispatch_impl<Ex>,
    .equals = &equals_impl<Ex>,
    .target = &target_impl<Ex>,
    .capabilities = &capabilities_impl<Ex>,
    .get_reactor = &get_reactor_impl<Ex>,
    .destroy_inline = &destroy_inline_impl<Ex>,
    .copy_inline = &copy_inline_impl<Ex>,
    .move_inline = &move_inline_impl<Ex>,
  };

  void ensure_impl() const noexcept { STRATA_ENSURE(ptr_ != nullptr, "any_executor: empty"); }

  void reset() noexcept {
    if (ptr_ != nullptr) {
      if (is_inline_) {
        vtable_->destroy_inline(ptr_);
      } else {
        storage_.reset();
      }
      ptr_ = nullptr;
      vtable_ = nullptr;
      is_inline_ = false;
    }
  }

  void copy_from(any_executor const& other) {
    if (other.ptr_ == nullptr) {
      return;
    }
    if (other.is_inline_) {
      other.vtable_->copy_inline(other.ptr_, storage_ptr());
      ptr_ = storage_ptr();
      is_inline_ = true;
    } else {
      storage_ = other.storage_;
      ptr_ = storage_.get();
      is_inline_ = false;
    }
    vtable_ = other.vtable_;
  }

  void move_from(any_executor& other) noexcept {
    if (other.ptr_ == nullptr) {
      return;
    }
    auto const* vt = other.vtable_;
    if (other.is_inline_) {
      vt->move_inline(other.ptr_, storage_ptr());
      ptr_ = storage_ptr();
      is_inline_ = true;
    } else {
      storage_ = std::move(other.storage_);
      ptr_ = storage_.get();
      is_inline_ = false;
    }
    vtable_ = vt;
    other.ptr_ = nullptr;
    other.vtable_ = nullptr;
    other.is_inline_ = false;
  }

  auto storage_ptr() noexcept -> void* { return static_cast<void*>(inline_storage_.data); }

  template <class T>
  auto target() const noexcept -> T const* {
    if (ptr_ == nullptr) {
      return nullptr;
    }
    return static_cast<T const*>(vtable_->target(ptr_, typeid(T)));
  }

  inline_storage inline_storage_{};
  std::shared_ptr<void> storage_{};
  void* ptr_{};
  vtable const* vtable_{};
  bool is_inline_{false};
};

namespace detail {

struct any_executor_access {
  template <class T>
  static auto target(any_executor const& ex) noexcept -> T const* {
    return ex.target<T>();
  }
};

}  // namespace detail

}  // namespace strata
