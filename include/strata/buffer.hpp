#pragma once

#include <strata/result.hpp>

#include <cstddef>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace strata {

namespace detail {

/// Storage shared by a `byte_buffer` and the views it hands out.
struct buffer_block {
  explicit buffer_block(std::size_t n) : bytes(n) {}

  std::vector<std::byte> bytes;
};

}  // namespace detail

/// View a string's characters as bytes.
inline auto as_bytes(std::string_view s) noexcept -> std::span<std::byte const> {
  return {reinterpret_cast<std::byte const*>(s.data()), s.size()};
}

/// A read-only, reference-counted slice of buffer storage.
///
/// A view keeps its storage block alive. The owning buffer never overwrites bytes of a block
/// that still has live views, so the contents of a view never change.
class buffer_view {
 public:
  buffer_view() noexcept = default;

  buffer_view(std::shared_ptr<detail::buffer_block const> block, std::size_t offset,
              std::size_t len) noexcept
      : block_(std::move(block)), offset_(offset), len_(len) {}

  /// A view over a private copy of `bytes`.
  static auto copy_of(std::span<std::byte const> bytes) -> buffer_view;
  static auto copy_of(std::string_view s) -> buffer_view { return copy_of(as_bytes(s)); }

  auto data() const noexcept -> std::byte const* {
    return block_ ? block_->bytes.data() + offset_ : nullptr;
  }
  auto size() const noexcept -> std::size_t { return len_; }
  auto empty() const noexcept -> bool { return len_ == 0; }

  auto bytes() const noexcept -> std::span<std::byte const> { return {data(), len_}; }

  auto to_string() const -> std::string {
    return std::string{reinterpret_cast<char const*>(data()), len_};
  }

  /// Sub-slice sharing the same block; `offset + len` must lie within this view.
  auto subview(std::size_t offset, std::size_t len) const -> buffer_view;

  /// True when this view references `block`.
  auto shares(detail::buffer_block const* block) const noexcept -> bool {
    return block_.get() == block;
  }

  friend auto operator==(buffer_view const& a, buffer_view const& b) noexcept -> bool;

  friend auto operator==(buffer_view const& a, std::string_view b) noexcept -> bool {
    return a.len_ == b.size() && a.to_string_view() == b;
  }

 private:
  auto to_string_view() const noexcept -> std::string_view {
    return {reinterpret_cast<char const*>(data()), len_};
  }

  std::shared_ptr<detail::buffer_block const> block_{};
  std::size_t offset_{0};
  std::size_t len_{0};
};

/// Growable byte storage with a read cursor, a write cursor and a capacity ceiling.
///
/// Layout inside the current block: `[consumed | readable | writable]`.
///
/// - `prepare(n)` / `commit(n)` append at the write cursor.
/// - `consume(n)` advances the read cursor.
/// - `share(offset, len)` returns a zero-copy view of readable bytes.
///
/// Bytes behind the read cursor are reclaimed (compacted) only while no view references the
/// current block. Otherwise growth moves the unconsumed bytes into a fresh block and the old
/// block stays alive for its views.
class byte_buffer {
 public:
  static constexpr std::size_t default_max_capacity = 64 * 1024;

  explicit byte_buffer(std::size_t max_capacity = default_max_capacity,
                       std::size_t initial_capacity = 0);

  byte_buffer(byte_buffer const&) = delete;
  auto operator=(byte_buffer const&) -> byte_buffer& = delete;
  byte_buffer(byte_buffer&&) noexcept = default;
  auto operator=(byte_buffer&&) noexcept -> byte_buffer& = default;

  ~byte_buffer() = default;

  /// Number of readable bytes.
  auto size() const noexcept -> std::size_t { return wpos_ - rpos_; }
  auto empty() const noexcept -> bool { return wpos_ == rpos_; }

  /// Bytes allocated in the current block.
  auto capacity() const noexcept -> std::size_t { return block_ ? block_->bytes.size() : 0; }
  auto max_capacity() const noexcept -> std::size_t { return max_capacity_; }

  /// Bytes that can still be appended before reaching the ceiling.
  auto writable_size() const noexcept -> std::size_t { return max_capacity_ - size(); }

  auto readable() const noexcept -> std::span<std::byte const>;

  /// Reserve `n` writable bytes at the write cursor.
  ///
  /// Fails with `error::frame_too_large` when `size() + n` exceeds `max_capacity()`.
  /// The returned span is valid until the next mutating call.
  auto prepare(std::size_t n) -> result<std::span<std::byte>>;

  /// Make `n` bytes of the last `prepare()` readable.
  void commit(std::size_t n);

  /// Discard `n` readable bytes.
  void consume(std::size_t n);

  /// Copy `bytes` to the write cursor; nothing is written on failure.
  auto append(std::span<std::byte const> bytes) -> std::error_code;
  auto append(std::string_view s) -> std::error_code { return append(as_bytes(s)); }

  /// Zero-copy view of `len` readable bytes starting `offset` bytes past the read cursor.
  auto share(std::size_t offset, std::size_t len) const -> buffer_view;

  /// Number of views referencing the current block.
  auto live_views() const noexcept -> std::size_t;

  auto owns(buffer_view const& v) const noexcept -> bool { return v.shares(block_.get()); }

  /// Drop all readable bytes.
  void clear() noexcept;

 private:
  void make_room(std::size_t n);

  std::shared_ptr<detail::buffer_block> block_{};
  std::size_t rpos_{0};
  std::size_t wpos_{0};
  std::size_t prepared_{0};
  std::size_t max_capacity_;
};

}  // namespace strata
