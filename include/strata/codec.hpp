#pragma once

#include <strata/buffer.hpp>
#include <strata/error.hpp>
#include <strata/result.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <system_error>

namespace strata {

/// Splits buffered bytes into frames.
///
/// `decode(buf)` returns:
/// - an item, with the read cursor advanced exactly past the consumed bytes;
/// - `std::nullopt` when more bytes are needed (the buffer is left untouched);
/// - `error::malformed_frame` / `error::frame_too_large` on a parse error.
///
/// A decoder keeps no state between calls beyond what the buffer records.
template <class D>
concept decoder = requires(D& d, byte_buffer& buf) {
  typename D::item_type;
  { d.decode(buf) } -> std::same_as<result<std::optional<typename D::item_type>>>;
};

/// Serializes one item at the write cursor.
///
/// `encode(item, buf)` writes nothing on failure. `error::frame_too_large` means the frame
/// can never fit; `error::would_block` means it does not fit next to the bytes already pending
/// and may be retried after a flush.
template <class E, class Item>
concept encoder = requires(E& e, Item const& item, byte_buffer& buf) {
  { e.encode(item, buf) } -> std::same_as<std::error_code>;
};

template <class C>
concept codec = decoder<C> && encoder<C, typename C::item_type>;

namespace detail {

/// Common size check before writing `total` bytes into `buf`.
inline auto check_encode_room(byte_buffer const& buf, std::size_t total) noexcept
  -> std::error_code {
  if (total > buf.max_capacity()) {
    return error::frame_too_large;
  }
  if (total > buf.writable_size()) {
    return error::would_block;
  }
  return {};
}

}  // namespace detail

/// Frames carrying a big-endian length header of 1, 2 or 4 bytes.
class length_prefixed_codec {
 public:
  using item_type = buffer_view;

  static constexpr std::size_t default_max_payload = 16 * 1024;

  explicit length_prefixed_codec(std::size_t header_width = 4,
                                 std::size_t max_payload = default_max_payload);

  auto decode(byte_buffer& buf) -> result<std::optional<buffer_view>>;
  auto encode(buffer_view const& item, byte_buffer& buf) -> std::error_code;

  auto header_width() const noexcept -> std::size_t { return header_width_; }
  auto max_payload() const noexcept -> std::size_t { return max_payload_; }

 private:
  std::size_t header_width_;
  std::size_t max_payload_;
};

/// Every readable byte is one frame.
class bytes_codec {
 public:
  using item_type = buffer_view;

  auto decode(byte_buffer& buf) -> result<std::optional<buffer_view>>;
  auto encode(buffer_view const& item, byte_buffer& buf) -> std::error_code;
};

/// Newline-delimited frames. A trailing `\r` is stripped on decode; encode appends `\n`.
class line_codec {
 public:
  using item_type = buffer_view;

  static constexpr std::size_t default_max_line = 8 * 1024;

  explicit line_codec(std::size_t max_line = default_max_line) : max_line_(max_line) {}

  auto decode(byte_buffer& buf) -> result<std::optional<buffer_view>>;
  auto encode(buffer_view const& item, byte_buffer& buf) -> std::error_code;

  auto max_line() const noexcept -> std::size_t { return max_line_; }

 private:
  std::size_t max_line_;
};

/// An item tagged with a protocol-level correlation id.
template <class T>
struct correlated {
  std::uint32_t id{};
  T value{};

  friend auto operator==(correlated const&, correlated const&) -> bool = default;
};

/// Prefixes each inner frame's payload with a 4-byte big-endian id.
///
/// Used with `dispatch_order::completion`: responses carry the id of their request, so they can
/// be written as soon as they finish.
template <class Inner>
  requires codec<Inner> && std::same_as<typename Inner::item_type, buffer_view>
class correlated_codec {
 public:
  using item_type = correlated<buffer_view>;

  static constexpr std::size_t id_width = 4;

  correlated_codec() = default;
  explicit correlated_codec(Inner inner) : inner_(std::move(inner)) {}

  auto decode(byte_buffer& buf) -> result<std::optional<item_type>> {
    auto r = inner_.decode(buf);
    if (!r) {
      return unexpected(r.error());
    }
    if (!r->has_value()) {
      return std::optional<item_type>{};
    }
    auto const& frame = **r;
    if (frame.size() < id_width) {
      return unexpected(make_error_code(error::malformed_frame));
    }
    auto const* p = frame.data();
    std::uint32_t id = 0;
    for (std::size_t i = 0; i < id_width; ++i) {
      id = (id << 8) | static_cast<std::uint32_t>(p[i]);
    }
    return std::optional<item_type>{
      item_type{id, frame.subview(id_width, frame.size() - id_width)}};
  }

  auto encode(item_type const& item, byte_buffer& buf) -> std::error_code {
    byte_buffer scratch{id_width + item.value.size(), id_width + item.value.size()};
    std::byte header[id_width];
    for (std::size_t i = 0; i < id_width; ++i) {
      header[i] = static_cast<std::byte>((item.id >> (8 * (id_width - 1 - i))) & 0xFF);
    }
    if (auto ec = scratch.append(std::span<std::byte const>{header, id_width})) {
      return ec;
    }
    if (auto ec = scratch.append(item.value.bytes())) {
      return ec;
    }
    return inner_.encode(scratch.share(0, scratch.size()), buf);
  }

  auto inner() noexcept -> Inner& { return inner_; }

 private:
  Inner inner_{};
};

}  // namespace strata
