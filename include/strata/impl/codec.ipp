#include <strata/assert.hpp>
#include <strata/codec.hpp>

#include <algorithm>
#include <cstring>
#include <limits>

namespace strata {

inline length_prefixed_codec::length_prefixed_codec(std::size_t header_width,
                                                    std::size_t max_payload)
    : header_width_(header_width), max_payload_(max_payload) {
  STRATA_ENSURE(header_width == 1 || header_width == 2 || header_width == 4,
                "length_prefixed_codec: header width must be 1, 2 or 4");
  auto const representable =
    header_width == 4 ? std::size_t{std::numeric_limits<std::uint32_t>::max()}
                      : (std::size_t{1} << (8 * header_width)) - 1;
  max_payload_ = std::min(max_payload_, representable);
}

inline auto length_prefixed_codec::decode(byte_buffer& buf)
  -> result<std::optional<buffer_view>> {
  auto const in = buf.readable();
  if (in.size() < header_width_) {
    return std::optional<buffer_view>{};
  }

  std::size_t len = 0;
  for (std::size_t i = 0; i < header_width_; ++i) {
    len = (len << 8) | static_cast<std::size_t>(in[i]);
  }
  if (len > max_payload_ || header_width_ + len > buf.max_capacity()) {
    return unexpected(make_error_code(error::frame_too_large));
  }
  if (in.size() < header_width_ + len) {
    return std::optional<buffer_view>{};
  }

  auto frame = buf.share(header_width_, len);
  buf.consume(header_width_ + len);
  return std::optional<buffer_view>{std::move(frame)};
}

inline auto length_prefixed_codec::encode(buffer_view const& item, byte_buffer& buf)
  -> std::error_code {
  auto const len = item.size();
  if (len > max_payload_) {
    return error::frame_too_large;
  }
  auto const total = header_width_ + len;
  if (auto ec = detail::check_encode_room(buf, total)) {
    return ec;
  }

  auto out = buf.prepare(total);
  if (!out) {
    return out.error();
  }
  auto* p = out->data();
  for (std::size_t i = 0; i < header_width_; ++i) {
    p[i] = static_cast<std::byte>((len >> (8 * (header_width_ - 1 - i))) & 0xFF);
  }
  if (len != 0) {
    std::memcpy(p + header_width_, item.data(), len);
  }
  buf.commit(total);
  return {};
}

inline auto bytes_codec::decode(byte_buffer& buf) -> result<std::optional<buffer_view>> {
  if (buf.empty()) {
    return std::optional<buffer_view>{};
  }
  auto const n = buf.size();
  auto frame = buf.share(0, n);
  buf.consume(n);
  return std::optional<buffer_view>{std::move(frame)};
}

inline auto bytes_codec::encode(buffer_view const& item, byte_buffer& buf) -> std::error_code {
  if (auto ec = detail::check_encode_room(buf, item.size())) {
    return ec;
  }
  return buf.append(item.bytes());
}

inline auto line_codec::decode(byte_buffer& buf) -> result<std::optional<buffer_view>> {
  auto const in = buf.readable();
  auto const it = std::find(in.begin(), in.end(), std::byte{'\n'});
  if (it == in.end()) {
    // A pending "\r" may still be stripped. A full buffer can never complete a line.
    if (in.size() > max_line_ + 1 || in.size() >= buf.max_capacity()) {
      return unexpected(make_error_code(error::frame_too_large));
    }
    return std::optional<buffer_view>{};
  }

  auto const nl = static_cast<std::size_t>(it - in.begin());
  auto len = nl;
  if (len > 0 && in[len - 1] == std::byte{'\r'}) {
    --len;
  }
  if (len > max_line_) {
    return unexpected(make_error_code(error::frame_too_large));
  }

  auto frame = buf.share(0, len);
  buf.consume(nl + 1);
  return std::optional<buffer_view>{std::move(frame)};
}

inline auto line_codec::encode(buffer_view const& item, byte_buffer& buf) -> std::error_code {
  auto const bytes = item.bytes();
  if (std::find(bytes.begin(), bytes.end(), std::byte{'\n'}) != bytes.end()) {
    return error::unencodable_frame;
  }
  if (bytes.size() > max_line_) {
    return error::frame_too_large;
  }
  auto const total = bytes.size() + 1;
  if (auto ec = detail::check_encode_room(buf, total)) {
    return ec;
  }

  auto out = buf.prepare(total);
  if (!out) {
    return out.error();
  }
  if (!bytes.empty()) {
    std::memcpy(out->data(), bytes.data(), bytes.size());
  }
  (*out)[bytes.size()] = std::byte{'\n'};
  buf.commit(total);
  return {};
}

}  // namespace strata
