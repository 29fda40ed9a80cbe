#include <strata/assert.hpp>
#include <strata/buffer.hpp>
#include <strata/error.hpp>

#include <algorithm>
#include <cstring>

namespace strata {

inline auto buffer_view::copy_of(std::span<std::byte const> bytes) -> buffer_view {
  auto block = std::make_shared<detail::buffer_block>(bytes.size());
  if (!bytes.empty()) {
    std::memcpy(block->bytes.data(), bytes.data(), bytes.size());
  }
  return buffer_view{std::move(block), 0, bytes.size()};
}

inline auto buffer_view::subview(std::size_t offset, std::size_t len) const -> buffer_view {
  STRATA_ENSURE(offset <= len_ && len <= len_ - offset, "buffer_view::subview: out of range");
  return buffer_view{block_, offset_ + offset, len};
}

inline auto operator==(buffer_view const& a, buffer_view const& b) noexcept -> bool {
  if (a.len_ != b.len_) {
    return false;
  }
  return a.len_ == 0 || std::memcmp(a.data(), b.data(), a.len_) == 0;
}

inline byte_buffer::byte_buffer(std::size_t max_capacity, std::size_t initial_capacity)
    : max_capacity_(max_capacity) {
  STRATA_ENSURE(max_capacity > 0, "byte_buffer: max_capacity must be > 0");
  if (initial_capacity > 0) {
    block_ = std::make_shared<detail::buffer_block>(std::min(initial_capacity, max_capacity));
  }
}

inline auto byte_buffer::readable() const noexcept -> std::span<std::byte const> {
  if (!block_) {
    return {};
  }
  return {block_->bytes.data() + rpos_, size()};
}

inline auto byte_buffer::live_views() const noexcept -> std::size_t {
  if (!block_) {
    return 0;
  }
  auto const n = block_.use_count();
  return n > 1 ? static_cast<std::size_t>(n - 1) : 0;
}

inline void byte_buffer::make_room(std::size_t n) {
  auto const used = size();
  if (block_ && block_->bytes.size() - wpos_ >= n) {
    return;
  }

  // Reuse the block in place when nobody else can observe it.
  if (block_ && live_views() == 0 && block_->bytes.size() >= used + n) {
    if (rpos_ != 0 && used != 0) {
      std::memmove(block_->bytes.data(), block_->bytes.data() + rpos_, used);
    }
    rpos_ = 0;
    wpos_ = used;
    return;
  }

  auto grown = std::max<std::size_t>(capacity() * 2, used + n);
  grown = std::max<std::size_t>(grown, 256);
  grown = std::min(grown, max_capacity_);

  auto fresh = std::make_shared<detail::buffer_block>(grown);
  if (used != 0) {
    std::memcpy(fresh->bytes.data(), block_->bytes.data() + rpos_, used);
  }
  block_ = std::move(fresh);
  rpos_ = 0;
  wpos_ = used;
}

inline auto byte_buffer::prepare(std::size_t n) -> result<std::span<std::byte>> {
  if (n > writable_size()) {
    return unexpected(make_error_code(error::frame_too_large));
  }
  make_room(n);
  prepared_ = n;
  return std::span<std::byte>{block_->bytes.data() + wpos_, n};
}

inline void byte_buffer::commit(std::size_t n) {
  STRATA_ENSURE(n <= prepared_, "byte_buffer::commit: more than prepared");
  wpos_ += n;
  prepared_ = 0;
}

inline void byte_buffer::consume(std::size_t n) {
  STRATA_ENSURE(n <= size(), "byte_buffer::consume: more than readable");
  rpos_ += n;
  prepared_ = 0;
  if (rpos_ == wpos_ && live_views() == 0) {
    rpos_ = 0;
    wpos_ = 0;
  }
}

inline auto byte_buffer::append(std::span<std::byte const> bytes) -> std::error_code {
  if (bytes.empty()) {
    return {};
  }
  auto r = prepare(bytes.size());
  if (!r) {
    return r.error();
  }
  std::memcpy(r->data(), bytes.data(), bytes.size());
  commit(bytes.size());
  return {};
}

inline auto byte_buffer::share(std::size_t offset, std::size_t len) const -> buffer_view {
  STRATA_ENSURE(offset <= size() && len <= size() - offset, "byte_buffer::share: out of range");
  if (len == 0) {
    return buffer_view{};
  }
  return buffer_view{block_, rpos_ + offset, len};
}

inline void byte_buffer::clear() noexcept {
  prepared_ = 0;
  if (live_views() != 0) {
    block_.reset();
  }
  rpos_ = 0;
  wpos_ = 0;
}

}  // namespace strata
