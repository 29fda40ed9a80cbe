#pragma once

#include <strata/awaitable.hpp>
#include <strata/buffer.hpp>
#include <strata/codec.hpp>
#include <strata/result.hpp>
#include <strata/transport.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace strata {

enum class io_state : std::uint8_t {
  open,
  read_paused,
  write_paused,
  shutting_down,
  closed,
};

auto to_string(io_state s) noexcept -> char const*;

/// Buffer sizes and backpressure watermarks of one connection.
struct io_config {
  /// Upper bound of one transport read.
  std::size_t read_chunk = 4096;
  std::size_t read_capacity = 64 * 1024;
  std::size_t write_capacity = 64 * 1024;

  /// Reads pause once this many undecoded bytes are buffered, unless they are only the start
  /// of a frame the codec is still waiting on...
  std::size_t read_high_watermark = 32 * 1024;
  /// ...and resume when consumption drops below this.
  std::size_t read_low_watermark = 8 * 1024;

  std::size_t write_high_watermark = 32 * 1024;
  std::size_t write_low_watermark = 8 * 1024;

  auto validate() const -> std::error_code;
};

struct io_stats {
  std::size_t read_calls = 0;
  std::size_t write_calls = 0;
  std::size_t bytes_read = 0;
  std::size_t bytes_written = 0;
};

/// One connection's byte stream with its read/write buffers and backpressure state.
///
/// Owns its transport exclusively. None of the operations block: `fill()` and `flush()`
/// transfer what the transport accepts right now, `wait_readable()` / `wait_writable()` are
/// the suspension points.
///
/// Not thread-safe: it is used from the connection's executor only.
class io_object {
 public:
  using clock = std::chrono::steady_clock;

  explicit io_object(std::unique_ptr<transport> t, io_config cfg = {});

  io_object(io_object&&) noexcept = default;
  auto operator=(io_object&&) noexcept -> io_object& = default;

  ~io_object();

  /// One transport read of at most `min(read_chunk, budget)` bytes.
  ///
  /// Returns the number of bytes read, or:
  /// - `error::would_block` when nothing is available or reads are paused or shutting down;
  /// - `error::eof` when the peer closed the stream;
  /// - `error::frame_too_large` when an incomplete frame already fills the read buffer;
  /// - `error::not_open` once closed;
  /// - the transport's error otherwise.
  auto fill(std::size_t budget = std::numeric_limits<std::size_t>::max())
    -> result<std::size_t>;

  /// Write as much of the write buffer as the transport accepts.
  ///
  /// Returns the number of bytes written. A transport that would block pauses writing rather
  /// than failing.
  auto flush() -> result<std::size_t>;

  /// Decode one frame from the read buffer.
  ///
  /// An incomplete result lifts the read pause until the next decode: the buffered bytes
  /// cannot be consumed before more of them arrive.
  template <class Codec>
    requires decoder<Codec>
  auto decode(Codec& c) -> result<std::optional<typename Codec::item_type>> {
    auto r = c.decode(read_buf_);
    partial_frame_ = r && !r->has_value() && !read_buf_.empty();
    update_read_pause();
    return r;
  }

  /// Encode one item into the write buffer.
  template <class Codec, class Item>
    requires encoder<Codec, Item>
  auto encode(Codec& c, Item const& item) -> std::error_code {
    auto ec = c.encode(item, write_buf_);
    update_write_pause(false);
    return ec;
  }

  /// Discard `n` bytes of the read buffer.
  void consume_read(std::size_t n);

  auto wait_readable() -> awaitable<std::error_code>;
  auto wait_writable() -> awaitable<std::error_code>;

  /// Stop reading; pending output can still be flushed.
  void begin_shutdown();

  /// Abort pending waits.
  void cancel() noexcept;

  /// Close the transport (idempotent). Buffered output is dropped.
  void close() noexcept;

  /// Swap the transport, e.g. for a TLS wrapper around the current one.
  void replace_transport(std::unique_ptr<transport> t);
  auto release_transport() noexcept -> std::unique_ptr<transport>;
  auto get_transport() noexcept -> transport* { return transport_.get(); }

  auto state() const noexcept -> io_state;
  auto stats() const noexcept -> io_stats const& { return stats_; }
  auto config() const noexcept -> io_config const& { return cfg_; }

  auto read_buffer() noexcept -> byte_buffer& { return read_buf_; }
  auto write_buffer() noexcept -> byte_buffer& { return write_buf_; }
  auto read_buffer() const noexcept -> byte_buffer const& { return read_buf_; }
  auto write_buffer() const noexcept -> byte_buffer const& { return write_buf_; }

  auto read_paused() const noexcept -> bool { return read_paused_; }
  /// The last decode found only the start of a frame.
  auto partial_frame() const noexcept -> bool { return partial_frame_; }
  auto write_paused() const noexcept -> bool { return write_paused_; }
  auto is_open() const noexcept -> bool { return !closed_ && transport_ && transport_->is_open(); }

  auto last_activity() const noexcept -> clock::time_point { return last_activity_; }
  auto peer() const -> std::string;

 private:
  void update_read_pause();
  void update_write_pause(bool would_block);
  void log_transition(io_state before) const;

  std::unique_ptr<transport> transport_;
  io_config cfg_;
  byte_buffer read_buf_;
  byte_buffer write_buf_;
  io_stats stats_{};
  bool read_paused_{false};
  bool partial_frame_{false};
  bool write_paused_{false};
  bool shutting_down_{false};
  bool closed_{false};
  clock::time_point last_activity_{clock::now()};
};

}  // namespace strata
