#include <strata/error.hpp>
#include <strata/io_object.hpp>
#include <strata/log.hpp>

#include <algorithm>

namespace strata {

inline auto to_string(io_state s) noexcept -> char const* {
  switch (s) {
    case io_state::open:
      return "open";
    case io_state::read_paused:
      return "read_paused";
    case io_state::write_paused:
      return "write_paused";
    case io_state::shutting_down:
      return "shutting_down";
    case io_state::closed:
      return "closed";
  }
  return "unknown";
}

inline auto io_config::validate() const -> std::error_code {
  if (read_chunk == 0 || read_capacity == 0 || write_capacity == 0) {
    return error::invalid_argument;
  }
  if (read_low_watermark > read_high_watermark || read_high_watermark > read_capacity) {
    return error::invalid_argument;
  }
  if (write_low_watermark > write_high_watermark || write_high_watermark > write_capacity) {
    return error::invalid_argument;
  }
  return {};
}

inline io_object::io_object(std::unique_ptr<transport> t, io_config cfg)
    : transport_(std::move(t)),
      cfg_(cfg),
      read_buf_(cfg.read_capacity),
      write_buf_(cfg.write_capacity) {
  STRATA_ENSURE(transport_ != nullptr, "io_object: null transport");
  STRATA_ENSURE(!cfg_.validate(), "io_object: invalid io_config");
}

inline io_object::~io_object() { close(); }

inline auto io_object::state() const noexcept -> io_state {
  if (closed_) {
    return io_state::closed;
  }
  if (shutting_down_) {
    return io_state::shutting_down;
  }
  if (write_paused_) {
    return io_state::write_paused;
  }
  if (read_paused_) {
    return io_state::read_paused;
  }
  return io_state::open;
}

inline void io_object::log_transition(io_state before) const {
  auto const after = state();
  if (before != after) {
    log::logger()->debug("io_object[{}]: {} -> {}", peer(), to_string(before), to_string(after));
  }
}

inline void io_object::update_read_pause() {
  auto const before = state();
  auto const pending = read_buf_.size();
  if (partial_frame_) {
    read_paused_ = false;
  } else if (!read_paused_ && pending >= cfg_.read_high_watermark) {
    read_paused_ = true;
  } else if (read_paused_ && pending < cfg_.read_low_watermark) {
    read_paused_ = false;
  }
  log_transition(before);
}

inline void io_object::update_write_pause(bool would_block) {
  auto const before = state();
  auto const pending = write_buf_.size();
  if (would_block || pending >= cfg_.write_high_watermark) {
    write_paused_ = true;
  } else if (write_paused_ && pending < cfg_.write_low_watermark) {
    write_paused_ = false;
  }
  log_transition(before);
}

inline auto io_object::fill(std::size_t budget) -> result<std::size_t> {
  if (closed_ || !transport_) {
    return unexpected(make_error_code(error::not_open));
  }
  if (read_paused_ || shutting_down_) {
    return unexpected(make_error_code(error::would_block));
  }

  auto const n = std::min({cfg_.read_chunk, budget, read_buf_.writable_size()});
  if (n == 0 && partial_frame_ && read_buf_.writable_size() == 0) {
    return unexpected(make_error_code(error::frame_too_large));
  }
  if (n == 0) {
    return unexpected(make_error_code(error::would_block));
  }

  auto span = read_buf_.prepare(n);
  if (!span) {
    return unexpected(span.error());
  }

  ++stats_.read_calls;
  auto r = transport_->read_some(*span);
  if (!r) {
    read_buf_.commit(0);
    return unexpected(r.error());
  }
  if (*r == 0) {
    read_buf_.commit(0);
    return unexpected(make_error_code(error::eof));
  }

  read_buf_.commit(*r);
  stats_.bytes_read += *r;
  last_activity_ = clock::now();
  update_read_pause();
  return *r;
}

inline auto io_object::flush() -> result<std::size_t> {
  if (closed_ || !transport_) {
    return unexpected(make_error_code(error::not_open));
  }

  std::size_t total = 0;
  bool blocked = false;
  while (!write_buf_.empty()) {
    ++stats_.write_calls;
    auto r = transport_->write_some(write_buf_.readable());
    if (!r) {
      if (r.error() == error::would_block) {
        blocked = true;
        break;
      }
      return unexpected(r.error());
    }
    if (*r == 0) {
      blocked = true;
      break;
    }
    write_buf_.consume(*r);
    total += *r;
  }

  if (total != 0) {
    stats_.bytes_written += total;
    last_activity_ = clock::now();
  }
  update_write_pause(blocked);
  return total;
}

inline void io_object::consume_read(std::size_t n) {
  read_buf_.consume(n);
  partial_frame_ = false;
  update_read_pause();
}

inline auto io_object::wait_readable() -> awaitable<std::error_code> {
  if (closed_ || !transport_) {
    co_return error::not_open;
  }
  co_return co_await transport_->async_wait(wait_type::read);
}

inline auto io_object::wait_writable() -> awaitable<std::error_code> {
  if (closed_ || !transport_) {
    co_return error::not_open;
  }
  co_return co_await transport_->async_wait(wait_type::write);
}

inline void io_object::begin_shutdown() {
  if (shutting_down_ || closed_) {
    return;
  }
  auto const before = state();
  shutting_down_ = true;
  log_transition(before);
}

inline void io_object::cancel() noexcept {
  if (transport_) {
    transport_->cancel();
  }
}

inline void io_object::close() noexcept {
  if (closed_ || !transport_) {
    closed_ = true;
    return;
  }
  auto const before = state();
  closed_ = true;
  transport_->close();
  try {
    log_transition(before);
  } catch (...) {
    log::report_exception(std::current_exception(), "io_object::close");
  }
}

inline void io_object::replace_transport(std::unique_ptr<transport> t) {
  STRATA_ENSURE(t != nullptr, "io_object::replace_transport: null transport");
  transport_ = std::move(t);
}

inline auto io_object::release_transport() noexcept -> std::unique_ptr<transport> {
  return std::move(transport_);
}

inline auto io_object::peer() const -> std::string {
  return transport_ ? transport_->peer() : std::string{};
}

}  // namespace strata
