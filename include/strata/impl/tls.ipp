#include <strata/assert.hpp>
#include <strata/detail/deadline.hpp>
#include <strata/error.hpp>
#include <strata/log.hpp>
#include <strata/this_coro.hpp>
#include <strata/tls.hpp>

namespace strata {

inline auto to_string(handshake_status s) noexcept -> char const* {
  switch (s) {
    case handshake_status::complete:
      return "complete";
    case handshake_status::want_read:
      return "want_read";
    case handshake_status::want_write:
      return "want_write";
    case handshake_status::failed:
      return "failed";
  }
  return "unknown";
}

inline auto async_handshake(io_object& io, tls_engine& engine, tls_role role,
                            std::chrono::steady_clock::duration timeout)
  -> awaitable<std::error_code> {
  auto* plain = io.get_transport();
  if (plain == nullptr || !io.is_open()) {
    co_return error::not_open;
  }
  STRATA_ENSURE(io.read_buffer().empty(), "async_handshake: bytes already buffered");

  auto ex = co_await this_coro::io_executor;
  detail::deadline_guard deadline{ex, timeout, [plain] { plain->cancel(); }};

  engine.begin(role);
  for (;;) {
    auto const st = engine.step(*plain);
    log::logger()->trace("tls: handshake step: {}", to_string(st));

    if (st == handshake_status::complete) {
      break;
    }
    if (st == handshake_status::failed) {
      log::logger()->debug("tls: handshake with {} failed", plain->peer());
      co_return error::handshake_failed;
    }

    auto ec = co_await plain->async_wait(st == handshake_status::want_read ? wait_type::read
                                                                           : wait_type::write);
    if (deadline.expired()) {
      log::logger()->info("tls: handshake with {} timed out", plain->peer());
      co_return error::timed_out;
    }
    if (ec) {
      co_return ec;
    }
  }

  STRATA_ENSURE(engine.is_complete(), "async_handshake: engine reported complete but is not");
  io.replace_transport(engine.wrap(io.release_transport()));
  co_return std::error_code{};
}

}  // namespace strata
