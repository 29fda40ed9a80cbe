#include <strata/error.hpp>
#include <strata/log.hpp>
#include <strata/socket_transport.hpp>
#include <strata/this_coro.hpp>

#include <cerrno>

#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

namespace strata {

namespace detail {

inline auto make_nonblocking(int fd) noexcept -> std::error_code {
  int const flags = ::fcntl(fd, F_GETFL, 0);
  if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    return last_error();
  }
  int const fdflags = ::fcntl(fd, F_GETFD, 0);
  if (fdflags >= 0) {
    (void)::fcntl(fd, F_SETFD, fdflags | FD_CLOEXEC);
  }
  return {};
}

// EPIPE and ECONNRESET are reported with the library's own codes.
inline auto map_stream_errno(int e) noexcept -> std::error_code {
  if (e == EPIPE) {
    return error::broken_pipe;
  }
  if (e == ECONNRESET) {
    return error::connection_reset;
  }
  return std::error_code(e, std::generic_category());
}

}  // namespace detail

inline socket_transport::socket_transport(any_io_executor ex, int fd) noexcept
    : ex_(std::move(ex)), fd_(fd) {
  if (fd >= 0) {
    if (auto ec = detail::make_nonblocking(fd)) {
      log::logger()->warn("socket_transport: fd={} non-blocking setup failed: {}", fd,
                          ec.message());
    }
  }
}

inline socket_transport::~socket_transport() { close(); }

inline auto socket_transport::connect(any_io_executor ex, endpoint const& ep)
  -> awaitable<result<std::unique_ptr<socket_transport>>> {
  int const fd = ::socket(ep.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    co_return unexpected(detail::last_error());
  }
  auto t = std::make_unique<socket_transport>(ex, fd);

  for (;;) {
    if (::connect(fd, ep.data(), ep.size()) == 0) {
      co_return std::move(t);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EINPROGRESS) {
      break;
    }
    co_return unexpected(detail::last_error());
  }

  if (auto ec = co_await t->async_wait(wait_type::write)) {
    co_return unexpected(ec);
  }

  int so_error = 0;
  socklen_t optlen = sizeof(so_error);
  if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &optlen) != 0) {
    co_return unexpected(detail::last_error());
  }
  if (so_error != 0) {
    co_return unexpected(std::error_code(so_error, std::generic_category()));
  }
  co_return std::move(t);
}

inline auto socket_transport::read_some(std::span<std::byte> buf) -> result<std::size_t> {
  auto const fd = native_handle();
  if (fd < 0) {
    return unexpected(make_error_code(error::not_open));
  }
  if (buf.empty()) {
    return std::size_t{0};
  }
  for (;;) {
    auto const n = ::recv(fd, buf.data(), buf.size(), 0);
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return unexpected(make_error_code(error::would_block));
    }
    return unexpected(detail::map_stream_errno(errno));
  }
}

inline auto socket_transport::write_some(std::span<std::byte const> buf) -> result<std::size_t> {
  auto const fd = native_handle();
  if (fd < 0) {
    return unexpected(make_error_code(error::not_open));
  }
  if (buf.empty()) {
    return std::size_t{0};
  }
  for (;;) {
    // MSG_NOSIGNAL: a peer that went away must not raise SIGPIPE.
    auto const n = ::send(fd, buf.data(), buf.size(), MSG_NOSIGNAL);
    if (n >= 0) {
      return static_cast<std::size_t>(n);
    }
    if (errno == EINTR) {
      continue;
    }
    if (errno == EAGAIN || errno == EWOULDBLOCK) {
      return unexpected(make_error_code(error::would_block));
    }
    return unexpected(detail::map_stream_errno(errno));
  }
}

inline auto socket_transport::async_wait(wait_type w) -> awaitable<std::error_code> {
  auto const fd = native_handle();
  if (fd < 0 || !ex_) {
    co_return error::not_open;
  }
  auto stop = co_await this_coro::stop_token;
  if (stop.stop_requested()) {
    co_return error::operation_aborted;
  }
  auto* r = ex_.get_reactor();
  auto const read = w == wait_type::read;
  detail::fd_wait_awaiter ready{r,
                                fd,
                                read ? detail::reactor::fd_event_kind::read
                                     : detail::reactor::fd_event_kind::write,
                                read ? read_slot_ : write_slot_,
                                ex_.as_any_executor(),
                                std::move(stop)};
  co_return co_await detail::ref_awaiter<detail::fd_wait_awaiter>{&ready};
}

inline auto socket_transport::shutdown_send() -> std::error_code {
  auto const fd = native_handle();
  if (fd < 0) {
    return error::not_open;
  }
  if (::shutdown(fd, SHUT_WR) != 0) {
    return detail::map_stream_errno(errno);
  }
  return {};
}

inline void socket_transport::cancel() noexcept {
  read_slot_.cancel();
  write_slot_.cancel();
}

inline void socket_transport::close() noexcept {
  auto const fd = fd_.exchange(-1, std::memory_order_acq_rel);
  if (fd < 0) {
    return;
  }
  cancel();
  // Pending registrations are aborted before the fd number can be reused.
  if (ex_) {
    ex_.get_reactor()->deregister_fd(fd);
  }
  (void)::close(fd);
}

inline auto socket_transport::peer() const -> std::string {
  auto const fd = native_handle();
  if (fd < 0) {
    return {};
  }
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getpeername(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
    return {};
  }
  auto ep = endpoint::from_native(reinterpret_cast<sockaddr const*>(&ss), len);
  return ep ? ep->to_string() : std::string{};
}

inline auto socket_transport::set_nodelay(bool on) noexcept -> std::error_code {
  auto const fd = native_handle();
  if (fd < 0) {
    return error::not_open;
  }
  int v = on ? 1 : 0;
  if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &v, sizeof(v)) != 0) {
    return detail::last_error();
  }
  return {};
}

}  // namespace strata
