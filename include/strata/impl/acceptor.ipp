#include <strata/acceptor.hpp>
#include <strata/detail/scope_exit.hpp>
#include <strata/error.hpp>
#include <strata/log.hpp>
#include <strata/socket_transport.hpp>
#include <strata/this_coro.hpp>

#include <cerrno>

#include <sys/socket.h>
#include <unistd.h>

namespace strata {

inline auto acceptor::listen(endpoint const& ep, int backlog) -> std::error_code {
  if (is_open()) {
    return error::busy;
  }
  int const fd = ::socket(ep.family(), SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return detail::last_error();
  }
  auto guard = detail::make_scope_exit([fd] { (void)::close(fd); });

  int on = 1;
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) != 0) {
    return detail::last_error();
  }
  if (::bind(fd, ep.data(), ep.size()) != 0) {
    return detail::last_error();
  }
  if (backlog <= 0) {
    backlog = SOMAXCONN;
  }
  if (::listen(fd, backlog) != 0) {
    return detail::last_error();
  }

  guard.release();
  fd_.store(fd, std::memory_order_release);
  log::logger()->debug("acceptor: listening on {}", ep.to_string());
  return {};
}

inline auto acceptor::local_endpoint() const -> result<endpoint> {
  auto const fd = native_handle();
  if (fd < 0) {
    return unexpected(make_error_code(error::not_open));
  }
  sockaddr_storage ss{};
  socklen_t len = sizeof(ss);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&ss), &len) != 0) {
    return unexpected(detail::last_error());
  }
  return endpoint::from_native(reinterpret_cast<sockaddr const*>(&ss), len);
}

inline auto acceptor::async_accept() -> awaitable<result<int>> {
  if (accepting_.exchange(true, std::memory_order_acq_rel)) {
    co_return unexpected(make_error_code(error::busy));
  }
  auto turn = detail::make_scope_exit([this] { accepting_.store(false, std::memory_order_release); });

  for (;;) {
    auto const listen_fd = native_handle();
    if (listen_fd < 0) {
      co_return unexpected(make_error_code(error::not_listening));
    }

    int const fd = ::accept4(listen_fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd >= 0) {
      co_return fd;
    }
    if (errno == EINTR || errno == ECONNABORTED) {
      continue;
    }
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      co_return unexpected(detail::last_error());
    }

    auto stop = co_await this_coro::stop_token;
    if (stop.stop_requested()) {
      co_return unexpected(make_error_code(error::operation_aborted));
    }
    detail::fd_wait_awaiter readable{ex_.get_reactor(), listen_fd,
                                     detail::reactor::fd_event_kind::read, read_slot_,
                                     ex_.as_any_executor(), std::move(stop)};
    auto ec = co_await detail::ref_awaiter<detail::fd_wait_awaiter>{&readable};
    if (ec) {
      co_return unexpected(ec);
    }
  }
}

inline void acceptor::close() noexcept {
  auto const fd = fd_.exchange(-1, std::memory_order_acq_rel);
  if (fd < 0) {
    return;
  }
  cancel();
  if (ex_) {
    ex_.get_reactor()->deregister_fd(fd);
  }
  (void)::close(fd);
}

}  // namespace strata
