#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

namespace strata::detail {

struct backend_event {
  int fd = -1;
  bool can_read = false;
  bool can_write = false;
  bool is_error = false;
};

/// OS readiness backend driven by the reactor thread.
///
/// Interest updates may come from any thread; `wait` is only called by the thread running the
/// reactor. Failures of the OS primitives are reported as `std::system_error`.
class backend_interface {
 public:
  virtual ~backend_interface() = default;

  backend_interface() = default;
  backend_interface(backend_interface const&) = delete;
  auto operator=(backend_interface const&) -> backend_interface& = delete;
  backend_interface(backend_interface&&) = delete;
  auto operator=(backend_interface&&) -> backend_interface& = delete;

  virtual void update_fd_interest(int fd, bool want_read, bool want_write) = 0;
  virtual void remove_fd_interest(int fd) noexcept = 0;

  virtual void wait(std::optional<std::chrono::milliseconds> timeout,
                    std::vector<backend_event>& out) = 0;
  virtual void wakeup() noexcept = 0;
};

// epoll by default; io_uring poll when built with STRATA_USE_URING.
auto make_backend() -> std::unique_ptr<backend_interface>;

}  // namespace strata::detail
