#pragma once

#include <strata/detail/reactor_backend.hpp>
#include <strata/detail/timer_entry.hpp>
#include <strata/detail/unique_function.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <system_error>
#include <unordered_map>
#include <vector>

namespace strata::detail {

/// Pending readiness operation on a file descriptor.
///
/// Exactly one of `on_ready` / `on_abort` is invoked, at most once, on the reactor thread or on
/// the thread that cancels the registration.
struct reactor_op {
  unique_function<void()> on_ready{};
  unique_function<void(std::error_code)> on_abort{};
};

using reactor_op_ptr = std::unique_ptr<reactor_op>;

struct timer_entry_compare {
  auto operator()(std::shared_ptr<timer_entry> const& lhs,
                  std::shared_ptr<timer_entry> const& rhs) const noexcept -> bool {
    return lhs->expiry > rhs->expiry;
  }
};

/// Single-threaded event loop core: posted work, a timer heap and fd readiness.
///
/// At most one thread drives `run*()` / `poll()` at a time. Posting, timer scheduling and
/// cancellation, fd registration and `stop()` are safe from any thread.
class reactor {
 public:
  enum class fd_event_kind : std::uint8_t { read, write };

  struct fd_event_handle {
    reactor* owner = nullptr;
    int fd = -1;
    fd_event_kind kind = fd_event_kind::read;
    std::uint64_t token = 0;

    auto valid() const noexcept -> bool {
      return owner != nullptr && fd >= 0 && token != reactor::invalid_fd_token;
    }
    explicit operator bool() const noexcept { return valid(); }

    /// Cancel the registration iff it is still the one this handle refers to.
    void cancel() const noexcept;
  };

  reactor();
  ~reactor();

  reactor(reactor const&) = delete;
  auto operator=(reactor const&) -> reactor& = delete;
  reactor(reactor&&) = delete;
  auto operator=(reactor&&) -> reactor& = delete;

  auto run() -> std::size_t;
  auto run_one() -> std::size_t;
  auto run_for(std::chrono::milliseconds timeout) -> std::size_t;
  auto poll() -> std::size_t;

  void stop();
  void restart();
  auto stopped() const noexcept -> bool { return stopped_.load(std::memory_order_acquire); }

  void post(unique_function<void()> f);
  void dispatch(unique_function<void()> f);

  auto schedule_timer(std::chrono::steady_clock::time_point expiry,
                      unique_function<void(std::error_code)> on_complete)
    -> std::shared_ptr<timer_entry>;

  /// Cancel `entry` if still pending; its completion runs inline with `operation_aborted`.
  void cancel_timer(std::shared_ptr<timer_entry> const& entry) noexcept;

  auto register_fd_read(int fd, reactor_op_ptr op) -> fd_event_handle;
  auto register_fd_write(int fd, reactor_op_ptr op) -> fd_event_handle;

  /// Abort every pending operation on `fd` and drop its interest.
  void deregister_fd(int fd);

  void add_work_guard() noexcept;
  void remove_work_guard() noexcept;

  auto running_in_this_thread() const noexcept -> bool;

 private:
  static constexpr std::uint64_t invalid_fd_token = 0;

  static auto this_thread_token() noexcept -> std::uintptr_t;
  void set_thread_id() noexcept;

  auto process_events(std::optional<std::chrono::milliseconds> max_wait) -> std::size_t;
  auto process_timers() -> std::size_t;
  auto process_posted() -> std::size_t;

  auto get_timeout() -> std::optional<std::chrono::milliseconds>;
  void wakeup() noexcept;
  auto has_work() -> bool;

  auto register_fd(int fd, fd_event_kind kind, reactor_op_ptr op) -> fd_event_handle;
  void reconcile_fd_interest(int fd);
  void reconcile_fd_interest_async(int fd);
  void cancel_fd_event(int fd, fd_event_kind kind, std::uint64_t token) noexcept;

  std::unique_ptr<backend_interface> backend_;
  std::vector<backend_event> events_{};

  std::atomic<bool> stopped_{false};

  struct fd_ops {
    reactor_op_ptr read_op;
    reactor_op_ptr write_op;
    std::uint64_t read_token = 0;
    std::uint64_t write_token = 0;
  };

  std::unordered_map<int, fd_ops> fd_operations_;
  std::mutex fd_mutex_;
  std::uint64_t next_fd_token_ = 1;

  std::priority_queue<std::shared_ptr<timer_entry>, std::vector<std::shared_ptr<timer_entry>>,
                      timer_entry_compare>
    timers_;
  std::uint64_t next_timer_id_ = 1;
  std::atomic<std::size_t> pending_timers_{0};
  std::mutex timer_mutex_;

  std::queue<unique_function<void()>> posted_operations_;
  std::mutex posted_mutex_;

  std::atomic<std::size_t> work_guard_counter_{0};
  std::atomic<std::uintptr_t> thread_token_{0};
};

}  // namespace strata::detail
