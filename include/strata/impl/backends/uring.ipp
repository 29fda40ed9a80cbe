#include <strata/detail/reactor_backend.hpp>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <mutex>
#include <system_error>
#include <unordered_map>

#include <liburing.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace strata::detail {

namespace {

// user_data layout: [generation:30][fd:32][tag:2]
constexpr std::uint64_t tag_poll = 0;
constexpr std::uint64_t tag_wakeup = 1;
constexpr std::uint64_t tag_remove = 2;

constexpr std::uint64_t fd_shift = 2;
constexpr std::uint64_t gen_shift = 34;

auto pack_user_data(int fd, std::uint64_t tag, std::uint32_t gen = 0) noexcept -> std::uint64_t {
  return (static_cast<std::uint64_t>(gen) << gen_shift) |
         (static_cast<std::uint64_t>(static_cast<std::uint32_t>(fd)) << fd_shift) | (tag & 0x3ULL);
}

auto unpack_tag(std::uint64_t data) noexcept -> std::uint64_t { return data & 0x3ULL; }

auto unpack_fd(std::uint64_t data) noexcept -> int {
  return static_cast<int>((data >> fd_shift) & 0xFFFFFFFFULL);
}

auto unpack_gen(std::uint64_t data) noexcept -> std::uint32_t {
  return static_cast<std::uint32_t>(data >> gen_shift);
}

void close_if_valid(int& fd) noexcept {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

void drain_eventfd(int eventfd) noexcept {
  std::uint64_t value = 0;
  for (;;) {
    auto const n = ::read(eventfd, &value, sizeof(value));
    if (n > 0 || (n < 0 && errno == EINTR)) {
      continue;
    }
    break;
  }
}

auto to_timespec(std::chrono::milliseconds ms) noexcept -> __kernel_timespec {
  auto const clamped =
    std::min<long long>(ms.count(), static_cast<long long>(std::numeric_limits<int>::max()));
  __kernel_timespec ts{};
  ts.tv_sec = static_cast<__kernel_time64_t>(clamped / 1000);
  ts.tv_nsec = static_cast<long long>(clamped % 1000) * 1000LL * 1000LL;
  return ts;
}

}  // namespace

/// io_uring backend built on one-shot POLL_ADD requests.
///
/// The ring is only submitted to by the reactor thread: interest changes from other threads are
/// queued and flushed at the next `wait`.
class backend_uring final : public backend_interface {
 public:
  backend_uring() {
    int const ret = ::io_uring_queue_init(256, &ring_, 0);
    if (ret < 0) {
      throw std::system_error(-ret, std::generic_category(), "io_uring_queue_init failed");
    }

    eventfd_ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (eventfd_ < 0) {
      ::io_uring_queue_exit(&ring_);
      throw std::system_error(errno, std::generic_category(), "eventfd failed");
    }

    submit_poll(eventfd_, POLLIN, pack_user_data(0, tag_wakeup));
  }

  ~backend_uring() override {
    close_if_valid(eventfd_);
    ::io_uring_queue_exit(&ring_);
  }

  void update_fd_interest(int fd, bool want_read, bool want_write) override {
    int mask = POLLERR | POLLHUP | POLLRDHUP;
    if (want_read) {
      mask |= POLLIN;
    }
    if (want_write) {
      mask |= POLLOUT;
    }

    {
      std::scoped_lock lk{state_mtx_};
      auto& st = polls_[fd];
      st.desired_mask = mask;
      if (st.armed) {
        // Re-armed with the new mask once the current request completes or is removed.
        if (st.active_mask != mask) {
          request_remove(fd, st);
        }
      } else {
        arm(fd, st, pending_adds_);
      }
    }
    wakeup();
  }

  void remove_fd_interest(int fd) noexcept override {
    {
      std::scoped_lock lk{state_mtx_};
      auto it = polls_.find(fd);
      if (it == polls_.end()) {
        return;
      }
      auto& st = it->second;
      st.desired_mask = 0;
      if (!st.armed) {
        polls_.erase(it);
        return;
      }
      request_remove(fd, st);
    }
    wakeup();
  }

  void wait(std::optional<std::chrono::milliseconds> timeout,
            std::vector<backend_event>& out) override {
    out.clear();
    flush_pending();

    io_uring_cqe* first = nullptr;
    int ret = 0;
    if (timeout.has_value()) {
      auto ts = to_timespec(*timeout);
      ret = ::io_uring_wait_cqe_timeout(&ring_, &first, &ts);
    } else {
      ret = ::io_uring_wait_cqe(&ring_, &first);
    }

    if (ret < 0) {
      if (ret == -EINTR || ret == -EAGAIN || ret == -ETIME) {
        return;
      }
      throw std::system_error(-ret, std::generic_category(), "io_uring_wait_cqe failed");
    }

    handle_cqe(first, out);
    ::io_uring_cqe_seen(&ring_, first);

    io_uring_cqe* batch[127]{};
    unsigned const n = ::io_uring_peek_batch_cqe(&ring_, batch, 127);
    for (unsigned i = 0; i < n; ++i) {
      handle_cqe(batch[i], out);
      ::io_uring_cqe_seen(&ring_, batch[i]);
    }

    flush_pending();
  }

  void wakeup() noexcept override {
    if (eventfd_ < 0 || wakeup_pending_.exchange(true, std::memory_order_acq_rel)) {
      return;
    }
    std::uint64_t value = 1;
    while (::write(eventfd_, &value, sizeof(value)) < 0 && errno == EINTR) {
    }
  }

 private:
  struct pending_add {
    int fd = -1;
    int mask = 0;
    std::uint64_t user_data = 0;
  };

  struct poll_state {
    bool armed = false;
    bool remove_requested = false;
    std::uint32_t active_gen = 0;
    std::uint32_t next_gen = 1;
    std::uint64_t active_user_data = 0;
    int active_mask = 0;
    int desired_mask = 0;
  };

  // Caller holds state_mtx_.
  void arm(int fd, poll_state& st, std::vector<pending_add>& sink) {
    st.armed = true;
    st.remove_requested = false;
    st.active_mask = st.desired_mask;
    st.active_gen = st.next_gen++;
    st.active_user_data = pack_user_data(fd, tag_poll, st.active_gen);
    sink.push_back(pending_add{fd, st.active_mask, st.active_user_data});
  }

  // Caller holds state_mtx_.
  void request_remove(int /*fd*/, poll_state& st) {
    if (!st.remove_requested) {
      st.remove_requested = true;
      pending_removes_.push_back(st.active_user_data);
    }
  }

  void handle_cqe(io_uring_cqe* cqe, std::vector<backend_event>& out) {
    std::uint64_t const data = ::io_uring_cqe_get_data64(cqe);
    std::uint64_t const tag = unpack_tag(data);

    if (tag == tag_wakeup) {
      wakeup_pending_.store(false, std::memory_order_release);
      drain_eventfd(eventfd_);
      submit_poll(eventfd_, POLLIN, pack_user_data(0, tag_wakeup));
      return;
    }
    if (tag == tag_remove) {
      return;
    }

    int const fd = unpack_fd(data);
    std::uint32_t const gen = unpack_gen(data);
    int const res = cqe->res;

    {
      std::scoped_lock lk{state_mtx_};
      auto it = polls_.find(fd);
      if (it == polls_.end()) {
        return;
      }
      auto& st = it->second;
      if (!st.armed || st.active_gen != gen) {
        return;
      }
      st.armed = false;
      st.remove_requested = false;
      if (st.desired_mask != 0) {
        arm(fd, st, pending_adds_);
      } else {
        polls_.erase(it);
      }
    }

    if (res == -ECANCELED) {
      return;
    }

    auto const ev = res >= 0 ? static_cast<std::uint32_t>(res) : 0U;
    bool const is_error = res < 0 || (ev & (POLLERR | POLLHUP | POLLRDHUP)) != 0;

    backend_event e{};
    e.fd = fd;
    e.is_error = is_error;
    e.can_read = is_error || (ev & POLLIN) != 0;
    e.can_write = is_error || (ev & POLLOUT) != 0;
    out.push_back(e);
  }

  void flush_pending() {
    std::vector<pending_add> adds;
    std::vector<std::uint64_t> removes;
    {
      std::scoped_lock lk{state_mtx_};
      adds.swap(pending_adds_);
      removes.swap(pending_removes_);
    }
    for (auto user_data : removes) {
      auto* sqe = get_sqe();
      ::io_uring_prep_poll_remove(sqe, user_data);
      ::io_uring_sqe_set_data64(sqe, pack_user_data(0, tag_remove));
    }
    for (auto const& a : adds) {
      auto* sqe = get_sqe();
      ::io_uring_prep_poll_add(sqe, a.fd, static_cast<unsigned>(a.mask));
      ::io_uring_sqe_set_data64(sqe, a.user_data);
    }
    if (!adds.empty() || !removes.empty()) {
      submit();
    }
  }

  void submit_poll(int fd, int mask, std::uint64_t user_data) {
    auto* sqe = get_sqe();
    ::io_uring_prep_poll_add(sqe, fd, static_cast<unsigned>(mask));
    ::io_uring_sqe_set_data64(sqe, user_data);
    submit();
  }

  auto get_sqe() -> io_uring_sqe* {
    auto* sqe = ::io_uring_get_sqe(&ring_);
    if (sqe == nullptr) {
      submit();
      sqe = ::io_uring_get_sqe(&ring_);
      if (sqe == nullptr) {
        throw std::system_error(std::make_error_code(std::errc::no_buffer_space),
                                "io_uring_get_sqe failed");
      }
    }
    return sqe;
  }

  void submit() {
    int const ret = ::io_uring_submit(&ring_);
    if (ret < 0) {
      throw std::system_error(-ret, std::generic_category(), "io_uring_submit failed");
    }
  }

  io_uring ring_{};
  int eventfd_ = -1;
  std::mutex state_mtx_{};
  std::unordered_map<int, poll_state> polls_{};
  std::vector<pending_add> pending_adds_{};
  std::vector<std::uint64_t> pending_removes_{};
  std::atomic<bool> wakeup_pending_{false};
};

inline auto make_backend() -> std::unique_ptr<backend_interface> {
  return std::make_unique<backend_uring>();
}

}  // namespace strata::detail
