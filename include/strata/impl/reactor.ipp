#include <strata/assert.hpp>
#include <strata/detail/reactor.hpp>
#include <strata/error.hpp>

#ifdef STRATA_USE_URING
#include <strata/impl/backends/uring.ipp>
#else
#include <strata/impl/backends/epoll.ipp>
#endif

#include <algorithm>
#include <chrono>
#include <utility>

namespace strata::detail {

inline reactor::reactor() : backend_(make_backend()) {}

inline reactor::~reactor() {
  // Abort whatever is still registered so awaiting coroutines observe cancellation.
  std::unordered_map<int, fd_ops> ops;
  {
    std::scoped_lock lk{fd_mutex_};
    ops.swap(fd_operations_);
  }
  for (auto& [fd, o] : ops) {
    if (o.read_op && o.read_op->on_abort) {
      o.read_op->on_abort(error::operation_aborted);
    }
    if (o.write_op && o.write_op->on_abort) {
      o.write_op->on_abort(error::operation_aborted);
    }
  }
}

inline auto reactor::this_thread_token() noexcept -> std::uintptr_t {
  static thread_local int tls_anchor = 0;
  return reinterpret_cast<std::uintptr_t>(&tls_anchor);
}

inline void reactor::set_thread_id() noexcept {
  thread_token_.store(this_thread_token(), std::memory_order_release);
}

inline auto reactor::running_in_this_thread() const noexcept -> bool {
  return thread_token_.load(std::memory_order_acquire) == this_thread_token();
}

inline auto reactor::run() -> std::size_t {
  set_thread_id();
  std::size_t count = 0;

  while (!stopped() && has_work()) {
    count += process_posted();
    count += process_timers();

    if (stopped() || !has_work()) {
      break;
    }

    count += process_events(get_timeout());
  }

  return count;
}

inline auto reactor::run_one() -> std::size_t {
  set_thread_id();

  if (auto n = process_posted(); n > 0) {
    return n;
  }
  if (auto n = process_timers(); n > 0) {
    return n;
  }
  if (stopped() || !has_work()) {
    return 0;
  }
  return process_events(get_timeout());
}

inline auto reactor::run_for(std::chrono::milliseconds timeout) -> std::size_t {
  set_thread_id();

  auto const deadline = std::chrono::steady_clock::now() + timeout;
  std::size_t count = 0;

  while (!stopped() && has_work()) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      break;
    }

    count += process_posted();
    count += process_timers();

    if (stopped() || !has_work()) {
      break;
    }

    auto wait_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    if (auto const timer_timeout = get_timeout()) {
      wait_ms = std::min(wait_ms, *timer_timeout);
    }

    count += process_events(wait_ms);
  }

  return count;
}

inline auto reactor::poll() -> std::size_t {
  set_thread_id();

  std::size_t count = 0;
  count += process_posted();
  count += process_timers();
  if (!stopped()) {
    count += process_events(std::chrono::milliseconds{0});
  }
  return count;
}

inline void reactor::stop() {
  stopped_.store(true, std::memory_order_release);
  wakeup();
}

inline void reactor::restart() { stopped_.store(false, std::memory_order_release); }

inline void reactor::post(unique_function<void()> f) {
  {
    std::scoped_lock lk{posted_mutex_};
    posted_operations_.push(std::move(f));
  }
  wakeup();
}

inline void reactor::dispatch(unique_function<void()> f) {
  if (running_in_this_thread() && !stopped()) {
    f();
  } else {
    post(std::move(f));
  }
}

inline auto reactor::schedule_timer(std::chrono::steady_clock::time_point expiry,
                                    unique_function<void(std::error_code)> on_complete)
  -> std::shared_ptr<timer_entry> {
  auto entry = std::make_shared<timer_entry>();
  entry->expiry = expiry;
  entry->on_complete = std::move(on_complete);

  {
    std::scoped_lock lk{timer_mutex_};
    entry->id = next_timer_id_++;
    timers_.push(entry);
  }
  pending_timers_.fetch_add(1, std::memory_order_acq_rel);

  wakeup();
  return entry;
}

inline void reactor::cancel_timer(std::shared_ptr<timer_entry> const& entry) noexcept {
  if (!entry || !entry->mark_cancelled()) {
    return;
  }
  pending_timers_.fetch_sub(1, std::memory_order_acq_rel);
  auto cb = std::move(entry->on_complete);
  wakeup();
  if (cb) {
    cb(error::operation_aborted);
  }
}

inline auto reactor::register_fd(int fd, fd_event_kind kind, reactor_op_ptr op)
  -> fd_event_handle {
  STRATA_ENSURE(op != nullptr, "reactor: null fd operation");
  reactor_op_ptr old;
  std::uint64_t token = 0;

  {
    std::scoped_lock lk{fd_mutex_};
    auto& ops = fd_operations_[fd];
    token = next_fd_token_++;
    if (kind == fd_event_kind::read) {
      ops.read_token = token;
      old = std::exchange(ops.read_op, std::move(op));
    } else {
      ops.write_token = token;
      old = std::exchange(ops.write_op, std::move(op));
    }
  }
  if (old && old->on_abort) {
    old->on_abort(error::operation_aborted);
  }

  reconcile_fd_interest_async(fd);
  wakeup();
  return fd_event_handle{this, fd, kind, token};
}

inline auto reactor::register_fd_read(int fd, reactor_op_ptr op) -> fd_event_handle {
  return register_fd(fd, fd_event_kind::read, std::move(op));
}

inline auto reactor::register_fd_write(int fd, reactor_op_ptr op) -> fd_event_handle {
  return register_fd(fd, fd_event_kind::write, std::move(op));
}

inline void reactor::deregister_fd(int fd) {
  fd_ops removed;
  {
    std::scoped_lock lk{fd_mutex_};
    auto it = fd_operations_.find(fd);
    if (it != fd_operations_.end()) {
      removed = std::move(it->second);
      fd_operations_.erase(it);
    }
  }

  // The fd is usually closed right after; drop interest synchronously.
  backend_->remove_fd_interest(fd);

  if (removed.read_op && removed.read_op->on_abort) {
    removed.read_op->on_abort(error::operation_aborted);
  }
  if (removed.write_op && removed.write_op->on_abort) {
    removed.write_op->on_abort(error::operation_aborted);
  }

  wakeup();
}

inline void reactor::add_work_guard() noexcept {
  work_guard_counter_.fetch_add(1, std::memory_order_acq_rel);
}

inline void reactor::remove_work_guard() noexcept {
  auto const old = work_guard_counter_.fetch_sub(1, std::memory_order_acq_rel);
  STRATA_ENSURE(old > 0, "reactor: remove_work_guard() without matching add_work_guard()");
  if (old == 1) {
    wakeup();
  }
}

inline auto reactor::process_events(std::optional<std::chrono::milliseconds> max_wait)
  -> std::size_t {
  backend_->wait(max_wait, events_);

  std::size_t count = 0;
  for (auto const& ev : events_) {
    reactor_op_ptr rop;
    reactor_op_ptr wop;
    {
      std::scoped_lock lk{fd_mutex_};
      auto it = fd_operations_.find(ev.fd);
      if (it == fd_operations_.end()) {
        continue;
      }
      auto& ops = it->second;
      if (ev.can_read && ops.read_op) {
        rop = std::move(ops.read_op);
        ops.read_token = invalid_fd_token;
      }
      if (ev.can_write && ops.write_op) {
        wop = std::move(ops.write_op);
        ops.write_token = invalid_fd_token;
      }
      if (!ops.read_op && !ops.write_op) {
        fd_operations_.erase(it);
      }
    }

    if (rop || wop) {
      reconcile_fd_interest(ev.fd);
    }
    if (rop && rop->on_ready) {
      rop->on_ready();
      ++count;
    }
    if (wop && wop->on_ready) {
      wop->on_ready();
      ++count;
    }
  }
  events_.clear();
  return count;
}

inline auto reactor::process_timers() -> std::size_t {
  std::unique_lock lk{timer_mutex_};
  std::size_t count = 0;
  auto const now = std::chrono::steady_clock::now();

  while (!timers_.empty() && !stopped()) {
    auto entry = timers_.top();
    if (!entry->is_pending()) {
      timers_.pop();
      continue;
    }
    if (entry->expiry > now) {
      break;
    }
    timers_.pop();

    if (!entry->mark_fired()) {
      continue;
    }
    pending_timers_.fetch_sub(1, std::memory_order_acq_rel);

    lk.unlock();
    auto cb = std::move(entry->on_complete);
    if (cb) {
      cb(std::error_code{});
    }
    ++count;
    lk.lock();
  }

  return count;
}

inline auto reactor::process_posted() -> std::size_t {
  std::queue<unique_function<void()>> local;
  {
    std::scoped_lock lk{posted_mutex_};
    std::swap(local, posted_operations_);
  }

  std::size_t n = 0;
  while (!local.empty()) {
    if (stopped()) {
      // Keep the remainder so a later restart() still runs it, ahead of newer work.
      std::scoped_lock lk{posted_mutex_};
      while (!posted_operations_.empty()) {
        local.push(std::move(posted_operations_.front()));
        posted_operations_.pop();
      }
      std::swap(local, posted_operations_);
      break;
    }

    auto f = std::move(local.front());
    local.pop();
    if (f) {
      f();
    }
    ++n;
  }
  return n;
}

inline auto reactor::get_timeout() -> std::optional<std::chrono::milliseconds> {
  std::scoped_lock lk{timer_mutex_};

  while (!timers_.empty() && !timers_.top()->is_pending()) {
    timers_.pop();
  }
  if (timers_.empty()) {
    return std::nullopt;
  }

  auto const now = std::chrono::steady_clock::now();
  auto const expiry = timers_.top()->expiry;
  if (expiry <= now) {
    return std::chrono::milliseconds{0};
  }
  // Round up so the wait never returns just before the deadline.
  return std::chrono::ceil<std::chrono::milliseconds>(expiry - now);
}

inline void reactor::wakeup() noexcept { backend_->wakeup(); }

inline auto reactor::has_work() -> bool {
  if (work_guard_counter_.load(std::memory_order_acquire) > 0) {
    return true;
  }
  if (pending_timers_.load(std::memory_order_acquire) > 0) {
    return true;
  }
  {
    std::scoped_lock lk{fd_mutex_};
    if (!fd_operations_.empty()) {
      return true;
    }
  }
  std::scoped_lock lk{posted_mutex_};
  return !posted_operations_.empty();
}

inline void reactor::reconcile_fd_interest(int fd) {
  bool want_read = false;
  bool want_write = false;
  {
    std::scoped_lock lk{fd_mutex_};
    auto it = fd_operations_.find(fd);
    if (it != fd_operations_.end()) {
      want_read = (it->second.read_op != nullptr);
      want_write = (it->second.write_op != nullptr);
    }
  }

  if (want_read || want_write) {
    backend_->update_fd_interest(fd, want_read, want_write);
  } else {
    backend_->remove_fd_interest(fd);
  }
}

inline void reactor::reconcile_fd_interest_async(int fd) {
  if (running_in_this_thread()) {
    reconcile_fd_interest(fd);
    return;
  }
  post([this, fd] { reconcile_fd_interest(fd); });
}

inline void reactor::cancel_fd_event(int fd, fd_event_kind kind, std::uint64_t token) noexcept {
  reactor_op_ptr removed;
  {
    std::scoped_lock lk{fd_mutex_};
    auto it = fd_operations_.find(fd);
    if (it == fd_operations_.end()) {
      return;
    }

    auto& ops = it->second;
    if (kind == fd_event_kind::read && ops.read_op && ops.read_token == token) {
      removed = std::move(ops.read_op);
      ops.read_token = invalid_fd_token;
    } else if (kind == fd_event_kind::write && ops.write_op && ops.write_token == token) {
      removed = std::move(ops.write_op);
      ops.write_token = invalid_fd_token;
    }

    if (!removed) {
      return;
    }
    if (!ops.read_op && !ops.write_op) {
      fd_operations_.erase(it);
    }
  }

  if (removed->on_abort) {
    removed->on_abort(error::operation_aborted);
  }
  // Interest is reconciled on the reactor thread; a stale wakeup finds no operation.
  post([this, fd] { reconcile_fd_interest(fd); });
}

inline void reactor::fd_event_handle::cancel() const noexcept {
  if (!valid()) {
    return;
  }
  owner->cancel_fd_event(fd, kind, token);
}

}  // namespace strata::detail
