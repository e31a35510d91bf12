#pragma once

#include <coroutine>
#include <deque>
#include <mutex>

namespace rp::engine {

/// Reader/writer lock for coroutines.
///
/// Any number of shared holders may coexist; an exclusive holder excludes
/// everyone. Acquisition is FIFO-fair: a new shared request queues behind a
/// waiting writer, so writers are not starved. Guards may be released from
/// any thread; granted waiters are resumed inline by the releasing thread.
class AsyncRwLock {
public:
  class Guard {
  public:
    Guard() = default;
    Guard(AsyncRwLock *lock, bool exclusive)
        : lock_(lock), exclusive_(exclusive) {}
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard(Guard &&other) noexcept
        : lock_(other.lock_), exclusive_(other.exclusive_) {
      other.lock_ = nullptr;
    }
    auto operator=(Guard &&other) noexcept -> Guard & {
      if (this == &other) {
        return *this;
      }
      release();
      lock_ = other.lock_;
      exclusive_ = other.exclusive_;
      other.lock_ = nullptr;
      return *this;
    }
    ~Guard() { release(); }

    auto owns_lock() const -> bool { return lock_ != nullptr; }

    auto release() -> void {
      if (lock_) {
        auto *lock = lock_;
        lock_ = nullptr;
        lock->unlock(exclusive_);
      }
    }

  private:
    AsyncRwLock *lock_ = nullptr;
    bool exclusive_ = false;
  };

  class Awaiter {
  public:
    Awaiter(AsyncRwLock &lock, bool exclusive)
        : lock_(&lock), exclusive_(exclusive) {}

    auto await_ready() const noexcept -> bool { return false; }
    auto await_suspend(std::coroutine_handle<> handle) -> bool;
    auto await_resume() -> Guard { return Guard{lock_, exclusive_}; }

  private:
    AsyncRwLock *lock_ = nullptr;
    bool exclusive_ = false;
  };

  AsyncRwLock() = default;
  AsyncRwLock(const AsyncRwLock &) = delete;
  AsyncRwLock &operator=(const AsyncRwLock &) = delete;

  /// Acquire shared (reader) access.
  auto lock_shared() -> Awaiter { return Awaiter{*this, false}; }
  /// Acquire exclusive (writer) access.
  auto lock() -> Awaiter { return Awaiter{*this, true}; }

  /// Non-suspending shared acquisition; empty guard on contention.
  auto try_lock_shared() -> Guard;

  auto readers() const -> int;
  auto writer_active() const -> bool;

private:
  struct Waiter {
    std::coroutine_handle<> handle;
    bool exclusive = false;
  };

  auto try_acquire_locked(bool exclusive) -> bool;
  auto unlock(bool exclusive) -> void;

  mutable std::mutex mutex_;
  int readers_ = 0;
  bool writer_ = false;
  std::deque<Waiter> waiters_;
};

} // namespace rp::engine
