#include "runtime/rw_lock.hpp"

#include <vector>

namespace rp::engine {

auto AsyncRwLock::Awaiter::await_suspend(std::coroutine_handle<> handle)
    -> bool {
  std::unique_lock<std::mutex> lock(lock_->mutex_);
  if (lock_->try_acquire_locked(exclusive_)) {
    return false;
  }
  lock_->waiters_.push_back(Waiter{handle, exclusive_});
  return true;
}

auto AsyncRwLock::try_lock_shared() -> Guard {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!try_acquire_locked(false)) {
    return {};
  }
  return Guard{this, false};
}

auto AsyncRwLock::readers() const -> int {
  std::unique_lock<std::mutex> lock(mutex_);
  return readers_;
}

auto AsyncRwLock::writer_active() const -> bool {
  std::unique_lock<std::mutex> lock(mutex_);
  return writer_;
}

auto AsyncRwLock::try_acquire_locked(bool exclusive) -> bool {
  if (writer_ || !waiters_.empty()) {
    return false;
  }
  if (exclusive) {
    if (readers_ > 0) {
      return false;
    }
    writer_ = true;
    return true;
  }
  readers_ += 1;
  return true;
}

auto AsyncRwLock::unlock(bool exclusive) -> void {
  std::vector<std::coroutine_handle<>> ready;
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (exclusive) {
      writer_ = false;
    } else {
      readers_ -= 1;
    }
    while (!waiters_.empty()) {
      auto &front = waiters_.front();
      if (front.exclusive) {
        if (writer_ || readers_ > 0) {
          break;
        }
        writer_ = true;
        ready.push_back(front.handle);
        waiters_.pop_front();
        break;
      }
      if (writer_) {
        break;
      }
      readers_ += 1;
      ready.push_back(front.handle);
      waiters_.pop_front();
    }
  }
  for (auto handle : ready) {
    handle.resume();
  }
}

} // namespace rp::engine
