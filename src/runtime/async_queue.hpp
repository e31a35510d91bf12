#pragma once

#include <algorithm>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <exec/task.hpp>
#include <stdexec/execution.hpp>
#include <stdexec/stop_token.hpp>

namespace rp::engine {

/// Unbounded multi-producer queue whose consumers suspend instead of block.
///
/// Waiters are resumed inline on the thread that pushes, closes or requests
/// stop, after the internal mutex has been released.
template <typename T>
class AsyncQueue {
public:
  class WaitAwaiter {
  public:
    explicit WaitAwaiter(AsyncQueue &queue, stdexec::inplace_stop_token token = {})
        : queue_(&queue), token_(token) {}

    auto await_ready() const noexcept -> bool { return false; }

    auto await_suspend(std::coroutine_handle<> handle) -> bool {
      handle_ = handle;
      if (token_.stop_possible()) {
        // May run inline when stop was already requested.
        on_stop_.emplace(token_, OnStop{this});
      }
      std::unique_lock<std::mutex> lock(queue_->mutex_);
      if (stopped_ || !queue_->items_.empty() || queue_->closed_) {
        return false;
      }
      queue_->waiters_.push_back(handle);
      return true;
    }

    /// True when at least one item is buffered.
    auto await_resume() const -> bool {
      std::unique_lock<std::mutex> lock(queue_->mutex_);
      return !queue_->items_.empty();
    }

  private:
    struct OnStop {
      WaitAwaiter *self;
      auto operator()() noexcept -> void { self->cancel(); }
    };

    auto cancel() noexcept -> void {
      bool resume = false;
      {
        std::unique_lock<std::mutex> lock(queue_->mutex_);
        stopped_ = true;
        auto &waiters = queue_->waiters_;
        auto it = std::find(waiters.begin(), waiters.end(), handle_);
        if (it != waiters.end()) {
          waiters.erase(it);
          resume = true;
        }
      }
      if (resume) {
        handle_.resume();
      }
    }

    AsyncQueue *queue_ = nullptr;
    stdexec::inplace_stop_token token_;
    std::coroutine_handle<> handle_;
    bool stopped_ = false;
    // Destroyed first: a running callback finishes before the fields it
    // touches go away.
    std::optional<stdexec::inplace_stop_callback<OnStop>> on_stop_;
  };

  AsyncQueue() = default;
  AsyncQueue(const AsyncQueue &) = delete;
  AsyncQueue &operator=(const AsyncQueue &) = delete;

  auto push(T value) -> bool {
    std::vector<std::coroutine_handle<>> ready;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      items_.push_back(std::move(value));
      ready.swap(waiters_);
    }
    for (auto handle : ready) {
      handle.resume();
    }
    return true;
  }

  auto close() -> void {
    std::vector<std::coroutine_handle<>> ready;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (closed_) {
        return;
      }
      closed_ = true;
      ready.swap(waiters_);
    }
    for (auto handle : ready) {
      handle.resume();
    }
  }

  /// Suspend until an item is buffered or the queue is closed.
  auto wait() -> WaitAwaiter { return WaitAwaiter{*this}; }

  /// As wait(), also resuming once `token` is stopped.
  auto wait(stdexec::inplace_stop_token token) -> WaitAwaiter {
    return WaitAwaiter{*this, token};
  }

  auto try_pop() -> std::optional<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  /// Take everything currently buffered.
  auto drain() -> std::vector<T> {
    std::unique_lock<std::mutex> lock(mutex_);
    std::vector<T> out;
    out.reserve(items_.size());
    for (auto &item : items_) {
      out.push_back(std::move(item));
    }
    items_.clear();
    return out;
  }

  /// Next item, or nullopt once the queue is closed and empty. Completes
  /// stopped when the awaiting task is asked to stop while nothing is
  /// buffered.
  auto pop() -> exec::task<std::optional<T>> {
    auto token = co_await stdexec::read_env(stdexec::get_stop_token);
    while (true) {
      const bool available = co_await wait(token);
      if (!available) {
        if (!closed() && token.stop_requested()) {
          co_await stdexec::just_stopped();
        }
        co_return std::nullopt;
      }
      if (auto value = try_pop()) {
        co_return value;
      }
    }
  }

  auto closed() const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return closed_;
  }

  auto size() const -> std::size_t {
    std::unique_lock<std::mutex> lock(mutex_);
    return items_.size();
  }

private:
  mutable std::mutex mutex_;
  std::deque<T> items_;
  std::vector<std::coroutine_handle<>> waiters_;
  bool closed_ = false;
};

} // namespace rp::engine
