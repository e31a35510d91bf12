#include "engine/sequence.hpp"

#include <mutex>
#include <utility>
#include <vector>

namespace rp::engine {

struct ResultStream::State {
  Step step;
  std::shared_ptr<RequestContext> context;
  std::function<void()> on_cancel;

  std::mutex mutex;
  bool done = false;
  std::optional<ReplicaError> outcome;
  std::vector<FinishCallback> callbacks;

  auto current_step() -> Step {
    std::lock_guard<std::mutex> lock(mutex);
    return done ? Step{} : step;
  }

  auto cancel_hook() -> std::function<void()> {
    std::lock_guard<std::mutex> lock(mutex);
    return done ? std::function<void()>{} : on_cancel;
  }

  auto finish(std::optional<ReplicaError> error) -> void {
    std::vector<FinishCallback> pending;
    Step released_step;
    std::function<void()> released_hook;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (done) {
        return;
      }
      done = true;
      outcome = error;
      pending.swap(callbacks);
      released_step.swap(step);
      released_hook.swap(on_cancel);
    }
    for (auto &callback : pending) {
      callback(error);
    }
  }
};

namespace {

auto cancelled_error() -> ReplicaError {
  return make_error(ErrorCode::Cancelled, "request cancelled");
}

} // namespace

ResultStream::ResultStream(Step step, std::shared_ptr<RequestContext> context,
                           std::function<void()> on_cancel)
    : state_(std::make_shared<State>()) {
  state_->step = std::move(step);
  state_->context =
      context ? std::move(context) : std::make_shared<RequestContext>();
  state_->on_cancel = std::move(on_cancel);
}

auto ResultStream::operator=(ResultStream &&other) noexcept -> ResultStream & {
  if (this != &other) {
    abandon();
    state_ = std::move(other.state_);
  }
  return *this;
}

ResultStream::~ResultStream() { abandon(); }

auto ResultStream::next() -> exec::task<Expected<std::optional<CallResult>>> {
  auto state = state_;
  if (!state) {
    co_return std::optional<CallResult>{};
  }
  auto step = state->current_step();
  if (!step) {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->outcome) {
      co_return tl::unexpected(*state->outcome);
    }
    co_return std::optional<CallResult>{};
  }
  if (state->context->is_cancelled()) {
    state->finish(cancelled_error());
    co_return tl::unexpected(cancelled_error());
  }

  auto item = co_await step();
  if (!item) {
    state->finish(item.error());
    co_return tl::unexpected(item.error());
  }
  if (!item->has_value()) {
    state->finish(std::nullopt);
  }
  co_return item;
}

auto ResultStream::cancel() -> void {
  if (!state_) {
    return;
  }
  state_->context->cancel();
  if (auto hook = state_->cancel_hook()) {
    hook();
  }
}

auto ResultStream::on_finish(FinishCallback callback) -> void {
  if (!state_) {
    callback(std::nullopt);
    return;
  }
  std::optional<ReplicaError> outcome;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (!state_->done) {
      state_->callbacks.push_back(std::move(callback));
      return;
    }
    outcome = state_->outcome;
  }
  callback(outcome);
}

auto ResultStream::context() const -> std::shared_ptr<RequestContext> {
  return state_ ? state_->context : nullptr;
}

auto ResultStream::finished() const -> bool {
  if (!state_) {
    return true;
  }
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->done;
}

auto ResultStream::abandon() -> void {
  if (!state_ || finished()) {
    return;
  }
  cancel();
  state_->finish(make_error(ErrorCode::Cancelled, "stream dropped before completion"));
  state_.reset();
}

}  // namespace rp::engine
