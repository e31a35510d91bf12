#pragma once

#include <functional>
#include <memory>
#include <optional>

#include <exec/task.hpp>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace rp::engine {

/// Lazy, finite, cancellable sequence of call results.
///
/// Finish callbacks fire exactly once: when the sequence ends, fails, is
/// cancelled, or is destroyed before reaching its end (reported as
/// cancelled). Whatever the step function captures is released at that
/// point.
class ResultStream {
public:
  /// Produce the next item; nullopt marks the end.
  using Step = std::function<exec::task<Expected<std::optional<CallResult>>>()>;
  /// Receives the failure, or nullopt when the sequence ended normally.
  using FinishCallback = std::function<void(const std::optional<ReplicaError> &)>;

  ResultStream() = default;
  ResultStream(Step step, std::shared_ptr<RequestContext> context,
               std::function<void()> on_cancel = {});
  ResultStream(const ResultStream &) = delete;
  ResultStream &operator=(const ResultStream &) = delete;
  ResultStream(ResultStream &&) noexcept = default;
  ResultStream &operator=(ResultStream &&other) noexcept;
  ~ResultStream();

  /// Pull the next item. A cancelled request yields a Cancelled error.
  auto next() -> exec::task<Expected<std::optional<CallResult>>>;

  /// Request cooperative cancellation; observed by the next pull.
  auto cancel() -> void;

  /// Register a callback; runs immediately if the stream already finished.
  auto on_finish(FinishCallback callback) -> void;

  auto context() const -> std::shared_ptr<RequestContext>;
  auto finished() const -> bool;

private:
  struct State;

  auto abandon() -> void;

  std::shared_ptr<State> state_;
};

}  // namespace rp::engine
