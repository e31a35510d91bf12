#include "runtime/http_bridge.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <utility>

#include <exec/when_any.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"
#include "runtime/async_queue.hpp"

namespace rp::engine {
namespace {

struct BridgeState {
  AsyncQueue<http::Message> inbound;
  AsyncQueue<http::Message> outbound;
  /// Never fed; closed to stop the pump, even while the body source is idle.
  AsyncQueue<bool> stop_requests;
  std::shared_ptr<RequestContext> context;

  std::mutex mutex;
  std::optional<ReplicaError> outcome;
  std::shared_ptr<void> permit;

  auto stop_pump() -> void {
    stop_requests.close();
    inbound.close();
  }

  /// Record how the dispatch ended, then release the consumer.
  auto finish(std::optional<ReplicaError> error) -> void {
    std::shared_ptr<void> released;
    {
      std::lock_guard<std::mutex> lock(mutex);
      outcome = std::move(error);
      released.swap(permit);
    }
    stop_pump();
    outbound.close();
  }

  auto result() -> std::optional<ReplicaError> {
    std::lock_guard<std::mutex> lock(mutex);
    return outcome;
  }
};

auto stop_signal(std::shared_ptr<BridgeState> state) -> exec::task<http::Message> {
  co_await state->stop_requests.pop();
  co_return http::Message::disconnect();
}

auto read_source(http::Receive source) -> exec::task<http::Message> {
  try {
    co_return co_await source();
  } catch (const std::exception &e) {
    log::warn("HTTP body source failed: {}", e.what());
  }
  co_return http::Message::disconnect();
}

/// Moves body messages into `inbound` until a disconnect or a stop. Each
/// read races the stop signal, so the source is asked to stop as soon as
/// the call is cancelled.
auto pump(std::shared_ptr<BridgeState> state, http::Receive source)
    -> exec::task<void> {
  while (!state->stop_requests.closed()) {
    auto message = co_await exec::when_any(read_source(source), stop_signal(state));
    const bool disconnect = message.type == http::MessageType::Disconnect;
    if (!state->inbound.push(std::move(message)) || disconnect) {
      break;
    }
  }
  state->inbound.close();
}

auto receive_next(std::shared_ptr<BridgeState> state) -> exec::task<http::Message> {
  auto message = co_await state->inbound.pop();
  if (!message) {
    co_return http::Message::disconnect();
  }
  co_return std::move(*message);
}

auto send_out(std::shared_ptr<BridgeState> state, http::Message message)
    -> exec::task<void> {
  // Dropped once the consumer has gone away.
  state->outbound.push(std::move(message));
  co_return;
}

auto run_dispatch(UserCallableHost &host, std::shared_ptr<BridgeState> state,
                  RequestMetadata metadata, http::Scope scope)
    -> exec::task<void> {
  RequestArgs args;
  args.http = http::Protocol{
      std::move(scope),
      [state]() { return receive_next(state); },
      [state](http::Message message) { return send_out(state, std::move(message)); },
  };
  // A dispatch that completes stopped still releases the consumer.
  struct StoppedGuard {
    std::shared_ptr<BridgeState> state;
    ~StoppedGuard() {
      if (state) {
        state->finish(make_error(ErrorCode::Cancelled, "HTTP dispatch stopped"));
      }
    }
  } stopped_guard{state};

  std::optional<ReplicaError> failure;
  try {
    auto result = co_await host.dispatch_unary(std::move(metadata), std::move(args),
                                               state->context);
    if (!result) {
      failure = result.error();
    }
  } catch (const std::exception &e) {
    failure = make_error(ErrorCode::Internal,
                         std::format("HTTP dispatch failed: {}", e.what()));
  } catch (...) {
    failure = make_error(ErrorCode::Internal, "HTTP dispatch failed");
  }
  stopped_guard.state.reset();
  state->finish(std::move(failure));
}

auto next_batch(std::shared_ptr<BridgeState> state)
    -> exec::task<Expected<std::optional<CallResult>>> {
  while (true) {
    const bool available = co_await state->outbound.wait();
    auto messages = state->outbound.drain();
    if (!messages.empty()) {
      co_return std::optional<CallResult>{
          CallResult{MessageBatch{http::MessageBatchCodec::encode(messages)}}};
    }
    if (available) {
      continue;
    }
    if (auto error = state->result()) {
      co_return tl::unexpected(*error);
    }
    if (state->context->is_cancelled()) {
      co_return tl::unexpected(
          make_error(ErrorCode::Cancelled, "request cancelled"));
    }
    co_return std::optional<CallResult>{};
  }
}

} // namespace

auto StreamingResponseBridge::stream(RequestMetadata metadata, http::Scope scope,
                                     http::Receive body_source,
                                     std::shared_ptr<RequestContext> context,
                                     std::shared_ptr<void> permit) -> ResultStream {
  auto state = std::make_shared<BridgeState>();
  state->context = context ? std::move(context) : std::make_shared<RequestContext>();
  state->permit = std::move(permit);

  auto scheduler = pool_.get_scheduler();
  scope_.spawn(stdexec::on(scheduler, pump(state, std::move(body_source))));
  scope_.spawn(stdexec::on(
      scheduler, run_dispatch(host_, state, std::move(metadata), std::move(scope))));

  return ResultStream(
      [state]() { return next_batch(state); }, state->context,
      [state]() {
        state->stop_pump();
        state->outbound.close();
      });
}

}  // namespace rp::engine
