#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <nlohmann/json.hpp>

namespace rp::engine {

using Json = nlohmann::json;

/// Lifecycle states of a replica as seen by the controller.
enum class ReplicaState {
  PendingAllocation,
  PendingInitialization,
  Healthy,
  Reconfiguring,
  Draining,
  Terminated,
};

auto to_string(ReplicaState state) -> std::string_view;

/// Mutable per-call gRPC context handed to user methods that declare it.
class GrpcContext {
public:
  GrpcContext() = default;
  explicit GrpcContext(
      std::vector<std::pair<std::string, std::string>> invocation_metadata)
      : invocation_metadata_(std::move(invocation_metadata)) {}

  auto code() const -> grpc::StatusCode { return code_; }
  auto set_code(grpc::StatusCode code) -> void { code_ = code; }

  auto details() const -> const std::string & { return details_; }
  auto set_details(std::string details) -> void { details_ = std::move(details); }

  auto invocation_metadata() const
      -> const std::vector<std::pair<std::string, std::string>> & {
    return invocation_metadata_;
  }

  auto trailing_metadata() const
      -> const std::vector<std::pair<std::string, std::string>> & {
    return trailing_metadata_;
  }
  auto add_trailing_metadata(std::string key, std::string value) -> void {
    trailing_metadata_.emplace_back(std::move(key), std::move(value));
  }

private:
  grpc::StatusCode code_ = grpc::StatusCode::OK;
  std::string details_;
  std::vector<std::pair<std::string, std::string>> invocation_metadata_;
  std::vector<std::pair<std::string, std::string>> trailing_metadata_;
};

/// Immutable routing metadata that travels with a call end-to-end.
struct RequestMetadata {
  std::string request_id;
  std::string route;
  std::string call_method = "__call__";
  bool is_http = false;
  bool is_streaming = false;
  bool is_grpc = false;
  std::optional<std::string> multiplexed_model_id;
  std::shared_ptr<GrpcContext> grpc_context;
};

/// Request-scoped context visible to user code for the duration of a call.
struct RequestContext {
  std::string route;
  std::string request_id;
  std::string app_name;
  std::string multiplexed_model_id;
  std::shared_ptr<GrpcContext> grpc_context;
  std::atomic<bool> cancelled{false};

  auto cancel() -> void { cancelled.store(true, std::memory_order_release); }

  auto is_cancelled() const -> bool {
    return cancelled.load(std::memory_order_acquire);
  }
};

/// Serialized gRPC reply paired with the context the method may have mutated.
struct GrpcReply {
  std::shared_ptr<GrpcContext> context;
  std::string payload;
};

/// One encoded batch of HTTP response messages produced by the bridge.
struct MessageBatch {
  std::string bytes;
};

/// Value produced by a unary call or by one step of a streaming call.
using CallResult = std::variant<Json, GrpcReply, MessageBatch>;

/// Snapshot of requests accepted by the replica.
struct QueueDepth {
  std::uint64_t pending = 0;
  std::uint64_t running = 0;

  auto total() const -> std::uint64_t { return pending + running; }
};

}  // namespace rp::engine
