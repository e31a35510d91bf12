#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <exec/task.hpp>

#include "engine/config.hpp"
#include "engine/error.hpp"
#include "engine/handler.hpp"
#include "engine/sequence.hpp"
#include "engine/serializer.hpp"
#include "engine/types.hpp"
#include "engine/version.hpp"
#include "runtime/metrics.hpp"

namespace rp::engine {

/// Builds the metrics recorder of a replica from its queue-depth probe.
using MetricsFactory =
    std::function<std::unique_ptr<MetricsRecorder>(std::function<QueueDepth()>)>;

struct CoordinatorOptions {
  DeploymentId deployment_id;
  /// "app#deployment#suffix" or "deployment#suffix".
  std::string replica_tag;
  DeploymentDefinition definition;
  InitArgs init_args;
  DeploymentConfig config;
  std::string code_version;
  /// gRPC payload codec; msgpack when null.
  std::shared_ptr<const Serializer> serializer;
  /// When unset a ReplicaMetricsManager is used.
  MetricsFactory metrics_factory;
  /// Receives autoscaling samples of the default recorder.
  AutoscalingSink autoscaling_sink;
  /// Request worker threads; 0 means --replica_request_threads.
  int request_threads = 0;
};

/// Identity a freshly allocated replica reports to the controller.
struct AllocationInfo {
  int pid = 0;
  std::string replica_tag;
  std::string hostname;
  std::string log_file_path;
};

struct ReplicaContext {
  std::string app_name;
  std::string deployment;
  std::string replica_tag;
  bool initialized = false;
};

/// What the controller learns after initialize / reconfigure.
struct ReplicaMetadata {
  DeploymentConfig config;
  DeploymentVersion version;
};

/// Entry surface of a replica.
///
/// Every call runs on the replica's request pool inside an envelope that
/// sets up the request context, times the call and emits one access-log
/// record and one metrics observation, whatever the outcome. Control-plane
/// calls sequence startup (allocate, initialize, health check) and shutdown
/// (drain, destruct).
///
/// Draining has no upper bound: it waits for as long as requests are
/// ongoing. The orchestrator is expected to force-kill the replica once
/// graceful_shutdown_timeout has elapsed.
class RequestCoordinator {
public:
  static auto create(CoordinatorOptions options)
      -> Expected<std::unique_ptr<RequestCoordinator>>;

  RequestCoordinator(const RequestCoordinator &) = delete;
  RequestCoordinator &operator=(const RequestCoordinator &) = delete;
  ~RequestCoordinator();

  auto handle_unary(RequestMetadata metadata, RequestArgs args)
      -> exec::task<Expected<CallResult>>;

  /// HTTP calls go through the streaming response bridge; the returned
  /// stream then yields encoded message batches.
  auto handle_streaming(RequestMetadata metadata, RequestArgs args)
      -> exec::task<Expected<ResultStream>>;

  /// Allocation probe; moves PENDING_ALLOCATION to PENDING_INITIALIZATION.
  auto is_allocated() -> AllocationInfo;

  /// Construct the handler once, optionally apply `config`'s user config,
  /// then run one health check.
  auto initialize_and_get_metadata(std::optional<DeploymentConfig> config = std::nullopt)
      -> exec::task<Expected<ReplicaMetadata>>;

  /// Stored config and version change only if the user-level reconfigure
  /// (run when user_config changed) succeeds.
  auto reconfigure(DeploymentConfig config) -> exec::task<Expected<ReplicaMetadata>>;

  auto check_health() -> exec::task<Expected<void>>;

  /// Drain in-flight requests, then run the handler's teardown. Safe to
  /// call repeatedly.
  auto drain_and_terminate() -> exec::task<void>;

  /// Never waits on user code.
  auto queue_depth() const -> QueueDepth;

  auto state() const -> ReplicaState;
  auto metadata() const -> ReplicaMetadata;
  auto replica_context() const -> ReplicaContext;

private:
  struct State;

  explicit RequestCoordinator(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

}  // namespace rp::engine
