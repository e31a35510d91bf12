#pragma once

#include <memory>
#include <string>
#include <vector>

#include <exec/task.hpp>

#include "engine/config.hpp"
#include "engine/error.hpp"
#include "engine/handler.hpp"
#include "engine/sequence.hpp"
#include "engine/serializer.hpp"
#include "engine/types.hpp"

namespace rp::engine {

/// Owns the user handler of one replica and runs every call into it.
///
/// Dispatches hold the handler lock shared; reconfigure holds it exclusively,
/// so no call observes a partially-applied reconfigure. Teardown has its own
/// lock and runs at most once.
class UserCallableHost {
public:
  /// Validate `definition` and store it unevaluated. `serializer` decodes
  /// gRPC requests and encodes gRPC replies (msgpack when null).
  static auto create(DeploymentDefinition definition, InitArgs init_args,
                     DeploymentId deployment_id,
                     std::shared_ptr<const Serializer> serializer = nullptr)
      -> Expected<std::unique_ptr<UserCallableHost>>;

  UserCallableHost(const UserCallableHost &) = delete;
  UserCallableHost &operator=(const UserCallableHost &) = delete;
  ~UserCallableHost();

  /// Build the handler instance and resolve its hooks. Must run once.
  auto initialize_callable() -> exec::task<Expected<void>>;

  /// Apply `user_config` to the handler under exclusive access. No-op for a
  /// null config.
  auto call_reconfigure(Json user_config) -> exec::task<Expected<void>>;

  /// Run a non-generator method. HTTP results are also sent over the
  /// protocol; gRPC results come back as GrpcReply.
  auto dispatch_unary(RequestMetadata metadata, RequestArgs args,
                      std::shared_ptr<RequestContext> context = nullptr)
      -> exec::task<Expected<CallResult>>;

  /// Start a generator method. The returned stream keeps shared access
  /// until it finishes.
  auto dispatch_streaming(RequestMetadata metadata, RequestArgs args,
                          std::shared_ptr<RequestContext> context = nullptr)
      -> exec::task<Expected<ResultStream>>;

  auto call_health_check() -> exec::task<Expected<void>>;

  /// Run the teardown hooks once. Failures are logged, never reported.
  auto call_destructor() -> exec::task<void>;

  auto initialized() const -> bool;
  auto is_function() const -> bool;
  auto deployment_id() const -> const DeploymentId &;

  /// Public method names of the live handler (empty before initialization).
  auto method_names() const -> std::vector<std::string>;

  struct State;

private:
  explicit UserCallableHost(std::shared_ptr<State> state);

  std::shared_ptr<State> state_;
};

}  // namespace rp::engine
