#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <exec/task.hpp>

#include "engine/error.hpp"
#include "engine/http.hpp"
#include "engine/types.hpp"

namespace rp::engine {

/// Arguments a user method is invoked with.
struct CallArgs {
  Json args = Json::array();
  Json kwargs = Json::object();
  /// Plain handlers serving an HTTP call.
  std::shared_ptr<http::Request> request;
  /// App-adapter handlers serving an HTTP call.
  std::optional<http::Protocol> http;
  /// gRPC calls to methods that declare the context parameter.
  std::shared_ptr<GrpcContext> grpc_context;
  std::shared_ptr<const RequestContext> context;

  auto arg(std::size_t index) const -> const Json & { return args.at(index); }
};

/// Inbound arguments as they arrive from the transport.
struct RequestArgs {
  Json args = Json::array();
  Json kwargs = Json::object();
  /// Set for HTTP calls. Streaming HTTP calls use `receive` as the body
  /// source and ignore `send`.
  std::optional<http::Protocol> http;
  /// Set for gRPC calls: the single serialized request message.
  std::optional<std::string> grpc_payload;
};

/// Pull-style lazy sequences. nullopt marks the end.
using SyncSequence = std::function<std::optional<Json>()>;
using AsyncSequence = std::function<exec::task<std::optional<Json>>()>;

using SyncUnary = std::function<Json(const CallArgs &)>;
using AsyncUnary = std::function<exec::task<Json>(CallArgs)>;
using SyncGenerator = std::function<SyncSequence(const CallArgs &)>;
using AsyncGenerator = std::function<AsyncSequence(CallArgs)>;

/// A typed invocable exposed by a handler.
class Method {
public:
  using Body = std::variant<SyncUnary, AsyncUnary, SyncGenerator, AsyncGenerator>;

  Method() = default;

  static auto unary(SyncUnary fn) -> Method {
    return Method(Body{std::in_place_type<SyncUnary>, std::move(fn)});
  }
  static auto async_unary(AsyncUnary fn) -> Method {
    return Method(Body{std::in_place_type<AsyncUnary>, std::move(fn)});
  }
  static auto generator(SyncGenerator fn) -> Method {
    return Method(Body{std::in_place_type<SyncGenerator>, std::move(fn)});
  }
  static auto async_generator(AsyncGenerator fn) -> Method {
    return Method(Body{std::in_place_type<AsyncGenerator>, std::move(fn)});
  }

  /// Plain HTTP calls invoke this method without any argument.
  auto without_request() && -> Method {
    takes_request_ = false;
    return std::move(*this);
  }
  /// gRPC calls pass the per-call context in CallArgs::grpc_context.
  auto with_grpc_context() && -> Method {
    wants_grpc_context_ = true;
    return std::move(*this);
  }

  auto body() const -> const Body & { return body_; }
  auto takes_request() const -> bool { return takes_request_; }
  auto wants_grpc_context() const -> bool { return wants_grpc_context_; }

  auto is_generator() const -> bool;
  /// False for a default-constructed method or an empty function.
  auto valid() const -> bool;

private:
  explicit Method(Body body) : body_(std::move(body)) {}

  Body body_;
  bool takes_request_ = true;
  bool wants_grpc_context_ = false;
};

/// Method name -> method; sorted so listings are deterministic.
using MethodTable = std::map<std::string, Method>;

/// What a handler instance offers to the host. Built once at initialization.
struct Capabilities {
  MethodTable methods;
  std::function<exec::task<void>(Json)> reconfigure;
  std::function<exec::task<void>()> check_health;
  std::function<exec::task<void>()> teardown;
  /// Shuts down the model-multiplexing subsystem, if the handler uses one.
  std::function<exec::task<void>()> multiplex_shutdown;
  /// Set when the handler wraps a whole web application.
  std::shared_ptr<http::App> http_app;
};

/// Base class of user handler instances.
///
/// Hooks and methods may capture `this`; the host keeps the instance alive
/// for as long as any call into it is outstanding.
class Handler {
public:
  virtual ~Handler() = default;
  virtual auto capabilities() -> Capabilities = 0;
};

/// Constructor arguments of a class definition.
struct InitArgs {
  Json args = Json::array();
  Json kwargs = Json::object();
};

/// A bare function: one body that answers every method name.
struct FunctionDefinition {
  std::string name;
  Method body;
};

/// A class: a factory that builds the handler instance. It may suspend.
struct ClassDefinition {
  std::string name;
  std::function<exec::task<std::shared_ptr<Handler>>(InitArgs)> factory;
};

using DeploymentDefinition = std::variant<FunctionDefinition, ClassDefinition>;

auto definition_name(const DeploymentDefinition &definition) -> const std::string &;

/// Public names of `methods`: those not starting with "__".
auto public_method_names(const MethodTable &methods) -> std::vector<std::string>;

}  // namespace rp::engine
