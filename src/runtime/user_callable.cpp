#include "runtime/user_callable.hpp"

#include <format>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <variant>

#include "common/logging/log.hpp"
#include "runtime/rw_lock.hpp"

namespace rp::engine {

struct UserCallableHost::State {
  /// What initialize_callable resolved from the definition.
  struct Bound {
    std::shared_ptr<Handler> handler;
    Capabilities caps;
    /// Set for bare-function definitions.
    std::optional<Method> function;
    std::function<exec::task<void>()> health_check;
  };

  DeploymentDefinition definition;
  InitArgs init_args;
  DeploymentId deployment_id;
  std::shared_ptr<const Serializer> serializer;
  bool is_function = false;

  AsyncRwLock lock;
  AsyncRwLock destructor_lock;
  bool destructed = false;

  mutable std::mutex bound_mutex;
  std::shared_ptr<const Bound> bound;

  auto snapshot() const -> std::shared_ptr<const Bound> {
    std::lock_guard<std::mutex> guard(bound_mutex);
    return bound;
  }

  auto publish(std::shared_ptr<const Bound> value) -> void {
    std::lock_guard<std::mutex> guard(bound_mutex);
    bound = std::move(value);
  }

  auto take() -> std::shared_ptr<const Bound> {
    std::lock_guard<std::mutex> guard(bound_mutex);
    return std::exchange(bound, nullptr);
  }
};

namespace {

using Bound = UserCallableHost::State::Bound;

/// Everything a running stream needs; released when the stream finishes.
struct StreamHold {
  std::shared_ptr<UserCallableHost::State> state;
  AsyncRwLock::Guard guard;
  std::shared_ptr<const Bound> bound;
  std::variant<SyncSequence, AsyncSequence> sequence;
  std::string method_name;
  bool is_grpc = false;
  std::shared_ptr<GrpcContext> grpc_context;
};

auto user_error(std::string_view method, std::string_view what) -> ReplicaError {
  return make_error(ErrorCode::UserException,
                    std::format("{} failed: {}", method, what));
}

auto not_initialized() -> ReplicaError {
  return make_error(ErrorCode::Internal, "replica handler is not initialized");
}

auto json_result(Json value) -> CallResult {
  return CallResult{std::in_place_type<Json>, std::move(value)};
}

auto noop_health_check() -> exec::task<void> { co_return; }

auto serve_app(std::shared_ptr<http::App> app, CallArgs args) -> exec::task<Json> {
  if (!args.http) {
    throw std::invalid_argument("the web application only serves HTTP calls");
  }
  co_await app->handle(std::move(*args.http));
  co_return Json{};
}

auto invoke_unary(Method method, CallArgs args) -> exec::task<Json> {
  if (const auto *fn = std::get_if<SyncUnary>(&method.body())) {
    co_return (*fn)(args);
  }
  co_return co_await std::get<AsyncUnary>(method.body())(std::move(args));
}

auto join_names(const std::vector<std::string> &names) -> std::string {
  std::string out;
  for (const auto &name : names) {
    if (!out.empty()) {
      out += ", ";
    }
    out += name;
  }
  return out;
}

auto resolve(const Bound &bound, const std::string &name) -> Expected<Method> {
  if (bound.function) {
    return *bound.function;
  }
  auto it = bound.caps.methods.find(name);
  if (it == bound.caps.methods.end()) {
    return tl::unexpected(make_error(
        ErrorCode::MethodNotFound,
        std::format("Tried to call a method '{}' that does not exist. "
                    "Available methods: [{}].",
                    name, join_names(public_method_names(bound.caps.methods)))));
  }
  return it->second;
}

auto prepare_args(const Bound &bound, const Method &method,
                  const RequestMetadata &metadata, RequestArgs &args,
                  const std::shared_ptr<GrpcContext> &grpc_context,
                  std::shared_ptr<const RequestContext> context,
                  const Serializer &serializer) -> Expected<CallArgs> {
  CallArgs call;
  call.context = std::move(context);
  if (metadata.is_http) {
    if (!args.http) {
      return tl::unexpected(make_error(ErrorCode::UsageError,
                                       "HTTP call is missing its protocol"));
    }
    if (bound.caps.http_app) {
      call.http = *args.http;
    } else if (method.takes_request()) {
      call.request = std::make_shared<http::Request>(args.http->scope,
                                                     args.http->receive);
    }
    return call;
  }
  if (metadata.is_grpc) {
    if (!args.grpc_payload) {
      return tl::unexpected(make_error(
          ErrorCode::UsageError, "gRPC call must carry exactly one request message"));
    }
    auto message = serializer.deserialize(*args.grpc_payload);
    if (!message) {
      return tl::unexpected(message.error());
    }
    call.args = Json::array();
    call.args.push_back(std::move(*message));
    if (method.wants_grpc_context()) {
      call.grpc_context = grpc_context;
    }
    return call;
  }
  call.args = args.args.is_null() ? Json::array() : std::move(args.args);
  call.kwargs = args.kwargs.is_null() ? Json::object() : std::move(args.kwargs);
  return call;
}

auto send_guarded(exec::task<void> send) -> exec::task<Expected<void>> {
  std::optional<std::string> failure;
  try {
    co_await std::move(send);
  } catch (const std::exception &e) {
    failure = e.what();
  }
  if (failure) {
    co_return tl::unexpected(make_error(
        ErrorCode::Internal,
        std::format("failed to send HTTP response: {}", *failure)));
  }
  co_return Expected<void>{};
}

auto pull(std::shared_ptr<StreamHold> hold)
    -> exec::task<Expected<std::optional<CallResult>>> {
  std::optional<Json> item;
  std::optional<ReplicaError> failure;
  try {
    if (auto *sync = std::get_if<SyncSequence>(&hold->sequence)) {
      item = (*sync)();
    } else {
      item = co_await std::get<AsyncSequence>(hold->sequence)();
    }
  } catch (const std::exception &e) {
    failure = user_error(hold->method_name, e.what());
  } catch (...) {
    failure = user_error(hold->method_name, "unknown exception");
  }
  if (failure) {
    co_return tl::unexpected(*failure);
  }
  if (!item) {
    co_return std::optional<CallResult>{};
  }
  if (hold->is_grpc) {
    auto bytes = hold->state->serializer->serialize(*item);
    if (!bytes) {
      co_return tl::unexpected(bytes.error());
    }
    co_return std::optional<CallResult>{
        CallResult{GrpcReply{hold->grpc_context, std::move(*bytes)}}};
  }
  co_return std::optional<CallResult>{json_result(std::move(*item))};
}

} // namespace

UserCallableHost::UserCallableHost(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

UserCallableHost::~UserCallableHost() = default;

auto UserCallableHost::create(DeploymentDefinition definition,
                              InitArgs init_args, DeploymentId deployment_id,
                              std::shared_ptr<const Serializer> serializer)
    -> Expected<std::unique_ptr<UserCallableHost>> {
  if (const auto *fn = std::get_if<FunctionDefinition>(&definition)) {
    if (!fn->body.valid()) {
      return tl::unexpected(make_error(
          ErrorCode::InvalidDefinition,
          std::format("deployment '{}' must be a function or a class, but its "
                      "function body is empty",
                      fn->name)));
    }
  } else if (!std::get<ClassDefinition>(definition).factory) {
    return tl::unexpected(make_error(
        ErrorCode::InvalidDefinition,
        std::format("deployment '{}' must be a function or a class, but its "
                    "class has no factory",
                    definition_name(definition))));
  }

  auto state = std::make_shared<State>();
  state->is_function = std::holds_alternative<FunctionDefinition>(definition);
  state->definition = std::move(definition);
  state->init_args = std::move(init_args);
  state->deployment_id = std::move(deployment_id);
  state->serializer =
      serializer ? std::move(serializer) : std::make_shared<MsgPackSerializer>();
  return std::unique_ptr<UserCallableHost>(new UserCallableHost(std::move(state)));
}

auto UserCallableHost::initialize_callable() -> exec::task<Expected<void>> {
  auto state = state_;
  auto guard = co_await state->lock.lock();
  if (state->snapshot()) {
    co_return tl::unexpected(make_error(ErrorCode::InitializationError,
                                        "replica is already initialized"));
  }
  log::info("Started initializing replica.");

  auto bound = std::make_shared<Bound>();
  std::optional<std::string> failure;
  try {
    if (const auto *fn = std::get_if<FunctionDefinition>(&state->definition)) {
      bound->function = fn->body;
    } else {
      const auto &cls = std::get<ClassDefinition>(state->definition);
      auto handler = co_await cls.factory(state->init_args);
      if (!handler) {
        failure = "factory returned no handler instance";
      } else {
        bound->caps = handler->capabilities();
        bound->handler = std::move(handler);
        if (auto app = bound->caps.http_app) {
          co_await app->startup();
          bound->caps.methods.insert_or_assign(
              "__call__", Method::async_unary([app](CallArgs args) {
                return serve_app(app, std::move(args));
              }));
        }
      }
    }
  } catch (const std::exception &e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }
  if (failure) {
    co_return tl::unexpected(make_error(
        ErrorCode::InitializationError,
        std::format("deployment '{}' failed to initialize: {}",
                    definition_name(state->definition), *failure)));
  }

  bound->health_check = bound->caps.check_health
                            ? bound->caps.check_health
                            : std::function<exec::task<void>()>(noop_health_check);
  state->publish(std::move(bound));
  log::info("Finished initializing replica.");
  co_return Expected<void>{};
}

auto UserCallableHost::call_reconfigure(Json user_config)
    -> exec::task<Expected<void>> {
  auto state = state_;
  auto guard = co_await state->lock.lock();
  if (user_config.is_null()) {
    co_return Expected<void>{};
  }
  if (state->is_function) {
    co_return tl::unexpected(make_error(
        ErrorCode::ConfigError,
        "deployment definition must be a class to use user_config"));
  }
  auto bound = state->snapshot();
  if (!bound) {
    co_return tl::unexpected(not_initialized());
  }
  if (!bound->caps.reconfigure) {
    co_return tl::unexpected(make_error(
        ErrorCode::ConfigError,
        std::format("user_config specified but deployment {} is missing a "
                    "reconfigure method",
                    state->deployment_id.to_string())));
  }

  std::optional<ReplicaError> failure;
  try {
    co_await bound->caps.reconfigure(std::move(user_config));
  } catch (const std::exception &e) {
    failure = user_error("reconfigure", e.what());
  } catch (...) {
    failure = user_error("reconfigure", "unknown exception");
  }
  if (failure) {
    co_return tl::unexpected(*failure);
  }
  co_return Expected<void>{};
}

auto UserCallableHost::dispatch_unary(RequestMetadata metadata,
                                      RequestArgs args,
                                      std::shared_ptr<RequestContext> context)
    -> exec::task<Expected<CallResult>> {
  auto state = state_;
  if (!context) {
    context = std::make_shared<RequestContext>();
  }
  auto guard = co_await state->lock.lock_shared();
  auto bound = state->snapshot();
  if (!bound) {
    co_return tl::unexpected(not_initialized());
  }
  log::debug("Started executing request {}", metadata.request_id);

  auto grpc_context = metadata.grpc_context
                          ? metadata.grpc_context
                          : std::make_shared<GrpcContext>();
  std::optional<ReplicaError> failure;
  Json result;
  auto method = resolve(*bound, metadata.call_method);
  if (!method) {
    failure = method.error();
  } else if (method->is_generator()) {
    failure = make_error(
        ErrorCode::UsageError,
        std::format("Method '{}' is a generator. Generators must be called "
                    "through the streaming path.",
                    metadata.call_method));
  } else {
    auto call_args = prepare_args(*bound, *method, metadata, args, grpc_context,
                                  context, *state->serializer);
    if (!call_args) {
      failure = call_args.error();
    } else {
      try {
        result = co_await invoke_unary(*method, std::move(*call_args));
      } catch (const std::exception &e) {
        failure = user_error(metadata.call_method, e.what());
      } catch (...) {
        failure = user_error(metadata.call_method, "unknown exception");
      }
    }
  }

  if (failure) {
    if (metadata.is_http && args.http && args.http->send &&
        !is_cancellation(*failure) && !context->is_cancelled()) {
      auto sent = co_await send_guarded(http::send_text(
          500, std::format("Unexpected error: {}.", failure->message),
          args.http->send));
      if (!sent) {
        log::warn("{}", sent.error().message);
      }
    }
    co_return tl::unexpected(*failure);
  }

  if (metadata.is_http && !bound->caps.http_app) {
    auto sent = co_await send_guarded(http::send_result(result, args.http->send));
    if (!sent) {
      co_return tl::unexpected(sent.error());
    }
  } else if (metadata.is_grpc) {
    auto bytes = state->serializer->serialize(result);
    if (!bytes) {
      co_return tl::unexpected(bytes.error());
    }
    co_return CallResult{GrpcReply{grpc_context, std::move(*bytes)}};
  }
  co_return json_result(std::move(result));
}

auto UserCallableHost::dispatch_streaming(RequestMetadata metadata,
                                          RequestArgs args,
                                          std::shared_ptr<RequestContext> context)
    -> exec::task<Expected<ResultStream>> {
  auto state = state_;
  if (!context) {
    context = std::make_shared<RequestContext>();
  }
  if (metadata.is_http) {
    co_return tl::unexpected(make_error(
        ErrorCode::UsageError,
        "HTTP requests are streamed through the response bridge"));
  }
  auto guard = co_await state->lock.lock_shared();
  auto bound = state->snapshot();
  if (!bound) {
    co_return tl::unexpected(not_initialized());
  }
  log::debug("Started executing request {}", metadata.request_id);

  auto method = resolve(*bound, metadata.call_method);
  if (!method) {
    co_return tl::unexpected(method.error());
  }
  if (!method->is_generator()) {
    co_return tl::unexpected(make_error(
        ErrorCode::UsageError,
        std::format("When streaming, the called method must be a generator, "
                    "but '{}' is not.",
                    metadata.call_method)));
  }

  auto hold = std::make_shared<StreamHold>();
  hold->state = state;
  hold->bound = bound;
  hold->method_name = metadata.call_method;
  hold->is_grpc = metadata.is_grpc;
  hold->grpc_context = metadata.grpc_context ? metadata.grpc_context
                                             : std::make_shared<GrpcContext>();

  auto call_args = prepare_args(*bound, *method, metadata, args,
                                hold->grpc_context, context, *state->serializer);
  if (!call_args) {
    co_return tl::unexpected(call_args.error());
  }

  std::optional<ReplicaError> failure;
  try {
    if (const auto *fn = std::get_if<SyncGenerator>(&method->body())) {
      hold->sequence.emplace<SyncSequence>((*fn)(*call_args));
    } else {
      hold->sequence.emplace<AsyncSequence>(
          std::get<AsyncGenerator>(method->body())(std::move(*call_args)));
    }
  } catch (const std::exception &e) {
    failure = user_error(metadata.call_method, e.what());
  } catch (...) {
    failure = user_error(metadata.call_method, "unknown exception");
  }
  if (failure) {
    co_return tl::unexpected(*failure);
  }
  const bool empty = std::visit(
      [](const auto &sequence) { return !static_cast<bool>(sequence); },
      hold->sequence);
  if (empty) {
    co_return tl::unexpected(make_error(
        ErrorCode::UsageError,
        std::format("generator '{}' produced no sequence", metadata.call_method)));
  }

  hold->guard = std::move(guard);
  ResultStream stream([hold]() { return pull(hold); }, std::move(context));
  co_return std::move(stream);
}

auto UserCallableHost::call_health_check() -> exec::task<Expected<void>> {
  auto state = state_;
  auto bound = state->snapshot();
  if (!bound) {
    co_return tl::unexpected(make_error(ErrorCode::HealthCheckFailed,
                                        "replica is not initialized"));
  }
  std::optional<std::string> failure;
  try {
    co_await bound->health_check();
  } catch (const std::exception &e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }
  if (failure) {
    co_return tl::unexpected(make_error(
        ErrorCode::HealthCheckFailed,
        std::format("user health check failed: {}", *failure)));
  }
  co_return Expected<void>{};
}

auto UserCallableHost::call_destructor() -> exec::task<void> {
  auto state = state_;
  auto guard = co_await state->destructor_lock.lock();
  if (state->destructed) {
    co_return;
  }
  state->destructed = true;
  auto bound = state->take();
  if (!bound || !bound->handler) {
    co_return;
  }

  std::optional<std::string> failure;
  try {
    if (bound->caps.teardown) {
      co_await bound->caps.teardown();
    }
    if (bound->caps.multiplex_shutdown) {
      co_await bound->caps.multiplex_shutdown();
    }
  } catch (const std::exception &e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }
  if (failure) {
    log::error("Exception during graceful shutdown of replica: {}", *failure);
  }
}

auto UserCallableHost::initialized() const -> bool {
  return state_->snapshot() != nullptr;
}

auto UserCallableHost::is_function() const -> bool { return state_->is_function; }

auto UserCallableHost::deployment_id() const -> const DeploymentId & {
  return state_->deployment_id;
}

auto UserCallableHost::method_names() const -> std::vector<std::string> {
  auto bound = state_->snapshot();
  if (!bound) {
    return {};
  }
  return public_method_names(bound->caps.methods);
}

}  // namespace rp::engine
