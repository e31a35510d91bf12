#include "runtime/coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <format>
#include <mutex>
#include <utility>

#include <exec/async_scope.hpp>
#include <exec/static_thread_pool.hpp>
#include <exec/timed_thread_scheduler.hpp>
#include <gflags/gflags.h>
#include <stdexec/execution.hpp>

#include <unistd.h>

#include "common/logging/log.hpp"
#include "runtime/http_bridge.hpp"
#include "runtime/rw_lock.hpp"
#include "runtime/user_callable.hpp"

DECLARE_int32(replica_request_threads);
DECLARE_int32(metrics_gauge_period_ms);
DECLARE_int32(autoscaling_record_period_ms);

namespace rp::engine {
namespace {

auto local_hostname() -> std::string {
  char buffer[256] = {};
  if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

auto status_of(const std::optional<ReplicaError> &error) -> std::string_view {
  if (!error) {
    return "OK";
  }
  return is_cancellation(*error) ? "CANCELLED" : "ERROR";
}

auto wrap_initialization(const ReplicaError &error) -> ReplicaError {
  if (error.code == ErrorCode::InitializationError) {
    return error;
  }
  return make_error(ErrorCode::InitializationError,
                    std::format("{}: {}", to_string(error.code), error.message));
}

} // namespace

struct RequestCoordinator::State {
  State(CoordinatorOptions opts, ReplicaName name,
        std::unique_ptr<UserCallableHost> callable, std::uint32_t threads)
      : options(std::move(opts)), replica_name(std::move(name)),
        host(std::move(callable)),
        request_pool(std::make_unique<exec::static_thread_pool>(threads)),
        timer_context(std::make_unique<exec::timed_thread_context>()),
        timer(timer_context->get_scheduler()),
        config(options.config),
        version(options.code_version, options.config) {
    bridge = std::make_unique<StreamingResponseBridge>(*host, scope, *request_pool);
  }

  ~State() {
    stdexec::sync_wait(scope.on_empty());
    if (metrics) {
      metrics->shutdown();
    }
  }

  struct RequestCounters {
    std::atomic<std::uint64_t> pending{0};
    std::atomic<std::uint64_t> running{0};
  };

  /// Counts a request as running for as long as it is alive.
  class RunningPermit {
  public:
    explicit RunningPermit(std::shared_ptr<RequestCounters> counters)
        : counters_(std::move(counters)) {
      counters_->running.fetch_add(1, std::memory_order_relaxed);
    }
    RunningPermit(const RunningPermit &) = delete;
    RunningPermit &operator=(const RunningPermit &) = delete;
    ~RunningPermit() { counters_->running.fetch_sub(1, std::memory_order_relaxed); }

  private:
    std::shared_ptr<RequestCounters> counters_;
  };

  /// Books one request from acceptance to completion.
  ///
  /// Pending until begin(), then running while any copy of its permit is
  /// alive. Reported exactly once: by finish(), or as cancelled when the
  /// envelope is destroyed unfinished, which happens when the call
  /// completes stopped.
  class RequestEnvelope {
  public:
    RequestEnvelope(const std::shared_ptr<State> &state, RequestMetadata metadata)
        : state_(state), counters_(state->counters), metadata_(std::move(metadata)),
          start_(std::chrono::steady_clock::now()) {
      counters_->pending.fetch_add(1, std::memory_order_relaxed);
    }
    RequestEnvelope(const RequestEnvelope &) = delete;
    RequestEnvelope &operator=(const RequestEnvelope &) = delete;

    ~RequestEnvelope() {
      if (!begun_) {
        counters_->pending.fetch_sub(1, std::memory_order_relaxed);
      }
      finish(make_error(ErrorCode::Cancelled, "request stopped before completion"));
    }

    /// Leave the queue; the returned permit keeps the request running.
    auto begin() -> std::shared_ptr<RunningPermit> {
      counters_->pending.fetch_sub(1, std::memory_order_relaxed);
      begun_ = true;
      permit_ = std::make_shared<RunningPermit>(counters_);
      start_ = std::chrono::steady_clock::now();
      return permit_;
    }

    auto finish(const std::optional<ReplicaError> &error) -> void {
      if (finished_.exchange(true, std::memory_order_acq_rel)) {
        return;
      }
      if (auto state = state_.lock()) {
        state->finish_request(metadata_, start_, error);
      }
      permit_.reset();
    }

    auto metadata() const -> const RequestMetadata & { return metadata_; }

  private:
    std::weak_ptr<State> state_;
    std::shared_ptr<RequestCounters> counters_;
    RequestMetadata metadata_;
    std::chrono::steady_clock::time_point start_;
    std::shared_ptr<RunningPermit> permit_;
    bool begun_ = false;
    std::atomic<bool> finished_{false};
  };

  auto depth() const -> QueueDepth {
    return QueueDepth{counters->pending.load(std::memory_order_relaxed),
                      counters->running.load(std::memory_order_relaxed)};
  }

  auto make_context(const RequestMetadata &metadata) const
      -> std::shared_ptr<RequestContext> {
    auto context = std::make_shared<RequestContext>();
    context->route = metadata.route;
    context->request_id = metadata.request_id;
    context->app_name = options.deployment_id.app;
    context->multiplexed_model_id = metadata.multiplexed_model_id.value_or("");
    context->grpc_context = metadata.grpc_context;
    return context;
  }

  auto finish_request(const RequestMetadata &metadata,
                      std::chrono::steady_clock::time_point start,
                      const std::optional<ReplicaError> &error) -> void {
    const double latency_ms = std::chrono::duration<double, std::milli>(
                                  std::chrono::steady_clock::now() - start)
                                  .count();
    const auto status = status_of(error);
    if (error && !is_cancellation(*error)) {
      log::error("Request failed:\n{}", error->message);
    }
    log::access(metadata.call_method, status, latency_ms);
    metrics->record_request(metadata.route, status, latency_ms, error.has_value());
  }

  auto current_config() const -> DeploymentConfig {
    std::lock_guard<std::mutex> lock(mutex);
    return config;
  }

  auto current_metadata() const -> ReplicaMetadata {
    std::lock_guard<std::mutex> lock(mutex);
    return ReplicaMetadata{version.deployment_config(), version};
  }

  auto configure_logging(const LoggingConfig &logging) -> void {
    log::ComponentOptions component;
    component.level = logging.log_level;
    component.json = logging.encoding == "JSON";
    component.logs_dir = logging.logs_dir.value_or("");
    component.enable_access_log = logging.enable_access_log;
    auto path = log::configure_component("replica", replica_name.component_name(),
                                         replica_name.replica_suffix, component);
    std::lock_guard<std::mutex> lock(mutex);
    log_file_path = std::move(path);
  }

  auto run_unary(std::shared_ptr<RequestEnvelope> envelope, RequestArgs args)
      -> exec::task<Expected<CallResult>> {
    envelope->begin();
    const auto &metadata = envelope->metadata();
    auto result = co_await host->dispatch_unary(metadata, std::move(args),
                                                make_context(metadata));
    envelope->finish(result ? std::nullopt
                            : std::optional<ReplicaError>(result.error()));
    co_return result;
  }

  auto run_streaming(std::shared_ptr<RequestEnvelope> envelope, RequestArgs args)
      -> exec::task<Expected<ResultStream>> {
    // Running until the stream finishes and, for HTTP, the bridged dispatch
    // has returned.
    auto permit = envelope->begin();
    const auto &metadata = envelope->metadata();
    auto context = make_context(metadata);

    Expected<ResultStream> stream = tl::unexpected(
        make_error(ErrorCode::UsageError, "HTTP call is missing its protocol"));
    if (metadata.is_http) {
      if (args.http) {
        stream = bridge->stream(metadata, std::move(args.http->scope),
                                std::move(args.http->receive), context, permit);
      }
    } else {
      stream = co_await host->dispatch_streaming(metadata, std::move(args), context);
    }
    if (!stream) {
      envelope->finish(stream.error());
      co_return tl::unexpected(stream.error());
    }

    stream->on_finish([envelope](const std::optional<ReplicaError> &error) {
      envelope->finish(error);
    });
    co_return std::move(stream);
  }

  auto drain_ongoing_requests() -> exec::task<void> {
    const auto wait_loop = current_config().graceful_shutdown_wait_loop;
    const auto wait_loop_s = std::chrono::duration<double>(wait_loop).count();
    while (true) {
      co_await exec::schedule_after(timer, wait_loop);
      const auto ongoing = metrics->current_queue_depth().total();
      if (ongoing > 0) {
        log::info("Waiting for an additional {}s to shut down because there are "
                  "{} ongoing requests.",
                  wait_loop_s, ongoing);
      } else {
        log::info("Graceful shutdown complete; replica exiting.");
        break;
      }
    }
  }

  CoordinatorOptions options;
  ReplicaName replica_name;
  std::unique_ptr<UserCallableHost> host;
  std::unique_ptr<exec::static_thread_pool> request_pool;
  std::unique_ptr<exec::timed_thread_context> timer_context;
  exec::timed_thread_scheduler timer;
  std::unique_ptr<MetricsRecorder> metrics;
  std::unique_ptr<StreamingResponseBridge> bridge;

  std::shared_ptr<RequestCounters> counters = std::make_shared<RequestCounters>();
  std::atomic<ReplicaState> replica_state{ReplicaState::PendingAllocation};

  AsyncRwLock init_lock;
  bool initialized = false;
  std::atomic<bool> ever_initialized{false};
  AsyncRwLock reconfigure_lock;

  mutable std::mutex mutex;
  DeploymentConfig config;
  DeploymentVersion version;
  std::string log_file_path;

  exec::async_scope scope;
};

RequestCoordinator::RequestCoordinator(std::shared_ptr<State> state)
    : state_(std::move(state)) {}

RequestCoordinator::~RequestCoordinator() = default;

auto RequestCoordinator::create(CoordinatorOptions options)
    -> Expected<std::unique_ptr<RequestCoordinator>> {
  auto name = ReplicaName::from_replica_tag(options.replica_tag);
  if (!name) {
    return tl::unexpected(name.error());
  }
  auto host = UserCallableHost::create(options.definition, options.init_args,
                                       options.deployment_id, options.serializer);
  if (!host) {
    return tl::unexpected(host.error());
  }

  const int threads = options.request_threads > 0 ? options.request_threads
                                                  : FLAGS_replica_request_threads;
  auto state = std::make_shared<State>(std::move(options), std::move(*name),
                                       std::move(*host),
                                       static_cast<std::uint32_t>(std::max(threads, 1)));
  state->configure_logging(state->config.logging_config);

  auto *raw = state.get();
  auto queue_depth = [raw] { return raw->depth(); };
  if (state->options.metrics_factory) {
    state->metrics = state->options.metrics_factory(queue_depth);
  }
  if (!state->metrics) {
    MetricsOptions metrics_options;
    metrics_options.gauge_period =
        std::chrono::milliseconds(FLAGS_metrics_gauge_period_ms);
    metrics_options.autoscaling_record_period =
        std::chrono::milliseconds(FLAGS_autoscaling_record_period_ms);
    state->metrics = std::make_unique<ReplicaMetricsManager>(
        state->options.replica_tag, state->options.deployment_id, queue_depth,
        state->config.autoscaling_config, state->options.autoscaling_sink,
        metrics_options);
  }
  state->metrics->start();

  log::info("Replica {} of deployment {} created (version {}).",
            state->options.replica_tag, state->options.deployment_id.to_string(),
            state->version.to_string());
  return std::unique_ptr<RequestCoordinator>(new RequestCoordinator(std::move(state)));
}

auto RequestCoordinator::handle_unary(RequestMetadata metadata, RequestArgs args)
    -> exec::task<Expected<CallResult>> {
  auto state = state_;
  auto envelope = std::make_shared<State::RequestEnvelope>(state, std::move(metadata));
  auto scheduler = state->request_pool->get_scheduler();
  co_return co_await stdexec::on(scheduler,
                                 state->run_unary(std::move(envelope), std::move(args)));
}

auto RequestCoordinator::handle_streaming(RequestMetadata metadata,
                                          RequestArgs args)
    -> exec::task<Expected<ResultStream>> {
  auto state = state_;
  auto envelope = std::make_shared<State::RequestEnvelope>(state, std::move(metadata));
  auto scheduler = state->request_pool->get_scheduler();
  co_return co_await stdexec::on(
      scheduler, state->run_streaming(std::move(envelope), std::move(args)));
}

auto RequestCoordinator::is_allocated() -> AllocationInfo {
  auto expected = ReplicaState::PendingAllocation;
  state_->replica_state.compare_exchange_strong(expected,
                                                ReplicaState::PendingInitialization);
  AllocationInfo info;
  info.pid = static_cast<int>(::getpid());
  info.replica_tag = state_->options.replica_tag;
  info.hostname = local_hostname();
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    info.log_file_path = state_->log_file_path;
  }
  return info;
}

auto RequestCoordinator::initialize_and_get_metadata(
    std::optional<DeploymentConfig> config) -> exec::task<Expected<ReplicaMetadata>> {
  auto state = state_;
  {
    auto guard = co_await state->init_lock.lock();
    if (!state->initialized) {
      auto initialized = co_await state->host->initialize_callable();
      if (!initialized) {
        co_return tl::unexpected(wrap_initialization(initialized.error()));
      }
      state->initialized = true;
      state->ever_initialized.store(true, std::memory_order_release);
    }
    if (config) {
      auto applied = co_await state->host->call_reconfigure(config->user_config);
      if (!applied) {
        co_return tl::unexpected(wrap_initialization(applied.error()));
      }
    }
  }

  auto healthy = co_await check_health();
  if (!healthy) {
    co_return tl::unexpected(wrap_initialization(healthy.error()));
  }
  auto expected = state->replica_state.load();
  while ((expected == ReplicaState::PendingAllocation ||
          expected == ReplicaState::PendingInitialization) &&
         !state->replica_state.compare_exchange_weak(expected,
                                                     ReplicaState::Healthy)) {
  }
  co_return state->current_metadata();
}

auto RequestCoordinator::reconfigure(DeploymentConfig config)
    -> exec::task<Expected<ReplicaMetadata>> {
  auto state = state_;
  auto guard = co_await state->reconfigure_lock.lock();
  const auto previous_state = state->replica_state.load();
  if (previous_state == ReplicaState::Healthy) {
    state->replica_state.store(ReplicaState::Reconfiguring);
  }

  const auto current = state->current_config();
  const bool user_config_changed = config.user_config != current.user_config;
  const bool logging_config_changed = config.logging_config != current.logging_config;

  if (user_config_changed) {
    auto applied = co_await state->host->call_reconfigure(config.user_config);
    if (!applied) {
      state->replica_state.store(previous_state);
      co_return tl::unexpected(applied.error());
    }
  }

  {
    std::lock_guard<std::mutex> lock(state->mutex);
    state->version = DeploymentVersion::from_deployment_version(state->version, config);
    state->config = config;
  }
  state->metrics->set_autoscaling_config(config.autoscaling_config);
  if (logging_config_changed) {
    state->configure_logging(config.logging_config);
  }
  state->replica_state.store(previous_state);
  co_return state->current_metadata();
}

auto RequestCoordinator::check_health() -> exec::task<Expected<void>> {
  auto state = state_;
  co_return co_await state->host->call_health_check();
}

auto RequestCoordinator::drain_and_terminate() -> exec::task<void> {
  auto state = state_;
  if (state->replica_state.load() == ReplicaState::Terminated) {
    co_return;
  }
  state->replica_state.store(ReplicaState::Draining);
  // A replica that never served traffic has nothing to drain.
  if (state->ever_initialized.load(std::memory_order_acquire)) {
    co_await state->drain_ongoing_requests();
    co_await state->host->call_destructor();
  }
  state->metrics->shutdown();
  state->replica_state.store(ReplicaState::Terminated);
}

auto RequestCoordinator::queue_depth() const -> QueueDepth { return state_->depth(); }

auto RequestCoordinator::state() const -> ReplicaState {
  return state_->replica_state.load();
}

auto RequestCoordinator::metadata() const -> ReplicaMetadata {
  return state_->current_metadata();
}

auto RequestCoordinator::replica_context() const -> ReplicaContext {
  ReplicaContext context;
  context.app_name = state_->options.deployment_id.app;
  context.deployment = state_->options.deployment_id.name;
  context.replica_tag = state_->options.replica_tag;
  context.initialized = state_->ever_initialized.load(std::memory_order_acquire);
  return context;
}

}  // namespace rp::engine
