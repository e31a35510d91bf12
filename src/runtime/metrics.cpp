#include "runtime/metrics.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <utility>

#include <exec/async_scope.hpp>
#include <exec/timed_thread_scheduler.hpp>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"

namespace rp::engine {

auto default_latency_buckets_ms() -> const std::vector<double> & {
  static const std::vector<double> buckets = {
      1,    2,    5,    10,    20,    50,     100,    200,    300,   400,
      500,  1000, 2000, 5000,  10000, 60000,  120000, 300000, 600000,
  };
  return buckets;
}

LatencyHistogram::LatencyHistogram(std::vector<double> boundaries)
    : boundaries_(std::move(boundaries)), counts_(boundaries_.size() + 1, 0) {
  std::sort(boundaries_.begin(), boundaries_.end());
}

auto LatencyHistogram::observe(double value) -> void {
  auto it = std::lower_bound(boundaries_.begin(), boundaries_.end(), value);
  counts_[static_cast<std::size_t>(it - boundaries_.begin())] += 1;
  count_ += 1;
  sum_ += value;
}

auto InMemoryMetricsStore::add_metrics_point(
    const std::map<std::string, double> &data_points, Clock::time_point timestamp)
    -> void {
  for (const auto &[key, value] : data_points) {
    data_[key].push_back(Point{timestamp, value});
  }
}

auto InMemoryMetricsStore::window_average(const std::string &key,
                                          Clock::time_point since) const
    -> std::optional<double> {
  auto it = data_.find(key);
  if (it == data_.end()) {
    return std::nullopt;
  }
  double total = 0.0;
  std::size_t samples = 0;
  for (const auto &point : it->second) {
    if (point.timestamp >= since) {
      total += point.value;
      samples += 1;
    }
  }
  if (samples == 0) {
    return std::nullopt;
  }
  return total / static_cast<double>(samples);
}

auto InMemoryMetricsStore::prune(Clock::time_point before) -> void {
  for (auto &[key, points] : data_) {
    std::erase_if(points,
                  [before](const Point &point) { return point.timestamp < before; });
  }
}

struct ReplicaMetricsManager::State {
  State(std::string tag, DeploymentId id, std::function<QueueDepth()> depth,
        std::optional<AutoscalingConfig> config, AutoscalingSink autoscaling_sink,
        MetricsOptions opts)
      : replica_tag(std::move(tag)), deployment_id(std::move(id)),
        queue_depth(std::move(depth)), sink(std::move(autoscaling_sink)),
        options(opts), autoscaling(std::move(config)),
        timer_context(std::make_unique<exec::timed_thread_context>()),
        scheduler(timer_context->get_scheduler()) {
    metrics.replica_starts = 1;
  }

  auto depth() const -> QueueDepth { return queue_depth ? queue_depth() : QueueDepth{}; }

  /// Run `tick` every `period` until it returns false or shutdown.
  auto schedule_periodic(std::chrono::milliseconds period,
                         std::function<bool()> tick) -> void {
    if (!running.load(std::memory_order_acquire)) {
      return;
    }
    period = std::max(period, std::chrono::milliseconds(1));
    auto sender = exec::schedule_after(scheduler, period) |
                  stdexec::then([this, period, tick = std::move(tick)]() mutable {
                    if (running.load(std::memory_order_acquire) && tick()) {
                      schedule_periodic(period, std::move(tick));
                    }
                  });
    scope.spawn(std::move(sender));
  }

  auto set_gauges() -> bool {
    const auto current = depth();
    std::lock_guard<std::mutex> lock(mutex);
    metrics.pending_gauge = current.pending;
    metrics.processing_gauge = current.running;
    return true;
  }

  auto record_autoscaling_point(std::uint64_t generation) -> bool {
    const auto current = depth();
    const auto now = InMemoryMetricsStore::Clock::now();
    std::lock_guard<std::mutex> lock(mutex);
    if (generation != autoscaling_generation || !autoscaling) {
      return false;
    }
    store.add_metrics_point(
        {{replica_tag, static_cast<double>(current.total())}}, now);
    store.prune(now - autoscaling->look_back_period);
    return true;
  }

  auto push_autoscaling_metrics(std::uint64_t generation) -> bool {
    AutoscalingSample sample;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (generation != autoscaling_generation || !autoscaling) {
        return false;
      }
      sample.replica_tag = replica_tag;
      sample.window_average = store.window_average(
          replica_tag,
          InMemoryMetricsStore::Clock::now() - autoscaling->look_back_period);
    }
    sample.sent_at = std::chrono::system_clock::now();
    if (sink) {
      sink(sample);
    }
    return true;
  }

  auto start_autoscaling(std::uint64_t generation, const AutoscalingConfig &config)
      -> void {
    schedule_periodic(
        std::min(options.autoscaling_record_period, config.metrics_interval),
        [this, generation] { return record_autoscaling_point(generation); });
    schedule_periodic(config.metrics_interval, [this, generation] {
      return push_autoscaling_metrics(generation);
    });
  }

  std::string replica_tag;
  DeploymentId deployment_id;
  std::function<QueueDepth()> queue_depth;
  AutoscalingSink sink;
  MetricsOptions options;

  mutable std::mutex mutex;
  MetricsSnapshot metrics;
  std::optional<AutoscalingConfig> autoscaling;
  std::uint64_t autoscaling_generation = 0;
  InMemoryMetricsStore store;

  std::atomic<bool> running{false};
  bool started = false;
  std::unique_ptr<exec::timed_thread_context> timer_context;
  exec::timed_thread_scheduler scheduler;
  exec::async_scope scope;
};

ReplicaMetricsManager::ReplicaMetricsManager(
    std::string replica_tag, DeploymentId deployment_id,
    std::function<QueueDepth()> queue_depth,
    std::optional<AutoscalingConfig> autoscaling_config, AutoscalingSink sink,
    MetricsOptions options)
    : state_(std::make_unique<State>(std::move(replica_tag),
                                     std::move(deployment_id),
                                     std::move(queue_depth),
                                     std::move(autoscaling_config),
                                     std::move(sink), options)) {}

ReplicaMetricsManager::~ReplicaMetricsManager() { shutdown(); }

auto ReplicaMetricsManager::record_request(std::string_view route,
                                           std::string_view status,
                                           double latency_ms, bool is_error)
    -> void {
  std::lock_guard<std::mutex> lock(state_->mutex);
  auto &stats = state_->metrics.routes[std::string(route)];
  stats.latency_ms.observe(latency_ms);
  if (is_error) {
    stats.errors += 1;
  } else {
    stats.requests += 1;
  }
  log::trace("request metrics route={} status={} latency_ms={:.3f}", route,
             status, latency_ms);
}

auto ReplicaMetricsManager::current_queue_depth() const -> QueueDepth {
  return state_->depth();
}

auto ReplicaMetricsManager::set_autoscaling_config(
    std::optional<AutoscalingConfig> config) -> void {
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->autoscaling == config) {
      return;
    }
    state_->autoscaling = config;
    generation = ++state_->autoscaling_generation;
  }
  if (config && state_->running.load(std::memory_order_acquire)) {
    state_->start_autoscaling(generation, *config);
  }
}

auto ReplicaMetricsManager::start() -> void {
  std::optional<AutoscalingConfig> config;
  std::uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->started) {
      return;
    }
    state_->started = true;
    config = state_->autoscaling;
    generation = state_->autoscaling_generation;
  }
  state_->running.store(true, std::memory_order_release);
  state_->schedule_periodic(state_->options.gauge_period,
                            [state = state_.get()] { return state->set_gauges(); });
  if (config) {
    state_->start_autoscaling(generation, *config);
  }
}

auto ReplicaMetricsManager::shutdown() -> void {
  if (!state_->running.exchange(false, std::memory_order_acq_rel)) {
    return;
  }
  state_->scope.request_stop();
  stdexec::sync_wait(state_->scope.on_empty());
}

auto ReplicaMetricsManager::snapshot() const -> MetricsSnapshot {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->metrics;
}

}  // namespace rp::engine
