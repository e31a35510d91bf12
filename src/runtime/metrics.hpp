#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "engine/config.hpp"
#include "engine/types.hpp"

namespace rp::engine {

/// Narrow interface the coordinator reports request outcomes through.
class MetricsRecorder {
public:
  virtual ~MetricsRecorder() = default;

  virtual auto record_request(std::string_view route, std::string_view status,
                              double latency_ms, bool is_error) -> void = 0;
  /// Requests accepted but not finished, as seen by the recorder.
  virtual auto current_queue_depth() const -> QueueDepth = 0;
  virtual auto set_autoscaling_config(std::optional<AutoscalingConfig> config)
      -> void = 0;
  /// Start periodic background tasks.
  virtual auto start() -> void = 0;
  /// Stop periodic background tasks. Idempotent.
  virtual auto shutdown() -> void = 0;
};

/// Latency bucket boundaries in milliseconds.
auto default_latency_buckets_ms() -> const std::vector<double> &;

/// Cumulative histogram; bucket i counts observations <= boundaries[i], the
/// last bucket counts everything above the largest boundary.
class LatencyHistogram {
public:
  explicit LatencyHistogram(
      std::vector<double> boundaries = default_latency_buckets_ms());

  auto observe(double value) -> void;

  auto boundaries() const -> const std::vector<double> & { return boundaries_; }
  auto bucket_counts() const -> const std::vector<std::uint64_t> & {
    return counts_;
  }
  auto count() const -> std::uint64_t { return count_; }
  auto sum() const -> double { return sum_; }

private:
  std::vector<double> boundaries_;
  std::vector<std::uint64_t> counts_;
  std::uint64_t count_ = 0;
  double sum_ = 0.0;
};

/// Timestamped samples per key, averaged over a look-back window.
class InMemoryMetricsStore {
public:
  using Clock = std::chrono::steady_clock;

  auto add_metrics_point(const std::map<std::string, double> &data_points,
                         Clock::time_point timestamp) -> void;

  /// Mean of the samples of `key` taken at or after `since`.
  auto window_average(const std::string &key, Clock::time_point since) const
      -> std::optional<double>;

  /// Drop samples older than `before`.
  auto prune(Clock::time_point before) -> void;

private:
  struct Point {
    Clock::time_point timestamp;
    double value = 0.0;
  };

  std::map<std::string, std::vector<Point>> data_;
};

struct RouteStats {
  std::uint64_t requests = 0;
  std::uint64_t errors = 0;
  LatencyHistogram latency_ms;
};

struct MetricsSnapshot {
  std::uint64_t replica_starts = 0;
  std::map<std::string, RouteStats> routes;
  std::uint64_t pending_gauge = 0;
  std::uint64_t processing_gauge = 0;
};

/// What the replica reports to the controller for autoscaling.
struct AutoscalingSample {
  std::string replica_tag;
  /// Mean ongoing requests over the look-back period (nullopt: no samples).
  std::optional<double> window_average;
  std::chrono::system_clock::time_point sent_at;
};

using AutoscalingSink = std::function<void(const AutoscalingSample &)>;

struct MetricsOptions {
  std::chrono::milliseconds gauge_period{std::chrono::seconds(1)};
  std::chrono::milliseconds autoscaling_record_period{500};
};

/// Default in-process recorder of a replica.
///
/// Keeps the per-route request/error counters and latency histograms,
/// refreshes the pending/processing gauges on a fixed period and, when
/// autoscaling is configured, samples ongoing requests into a local store
/// and pushes the window average to `sink` every metrics interval.
class ReplicaMetricsManager final : public MetricsRecorder {
public:
  ReplicaMetricsManager(std::string replica_tag, DeploymentId deployment_id,
                        std::function<QueueDepth()> queue_depth,
                        std::optional<AutoscalingConfig> autoscaling_config,
                        AutoscalingSink sink = {}, MetricsOptions options = {});
  ReplicaMetricsManager(const ReplicaMetricsManager &) = delete;
  ReplicaMetricsManager &operator=(const ReplicaMetricsManager &) = delete;
  ~ReplicaMetricsManager() override;

  auto record_request(std::string_view route, std::string_view status,
                      double latency_ms, bool is_error) -> void override;
  auto current_queue_depth() const -> QueueDepth override;
  auto set_autoscaling_config(std::optional<AutoscalingConfig> config)
      -> void override;
  auto start() -> void override;
  auto shutdown() -> void override;

  auto snapshot() const -> MetricsSnapshot;

private:
  struct State;
  std::unique_ptr<State> state_;
};

}  // namespace rp::engine
