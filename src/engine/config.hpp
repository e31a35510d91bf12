#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace rp::engine {

/// Identifies a deployment inside an application.
struct DeploymentId {
  std::string app;
  std::string name;

  auto operator==(const DeploymentId &) const -> bool = default;

  /// "app#name", or just "name" for the default (empty) app.
  auto to_string() const -> std::string;
};

/// Parsed form of a replica tag ("app#deployment#suffix").
struct ReplicaName {
  std::string app_name;
  std::string deployment_name;
  std::string replica_suffix;

  static auto from_replica_tag(std::string_view tag) -> Expected<ReplicaName>;

  /// Component name used for per-replica log files.
  auto component_name() const -> std::string;
};

struct LoggingConfig {
  std::string log_level = "info";
  /// "TEXT" or "JSON".
  std::string encoding = "TEXT";
  std::optional<std::string> logs_dir;
  bool enable_access_log = true;

  auto operator==(const LoggingConfig &) const -> bool = default;
};

struct AutoscalingConfig {
  int min_replicas = 1;
  int max_replicas = 1;
  double target_num_ongoing_requests_per_replica = 1.0;
  /// How often the replica pushes its window average to the controller.
  std::chrono::milliseconds metrics_interval{std::chrono::seconds(10)};
  /// Window over which ongoing-request samples are averaged.
  std::chrono::milliseconds look_back_period{std::chrono::seconds(30)};

  auto operator==(const AutoscalingConfig &) const -> bool = default;
};

/// Immutable deployment configuration; replaced wholesale on reconfigure.
struct DeploymentConfig {
  int num_replicas = 1;
  int max_concurrent_queries = 100;
  /// User-visible configuration passed to the handler's reconfigure hook
  /// (null means none).
  Json user_config;
  std::chrono::milliseconds graceful_shutdown_wait_loop{std::chrono::seconds(2)};
  std::chrono::milliseconds graceful_shutdown_timeout{std::chrono::seconds(20)};
  std::chrono::milliseconds health_check_period{std::chrono::seconds(10)};
  std::chrono::milliseconds health_check_timeout{std::chrono::seconds(30)};
  std::optional<AutoscalingConfig> autoscaling_config;
  LoggingConfig logging_config;

  auto operator==(const DeploymentConfig &) const -> bool = default;

  /// Parse from JSON (durations in seconds, `*_s` keys). Unknown keys are
  /// rejected.
  static auto from_json(const Json &json) -> Expected<DeploymentConfig>;
  auto to_json() const -> Json;

  /// JSON of the fields a running handler can observe without restart.
  auto reconfigure_json() const -> Json;
};

}  // namespace rp::engine
