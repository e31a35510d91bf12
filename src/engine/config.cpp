#include "engine/config.hpp"

#include <array>
#include <format>
#include <string>
#include <vector>

namespace rp::engine {
namespace {

constexpr std::array<std::string_view, 9> kDeploymentKeys = {
    "num_replicas",
    "max_concurrent_queries",
    "user_config",
    "graceful_shutdown_wait_loop_s",
    "graceful_shutdown_timeout_s",
    "health_check_period_s",
    "health_check_timeout_s",
    "autoscaling_config",
    "logging_config",
};

auto to_seconds(std::chrono::milliseconds value) -> double {
  return std::chrono::duration<double>(value).count();
}

auto read_seconds(const Json &object, std::string_view key,
                  std::chrono::milliseconds &out) -> Expected<void> {
  auto it = object.find(std::string(key));
  if (it == object.end()) {
    return {};
  }
  if (!it->is_number()) {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError, std::format("'{}' must be a number", key)));
  }
  const double seconds = it->get<double>();
  if (seconds < 0) {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError, std::format("'{}' must be >= 0", key)));
  }
  out = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::duration<double>(seconds));
  return {};
}

auto read_int(const Json &object, std::string_view key, int min_value,
              int &out) -> Expected<void> {
  auto it = object.find(std::string(key));
  if (it == object.end()) {
    return {};
  }
  if (!it->is_number_integer()) {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError, std::format("'{}' must be an integer", key)));
  }
  const auto value = it->get<int>();
  if (value < min_value) {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError,
        std::format("'{}' must be >= {}", key, min_value)));
  }
  out = value;
  return {};
}

auto parse_logging(const Json &json) -> Expected<LoggingConfig> {
  LoggingConfig config;
  if (json.is_null()) {
    return config;
  }
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::ConfigError,
                                     "'logging_config' must be an object"));
  }
  for (const auto &[key, value] : json.items()) {
    if (key == "log_level" && value.is_string()) {
      config.log_level = value.get<std::string>();
    } else if (key == "encoding" && value.is_string()) {
      config.encoding = value.get<std::string>();
      if (config.encoding != "TEXT" && config.encoding != "JSON") {
        return tl::unexpected(make_error(
            ErrorCode::ConfigError,
            std::format("unsupported log encoding '{}'", config.encoding)));
      }
    } else if (key == "logs_dir" && (value.is_string() || value.is_null())) {
      if (value.is_string()) {
        config.logs_dir = value.get<std::string>();
      }
    } else if (key == "enable_access_log" && value.is_boolean()) {
      config.enable_access_log = value.get<bool>();
    } else {
      return tl::unexpected(make_error(
          ErrorCode::ConfigError,
          std::format("invalid logging_config field '{}'", key)));
    }
  }
  return config;
}

auto parse_autoscaling(const Json &json) -> Expected<AutoscalingConfig> {
  if (!json.is_object()) {
    return tl::unexpected(make_error(ErrorCode::ConfigError,
                                     "'autoscaling_config' must be an object"));
  }
  AutoscalingConfig config;
  if (auto ok = read_int(json, "min_replicas", 0, config.min_replicas); !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto ok = read_int(json, "max_replicas", 1, config.max_replicas); !ok) {
    return tl::unexpected(ok.error());
  }
  if (config.max_replicas < config.min_replicas) {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError, "max_replicas must be >= min_replicas"));
  }
  if (auto it = json.find("target_num_ongoing_requests_per_replica");
      it != json.end()) {
    if (!it->is_number() || it->get<double>() <= 0) {
      return tl::unexpected(make_error(
          ErrorCode::ConfigError,
          "'target_num_ongoing_requests_per_replica' must be > 0"));
    }
    config.target_num_ongoing_requests_per_replica = it->get<double>();
  }
  if (auto ok = read_seconds(json, "metrics_interval_s", config.metrics_interval);
      !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto ok =
          read_seconds(json, "look_back_period_s", config.look_back_period);
      !ok) {
    return tl::unexpected(ok.error());
  }
  return config;
}

}  // namespace

auto DeploymentId::to_string() const -> std::string {
  if (app.empty()) {
    return name;
  }
  return std::format("{}#{}", app, name);
}

auto ReplicaName::from_replica_tag(std::string_view tag)
    -> Expected<ReplicaName> {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    auto pos = tag.find('#', start);
    parts.push_back(tag.substr(start, pos - start));
    if (pos == std::string_view::npos) {
      break;
    }
    start = pos + 1;
  }
  ReplicaName name;
  if (parts.size() == 3) {
    name.app_name = std::string(parts[0]);
    name.deployment_name = std::string(parts[1]);
    name.replica_suffix = std::string(parts[2]);
  } else if (parts.size() == 2) {
    name.deployment_name = std::string(parts[0]);
    name.replica_suffix = std::string(parts[1]);
  } else {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError,
        std::format("invalid replica tag '{}': expected app#deployment#suffix",
                    tag)));
  }
  if (name.deployment_name.empty() || name.replica_suffix.empty()) {
    return tl::unexpected(make_error(
        ErrorCode::ConfigError, std::format("invalid replica tag '{}'", tag)));
  }
  return name;
}

auto ReplicaName::component_name() const -> std::string {
  if (app_name.empty()) {
    return deployment_name;
  }
  return std::format("{}_{}", app_name, deployment_name);
}

auto DeploymentConfig::from_json(const Json &json) -> Expected<DeploymentConfig> {
  if (!json.is_object()) {
    return tl::unexpected(
        make_error(ErrorCode::ConfigError, "deployment config must be an object"));
  }
  for (const auto &[key, value] : json.items()) {
    bool known = false;
    for (auto candidate : kDeploymentKeys) {
      if (candidate == key) {
        known = true;
        break;
      }
    }
    if (!known) {
      return tl::unexpected(make_error(
          ErrorCode::ConfigError,
          std::format("unknown deployment config field '{}'", key)));
    }
  }

  DeploymentConfig config;
  if (auto ok = read_int(json, "num_replicas", 0, config.num_replicas); !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto ok = read_int(json, "max_concurrent_queries", 1,
                         config.max_concurrent_queries);
      !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto it = json.find("user_config"); it != json.end()) {
    config.user_config = *it;
  }
  if (auto ok = read_seconds(json, "graceful_shutdown_wait_loop_s",
                             config.graceful_shutdown_wait_loop);
      !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto ok = read_seconds(json, "graceful_shutdown_timeout_s",
                             config.graceful_shutdown_timeout);
      !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto ok = read_seconds(json, "health_check_period_s",
                             config.health_check_period);
      !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto ok = read_seconds(json, "health_check_timeout_s",
                             config.health_check_timeout);
      !ok) {
    return tl::unexpected(ok.error());
  }
  if (auto it = json.find("autoscaling_config");
      it != json.end() && !it->is_null()) {
    auto autoscaling = parse_autoscaling(*it);
    if (!autoscaling) {
      return tl::unexpected(autoscaling.error());
    }
    config.autoscaling_config = *autoscaling;
  }
  if (auto it = json.find("logging_config"); it != json.end()) {
    auto logging = parse_logging(*it);
    if (!logging) {
      return tl::unexpected(logging.error());
    }
    config.logging_config = std::move(*logging);
  }
  return config;
}

auto DeploymentConfig::to_json() const -> Json {
  Json json = Json::object();
  json["num_replicas"] = num_replicas;
  json["max_concurrent_queries"] = max_concurrent_queries;
  json["user_config"] = user_config;
  json["graceful_shutdown_wait_loop_s"] = to_seconds(graceful_shutdown_wait_loop);
  json["graceful_shutdown_timeout_s"] = to_seconds(graceful_shutdown_timeout);
  json["health_check_period_s"] = to_seconds(health_check_period);
  json["health_check_timeout_s"] = to_seconds(health_check_timeout);
  if (autoscaling_config) {
    json["autoscaling_config"] = {
        {"min_replicas", autoscaling_config->min_replicas},
        {"max_replicas", autoscaling_config->max_replicas},
        {"target_num_ongoing_requests_per_replica",
         autoscaling_config->target_num_ongoing_requests_per_replica},
        {"metrics_interval_s", to_seconds(autoscaling_config->metrics_interval)},
        {"look_back_period_s", to_seconds(autoscaling_config->look_back_period)},
    };
  } else {
    json["autoscaling_config"] = nullptr;
  }
  Json logging = Json::object();
  logging["log_level"] = logging_config.log_level;
  logging["encoding"] = logging_config.encoding;
  logging["logs_dir"] = logging_config.logs_dir
                            ? Json(*logging_config.logs_dir)
                            : Json(nullptr);
  logging["enable_access_log"] = logging_config.enable_access_log;
  json["logging_config"] = std::move(logging);
  return json;
}

auto DeploymentConfig::reconfigure_json() const -> Json {
  Json json = Json::object();
  json["user_config"] = user_config;
  json["graceful_shutdown_wait_loop_s"] = to_seconds(graceful_shutdown_wait_loop);
  json["graceful_shutdown_timeout_s"] = to_seconds(graceful_shutdown_timeout);
  json["health_check_period_s"] = to_seconds(health_check_period);
  json["health_check_timeout_s"] = to_seconds(health_check_timeout);
  return json;
}

}  // namespace rp::engine
