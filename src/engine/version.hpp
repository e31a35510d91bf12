#pragma once

#include <cstdint>
#include <format>
#include <functional>
#include <string>
#include <string_view>

#include "engine/config.hpp"

namespace rp::engine {

/// 64-bit content fingerprint (truncated blake3).
auto fingerprint(std::string_view payload) -> std::uint64_t;

/// Version of a deployment as advertised to the controller.
///
/// The code version identifies the handler definition; the config hashes
/// let the controller tell whether a replica needs a restart, a
/// reconfigure, or nothing at all.
class DeploymentVersion {
public:
  DeploymentVersion() = default;
  DeploymentVersion(std::string code_version, DeploymentConfig config);

  /// Derive the version that results from applying `config` to `previous`.
  static auto from_deployment_version(const DeploymentVersion &previous,
                                      DeploymentConfig config)
      -> DeploymentVersion;

  auto code_version() const -> const std::string & { return code_version_; }
  auto deployment_config() const -> const DeploymentConfig & { return config_; }
  auto reconfigure_hash() const -> std::uint64_t { return reconfigure_hash_; }
  auto hash() const -> std::uint64_t { return hash_; }

  auto requires_actor_restart(const DeploymentVersion &other) const -> bool;
  auto requires_actor_reconfigure(const DeploymentVersion &other) const -> bool;

  /// "code_version:hash" in hex.
  auto to_string() const -> std::string;

  auto operator==(const DeploymentVersion &other) const -> bool {
    return code_version_ == other.code_version_ && hash_ == other.hash_;
  }

private:
  auto compute_hashes() -> void;

  std::string code_version_;
  DeploymentConfig config_;
  std::uint64_t reconfigure_hash_ = 0;
  std::uint64_t hash_ = 0;
};

}  // namespace rp::engine

template <>
struct std::hash<rp::engine::DeploymentVersion> {
  auto operator()(const rp::engine::DeploymentVersion &v) const -> std::size_t {
    std::size_t h1 = std::hash<std::string>{}(v.code_version());
    std::size_t h2 = std::hash<std::uint64_t>{}(v.hash());
    return h1 ^ (h2 << 1);
  }
};

template <>
struct std::formatter<rp::engine::DeploymentVersion>
    : std::formatter<std::string> {
  auto format(const rp::engine::DeploymentVersion &v,
              std::format_context &ctx) const {
    return formatter<std::string>::format(v.to_string(), ctx);
  }
};
