#include "engine/version.hpp"

#include <array>
#include <cstring>

#include "blake3.h"

namespace rp::engine {

auto fingerprint(std::string_view payload) -> std::uint64_t {
  std::array<std::uint8_t, 8> digest{};
  blake3_hasher hasher;
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, payload.data(), payload.size());
  blake3_hasher_finalize(&hasher, digest.data(), digest.size());
  std::uint64_t value = 0;
  std::memcpy(&value, digest.data(), digest.size());
  return value;
}

DeploymentVersion::DeploymentVersion(std::string code_version,
                                     DeploymentConfig config)
    : code_version_(std::move(code_version)), config_(std::move(config)) {
  compute_hashes();
}

auto DeploymentVersion::from_deployment_version(
    const DeploymentVersion &previous, DeploymentConfig config)
    -> DeploymentVersion {
  return DeploymentVersion(previous.code_version_, std::move(config));
}

auto DeploymentVersion::requires_actor_restart(
    const DeploymentVersion &other) const -> bool {
  return code_version_ != other.code_version_;
}

auto DeploymentVersion::requires_actor_reconfigure(
    const DeploymentVersion &other) const -> bool {
  return reconfigure_hash_ != other.reconfigure_hash_;
}

auto DeploymentVersion::to_string() const -> std::string {
  return std::format("{}:{:016x}", code_version_, hash_);
}

auto DeploymentVersion::compute_hashes() -> void {
  // nlohmann objects are key-sorted, so dump() is canonical.
  reconfigure_hash_ = fingerprint(config_.reconfigure_json().dump());
  Json full = config_.to_json();
  full["code_version"] = code_version_;
  hash_ = fingerprint(full.dump());
}

}  // namespace rp::engine
