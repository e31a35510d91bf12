#include "engine/types.hpp"

namespace rp::engine {

auto to_string(ReplicaState state) -> std::string_view {
  switch (state) {
  case ReplicaState::PendingAllocation:
    return "PENDING_ALLOCATION";
  case ReplicaState::PendingInitialization:
    return "PENDING_INITIALIZATION";
  case ReplicaState::Healthy:
    return "HEALTHY";
  case ReplicaState::Reconfiguring:
    return "RECONFIGURING";
  case ReplicaState::Draining:
    return "DRAINING";
  case ReplicaState::Terminated:
    return "TERMINATED";
  }
  return "UNKNOWN";
}

}  // namespace rp::engine
