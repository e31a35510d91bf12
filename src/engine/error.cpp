#include "engine/error.hpp"

namespace rp::engine {

auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
  case ErrorCode::InvalidDefinition:
    return "InvalidDefinition";
  case ErrorCode::InitializationError:
    return "InitializationError";
  case ErrorCode::ConfigError:
    return "ConfigError";
  case ErrorCode::MethodNotFound:
    return "MethodNotFound";
  case ErrorCode::UsageError:
    return "UsageError";
  case ErrorCode::HealthCheckFailed:
    return "HealthCheckFailed";
  case ErrorCode::UserException:
    return "UserException";
  case ErrorCode::Cancelled:
    return "Cancelled";
  case ErrorCode::Serialization:
    return "Serialization";
  case ErrorCode::Internal:
    return "Internal";
  }
  return "Unknown";
}

}  // namespace rp::engine
