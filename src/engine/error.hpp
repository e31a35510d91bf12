#pragma once

#include <string>
#include <string_view>
#include <utility>

#include <tl/expected.hpp>

namespace rp::engine {

/// Failure classes reported by the replica engine.
enum class ErrorCode {
  InvalidDefinition,
  InitializationError,
  ConfigError,
  MethodNotFound,
  UsageError,
  HealthCheckFailed,
  UserException,
  Cancelled,
  Serialization,
  Internal,
};

struct ReplicaError {
  ErrorCode code = ErrorCode::Internal;
  std::string message;
};

template <typename T>
using Expected = tl::expected<T, ReplicaError>;

inline auto make_error(ErrorCode code, std::string message) -> ReplicaError {
  return ReplicaError{code, std::move(message)};
}

/// Stable name for an error code (used in logs and wrapped messages).
auto to_string(ErrorCode code) -> std::string_view;

/// Cancellation is reported as a status rather than an error.
inline auto is_cancellation(const ReplicaError &error) -> bool {
  return error.code == ErrorCode::Cancelled;
}

}  // namespace rp::engine
