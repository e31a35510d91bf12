#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>
#include <string_view>

namespace rp::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Sink settings for one serving component (a replica).
struct ComponentOptions {
  std::string level = "info";
  /// One JSON object per line instead of plain text.
  bool json = false;
  /// Directory for the component log file; empty means --replica_logs_dir.
  std::string logs_dir;
  bool enable_access_log = true;
};

void init();

void shutdown();

/// Rebuild the default logger for a component and return its log file path.
/// The file is named "<type>_<name>_<id>.log". Empty if the file could not
/// be opened and logging fell back to stderr.
std::string configure_component(std::string_view component_type,
                                std::string_view component_name,
                                std::string_view component_id,
                                const ComponentOptions& options);

/// Access-log record for one finished request; no-op when disabled.
void access(std::string_view method, std::string_view status, double latency_ms);

}  // namespace rp::log
