#include "common/logging/log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <mutex>
#include <system_error>
#include <vector>

#include <gflags/gflags.h>
#include <nlohmann/json.hpp>
#include <spdlog/pattern_formatter.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_int32(log_queue_size);
DECLARE_int32(log_flush_interval_ms);
DECLARE_string(replica_logs_dir);

namespace {

std::shared_ptr<spdlog::sinks::sink> create_file_sink(const std::string& file_path,
                                                      size_t max_size,
                                                      int max_files) {
  if (max_files < 1) {
    max_files = 1;
  }
  if (max_size < 1024) {
    max_size = 1024;
  }
  return std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file_path, max_size, max_files);
}

auto parse_log_level(const std::string& level) -> spdlog::level::level_enum {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return spdlog::level::info;
}

auto json_string(std::string_view text) -> std::string {
  return nlohmann::json(std::string(text))
      .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

/// `%*`: the message payload as a quoted, escaped JSON string.
class JsonPayloadFlag final : public spdlog::custom_flag_formatter {
public:
  void format(const spdlog::details::log_msg& msg, const std::tm&,
              spdlog::memory_buf_t& dest) override {
    const auto escaped = json_string(std::string_view(msg.payload.data(), msg.payload.size()));
    dest.append(escaped.data(), escaped.data() + escaped.size());
  }

  std::unique_ptr<custom_flag_formatter> clone() const override {
    return std::make_unique<JsonPayloadFlag>();
  }
};

auto component_formatter(std::string_view name, std::string_view id, bool json)
    -> std::unique_ptr<spdlog::formatter> {
  auto formatter = std::make_unique<spdlog::pattern_formatter>();
  if (json) {
    formatter->add_flag<JsonPayloadFlag>('*').set_pattern(std::format(
        R"({{"asctime":"%Y-%m-%d %H:%M:%S.%e","levelname":"%l","component_name":{},"component_id":{},"message":%*}})",
        json_string(name), json_string(id)));
  } else {
    formatter->set_pattern(std::format("[%Y-%m-%d %H:%M:%S.%e] [%l] [{} {}] %v", name, id));
  }
  return formatter;
}

/// Shared by every logger this process builds; created once.
void ensure_thread_pool() {
  if (spdlog::thread_pool()) {
    return;
  }
  spdlog::init_thread_pool(static_cast<size_t>(std::max(FLAGS_log_queue_size, 128)), 1);
  if (FLAGS_log_flush_interval_ms > 0) {
    spdlog::flush_every(std::chrono::milliseconds(FLAGS_log_flush_interval_ms));
  }
}

}  // namespace

namespace rp::log {

namespace {
  std::mutex g_mutex;
  std::shared_ptr<spdlog::async_logger> g_logger;
  bool g_initialized = false;
  std::atomic<bool> g_access_enabled{true};
}

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_initialized) {
    return;
  }

  const std::string log_file = FLAGS_log_file;
  const size_t max_size = static_cast<size_t>(FLAGS_log_max_size);
  const int max_files = FLAGS_log_max_files;

  ensure_thread_pool();

  std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;

  auto file_sink = create_file_sink(log_file, max_size, max_files);
  sinks.push_back(file_sink);

  const auto level = parse_log_level(FLAGS_log_level);
  file_sink->set_level(level);

  g_logger = std::make_shared<spdlog::async_logger>(
      "rp_engine", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(g_logger);
  spdlog::set_level(level);
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

  g_initialized = true;
  spdlog::info("Logger initialized: file={}, level={}", log_file, FLAGS_log_level);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
    g_initialized = false;
  }
}

std::string configure_component(std::string_view component_type,
                                std::string_view component_name,
                                std::string_view component_id,
                                const ComponentOptions& options) {
  std::lock_guard<std::mutex> lock(g_mutex);
  ensure_thread_pool();

  const std::filesystem::path dir =
      options.logs_dir.empty() ? FLAGS_replica_logs_dir : options.logs_dir;
  const auto path = dir / std::format("{}_{}_{}.log", component_type,
                                      component_name, component_id);
  const auto level = parse_log_level(options.level);

  std::shared_ptr<spdlog::sinks::sink> sink;
  std::string file_path;
  std::string open_error;
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  try {
    sink = create_file_sink(path.string(), static_cast<size_t>(FLAGS_log_max_size),
                            FLAGS_log_max_files);
    file_path = path.string();
  } catch (const spdlog::spdlog_ex& e) {
    open_error = e.what();
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  }
  sink->set_level(level);
  sink->set_formatter(component_formatter(component_name, component_id, options.json));

  if (g_logger) {
    g_logger->flush();
  }
  g_logger = std::make_shared<spdlog::async_logger>(
      std::format("{}_{}", component_type, component_id), sink,
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  g_logger->set_level(level);
  spdlog::set_default_logger(g_logger);
  g_initialized = true;
  g_access_enabled.store(options.enable_access_log, std::memory_order_relaxed);

  if (file_path.empty()) {
    spdlog::warn("Could not open log file {} ({}), logging to stderr",
                 path.string(), open_error);
  }
  return file_path;
}

void access(std::string_view method, std::string_view status, double latency_ms) {
  if (!g_access_enabled.load(std::memory_order_relaxed)) {
    return;
  }
  spdlog::info("{} {} {:.1f}ms", method, status, latency_ms);
}

}  // namespace rp::log
