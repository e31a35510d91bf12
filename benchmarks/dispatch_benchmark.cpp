#include <benchmark/benchmark.h>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <exec/task.hpp>
#include <stdexec/execution.hpp>

#include "engine/http.hpp"
#include "runtime/coordinator.hpp"

namespace {

using rp::engine::CallArgs;
using rp::engine::Capabilities;
using rp::engine::Json;
using rp::engine::Method;

class EchoHandler : public rp::engine::Handler {
public:
  auto capabilities() -> Capabilities override {
    Capabilities caps;
    caps.methods["echo"] = Method::unary([](const CallArgs &call) { return call.arg(0); });
    caps.methods["range"] = Method::generator([](const CallArgs &call) {
      const int n = call.arg(0).get<int>();
      auto next = std::make_shared<int>(0);
      return rp::engine::SyncSequence([n, next]() -> std::optional<Json> {
        if (*next >= n) {
          return std::nullopt;
        }
        return Json((*next)++);
      });
    });
    return caps;
  }
};

auto make_echo(rp::engine::InitArgs) -> exec::task<std::shared_ptr<rp::engine::Handler>> {
  co_return std::make_shared<EchoHandler>();
}

template <typename T>
auto block_on(exec::task<T> task) -> T {
  auto result = stdexec::sync_wait(std::move(task));
  return std::move(std::get<0>(*result));
}

/// Discards reported requests so only dispatch overhead is measured.
class NullRecorder final : public rp::engine::MetricsRecorder {
public:
  explicit NullRecorder(std::function<rp::engine::QueueDepth()> probe)
      : probe_(std::move(probe)) {}

  auto record_request(std::string_view, std::string_view, double, bool) -> void override {}
  auto current_queue_depth() const -> rp::engine::QueueDepth override { return probe_(); }
  auto set_autoscaling_config(std::optional<rp::engine::AutoscalingConfig>) -> void override {}
  auto start() -> void override {}
  auto shutdown() -> void override {}

private:
  std::function<rp::engine::QueueDepth()> probe_;
};

class DispatchBenchmark : public benchmark::Fixture {
public:
  void SetUp(const benchmark::State &) override {
    std::call_once(init_flag_, [] { initialize_benchmark(); });
    if (!coordinator_) {
      throw std::runtime_error("benchmark not initialized");
    }
  }

  void TearDown(const benchmark::State &) override {}

  static auto initialize_benchmark() -> void {
    rp::engine::CoordinatorOptions options;
    options.deployment_id = rp::engine::DeploymentId{"bench", "echo"};
    options.replica_tag = "bench#echo#b0";
    options.definition = rp::engine::ClassDefinition{"Echo", make_echo};
    options.code_version = "bench";
    options.request_threads = 4;
    options.config.logging_config.log_level = "warn";
    options.config.logging_config.enable_access_log = false;
    options.metrics_factory = [](std::function<rp::engine::QueueDepth()> probe) {
      return std::make_unique<NullRecorder>(std::move(probe));
    };

    auto coordinator = rp::engine::RequestCoordinator::create(std::move(options));
    if (!coordinator) {
      throw std::runtime_error(coordinator.error().message);
    }
    coordinator_ = std::move(*coordinator);
    coordinator_->is_allocated();
    auto metadata = block_on(coordinator_->initialize_and_get_metadata());
    if (!metadata) {
      throw std::runtime_error(metadata.error().message);
    }
  }

  static std::once_flag init_flag_;
  static std::unique_ptr<rp::engine::RequestCoordinator> coordinator_;
};

std::once_flag DispatchBenchmark::init_flag_;
std::unique_ptr<rp::engine::RequestCoordinator> DispatchBenchmark::coordinator_;

BENCHMARK_DEFINE_F(DispatchBenchmark, UnaryEcho)(benchmark::State &state) {
  rp::engine::RequestMetadata metadata;
  metadata.route = "/echo";
  metadata.call_method = "echo";
  rp::engine::RequestArgs args;
  args.args = Json::array({"bench"});

  for (auto _ : state) {
    auto result = block_on(coordinator_->handle_unary(metadata, args));
    if (!result) {
      state.SkipWithError(result.error().message.c_str());
      break;
    }
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_REGISTER_F(DispatchBenchmark, UnaryEcho)->UseRealTime();
BENCHMARK_REGISTER_F(DispatchBenchmark, UnaryEcho)->Threads(4)->UseRealTime();

BENCHMARK_DEFINE_F(DispatchBenchmark, StreamingRange)(benchmark::State &state) {
  rp::engine::RequestMetadata metadata;
  metadata.route = "/range";
  metadata.call_method = "range";
  metadata.is_streaming = true;
  rp::engine::RequestArgs args;
  args.args = Json::array({static_cast<int>(state.range(0))});

  for (auto _ : state) {
    auto stream = block_on(coordinator_->handle_streaming(metadata, args));
    if (!stream) {
      state.SkipWithError(stream.error().message.c_str());
      break;
    }
    std::int64_t items = 0;
    while (true) {
      auto item = block_on(stream->next());
      if (!item || !*item) {
        break;
      }
      ++items;
    }
    benchmark::DoNotOptimize(items);
  }
  state.SetItemsProcessed(state.iterations() * state.range(0));
}

BENCHMARK_REGISTER_F(DispatchBenchmark, StreamingRange)->Arg(16)->Arg(256)->UseRealTime();

void MessageBatchEncode(benchmark::State &state) {
  std::vector<rp::engine::http::Message> messages;
  messages.push_back(rp::engine::http::Message::response_start(
      200, {{"content-type", "application/json"}}));
  for (int i = 0; i < state.range(0); ++i) {
    messages.push_back(
        rp::engine::http::Message::response_body(std::string(256, 'x'), true));
  }
  for (auto _ : state) {
    auto bytes = rp::engine::http::MessageBatchCodec::encode(messages);
    benchmark::DoNotOptimize(bytes);
  }
}

BENCHMARK(MessageBatchEncode)->Arg(1)->Arg(64);

}  // namespace

BENCHMARK_MAIN();
