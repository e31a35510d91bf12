#include <chrono>
#include <cstdlib>
#include <format>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <exec/task.hpp>
#include <gflags/gflags.h>
#include <stdexec/execution.hpp>

#include "common/logging/log.hpp"
#include "runtime/coordinator.hpp"

DEFINE_string(replica_tag, "demo#greeter#r1", "Replica tag: app#deployment#suffix");
DEFINE_string(deployment_config, "{}", "Deployment config as JSON (durations in seconds)");
DEFINE_string(name, "Alice", "Who to greet");
DEFINE_int32(count, 5, "How many numbers the streaming call yields");

namespace {

using rp::engine::CallArgs;
using rp::engine::Capabilities;
using rp::engine::Json;
using rp::engine::Method;

class Greeter : public rp::engine::Handler {
public:
  auto capabilities() -> Capabilities override {
    Capabilities caps;
    caps.methods["greet"] = Method::unary([this](const CallArgs &call) {
      return Json(greeting_ + " " + call.arg(0).get<std::string>());
    });
    caps.methods["count_up"] = Method::generator([](const CallArgs &call) {
      const int n = call.arg(0).get<int>();
      auto next = std::make_shared<int>(0);
      return rp::engine::SyncSequence([n, next]() -> std::optional<Json> {
        if (*next >= n) {
          return std::nullopt;
        }
        return Json((*next)++);
      });
    });
    caps.reconfigure = [this](Json config) { return apply(this, std::move(config)); };
    return caps;
  }

private:
  static auto apply(Greeter *self, Json config) -> exec::task<void> {
    if (!config.contains("greeting")) {
      throw std::invalid_argument("user_config needs a 'greeting'");
    }
    self->greeting_ = config.at("greeting").get<std::string>();
    co_return;
  }

  std::string greeting_ = "hi";
};

auto make_greeter(rp::engine::InitArgs) -> exec::task<std::shared_ptr<rp::engine::Handler>> {
  co_return std::make_shared<Greeter>();
}

template <typename T>
auto block_on(exec::task<T> task) -> T {
  auto result = stdexec::sync_wait(std::move(task));
  return std::move(std::get<0>(*result));
}

auto request(std::string method, Json args) -> std::pair<rp::engine::RequestMetadata,
                                                          rp::engine::RequestArgs> {
  rp::engine::RequestMetadata metadata;
  metadata.request_id = std::format("demo-{}", method);
  metadata.route = "/" + method;
  metadata.call_method = std::move(method);
  rp::engine::RequestArgs call;
  call.args = std::move(args);
  return {metadata, call};
}

}  // namespace

int main(int argc, char **argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  rp::log::init();

  Json config_json;
  try {
    config_json = Json::parse(FLAGS_deployment_config);
  } catch (const std::exception &ex) {
    std::cerr << "Failed to parse deployment config: " << ex.what() << "\n";
    return 1;
  }
  auto config = rp::engine::DeploymentConfig::from_json(config_json);
  if (!config) {
    std::cerr << "Invalid deployment config: " << config.error().message << "\n";
    return 1;
  }

  rp::engine::CoordinatorOptions options;
  options.deployment_id = rp::engine::DeploymentId{"demo", "greeter"};
  options.replica_tag = FLAGS_replica_tag;
  options.definition = rp::engine::ClassDefinition{"Greeter", make_greeter};
  options.config = *config;
  options.code_version = "demo-1";

  auto coordinator = rp::engine::RequestCoordinator::create(std::move(options));
  if (!coordinator) {
    std::cerr << "Failed to create replica: " << coordinator.error().message << "\n";
    return 1;
  }
  auto &replica = **coordinator;

  auto info = replica.is_allocated();
  std::cout << std::format("allocated pid={} host={} log={}\n", info.pid, info.hostname,
                           info.log_file_path);

  auto metadata = block_on(replica.initialize_and_get_metadata());
  if (!metadata) {
    std::cerr << "Initialization failed: " << metadata.error().message << "\n";
    return 1;
  }
  std::cout << std::format("state={} version={}\n", rp::engine::to_string(replica.state()),
                           metadata->version.to_string());

  auto [greet, greet_args] = request("greet", Json::array({FLAGS_name}));
  auto greeting = block_on(replica.handle_unary(greet, greet_args));
  if (!greeting) {
    std::cerr << "greet failed: " << greeting.error().message << "\n";
  } else {
    std::cout << std::get<Json>(*greeting).get<std::string>() << "\n";
  }

  auto [count, count_args] = request("count_up", Json::array({FLAGS_count}));
  count.is_streaming = true;
  auto stream = block_on(replica.handle_streaming(count, count_args));
  if (!stream) {
    std::cerr << "count_up failed: " << stream.error().message << "\n";
  } else {
    while (true) {
      auto item = block_on(stream->next());
      if (!item) {
        std::cerr << "count_up failed: " << item.error().message << "\n";
        break;
      }
      if (!*item) {
        break;
      }
      std::cout << "count_up -> " << std::get<Json>(**item).dump() << "\n";
    }
  }

  auto updated_config = replica.metadata().config;
  updated_config.user_config = Json{{"greeting", "hello"}};
  auto updated = block_on(replica.reconfigure(updated_config));
  if (!updated) {
    std::cerr << "reconfigure failed: " << updated.error().message << "\n";
  } else {
    auto again = block_on(replica.handle_unary(greet, greet_args));
    if (again) {
      std::cout << std::get<Json>(*again).get<std::string>() << "\n";
    }
  }

  auto depth = replica.queue_depth();
  std::cout << std::format("pending={} running={}\n", depth.pending, depth.running);

  stdexec::sync_wait(replica.drain_and_terminate());
  std::cout << std::format("state={}\n", rp::engine::to_string(replica.state()));
  rp::log::shutdown();
  return 0;
}
