#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <exec/task.hpp>
#include <stdexec/execution.hpp>

#include "engine/handler.hpp"
#include "engine/http.hpp"
#include "engine/sequence.hpp"
#include "engine/types.hpp"
#include "runtime/async_queue.hpp"

namespace rp::engine::testing {

/// Drive a task to completion on the calling thread.
template <typename T>
auto run(exec::task<T> task) -> T {
  if constexpr (std::is_void_v<T>) {
    stdexec::sync_wait(std::move(task));
  } else {
    auto result = stdexec::sync_wait(std::move(task));
    return std::move(std::get<0>(*result));
  }
}

/// Wait until predicate returns true or the timeout expires.
inline auto wait_for_condition(const std::function<bool()> &predicate,
                               std::chrono::milliseconds timeout) -> bool {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

/// Pull a stream to its end; stops at the first error.
inline auto collect(ResultStream &stream) -> exec::task<Expected<std::vector<CallResult>>> {
  std::vector<CallResult> items;
  while (true) {
    auto item = co_await stream.next();
    if (!item) {
      co_return tl::unexpected(item.error());
    }
    if (!*item) {
      break;
    }
    items.push_back(std::move(**item));
  }
  co_return items;
}

inline auto json_values(const std::vector<CallResult> &items) -> std::vector<Json> {
  std::vector<Json> out;
  for (const auto &item : items) {
    out.push_back(std::get<Json>(item));
  }
  return out;
}

/// Decode every MessageBatch of a bridged response into one message list.
inline auto decode_batches(const std::vector<CallResult> &items)
    -> std::vector<http::Message> {
  std::vector<http::Message> out;
  for (const auto &item : items) {
    auto decoded = http::MessageBatchCodec::decode(std::get<MessageBatch>(item).bytes);
    if (!decoded) {
      throw std::runtime_error(decoded.error().message);
    }
    out.insert(out.end(), decoded->begin(), decoded->end());
  }
  return out;
}

/// What a test handler observed during its life.
struct Probe {
  std::atomic<int> constructed{0};
  std::atomic<int> teardowns{0};
  std::atomic<int> multiplex_shutdowns{0};
  std::atomic<int> reconfigures{0};
  std::atomic<bool> unhealthy{false};
  std::mutex mutex;
  Json last_user_config;
};

/// Handler with greet, a generator, a failing method and a private helper.
class Greeter : public Handler {
public:
  explicit Greeter(std::shared_ptr<Probe> probe) : probe_(std::move(probe)) {}

  auto capabilities() -> Capabilities override {
    Capabilities caps;
    caps.methods["greet"] = Method::unary([](const CallArgs &call) {
      return Json("hi " + call.arg(0).get<std::string>());
    });
    caps.methods["count_up"] = Method::generator([](const CallArgs &call) {
      const int n = call.arg(0).get<int>();
      auto next = std::make_shared<int>(0);
      return SyncSequence([n, next]() -> std::optional<Json> {
        if (*next >= n) {
          return std::nullopt;
        }
        return Json((*next)++);
      });
    });
    caps.methods["boom"] = Method::unary([](const CallArgs &) -> Json {
      throw std::runtime_error("kaboom");
    });
    caps.methods["__helper"] = Method::unary([](const CallArgs &) { return Json(); });
    auto probe = probe_;
    caps.check_health = [probe] { return check(probe); };
    caps.teardown = [probe] { return teardown(probe); };
    return caps;
  }

private:
  static auto check(std::shared_ptr<Probe> probe) -> exec::task<void> {
    if (probe->unhealthy.load()) {
      throw std::runtime_error("replica is sick");
    }
    co_return;
  }

  static auto teardown(std::shared_ptr<Probe> probe) -> exec::task<void> {
    probe->teardowns.fetch_add(1);
    co_return;
  }

  std::shared_ptr<Probe> probe_;
};

inline auto make_greeter(std::shared_ptr<Probe> probe, InitArgs)
    -> exec::task<std::shared_ptr<Handler>> {
  probe->constructed.fetch_add(1);
  co_return std::make_shared<Greeter>(std::move(probe));
}

inline auto greeter_definition(std::shared_ptr<Probe> probe) -> DeploymentDefinition {
  return ClassDefinition{"Greeter", [probe](InitArgs args) {
                           return make_greeter(probe, std::move(args));
                         }};
}

/// Records outbound messages in place of a real response channel.
struct SentMessages {
  std::mutex mutex;
  std::vector<http::Message> messages;

  auto snapshot() -> std::vector<http::Message> {
    std::lock_guard<std::mutex> lock(mutex);
    return messages;
  }
};

inline auto record_message(std::shared_ptr<SentMessages> sink, http::Message message)
    -> exec::task<void> {
  std::lock_guard<std::mutex> lock(sink->mutex);
  sink->messages.push_back(std::move(message));
  co_return;
}

inline auto recording_send(std::shared_ptr<SentMessages> sink) -> http::Send {
  return [sink](http::Message message) { return record_message(sink, std::move(message)); };
}

/// Caller-side body source fed by the test; suspends while empty.
struct BodySource {
  AsyncQueue<http::Message> queue;

  auto push(http::Message message) -> void { queue.push(std::move(message)); }
};

inline auto next_body(std::shared_ptr<BodySource> source) -> exec::task<http::Message> {
  auto message = co_await source->queue.pop();
  if (!message) {
    co_return http::Message::disconnect();
  }
  co_return std::move(*message);
}

inline auto body_receiver(std::shared_ptr<BodySource> source) -> http::Receive {
  return [source]() { return next_body(source); };
}

/// Body source that replays a fixed message list, then disconnects.
inline auto fixed_body(std::vector<http::Message> messages) -> http::Receive {
  auto source = std::make_shared<BodySource>();
  for (auto &message : messages) {
    source->push(std::move(message));
  }
  source->push(http::Message::disconnect());
  return body_receiver(source);
}

}  // namespace rp::engine::testing
