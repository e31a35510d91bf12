#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <exec/task.hpp>

#include "engine/error.hpp"
#include "engine/types.hpp"

namespace rp::engine::http {

using Headers = std::vector<std::pair<std::string, std::string>>;

enum class MessageType {
  RequestBody,
  Disconnect,
  ResponseStart,
  ResponseBody,
};

auto to_string(MessageType type) -> std::string_view;

/// One message of the asynchronous web-gateway protocol.
struct Message {
  MessageType type = MessageType::RequestBody;
  /// ResponseStart only.
  int status = 200;
  /// ResponseStart only.
  Headers headers;
  /// RequestBody / ResponseBody payload.
  std::string body;
  bool more_body = false;

  auto operator==(const Message &) const -> bool = default;

  static auto request_body(std::string body, bool more_body) -> Message;
  static auto disconnect() -> Message;
  static auto response_start(int status, Headers headers) -> Message;
  static auto response_body(std::string body, bool more_body) -> Message;
};

/// Request line and headers of an HTTP call.
struct Scope {
  std::string method = "GET";
  std::string path = "/";
  std::string query_string;
  std::string http_version = "1.1";
  Headers headers;

  /// Case-insensitive header lookup.
  auto header(std::string_view name) const -> std::optional<std::string_view>;

  auto to_json() const -> Json;
  static auto from_json(const Json &json) -> Expected<Scope>;
};

/// Pull the next inbound message.
using Receive = std::function<exec::task<Message>()>;
/// Push one outbound message.
using Send = std::function<exec::task<void>(Message)>;

/// Raw protocol triple handed to app-adapter handlers.
struct Protocol {
  Scope scope;
  Receive receive;
  Send send;
};

/// Request object handed to plain (non-adapter) handlers.
class Request {
public:
  Request(Scope scope, Receive receive)
      : scope_(std::move(scope)), receive_(std::move(receive)) {}

  auto scope() const -> const Scope & { return scope_; }
  auto method() const -> const std::string & { return scope_.method; }
  auto path() const -> const std::string & { return scope_.path; }
  auto header(std::string_view name) const -> std::optional<std::string_view> {
    return scope_.header(name);
  }
  /// Value of `key` in the query string, if present.
  auto query_param(std::string_view key) const -> std::optional<std::string>;

  /// Read the whole body. Subsequent calls return the cached body.
  auto body() -> exec::task<std::string>;
  /// Read the body and parse it as JSON.
  auto json() -> exec::task<Expected<Json>>;

private:
  Scope scope_;
  Receive receive_;
  std::optional<std::string> body_;
};

/// Capability of handlers that wrap a whole web application.
class App {
public:
  virtual ~App() = default;

  /// Lifespan startup, run once when the handler is initialized.
  virtual auto startup() -> exec::task<void> = 0;
  /// Serve one request over the raw protocol triple.
  virtual auto handle(Protocol protocol) -> exec::task<void> = 0;
};

/// Render a handler result as a complete response and push it.
auto send_result(Json result, Send send) -> exec::task<void>;

/// Push a plain-text response with the given status.
auto send_text(int status, std::string text, Send send)
    -> exec::task<void>;

/// Lightweight codec for batches of protocol messages (msgpack).
class MessageBatchCodec {
public:
  static auto encode(const std::vector<Message> &messages) -> std::string;
  static auto decode(std::string_view bytes) -> Expected<std::vector<Message>>;
};

} // namespace rp::engine::http
