#include "engine/http.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <format>

namespace rp::engine::http {
namespace {

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
  return lhs.size() == rhs.size() &&
         std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
           return std::tolower(static_cast<unsigned char>(a)) ==
                  std::tolower(static_cast<unsigned char>(b));
         });
}

auto send_body(int status, std::string content_type, std::string body,
               const Send &send) -> exec::task<void> {
  Headers headers;
  headers.emplace_back("content-type", std::move(content_type));
  headers.emplace_back("content-length", std::to_string(body.size()));
  co_await send(Message::response_start(status, std::move(headers)));
  co_await send(Message::response_body(std::move(body), false));
}

} // namespace

auto to_string(MessageType type) -> std::string_view {
  switch (type) {
  case MessageType::RequestBody:
    return "http.request";
  case MessageType::Disconnect:
    return "http.disconnect";
  case MessageType::ResponseStart:
    return "http.response.start";
  case MessageType::ResponseBody:
    return "http.response.body";
  }
  return "unknown";
}

auto Message::request_body(std::string body, bool more_body) -> Message {
  Message message;
  message.type = MessageType::RequestBody;
  message.body = std::move(body);
  message.more_body = more_body;
  return message;
}

auto Message::disconnect() -> Message {
  Message message;
  message.type = MessageType::Disconnect;
  return message;
}

auto Message::response_start(int status, Headers headers) -> Message {
  Message message;
  message.type = MessageType::ResponseStart;
  message.status = status;
  message.headers = std::move(headers);
  return message;
}

auto Message::response_body(std::string body, bool more_body) -> Message {
  Message message;
  message.type = MessageType::ResponseBody;
  message.body = std::move(body);
  message.more_body = more_body;
  return message;
}

auto Scope::header(std::string_view name) const
    -> std::optional<std::string_view> {
  for (const auto &[key, value] : headers) {
    if (iequals(key, name)) {
      return std::string_view(value);
    }
  }
  return std::nullopt;
}

auto Scope::to_json() const -> Json {
  Json json = Json::object();
  json["method"] = method;
  json["path"] = path;
  json["query_string"] = query_string;
  json["http_version"] = http_version;
  Json header_list = Json::array();
  for (const auto &[key, value] : headers) {
    header_list.push_back(Json::array({key, value}));
  }
  json["headers"] = std::move(header_list);
  return json;
}

auto Scope::from_json(const Json &json) -> Expected<Scope> {
  if (!json.is_object()) {
    return tl::unexpected(
        make_error(ErrorCode::UsageError, "http scope must be an object"));
  }
  Scope scope;
  try {
    scope.method = json.value("method", scope.method);
    scope.path = json.value("path", scope.path);
    scope.query_string = json.value("query_string", scope.query_string);
    scope.http_version = json.value("http_version", scope.http_version);
    if (auto it = json.find("headers"); it != json.end()) {
      for (const auto &entry : *it) {
        if (!entry.is_array() || entry.size() != 2) {
          return tl::unexpected(make_error(
              ErrorCode::UsageError, "http header must be a [name, value] pair"));
        }
        scope.headers.emplace_back(entry[0].get<std::string>(),
                                   entry[1].get<std::string>());
      }
    }
  } catch (const std::exception &e) {
    return tl::unexpected(make_error(
        ErrorCode::UsageError, std::format("invalid http scope: {}", e.what())));
  }
  return scope;
}

auto Request::query_param(std::string_view key) const
    -> std::optional<std::string> {
  std::string_view query = scope_.query_string;
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    auto eq = pair.find('=');
    auto name = pair.substr(0, eq);
    if (name == key) {
      if (eq == std::string_view::npos) {
        return std::string{};
      }
      return std::string(pair.substr(eq + 1));
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}

auto Request::body() -> exec::task<std::string> {
  if (body_) {
    co_return *body_;
  }
  std::string out;
  if (receive_) {
    while (true) {
      auto message = co_await receive_();
      if (message.type != MessageType::RequestBody) {
        break;
      }
      out += message.body;
      if (!message.more_body) {
        break;
      }
    }
  }
  body_ = out;
  co_return out;
}

auto Request::json() -> exec::task<Expected<Json>> {
  auto text = co_await body();
  try {
    co_return Json::parse(text);
  } catch (const std::exception &e) {
    co_return tl::unexpected(make_error(
        ErrorCode::Serialization,
        std::format("request body is not valid JSON: {}", e.what())));
  }
}

auto send_result(Json result, Send send) -> exec::task<void> {
  if (result.is_string()) {
    co_await send_body(200, "text/plain; charset=utf-8",
                       result.get<std::string>(), send);
    co_return;
  }
  if (result.is_binary()) {
    const auto &bytes = result.get_binary();
    co_await send_body(200, "application/octet-stream",
                       std::string(bytes.begin(), bytes.end()), send);
    co_return;
  }
  co_await send_body(200, "application/json", result.dump(), send);
}

auto send_text(int status, std::string text, Send send)
    -> exec::task<void> {
  co_await send_body(status, "text/plain; charset=utf-8", std::move(text), send);
}

auto MessageBatchCodec::encode(const std::vector<Message> &messages)
    -> std::string {
  Json batch = Json::array();
  for (const auto &message : messages) {
    Json entry = Json::object();
    entry["t"] = static_cast<int>(message.type);
    entry["m"] = message.more_body;
    entry["b"] = Json::binary(
        std::vector<std::uint8_t>(message.body.begin(), message.body.end()));
    if (message.type == MessageType::ResponseStart) {
      entry["s"] = message.status;
      Json headers = Json::array();
      for (const auto &[key, value] : message.headers) {
        headers.push_back(Json::array({key, value}));
      }
      entry["h"] = std::move(headers);
    }
    batch.push_back(std::move(entry));
  }
  auto bytes = Json::to_msgpack(batch);
  return std::string(bytes.begin(), bytes.end());
}

auto MessageBatchCodec::decode(std::string_view bytes)
    -> Expected<std::vector<Message>> {
  std::vector<Message> messages;
  try {
    auto batch = Json::from_msgpack(bytes.begin(), bytes.end());
    if (!batch.is_array()) {
      return tl::unexpected(
          make_error(ErrorCode::Serialization, "message batch must be an array"));
    }
    messages.reserve(batch.size());
    for (const auto &entry : batch) {
      Message message;
      const auto type = entry.at("t").get<int>();
      if (type < 0 || type > static_cast<int>(MessageType::ResponseBody)) {
        return tl::unexpected(make_error(
            ErrorCode::Serialization,
            std::format("unknown message type {}", type)));
      }
      message.type = static_cast<MessageType>(type);
      message.more_body = entry.at("m").get<bool>();
      const auto &body = entry.at("b").get_binary();
      message.body.assign(body.begin(), body.end());
      if (message.type == MessageType::ResponseStart) {
        message.status = entry.at("s").get<int>();
        for (const auto &header : entry.at("h")) {
          message.headers.emplace_back(header.at(0).get<std::string>(),
                                       header.at(1).get<std::string>());
        }
      }
      messages.push_back(std::move(message));
    }
  } catch (const std::exception &e) {
    return tl::unexpected(make_error(
        ErrorCode::Serialization,
        std::format("message batch decode failed: {}", e.what())));
  }
  return messages;
}

} // namespace rp::engine::http
