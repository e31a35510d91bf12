#include "engine/serializer.hpp"

#include <format>

namespace rp::engine {

auto JsonSerializer::serialize(const Json &data) const -> Expected<std::string> {
  try {
    return data.dump();
  } catch (const std::exception &e) {
    return tl::unexpected(make_error(
        ErrorCode::Serialization,
        std::format("JSON serialization failed: {}", e.what())));
  }
}

auto JsonSerializer::deserialize(std::string_view bytes) const
    -> Expected<Json> {
  try {
    return Json::parse(bytes.begin(), bytes.end());
  } catch (const std::exception &e) {
    return tl::unexpected(make_error(
        ErrorCode::Serialization,
        std::format("JSON deserialization failed: {}", e.what())));
  }
}

auto MsgPackSerializer::serialize(const Json &data) const
    -> Expected<std::string> {
  try {
    auto bytes = Json::to_msgpack(data);
    return std::string(bytes.begin(), bytes.end());
  } catch (const std::exception &e) {
    return tl::unexpected(make_error(
        ErrorCode::Serialization,
        std::format("msgpack serialization failed: {}", e.what())));
  }
}

auto MsgPackSerializer::deserialize(std::string_view bytes) const
    -> Expected<Json> {
  try {
    return Json::from_msgpack(bytes.begin(), bytes.end());
  } catch (const std::exception &e) {
    return tl::unexpected(make_error(
        ErrorCode::Serialization,
        std::format("msgpack deserialization failed: {}", e.what())));
  }
}

auto make_serializer(std::string_view name)
    -> Expected<std::shared_ptr<const Serializer>> {
  if (name == "json") {
    return std::make_shared<const JsonSerializer>();
  }
  if (name == "msgpack") {
    return std::make_shared<const MsgPackSerializer>();
  }
  return tl::unexpected(make_error(
      ErrorCode::Serialization, std::format("unknown serializer '{}'", name)));
}

} // namespace rp::engine
