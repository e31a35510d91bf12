#ifndef RP_ENGINE_SERIALIZER_HPP
#define RP_ENGINE_SERIALIZER_HPP

#include "engine/error.hpp"
#include "engine/types.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace rp::engine {

/// Pluggable codec for payloads crossing the call boundary.
class Serializer {
public:
  virtual ~Serializer() = default;

  virtual auto name() const -> std::string_view = 0;
  virtual auto content_type() const -> std::string_view = 0;
  virtual auto serialize(const Json &data) const -> Expected<std::string> = 0;
  virtual auto deserialize(std::string_view bytes) const -> Expected<Json> = 0;
};

class JsonSerializer final : public Serializer {
public:
  auto name() const -> std::string_view override { return "json"; }

  auto content_type() const -> std::string_view override {
    return "application/json";
  }

  auto serialize(const Json &data) const -> Expected<std::string> override;
  auto deserialize(std::string_view bytes) const -> Expected<Json> override;
};

class MsgPackSerializer final : public Serializer {
public:
  auto name() const -> std::string_view override { return "msgpack"; }

  auto content_type() const -> std::string_view override {
    return "application/msgpack";
  }

  auto serialize(const Json &data) const -> Expected<std::string> override;
  auto deserialize(std::string_view bytes) const -> Expected<Json> override;
};

/// Resolve a serializer by name ("json" or "msgpack").
auto make_serializer(std::string_view name)
    -> Expected<std::shared_ptr<const Serializer>>;

} // namespace rp::engine

#endif // RP_ENGINE_SERIALIZER_HPP
