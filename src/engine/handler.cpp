#include "engine/handler.hpp"

namespace rp::engine {

auto Method::is_generator() const -> bool {
  return std::holds_alternative<SyncGenerator>(body_) ||
         std::holds_alternative<AsyncGenerator>(body_);
}

auto Method::valid() const -> bool {
  return std::visit([](const auto &fn) { return static_cast<bool>(fn); }, body_);
}

auto definition_name(const DeploymentDefinition &definition)
    -> const std::string & {
  return std::visit([](const auto &def) -> const std::string & { return def.name; },
                    definition);
}

auto public_method_names(const MethodTable &methods) -> std::vector<std::string> {
  std::vector<std::string> names;
  names.reserve(methods.size());
  for (const auto &[name, method] : methods) {
    if (name.rfind("__", 0) == 0) {
      continue;
    }
    names.push_back(name);
  }
  return names;
}

}  // namespace rp::engine
