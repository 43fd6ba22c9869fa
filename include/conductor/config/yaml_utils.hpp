#pragma once

#include "conductor/model/state_strings.hpp"

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace YAML {

template <conductor::NamedEnum E>
struct convert<E> {
  static auto encode(const E& value) -> Node {
    return Node(std::string(conductor::to_string_view(value)));
  }
  static auto decode(const Node& node, E& value) -> bool {
    if (!node.IsScalar()) return false;
    auto parsed = conductor::parse<E>(node.as<std::string>());
    if (!parsed) return false;
    value = *parsed;
    return true;
  }
};

}  // namespace YAML

namespace conductor {

template <typename T>
concept YamlParsable = requires(const YAML::Node& n) { { n.as<T>() }; };

template <YamlParsable T>
[[nodiscard]] auto yaml_get_or(const YAML::Node& node, std::string_view key,
                               T default_val) -> T {
  auto field = node[std::string(key)];
  if (!field || (!field.IsScalar() && !field.IsSequence() && !field.IsMap())) {
    return default_val;
  }
  return field.as<T>();
}

[[nodiscard]] inline auto yaml_get_ms_or(const YAML::Node& node,
                                         std::string_view key,
                                         std::chrono::milliseconds default_val)
    -> std::chrono::milliseconds {
  return std::chrono::milliseconds(
      yaml_get_or<std::int64_t>(node, key, default_val.count()));
}

inline void yaml_emit(YAML::Emitter& out, std::string_view key,
                      const auto& value) {
  out << YAML::Key << std::string(key) << YAML::Value << value;
}

inline void yaml_emit_if_not_empty(YAML::Emitter& out, std::string_view key,
                                   std::string_view value) {
  if (!value.empty()) {
    out << YAML::Key << std::string(key) << YAML::Value << std::string(value);
  }
}

}  // namespace conductor
