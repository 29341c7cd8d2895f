#pragma once

#include "orchestra/util/id.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace YAML {

template <typename Tag>
struct convert<orchestra::TypedId<Tag>> {
  static auto encode(const orchestra::TypedId<Tag>& id) -> Node {
    return Node(id.str());
  }
  static auto decode(const Node& node, orchestra::TypedId<Tag>& id) -> bool {
    if (!node.IsScalar()) return false;
    id = orchestra::TypedId<Tag>{node.as<std::string>()};
    return true;
  }
};

template <>
struct convert<std::chrono::milliseconds> {
  static auto encode(const std::chrono::milliseconds& ms) -> Node {
    return Node(ms.count());
  }
  static auto decode(const Node& node, std::chrono::milliseconds& ms) -> bool {
    if (!node.IsScalar()) return false;
    ms = std::chrono::milliseconds(node.as<std::int64_t>());
    return true;
  }
};

}  // namespace YAML

namespace orchestra {

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

// Plain scalars are typed (bool, integer, string); quoted scalars always stay
// strings. Throws YAML::Exception on malformed nodes.
[[nodiscard]] inline auto yaml_to_json(const YAML::Node& node)
    -> nlohmann::json {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return nullptr;
    case YAML::NodeType::Scalar: {
      const auto& text = node.Scalar();
      if (node.Tag() == "!") {
        return text;
      }
      if (text == "true" || text == "false") {
        return text == "true";
      }
      // Only integers that print back identically; "1.10" or "007" stay text.
      if (std::int64_t i{}; YAML::convert<std::int64_t>::decode(node, i) &&
                            std::to_string(i) == text) {
        return i;
      }
      return text;
    }
    case YAML::NodeType::Sequence: {
      auto arr = nlohmann::json::array();
      for (const auto& item : node) {
        arr.push_back(yaml_to_json(item));
      }
      return arr;
    }
    case YAML::NodeType::Map: {
      auto obj = nlohmann::json::object();
      for (const auto& kv : node) {
        obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return obj;
    }
  }
  return nullptr;
}

}  // namespace orchestra
