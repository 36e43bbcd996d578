#pragma once

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace parastore::model::yaml_fields {

// Missing keys come back as a null node rather than an invalid one.
inline YAML::Node child(const YAML::Node &node, const char *key) {
  const YAML::Node value = node[key];
  return value.IsDefined() ? value : YAML::Node();
}

inline bool read_string(const YAML::Node &node, const char *key, std::string &out) {
  const YAML::Node value = node[key];
  if (!value.IsDefined() || !value.IsScalar()) {
    return false;
  }
  out = value.Scalar();
  return true;
}

inline void read_optional(const YAML::Node &node, const char *key,
                          std::optional<std::string> &out) {
  const YAML::Node value = node[key];
  if (value.IsDefined() && value.IsScalar()) {
    out = value.Scalar();
  }
}

inline void read_string_list(const YAML::Node &node, const char *key,
                             std::vector<std::string> &out) {
  const YAML::Node value = node[key];
  if (!value.IsDefined() || !value.IsSequence()) {
    return;
  }
  for (const auto &item : value) {
    if (item.IsScalar()) {
      out.push_back(item.Scalar());
    }
  }
}

inline void write_optional(YAML::Node &node, const char *key,
                           const std::optional<std::string> &value) {
  if (value.has_value()) {
    node[key] = *value;
  }
}

inline void write_string_list(YAML::Node &node, const char *key,
                              const std::vector<std::string> &values) {
  if (values.empty()) {
    return;
  }
  YAML::Node list(YAML::NodeType::Sequence);
  for (const auto &value : values) {
    list.push_back(value);
  }
  node[key] = list;
}

} // namespace parastore::model::yaml_fields
