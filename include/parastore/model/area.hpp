#pragma once

#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parastore::model {

enum class AreaStatus { Active, Dormant };

[[nodiscard]] std::string_view to_string(AreaStatus status);
[[nodiscard]] std::optional<AreaStatus> parse_area_status(const std::string &value);

struct Goal {
  std::string description;
  std::string status;
  std::optional<std::string> target_date;
};

// Contents of an area's `_meta.yaml`.
struct AreaMeta {
  std::string id;
  std::string name;
  std::optional<std::string> description;
  AreaStatus status = AreaStatus::Active;
  std::vector<std::string> responsibilities;
  std::vector<Goal> goals;
  std::optional<std::string> review_cadence; // daily | weekly | monthly | quarterly
  std::string created_at;
  std::string updated_at;
  std::vector<std::string> tags;
};

[[nodiscard]] const schema::Schema &area_meta_schema();
[[nodiscard]] const schema::Schema &area_index_schema();

} // namespace parastore::model

namespace YAML {

template <> struct convert<parastore::model::Goal> {
  static Node encode(const parastore::model::Goal &value);
  static bool decode(const Node &node, parastore::model::Goal &value);
};

template <> struct convert<parastore::model::AreaMeta> {
  static Node encode(const parastore::model::AreaMeta &value);
  static bool decode(const Node &node, parastore::model::AreaMeta &value);
};

} // namespace YAML
