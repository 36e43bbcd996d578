#pragma once

#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace parastore::model {

struct InboxItem {
  std::string id;
  std::string title;
  std::string type; // task | note | idea | reference | capture
  std::optional<std::string> content;
  std::optional<std::string> source;
  std::optional<int> priority_score;
  bool processed = false;
  std::optional<std::string> target_project;
  std::optional<std::string> target_area;
  std::optional<std::string> due_date;
  std::string created_at;
  std::string updated_at;
  std::vector<std::string> tags;
};

[[nodiscard]] const schema::Schema &inbox_item_schema();
// `Inbox/_queue.yaml`: {version, updated_at, items, stats}.
[[nodiscard]] const schema::Schema &inbox_queue_schema();

} // namespace parastore::model

namespace YAML {

template <> struct convert<parastore::model::InboxItem> {
  static Node encode(const parastore::model::InboxItem &value);
  static bool decode(const Node &node, parastore::model::InboxItem &value);
};

} // namespace YAML
