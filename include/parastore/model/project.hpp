#pragma once

#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parastore::model {

enum class ProjectStatus { Active, Paused, Completed, Cancelled };
enum class Priority { High, Medium, Low };

[[nodiscard]] std::string_view to_string(ProjectStatus status);
[[nodiscard]] std::string_view to_string(Priority priority);
[[nodiscard]] std::optional<ProjectStatus> parse_project_status(const std::string &value);
[[nodiscard]] std::optional<Priority> parse_priority(const std::string &value);

struct Stakeholder {
  std::string name;
  std::string role;
  std::optional<std::string> contact;
};

// Contents of a project's `_meta.yaml`.
struct ProjectMeta {
  std::string id;
  std::string name;
  std::optional<std::string> description;
  ProjectStatus status = ProjectStatus::Active;
  Priority priority = Priority::Medium;
  std::optional<std::string> area;
  std::optional<std::string> deadline;
  std::string created_at;
  std::string updated_at;
  std::vector<Stakeholder> stakeholders;
  std::vector<std::string> tags;
};

[[nodiscard]] const schema::Schema &project_meta_schema();
[[nodiscard]] const schema::Schema &project_index_schema();

} // namespace parastore::model

namespace YAML {

template <> struct convert<parastore::model::Stakeholder> {
  static Node encode(const parastore::model::Stakeholder &value);
  static bool decode(const Node &node, parastore::model::Stakeholder &value);
};

template <> struct convert<parastore::model::ProjectMeta> {
  static Node encode(const parastore::model::ProjectMeta &value);
  static bool decode(const Node &node, parastore::model::ProjectMeta &value);
};

} // namespace YAML
