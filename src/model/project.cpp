#include "parastore/model/project.hpp"

#include "yaml_fields.hpp"

namespace parastore::model {

std::string_view to_string(const ProjectStatus status) {
  switch (status) {
  case ProjectStatus::Active:
    return "active";
  case ProjectStatus::Paused:
    return "paused";
  case ProjectStatus::Completed:
    return "completed";
  case ProjectStatus::Cancelled:
    return "cancelled";
  }
  return "active";
}

std::string_view to_string(const Priority priority) {
  switch (priority) {
  case Priority::High:
    return "high";
  case Priority::Medium:
    return "medium";
  case Priority::Low:
    return "low";
  }
  return "medium";
}

std::optional<ProjectStatus> parse_project_status(const std::string &value) {
  for (const auto status : {ProjectStatus::Active, ProjectStatus::Paused, ProjectStatus::Completed,
                            ProjectStatus::Cancelled}) {
    if (value == to_string(status)) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<Priority> parse_priority(const std::string &value) {
  for (const auto priority : {Priority::High, Priority::Medium, Priority::Low}) {
    if (value == to_string(priority)) {
      return priority;
    }
  }
  return std::nullopt;
}

const schema::Schema &project_meta_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema stakeholder("Stakeholder");
    stakeholder.required("name", Field::string().min_length(1))
        .required("role", Field::string().min_length(1))
        .optional("contact", Field::string());

    schema::Schema project("ProjectMeta");
    project.required("id", Field::string().starts_with("proj_"))
        .required("name", Field::string().min_length(1))
        .optional("description", Field::string())
        .required("status", Field::one_of({"active", "paused", "completed", "cancelled"}))
        .required("priority", Field::one_of({"high", "medium", "low"}))
        .optional("area", Field::string())
        .optional("deadline", Field::timestamp())
        .required("created_at", Field::timestamp())
        .required("updated_at", Field::timestamp())
        .optional("stakeholders", Field::array_of(Field::object(stakeholder)))
        .optional("tags", Field::array_of(Field::string()));
    return project;
  }();
  return kSchema;
}

const schema::Schema &project_index_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema index("ProjectIndex");
    index.required("version", Field::integer().min(1))
        .required("updated_at", Field::timestamp())
        .required("projects", Field::array_of(Field::object(project_meta_schema())));
    return index;
  }();
  return kSchema;
}

} // namespace parastore::model

namespace YAML {

using namespace parastore::model::yaml_fields;

Node convert<parastore::model::Stakeholder>::encode(const parastore::model::Stakeholder &value) {
  Node node(NodeType::Map);
  node["name"] = value.name;
  node["role"] = value.role;
  write_optional(node, "contact", value.contact);
  return node;
}

bool convert<parastore::model::Stakeholder>::decode(const Node &node,
                                                    parastore::model::Stakeholder &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  if (!read_string(node, "name", value.name) || !read_string(node, "role", value.role)) {
    return false;
  }
  read_optional(node, "contact", value.contact);
  return true;
}

Node convert<parastore::model::ProjectMeta>::encode(const parastore::model::ProjectMeta &value) {
  Node node(NodeType::Map);
  node["id"] = value.id;
  node["name"] = value.name;
  write_optional(node, "description", value.description);
  node["status"] = std::string(parastore::model::to_string(value.status));
  node["priority"] = std::string(parastore::model::to_string(value.priority));
  write_optional(node, "area", value.area);
  write_optional(node, "deadline", value.deadline);
  node["created_at"] = value.created_at;
  node["updated_at"] = value.updated_at;
  if (!value.stakeholders.empty()) {
    Node list(NodeType::Sequence);
    for (const auto &stakeholder : value.stakeholders) {
      list.push_back(stakeholder);
    }
    node["stakeholders"] = list;
  }
  write_string_list(node, "tags", value.tags);
  return node;
}

bool convert<parastore::model::ProjectMeta>::decode(const Node &node,
                                                    parastore::model::ProjectMeta &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  std::string status;
  std::string priority;
  if (!read_string(node, "id", value.id) || !read_string(node, "name", value.name) ||
      !read_string(node, "status", status) || !read_string(node, "priority", priority) ||
      !read_string(node, "created_at", value.created_at) ||
      !read_string(node, "updated_at", value.updated_at)) {
    return false;
  }
  const auto parsed_status = parastore::model::parse_project_status(status);
  const auto parsed_priority = parastore::model::parse_priority(priority);
  if (!parsed_status.has_value() || !parsed_priority.has_value()) {
    return false;
  }
  value.status = *parsed_status;
  value.priority = *parsed_priority;
  read_optional(node, "description", value.description);
  read_optional(node, "area", value.area);
  read_optional(node, "deadline", value.deadline);
  if (const Node stakeholders = child(node, "stakeholders"); stakeholders.IsSequence()) {
    for (const auto &item : stakeholders) {
      parastore::model::Stakeholder stakeholder;
      if (!convert<parastore::model::Stakeholder>::decode(item, stakeholder)) {
        return false;
      }
      value.stakeholders.push_back(std::move(stakeholder));
    }
  }
  read_string_list(node, "tags", value.tags);
  return true;
}

} // namespace YAML
