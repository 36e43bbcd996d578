#include "parastore/model/area.hpp"

#include "yaml_fields.hpp"

namespace parastore::model {

std::string_view to_string(const AreaStatus status) {
  return status == AreaStatus::Dormant ? "dormant" : "active";
}

std::optional<AreaStatus> parse_area_status(const std::string &value) {
  if (value == "active") {
    return AreaStatus::Active;
  }
  if (value == "dormant") {
    return AreaStatus::Dormant;
  }
  return std::nullopt;
}

const schema::Schema &area_meta_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema goal("Goal");
    goal.required("description", Field::string().min_length(1))
        .required("status", Field::string().min_length(1))
        .optional("target_date", Field::timestamp());

    schema::Schema area("AreaMeta");
    area.required("id", Field::string().starts_with("area_"))
        .required("name", Field::string().min_length(1))
        .optional("description", Field::string())
        .required("status", Field::one_of({"active", "dormant"}))
        .optional("responsibilities", Field::array_of(Field::string()))
        .optional("goals", Field::array_of(Field::object(goal)))
        .optional("review_cadence", Field::one_of({"daily", "weekly", "monthly", "quarterly"}))
        .required("created_at", Field::timestamp())
        .required("updated_at", Field::timestamp())
        .optional("tags", Field::array_of(Field::string()));
    return area;
  }();
  return kSchema;
}

const schema::Schema &area_index_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema index("AreaIndex");
    index.required("version", Field::integer().min(1))
        .required("updated_at", Field::timestamp())
        .required("areas", Field::array_of(Field::object(area_meta_schema())));
    return index;
  }();
  return kSchema;
}

} // namespace parastore::model

namespace YAML {

using namespace parastore::model::yaml_fields;

Node convert<parastore::model::Goal>::encode(const parastore::model::Goal &value) {
  Node node(NodeType::Map);
  node["description"] = value.description;
  node["status"] = value.status;
  write_optional(node, "target_date", value.target_date);
  return node;
}

bool convert<parastore::model::Goal>::decode(const Node &node, parastore::model::Goal &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  if (!read_string(node, "description", value.description) ||
      !read_string(node, "status", value.status)) {
    return false;
  }
  read_optional(node, "target_date", value.target_date);
  return true;
}

Node convert<parastore::model::AreaMeta>::encode(const parastore::model::AreaMeta &value) {
  Node node(NodeType::Map);
  node["id"] = value.id;
  node["name"] = value.name;
  write_optional(node, "description", value.description);
  node["status"] = std::string(parastore::model::to_string(value.status));
  write_string_list(node, "responsibilities", value.responsibilities);
  if (!value.goals.empty()) {
    Node goals(NodeType::Sequence);
    for (const auto &goal : value.goals) {
      goals.push_back(goal);
    }
    node["goals"] = goals;
  }
  write_optional(node, "review_cadence", value.review_cadence);
  node["created_at"] = value.created_at;
  node["updated_at"] = value.updated_at;
  write_string_list(node, "tags", value.tags);
  return node;
}

bool convert<parastore::model::AreaMeta>::decode(const Node &node,
                                                 parastore::model::AreaMeta &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  std::string status;
  if (!read_string(node, "id", value.id) || !read_string(node, "name", value.name) ||
      !read_string(node, "status", status) ||
      !read_string(node, "created_at", value.created_at) ||
      !read_string(node, "updated_at", value.updated_at)) {
    return false;
  }
  const auto parsed = parastore::model::parse_area_status(status);
  if (!parsed.has_value()) {
    return false;
  }
  value.status = *parsed;
  read_optional(node, "description", value.description);
  read_string_list(node, "responsibilities", value.responsibilities);
  if (const Node goals = child(node, "goals"); goals.IsSequence()) {
    for (const auto &item : goals) {
      parastore::model::Goal goal;
      if (!convert<parastore::model::Goal>::decode(item, goal)) {
        return false;
      }
      value.goals.push_back(std::move(goal));
    }
  }
  read_optional(node, "review_cadence", value.review_cadence);
  read_string_list(node, "tags", value.tags);
  return true;
}

} // namespace YAML
