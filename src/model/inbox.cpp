#include "parastore/model/inbox.hpp"

#include "yaml_fields.hpp"

namespace parastore::model {

const schema::Schema &inbox_item_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema item("InboxItem");
    item.required("id", Field::string().starts_with("inbox_"))
        .required("title", Field::string().min_length(1))
        .required("type", Field::one_of({"task", "note", "idea", "reference", "capture"}))
        .optional("content", Field::string())
        .optional("source", Field::string())
        .optional("priority_score", Field::integer().min(0).max(100))
        .optional("processed", Field::boolean())
        .optional("target_project", Field::string())
        .optional("target_area", Field::string())
        .optional("due_date", Field::timestamp())
        .required("created_at", Field::timestamp())
        .required("updated_at", Field::timestamp())
        .optional("tags", Field::array_of(Field::string()));
    return item;
  }();
  return kSchema;
}

const schema::Schema &inbox_queue_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema stats("InboxStats");
    stats.required("total", Field::integer().min(0))
        .required("unprocessed", Field::integer().min(0))
        .required("by_type", Field::any());

    schema::Schema queue("InboxQueue");
    queue.required("version", Field::integer().min(1))
        .required("updated_at", Field::timestamp())
        .required("items", Field::array_of(Field::object(inbox_item_schema())))
        .required("stats", Field::object(stats));
    return queue;
  }();
  return kSchema;
}

} // namespace parastore::model

namespace YAML {

using namespace parastore::model::yaml_fields;

Node convert<parastore::model::InboxItem>::encode(const parastore::model::InboxItem &value) {
  Node node(NodeType::Map);
  node["id"] = value.id;
  node["title"] = value.title;
  node["type"] = value.type;
  write_optional(node, "content", value.content);
  write_optional(node, "source", value.source);
  if (value.priority_score.has_value()) {
    node["priority_score"] = *value.priority_score;
  }
  node["processed"] = value.processed;
  write_optional(node, "target_project", value.target_project);
  write_optional(node, "target_area", value.target_area);
  write_optional(node, "due_date", value.due_date);
  node["created_at"] = value.created_at;
  node["updated_at"] = value.updated_at;
  write_string_list(node, "tags", value.tags);
  return node;
}

bool convert<parastore::model::InboxItem>::decode(const Node &node,
                                                  parastore::model::InboxItem &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  if (!read_string(node, "id", value.id) || !read_string(node, "title", value.title) ||
      !read_string(node, "type", value.type) ||
      !read_string(node, "created_at", value.created_at) ||
      !read_string(node, "updated_at", value.updated_at)) {
    return false;
  }
  read_optional(node, "content", value.content);
  read_optional(node, "source", value.source);
  if (const Node score = child(node, "priority_score"); score.IsScalar()) {
    int parsed = 0;
    if (!convert<int>::decode(score, parsed)) {
      return false;
    }
    value.priority_score = parsed;
  }
  if (const Node processed = child(node, "processed"); processed.IsScalar()) {
    if (!convert<bool>::decode(processed, value.processed)) {
      return false;
    }
  }
  read_optional(node, "target_project", value.target_project);
  read_optional(node, "target_area", value.target_area);
  read_optional(node, "due_date", value.due_date);
  read_string_list(node, "tags", value.tags);
  return true;
}

} // namespace YAML
