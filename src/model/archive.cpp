#include "parastore/model/archive.hpp"

#include "parastore/common/time.hpp"
#include "yaml_fields.hpp"

namespace parastore::model {

std::string_view to_string(const ArchivedType type) {
  return type == ArchivedType::Area ? "area" : "project";
}

std::string_view to_string(const ArchiveReason reason) {
  switch (reason) {
  case ArchiveReason::Completed:
    return "completed";
  case ArchiveReason::Cancelled:
    return "cancelled";
  case ArchiveReason::Inactive:
    return "inactive";
  case ArchiveReason::Manual:
    return "manual";
  }
  return "manual";
}

std::optional<ArchivedType> parse_archived_type(const std::string &value) {
  if (value == "project") {
    return ArchivedType::Project;
  }
  if (value == "area") {
    return ArchivedType::Area;
  }
  return std::nullopt;
}

std::optional<ArchiveReason> parse_archive_reason(const std::string &value) {
  for (const auto reason : {ArchiveReason::Completed, ArchiveReason::Cancelled,
                            ArchiveReason::Inactive, ArchiveReason::Manual}) {
    if (value == to_string(reason)) {
      return reason;
    }
  }
  return std::nullopt;
}

void ArchiveIndex::append(ArchivedItem item) {
  ++stats.total;
  if (item.type == ArchivedType::Project) {
    ++stats.projects;
  } else {
    ++stats.areas;
  }
  archived_items.push_back(std::move(item));
}

bool ArchiveIndex::stats_consistent() const {
  std::uint64_t projects = 0;
  std::uint64_t areas = 0;
  for (const auto &item : archived_items) {
    if (item.type == ArchivedType::Project) {
      ++projects;
    } else {
      ++areas;
    }
  }
  return stats.total == archived_items.size() && stats.projects == projects &&
         stats.areas == areas;
}

ArchiveIndex default_archive_index() {
  ArchiveIndex index;
  index.version = 1;
  index.generated_at = common::now_rfc3339();
  return index;
}

const schema::Schema &archived_item_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema item("ArchivedItem");
    item.required("id", Field::string().min_length(1))
        .required("type", Field::one_of({"project", "area"}))
        .required("original_path", Field::string().min_length(1))
        .required("archived_to", Field::string().min_length(1))
        .required("archived_at", Field::timestamp())
        .required("reason", Field::one_of({"completed", "cancelled", "inactive", "manual"}))
        .optional("title", Field::string())
        .optional("notes", Field::string());
    return item;
  }();
  return kSchema;
}

const schema::Schema &archive_index_schema() {
  using schema::Field;
  static const schema::Schema kSchema = [] {
    schema::Schema stats("ArchiveStats");
    stats.required("total", Field::integer().min(0))
        .required("projects", Field::integer().min(0))
        .required("areas", Field::integer().min(0));

    schema::Schema index("ArchiveIndex");
    index.required("version", Field::integer().min(1))
        .required("generated_at", Field::timestamp())
        .required("archived_items", Field::array_of(Field::object(archived_item_schema())))
        .required("stats", Field::object(stats));
    return index;
  }();
  return kSchema;
}

} // namespace parastore::model

namespace YAML {

using namespace parastore::model::yaml_fields;

Node convert<parastore::model::ArchivedItem>::encode(const parastore::model::ArchivedItem &value) {
  Node node(NodeType::Map);
  node["id"] = value.id;
  node["type"] = std::string(parastore::model::to_string(value.type));
  node["original_path"] = value.original_path;
  node["archived_to"] = value.archived_to;
  node["archived_at"] = value.archived_at;
  node["reason"] = std::string(parastore::model::to_string(value.reason));
  write_optional(node, "title", value.title);
  write_optional(node, "notes", value.notes);
  return node;
}

bool convert<parastore::model::ArchivedItem>::decode(const Node &node,
                                                     parastore::model::ArchivedItem &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  std::string type;
  std::string reason;
  if (!read_string(node, "id", value.id) || !read_string(node, "type", type) ||
      !read_string(node, "original_path", value.original_path) ||
      !read_string(node, "archived_to", value.archived_to) ||
      !read_string(node, "archived_at", value.archived_at) ||
      !read_string(node, "reason", reason)) {
    return false;
  }
  const auto parsed_type = parastore::model::parse_archived_type(type);
  const auto parsed_reason = parastore::model::parse_archive_reason(reason);
  if (!parsed_type.has_value() || !parsed_reason.has_value()) {
    return false;
  }
  value.type = *parsed_type;
  value.reason = *parsed_reason;
  read_optional(node, "title", value.title);
  read_optional(node, "notes", value.notes);
  return true;
}

Node convert<parastore::model::ArchiveIndex>::encode(const parastore::model::ArchiveIndex &value) {
  Node node(NodeType::Map);
  node["version"] = value.version;
  node["generated_at"] = value.generated_at;
  Node items(NodeType::Sequence);
  for (const auto &item : value.archived_items) {
    items.push_back(item);
  }
  node["archived_items"] = items;
  Node stats(NodeType::Map);
  stats["total"] = value.stats.total;
  stats["projects"] = value.stats.projects;
  stats["areas"] = value.stats.areas;
  node["stats"] = stats;
  return node;
}

bool convert<parastore::model::ArchiveIndex>::decode(const Node &node,
                                                     parastore::model::ArchiveIndex &value) {
  if (!node.IsMap()) {
    return false;
  }
  value = {};
  const Node version = child(node, "version");
  const Node items = child(node, "archived_items");
  const Node stats = child(node, "stats");
  if (!version.IsScalar() || !convert<int>::decode(version, value.version) ||
      !read_string(node, "generated_at", value.generated_at) || !items.IsSequence() ||
      !stats.IsMap()) {
    return false;
  }
  for (const auto &entry : items) {
    parastore::model::ArchivedItem item;
    if (!convert<parastore::model::ArchivedItem>::decode(entry, item)) {
      return false;
    }
    value.archived_items.push_back(std::move(item));
  }
  const Node total = child(stats, "total");
  const Node projects = child(stats, "projects");
  const Node areas = child(stats, "areas");
  return total.IsScalar() && projects.IsScalar() && areas.IsScalar() &&
         convert<std::uint64_t>::decode(total, value.stats.total) &&
         convert<std::uint64_t>::decode(projects, value.stats.projects) &&
         convert<std::uint64_t>::decode(areas, value.stats.areas);
}

} // namespace YAML
