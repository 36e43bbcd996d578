#include "parastore/index/registry.hpp"

#include "parastore/common/fs.hpp"
#include "parastore/model/archive.hpp"
#include "parastore/model/area.hpp"
#include "parastore/model/contact.hpp"
#include "parastore/model/inbox.hpp"
#include "parastore/model/project.hpp"

#include <array>
#include <utility>

namespace parastore::index {

namespace {

struct ResourceSubtype {
  const char *dir;
  EntityType type;
};

constexpr std::array<ResourceSubtype, 5> kResourceSubtypes = {{
    {"contacts", EntityType::Contact},
    {"notes", EntityType::Note},
    {"templates", EntityType::Template},
    {"procedures", EntityType::Procedure},
    {"preferences", EntityType::Preference},
}};

const char *resource_dir_for(const EntityType type) {
  for (const auto &subtype : kResourceSubtypes) {
    if (subtype.type == type) {
      return subtype.dir;
    }
  }
  return nullptr;
}

schema::Schema list_index_schema(const std::string &key) {
  return schema::Schema(key + "_index")
      .required("version", schema::Field::integer().min(kIndexVersion))
      .required("updated_at", schema::Field::timestamp())
      .required(key, schema::Field::array_of(schema::Field::any()));
}

} // namespace

std::string_view entity_type_name(const EntityType type) {
  switch (type) {
  case EntityType::Project:
    return "project";
  case EntityType::Area:
    return "area";
  case EntityType::Archive:
    return "archive";
  case EntityType::Inbox:
    return "inbox";
  case EntityType::Contact:
    return "contact";
  case EntityType::Note:
    return "note";
  case EntityType::Template:
    return "template";
  case EntityType::Procedure:
    return "procedure";
  case EntityType::Preference:
    return "preference";
  }
  return "unknown";
}

CategoryRegistry::CategoryRegistry(std::string root_name) : root_(std::move(root_name)) {}

std::string CategoryRegistry::index_path_for(const EntityType type) const {
  switch (type) {
  case EntityType::Project:
    return root_ + "/" + paths::kProjectsDir + "/" + kIndexFileName;
  case EntityType::Area:
    return root_ + "/" + paths::kAreasDir + "/" + kIndexFileName;
  case EntityType::Archive:
    return root_ + "/" + paths::kArchiveDir + "/" + kIndexFileName;
  case EntityType::Inbox:
    return root_ + "/" + paths::kInboxDir + "/" + kQueueFileName;
  case EntityType::Contact:
  case EntityType::Note:
  case EntityType::Template:
  case EntityType::Procedure:
  case EntityType::Preference:
    return root_ + "/" + paths::kResourcesDir + "/" + resource_dir_for(type) + "/" +
           kIndexFileName;
  }
  return root_ + "/" + kIndexFileName;
}

std::string_view CategoryRegistry::list_key_for(const EntityType type) {
  switch (type) {
  case EntityType::Project:
    return "projects";
  case EntityType::Area:
    return "areas";
  case EntityType::Archive:
    return "archived_items";
  case EntityType::Inbox:
    return "items";
  case EntityType::Contact:
    return "contacts";
  case EntityType::Note:
    return "notes";
  case EntityType::Template:
    return "templates";
  case EntityType::Procedure:
    return "procedures";
  case EntityType::Preference:
    return "preferences";
  }
  return "items";
}

const schema::Schema &CategoryRegistry::index_schema_for(const EntityType type) {
  switch (type) {
  case EntityType::Project:
    return model::project_index_schema();
  case EntityType::Area:
    return model::area_index_schema();
  case EntityType::Archive:
    return model::archive_index_schema();
  case EntityType::Inbox:
    return model::inbox_queue_schema();
  case EntityType::Contact:
    return model::contact_index_schema();
  case EntityType::Note: {
    static const schema::Schema notes = list_index_schema("notes");
    return notes;
  }
  case EntityType::Template: {
    static const schema::Schema templates = list_index_schema("templates");
    return templates;
  }
  case EntityType::Procedure: {
    static const schema::Schema procedures = list_index_schema("procedures");
    return procedures;
  }
  case EntityType::Preference: {
    static const schema::Schema preferences = list_index_schema("preferences");
    return preferences;
  }
  }
  static const schema::Schema items = list_index_schema("items");
  return items;
}

std::optional<EntityType> CategoryRegistry::entity_type_from_path(const std::string &path) const {
  const auto segments = common::path_segments(path);
  // <root>/<category>/<entity...>
  if (segments.size() < 3 || segments[0] != root_) {
    return std::nullopt;
  }
  const std::string &leaf = segments.back();
  if (leaf == kIndexFileName || leaf == kQueueFileName) {
    return std::nullopt;
  }

  const std::string &category = segments[1];
  if (category == paths::kProjectsDir) {
    return EntityType::Project;
  }
  if (category == paths::kAreasDir) {
    return EntityType::Area;
  }
  if (category == paths::kArchiveDir) {
    return EntityType::Archive;
  }
  if (category == paths::kInboxDir) {
    return EntityType::Inbox;
  }
  if (category == paths::kResourcesDir && segments.size() >= 4) {
    for (const auto &subtype : kResourceSubtypes) {
      if (segments[2] == subtype.dir) {
        return subtype.type;
      }
    }
  }
  return std::nullopt;
}

bool CategoryRegistry::writer_maintains_index(const EntityType type) {
  return type != EntityType::Archive;
}

} // namespace parastore::index
