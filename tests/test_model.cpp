#include "test_framework.hpp"

#include "parastore/model/archive.hpp"
#include "parastore/model/area.hpp"
#include "parastore/model/contact.hpp"
#include "parastore/model/ids.hpp"
#include "parastore/model/inbox.hpp"
#include "parastore/model/project.hpp"
#include "parastore/model/resource.hpp"

#include <set>

namespace {

parastore::model::ProjectMeta sample_project() {
  parastore::model::ProjectMeta project;
  project.id = "proj_abc";
  project.name = "Website relaunch";
  project.status = parastore::model::ProjectStatus::Completed;
  project.priority = parastore::model::Priority::High;
  project.created_at = "2025-01-01T00:00:00Z";
  project.updated_at = "2025-06-01T12:00:00Z";
  project.stakeholders.push_back({.name = "Ana", .role = "owner", .contact = std::nullopt});
  project.tags = {"web"};
  return project;
}

} // namespace

void register_model_tests(std::vector<parastore::tests::TestCase> &tests) {
  using parastore::tests::require;
  namespace model = parastore::model;

  tests.push_back({"project_meta_encodes_to_schema_valid_yaml", [] {
                     const auto node = YAML::convert<model::ProjectMeta>::encode(sample_project());
                     require(model::project_meta_schema().validate(node).ok(),
                             "encoded project validates");
                     require(node["status"].as<std::string>() == "completed", "status string");
                     require(!node["description"].IsDefined(), "unset optional omitted");

                     model::ProjectMeta decoded;
                     require(YAML::convert<model::ProjectMeta>::decode(node, decoded), "decodes");
                     require(decoded.stakeholders.size() == 1 &&
                                 decoded.stakeholders[0].name == "Ana",
                             "stakeholder kept");
                   }});

  tests.push_back({"project_decode_rejects_unknown_status", [] {
                     auto node = YAML::convert<model::ProjectMeta>::encode(sample_project());
                     node["status"] = "someday";
                     model::ProjectMeta decoded;
                     require(!YAML::convert<model::ProjectMeta>::decode(node, decoded),
                             "unknown status rejected");
                     require(!model::project_meta_schema().validate(node).ok(), "schema too");
                   }});

  tests.push_back({"area_status_parses_and_validates", [] {
                     require(model::parse_area_status("dormant") == model::AreaStatus::Dormant,
                             "dormant parses");
                     require(!model::parse_area_status("sleeping").has_value(), "unknown status");
                     model::AreaMeta area;
                     area.id = "area_health";
                     area.name = "Health";
                     area.status = model::AreaStatus::Dormant;
                     area.created_at = "2025-01-01T00:00:00Z";
                     area.updated_at = "2025-02-01T00:00:00Z";
                     area.review_cadence = "weekly";
                     const auto node = YAML::convert<model::AreaMeta>::encode(area);
                     require(model::area_meta_schema().validate(node).ok(), "area validates");
                   }});

  tests.push_back({"contact_and_inbox_schemas_enforce_prefixes", [] {
                     const auto contact = YAML::Load(
                         "id: proj_wrong\nname: John\ntype: person\n"
                         "created_at: 2025-01-01T00:00:00Z\nupdated_at: 2025-01-01T00:00:00Z\n");
                     require(!model::contact_card_schema().validate(contact).ok(),
                             "contact id prefix");
                     const auto inbox = YAML::Load(
                         "id: inbox_1\ntitle: Call\ntype: task\npriority_score: 150\n"
                         "created_at: 2025-01-01T00:00:00Z\nupdated_at: 2025-01-01T00:00:00Z\n");
                     require(!model::inbox_item_schema().validate(inbox).ok(), "score bounds");
                     require(model::resource_entity_schema().validate(YAML::Load("id: x\n")).ok(),
                             "resource needs only id");
                   }});

  tests.push_back({"archive_index_append_keeps_stats_consistent", [] {
                     auto index = model::default_archive_index();
                     model::ArchivedItem item;
                     item.id = "proj_1";
                     item.type = model::ArchivedType::Project;
                     item.original_path = "Projects/p1";
                     item.archived_to = "Orion/Archive/projects/2025-06/p1";
                     item.archived_at = "2025-06-02T00:00:00Z";
                     item.reason = model::ArchiveReason::Completed;
                     index.append(item);
                     item.id = "area_1";
                     item.type = model::ArchivedType::Area;
                     item.reason = model::ArchiveReason::Inactive;
                     index.append(item);
                     require(index.stats.total == 2 && index.stats.projects == 1 &&
                                 index.stats.areas == 1,
                             "counters");
                     require(index.stats_consistent(), "consistent");

                     const auto node = YAML::convert<model::ArchiveIndex>::encode(index);
                     require(model::archive_index_schema().validate(node).ok(), "validates");
                     index.stats.total = 5;
                     require(!index.stats_consistent(), "tampered stats detected");
                   }});

  tests.push_back({"generated_ids_have_prefix_and_suffix", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 50; ++i) {
                       const auto id = model::generate_project_id();
                       require(model::is_valid_id(id, model::kProjectIdPrefix), id);
                       seen.insert(id);
                     }
                     require(seen.size() == 50, "ids are unique");
                     require(model::id_prefix("cont_abc") == "cont", "prefix");
                     require(model::id_suffix("cont_abc") == "abc", "suffix");
                     require(!model::id_prefix("noprefix").has_value(), "no underscore");
                     require(!model::is_valid_id("proj_ABCDEFGHIJKL", "proj"), "uppercase");
                   }});
}
