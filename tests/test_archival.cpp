#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parastore/archive/archival.hpp"
#include "parastore/common/time.hpp"
#include "parastore/common/yaml_codec.hpp"
#include "parastore/index/registry.hpp"
#include "parastore/store/index_store.hpp"

#include <functional>

namespace {

parastore::model::ProjectMeta completed_project(const std::string &updated_at) {
  parastore::model::ProjectMeta project;
  project.id = "proj_1";
  project.name = "Launch";
  project.status = parastore::model::ProjectStatus::Completed;
  project.created_at = "2025-01-01T00:00:00Z";
  project.updated_at = updated_at;
  return project;
}

parastore::model::AreaMeta dormant_area() {
  parastore::model::AreaMeta area;
  area.id = "area_1";
  area.name = "Old hobby";
  area.status = parastore::model::AreaStatus::Dormant;
  area.created_at = "2024-01-01T00:00:00Z";
  area.updated_at = "2026-02-10T08:00:00Z";
  return area;
}

struct ArchiveFixture {
  parastore::testing::TempWorkspace ws;
  std::shared_ptr<parastore::testing::FaultInjectingFileSystem> fs;
  std::shared_ptr<parastore::store::IndexStore> indexes;
  std::unique_ptr<parastore::archive::ArchivalEngine> engine;

  explicit ArchiveFixture(parastore::archive::ArchivalOptions options = {}) {
    ws.create_file("Orion/Projects/p1/_meta.yaml", "id: proj_1\nstatus: completed\n");
    ws.create_file("Orion/Areas/hobby/_meta.yaml", "id: area_1\nstatus: dormant\n");
    fs = std::make_shared<parastore::testing::FaultInjectingFileSystem>(ws.filesystem());
    indexes = std::make_shared<parastore::store::IndexStore>(
        fs, parastore::index::CategoryRegistry());
    engine = std::make_unique<parastore::archive::ArchivalEngine>(fs, indexes, options);
  }
};

parastore::common::ErrorCode archive_error_code(const std::function<void()> &fn) {
  try {
    fn();
  } catch (const parastore::archive::ArchiveError &err) {
    return err.code();
  }
  throw std::runtime_error("expected ArchiveError");
}

} // namespace

void register_archival_tests(std::vector<parastore::tests::TestCase> &tests) {
  using parastore::tests::require;
  namespace archive = parastore::archive;
  namespace model = parastore::model;
  namespace common = parastore::common;
  namespace index = parastore::index;
  namespace pt = parastore::testing;
  using Op = pt::FaultInjectingFileSystem::Op;

  tests.push_back({"archive_predicates_follow_status", [] {
                     auto project = completed_project("2025-01-01T00:00:00Z");
                     require(archive::can_archive_project(project), "completed");
                     project.status = model::ProjectStatus::Cancelled;
                     require(!archive::can_archive_project(project), "cancelled is not enough");
                     auto area = dormant_area();
                     require(archive::can_archive_area(area), "dormant");
                     area.status = model::AreaStatus::Active;
                     require(!archive::can_archive_area(area), "active area");
                   }});

  tests.push_back({"archive_path_buckets_by_utc_month", [] {
                     require(archive::year_month("2025-12-31T23:59:59Z") == "2025-12", "last second");
                     require(archive::year_month("2026-01-01T00:30:00+01:00") == "2025-12",
                             "offset shifts month");
                     require(!archive::year_month("not a date").has_value(), "invalid");
                     require(archive::archive_path_for("Orion", model::ArchivedType::Area, "hobby",
                                                       "2026-02-10T08:00:00Z") ==
                                 "Orion/Archive/areas/2026-02/hobby",
                             "area path");
                   }});

  tests.push_back({"archive_project_moves_directory_and_records_item", [] {
                     ArchiveFixture f;
                     const auto result = f.engine->archive_project(
                         completed_project("2025-12-31T23:59:59Z"), "Projects/p1");
                     require(result.archived_to == "Orion/Archive/projects/2025-12/p1",
                             result.archived_to);
                     require(result.original_path == "Projects/p1", "original path");
                     require(common::is_rfc3339(result.archived_at), "archived_at timestamp");
                     require(!f.ws.exists("Orion/Projects/p1"), "source moved");
                     require(f.ws.exists("Orion/Archive/projects/2025-12/p1/_meta.yaml"),
                             "tree at destination");

                     const auto loaded = f.engine->load_archive_index();
                     require(loaded.ok(), "index readable");
                     const auto &idx = loaded.value();
                     require(idx.archived_items.size() == 1, "one item");
                     require(idx.archived_items[0].reason == model::ArchiveReason::Completed,
                             "reason");
                     require(idx.archived_items[0].title == "Launch", "title");
                     require(idx.stats.total == 1 && idx.stats.projects == 1 && idx.stats.areas == 0,
                             "stats");
                   }});

  tests.push_back({"archive_area_uses_inactive_reason", [] {
                     ArchiveFixture f;
                     const auto result = f.engine->archive_area(dormant_area(), "Areas/hobby");
                     require(result.archived_to == "Orion/Archive/areas/2026-02/hobby",
                             result.archived_to);
                     const auto loaded = f.engine->load_archive_index();
                     require(loaded.ok(), "index readable");
                     require(loaded.value().archived_items[0].reason ==
                                 model::ArchiveReason::Inactive,
                             "inactive");
                     require(loaded.value().stats.areas == 1, "area counter");
                   }});

  tests.push_back({"archive_stats_stay_consistent_across_calls", [] {
                     ArchiveFixture f;
                     f.ws.create_file("Orion/Projects/p2/_meta.yaml", "id: proj_2\n");
                     auto second = completed_project("2025-03-01T00:00:00Z");
                     second.id = "proj_2";
                     (void)f.engine->archive_project(completed_project("2025-03-01T00:00:00Z"),
                                                     "Projects/p1");
                     (void)f.engine->archive_project(second, "Orion/Projects/p2");
                     (void)f.engine->archive_area(dormant_area(), "Areas/hobby");
                     const auto loaded = f.engine->load_archive_index();
                     require(loaded.ok(), "index readable");
                     const auto &stats = loaded.value().stats;
                     require(stats.total == loaded.value().archived_items.size(), "total");
                     require(stats.projects + stats.areas == stats.total, "split");
                     require(stats.projects == 2, "projects");
                     require(loaded.value().stats_consistent(), "per-type counts");
                   }});

  tests.push_back({"archive_rejects_unarchivable_without_mutation", [] {
                     ArchiveFixture f;
                     auto project = completed_project("2025-01-01T00:00:00Z");
                     project.status = model::ProjectStatus::Active;
                     std::string message;
                     try {
                       (void)f.engine->archive_project(project, "Projects/p1");
                     } catch (const archive::ArchiveError &err) {
                       require(err.code() == common::ErrorCode::NotArchivable, "code");
                       message = err.what();
                     }
                     require(message.find("Launch") != std::string::npos &&
                                 message.find("active") != std::string::npos,
                             message);
                     require(f.fs->mutations() == 0, "no filesystem mutation");
                     require(f.ws.exists("Orion/Projects/p1"), "source untouched");
                   }});

  tests.push_back({"archive_rejects_already_archived_paths", [] {
                     ArchiveFixture f;
                     const auto code = archive_error_code([&f] {
                       (void)f.engine->archive_project(completed_project("2025-01-01T00:00:00Z"),
                                                       "Archive/projects/2025-01/p1");
                     });
                     require(code == common::ErrorCode::AlreadyArchived, "already archived");
                     require(f.fs->mutations() == 0, "no mutation");
                   }});

  tests.push_back({"archive_missing_source_is_not_found", [] {
                     ArchiveFixture f;
                     const auto code = archive_error_code([&f] {
                       (void)f.engine->archive_project(completed_project("2025-01-01T00:00:00Z"),
                                                       "Projects/ghost");
                     });
                     require(code == common::ErrorCode::NotFound, "not found");
                   }});

  tests.push_back({"archive_existing_destination_is_fs_error", [] {
                     ArchiveFixture f;
                     f.ws.create_dir("Orion/Archive/projects/2025-01/p1");
                     const auto code = archive_error_code([&f] {
                       (void)f.engine->archive_project(completed_project("2025-01-05T00:00:00Z"),
                                                       "Projects/p1");
                     });
                     require(code == common::ErrorCode::FsError, "fs error");
                     require(f.ws.exists("Orion/Projects/p1/_meta.yaml"), "source kept");
                   }});

  tests.push_back({"archive_rolls_back_when_index_write_fails", [] {
                     ArchiveFixture f;
                     pt::ObserverScope scope;
                     f.fs->fail(Op::Write, "Archive/_index.yaml");
                     const auto code = archive_error_code([&f] {
                       (void)f.engine->archive_project(completed_project("2025-07-01T00:00:00Z"),
                                                       "Projects/p1");
                     });
                     require(code == common::ErrorCode::FsError, "fs error");
                     require(f.ws.exists("Orion/Projects/p1/_meta.yaml"), "source restored");
                     require(!f.ws.exists("Orion/Archive/projects/2025-07/p1"), "no archived copy");
                     require(!f.ws.exists("Orion/Archive/_index.yaml"), "no index");
                     require(scope.observer()
                                     .count<parastore::observability::ArchiveRollbackEvent>() == 1,
                             "rollback reported");
                   }});

  tests.push_back({"archive_rolls_back_on_corrupt_index", [] {
                     ArchiveFixture f;
                     f.ws.create_file("Orion/Archive/_index.yaml", "archived_items: [oops\n");
                     const auto code = archive_error_code([&f] {
                       (void)f.engine->archive_project(completed_project("2025-07-01T00:00:00Z"),
                                                       "Projects/p1");
                     });
                     require(code == common::ErrorCode::FsError, "fs error");
                     require(f.ws.exists("Orion/Projects/p1"), "source restored");
                     require(f.ws.read_file("Orion/Archive/_index.yaml") ==
                                 "archived_items: [oops\n",
                             "corrupt index not overwritten");
                   }});

  tests.push_back({"archive_cleans_source_index_when_enabled", [] {
                     ArchiveFixture f;
                     require(f.indexes->upsert(index::EntityType::Project,
                                               YAML::Load("id: proj_1\nstatus: completed\n"))
                                 .ok(),
                             "seed index");
                     (void)f.engine->archive_project(completed_project("2025-07-01T00:00:00Z"),
                                                     "Projects/p1");
                     const auto listed = f.indexes->load(index::EntityType::Project);
                     require(listed.ok() && !listed.value().contains("proj_1"), "removed");
                   }});

  tests.push_back({"archive_keeps_source_index_when_disabled", [] {
                     ArchiveFixture f(archive::ArchivalOptions{.clean_source_index = false});
                     require(f.indexes->upsert(index::EntityType::Project,
                                               YAML::Load("id: proj_1\nstatus: completed\n"))
                                 .ok(),
                             "seed index");
                     (void)f.engine->archive_project(completed_project("2025-07-01T00:00:00Z"),
                                                     "Projects/p1");
                     const auto listed = f.indexes->load(index::EntityType::Project);
                     require(listed.ok() && listed.value().contains("proj_1"), "kept");
                   }});

  tests.push_back({"init_archive_is_idempotent", [] {
                     ArchiveFixture f;
                     const auto first = f.engine->init_archive();
                     require(first.ok(), "first init");
                     require(first.value().created.size() == 3, "three dirs created");
                     require(first.value().index_created, "index created");
                     const auto second = f.engine->init_archive();
                     require(second.ok(), "second init");
                     require(second.value().created.empty() && second.value().skipped.size() == 3,
                             "all skipped");
                     require(!second.value().index_created, "index kept");
                     const auto loaded = f.engine->load_archive_index();
                     require(loaded.ok() && loaded.value().archived_items.empty(), "empty index");
                   }});

  tests.push_back({"load_archive_index_uses_reader_errors", [] {
                     ArchiveFixture f;
                     const auto missing = f.engine->load_archive_index();
                     require(!missing.ok() && missing.error().code == common::ErrorCode::NotFound,
                             "not found");
                     f.ws.create_file("Orion/Archive/_index.yaml", "version: 0\n");
                     const auto invalid = f.engine->load_archive_index();
                     require(!invalid.ok() &&
                                 invalid.error().code == common::ErrorCode::ValidationError,
                             "validation error");
                   }});
}
