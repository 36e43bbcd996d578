#include "parastore/archive/archival.hpp"

#include "parastore/common/fs.hpp"
#include "parastore/common/time.hpp"
#include "parastore/common/yaml_codec.hpp"
#include "parastore/observability/global.hpp"
#include "parastore/paths/resolver.hpp"
#include "parastore/store/atomic_file.hpp"

#include <utility>

namespace parastore::archive {

namespace {

std::string archived_subdir(const model::ArchivedType type) {
  return type == model::ArchivedType::Project ? kArchivedProjectsDir : kArchivedAreasDir;
}

std::string parent_of(const std::string &path) {
  const auto pos = path.rfind('/');
  return pos == std::string::npos ? std::string() : path.substr(0, pos);
}

} // namespace

ArchiveError::ArchiveError(const common::ErrorCode code, const std::string &message,
                           std::exception_ptr cause)
    : std::runtime_error(message), code_(code), cause_(std::move(cause)) {}

common::Error ArchiveError::to_error() const { return common::make_error(code_, what(), cause_); }

bool can_archive_project(const model::ProjectMeta &project) {
  return project.status == model::ProjectStatus::Completed;
}

bool can_archive_area(const model::AreaMeta &area) {
  return area.status == model::AreaStatus::Dormant;
}

std::optional<std::string> year_month(const std::string &timestamp) {
  const auto parsed = common::parse_rfc3339(timestamp);
  if (!parsed.has_value()) {
    return std::nullopt;
  }
  return common::utc_year_month(*parsed);
}

std::optional<std::string> archive_path_for(const std::string &root,
                                            const model::ArchivedType type,
                                            const std::string &dirname,
                                            const std::string &updated_at) {
  const auto month = year_month(updated_at);
  if (!month.has_value() || dirname.empty()) {
    return std::nullopt;
  }
  return root + "/" + paths::kArchiveDir + "/" + archived_subdir(type) + "/" + *month + "/" +
         dirname;
}

ArchivalEngine::ArchivalEngine(std::shared_ptr<fs::FileSystem> fs,
                               std::shared_ptr<store::IndexStore> indexes, ArchivalOptions options)
    : fs_(std::move(fs)), indexes_(std::move(indexes)), reader_(fs_), options_(options) {}

std::string ArchivalEngine::archive_index_path() const {
  return indexes_->registry().index_path_for(index::EntityType::Archive);
}

ArchiveResult ArchivalEngine::archive_project(const model::ProjectMeta &project,
                                              const std::string &original_path) {
  return archive_entity(Request{.type = model::ArchivedType::Project,
                                .id = project.id,
                                .name = project.name,
                                .status = std::string(model::to_string(project.status)),
                                .updated_at = project.updated_at,
                                .reason = model::ArchiveReason::Completed,
                                .archivable = can_archive_project(project)},
                        original_path);
}

ArchiveResult ArchivalEngine::archive_area(const model::AreaMeta &area,
                                           const std::string &original_path) {
  return archive_entity(Request{.type = model::ArchivedType::Area,
                                .id = area.id,
                                .name = area.name,
                                .status = std::string(model::to_string(area.status)),
                                .updated_at = area.updated_at,
                                .reason = model::ArchiveReason::Inactive,
                                .archivable = can_archive_area(area)},
                        original_path);
}

ArchiveResult ArchivalEngine::archive_entity(const Request &request,
                                             const std::string &original_path) {
  const std::string kind = request.type == model::ArchivedType::Project ? "Project" : "Area";
  const std::string &root = indexes_->registry().root();

  if (!request.archivable) {
    throw ArchiveError(common::ErrorCode::NotArchivable,
                       kind + " \"" + request.name + "\" cannot be archived (status: " +
                           request.status + ")");
  }

  auto segments = common::path_segments(original_path);
  if (!segments.empty() && segments.front() == root) {
    segments.erase(segments.begin());
  }
  if (!segments.empty() && common::to_lower(segments.front()) == common::to_lower(paths::kArchiveDir)) {
    throw ArchiveError(common::ErrorCode::AlreadyArchived,
                       kind + " \"" + request.name + "\" is already archived: " + original_path);
  }

  const std::string dirname = segments.empty() ? request.name : segments.back();
  const auto destination = archive_path_for(root, request.type, dirname, request.updated_at);
  if (!destination.has_value()) {
    throw ArchiveError(common::ErrorCode::NotArchivable,
                       kind + " \"" + request.name + "\" has no usable updated_at: '" +
                           request.updated_at + "'");
  }

  const std::string parent = parent_of(*destination);
  const auto parent_exists = fs_->exists(parent);
  if (!parent_exists.ok()) {
    throw ArchiveError(common::ErrorCode::FsError,
                       "Failed to check " + parent + ": " + parent_exists.error().message,
                       parent_exists.error().cause);
  }
  if (!parent_exists.value()) {
    if (const auto created = fs_->create_directories(parent); !created.ok()) {
      throw ArchiveError(common::ErrorCode::FsError,
                         "Failed to create " + parent + ": " + created.error().message,
                         created.error().cause);
    }
  }

  const std::string source = segments.empty() ? root : root + "/" + common::join(segments, '/');
  const auto source_exists = fs_->exists(source);
  if (!source_exists.ok()) {
    throw ArchiveError(common::ErrorCode::FsError,
                       "Failed to check " + source + ": " + source_exists.error().message,
                       source_exists.error().cause);
  }
  if (!source_exists.value()) {
    throw ArchiveError(common::ErrorCode::NotFound,
                       kind + " directory not found: " + original_path);
  }

  const auto destination_exists = fs_->exists(*destination);
  if (!destination_exists.ok()) {
    throw ArchiveError(common::ErrorCode::FsError,
                       "Failed to check " + *destination + ": " +
                           destination_exists.error().message,
                       destination_exists.error().cause);
  }
  if (destination_exists.value()) {
    throw ArchiveError(common::ErrorCode::FsError,
                       "Archive destination already exists: " + *destination);
  }

  if (const auto moved = fs_->rename(source, *destination); !moved.ok()) {
    throw ArchiveError(common::ErrorCode::FsError,
                       "Failed to move " + source + " to " + *destination + ": " +
                           moved.error().message,
                       moved.error().cause);
  }

  const std::string archived_at = common::now_rfc3339();
  model::ArchivedItem item;
  item.id = request.id;
  item.type = request.type;
  item.original_path = original_path;
  item.archived_to = *destination;
  item.archived_at = archived_at;
  item.reason = request.reason;
  if (!request.name.empty()) {
    item.title = request.name;
  }

  const auto appended = append_to_index(std::move(item));
  if (!appended.ok()) {
    const auto rolled_back = fs_->rename(*destination, source);
    observability::record_archive_rollback(source, *destination, rolled_back.ok());
    std::string message = "Failed to update archive index: " + appended.error().message;
    if (!rolled_back.ok()) {
      message += "; rollback failed: " + rolled_back.error().message;
    }
    throw ArchiveError(common::ErrorCode::FsError, message, appended.error().cause);
  }

  observability::record_archived(request.id, std::string(model::to_string(request.type)),
                                 *destination);
  observability::record_metric(observability::ArchiveTotalMetric{.total = appended.value()});

  if (options_.clean_source_index) {
    clean_source_index(request);
  }

  return ArchiveResult{
      .archived_to = *destination, .archived_at = archived_at, .original_path = original_path};
}

common::Result<std::uint64_t> ArchivalEngine::append_to_index(model::ArchivedItem item) {
  using R = common::Result<std::uint64_t>;
  const std::string path = archive_index_path();
  try {
    const auto held = indexes_->lock(path);

    const auto exists = fs_->exists(path);
    if (!exists.ok()) {
      return R::failure(exists.error());
    }

    model::ArchiveIndex archive_index = model::default_archive_index();
    if (exists.value()) {
      auto loaded = reader_.read<model::ArchiveIndex>(path, model::archive_index_schema());
      if (!loaded.ok()) {
        return R::failure(loaded.error());
      }
      archive_index = std::move(loaded.value());
    }

    archive_index.append(std::move(item));
    archive_index.generated_at = common::now_rfc3339();

    const auto text = common::emit_yaml(YAML::convert<model::ArchiveIndex>::encode(archive_index));
    if (!text.ok()) {
      return R::failure(text.error());
    }
    const auto written = store::write_atomic(*fs_, path, text.value(), true);
    if (!written.ok()) {
      return R::failure(written.error());
    }
    return R::success(archive_index.stats.total);
  } catch (...) {
    const auto cause = std::current_exception();
    return R::failure(common::make_error(common::ErrorCode::FsError,
                                         common::describe_exception(cause), cause));
  }
}

void ArchivalEngine::clean_source_index(const Request &request) {
  const auto type = request.type == model::ArchivedType::Project ? index::EntityType::Project
                                                                 : index::EntityType::Area;
  const std::string index_path = indexes_->registry().index_path_for(type);
  try {
    if (const auto removed = indexes_->remove(type, request.id); !removed.ok()) {
      observability::record_index_sync_failed(index_path, "archive", removed.error().message);
    }
  } catch (...) {
    observability::record_index_sync_failed(index_path, "archive",
                                            common::describe_exception(std::current_exception()));
  }
}

common::Result<ArchiveInitResult> ArchivalEngine::init_archive() {
  using R = common::Result<ArchiveInitResult>;
  const std::string &root = indexes_->registry().root();
  const std::string archive_dir = root + "/" + paths::kArchiveDir;
  ArchiveInitResult result;

  for (const auto &dir : {archive_dir, archive_dir + "/" + kArchivedProjectsDir,
                          archive_dir + "/" + kArchivedAreasDir}) {
    const auto exists = fs_->exists(dir);
    if (!exists.ok()) {
      return R::failure(
          common::rewrap(common::ErrorCode::FsError, "Failed to check " + dir, exists.error()));
    }
    if (exists.value()) {
      result.skipped.push_back(dir);
      continue;
    }
    if (const auto created = fs_->create_directories(dir); !created.ok()) {
      return R::failure(
          common::rewrap(common::ErrorCode::FsError, "Failed to create " + dir, created.error()));
    }
    result.created.push_back(dir);
  }

  const std::string path = archive_index_path();
  const auto held = indexes_->lock(path);
  const auto exists = fs_->exists(path);
  if (!exists.ok()) {
    return R::failure(
        common::rewrap(common::ErrorCode::FsError, "Failed to check " + path, exists.error()));
  }
  if (!exists.value()) {
    const auto text =
        common::emit_yaml(YAML::convert<model::ArchiveIndex>::encode(model::default_archive_index()));
    if (!text.ok()) {
      return R::failure(text.error());
    }
    const auto written = store::write_atomic(*fs_, path, text.value(), false);
    if (!written.ok()) {
      return R::failure(written.error());
    }
    result.index_created = true;
  }
  return R::success(std::move(result));
}

common::Result<model::ArchiveIndex> ArchivalEngine::load_archive_index() const {
  return reader_.read<model::ArchiveIndex>(archive_index_path(), model::archive_index_schema());
}

} // namespace parastore::archive
