#pragma once

#include "parastore/common/error.hpp"
#include "parastore/common/result.hpp"
#include "parastore/fs/filesystem.hpp"
#include "parastore/model/archive.hpp"
#include "parastore/model/area.hpp"
#include "parastore/model/project.hpp"
#include "parastore/store/index_store.hpp"
#include "parastore/store/reader.hpp"

#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace parastore::archive {

inline constexpr const char *kArchivedProjectsDir = "projects";
inline constexpr const char *kArchivedAreasDir = "areas";

// Thrown by the archive entry points. Codes: NotArchivable, AlreadyArchived,
// NotFound, FsError.
class ArchiveError : public std::runtime_error {
public:
  ArchiveError(common::ErrorCode code, const std::string &message,
               std::exception_ptr cause = nullptr);

  [[nodiscard]] common::ErrorCode code() const noexcept { return code_; }
  [[nodiscard]] const std::exception_ptr &cause() const noexcept { return cause_; }
  [[nodiscard]] common::Error to_error() const;

private:
  common::ErrorCode code_;
  std::exception_ptr cause_;
};

struct ArchiveResult {
  // Namespace-relative, e.g. "Orion/Archive/projects/2025-12/p1".
  std::string archived_to;
  std::string archived_at;
  // As passed by the caller, e.g. "Projects/p1".
  std::string original_path;
};

struct ArchiveInitResult {
  std::vector<std::string> created;
  std::vector<std::string> skipped;
  bool index_created = false;
};

struct ArchivalOptions {
  // Drop the archived id from Projects/ or Areas/ index afterwards.
  bool clean_source_index = true;
};

[[nodiscard]] bool can_archive_project(const model::ProjectMeta &project);
[[nodiscard]] bool can_archive_area(const model::AreaMeta &area);

// "YYYY-MM" of an RFC 3339 timestamp in UTC, or nullopt if it does not parse.
[[nodiscard]] std::optional<std::string> year_month(const std::string &timestamp);

// "<root>/Archive/<projects|areas>/<YYYY-MM>/<dirname>".
[[nodiscard]] std::optional<std::string> archive_path_for(const std::string &root,
                                                          model::ArchivedType type,
                                                          const std::string &dirname,
                                                          const std::string &updated_at);

class ArchivalEngine {
public:
  ArchivalEngine(std::shared_ptr<fs::FileSystem> fs, std::shared_ptr<store::IndexStore> indexes,
                 ArchivalOptions options = {});

  // `original_path` is root-relative ("Projects/p1"); a leading root segment
  // is tolerated. Throws ArchiveError.
  ArchiveResult archive_project(const model::ProjectMeta &project,
                                const std::string &original_path);
  ArchiveResult archive_area(const model::AreaMeta &area, const std::string &original_path);

  // Creates Archive/, Archive/projects/, Archive/areas/ and an empty archive
  // index where missing.
  [[nodiscard]] common::Result<ArchiveInitResult> init_archive();
  [[nodiscard]] common::Result<model::ArchiveIndex> load_archive_index() const;

  [[nodiscard]] std::string archive_index_path() const;

private:
  struct Request {
    model::ArchivedType type;
    std::string id;
    std::string name;
    std::string status;
    std::string updated_at;
    model::ArchiveReason reason;
    bool archivable;
  };

  ArchiveResult archive_entity(const Request &request, const std::string &original_path);
  [[nodiscard]] common::Result<std::uint64_t> append_to_index(model::ArchivedItem item);
  void clean_source_index(const Request &request);

  std::shared_ptr<fs::FileSystem> fs_;
  std::shared_ptr<store::IndexStore> indexes_;
  store::EntityReader reader_;
  ArchivalOptions options_;
};

} // namespace parastore::archive
