#pragma once

#include "parastore/archive/archival.hpp"
#include "parastore/common/result.hpp"
#include "parastore/config/schema.hpp"
#include "parastore/fs/filesystem.hpp"
#include "parastore/paths/resolver.hpp"
#include "parastore/store/index_store.hpp"
#include "parastore/store/reader.hpp"
#include "parastore/store/writer.hpp"

#include <memory>
#include <string>

namespace parastore::store {

struct StoreOptions {
  std::string root_name = paths::kDefaultRootName;
  std::string scheme = paths::kDefaultScheme;
  bool create_missing_index = true;
  bool clean_source_index = true;

  [[nodiscard]] static StoreOptions from_config(const config::Config &config);
};

// Entry point for callers: resolves addresses and routes physical paths to the
// reader, writer and archival engine, all sharing one filesystem and one
// index lock table.
class ParaStore {
public:
  explicit ParaStore(std::shared_ptr<fs::FileSystem> fs, StoreOptions options = {});

  // Validates the config and roots a LocalFileSystem at store.home_dir.
  [[nodiscard]] static common::Result<std::unique_ptr<ParaStore>>
  open(const config::Config &config);

  [[nodiscard]] paths::ResolveResult<std::string> resolve(const std::string &address) const;
  [[nodiscard]] paths::ResolveResult<std::string>
  to_logical_address(const std::string &path) const;

  [[nodiscard]] common::Result<YAML::Node> read(const std::string &path,
                                                const schema::Schema &schema,
                                                const ReadOptions &options = {}) const;
  template <typename T>
  [[nodiscard]] common::Result<T> read(const std::string &path, const schema::Schema &schema,
                                       const ReadOptions &options = {}) const {
    return reader_.read<T>(path, schema, options);
  }

  [[nodiscard]] common::Status write(const std::string &path, const YAML::Node &entity,
                                     const schema::Schema &schema,
                                     const WriteOptions &options = {});
  template <typename T>
  [[nodiscard]] common::Status write(const std::string &path, const T &entity,
                                     const schema::Schema &schema,
                                     const WriteOptions &options = {}) {
    return write(path, YAML::convert<T>::encode(entity), schema, options);
  }

  [[nodiscard]] common::Status remove(const std::string &path, const DeleteOptions &options = {});

  // Throw archive::ArchiveError.
  archive::ArchiveResult archive_project(const model::ProjectMeta &project,
                                         const std::string &original_path);
  archive::ArchiveResult archive_area(const model::AreaMeta &area,
                                      const std::string &original_path);

  [[nodiscard]] common::Result<archive::ArchiveInitResult> init_archive();
  [[nodiscard]] common::Result<model::ArchiveIndex> load_archive_index() const;

  [[nodiscard]] const paths::PathResolver &resolver() const { return resolver_; }
  [[nodiscard]] IndexStore &indexes() { return *indexes_; }
  [[nodiscard]] fs::FileSystem &filesystem() { return *fs_; }

private:
  std::shared_ptr<fs::FileSystem> fs_;
  paths::PathResolver resolver_;
  std::shared_ptr<IndexStore> indexes_;
  EntityReader reader_;
  EntityWriter writer_;
  archive::ArchivalEngine archival_;
};

} // namespace parastore::store
