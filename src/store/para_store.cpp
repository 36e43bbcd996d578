#include "parastore/store/para_store.hpp"

#include "parastore/config/config.hpp"
#include "parastore/fs/local_filesystem.hpp"
#include "parastore/observability/global.hpp"

#include <chrono>
#include <utility>

namespace parastore::store {

namespace {

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

StoreOptions StoreOptions::from_config(const config::Config &config) {
  StoreOptions options;
  options.root_name = config.store.root_name;
  options.scheme = config.store.scheme;
  options.create_missing_index = config.index.create_missing;
  options.clean_source_index = config.archive.clean_source_index;
  return options;
}

ParaStore::ParaStore(std::shared_ptr<fs::FileSystem> fs, StoreOptions options)
    : fs_(std::move(fs)), resolver_(options.root_name, options.scheme),
      indexes_(std::make_shared<IndexStore>(fs_, index::CategoryRegistry(options.root_name),
                                            options.create_missing_index)),
      reader_(fs_), writer_(fs_, indexes_),
      archival_(fs_, indexes_,
                archive::ArchivalOptions{.clean_source_index = options.clean_source_index}) {}

common::Result<std::unique_ptr<ParaStore>> ParaStore::open(const config::Config &config) {
  using R = common::Result<std::unique_ptr<ParaStore>>;
  const auto validated = config::validate_config(config);
  if (!validated.ok()) {
    return R::failure(validated.error());
  }
  const auto home = config::resolve_home_dir(config);
  if (!home.ok()) {
    return R::failure(home.error());
  }
  auto fs = std::make_shared<fs::LocalFileSystem>(home.value());
  return R::success(std::make_unique<ParaStore>(std::move(fs), StoreOptions::from_config(config)));
}

paths::ResolveResult<std::string> ParaStore::resolve(const std::string &address) const {
  return resolver_.resolve(address);
}

paths::ResolveResult<std::string> ParaStore::to_logical_address(const std::string &path) const {
  return resolver_.to_logical_address(path);
}

common::Result<YAML::Node> ParaStore::read(const std::string &path, const schema::Schema &schema,
                                           const ReadOptions &options) const {
  return reader_.read(path, schema, options);
}

common::Status ParaStore::write(const std::string &path, const YAML::Node &entity,
                                const schema::Schema &schema, const WriteOptions &options) {
  const auto start = std::chrono::steady_clock::now();
  auto result = writer_.write(path, entity, schema, options);
  observability::record_latency("write", elapsed_since(start));
  return result;
}

common::Status ParaStore::remove(const std::string &path, const DeleteOptions &options) {
  const auto start = std::chrono::steady_clock::now();
  auto result = writer_.remove(path, options);
  observability::record_latency("delete", elapsed_since(start));
  return result;
}

archive::ArchiveResult ParaStore::archive_project(const model::ProjectMeta &project,
                                                  const std::string &original_path) {
  const auto start = std::chrono::steady_clock::now();
  auto result = archival_.archive_project(project, original_path);
  observability::record_latency("archive_project", elapsed_since(start));
  return result;
}

archive::ArchiveResult ParaStore::archive_area(const model::AreaMeta &area,
                                               const std::string &original_path) {
  const auto start = std::chrono::steady_clock::now();
  auto result = archival_.archive_area(area, original_path);
  observability::record_latency("archive_area", elapsed_since(start));
  return result;
}

common::Result<archive::ArchiveInitResult> ParaStore::init_archive() {
  return archival_.init_archive();
}

common::Result<model::ArchiveIndex> ParaStore::load_archive_index() const {
  return archival_.load_archive_index();
}

} // namespace parastore::store
