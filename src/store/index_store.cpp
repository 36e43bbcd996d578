#include "parastore/store/index_store.hpp"

#include "parastore/common/time.hpp"
#include "parastore/store/atomic_file.hpp"

#include <utility>

namespace parastore::store {

IndexStore::IndexStore(std::shared_ptr<fs::FileSystem> fs, index::CategoryRegistry registry,
                       const bool create_missing)
    : fs_(std::move(fs)), registry_(std::move(registry)), create_missing_(create_missing) {}

std::unique_lock<std::mutex> IndexStore::lock(const std::string &path) {
  std::mutex *path_mutex = nullptr;
  {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    auto &slot = locks_[path];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    path_mutex = slot.get();
  }
  return std::unique_lock<std::mutex>(*path_mutex);
}

common::Result<index::IndexDocument> IndexStore::read_document(const index::EntityType type,
                                                               const bool create_if_absent) const {
  using R = common::Result<index::IndexDocument>;
  const std::string path = registry_.index_path_for(type);
  const std::string key(index::CategoryRegistry::list_key_for(type));

  const auto exists = fs_->exists(path);
  if (!exists.ok()) {
    return R::failure(common::rewrap(common::ErrorCode::FsError,
                                     "Failed to check index " + path, exists.error()));
  }
  if (!exists.value()) {
    if (!create_if_absent) {
      return R::failure(
          common::make_error(common::ErrorCode::NotFound, "Index not found: " + path));
    }
    return R::success(index::IndexDocument::empty(key, common::now_rfc3339()));
  }

  const auto text = fs_->read_text(path);
  if (!text.ok()) {
    return R::failure(
        common::rewrap(common::ErrorCode::ReadError, "Failed to read index " + path, text.error()));
  }
  auto document = index::IndexDocument::parse(text.value(), key);
  if (!document.ok()) {
    return R::failure(common::rewrap(common::ErrorCode::ParseError, "Invalid index " + path,
                                     document.error()));
  }
  return document;
}

common::Status IndexStore::write_document(const std::string &path,
                                          const index::IndexDocument &document) {
  const auto text = document.serialize();
  if (!text.ok()) {
    return common::Status::failure(text.error());
  }
  const auto written = write_atomic(*fs_, path, text.value(), true);
  if (!written.ok()) {
    return common::Status::failure(written.error());
  }
  return common::Status::success();
}

common::Result<index::IndexDocument> IndexStore::load(const index::EntityType type) const {
  return read_document(type, false);
}

common::Result<index::UpsertOutcome> IndexStore::upsert(const index::EntityType type,
                                                        const YAML::Node &entity) {
  using R = common::Result<index::UpsertOutcome>;
  const std::string path = registry_.index_path_for(type);
  const auto held = lock(path);

  auto document = read_document(type, create_missing_);
  if (!document.ok()) {
    return R::failure(document.error());
  }
  auto outcome = document.value().upsert(entity);
  if (!outcome.ok()) {
    return outcome;
  }
  document.value().touch(common::now_rfc3339());
  if (const auto written = write_document(path, document.value()); !written.ok()) {
    return R::failure(written.error());
  }
  return outcome;
}

common::Result<bool> IndexStore::remove(const index::EntityType type, const std::string &id) {
  using R = common::Result<bool>;
  const std::string path = registry_.index_path_for(type);
  const auto held = lock(path);

  auto document = read_document(type, false);
  if (!document.ok()) {
    if (document.error().code == common::ErrorCode::NotFound) {
      return R::success(false);
    }
    return R::failure(document.error());
  }
  if (!document.value().remove(id)) {
    return R::success(false);
  }
  document.value().touch(common::now_rfc3339());
  if (const auto written = write_document(path, document.value()); !written.ok()) {
    return R::failure(written.error());
  }
  return R::success(true);
}

} // namespace parastore::store
