#include "parastore/store/writer.hpp"

#include "parastore/common/yaml_codec.hpp"
#include "parastore/observability/global.hpp"
#include "parastore/store/atomic_file.hpp"

#include <utility>

namespace parastore::store {

namespace {

common::Error unexpected(const std::string &operation, const std::string &path) {
  const auto cause = std::current_exception();
  return common::make_error(common::ErrorCode::FsError,
                            "Unexpected error during " + operation + " of " + path + ": " +
                                common::describe_exception(cause),
                            cause);
}

} // namespace

EntityWriter::EntityWriter(std::shared_ptr<fs::FileSystem> fs, std::shared_ptr<IndexStore> indexes)
    : fs_(std::move(fs)), indexes_(std::move(indexes)) {}

common::Status EntityWriter::write(const std::string &path, const YAML::Node &entity,
                                   const schema::Schema &schema, const WriteOptions &options) {
  try {
    return write_unchecked(path, entity, schema, options);
  } catch (...) {
    return common::Status::failure(unexpected("write", path));
  }
}

common::Status EntityWriter::write_unchecked(const std::string &path, const YAML::Node &entity,
                                             const schema::Schema &schema,
                                             const WriteOptions &options) {
  if (options.validate) {
    if (const auto valid = schema.validate(entity); !valid.ok()) {
      return common::Status::failure(common::rewrap(
          common::ErrorCode::ValidationError, "Validation failed for " + path, valid.error()));
    }
  }

  const auto text = common::emit_yaml(entity);
  if (!text.ok()) {
    return common::Status::failure(common::rewrap(common::ErrorCode::WriteError,
                                                  "Failed to serialise " + path, text.error()));
  }

  const auto written = write_atomic(*fs_, path, text.value(), options.create_backup);
  if (!written.ok()) {
    return common::Status::failure(written.error());
  }
  observability::record_entity_written(path, !written.value().existed);

  if (options.update_index) {
    sync_upsert(path, entity);
  }
  return common::Status::success();
}

common::Status EntityWriter::remove(const std::string &path, const DeleteOptions &options) {
  try {
    return remove_unchecked(path, options);
  } catch (...) {
    return common::Status::failure(unexpected("delete", path));
  }
}

common::Status EntityWriter::remove_unchecked(const std::string &path,
                                              const DeleteOptions &options) {
  const auto exists = fs_->exists(path);
  if (!exists.ok()) {
    return common::Status::failure(common::rewrap(
        common::ErrorCode::FsError, "Failed to check existence of " + path, exists.error()));
  }
  if (!exists.value()) {
    return common::Status::failure(
        common::make_error(common::ErrorCode::NotFound, "File not found: " + path));
  }

  std::optional<std::string> id;
  if (options.remove_from_index) {
    id = read_id(path);
  }

  if (options.create_backup) {
    if (const auto copied = fs_->copy_file(path, path + kBackupSuffix); !copied.ok()) {
      return common::Status::failure(common::rewrap(common::ErrorCode::BackupError,
                                                    "Failed to back up " + path, copied.error()));
    }
  }

  if (const auto removed = fs_->remove(path); !removed.ok()) {
    return common::Status::failure(
        common::rewrap(common::ErrorCode::DeleteError, "Failed to delete " + path, removed.error()));
  }
  observability::record_entity_deleted(path);

  if (options.remove_from_index && id.has_value()) {
    sync_remove(path, *id);
  }
  return common::Status::success();
}

std::optional<std::string> EntityWriter::read_id(const std::string &path) const {
  const auto text = fs_->read_text(path);
  if (!text.ok()) {
    observability::record_index_sync_failed(path, "remove", "id unreadable: " + text.error().message);
    return std::nullopt;
  }
  const auto node = common::parse_yaml(text.value());
  if (!node.ok()) {
    observability::record_index_sync_failed(path, "remove", "id unreadable: " + node.error().message);
    return std::nullopt;
  }
  return common::scalar_field(node.value(), "id");
}

void EntityWriter::sync_upsert(const std::string &path, const YAML::Node &entity) {
  const auto &registry = indexes_->registry();
  const auto type = registry.entity_type_from_path(path);
  if (!type.has_value() || !index::CategoryRegistry::writer_maintains_index(*type)) {
    return;
  }
  try {
    if (const auto result = indexes_->upsert(*type, entity); !result.ok()) {
      observability::record_index_sync_failed(registry.index_path_for(*type), "upsert",
                                              result.error().message);
    }
  } catch (...) {
    observability::record_index_sync_failed(registry.index_path_for(*type), "upsert",
                                            common::describe_exception(std::current_exception()));
  }
}

void EntityWriter::sync_remove(const std::string &path, const std::string &id) {
  const auto &registry = indexes_->registry();
  const auto type = registry.entity_type_from_path(path);
  if (!type.has_value() || !index::CategoryRegistry::writer_maintains_index(*type)) {
    return;
  }
  try {
    if (const auto result = indexes_->remove(*type, id); !result.ok()) {
      observability::record_index_sync_failed(registry.index_path_for(*type), "remove",
                                              result.error().message);
    }
  } catch (...) {
    observability::record_index_sync_failed(registry.index_path_for(*type), "remove",
                                            common::describe_exception(std::current_exception()));
  }
}

} // namespace parastore::store
