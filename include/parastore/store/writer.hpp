#pragma once

#include "parastore/common/result.hpp"
#include "parastore/fs/filesystem.hpp"
#include "parastore/schema/schema.hpp"
#include "parastore/store/index_store.hpp"

#include <yaml-cpp/yaml.h>

#include <memory>
#include <optional>
#include <string>

namespace parastore::store {

struct WriteOptions {
  bool validate = true;
  bool update_index = true;
  bool create_backup = true;
};

struct DeleteOptions {
  bool remove_from_index = true;
  bool create_backup = true;
};

// Atomic create/update/delete of single entity files. The entity file is the
// source of truth: index synchronisation afterwards is best-effort and its
// failures are reported to the observer, never to the caller.
class EntityWriter {
public:
  EntityWriter(std::shared_ptr<fs::FileSystem> fs, std::shared_ptr<IndexStore> indexes);

  // ValidationError, FsError, BackupError, WriteError or RenameError.
  [[nodiscard]] common::Status write(const std::string &path, const YAML::Node &entity,
                                     const schema::Schema &schema,
                                     const WriteOptions &options = {});

  template <typename T>
  [[nodiscard]] common::Status write(const std::string &path, const T &entity,
                                     const schema::Schema &schema,
                                     const WriteOptions &options = {}) {
    return write(path, YAML::convert<T>::encode(entity), schema, options);
  }

  // NotFound, FsError, BackupError or DeleteError.
  [[nodiscard]] common::Status remove(const std::string &path, const DeleteOptions &options = {});

private:
  [[nodiscard]] common::Status write_unchecked(const std::string &path, const YAML::Node &entity,
                                               const schema::Schema &schema,
                                               const WriteOptions &options);
  [[nodiscard]] common::Status remove_unchecked(const std::string &path,
                                                const DeleteOptions &options);
  void sync_upsert(const std::string &path, const YAML::Node &entity);
  void sync_remove(const std::string &path, const std::string &id);
  [[nodiscard]] std::optional<std::string> read_id(const std::string &path) const;

  std::shared_ptr<fs::FileSystem> fs_;
  std::shared_ptr<IndexStore> indexes_;
};

} // namespace parastore::store
