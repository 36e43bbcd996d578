#pragma once

#include "parastore/common/result.hpp"
#include "parastore/fs/filesystem.hpp"
#include "parastore/index/index_document.hpp"
#include "parastore/index/registry.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace parastore::store {

// Read-modify-write access to category index files. Each cycle holds the
// per-path mutex for its index, so in-process callers never interleave on the
// same file. Other processes still race last-writer-wins.
class IndexStore {
public:
  IndexStore(std::shared_ptr<fs::FileSystem> fs, index::CategoryRegistry registry,
             bool create_missing = true);

  [[nodiscard]] common::Result<index::IndexDocument> load(index::EntityType type) const;
  [[nodiscard]] common::Result<index::UpsertOutcome> upsert(index::EntityType type,
                                                            const YAML::Node &entity);
  // False when the id was not listed (the file is then left untouched).
  [[nodiscard]] common::Result<bool> remove(index::EntityType type, const std::string &id);

  // Serialises every read-modify-write of `path` within this process.
  [[nodiscard]] std::unique_lock<std::mutex> lock(const std::string &path);

  [[nodiscard]] const index::CategoryRegistry &registry() const { return registry_; }

private:
  [[nodiscard]] common::Result<index::IndexDocument> read_document(index::EntityType type,
                                                                   bool create_if_absent) const;
  [[nodiscard]] common::Status write_document(const std::string &path,
                                              const index::IndexDocument &document);

  std::shared_ptr<fs::FileSystem> fs_;
  index::CategoryRegistry registry_;
  bool create_missing_;
  std::mutex locks_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

} // namespace parastore::store
