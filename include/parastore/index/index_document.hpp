#pragma once

#include "parastore/common/result.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace parastore::index {

enum class UpsertOutcome { Inserted, Replaced };

// A category index: {version, updated_at, <list_key>: [entries...]}. Entries
// are keyed by their `id`; everything else in the document is carried through
// untouched.
class IndexDocument {
public:
  [[nodiscard]] static IndexDocument empty(std::string list_key, const std::string &timestamp);
  [[nodiscard]] static common::Result<IndexDocument> parse(const std::string &text,
                                                           std::string list_key);

  [[nodiscard]] common::Result<std::string> serialize() const;

  // Replaces the entry carrying the same id in place, else appends.
  // The entity must have a scalar `id`.
  [[nodiscard]] common::Result<UpsertOutcome> upsert(const YAML::Node &entity);
  bool remove(const std::string &id);
  void touch(const std::string &timestamp);

  [[nodiscard]] bool contains(const std::string &id) const;
  [[nodiscard]] std::optional<YAML::Node> find(const std::string &id) const;
  [[nodiscard]] std::vector<std::string> ids() const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] const std::string &list_key() const { return list_key_; }
  [[nodiscard]] const YAML::Node &node() const { return root_; }

private:
  IndexDocument(YAML::Node root, std::string list_key);

  [[nodiscard]] YAML::Node entries() const { return root_[list_key_]; }

  YAML::Node root_;
  std::string list_key_;
};

} // namespace parastore::index
