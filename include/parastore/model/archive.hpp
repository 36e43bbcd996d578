#pragma once

#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace parastore::model {

enum class ArchivedType { Project, Area };
enum class ArchiveReason { Completed, Cancelled, Inactive, Manual };

[[nodiscard]] std::string_view to_string(ArchivedType type);
[[nodiscard]] std::string_view to_string(ArchiveReason reason);
[[nodiscard]] std::optional<ArchivedType> parse_archived_type(const std::string &value);
[[nodiscard]] std::optional<ArchiveReason> parse_archive_reason(const std::string &value);

struct ArchivedItem {
  std::string id;
  ArchivedType type = ArchivedType::Project;
  std::string original_path;
  std::string archived_to;
  std::string archived_at;
  ArchiveReason reason = ArchiveReason::Manual;
  std::optional<std::string> title;
  std::optional<std::string> notes;
};

struct ArchiveStats {
  std::uint64_t total = 0;
  std::uint64_t projects = 0;
  std::uint64_t areas = 0;
};

// `Archive/_index.yaml`. Items and stats live in one document so a single
// atomic write keeps them consistent.
struct ArchiveIndex {
  int version = 1;
  std::string generated_at;
  std::vector<ArchivedItem> archived_items;
  ArchiveStats stats;

  // Appends and bumps `stats.total` plus the per-type counter.
  void append(ArchivedItem item);
  [[nodiscard]] bool stats_consistent() const;
};

[[nodiscard]] ArchiveIndex default_archive_index();

[[nodiscard]] const schema::Schema &archived_item_schema();
[[nodiscard]] const schema::Schema &archive_index_schema();

} // namespace parastore::model

namespace YAML {

template <> struct convert<parastore::model::ArchivedItem> {
  static Node encode(const parastore::model::ArchivedItem &value);
  static bool decode(const Node &node, parastore::model::ArchivedItem &value);
};

template <> struct convert<parastore::model::ArchiveIndex> {
  static Node encode(const parastore::model::ArchiveIndex &value);
  static bool decode(const Node &node, parastore::model::ArchiveIndex &value);
};

} // namespace YAML
