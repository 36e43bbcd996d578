#pragma once

#include "parastore/paths/resolver.hpp"
#include "parastore/schema/schema.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace parastore::index {

enum class EntityType {
  Project,
  Area,
  Archive,
  Inbox,
  Contact,
  Note,
  Template,
  Procedure,
  Preference,
};

[[nodiscard]] std::string_view entity_type_name(EntityType type);

inline constexpr const char *kIndexFileName = "_index.yaml";
inline constexpr const char *kQueueFileName = "_queue.yaml";
inline constexpr int kIndexVersion = 1;

// Static category -> index file mapping. Paths are namespace-relative
// ("Orion/Projects/_index.yaml").
class CategoryRegistry {
public:
  explicit CategoryRegistry(std::string root_name = paths::kDefaultRootName);

  [[nodiscard]] std::string index_path_for(EntityType type) const;
  [[nodiscard]] static std::string_view list_key_for(EntityType type);
  [[nodiscard]] static const schema::Schema &index_schema_for(EntityType type);

  // Category of the entity stored at `path`, decided by its leading segments
  // alone. Index files themselves, paths outside the root and bare category
  // directories have no entity type.
  [[nodiscard]] std::optional<EntityType> entity_type_from_path(const std::string &path) const;

  // The archive index belongs to the archival engine, not the entity writer.
  [[nodiscard]] static bool writer_maintains_index(EntityType type);

  [[nodiscard]] const std::string &root() const { return root_; }

private:
  std::string root_;
};

} // namespace parastore::index
