#pragma once

#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>
#include <vector>

namespace parastore::model {

// Contact card stored as `Resources/contacts/<slug>.yaml`.
struct ContactCard {
  std::string id;
  std::string name;
  std::string type; // person | organization
  std::optional<std::string> email;
  std::optional<std::string> phone;
  std::optional<std::string> company;
  std::optional<std::string> role;
  std::optional<std::string> relationship;
  std::optional<std::string> notes;
  std::string created_at;
  std::string updated_at;
  std::vector<std::string> tags;
  std::vector<std::string> projects;
};

[[nodiscard]] const schema::Schema &contact_card_schema();
[[nodiscard]] const schema::Schema &contact_index_schema();

} // namespace parastore::model

namespace YAML {

template <> struct convert<parastore::model::ContactCard> {
  static Node encode(const parastore::model::ContactCard &value);
  static bool decode(const Node &node, parastore::model::ContactCard &value);
};

} // namespace YAML
