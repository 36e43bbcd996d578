#pragma once

#include "parastore/common/result.hpp"
#include "parastore/fs/filesystem.hpp"
#include "parastore/schema/schema.hpp"

#include <yaml-cpp/yaml.h>

#include <memory>
#include <string>

namespace parastore::store {

struct ReadOptions {
  bool validate = true;
};

// Converts a validated node into T through YAML::convert<T>. A node the
// converter rejects is reported as ValidationError.
template <typename T>
[[nodiscard]] common::Result<T> decode_entity(const YAML::Node &node, const std::string &path) {
  try {
    T value{};
    if (!YAML::convert<T>::decode(node, value)) {
      return common::Result<T>::failure(common::make_error(
          common::ErrorCode::ValidationError, "Entity at " + path + " has an unexpected shape"));
    }
    return common::Result<T>::success(std::move(value));
  } catch (const YAML::Exception &ex) {
    return common::Result<T>::failure(
        common::make_error(common::ErrorCode::ValidationError,
                           "Entity at " + path + " has an unexpected shape: " + ex.msg,
                           std::current_exception()));
  }
}

class EntityReader {
public:
  explicit EntityReader(std::shared_ptr<const fs::FileSystem> fs);

  // NotFound, ReadError, ParseError, ValidationError or FsError. Parsing
  // happens even when validation is off.
  [[nodiscard]] common::Result<YAML::Node> read(const std::string &path,
                                                const schema::Schema &schema,
                                                const ReadOptions &options = {}) const;

  template <typename T>
  [[nodiscard]] common::Result<T> read(const std::string &path, const schema::Schema &schema,
                                       const ReadOptions &options = {}) const {
    auto node = read(path, schema, options);
    if (!node.ok()) {
      return common::Result<T>::failure(node.error());
    }
    return decode_entity<T>(node.value(), path);
  }

private:
  [[nodiscard]] common::Result<YAML::Node> read_unchecked(const std::string &path,
                                                          const schema::Schema &schema,
                                                          const ReadOptions &options) const;

  std::shared_ptr<const fs::FileSystem> fs_;
};

} // namespace parastore::store
