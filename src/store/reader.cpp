#include "parastore/store/reader.hpp"

#include "parastore/common/yaml_codec.hpp"

#include <utility>

namespace parastore::store {

EntityReader::EntityReader(std::shared_ptr<const fs::FileSystem> fs) : fs_(std::move(fs)) {}

common::Result<YAML::Node> EntityReader::read(const std::string &path,
                                              const schema::Schema &schema,
                                              const ReadOptions &options) const {
  try {
    return read_unchecked(path, schema, options);
  } catch (...) {
    const auto cause = std::current_exception();
    return common::Result<YAML::Node>::failure(
        common::make_error(common::ErrorCode::FsError,
                           "Unexpected error reading " + path + ": " +
                               common::describe_exception(cause),
                           cause));
  }
}

common::Result<YAML::Node> EntityReader::read_unchecked(const std::string &path,
                                                        const schema::Schema &schema,
                                                        const ReadOptions &options) const {
  using R = common::Result<YAML::Node>;

  const auto exists = fs_->exists(path);
  if (!exists.ok()) {
    return R::failure(common::rewrap(common::ErrorCode::FsError,
                                     "Failed to check existence of " + path, exists.error()));
  }
  if (!exists.value()) {
    return R::failure(common::make_error(common::ErrorCode::NotFound, "File not found: " + path));
  }

  const auto text = fs_->read_text(path);
  if (!text.ok()) {
    return R::failure(
        common::rewrap(common::ErrorCode::ReadError, "Failed to read " + path, text.error()));
  }

  auto node = common::parse_yaml(text.value());
  if (!node.ok()) {
    return R::failure(
        common::rewrap(common::ErrorCode::ParseError, "Failed to parse " + path, node.error()));
  }

  if (options.validate) {
    if (const auto valid = schema.validate(node.value()); !valid.ok()) {
      return R::failure(common::rewrap(common::ErrorCode::ValidationError,
                                       "Validation failed for " + path, valid.error()));
    }
  }
  return node;
}

} // namespace parastore::store
