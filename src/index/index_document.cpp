#include "parastore/index/index_document.hpp"

#include "parastore/common/yaml_codec.hpp"
#include "parastore/index/registry.hpp"

#include <utility>

namespace parastore::index {

namespace {

std::optional<std::string> entry_id(const YAML::Node &entry) {
  if (!entry.IsMap()) {
    return std::nullopt;
  }
  return common::scalar_field(entry, "id");
}

} // namespace

IndexDocument::IndexDocument(YAML::Node root, std::string list_key)
    : root_(std::move(root)), list_key_(std::move(list_key)) {}

IndexDocument IndexDocument::empty(std::string list_key, const std::string &timestamp) {
  YAML::Node root(YAML::NodeType::Map);
  root["version"] = kIndexVersion;
  root["updated_at"] = timestamp;
  root[list_key] = YAML::Node(YAML::NodeType::Sequence);
  return IndexDocument(std::move(root), std::move(list_key));
}

common::Result<IndexDocument> IndexDocument::parse(const std::string &text,
                                                   std::string list_key) {
  auto parsed = common::parse_yaml(text);
  if (!parsed.ok()) {
    return common::Result<IndexDocument>::failure(parsed.error());
  }

  YAML::Node root = parsed.value();
  if (root.IsNull()) {
    root = YAML::Node(YAML::NodeType::Map);
    root["version"] = kIndexVersion;
  }
  if (!root.IsMap()) {
    return common::Result<IndexDocument>::failure(
        common::make_error(common::ErrorCode::ParseError, "Index document is not a mapping"));
  }

  const YAML::Node list = root[list_key];
  if (!list.IsDefined() || list.IsNull()) {
    root[list_key] = YAML::Node(YAML::NodeType::Sequence);
  } else if (!list.IsSequence()) {
    return common::Result<IndexDocument>::failure(common::make_error(
        common::ErrorCode::ParseError, "Index field '" + list_key + "' is not a list"));
  }
  return common::Result<IndexDocument>::success(IndexDocument(root, std::move(list_key)));
}

common::Result<std::string> IndexDocument::serialize() const { return common::emit_yaml(root_); }

common::Result<UpsertOutcome> IndexDocument::upsert(const YAML::Node &entity) {
  const auto id = entry_id(entity);
  if (!id.has_value() || id->empty()) {
    return common::Result<UpsertOutcome>::failure(
        common::make_error(common::ErrorCode::ValidationError, "Index entry has no id"));
  }

  YAML::Node list = root_[list_key_];
  for (std::size_t i = 0; i < list.size(); ++i) {
    if (entry_id(list[i]) == id) {
      list[i] = YAML::Clone(entity);
      return common::Result<UpsertOutcome>::success(UpsertOutcome::Replaced);
    }
  }
  list.push_back(YAML::Clone(entity));
  return common::Result<UpsertOutcome>::success(UpsertOutcome::Inserted);
}

bool IndexDocument::remove(const std::string &id) {
  const YAML::Node list = entries();
  YAML::Node kept(YAML::NodeType::Sequence);
  bool removed = false;
  for (const auto &entry : list) {
    if (entry_id(entry) == id) {
      removed = true;
      continue;
    }
    kept.push_back(entry);
  }
  if (removed) {
    root_[list_key_] = kept;
  }
  return removed;
}

void IndexDocument::touch(const std::string &timestamp) { root_["updated_at"] = timestamp; }

bool IndexDocument::contains(const std::string &id) const { return find(id).has_value(); }

std::optional<YAML::Node> IndexDocument::find(const std::string &id) const {
  for (const auto &entry : entries()) {
    if (entry_id(entry) == id) {
      return entry;
    }
  }
  return std::nullopt;
}

std::vector<std::string> IndexDocument::ids() const {
  std::vector<std::string> out;
  for (const auto &entry : entries()) {
    if (auto id = entry_id(entry); id.has_value()) {
      out.push_back(std::move(*id));
    }
  }
  return out;
}

std::size_t IndexDocument::size() const { return entries().size(); }

} // namespace parastore::index
