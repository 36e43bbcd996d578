#include "parastore/paths/resolver.hpp"

#include "parastore/common/fs.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace parastore::paths {

namespace {

struct CategoryMapping {
  const char *category;
  const char *relative_dir;
};

constexpr std::array<CategoryMapping, 10> kMappings = {{
    {"projects", "Projects"},
    {"areas", "Areas"},
    {"resources", "Resources"},
    {"archive", "Archive"},
    {"inbox", "Inbox"},
    {"contacts", "Resources/contacts"},
    {"templates", "Resources/templates"},
    {"notes", "Resources/notes"},
    {"procedures", "Resources/procedures"},
    {"preferences", "Resources/preferences"},
}};

constexpr std::array<const char *, 5> kEntityCategories = {
    "contacts", "templates", "notes", "procedures", "preferences"};

const CategoryMapping *find_mapping(const std::string &category) {
  for (const auto &mapping : kMappings) {
    if (category == mapping.category) {
      return &mapping;
    }
  }
  return nullptr;
}

// Canonical directory name for a top-level category, matched case-insensitively.
const char *top_level_dir(const std::string &segment) {
  const std::string lowered = common::to_lower(segment);
  for (const auto &mapping : kMappings) {
    const std::string dir = mapping.relative_dir;
    if (dir.find('/') == std::string::npos && common::to_lower(dir) == lowered) {
      return mapping.relative_dir;
    }
  }
  return nullptr;
}

// Collapses repeated separators and drops a trailing one; a leading separator
// is kept so absolute paths never look namespace-relative.
std::string normalize_separators(const std::string &path) {
  std::string out;
  out.reserve(path.size());
  for (const char ch : path) {
    if (ch == '/' && !out.empty() && out.back() == '/') {
      continue;
    }
    out.push_back(ch);
  }
  if (out.size() > 1 && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

std::vector<std::string> tail(const std::vector<std::string> &segments, const std::size_t from) {
  if (from >= segments.size()) {
    return {};
  }
  return {segments.begin() + static_cast<std::ptrdiff_t>(from), segments.end()};
}

} // namespace

std::string_view resolve_error_name(const ResolveErrorCode code) {
  return code == ResolveErrorCode::InvalidCategory ? "INVALID_CATEGORY" : "NOT_PARA_PATH";
}

PathResolver::PathResolver(std::string root_name, std::string scheme)
    : root_(std::move(root_name)), scheme_(std::move(scheme)) {}

const std::vector<std::string> &PathResolver::categories() {
  static const std::vector<std::string> kCategories = [] {
    std::vector<std::string> names;
    for (const auto &mapping : kMappings) {
      names.emplace_back(mapping.category);
    }
    return names;
  }();
  return kCategories;
}

bool PathResolver::is_entity_category(const std::string &category) {
  return std::any_of(kEntityCategories.begin(), kEntityCategories.end(),
                     [&category](const char *name) { return category == name; });
}

bool PathResolver::is_para_path(const std::string &path) const {
  if (path.empty()) {
    return false;
  }
  const std::string normalized = normalize_separators(path);
  return normalized == root_ || common::starts_with(normalized, root_ + "/");
}

std::string PathResolver::build_path(const std::vector<std::string> &segments) const {
  std::vector<std::string> parts{root_};
  for (const auto &segment : segments) {
    for (auto &piece : common::path_segments(segment)) {
      parts.push_back(std::move(piece));
    }
  }
  return common::join(parts, '/');
}

ResolveResult<std::string> PathResolver::resolve(const std::string &address) const {
  const std::string prefix = scheme_ + "://";
  if (address.size() >= prefix.size() &&
      common::to_lower(address.substr(0, prefix.size())) == common::to_lower(prefix)) {
    return resolve_category_path(address.substr(prefix.size()));
  }

  if (is_para_path(address)) {
    return ResolveResult<std::string>::success(resolve_rooted(common::path_segments(address)));
  }

  const auto segments = common::path_segments(address);
  if (!segments.empty() && !common::starts_with(address, "/") &&
      find_mapping(common::to_lower(segments.front())) != nullptr) {
    return resolve_category_path(address);
  }

  return ResolveResult<std::string>::failure(
      ResolveError{.code = ResolveErrorCode::NotParaPath,
                   .message = "Path '" + address + "' is not a valid PARA path",
                   .path = address,
                   .category = {},
                   .valid = {}});
}

ResolveResult<std::string> PathResolver::resolve_category_path(const std::string &rest) const {
  const auto segments = common::path_segments(rest);
  if (segments.empty()) {
    return ResolveResult<std::string>::success(root_);
  }

  const std::string category = common::to_lower(segments.front());
  const CategoryMapping *mapping = find_mapping(category);
  if (mapping == nullptr) {
    return ResolveResult<std::string>::failure(
        ResolveError{.code = ResolveErrorCode::InvalidCategory,
                     .message = "Invalid category '" + category +
                                "'. Valid categories: " + common::join(categories(), ','),
                     .path = rest,
                     .category = category,
                     .valid = categories()});
  }

  std::string resolved = root_ + "/" + mapping->relative_dir;
  const auto remainder = tail(segments, 1);
  if (!remainder.empty()) {
    resolved += "/" + common::join(remainder, '/');
    if (is_entity_category(category) && !common::ends_with(remainder.back(), kEntityExtension)) {
      resolved += kEntityExtension;
    }
  }
  return ResolveResult<std::string>::success(std::move(resolved));
}

std::string PathResolver::resolve_rooted(const std::vector<std::string> &segments) const {
  std::vector<std::string> parts = segments;
  if (parts.size() >= 2) {
    if (const char *dir = top_level_dir(parts[1]); dir != nullptr) {
      parts[1] = dir;
    }
  }
  return common::join(parts, '/');
}

ResolveResult<std::string> PathResolver::to_logical_address(const std::string &path) const {
  if (!is_para_path(path)) {
    return ResolveResult<std::string>::failure(
        ResolveError{.code = ResolveErrorCode::NotParaPath,
                     .message = "Path '" + path + "' is not a valid PARA path",
                     .path = path,
                     .category = {},
                     .valid = {}});
  }

  const auto segments = common::path_segments(path);
  const std::string prefix = scheme_ + "://";
  if (segments.size() == 1) {
    return ResolveResult<std::string>::success(prefix);
  }

  const char *dir = top_level_dir(segments[1]);
  if (dir == nullptr) {
    // No category maps here; the rooted form is itself a valid address.
    return ResolveResult<std::string>::success(common::join(segments, '/'));
  }

  const std::string category = common::to_lower(dir);
  if (category == "resources" && segments.size() >= 3 && is_entity_category(segments[2])) {
    const auto remainder = tail(segments, 3);
    if (remainder.empty()) {
      return ResolveResult<std::string>::success(prefix + segments[2]);
    }
    if (common::ends_with(remainder.back(), kEntityExtension)) {
      return ResolveResult<std::string>::success(prefix + segments[2] + "/" +
                                                 common::join(remainder, '/'));
    }
  }

  const auto remainder = tail(segments, 2);
  if (remainder.empty()) {
    return ResolveResult<std::string>::success(prefix + category);
  }
  return ResolveResult<std::string>::success(prefix + category + "/" +
                                             common::join(remainder, '/'));
}

} // namespace parastore::paths
