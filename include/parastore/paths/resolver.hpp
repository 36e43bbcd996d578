#pragma once

#include "parastore/common/result.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace parastore::paths {

inline constexpr const char *kDefaultRootName = "Orion";
inline constexpr const char *kDefaultScheme = "para";
inline constexpr const char *kEntityExtension = ".yaml";

inline constexpr const char *kProjectsDir = "Projects";
inline constexpr const char *kAreasDir = "Areas";
inline constexpr const char *kResourcesDir = "Resources";
inline constexpr const char *kArchiveDir = "Archive";
inline constexpr const char *kInboxDir = "Inbox";

enum class ResolveErrorCode { NotParaPath, InvalidCategory };

[[nodiscard]] std::string_view resolve_error_name(ResolveErrorCode code);

struct ResolveError {
  ResolveErrorCode code = ResolveErrorCode::NotParaPath;
  std::string message;
  std::string path;
  std::string category;
  std::vector<std::string> valid;
};

template <typename T> using ResolveResult = common::Result<T, ResolveError>;

// Maps logical addresses onto namespace-relative physical paths:
//   para://projects/q1        -> Orion/Projects/q1
//   Orion/Projects/q1         -> Orion/Projects/q1
//   projects/q1               -> Orion/Projects/q1
//   para://contacts/john      -> Orion/Resources/contacts/john.yaml
class PathResolver {
public:
  explicit PathResolver(std::string root_name = kDefaultRootName,
                        std::string scheme = kDefaultScheme);

  [[nodiscard]] ResolveResult<std::string> resolve(const std::string &address) const;

  // Inverse of resolve(). Yields a scheme address when one maps back to the
  // same path, otherwise the normalised root-relative path.
  [[nodiscard]] ResolveResult<std::string> to_logical_address(const std::string &path) const;

  // True for exactly the root or "<root>/..." (so "OrionExtra/x" is not).
  [[nodiscard]] bool is_para_path(const std::string &path) const;

  [[nodiscard]] std::string build_path(const std::vector<std::string> &segments) const;

  [[nodiscard]] const std::string &root() const { return root_; }
  [[nodiscard]] const std::string &scheme() const { return scheme_; }

  // Logical category names accepted after the scheme.
  [[nodiscard]] static const std::vector<std::string> &categories();
  // Categories whose final segment receives the storage extension.
  [[nodiscard]] static bool is_entity_category(const std::string &category);

private:
  [[nodiscard]] ResolveResult<std::string> resolve_category_path(const std::string &rest) const;
  [[nodiscard]] std::string resolve_rooted(const std::vector<std::string> &segments) const;

  std::string root_;
  std::string scheme_;
};

} // namespace parastore::paths
