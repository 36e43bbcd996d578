#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace parastore::model {

inline constexpr const char *kProjectIdPrefix = "proj";
inline constexpr const char *kAreaIdPrefix = "area";
inline constexpr const char *kContactIdPrefix = "cont";
inline constexpr const char *kInboxIdPrefix = "inbox";
inline constexpr const char *kResourceIdPrefix = "res";
inline constexpr const char *kTemplateIdPrefix = "tmpl";

inline constexpr std::size_t kIdSuffixLength = 12;

// "<prefix>_" followed by 12 characters from [0-9a-z].
[[nodiscard]] std::string generate_id(const std::string &prefix);
[[nodiscard]] std::string generate_project_id();
[[nodiscard]] std::string generate_area_id();
[[nodiscard]] std::string generate_contact_id();
[[nodiscard]] std::string generate_inbox_id();
[[nodiscard]] std::string generate_resource_id();
[[nodiscard]] std::string generate_template_id();

[[nodiscard]] bool is_valid_id(const std::string &id, const std::string &prefix);
[[nodiscard]] std::optional<std::string> id_prefix(const std::string &id);
[[nodiscard]] std::optional<std::string> id_suffix(const std::string &id);

} // namespace parastore::model
