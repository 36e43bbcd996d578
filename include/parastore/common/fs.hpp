#pragma once

#include "parastore/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace parastore::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split(const std::string &value, char separator);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, char separator);

// Splits on '/', dropping empty segments produced by leading, trailing or
// repeated separators.
[[nodiscard]] std::vector<std::string> path_segments(const std::string &path);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] bool is_subpath(const std::filesystem::path &candidate,
                             const std::filesystem::path &parent);

} // namespace parastore::common
