#pragma once

#include "parastore/common/result.hpp"
#include "parastore/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace parastore::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

// Hard problems fail; soft ones come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

// Directory the store root lives in, with `~` and `$VAR` expanded.
[[nodiscard]] common::Result<std::filesystem::path> resolve_home_dir(const Config &config);

void apply_env_overrides(Config &config);

} // namespace parastore::config
