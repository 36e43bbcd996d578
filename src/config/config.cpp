#include "parastore/config/config.hpp"

#include "parastore/common/fs.hpp"
#include "parastore/common/toml.hpp"
#include "parastore/observability/factory.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace parastore::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".parastore";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("PARASTORE_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

bool is_valid_root_name(const std::string &name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  return name.find('/') == std::string::npos && name.find('\\') == std::string::npos;
}

bool is_valid_scheme(const std::string &scheme) {
  if (scheme.empty() || std::isalpha(static_cast<unsigned char>(scheme.front())) == 0) {
    return false;
  }
  for (const char ch : scheme) {
    const auto c = static_cast<unsigned char>(ch);
    if (std::isalnum(c) == 0 && ch != '+' && ch != '-' && ch != '.') {
      return false;
    }
  }
  return true;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path);
    }
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *home = std::getenv("PARASTORE_HOME"); home != nullptr && *home) {
    config.store.home_dir = home;
  }
  if (const char *root = std::getenv("PARASTORE_ROOT"); root != nullptr && *root) {
    config.store.root_name = root;
  }
  if (const char *backend = std::getenv("PARASTORE_OBSERVABILITY");
      backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }

  const auto &doc = parsed.value();
  Config config;
  config.store.home_dir = doc.get_string("store.home_dir", config.store.home_dir);
  config.store.root_name = doc.get_string("store.root_name", config.store.root_name);
  config.store.scheme = doc.get_string("store.scheme", config.store.scheme);
  config.index.create_missing = doc.get_bool("index.create_missing", config.index.create_missing);
  config.archive.clean_source_index =
      doc.get_bool("archive.clean_source_index", config.archive.clean_source_index);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_path =
      doc.get_string("observability.log_path", config.observability.log_path);
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::make_error(
        common::ErrorCode::ReadError, "Unable to open config file: " + path.string()));
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(
        common::rewrap(common::ErrorCode::ParseError, "Invalid config " + path.string(),
                       config.error()));
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::failure(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::failure(common::make_error(
          common::ErrorCode::WriteError,
          "Failed to create config directory: " + ensure_ec.message()));
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::failure(
        common::make_error(common::ErrorCode::WriteError, "Unable to write temporary config file"));
  }

  file << "[store]\n";
  if (!config.store.home_dir.empty()) {
    file << "home_dir = " << common::quote_toml_string(config.store.home_dir) << "\n";
  }
  file << "root_name = " << common::quote_toml_string(config.store.root_name) << "\n";
  file << "scheme = " << common::quote_toml_string(config.store.scheme) << "\n";

  file << "\n[index]\n";
  file << "create_missing = " << bool_to_toml(config.index.create_missing) << "\n";

  file << "\n[archive]\n";
  file << "clean_source_index = " << bool_to_toml(config.archive.clean_source_index) << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  if (!config.observability.log_path.empty()) {
    file << "log_path = " << common::quote_toml_string(config.observability.log_path) << "\n";
  }

  file.close();
  if (!file) {
    return common::Status::failure(
        common::make_error(common::ErrorCode::WriteError, "Failed writing temporary config file"));
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(tmp_path, cleanup_ec);
    return common::Status::failure(common::make_error(
        common::ErrorCode::RenameError, "Failed to atomically replace config: " + ec.message()));
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;
  const auto invalid = [](const std::string &message) {
    return common::Result<std::vector<std::string>>::failure(
        common::make_error(common::ErrorCode::ValidationError, message));
  };

  if (!is_valid_root_name(config.store.root_name)) {
    return invalid("Invalid store.root_name: '" + config.store.root_name + "'");
  }
  if (!is_valid_scheme(config.store.scheme)) {
    return invalid("Invalid store.scheme: '" + config.store.scheme + "'");
  }
  const auto backends = observability::parse_backends(config.observability.backend);
  if (!backends.ok()) {
    return invalid(backends.error().message);
  }
  for (const auto backend : backends.value()) {
    if (backend == observability::Backend::File && config.observability.log_path.empty()) {
      return invalid("observability.backend 'file' needs observability.log_path");
    }
  }

  if (!config.index.create_missing) {
    warnings.push_back("index.create_missing is off; writes into categories without an index "
                       "will not be indexed");
  }
  if (!config.store.home_dir.empty()) {
    std::error_code ec;
    const std::filesystem::path home(common::expand_path(config.store.home_dir));
    if (!std::filesystem::is_directory(home, ec)) {
      warnings.push_back("store.home_dir does not exist yet: " + home.string());
    }
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<std::filesystem::path> resolve_home_dir(const Config &config) {
  if (!config.store.home_dir.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(config.store.home_dir)));
  }
  return common::home_dir();
}

} // namespace parastore::config
