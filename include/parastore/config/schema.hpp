#pragma once

#include <string>

namespace parastore::config {

struct StoreConfig {
  // Directory holding the root; empty means $HOME.
  std::string home_dir;
  std::string root_name = "Orion";
  std::string scheme = "para";
};

struct IndexConfig {
  bool create_missing = true;
};

struct ArchiveConfig {
  bool clean_source_index = true;
};

struct ObservabilityConfig {
  // "none", "log", "file" or a comma-separated list of them.
  std::string backend = "log";
  // Target of the "file" backend, appended to.
  std::string log_path;
};

struct Config {
  StoreConfig store;
  IndexConfig index;
  ArchiveConfig archive;
  ObservabilityConfig observability;
};

} // namespace parastore::config
