#pragma once

#include "parastore/common/result.hpp"

#include <string>

namespace parastore::fs {

// Filesystem capability scoped to a home-relative namespace. Every path is
// relative to the namespace base ("Orion/Projects/p1/_meta.yaml"). Failures are
// reported as FsError with the underlying exception as cause; callers re-label
// them with their own error codes.
class FileSystem {
public:
  virtual ~FileSystem() = default;

  [[nodiscard]] virtual common::Result<bool> exists(const std::string &path) const = 0;
  [[nodiscard]] virtual common::Result<std::string> read_text(const std::string &path) const = 0;
  [[nodiscard]] virtual common::Status write_text(const std::string &path,
                                                  const std::string &content) = 0;
  // Overwrites `to` if it exists.
  [[nodiscard]] virtual common::Status copy_file(const std::string &from,
                                                 const std::string &to) = 0;
  // Single rename(2); works for files and directories.
  [[nodiscard]] virtual common::Status rename(const std::string &from, const std::string &to) = 0;
  [[nodiscard]] virtual common::Status remove(const std::string &path) = 0;
  [[nodiscard]] virtual common::Status create_directories(const std::string &path) = 0;
};

} // namespace parastore::fs
