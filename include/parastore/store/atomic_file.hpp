#pragma once

#include "parastore/common/result.hpp"
#include "parastore/fs/filesystem.hpp"

#include <string>

namespace parastore::store {

inline constexpr const char *kBackupSuffix = ".bak";
inline constexpr const char *kTempSuffix = ".tmp";

// Owns a `.tmp` file for the duration of a write and removes it on every exit
// path unless release() is called after the rename landed.
class TempFileGuard {
public:
  TempFileGuard(fs::FileSystem &fs, std::string path);
  ~TempFileGuard();

  TempFileGuard(const TempFileGuard &) = delete;
  TempFileGuard &operator=(const TempFileGuard &) = delete;

  [[nodiscard]] const std::string &path() const { return path_; }
  void release() { armed_ = false; }

private:
  fs::FileSystem &fs_;
  std::string path_;
  bool armed_ = true;
};

struct AtomicWriteOutcome {
  bool existed = false;
  bool backed_up = false;
};

// exists -> copy to .bak (only if present and requested) -> write .tmp ->
// rename over the target. Failures map to FsError, BackupError, WriteError and
// RenameError respectively; the target is never touched unless the rename
// succeeds.
[[nodiscard]] common::Result<AtomicWriteOutcome> write_atomic(fs::FileSystem &fs,
                                                              const std::string &path,
                                                              const std::string &content,
                                                              bool create_backup);

} // namespace parastore::store
