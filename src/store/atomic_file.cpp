#include "parastore/store/atomic_file.hpp"

#include "parastore/observability/global.hpp"

#include <utility>

namespace parastore::store {

TempFileGuard::TempFileGuard(fs::FileSystem &fs, std::string path)
    : fs_(fs), path_(std::move(path)) {}

TempFileGuard::~TempFileGuard() {
  if (!armed_) {
    return;
  }
  const auto present = fs_.exists(path_);
  if (present.ok() && !present.value()) {
    return;
  }
  if (const auto removed = fs_.remove(path_); !removed.ok()) {
    observability::record_error("atomic_file",
                                "Failed to remove " + path_ + ": " + removed.error().message);
  }
}

common::Result<AtomicWriteOutcome> write_atomic(fs::FileSystem &fs, const std::string &path,
                                                 const std::string &content,
                                                 const bool create_backup) {
  using R = common::Result<AtomicWriteOutcome>;
  AtomicWriteOutcome outcome;

  const auto exists = fs.exists(path);
  if (!exists.ok()) {
    return R::failure(common::rewrap(common::ErrorCode::FsError,
                                     "Failed to check existence of " + path, exists.error()));
  }
  outcome.existed = exists.value();

  if (outcome.existed && create_backup) {
    if (const auto copied = fs.copy_file(path, path + kBackupSuffix); !copied.ok()) {
      return R::failure(common::rewrap(common::ErrorCode::BackupError,
                                       "Failed to back up " + path, copied.error()));
    }
    outcome.backed_up = true;
  }

  TempFileGuard temp(fs, path + kTempSuffix);
  if (const auto written = fs.write_text(temp.path(), content); !written.ok()) {
    return R::failure(common::rewrap(common::ErrorCode::WriteError,
                                     "Failed to write " + temp.path(), written.error()));
  }

  if (const auto renamed = fs.rename(temp.path(), path); !renamed.ok()) {
    return R::failure(common::rewrap(common::ErrorCode::RenameError,
                                     "Failed to move " + temp.path() + " into place",
                                     renamed.error()));
  }
  temp.release();
  return R::success(outcome);
}

} // namespace parastore::store
