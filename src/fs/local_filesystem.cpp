#include "parastore/fs/local_filesystem.hpp"

#include "parastore/common/fs.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace parastore::fs {

namespace {

common::Error fs_failure(const std::string &what, const std::filesystem::path &p1,
                         const std::error_code &ec) {
  return common::make_error(
      common::ErrorCode::FsError, what + ": " + p1.string() + ": " + ec.message(),
      std::make_exception_ptr(std::filesystem::filesystem_error(what, p1, ec)));
}

common::Error fs_failure(const std::string &what, const std::filesystem::path &p1,
                         const std::filesystem::path &p2, const std::error_code &ec) {
  return common::make_error(
      common::ErrorCode::FsError,
      what + ": " + p1.string() + " -> " + p2.string() + ": " + ec.message(),
      std::make_exception_ptr(std::filesystem::filesystem_error(what, p1, p2, ec)));
}

} // namespace

LocalFileSystem::LocalFileSystem(std::filesystem::path base_dir)
    : base_dir_(base_dir.lexically_normal()) {
  if (!base_dir_.has_filename() && base_dir_ != base_dir_.root_path()) {
    base_dir_ = base_dir_.parent_path();
  }
}

common::Result<std::filesystem::path> LocalFileSystem::absolute(const std::string &path) const {
  const auto full = (base_dir_ / std::filesystem::path(path)).lexically_normal();
  if (!common::is_subpath(full, base_dir_)) {
    return common::Result<std::filesystem::path>::failure(
        fs_failure("path escapes namespace", full,
                   std::make_error_code(std::errc::permission_denied)));
  }
  return common::Result<std::filesystem::path>::success(full);
}

common::Result<bool> LocalFileSystem::exists(const std::string &path) const {
  auto full = absolute(path);
  if (!full.ok()) {
    return common::Result<bool>::failure(full.error());
  }
  std::error_code ec;
  const bool found = std::filesystem::exists(full.value(), ec);
  if (ec) {
    return common::Result<bool>::failure(fs_failure("exists", full.value(), ec));
  }
  return common::Result<bool>::success(found);
}

common::Result<std::string> LocalFileSystem::read_text(const std::string &path) const {
  auto full = absolute(path);
  if (!full.ok()) {
    return common::Result<std::string>::failure(full.error());
  }
  std::ifstream in(full.value(), std::ios::binary);
  if (!in) {
    return common::Result<std::string>::failure(
        fs_failure("open for reading", full.value(), std::make_error_code(std::errc::io_error)));
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return common::Result<std::string>::failure(
        fs_failure("read", full.value(), std::make_error_code(std::errc::io_error)));
  }
  return common::Result<std::string>::success(buffer.str());
}

common::Status LocalFileSystem::write_text(const std::string &path, const std::string &content) {
  auto full = absolute(path);
  if (!full.ok()) {
    return common::Status::failure(full.error());
  }
  std::ofstream out(full.value(), std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::failure(
        fs_failure("open for writing", full.value(), std::make_error_code(std::errc::io_error)));
  }
  out << content;
  out.close();
  if (!out) {
    return common::Status::failure(
        fs_failure("write", full.value(), std::make_error_code(std::errc::io_error)));
  }
  return common::Status::success();
}

common::Status LocalFileSystem::copy_file(const std::string &from, const std::string &to) {
  auto src = absolute(from);
  auto dst = absolute(to);
  if (!src.ok()) {
    return common::Status::failure(src.error());
  }
  if (!dst.ok()) {
    return common::Status::failure(dst.error());
  }
  std::error_code ec;
  std::filesystem::copy_file(src.value(), dst.value(),
                             std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return common::Status::failure(fs_failure("copy", src.value(), dst.value(), ec));
  }
  return common::Status::success();
}

common::Status LocalFileSystem::rename(const std::string &from, const std::string &to) {
  auto src = absolute(from);
  auto dst = absolute(to);
  if (!src.ok()) {
    return common::Status::failure(src.error());
  }
  if (!dst.ok()) {
    return common::Status::failure(dst.error());
  }
  std::error_code ec;
  std::filesystem::rename(src.value(), dst.value(), ec);
  if (ec) {
    return common::Status::failure(fs_failure("rename", src.value(), dst.value(), ec));
  }
  return common::Status::success();
}

common::Status LocalFileSystem::remove(const std::string &path) {
  auto full = absolute(path);
  if (!full.ok()) {
    return common::Status::failure(full.error());
  }
  std::error_code ec;
  const bool removed = std::filesystem::remove(full.value(), ec);
  if (ec) {
    return common::Status::failure(fs_failure("remove", full.value(), ec));
  }
  if (!removed) {
    return common::Status::failure(fs_failure(
        "remove", full.value(), std::make_error_code(std::errc::no_such_file_or_directory)));
  }
  return common::Status::success();
}

common::Status LocalFileSystem::create_directories(const std::string &path) {
  auto full = absolute(path);
  if (!full.ok()) {
    return common::Status::failure(full.error());
  }
  std::error_code ec;
  std::filesystem::create_directories(full.value(), ec);
  if (ec) {
    return common::Status::failure(fs_failure("create directories", full.value(), ec));
  }
  return common::Status::success();
}

} // namespace parastore::fs
