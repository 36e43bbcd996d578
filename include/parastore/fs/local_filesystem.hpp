#pragma once

#include "parastore/fs/filesystem.hpp"

#include <filesystem>

namespace parastore::fs {

class LocalFileSystem final : public FileSystem {
public:
  explicit LocalFileSystem(std::filesystem::path base_dir);

  [[nodiscard]] common::Result<bool> exists(const std::string &path) const override;
  [[nodiscard]] common::Result<std::string> read_text(const std::string &path) const override;
  [[nodiscard]] common::Status write_text(const std::string &path,
                                          const std::string &content) override;
  [[nodiscard]] common::Status copy_file(const std::string &from, const std::string &to) override;
  [[nodiscard]] common::Status rename(const std::string &from, const std::string &to) override;
  [[nodiscard]] common::Status remove(const std::string &path) override;
  [[nodiscard]] common::Status create_directories(const std::string &path) override;

  [[nodiscard]] const std::filesystem::path &base_dir() const { return base_dir_; }
  // Absolute location of a namespace path; fails for paths escaping the base.
  [[nodiscard]] common::Result<std::filesystem::path> absolute(const std::string &path) const;

private:
  std::filesystem::path base_dir_;
};

} // namespace parastore::fs
