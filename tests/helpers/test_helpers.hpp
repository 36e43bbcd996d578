#pragma once

#include "parastore/config/schema.hpp"
#include "parastore/fs/filesystem.hpp"
#include "parastore/fs/local_filesystem.hpp"
#include "parastore/observability/observer.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace parastore::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  void create_dir(const std::string &name) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;
  [[nodiscard]] bool exists(const std::string &name) const;

  [[nodiscard]] std::shared_ptr<fs::LocalFileSystem> filesystem() const;

private:
  std::filesystem::path path_;
};

config::Config temp_config(const TempWorkspace &workspace);

// Wraps a real filesystem and fails chosen operations on paths containing a
// fragment. Mutating calls are counted so tests can assert "nothing changed".
class FaultInjectingFileSystem final : public fs::FileSystem {
public:
  enum class Op { Exists, Read, Write, Copy, Rename, Remove, CreateDirectories };

  explicit FaultInjectingFileSystem(std::shared_ptr<fs::FileSystem> inner);

  void fail(Op op, std::string path_fragment);
  void clear_faults() { faults_.clear(); }
  [[nodiscard]] std::size_t mutations() const { return mutations_; }
  [[nodiscard]] const std::vector<std::string> &renames() const { return renames_; }

  [[nodiscard]] common::Result<bool> exists(const std::string &path) const override;
  [[nodiscard]] common::Result<std::string> read_text(const std::string &path) const override;
  [[nodiscard]] common::Status write_text(const std::string &path,
                                          const std::string &content) override;
  [[nodiscard]] common::Status copy_file(const std::string &from, const std::string &to) override;
  [[nodiscard]] common::Status rename(const std::string &from, const std::string &to) override;
  [[nodiscard]] common::Status remove(const std::string &path) override;
  [[nodiscard]] common::Status create_directories(const std::string &path) override;

private:
  struct Fault {
    Op op;
    std::string fragment;
  };

  [[nodiscard]] bool should_fail(Op op, const std::string &path) const;
  [[nodiscard]] static common::Error injected(const std::string &path);

  std::shared_ptr<fs::FileSystem> inner_;
  std::vector<Fault> faults_;
  std::size_t mutations_ = 0;
  std::vector<std::string> renames_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override {
    events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::size_t n = 0;
    for (const auto &event : events) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }

  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;
};

// Installs a RecordingObserver as the global observer for one scope.
class ObserverScope {
public:
  ObserverScope();
  ~ObserverScope();

  ObserverScope(const ObserverScope &) = delete;
  ObserverScope &operator=(const ObserverScope &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

} // namespace parastore::testing
