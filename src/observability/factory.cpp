#include "parastore/observability/factory.hpp"

#include "parastore/common/fs.hpp"
#include "parastore/observability/log_observer.hpp"
#include "parastore/observability/multi_observer.hpp"

#include <algorithm>
#include <fstream>
#include <optional>

namespace parastore::observability {

common::Result<std::vector<Backend>> parse_backends(const std::string &spec) {
  using R = common::Result<std::vector<Backend>>;
  std::vector<Backend> backends;
  for (const auto &part : common::split(spec, ',')) {
    const std::string name = common::to_lower(common::trim(part));
    std::optional<Backend> backend;
    if (name == "log") {
      backend = Backend::Log;
    } else if (name == "file") {
      backend = Backend::File;
    } else if (name != "none") {
      return R::failure(common::make_error(common::ErrorCode::ValidationError,
                                           "Unknown observability backend: '" + name + "'"));
    }
    if (backend.has_value() &&
        std::find(backends.begin(), backends.end(), *backend) == backends.end()) {
      backends.push_back(*backend);
    }
  }
  return R::success(std::move(backends));
}

common::Result<std::unique_ptr<IObserver>> create_observer(const config::Config &config) {
  using R = common::Result<std::unique_ptr<IObserver>>;
  const auto backends = parse_backends(config.observability.backend);
  if (!backends.ok()) {
    return R::failure(backends.error());
  }

  std::vector<std::unique_ptr<IObserver>> observers;
  for (const auto backend : backends.value()) {
    if (backend == Backend::Log) {
      observers.push_back(std::make_unique<LogObserver>());
      continue;
    }
    const std::string path = common::expand_path(config.observability.log_path);
    if (path.empty()) {
      return R::failure(common::make_error(common::ErrorCode::ValidationError,
                                           "observability.backend 'file' needs a log_path"));
    }
    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!*file) {
      return R::failure(
          common::make_error(common::ErrorCode::WriteError, "Unable to open log file: " + path));
    }
    observers.push_back(std::make_unique<LogObserver>(std::move(file)));
  }

  if (observers.empty()) {
    return R::success(nullptr);
  }
  if (observers.size() == 1) {
    return R::success(std::move(observers.front()));
  }
  return R::success(std::make_unique<MultiObserver>(std::move(observers)));
}

} // namespace parastore::observability
