#pragma once

#include "parastore/common/result.hpp"
#include "parastore/config/schema.hpp"
#include "parastore/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace parastore::observability {

enum class Backend { Log, File };

// Parses `observability.backend`. "none" contributes nothing, duplicates
// collapse, and an empty or unknown name is a ValidationError.
[[nodiscard]] common::Result<std::vector<Backend>> parse_backends(const std::string &spec);

// Yields nullptr when no backend is selected; the global record helpers treat
// that as disabled.
[[nodiscard]] common::Result<std::unique_ptr<IObserver>>
create_observer(const config::Config &config);

} // namespace parastore::observability
