#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace parastore::common {

using SysSeconds = std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::string format_rfc3339(SysSeconds when);

// Accepts `YYYY-MM-DDTHH:MM:SS[.fraction](Z|+HH:MM|-HH:MM|+HHMM|-HHMM)`.
// Fractional seconds are truncated.
[[nodiscard]] std::optional<SysSeconds> parse_rfc3339(const std::string &text);
[[nodiscard]] bool is_rfc3339(const std::string &text);

// "YYYY-MM" of the instant, in UTC.
[[nodiscard]] std::string utc_year_month(SysSeconds when);

} // namespace parastore::common
