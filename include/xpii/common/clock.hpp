#pragma once

#include <chrono>
#include <functional>
#include <string>

namespace xpii::common {

using clock_fn = std::function<std::chrono::system_clock::time_point()>;

/// Wall clock used when no clock is injected.
clock_fn system_clock();

/// `YYYY-MM-DDTHH:MM:SSZ` (W3CDTF, UTC, second precision).
std::string format_w3cdtf(std::chrono::system_clock::time_point tp);

/// `YYYY-MM-DDTHH:MM:SS.mmmZ` (RFC3339, UTC, millisecond precision).
std::string format_rfc3339_millis(std::chrono::system_clock::time_point tp);

/// `YYYYMMDDHHMMSS` in local time; the default session id shape.
std::string format_local_compact(std::chrono::system_clock::time_point tp);

}  // namespace xpii::common
