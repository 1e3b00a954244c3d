#ifndef LOADPLAN_DATE_UTILS
#define LOADPLAN_DATE_UTILS

#include <chrono>  // for duration, system_clock, time_point
#include <string>
#include <string_view>

namespace loadplan {

using timestamp =
  std::chrono::time_point<std::chrono::system_clock, std::chrono::seconds>;
using minutes = std::chrono::minutes;

auto
now() -> timestamp;

// ISO-8601 in UTC, e.g. 2024-03-01T08:30:00Z
auto
to_iso8601(timestamp) -> std::string;

auto
parse_date(std::string_view) -> timestamp;

// Accepts "YYYY-MM-DDTHH:MM:SS", with or without a trailing 'Z', a space in
// place of the 'T', or a bare date.
auto
parse_datetime(std::string_view) -> timestamp;

} // namespace loadplan

#endif
