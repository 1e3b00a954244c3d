#include "date_utils.hxx"
#include "errors.hxx"
#include <date/date.h>
#include <fmt/format.h>
#include <sstream>

namespace loadplan {

namespace {
auto
try_parse(std::string_view text, const char* format, timestamp& result) -> bool
{
  std::istringstream stream{ std::string(text) };
  stream >> date::parse(format, result);
  return not stream.fail();
}
} // namespace

auto
now() -> timestamp
{
  return std::chrono::floor<std::chrono::seconds>(
    std::chrono::system_clock::now());
}

auto
to_iso8601(timestamp value) -> std::string
{
  return date::format("%FT%TZ", value);
}

auto
parse_date(std::string_view dateString) -> timestamp
{
  timestamp result;

  if (not try_parse(dateString, "%F", result)) {
    throw Error(fmt::format("Unparseable date '{}'", dateString));
  }
  return result;
}

auto
parse_datetime(std::string_view dateString) -> timestamp
{
  timestamp result;

  for (const auto* format : { "%FT%T", "%F %T", "%FT%R", "%F %R" }) {
    if (try_parse(dateString, format, result)) {
      return result;
    }
  }
  return parse_date(dateString);
}

} // namespace loadplan
