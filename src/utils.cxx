#include "utils.hxx"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <numbers>

namespace loadplan {

namespace {
constexpr double EARTH_RADIUS_KM = 6371.0;

auto
radians(double degrees) -> double
{
  return degrees * std::numbers::pi / 180.0;
}
} // namespace

void
to_lower(std::string& value)
{
  std::transform(value.begin(), value.end(), value.begin(), [](auto chr) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  });
}

auto
lowered(std::string_view value) -> std::string
{
  std::string result(value);
  to_lower(result);
  return result;
}

auto
iequals(std::string_view lhs, std::string_view rhs) -> bool
{
  return std::ranges::equal(lhs, rhs, [](char left, char right) {
    return std::tolower(static_cast<unsigned char>(left)) ==
           std::tolower(static_cast<unsigned char>(right));
  });
}

auto
contains_any(std::string_view haystack,
             std::initializer_list<std::string_view> needles) -> bool
{
  return std::ranges::any_of(needles, [haystack](auto needle) {
    return haystack.find(needle) != std::string_view::npos;
  });
}

auto
haversine_km(double latFrom, double lonFrom, double latTo, double lonTo)
  -> double
{
  auto dLat = radians(latTo - latFrom);
  auto dLon = radians(lonTo - lonFrom);
  auto hav = std::sin(dLat / 2) * std::sin(dLat / 2) +
             std::cos(radians(latFrom)) * std::cos(radians(latTo)) *
               std::sin(dLon / 2) * std::sin(dLon / 2);
  return EARTH_RADIUS_KM * 2 * std::atan2(std::sqrt(hav), std::sqrt(1 - hav));
}

} // namespace loadplan
