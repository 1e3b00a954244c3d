#ifndef LOADPLAN_UTILS
#define LOADPLAN_UTILS

#include <initializer_list>
#include <string>
#include <string_view>

namespace loadplan {

void
to_lower(std::string&);

auto
lowered(std::string_view) -> std::string;

auto
iequals(std::string_view, std::string_view) -> bool;

// True when any of the needles occurs in the (already lowered) haystack.
auto
contains_any(std::string_view, std::initializer_list<std::string_view>)
  -> bool;

// Great-circle distance between two (latitude, longitude) pairs in degrees.
auto
haversine_km(double, double, double, double) -> double;

} // namespace loadplan

#endif
