#ifndef LOADPLAN_LOADPLAN_HXX
#define LOADPLAN_LOADPLAN_HXX

#include <string>

namespace loadplan {

auto
project() -> const char*;

auto
version() -> const char*;

auto
usage() -> std::string;

} // namespace loadplan

#endif
