#include <fmt/format.h>
#include <loadplan/loadplan.hxx>
#include <loadplan/version.hxx>

namespace loadplan {

auto
project() -> const char*
{
  return LOADPLAN_PROJECT_NAME;
}

auto
version() -> const char*
{
  return LOADPLAN_VERSION_STRING;
}

auto
usage() -> std::string
{
  return fmt::format("{}-{}", project(), version());
}

} // namespace loadplan
