#include "location_index.hxx"
#include "utils.hxx"
#include <fmt/format.h>
#include <stdexcept>

namespace loadplan {

auto
LocationIndex::build(const std::vector<Truck>& trucks,
                     const std::vector<Order>& orders) -> LocationIndex
{
  LocationIndex index;

  for (const auto& truck : trucks) {
    index.add(truck.warehouse);
  }

  for (const auto& order : orders) {
    index.add(order.ship_from);
  }

  for (const auto& order : orders) {
    index.add(order.ship_to);
  }
  return index;
}

auto
LocationIndex::add(const std::string& name) -> std::pair<size_t, bool>
{
  auto key = lowered(name);

  if (auto found = mNodes.find(key); found != mNodes.end()) {
    return { found->second, false };
  }
  auto node = mNames.size();
  mNames.push_back(name);
  mNodes.emplace(std::move(key), node);
  return { node, true };
}

auto
LocationIndex::contains(std::string_view name) const -> bool
{
  return mNodes.contains(lowered(name));
}

auto
LocationIndex::node(std::string_view name) const -> size_t
{
  if (auto found = mNodes.find(lowered(name)); found != mNodes.end()) {
    return found->second;
  }
  throw std::out_of_range(fmt::format("Unknown location '{}'", name));
}

auto
LocationIndex::name(size_t node) const -> const std::string&
{
  return mNames.at(node);
}

auto
LocationIndex::names() const -> const std::vector<std::string>&
{
  return mNames;
}

auto
LocationIndex::size() const -> size_t
{
  return mNames.size();
}

} // namespace loadplan
