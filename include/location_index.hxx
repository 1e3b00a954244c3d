#ifndef LOADPLAN_LOCATION_INDEX
#define LOADPLAN_LOCATION_INDEX

#include "concepts.hxx"
#include "transportation.hxx"
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace loadplan {

/**
 * @brief Order preserving, de-duplicated list of the locations of a batch.
 * @details Each distinct location (compared case-insensitively, first
 * spelling wins) maps to one node index shared by the matrices and the
 * solver.
 */
class LocationIndex
{
private:
  std::vector<std::string> mNames;
  std::unordered_map<std::string, size_t> mNodes;

public:
  LocationIndex() = default;

  template<range_of<std::string> range_t>
  explicit LocationIndex(const range_t& names)
  {
    for (const auto& name : names) {
      add(name);
    }
  }

  // Truck warehouses first, then order origins, then order destinations.
  static auto build(const std::vector<Truck>&, const std::vector<Order>&)
    -> LocationIndex;

  auto add(const std::string&) -> std::pair<size_t, bool>;

  [[nodiscard]] auto contains(std::string_view) const -> bool;

  // Throws std::out_of_range for unknown locations.
  [[nodiscard]] auto node(std::string_view) const -> size_t;

  [[nodiscard]] auto name(size_t) const -> const std::string&;

  [[nodiscard]] auto names() const -> const std::vector<std::string>&;

  [[nodiscard]] auto size() const -> size_t;
};

} // namespace loadplan

#endif
