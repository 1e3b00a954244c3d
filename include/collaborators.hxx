/** @file collaborators.hxx
 * @brief Contracts of the services the engine talks to.
 * @details Each contract is implemented by a network client for production
 * use and by an in-process fake in the tests. Implementations report I/O
 * failures by throwing ServiceUnavailable.
 */
#ifndef LOADPLAN_COLLABORATORS
#define LOADPLAN_COLLABORATORS

#include "errors.hxx"
#include "transportation.hxx"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loadplan {

using Matrix = std::vector<std::vector<double>>;

/**
 * @brief Distances in kilometres and travel times in minutes between every
 * ordered pair of a location list.
 */
struct RouteMatrix
{
  Matrix distance_km;
  Matrix time_min;
};

struct Forecast
{
  std::string condition;
};

class FleetRegistry
{
public:
  virtual ~FleetRegistry() = default;

  virtual auto list_available_trucks() -> std::vector<Truck> = 0;

  virtual auto list_available_trailers() -> std::vector<Trailer> = 0;
};

class MappingService
{
public:
  virtual ~MappingService() = default;

  /**
   * @brief Fetch the full N x N matrix for the given locations in one call.
   * @param[in] : Ordered, de-duplicated location names
   */
  virtual auto route_matrix(const std::vector<std::string>&) -> RouteMatrix = 0;
};

class DistanceTable
{
public:
  virtual ~DistanceTable() = default;

  /**
   * @brief Estimated road distance in km, +infinity when unknown.
   */
  [[nodiscard]] virtual auto approximate_distance(std::string_view,
                                                  std::string_view) const
    -> double = 0;
};

/**
 * @brief Forecast lookups may be issued concurrently from several threads.
 */
class WeatherService
{
public:
  virtual ~WeatherService() = default;

  // nullopt when no forecast is available for the location.
  virtual auto forecast(const std::string&, int) -> std::optional<Forecast> = 0;
};

class AssignmentStore
{
public:
  virtual ~AssignmentStore() = default;

  virtual void save_assignment(const OrderAssignment&) = 0;

  virtual void update_order_status(const std::string&, OrderStatus) = 0;
};

// Stand-in used when no mapping credentials are configured: every call fails
// so the matrix builder takes its fallback path.
class UnavailableMapping : public MappingService
{
public:
  auto route_matrix(const std::vector<std::string>&) -> RouteMatrix override
  {
    throw ServiceUnavailable("No mapping service configured");
  }
};

class NoWeather : public WeatherService
{
public:
  auto forecast(const std::string&, int) -> std::optional<Forecast> override
  {
    return std::nullopt;
  }
};

} // namespace loadplan

#endif
