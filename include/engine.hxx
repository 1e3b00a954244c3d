/** @file engine.hxx
 * @brief Entry point of one optimisation batch.
 */
#ifndef LOADPLAN_ENGINE
#define LOADPLAN_ENGINE

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "collaborators.hxx"
#include "economics.hxx"
#include "engine_config.hxx"
#include "materializer.hxx"
#include "solver.hxx"
#include <Poco/Logger.h>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace loadplan {

struct OptimizationResult
{
  std::vector<OrderAssignment> assignments;
  // Ids of every order left without an assignment, in input order.
  std::vector<std::string> unassigned_orders;
  // Same orders, with the reason each one was left out.
  std::vector<Unassigned> unassigned;
  // Every evaluated route, ranked, accepted or not.
  std::vector<RouteMetrics> route_summary;
  bool degraded_matrix = false;
  std::optional<SolveStatus> solver_status;

  // Operator facing report of the batch.
  [[nodiscard]] auto summary() const -> std::string;
};

void
to_json(nlohmann::json&, const OptimizationResult&);

/**
 * @brief Assigns pending orders to trucks and trailers.
 * @details Fetches the fleet, builds the travel matrix, solves the routing
 * problem, filters the routes on profit and binds trailers to the orders of
 * the surviving routes. Collaborator failures degrade the batch and never
 * escape optimize(). Calls on one engine are serialised.
 */
class OptimizationEngine
{
private:
  FleetRegistry& mFleet;
  MappingService& mMaps;
  WeatherService& mWeather;
  const DistanceTable& mTable;
  AssignmentStore& mStore;
  EngineConfig mConfig;
  std::mutex mMutex;

  static auto logger() -> Poco::Logger&;

public:
  OptimizationEngine(FleetRegistry&,
                     MappingService&,
                     WeatherService&,
                     const DistanceTable&,
                     AssignmentStore&,
                     EngineConfig = {});

  auto optimize(const std::vector<Order>&) -> OptimizationResult;

  [[nodiscard]] auto config() const -> const EngineConfig&;
};

} // namespace loadplan

#endif
