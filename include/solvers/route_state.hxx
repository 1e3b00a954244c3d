/** @file route_state.hxx
 * @brief Route feasibility and the mutable plan shared by the solver moves.
 */
#ifndef LOADPLAN_SOLVERS_ROUTE_STATE
#define LOADPLAN_SOLVERS_ROUTE_STATE

#include "solver.hxx"
#include <optional>
#include <vector>

namespace loadplan::solvers {

constexpr double EPSILON = 1e-9;

struct Schedule
{
  double distance_km = 0.0;
  // Minute the vehicle is back at its depot.
  double time_min = 0.0;
};

/**
 * @brief Read-only view of a problem with the lookups the moves need.
 */
class Instance
{
private:
  const RoutingProblem& mProblem;
  SolverOptions mOptions;
  std::vector<bool> mDemand;
  std::vector<std::vector<size_t>> mOrigins;

public:
  Instance(const RoutingProblem&, const SolverOptions&);

  [[nodiscard]] auto problem() const -> const RoutingProblem&;

  [[nodiscard]] auto options() const -> const SolverOptions&;

  [[nodiscard]] auto size() const -> size_t;

  [[nodiscard]] auto vehicles() const -> size_t;

  [[nodiscard]] auto depot(size_t) const -> size_t;

  [[nodiscard]] auto is_demand(size_t) const -> bool;

  // Origins of the orders delivered to the node, empty for pure pickups.
  [[nodiscard]] auto origins(size_t) const -> const std::vector<size_t>&;

  [[nodiscard]] auto allowed(size_t, size_t) const -> bool;

  /**
   * @brief Check a vehicle's stop sequence and compute its cost.
   * @param[in] : Vehicle index
   * @param[in] : Stops, depots excluded
   * @return nullopt when any arc, window, duty cap or precedence is violated
   */
  [[nodiscard]] auto evaluate(size_t, const std::vector<size_t>&) const
    -> std::optional<Schedule>;

  // First delivery of the sequence none of whose orders can be picked up
  // earlier on the route, or the sequence size when there is none.
  [[nodiscard]] auto unsupported(size_t, const std::vector<size_t>&) const
    -> size_t;
};

/**
 * @brief Mutable assignment of stops to vehicles.
 */
class Plan
{
private:
  std::vector<std::vector<size_t>> mRoutes;
  std::vector<Schedule> mSchedules;
  // Visits per node, so that routes can be updated in any order.
  std::vector<int> mVisits;

public:
  explicit Plan(const Instance&);

  [[nodiscard]] auto route(size_t) const -> const std::vector<size_t>&;

  [[nodiscard]] auto schedule(size_t) const -> const Schedule&;

  [[nodiscard]] auto vehicles() const -> size_t;

  [[nodiscard]] auto routed(size_t) const -> bool;

  [[nodiscard]] auto stops() const -> size_t;

  void update(size_t, std::vector<size_t>, const Schedule&);

  [[nodiscard]] auto distance() const -> double;

  [[nodiscard]] auto unrouted(const Instance&) const -> std::vector<size_t>;

  // Total distance plus the drop penalty of every unrouted demand node.
  [[nodiscard]] auto objective(const Instance&) const -> double;
};

} // namespace loadplan::solvers

#endif
