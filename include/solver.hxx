/** @file solver.hxx
 * @brief Vehicle routing with time windows, optional stops and pickup
 * before delivery precedence.
 */
#ifndef LOADPLAN_SOLVER
#define LOADPLAN_SOLVER

#include "collaborators.hxx"
#include "engine_config.hxx"
#include "matrix_builder.hxx"
#include <Poco/Logger.h>
#include <string_view>
#include <vector>

namespace loadplan {

// An order's origin node must be visited before its destination node on the
// same route, unless the origin is the depot of the serving vehicle.
struct Precedence
{
  size_t origin;
  size_t destination;
};

struct RoutingProblem
{
  Matrix distance_km;
  Matrix time_min;
  std::vector<TimeWindow> windows;
  // Depot node of every vehicle.
  std::vector<size_t> depots;
  // Longest route every vehicle may drive, in minutes.
  std::vector<double> duty_caps;
  // Nodes whose omission costs the drop penalty.
  std::vector<size_t> demands;
  std::vector<Precedence> precedences;

  [[nodiscard]] auto size() const -> size_t;

  [[nodiscard]] auto vehicles() const -> size_t;
};

struct VehicleRoute
{
  size_t vehicle = 0;
  // Visited nodes, starting and ending at the vehicle's depot.
  std::vector<size_t> nodes;
  double distance_km = 0.0;
  double time_min = 0.0;

  // Nodes between the two depot visits.
  [[nodiscard]] auto stops() const -> std::vector<size_t>;

  [[nodiscard]] auto empty() const -> bool;
};

enum class SolveStatus : uint8_t
{
  SOLVED = 0,
  NO_SOLUTION = 1,
};

auto
to_string(SolveStatus) -> std::string_view;

struct RoutingSolution
{
  SolveStatus status = SolveStatus::NO_SOLUTION;
  // One entry per vehicle, in vehicle order.
  std::vector<VehicleRoute> routes;
  std::vector<size_t> dropped;
  double objective = 0.0;
  size_t iterations = 0;
};

/**
 * @brief Single threaded heuristic solver bounded by a wall clock budget.
 * @details Builds a first solution by global cheapest insertion, descends to
 * a local optimum with relocate, exchange, 2-opt, re-insertion and removal
 * moves, then perturbs the best known solution by seeded ruin and recreate
 * until the budget expires or the stagnation limit is reached.
 */
class RoutingSolver
{
private:
  SolverOptions mOptions;

  static auto logger() -> Poco::Logger&;

public:
  explicit RoutingSolver(const SolverOptions&);

  // Throws Error when the problem is inconsistent (mismatched sizes, nodes out
  // of range). Infeasibility is reported through the status, never thrown.
  [[nodiscard]] auto solve(const RoutingProblem&) const -> RoutingSolution;
};

} // namespace loadplan

#endif
