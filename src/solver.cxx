#include "solver.hxx"
#include "solvers/cheapest_insertion.hxx"
#include "solvers/local_search.hxx"
#include "solvers/route_state.hxx"
#include <algorithm>
#include <chrono>
#include <fmt/format.h>
#include <random>

namespace loadplan {

namespace {
void
check(const RoutingProblem& problem)
{
  auto size = problem.size();
  auto square = [size](const Matrix& matrix) {
    return std::ranges::all_of(
      matrix, [size](const auto& row) { return row.size() == size; });
  };

  if (problem.time_min.size() != size or not square(problem.distance_km) or
      not square(problem.time_min) or problem.windows.size() != size) {
    throw Error(fmt::format("Routing problem over {} nodes has mismatched "
                            "matrices or windows",
                            size));
  }

  if (problem.duty_caps.size() != problem.depots.size()) {
    throw Error(fmt::format("{} duty caps given for {} vehicles",
                            problem.duty_caps.size(),
                            problem.depots.size()));
  }

  auto inRange = [size](size_t node) { return node < size; };

  if (not std::ranges::all_of(problem.depots, inRange) or
      not std::ranges::all_of(problem.demands, inRange) or
      not std::ranges::all_of(problem.precedences, [size](const auto& rule) {
        return rule.origin < size and rule.destination < size;
      })) {
    throw Error("Routing problem refers to a node out of range");
  }
}

auto
materialize(const solvers::Instance& instance, const solvers::Plan& plan)
  -> RoutingSolution
{
  RoutingSolution solution;
  size_t served = 0;

  for (size_t vehicle = 0; vehicle < plan.vehicles(); ++vehicle) {
    VehicleRoute route;
    route.vehicle = vehicle;
    route.nodes.push_back(instance.depot(vehicle));

    for (auto node : plan.route(vehicle)) {
      route.nodes.push_back(node);
      served += instance.is_demand(node) ? 1 : 0;
    }
    route.nodes.push_back(instance.depot(vehicle));
    route.distance_km = plan.schedule(vehicle).distance_km;
    route.time_min = plan.schedule(vehicle).time_min;
    solution.routes.push_back(std::move(route));
  }
  solution.dropped = plan.unrouted(instance);
  solution.objective = plan.objective(instance);
  solution.status = served > 0 or instance.problem().demands.empty()
                      ? SolveStatus::SOLVED
                      : SolveStatus::NO_SOLUTION;
  return solution;
}
} // namespace

auto
RoutingProblem::size() const -> size_t
{
  return distance_km.size();
}

auto
RoutingProblem::vehicles() const -> size_t
{
  return depots.size();
}

auto
VehicleRoute::stops() const -> std::vector<size_t>
{
  if (nodes.size() <= 2) {
    return {};
  }
  return { nodes.begin() + 1, nodes.end() - 1 };
}

auto
VehicleRoute::empty() const -> bool
{
  return nodes.size() <= 2;
}

auto
to_string(SolveStatus status) -> std::string_view
{
  return status == SolveStatus::SOLVED ? "solved" : "no_solution";
}

RoutingSolver::RoutingSolver(const SolverOptions& options)
  : mOptions(options)
{
}

auto
RoutingSolver::logger() -> Poco::Logger&
{
  return Poco::Logger::get("routing-solver");
}

auto
RoutingSolver::solve(const RoutingProblem& input) const -> RoutingSolution
{
  check(input);

  auto problem = input;
  std::ranges::sort(problem.demands);
  auto [first, last] = std::ranges::unique(problem.demands);
  problem.demands.erase(first, last);

  auto started = std::chrono::steady_clock::now();
  auto deadline = started + mOptions.time_limit;

  solvers::Instance instance(problem, mOptions);
  solvers::Plan current(instance);

  solvers::insert_cheapest(instance, current, deadline);
  solvers::LocalSearch(instance, deadline).run(current);

  auto best = current;
  auto bestObjective = best.objective(instance);
  auto currentObjective = bestObjective;

  logger().debug(fmt::format("Initial solution: {} stops, objective {:.2f}",
                             best.stops(),
                             bestObjective));

  std::mt19937 generator(mOptions.seed);
  size_t iterations = 0;
  size_t stagnation = 0;

  while (best.stops() > 0 and std::chrono::steady_clock::now() < deadline and
         stagnation < mOptions.stagnation_limit) {
    auto candidate = current;
    solvers::ruin(instance, candidate, generator);
    solvers::insert_cheapest(instance, candidate, deadline);
    solvers::LocalSearch(instance, deadline).run(candidate);
    ++iterations;

    auto objective = candidate.objective(instance);

    if (objective < bestObjective - solvers::EPSILON) {
      best = candidate;
      bestObjective = objective;
      stagnation = 0;
    } else {
      ++stagnation;
    }

    if (objective <= currentObjective + solvers::EPSILON) {
      current = std::move(candidate);
      currentObjective = objective;
    }
  }

  auto solution = materialize(instance, best);
  solution.iterations = iterations;

  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - started);
  logger().information(
    fmt::format("Solved {} nodes with {} vehicles in {}ms: {} stops, {} "
                "dropped, objective {:.2f} after {} perturbations",
                problem.size(),
                problem.vehicles(),
                elapsed.count(),
                best.stops(),
                solution.dropped.size(),
                solution.objective,
                iterations));
  return solution;
}

} // namespace loadplan
