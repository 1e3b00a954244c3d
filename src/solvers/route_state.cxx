#include "solvers/route_state.hxx"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace loadplan::solvers {

Instance::Instance(const RoutingProblem& problem, const SolverOptions& options)
  : mProblem(problem)
  , mOptions(options)
  , mDemand(problem.size(), false)
  , mOrigins(problem.size())
{
  for (auto node : problem.demands) {
    mDemand[node] = true;
  }

  for (const auto& [origin, destination] : problem.precedences) {
    auto& origins = mOrigins[destination];

    if (std::ranges::find(origins, origin) == origins.end()) {
      origins.push_back(origin);
    }
  }
}

auto
Instance::problem() const -> const RoutingProblem&
{
  return mProblem;
}

auto
Instance::options() const -> const SolverOptions&
{
  return mOptions;
}

auto
Instance::size() const -> size_t
{
  return mProblem.size();
}

auto
Instance::vehicles() const -> size_t
{
  return mProblem.vehicles();
}

auto
Instance::depot(size_t vehicle) const -> size_t
{
  return mProblem.depots[vehicle];
}

auto
Instance::is_demand(size_t node) const -> bool
{
  return mDemand[node];
}

auto
Instance::origins(size_t node) const -> const std::vector<size_t>&
{
  return mOrigins[node];
}

auto
Instance::allowed(size_t from, size_t to) const -> bool
{
  auto distance = mProblem.distance_km[from][to];
  auto time = mProblem.time_min[from][to];
  return std::isfinite(distance) and std::isfinite(time) and
         time <= mOptions.max_leg_minutes;
}

auto
Instance::unsupported(size_t vehicle, const std::vector<size_t>& stops) const
  -> size_t
{
  auto depot = mProblem.depots[vehicle];

  for (size_t pos = 0; pos < stops.size(); ++pos) {
    const auto& origins = mOrigins[stops[pos]];

    if (origins.empty()) {
      continue;
    }

    auto supported = std::ranges::any_of(origins, [&](size_t origin) {
      return origin == depot or
             std::find(stops.begin(), stops.begin() + pos, origin) !=
               stops.begin() + pos;
    });

    if (not supported) {
      return pos;
    }
  }
  return stops.size();
}

auto
Instance::evaluate(size_t vehicle, const std::vector<size_t>& stops) const
  -> std::optional<Schedule>
{
  auto depot = mProblem.depots[vehicle];

  if (stops.empty()) {
    return Schedule{};
  }

  Schedule schedule;
  double clock = mProblem.windows[depot].earliest;
  auto previous = depot;

  for (auto node : stops) {
    if (node == depot or not allowed(previous, node)) {
      return std::nullopt;
    }

    const auto& window = mProblem.windows[node];
    auto arrival = clock + mProblem.time_min[previous][node];

    if (arrival < window.earliest) {
      if (window.earliest - arrival > mOptions.max_wait_minutes) {
        return std::nullopt;
      }
      arrival = window.earliest;
    }

    if (arrival > window.latest + EPSILON) {
      return std::nullopt;
    }
    schedule.distance_km += mProblem.distance_km[previous][node];
    clock = arrival + mOptions.service_minutes;
    previous = node;
  }

  if (not allowed(previous, depot)) {
    return std::nullopt;
  }
  clock += mProblem.time_min[previous][depot];

  auto cap = std::min({ static_cast<double>(mOptions.horizon_minutes),
                        static_cast<double>(mProblem.windows[depot].latest),
                        mProblem.duty_caps[vehicle] });

  if (clock > cap + EPSILON) {
    return std::nullopt;
  }

  if (unsupported(vehicle, stops) != stops.size()) {
    return std::nullopt;
  }
  schedule.distance_km += mProblem.distance_km[previous][depot];
  schedule.time_min = clock;
  return schedule;
}

Plan::Plan(const Instance& instance)
  : mRoutes(instance.vehicles())
  , mSchedules(instance.vehicles())
  , mVisits(instance.size(), 0)
{
}

auto
Plan::route(size_t vehicle) const -> const std::vector<size_t>&
{
  return mRoutes[vehicle];
}

auto
Plan::schedule(size_t vehicle) const -> const Schedule&
{
  return mSchedules[vehicle];
}

auto
Plan::vehicles() const -> size_t
{
  return mRoutes.size();
}

auto
Plan::routed(size_t node) const -> bool
{
  return mVisits[node] > 0;
}

auto
Plan::stops() const -> size_t
{
  return std::accumulate(
    mRoutes.begin(), mRoutes.end(), size_t{ 0 }, [](size_t acc, const auto& r) {
      return acc + r.size();
    });
}

void
Plan::update(size_t vehicle,
             std::vector<size_t> stops,
             const Schedule& schedule)
{
  for (auto node : mRoutes[vehicle]) {
    --mVisits[node];
  }

  for (auto node : stops) {
    ++mVisits[node];
  }
  mRoutes[vehicle] = std::move(stops);
  mSchedules[vehicle] = schedule;
}

auto
Plan::distance() const -> double
{
  return std::accumulate(mSchedules.begin(),
                         mSchedules.end(),
                         0.0,
                         [](double acc, const Schedule& schedule) {
                           return acc + schedule.distance_km;
                         });
}

auto
Plan::unrouted(const Instance& instance) const -> std::vector<size_t>
{
  std::vector<size_t> nodes;

  for (auto node : instance.problem().demands) {
    if (not routed(node)) {
      nodes.push_back(node);
    }
  }
  return nodes;
}

auto
Plan::objective(const Instance& instance) const -> double
{
  return distance() +
         instance.options().drop_penalty *
           static_cast<double>(unrouted(instance).size());
}

} // namespace loadplan::solvers
