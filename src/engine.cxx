#include "engine.hxx"
#include "batch_cache.hxx"
#include "location_index.hxx"
#include "matrix_builder.hxx"
#include "pairwise_iterator.hxx"
#include "transportation/serialization.hxx"
#include "utils.hxx"
#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <numeric>
#include <unordered_map>
#include <unordered_set>

namespace loadplan {

namespace {
// Orders whose destination is visited on the route and whose pickup happens
// at the depot or earlier on the route, in visitation order.
auto
orders_on_route(const VehicleRoute& route,
                const std::vector<size_t>& origins,
                const std::vector<size_t>& destinations,
                const std::vector<size_t>& routable,
                std::vector<bool>& claimed) -> std::vector<size_t>
{
  auto stops = route.stops();
  auto depot = route.nodes.front();
  std::unordered_map<size_t, size_t> position;

  for (size_t pos = 0; pos < stops.size(); ++pos) {
    position.emplace(stops[pos], pos);
  }

  std::vector<std::pair<size_t, size_t>> visits;

  for (auto idx : routable) {
    auto delivered = position.find(destinations[idx]);

    if (claimed[idx] or delivered == position.end()) {
      continue;
    }

    auto picked = position.find(origins[idx]);

    if (origins[idx] == depot or
        (picked != position.end() and picked->second < delivered->second)) {
      visits.emplace_back(delivered->second, idx);
      claimed[idx] = true;
    }
  }
  std::ranges::sort(visits);

  std::vector<size_t> orders;
  std::ranges::transform(
    visits, std::back_inserter(orders), [](const auto& v) { return v.second; });
  return orders;
}
} // namespace

auto
OptimizationResult::summary() const -> std::string
{
  auto total = [this](auto member) {
    return std::accumulate(route_summary.begin(),
                           route_summary.end(),
                           0.0,
                           [member](double acc, const RouteMetrics& metrics) {
                             return acc + member(metrics);
                           });
  };

  auto revenue = total([](const auto& m) { return m.revenue; });
  auto cost = total([](const auto& m) { return m.cost; });
  auto profit = total([](const auto& m) { return m.profit; });
  auto distance = total([](const auto& m) { return m.route.distance_km; });
  auto hours = total([](const auto& m) { return m.route.time_min; }) / 60.0;

  std::string text = "===== ROUTE OPTIMIZATION SUMMARY =====\n";
  auto out = std::back_inserter(text);
  fmt::format_to(out, "Solver status: {}{}\n",
                 solver_status ? to_string(*solver_status) : "not run",
                 degraded_matrix ? " (estimated distances)" : "");
  fmt::format_to(out, "Total routes: {}\n", route_summary.size());
  fmt::format_to(out, "Total assignments: {}\n", assignments.size());
  fmt::format_to(out, "Unassigned orders: {}\n", unassigned_orders.size());
  fmt::format_to(out, "Total revenue: ${:.2f}\n", revenue);
  fmt::format_to(out, "Total cost: ${:.2f}\n", cost);
  fmt::format_to(out, "Total profit: ${:.2f}\n", profit);
  fmt::format_to(out,
                 "Overall profit margin: {:.2f}%\n",
                 revenue > 0 ? profit / revenue * 100 : 0.0);
  fmt::format_to(out, "Total distance: {:.2f} km\n", distance);
  fmt::format_to(out, "Total time: {:.2f} hours\n", hours);

  if (not route_summary.empty()) {
    fmt::format_to(out, "\nRoute details:\n");
  }

  for (size_t idx = 0; idx < route_summary.size(); ++idx) {
    const auto& metrics = route_summary[idx];
    fmt::format_to(out,
                   "  Route {} (Truck {}): {}\n",
                   idx + 1,
                   metrics.route.truck_id,
                   to_string(metrics.decision));
    fmt::format_to(out, "    Orders: {}\n", metrics.route.orders.size());
    fmt::format_to(out, "    Distance: {:.2f} km\n", metrics.route.distance_km);
    fmt::format_to(out, "    Time: {:.2f} hours\n", metrics.route.time_min / 60);
    fmt::format_to(out, "    Revenue: ${:.2f}\n", metrics.revenue);
    fmt::format_to(out, "    Cost: ${:.2f}\n", metrics.cost);
    fmt::format_to(out, "    Profit: ${:.2f}\n", metrics.profit);
    fmt::format_to(out, "    Profit margin: {:.2f}%\n", metrics.margin * 100);
  }

  for (const auto& [orderId, reason] : unassigned) {
    fmt::format_to(out, "  Unassigned {}: {}\n", orderId, to_string(reason));
  }
  text += "======================================\n";
  return text;
}

void
to_json(nlohmann::json& data, const OptimizationResult& result)
{
  auto unassigned = nlohmann::json::array();

  for (const auto& [orderId, reason] : result.unassigned) {
    unassigned.push_back(
      { { "order_id", orderId }, { "reason", std::string(to_string(reason)) } });
  }

  data = nlohmann::json{ { "assignments", result.assignments },
                         { "unassigned_orders", result.unassigned_orders },
                         { "unassigned", unassigned },
                         { "route_summary", result.route_summary },
                         { "degraded_matrix", result.degraded_matrix } };
  data["solver_status"] =
    result.solver_status
      ? nlohmann::json(std::string(to_string(*result.solver_status)))
      : nlohmann::json(nullptr);
}

OptimizationEngine::OptimizationEngine(FleetRegistry& fleet,
                                       MappingService& maps,
                                       WeatherService& weather,
                                       const DistanceTable& table,
                                       AssignmentStore& store,
                                       EngineConfig config)
  : mFleet(fleet)
  , mMaps(maps)
  , mWeather(weather)
  , mTable(table)
  , mStore(store)
  , mConfig(std::move(config))
{
  mConfig.validate();
}

auto
OptimizationEngine::logger() -> Poco::Logger&
{
  return Poco::Logger::get("optimization-engine");
}

auto
OptimizationEngine::config() const -> const EngineConfig&
{
  return mConfig;
}

auto
OptimizationEngine::optimize(const std::vector<Order>& orders)
  -> OptimizationResult
{
  OptimizationResult result;

  if (orders.empty()) {
    return result;
  }

  std::lock_guard lock(mMutex);
  logger().information(fmt::format("Optimising {} orders", orders.size()));

  std::unordered_map<std::string, UnassignedReason> reasons;
  auto leaveOut = [&reasons](const Order& order, UnassignedReason reason) {
    reasons.try_emplace(order.id, reason);
  };

  std::vector<size_t> pending;
  std::vector<bool> duplicate(orders.size(), false);
  std::unordered_set<std::string> seen;

  for (size_t idx = 0; idx < orders.size(); ++idx) {
    if (not seen.insert(orders[idx].id).second) {
      logger().warning(fmt::format(
        "Order {} appears more than once, keeping the first", orders[idx].id));
      duplicate[idx] = true;
    } else if (orders[idx].status == OrderStatus::PENDING) {
      pending.push_back(idx);
    } else {
      leaveOut(orders[idx], UnassignedReason::NOT_PENDING);
    }
  }

  auto finish = [&]() {
    for (size_t idx = 0; idx < orders.size(); ++idx) {
      const auto& order = orders[idx];

      if (duplicate[idx]) {
        result.unassigned_orders.push_back(order.id);
        result.unassigned.push_back(
          { order.id, UnassignedReason::DUPLICATE_ORDER });
      } else if (auto found = reasons.find(order.id); found != reasons.end()) {
        result.unassigned_orders.push_back(order.id);
        result.unassigned.push_back({ order.id, found->second });
        reasons.erase(found);
      }
    }
    logger().information(
      fmt::format("Batch done: {} assigned, {} unassigned, {} routes",
                  result.assignments.size(),
                  result.unassigned_orders.size(),
                  result.route_summary.size()));
    return result;
  };

  if (pending.empty()) {
    return finish();
  }

  std::vector<Truck> trucks;
  std::vector<Trailer> trailers;

  try {
    trucks = mFleet.list_available_trucks();
    trailers = mFleet.list_available_trailers();
  } catch (const std::exception& exc) {
    logger().warning(
      fmt::format("Fleet registry unavailable, no fleet: {}", exc.what()));
    trucks.clear();
    trailers.clear();
  }

  if (trucks.empty() or trailers.empty()) {
    logger().warning(fmt::format("{} trucks and {} trailers available, "
                                 "nothing to optimise",
                                 trucks.size(),
                                 trailers.size()));
    for (auto idx : pending) {
      leaveOut(orders[idx], UnassignedReason::NO_FLEET);
    }
    return finish();
  }

  std::vector<size_t> routable;
  std::vector<Order> batch;

  for (auto idx : pending) {
    if (iequals(orders[idx].ship_from, orders[idx].ship_to)) {
      leaveOut(orders[idx], UnassignedReason::NO_ROUTE);
    } else {
      routable.push_back(idx);
    }
  }

  for (auto idx : routable) {
    batch.push_back(orders[idx]);
  }

  auto index = LocationIndex::build(trucks, batch);
  std::vector<size_t> depots;
  std::ranges::transform(trucks, std::back_inserter(depots), [&](const auto& t) {
    return index.node(t.warehouse);
  });

  std::vector<size_t> distinctDepots = depots;
  std::ranges::sort(distinctDepots);
  distinctDepots.erase(std::ranges::unique(distinctDepots).begin(),
                       distinctDepots.end());

  BatchCache cache;
  GeoTimeMatrixBuilder builder(mMaps, mWeather, mTable, mConfig);
  auto matrix = builder.build(index, batch, distinctDepots, cache);
  result.degraded_matrix = matrix.degraded;

  std::vector<size_t> origins(orders.size());
  std::vector<size_t> destinations(orders.size());
  std::unordered_set<size_t> demands;
  RoutingProblem problem;

  for (auto idx : routable) {
    origins[idx] = index.node(orders[idx].ship_from);
    destinations[idx] = index.node(orders[idx].ship_to);
    problem.precedences.push_back({ origins[idx], destinations[idx] });
    demands.insert(destinations[idx]);

    if (not std::ranges::binary_search(distinctDepots, origins[idx])) {
      demands.insert(origins[idx]);
    }
  }

  problem.distance_km = matrix.distance_km;
  problem.time_min = matrix.time_min;
  problem.windows = matrix.windows;
  problem.depots = depots;
  problem.demands.assign(demands.begin(), demands.end());
  std::ranges::sort(problem.demands);

  for (const auto& truck : trucks) {
    problem.duty_caps.push_back(
      mConfig.solver.enforce_duty_hours
        ? static_cast<double>(truck.remaining_duty().count())
        : static_cast<double>(mConfig.solver.horizon_minutes));
  }

  auto solution = RoutingSolver(mConfig.solver).solve(problem);
  result.solver_status = solution.status;

  if (solution.status == SolveStatus::NO_SOLUTION) {
    logger().warning(fmt::format(
      "No feasible route found for {} orders within {}ms",
      routable.size(),
      mConfig.solver.time_limit.count()));
  }

  RouteEconomicsEvaluator evaluator(mConfig.economics);
  std::vector<bool> claimed(orders.size(), false);
  std::vector<RouteMetrics> evaluated;

  for (const auto& route : solution.routes) {
    if (route.empty()) {
      continue;
    }

    auto onRoute =
      orders_on_route(route, origins, destinations, routable, claimed);

    if (onRoute.empty()) {
      logger().debug(fmt::format("Route of truck {} completes no order",
                                 trucks[route.vehicle].id));
      continue;
    }

    double distance = 0.0;
    for (auto [from, to] : make_pairwise_range(route.nodes)) {
      distance += matrix.distance_km[from][to];
    }

    RouteCandidate candidate{ route.vehicle,
                              trucks[route.vehicle].id,
                              std::move(onRoute),
                              distance,
                              route.time_min };
    evaluated.push_back(evaluator.evaluate(candidate, orders));
  }

  RouteEconomicsEvaluator::rank(evaluated);

  std::vector<RouteMetrics> accepted;
  for (const auto& metrics : evaluated) {
    if (metrics.accepted()) {
      accepted.push_back(metrics);
      continue;
    }
    logger().warning(fmt::format("Rejected route of truck {}: {} (profit "
                                 "{:.2f}, margin {:.1f}%)",
                                 metrics.route.truck_id,
                                 to_string(metrics.decision),
                                 metrics.profit,
                                 metrics.margin * 100));
    for (auto idx : metrics.route.orders) {
      leaveOut(orders[idx], UnassignedReason::UNPROFITABLE);
    }
  }

  AssignmentMaterializer materializer(mStore, mConfig.actor);
  auto materialized = materializer.materialize(accepted, orders, trailers, now());
  result.assignments = std::move(materialized.assignments);

  for (const auto& [orderId, reason] : materialized.unassigned) {
    reasons.try_emplace(orderId, reason);
  }

  for (auto idx : routable) {
    if (not claimed[idx]) {
      leaveOut(orders[idx], UnassignedReason::NO_ROUTE);
    }
  }
  result.route_summary = std::move(evaluated);
  return finish();
}

} // namespace loadplan
