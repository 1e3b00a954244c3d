#include "economics.hxx"
#include <algorithm>
#include <fmt/format.h>

namespace loadplan {

auto
to_string(Decision decision) -> std::string_view
{
  switch (decision) {
    case Decision::ACCEPTED:
      return "accepted";
    case Decision::BELOW_MARGIN_FLOOR:
      return "below_margin_floor";
    default:
      return "non_positive_profit";
  }
}

auto
RouteMetrics::accepted() const -> bool
{
  return decision == Decision::ACCEPTED;
}

RouteEconomicsEvaluator::RouteEconomicsEvaluator(const EconomicsRates& rates)
  : mRates(rates)
{
}

auto
RouteEconomicsEvaluator::logger() -> Poco::Logger&
{
  return Poco::Logger::get("route-economics");
}

auto
RouteEconomicsEvaluator::distance_factor(double distanceKm) const -> double
{
  return std::max(1.0, mRates.distance_factor_per_km * distanceKm);
}

auto
RouteEconomicsEvaluator::requirement_multiplier(const Order& order) const
  -> double
{
  double multiplier = 1.0;

  if (order.needs(Order::HEATING)) {
    multiplier += mRates.heating_surcharge;
  }
  if (order.needs(Order::REFRIGERATION)) {
    multiplier += mRates.refrigeration_surcharge;
  }
  if (order.needs(Order::HAZARDOUS)) {
    multiplier += mRates.hazardous_surcharge;
  }
  return multiplier;
}

auto
RouteEconomicsEvaluator::order_revenue(const Order& order,
                                       double distanceKm) const -> double
{
  return mRates.base_rate_per_kg * order.weight_kg *
         distance_factor(distanceKm) * requirement_multiplier(order);
}

auto
RouteEconomicsEvaluator::cost(double distanceKm, double durationMin) const
  -> double
{
  auto hours = durationMin / 60.0;
  auto fuel = mRates.fuel_cost_per_km * distanceKm;
  auto driver = mRates.driver_cost_per_hour * hours;
  auto maintenance = mRates.maintenance_cost_per_km * distanceKm;
  auto overhead = mRates.overhead_fixed + mRates.overhead_per_hour * hours;
  return fuel + driver + maintenance + overhead;
}

auto
RouteEconomicsEvaluator::evaluate(const RouteCandidate& route,
                                  const std::vector<Order>& orders) const
  -> RouteMetrics
{
  RouteMetrics metrics;
  metrics.route = route;
  metrics.order_revenue.reserve(route.orders.size());

  for (auto idx : route.orders) {
    const auto& order = orders.at(idx);
    auto revenue = order_revenue(order, route.distance_km);
    metrics.order_ids.push_back(order.id);
    metrics.order_revenue.push_back(revenue);
    metrics.revenue += revenue;
  }
  metrics.cost = cost(route.distance_km, route.time_min);
  metrics.profit = metrics.revenue - metrics.cost;
  metrics.margin =
    metrics.revenue == 0.0 ? 0.0 : metrics.profit / metrics.revenue;

  if (metrics.profit <= 0.0) {
    metrics.decision = Decision::NON_POSITIVE_PROFIT;
  } else if (mRates.min_margin > 0.0 and metrics.margin < mRates.min_margin) {
    metrics.decision = Decision::BELOW_MARGIN_FLOOR;
  } else {
    metrics.decision = Decision::ACCEPTED;
  }

  auto message = fmt::format(
    "Truck {}: {} orders, {:.1f} km, {:.0f} min, revenue {:.2f}, cost {:.2f}, "
    "profit {:.2f}, margin {:.1f}% -> {}",
    route.truck_id,
    route.orders.size(),
    route.distance_km,
    route.time_min,
    metrics.revenue,
    metrics.cost,
    metrics.profit,
    metrics.margin * 100,
    to_string(metrics.decision));

  if (metrics.accepted()) {
    logger().debug(message);
  } else {
    logger().warning(message);
  }
  return metrics;
}

void
RouteEconomicsEvaluator::rank(std::vector<RouteMetrics>& metrics)
{
  std::ranges::stable_sort(metrics, [](const auto& lhs, const auto& rhs) {
    if (lhs.profit != rhs.profit) {
      return lhs.profit > rhs.profit;
    }
    return lhs.route.vehicle < rhs.route.vehicle;
  });
}

void
to_json(nlohmann::json& data, const RouteMetrics& metrics)
{
  data = nlohmann::json{ { "vehicle", metrics.route.vehicle },
                         { "truck_id", metrics.route.truck_id },
                         { "distance_km", metrics.route.distance_km },
                         { "time_min", metrics.route.time_min },
                         { "revenue", metrics.revenue },
                         { "cost", metrics.cost },
                         { "profit", metrics.profit },
                         { "margin", metrics.margin },
                         { "decision", std::string(to_string(metrics.decision)) } };
  auto orders = nlohmann::json::array();

  for (size_t idx = 0; idx < metrics.route.orders.size(); ++idx) {
    orders.push_back({ { "order_id", metrics.order_ids.at(idx) },
                       { "sequence", idx },
                       { "revenue", metrics.order_revenue.at(idx) } });
  }
  data["orders"] = orders;
}

} // namespace loadplan
