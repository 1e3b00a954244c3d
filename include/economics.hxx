/** @file economics.hxx
 * @brief Revenue, cost and acceptance of candidate routes.
 */
#ifndef LOADPLAN_ECONOMICS
#define LOADPLAN_ECONOMICS

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "engine_config.hxx"
#include "transportation.hxx"
#include <Poco/Logger.h>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace loadplan {

// One vehicle's route, before economic filtering.
struct RouteCandidate
{
  size_t vehicle = 0;
  std::string truck_id;
  // Indices into the batch's orders, in visitation order.
  std::vector<size_t> orders;
  double distance_km = 0.0;
  double time_min = 0.0;
};

enum class Decision : uint8_t
{
  ACCEPTED = 0,
  NON_POSITIVE_PROFIT = 1,
  BELOW_MARGIN_FLOOR = 2,
};

auto
to_string(Decision) -> std::string_view;

struct RouteMetrics
{
  RouteCandidate route;
  std::vector<std::string> order_ids;
  // Revenue of every order of the route, aligned with route.orders.
  std::vector<double> order_revenue;
  double revenue = 0.0;
  double cost = 0.0;
  double profit = 0.0;
  double margin = 0.0;
  Decision decision = Decision::NON_POSITIVE_PROFIT;

  [[nodiscard]] auto accepted() const -> bool;
};

class RouteEconomicsEvaluator
{
private:
  EconomicsRates mRates;

  static auto logger() -> Poco::Logger&;

public:
  explicit RouteEconomicsEvaluator(const EconomicsRates& = {});

  // Floored at 1.
  [[nodiscard]] auto distance_factor(double) const -> double;

  [[nodiscard]] auto requirement_multiplier(const Order&) const -> double;

  [[nodiscard]] auto order_revenue(const Order&, double) const -> double;

  /**
   * @brief Fuel, driver, maintenance and overhead cost of a route.
   * @param[in] : Distance in km
   * @param[in] : Duration in minutes
   */
  [[nodiscard]] auto cost(double, double) const -> double;

  [[nodiscard]] auto evaluate(const RouteCandidate&,
                              const std::vector<Order>&) const -> RouteMetrics;

  // Descending profit, ties by ascending vehicle index.
  static void rank(std::vector<RouteMetrics>&);
};

void
to_json(nlohmann::json&, const RouteMetrics&);

} // namespace loadplan

#endif
