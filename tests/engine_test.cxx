#include "engine.hxx"
#include "fakes.hxx"
#include "utils.hxx"
#include <algorithm>
#include <gtest/gtest.h>
#include <map>
#include <set>

namespace loadplan {
namespace {

using testing::FakeFleet;
using testing::FakeMapping;
using testing::FakeWeather;
using testing::FlakyStore;
using testing::make_order;
using testing::make_trailer;
using testing::make_truck;

class OptimizationEngineTest : public ::testing::Test
{
protected:
  FakeFleet fleet;
  FakeMapping maps;
  FakeWeather weather;
  FlakyStore store;

  void SetUp() override
  {
    maps.leg("Winnipeg", "Steinbach", 40, 30);
    maps.leg("Winnipeg", "Brandon", 100, 70);
    maps.leg("Steinbach", "Brandon", 90, 65);
    maps.leg("Winnipeg", "Gimli", 250, 200);
    maps.leg("Steinbach", "Gimli", 280, 230);
    maps.leg("Brandon", "Gimli", 330, 260);

    fleet.trucks = { make_truck("T-1", "Winnipeg") };
  }

  static auto config() -> EngineConfig
  {
    EngineConfig config;
    config.solver.time_limit = std::chrono::milliseconds(3000);
    config.solver.stagnation_limit = 30;
    config.actor = "test-planner";
    return config;
  }

  auto engine() -> OptimizationEngine
  {
    return { fleet, maps, weather, maps, store, config() };
  }

  static auto reason(const OptimizationResult& result, const std::string& id)
    -> std::optional<UnassignedReason>
  {
    for (const auto& [orderId, why] : result.unassigned) {
      if (orderId == id) {
        return why;
      }
    }
    return std::nullopt;
  }
};

TEST_F(OptimizationEngineTest, EmptyBatchTouchesNothing)
{
  auto result = engine().optimize({});

  EXPECT_TRUE(result.assignments.empty());
  EXPECT_TRUE(result.unassigned_orders.empty());
  EXPECT_TRUE(result.route_summary.empty());
  EXPECT_FALSE(result.solver_status.has_value());
  EXPECT_EQ(fleet.calls, 0u);
  EXPECT_EQ(maps.calls, 0u);
}

TEST_F(OptimizationEngineTest, TrailerCapacityLimitsLoad)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 2000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  auto result = engine().optimize(orders);

  EXPECT_EQ(result.solver_status, SolveStatus::SOLVED);
  ASSERT_EQ(result.assignments.size(), 1u);
  EXPECT_EQ(result.assignments[0].order_id, "O-2");
  EXPECT_EQ(result.assignments[0].truck_id, "T-1");
  EXPECT_EQ(result.assignments[0].trailer_id, "TR-1");
  EXPECT_EQ(result.unassigned_orders, std::vector<std::string>{ "O-1" });
  EXPECT_EQ(reason(result, "O-1"), UnassignedReason::NO_TRAILER);
  EXPECT_EQ(store.status("O-2"), OrderStatus::ASSIGNED);
  EXPECT_FALSE(store.status("O-1").has_value());
}

TEST_F(OptimizationEngineTest, SequencesFollowTheRoute)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  auto result = engine().optimize(orders);

  ASSERT_EQ(result.assignments.size(), 2u);
  EXPECT_TRUE(result.unassigned_orders.empty());
  EXPECT_EQ(result.assignments[0].sequence, 0u);
  EXPECT_EQ(result.assignments[1].sequence, 1u);
  EXPECT_EQ(result.assignments[0].assigned_by, "test-planner");

  ASSERT_EQ(result.route_summary.size(), 1u);
  const auto& route = result.route_summary[0];
  EXPECT_DOUBLE_EQ(route.route.distance_km, 230.0);
  EXPECT_DOUBLE_EQ(route.revenue, 529.0);
  EXPECT_DOUBLE_EQ(route.profit, route.revenue - route.cost);
  EXPECT_GT(route.profit, 0.0);
  EXPECT_EQ(route.order_ids[0], result.assignments[0].order_id);
}

TEST_F(OptimizationEngineTest, LossMakingRouteIsRejected)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };

  auto result =
    engine().optimize({ make_order("O-1", "Winnipeg", "Gimli", 10, Priority::LOW) });

  EXPECT_TRUE(result.assignments.empty());
  EXPECT_EQ(reason(result, "O-1"), UnassignedReason::UNPROFITABLE);
  ASSERT_EQ(result.route_summary.size(), 1u);
  EXPECT_EQ(result.route_summary[0].decision, Decision::NON_POSITIVE_PROFIT);
  EXPECT_TRUE(store.assignments().empty());
}

TEST_F(OptimizationEngineTest, PicksUpAwayFromTheDepot)
{
  fleet.trailers = { make_trailer("TR-S", "Steinbach", 5000) };

  auto result =
    engine().optimize({ make_order("O-1", "Steinbach", "Brandon", 1500) });

  ASSERT_EQ(result.assignments.size(), 1u);
  EXPECT_EQ(result.assignments[0].trailer_id, "TR-S");
  // Depot, pickup, delivery and back.
  EXPECT_DOUBLE_EQ(result.route_summary[0].route.distance_km, 230.0);
}

TEST_F(OptimizationEngineTest, DegradesWhenMappingIsDown)
{
  maps.failing = true;
  weather.condition("Brandon", "Blizzard and heavy snow");
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  auto result = engine().optimize(orders);

  EXPECT_TRUE(result.degraded_matrix);
  EXPECT_EQ(result.assignments.size(), 2u);
  EXPECT_EQ(weather.calls, 0u);
  ASSERT_EQ(result.route_summary.size(), 1u);
  // Never shorter than the direct estimate to the farthest stop and back.
  EXPECT_GE(result.route_summary[0].route.distance_km, 200.0);
  EXPECT_DOUBLE_EQ(result.route_summary[0].route.time_min, 230.0);
}

TEST_F(OptimizationEngineTest, SurvivesUnexpectedMappingErrors)
{
  maps.crash = "quota exceeded";
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  OptimizationResult result;
  ASSERT_NO_THROW(result = engine().optimize(orders));

  EXPECT_TRUE(result.degraded_matrix);
  EXPECT_EQ(result.assignments.size(), 2u);
  EXPECT_TRUE(result.unassigned.empty());
}

TEST_F(OptimizationEngineTest, UnreachableDestinationHasNoRoute)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Brandon", 1800),
                             make_order("O-2", "Winnipeg", "Churchill", 900) };

  auto result = engine().optimize(orders);

  EXPECT_EQ(reason(result, "O-2"), UnassignedReason::NO_ROUTE);
  ASSERT_EQ(result.assignments.size(), 1u);
  EXPECT_EQ(result.assignments[0].order_id, "O-1");
}

TEST_F(OptimizationEngineTest, SameOriginAndDestinationHasNoRoute)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };

  auto result =
    engine().optimize({ make_order("O-1", "Winnipeg", "winnipeg", 100) });

  EXPECT_EQ(reason(result, "O-1"), UnassignedReason::NO_ROUTE);
  EXPECT_TRUE(result.assignments.empty());
}

TEST_F(OptimizationEngineTest, SkipsOrdersThatAreNotPending)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  auto delivered = make_order("O-1", "Winnipeg", "Steinbach", 500);
  delivered.status = OrderStatus::DELIVERED;

  auto result = engine().optimize(
    { delivered, make_order("O-2", "Winnipeg", "Brandon", 1800) });

  EXPECT_EQ(reason(result, "O-1"), UnassignedReason::NOT_PENDING);
  ASSERT_EQ(result.assignments.size(), 1u);
  EXPECT_EQ(result.assignments[0].order_id, "O-2");
  EXPECT_EQ(result.assignments[0].sequence, 0u);
}

TEST_F(OptimizationEngineTest, AssignsARepeatedOrderIdOnce)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-1", "Winnipeg", "Brandon", 1800),
                             make_order("O-2", "Winnipeg", "Brandon", 800) };

  auto result = engine().optimize(orders);

  ASSERT_EQ(result.assignments.size(), 2u);
  EXPECT_EQ(
    std::ranges::count(
      result.assignments, std::string("O-1"), &OrderAssignment::order_id),
    1);
  EXPECT_EQ(result.unassigned_orders, (std::vector<std::string>{ "O-1" }));
  ASSERT_EQ(result.unassigned.size(), 1u);
  EXPECT_EQ(result.unassigned[0].reason, UnassignedReason::DUPLICATE_ORDER);
  EXPECT_EQ(store.assignments().size(), 2u);
}

TEST_F(OptimizationEngineTest, EveryOrderNeedsAFleet)
{
  fleet.failing = true;
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  auto result = engine().optimize(orders);

  EXPECT_TRUE(result.assignments.empty());
  EXPECT_EQ(result.unassigned_orders,
            (std::vector<std::string>{ "O-1", "O-2" }));
  EXPECT_EQ(reason(result, "O-1"), UnassignedReason::NO_FLEET);
  EXPECT_EQ(reason(result, "O-2"), UnassignedReason::NO_FLEET);
  EXPECT_EQ(maps.calls, 0u);

  fleet.failing = false;
  fleet.trailers.clear();
  result = engine().optimize(orders);
  EXPECT_EQ(reason(result, "O-2"), UnassignedReason::NO_FLEET);
}

TEST_F(OptimizationEngineTest, SurvivesPersistenceFailure)
{
  store.rejected = { "O-2" };
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 5000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  auto result = engine().optimize(orders);

  EXPECT_EQ(reason(result, "O-2"), UnassignedReason::PERSISTENCE_FAILED);
  ASSERT_EQ(result.assignments.size(), 1u);
  EXPECT_EQ(result.assignments[0].order_id, "O-1");
}

TEST_F(OptimizationEngineTest, KeepsEveryInvariantOnMixedBatch)
{
  fleet.trucks = { make_truck("T-1", "Winnipeg"),
                   make_truck("T-2", "Brandon", 4.0),
                   make_truck("T-3", "Winnipeg", 9.9) };
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 1500),
                     make_trailer("TR-2", "Winnipeg", 2500, Trailer::REFRIGERATED),
                     make_trailer("TR-3", "Brandon", 3000),
                     make_trailer("TR-4", "Steinbach", 800) };

  auto cold = make_order("O-3", "Winnipeg", "Brandon", 900, Priority::MEDIUM);
  cold.requirements = Order::REFRIGERATION;
  auto cancelled = make_order("O-7", "Brandon", "Winnipeg", 100);
  cancelled.status = OrderStatus::CANCELLED;

  std::vector<Order> orders{
    make_order("O-1", "Winnipeg", "Steinbach", 700),
    make_order("O-2", "Winnipeg", "Brandon", 1200, Priority::LOW),
    cold,
    make_order("O-4", "Brandon", "Steinbach", 1600),
    make_order("O-5", "Steinbach", "Brandon", 600, Priority::MEDIUM),
    make_order("O-6", "Winnipeg", "Gimli", 20, Priority::LOW),
    cancelled,
  };

  auto result = engine().optimize(orders);

  std::set<std::string> seen;
  std::set<std::string> inputs;
  for (const auto& order : orders) {
    inputs.insert(order.id);
  }

  for (const auto& assignment : result.assignments) {
    EXPECT_TRUE(inputs.contains(assignment.order_id));
    EXPECT_TRUE(seen.insert(assignment.order_id).second)
      << assignment.order_id << " assigned twice";
  }

  for (const auto& id : result.unassigned_orders) {
    EXPECT_TRUE(seen.insert(id).second) << id << " both assigned and left out";
  }
  EXPECT_EQ(seen, inputs);
  EXPECT_EQ(reason(result, "O-7"), UnassignedReason::NOT_PENDING);
  EXPECT_EQ(result.unassigned.size(), result.unassigned_orders.size());

  std::map<std::string, double> load;
  std::map<std::string, Trailer> pool;
  for (const auto& trailer : fleet.trailers) {
    pool.emplace(trailer.id, trailer);
  }

  for (const auto& assignment : result.assignments) {
    const auto& order = *std::ranges::find(orders, assignment.order_id, &Order::id);
    const auto& trailer = pool.at(assignment.trailer_id);
    load[trailer.id] += order.weight_kg;
    EXPECT_TRUE(trailer.covers(order)) << order.id;
    EXPECT_EQ(lowered(trailer.warehouse), lowered(order.ship_from)) << order.id;
  }

  for (const auto& [id, kg] : load) {
    EXPECT_LE(kg, pool.at(id).max_weight_kg) << id;
  }

  for (size_t idx = 1; idx < result.route_summary.size(); ++idx) {
    EXPECT_GE(result.route_summary[idx - 1].profit,
              result.route_summary[idx].profit);
  }

  for (const auto& metrics : result.route_summary) {
    EXPECT_DOUBLE_EQ(metrics.profit, metrics.revenue - metrics.cost);
    if (metrics.accepted()) {
      EXPECT_GT(metrics.profit, 0.0);
    }
    EXPECT_LE(metrics.route.time_min, 600.0);
  }
}

TEST_F(OptimizationEngineTest, ReportsSummaryAndJson)
{
  fleet.trailers = { make_trailer("TR-1", "Winnipeg", 2000) };
  std::vector<Order> orders{ make_order("O-1", "Winnipeg", "Steinbach", 500),
                             make_order("O-2", "Winnipeg", "Brandon", 1800) };

  auto result = engine().optimize(orders);
  auto text = result.summary();

  EXPECT_NE(text.find("ROUTE OPTIMIZATION SUMMARY"), std::string::npos);
  EXPECT_NE(text.find("Total assignments: 1"), std::string::npos);
  EXPECT_NE(text.find("Unassigned O-1: no_trailer"), std::string::npos);

  nlohmann::json data = result;
  EXPECT_EQ(data["solver_status"], "solved");
  EXPECT_EQ(data["unassigned"][0]["reason"], "no_trailer");
  EXPECT_EQ(data["assignments"][0]["order_id"], "O-2");
  EXPECT_FALSE(data["degraded_matrix"].get<bool>());
}

TEST(OptimizationEngine, RejectsInvalidConfiguration)
{
  FakeFleet fleet;
  FakeMapping maps;
  FakeWeather weather;
  FlakyStore store;
  EngineConfig config;
  config.economics.min_margin = 1.5;

  EXPECT_THROW((OptimizationEngine{ fleet, maps, weather, maps, store, config }),
               ConfigurationError);
}

} // namespace
} // namespace loadplan
