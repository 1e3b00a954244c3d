#include "fakes.hxx"
#include "matrix_builder.hxx"
#include <cmath>
#include <gtest/gtest.h>

namespace loadplan {
namespace {

using testing::FakeMapping;
using testing::FakeWeather;
using testing::make_order;
using testing::make_truck;

class GeoTimeMatrixBuilderTest : public ::testing::Test
{
protected:
  FakeMapping maps;
  FakeWeather weather;
  EngineConfig config;
  BatchCache cache;

  std::vector<Order> orders{
    make_order("O-1", "Winnipeg", "Steinbach", 500, Priority::HIGH),
    make_order("O-2", "Winnipeg", "Brandon", 800, Priority::LOW),
    make_order("O-3", "Steinbach", "Brandon", 300, Priority::MEDIUM),
  };
  std::vector<Truck> trucks{ make_truck("T-1", "Winnipeg") };
  LocationIndex index = LocationIndex::build(trucks, orders);

  void SetUp() override
  {
    maps.leg("Winnipeg", "Steinbach", 60, 50);
    maps.leg("Winnipeg", "Brandon", 210, 130);
    maps.leg("Steinbach", "Brandon", 250, 160);
  }

  auto build() -> TravelMatrix
  {
    return GeoTimeMatrixBuilder(maps, weather, maps, config)
      .build(index, orders, { index.node("Winnipeg") }, cache);
  }
};

TEST_F(GeoTimeMatrixBuilderTest, UsesMappedDistancesAndTimes)
{
  auto matrix = build();
  auto w = index.node("Winnipeg");
  auto b = index.node("Brandon");

  EXPECT_FALSE(matrix.degraded);
  ASSERT_EQ(matrix.size(), 3u);
  EXPECT_DOUBLE_EQ(matrix.distance_km[w][b], 210.0);
  EXPECT_DOUBLE_EQ(matrix.time_min[b][w], 130.0);
  EXPECT_DOUBLE_EQ(matrix.distance_km[b][b], 0.0);
  EXPECT_EQ(maps.calls, 1u);
}

TEST_F(GeoTimeMatrixBuilderTest, SlowsLegsIntoBadWeather)
{
  weather.condition("Brandon", "Heavy Snow");
  weather.condition("Steinbach", "Thunderstorm with rain");

  auto matrix = build();
  auto w = index.node("Winnipeg");
  auto s = index.node("Steinbach");
  auto b = index.node("Brandon");

  EXPECT_DOUBLE_EQ(matrix.time_min[w][b], 130.0 * 1.3);
  EXPECT_DOUBLE_EQ(matrix.time_min[s][b], 160.0 * 1.3);
  EXPECT_DOUBLE_EQ(matrix.time_min[w][s], 50.0 * 1.5);
  // Leaving bad weather is not slowed down.
  EXPECT_DOUBLE_EQ(matrix.time_min[b][w], 130.0);
  EXPECT_DOUBLE_EQ(matrix.distance_km[w][b], 210.0);
  EXPECT_DOUBLE_EQ(matrix.weather[b], 0.3);
  EXPECT_DOUBLE_EQ(matrix.weather[w], 0.0);
}

TEST_F(GeoTimeMatrixBuilderTest, FailedForecastMeansNoAdjustment)
{
  weather.condition("Brandon", "Snow");
  weather.fail("Brandon");

  auto matrix = build();

  EXPECT_FALSE(matrix.degraded);
  EXPECT_DOUBLE_EQ(matrix.weather[index.node("Brandon")], 0.0);
  EXPECT_DOUBLE_EQ(
    matrix.time_min[index.node("Winnipeg")][index.node("Brandon")], 130.0);
}

TEST_F(GeoTimeMatrixBuilderTest, ForecastsEachLocationOncePerBatch)
{
  weather.condition("Brandon", "Light rain");

  build();
  build();

  EXPECT_EQ(weather.calls, 3u);
  EXPECT_EQ(cache.weather("brandon"), 0.2);
}

TEST_F(GeoTimeMatrixBuilderTest, FallsBackToDistanceTable)
{
  maps.failing = true;
  weather.condition("Brandon", "Snow");
  config.matrix.average_speed_kmh = 80;

  auto matrix = build();
  auto w = index.node("Winnipeg");
  auto b = index.node("Brandon");

  EXPECT_TRUE(matrix.degraded);
  EXPECT_DOUBLE_EQ(matrix.distance_km[w][b], 210.0);
  EXPECT_DOUBLE_EQ(matrix.time_min[w][b], 210.0 / 80 * 60);
  EXPECT_EQ(weather.calls, 0u);
  EXPECT_DOUBLE_EQ(matrix.weather[b], 0.0);
}

TEST_F(GeoTimeMatrixBuilderTest, FallsBackWhenALegIsUnknown)
{
  // Unknown leg makes the fake answer NOT_FOUND, and the table knows nothing
  // either.
  orders.push_back(make_order("O-4", "Winnipeg", "Flin Flon", 100));
  index = LocationIndex::build(trucks, orders);

  auto matrix = build();
  auto w = index.node("Winnipeg");
  auto f = index.node("Flin Flon");

  EXPECT_TRUE(matrix.degraded);
  EXPECT_TRUE(std::isinf(matrix.distance_km[w][f]));
  EXPECT_TRUE(std::isinf(matrix.time_min[f][w]));
  EXPECT_DOUBLE_EQ(matrix.distance_km[f][f], 0.0);
}

TEST_F(GeoTimeMatrixBuilderTest, FallsBackOnAnyMappingFailure)
{
  maps.crash = "quota exceeded";

  TravelMatrix matrix;
  ASSERT_NO_THROW(matrix = build());

  auto w = index.node("Winnipeg");
  auto s = index.node("Steinbach");

  EXPECT_TRUE(matrix.degraded);
  EXPECT_EQ(maps.calls, 1u);
  EXPECT_DOUBLE_EQ(matrix.distance_km[w][s], 60.0);
  EXPECT_DOUBLE_EQ(matrix.time_min[w][s], 60.0);
  EXPECT_EQ(weather.calls, 0u);
}

TEST_F(GeoTimeMatrixBuilderTest, TreatsFailingEstimatesAsUnreachable)
{
  maps.failing = true;
  maps.table_crash = "table corrupt";

  TravelMatrix matrix;
  ASSERT_NO_THROW(matrix = build());

  auto w = index.node("Winnipeg");
  auto b = index.node("Brandon");

  EXPECT_TRUE(matrix.degraded);
  EXPECT_TRUE(std::isinf(matrix.distance_km[w][b]));
  EXPECT_TRUE(std::isinf(matrix.time_min[b][w]));
  EXPECT_DOUBLE_EQ(matrix.distance_km[b][b], 0.0);
}

TEST_F(GeoTimeMatrixBuilderTest, MemoisesEstimatesWithinBatch)
{
  maps.failing = true;

  build();
  auto lookups = maps.lookups();
  build();

  EXPECT_EQ(lookups, 6u);
  EXPECT_EQ(maps.lookups(), lookups);
  EXPECT_EQ(cache.size(), 6u);
}

TEST_F(GeoTimeMatrixBuilderTest, TightestPriorityWindowWins)
{
  config.windows = { 200, 500, 1000 };

  auto matrix = build();

  // Steinbach is the destination of a high and the origin of a medium order.
  EXPECT_EQ(matrix.windows[index.node("Steinbach")].latest, 200);
  EXPECT_EQ(matrix.windows[index.node("Brandon")].latest, 500);
  EXPECT_EQ(matrix.windows[index.node("Brandon")].earliest, 0);
}

TEST_F(GeoTimeMatrixBuilderTest, DepotsAndUntouchedLocationsGetHorizon)
{
  config.solver.horizon_minutes = 400;
  index.add("Gimli");
  maps.leg("Gimli", "Winnipeg", 90, 70);
  maps.leg("Gimli", "Steinbach", 130, 100);
  maps.leg("Gimli", "Brandon", 280, 190);

  auto matrix = build();

  EXPECT_EQ(matrix.windows[index.node("Winnipeg")].latest, 400);
  EXPECT_EQ(matrix.windows[index.node("Gimli")].latest, 400);
  EXPECT_EQ(matrix.windows[index.node("Steinbach")].latest, 200);
  // Clipped to the horizon.
  EXPECT_EQ(matrix.windows[index.node("Brandon")].latest, 400);
}

} // namespace
} // namespace loadplan
