#include "weather_adjustment.hxx"
#include <gtest/gtest.h>

namespace loadplan {
namespace {

TEST(WeatherAdjustment, MatchesKeywordsIgnoringCase)
{
  WeatherAdjustment adjust;

  EXPECT_DOUBLE_EQ(adjust("Snow"), 0.30);
  EXPECT_DOUBLE_EQ(adjust("light RAIN"), 0.20);
  EXPECT_DOUBLE_EQ(adjust("Showers"), 0.20);
  EXPECT_DOUBLE_EQ(adjust("Mist"), 0.10);
  EXPECT_DOUBLE_EQ(adjust("Freezing fog"), 0.10);
  EXPECT_DOUBLE_EQ(adjust("Thunderstorm"), 0.50);
}

TEST(WeatherAdjustment, MostSevereKeywordWins)
{
  WeatherAdjustment adjust;

  EXPECT_DOUBLE_EQ(adjust("Rain and snow"), 0.30);
  EXPECT_DOUBLE_EQ(adjust("Thunder with rain"), 0.50);
  EXPECT_DOUBLE_EQ(adjust("Snow storm"), 0.50);
  EXPECT_DOUBLE_EQ(adjust("Mist turning to drizzle and rain"), 0.20);
}

TEST(WeatherAdjustment, ClearSkiesCostNothing)
{
  WeatherAdjustment adjust;

  EXPECT_DOUBLE_EQ(adjust("Clear"), 0.0);
  EXPECT_DOUBLE_EQ(adjust("Clouds"), 0.0);
  EXPECT_DOUBLE_EQ(adjust(""), 0.0);
}

TEST(WeatherAdjustment, UsesConfiguredRates)
{
  WeatherRates rates;
  rates.snow = 0.45;
  rates.fog = 0.0;

  WeatherAdjustment adjust(rates);

  EXPECT_DOUBLE_EQ(adjust("Blowing snow"), 0.45);
  EXPECT_DOUBLE_EQ(adjust("Fog"), 0.0);
  EXPECT_DOUBLE_EQ(adjust("Rain"), 0.20);
}

} // namespace
} // namespace loadplan
