#include "weather_adjustment.hxx"
#include "utils.hxx"

namespace loadplan {

WeatherAdjustment::WeatherAdjustment(const WeatherRates& rates)
  : mRates(rates)
{
}

auto
WeatherAdjustment::operator()(std::string_view condition) const -> double
{
  auto text = lowered(condition);

  if (contains_any(text, { "storm", "thunder" })) {
    return mRates.storm;
  }
  if (contains_any(text, { "snow" })) {
    return mRates.snow;
  }
  if (contains_any(text, { "rain", "shower" })) {
    return mRates.rain;
  }
  if (contains_any(text, { "fog", "mist" })) {
    return mRates.fog;
  }
  return 0.0;
}

} // namespace loadplan
