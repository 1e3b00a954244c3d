#ifndef LOADPLAN_WEATHER_ADJUSTMENT
#define LOADPLAN_WEATHER_ADJUSTMENT

#include "engine_config.hxx"
#include <string_view>

namespace loadplan {

/**
 * @brief Maps a forecast condition to the fraction by which travel times
 * into that location are inflated.
 * @details Matching is a case-insensitive substring search. When several
 * keywords match the most severe one wins: storm/thunder, then snow, then
 * rain/shower, then fog/mist. Anything else yields 0.
 */
class WeatherAdjustment
{
private:
  WeatherRates mRates;

public:
  explicit WeatherAdjustment(const WeatherRates& = {});

  [[nodiscard]] auto operator()(std::string_view) const -> double;
};

} // namespace loadplan

#endif
