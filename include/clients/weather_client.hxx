#ifndef LOADPLAN_CLIENTS_WEATHER_CLIENT
#define LOADPLAN_CLIENTS_WEATHER_CLIENT

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "collaborators.hxx"
#include <Poco/URI.h>
#include <nlohmann/json.hpp>
#include <string>

namespace loadplan {

// OpenWeatherMap 5 day / 3 hour forecast. Stateless, so safe to call from
// several threads at once.
class OpenWeatherClient : public WeatherService
{
private:
  Poco::URI mBase;
  std::string mKey;

public:
  static constexpr auto DEFAULT_URI = "https://api.openweathermap.org";
  static constexpr int MAX_SLOTS = 40;

  OpenWeatherClient(const std::string&, std::string);

  // True when no usable key is configured, in which case every forecast is
  // nullopt.
  [[nodiscard]] auto placeholder() const -> bool;

  auto forecast(const std::string&, int) -> std::optional<Forecast> override;

  // Condition of the first forecast slot, nullopt for an empty forecast.
  static auto parse(const nlohmann::json&) -> std::optional<Forecast>;
};

} // namespace loadplan

#endif
