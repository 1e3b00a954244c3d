#include "clients/weather_client.hxx"
#include "clients/http.hxx"
#include <Poco/Logger.h>
#include <algorithm>
#include <fmt/format.h>

namespace loadplan {

OpenWeatherClient::OpenWeatherClient(const std::string& uri, std::string key)
  : mBase(base_uri(uri.empty() ? DEFAULT_URI : uri))
  , mKey(std::move(key))
{
}

auto
OpenWeatherClient::placeholder() const -> bool
{
  return mKey.empty() or mKey.starts_with("placeholder") or
         mKey.starts_with("your_");
}

auto
OpenWeatherClient::forecast(const std::string& location, int days)
  -> std::optional<Forecast>
{
  if (placeholder()) {
    return std::nullopt;
  }

  Poco::URI uri(mBase);
  uri.setPath("/data/2.5/forecast");
  uri.addQueryParameter("q", location);
  uri.addQueryParameter("appid", mKey);
  uri.addQueryParameter("units", "metric");
  uri.addQueryParameter("cnt",
                        std::to_string(std::clamp(days * 8, 1, MAX_SLOTS)));

  auto result = parse(get_json(uri, "Weather API"));
  Poco::Logger::get("weather-client")
    .debug(fmt::format("{}: {}",
                       location,
                       result ? result->condition : std::string("no forecast")));
  return result;
}

auto
OpenWeatherClient::parse(const nlohmann::json& data) -> std::optional<Forecast>
{
  try {
    if (not data.contains("list") or data["list"].empty()) {
      return std::nullopt;
    }

    const auto& conditions = data["list"][0].at("weather");

    if (conditions.empty()) {
      return std::nullopt;
    }
    return Forecast{ conditions[0].at("main").get<std::string>() };
  } catch (const nlohmann::json::exception& exc) {
    throw ServiceUnavailable(
      fmt::format("Malformed Weather API answer: {}", exc.what()));
  }
}

} // namespace loadplan
