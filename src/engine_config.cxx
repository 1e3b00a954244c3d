#include "engine_config.hxx"
#include "errors.hxx"
#include <Poco/Exception.h>
#include <cmath>
#include <fmt/format.h>

namespace loadplan {

namespace {
void
require(bool condition, std::string_view key, double value)
{
  if (not condition) {
    throw ConfigurationError(
      fmt::format("Invalid value for {}: {}", key, value));
  }
}

auto
non_negative(double value) -> bool
{
  return std::isfinite(value) and value >= 0.0;
}
} // namespace

auto
EngineConfig::from(const Poco::Util::AbstractConfiguration& props)
  -> EngineConfig
{
  EngineConfig config;

  try {
    auto& solver = config.solver;
    solver.time_limit = std::chrono::milliseconds(props.getInt64(
      "solver.time_limit_ms", solver.time_limit.count()));
    solver.horizon_minutes =
      props.getInt("solver.horizon_minutes", solver.horizon_minutes);
    solver.max_leg_minutes =
      props.getInt("solver.max_leg_minutes", solver.max_leg_minutes);
    solver.max_wait_minutes =
      props.getInt("solver.max_wait_minutes", solver.max_wait_minutes);
    solver.service_minutes =
      props.getInt("solver.service_minutes", solver.service_minutes);
    solver.drop_penalty =
      props.getDouble("solver.drop_penalty", solver.drop_penalty);
    solver.stagnation_limit = props.getUInt64(
      "solver.stagnation_limit", solver.stagnation_limit);
    solver.seed = props.getUInt("solver.seed", solver.seed);
    solver.enforce_duty_hours =
      props.getBool("solver.enforce_duty_hours", solver.enforce_duty_hours);

    auto& matrix = config.matrix;
    matrix.average_speed_kmh =
      props.getDouble("matrix.average_speed_kmh", matrix.average_speed_kmh);
    matrix.forecast_days =
      props.getInt("matrix.forecast_days", matrix.forecast_days);
    matrix.weather_threads =
      props.getInt("matrix.weather_threads", matrix.weather_threads);

    auto& windows = config.windows;
    windows.high = props.getInt("windows.high", windows.high);
    windows.medium = props.getInt("windows.medium", windows.medium);
    windows.low = props.getInt("windows.low", windows.low);

    auto& weather = config.weather;
    weather.snow = props.getDouble("weather.snow", weather.snow);
    weather.rain = props.getDouble("weather.rain", weather.rain);
    weather.fog = props.getDouble("weather.fog", weather.fog);
    weather.storm = props.getDouble("weather.storm", weather.storm);

    auto& economics = config.economics;
    economics.base_rate_per_kg = props.getDouble(
      "economics.base_rate_per_kg", economics.base_rate_per_kg);
    economics.distance_factor_per_km = props.getDouble(
      "economics.distance_factor_per_km", economics.distance_factor_per_km);
    economics.heating_surcharge = props.getDouble(
      "economics.surcharge.heating", economics.heating_surcharge);
    economics.refrigeration_surcharge = props.getDouble(
      "economics.surcharge.refrigeration", economics.refrigeration_surcharge);
    economics.hazardous_surcharge = props.getDouble(
      "economics.surcharge.hazardous", economics.hazardous_surcharge);
    economics.fuel_cost_per_km = props.getDouble(
      "economics.fuel_cost_per_km", economics.fuel_cost_per_km);
    economics.driver_cost_per_hour = props.getDouble(
      "economics.driver_cost_per_hour", economics.driver_cost_per_hour);
    economics.maintenance_cost_per_km = props.getDouble(
      "economics.maintenance_cost_per_km", economics.maintenance_cost_per_km);
    economics.overhead_fixed =
      props.getDouble("economics.overhead_fixed", economics.overhead_fixed);
    economics.overhead_per_hour = props.getDouble(
      "economics.overhead_per_hour", economics.overhead_per_hour);
    economics.min_margin =
      props.getDouble("economics.min_margin", economics.min_margin);

    config.actor = props.getString("engine.actor", config.actor);
  } catch (const Poco::SyntaxException& exc) {
    throw ConfigurationError(
      fmt::format("Malformed configuration value: {}", exc.displayText()));
  }
  return config;
}

void
EngineConfig::validate() const
{
  require(solver.time_limit.count() > 0,
          "solver.time_limit_ms",
          static_cast<double>(solver.time_limit.count()));
  require(
    solver.horizon_minutes > 0, "solver.horizon_minutes", solver.horizon_minutes);
  require(solver.max_leg_minutes > 0,
          "solver.max_leg_minutes",
          solver.max_leg_minutes);
  require(solver.max_wait_minutes >= 0,
          "solver.max_wait_minutes",
          solver.max_wait_minutes);
  require(solver.service_minutes >= 0,
          "solver.service_minutes",
          solver.service_minutes);
  require(solver.drop_penalty > 0 and std::isfinite(solver.drop_penalty),
          "solver.drop_penalty",
          solver.drop_penalty);

  require(matrix.average_speed_kmh > 0 and
            std::isfinite(matrix.average_speed_kmh),
          "matrix.average_speed_kmh",
          matrix.average_speed_kmh);
  require(matrix.forecast_days > 0, "matrix.forecast_days", matrix.forecast_days);
  require(
    matrix.weather_threads > 0, "matrix.weather_threads", matrix.weather_threads);

  require(windows.high >= 0, "windows.high", windows.high);
  require(windows.medium >= 0, "windows.medium", windows.medium);
  require(windows.low >= 0, "windows.low", windows.low);

  require(non_negative(weather.snow), "weather.snow", weather.snow);
  require(non_negative(weather.rain), "weather.rain", weather.rain);
  require(non_negative(weather.fog), "weather.fog", weather.fog);
  require(non_negative(weather.storm), "weather.storm", weather.storm);

  require(non_negative(economics.base_rate_per_kg),
          "economics.base_rate_per_kg",
          economics.base_rate_per_kg);
  require(non_negative(economics.distance_factor_per_km),
          "economics.distance_factor_per_km",
          economics.distance_factor_per_km);
  require(non_negative(economics.heating_surcharge),
          "economics.surcharge.heating",
          economics.heating_surcharge);
  require(non_negative(economics.refrigeration_surcharge),
          "economics.surcharge.refrigeration",
          economics.refrigeration_surcharge);
  require(non_negative(economics.hazardous_surcharge),
          "economics.surcharge.hazardous",
          economics.hazardous_surcharge);
  require(non_negative(economics.fuel_cost_per_km),
          "economics.fuel_cost_per_km",
          economics.fuel_cost_per_km);
  require(non_negative(economics.driver_cost_per_hour),
          "economics.driver_cost_per_hour",
          economics.driver_cost_per_hour);
  require(non_negative(economics.maintenance_cost_per_km),
          "economics.maintenance_cost_per_km",
          economics.maintenance_cost_per_km);
  require(non_negative(economics.overhead_fixed),
          "economics.overhead_fixed",
          economics.overhead_fixed);
  require(non_negative(economics.overhead_per_hour),
          "economics.overhead_per_hour",
          economics.overhead_per_hour);
  require(economics.min_margin >= 0.0 and economics.min_margin < 1.0,
          "economics.min_margin",
          economics.min_margin);

  if (actor.empty()) {
    throw ConfigurationError("engine.actor must not be empty");
  }
}

void
EngineConfig::log(Poco::Logger& logger) const
{
  logger.information(fmt::format(
    "solver: time_limit={}ms horizon={}min max_leg={}min max_wait={}min "
    "service={}min drop_penalty={} stagnation={} seed={} duty_hours={}",
    solver.time_limit.count(),
    solver.horizon_minutes,
    solver.max_leg_minutes,
    solver.max_wait_minutes,
    solver.service_minutes,
    solver.drop_penalty,
    solver.stagnation_limit,
    solver.seed,
    solver.enforce_duty_hours));
  logger.information(
    fmt::format("matrix: speed={}km/h forecast_days={} weather_threads={} "
                "windows high={} medium={} low={}",
                matrix.average_speed_kmh,
                matrix.forecast_days,
                matrix.weather_threads,
                windows.high,
                windows.medium,
                windows.low));
  logger.information(
    fmt::format("weather: snow={} rain={} fog={} storm={}",
                weather.snow,
                weather.rain,
                weather.fog,
                weather.storm));
  logger.information(fmt::format(
    "economics: rate={}/kg distance_factor={}/km surcharges heating={} "
    "refrigeration={} hazardous={} fuel={}/km driver={}/h maintenance={}/km "
    "overhead={}+{}/h min_margin={}",
    economics.base_rate_per_kg,
    economics.distance_factor_per_km,
    economics.heating_surcharge,
    economics.refrigeration_surcharge,
    economics.hazardous_surcharge,
    economics.fuel_cost_per_km,
    economics.driver_cost_per_hour,
    economics.maintenance_cost_per_km,
    economics.overhead_fixed,
    economics.overhead_per_hour,
    economics.min_margin));
  logger.information(fmt::format("engine: actor={}", actor));
}

} // namespace loadplan
