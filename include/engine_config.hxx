/** @file engine_config.hxx
 * @brief Tunables of one optimisation engine.
 */
#ifndef LOADPLAN_ENGINE_CONFIG
#define LOADPLAN_ENGINE_CONFIG

#include <Poco/Logger.h>
#include <Poco/Util/AbstractConfiguration.h>
#include <chrono>
#include <cstdint>
#include <string>

namespace loadplan {

struct SolverOptions
{
  std::chrono::milliseconds time_limit{ 30000 };
  int horizon_minutes = 1440;
  int max_leg_minutes = 1440;
  int max_wait_minutes = 30;
  int service_minutes = 0;
  double drop_penalty = 1000000.0;
  size_t stagnation_limit = 2000;
  uint32_t seed = 7;
  bool enforce_duty_hours = true;
};

struct MatrixOptions
{
  double average_speed_kmh = 60.0;
  int forecast_days = 1;
  int weather_threads = 4;
};

// Latest service minute of a location, by the priority of its orders.
struct TimeWindowPolicy
{
  int high = 200;
  int medium = 500;
  int low = 1000;
};

struct WeatherRates
{
  double snow = 0.30;
  double rain = 0.20;
  double fog = 0.10;
  double storm = 0.50;
};

struct EconomicsRates
{
  double base_rate_per_kg = 0.10;
  double distance_factor_per_km = 0.01;
  double heating_surcharge = 0.3;
  double refrigeration_surcharge = 0.3;
  double hazardous_surcharge = 0.5;
  double fuel_cost_per_km = 0.35;
  double driver_cost_per_hour = 25.0;
  double maintenance_cost_per_km = 0.05;
  double overhead_fixed = 50.0;
  double overhead_per_hour = 5.0;
  double min_margin = 0.0;
};

struct EngineConfig
{
  static constexpr auto DEFAULT_ACTOR = "optimization_engine";

  SolverOptions solver;
  MatrixOptions matrix;
  TimeWindowPolicy windows;
  WeatherRates weather;
  EconomicsRates economics;
  std::string actor = DEFAULT_ACTOR;

  /**
   * @brief Read every known key, keeping the defaults for missing ones.
   * @throws ConfigurationError when a value cannot be converted.
   */
  static auto from(const Poco::Util::AbstractConfiguration&) -> EngineConfig;

  // Throws ConfigurationError on the first invalid value.
  void validate() const;

  void log(Poco::Logger&) const;
};

} // namespace loadplan

#endif
