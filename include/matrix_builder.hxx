/** @file matrix_builder.hxx
 * @brief Distance, travel time and service window inputs of the solver.
 */
#ifndef LOADPLAN_MATRIX_BUILDER
#define LOADPLAN_MATRIX_BUILDER

#include "batch_cache.hxx"
#include "collaborators.hxx"
#include "engine_config.hxx"
#include "location_index.hxx"
#include "weather_adjustment.hxx"
#include <Poco/Logger.h>
#include <vector>

namespace loadplan {

struct TimeWindow
{
  int earliest = 0;
  int latest = 0;
};

struct TravelMatrix
{
  Matrix distance_km;
  Matrix time_min;
  std::vector<TimeWindow> windows;
  // Inflation applied to legs arriving at each location, all 0 when degraded.
  std::vector<double> weather;
  bool degraded = false;

  [[nodiscard]] auto size() const -> size_t;
};

/**
 * @brief Builds the travel matrix of a batch from the mapping service,
 * falling back to the distance table when the service cannot answer.
 */
class GeoTimeMatrixBuilder
{
private:
  MappingService& mMaps;
  WeatherService& mWeather;
  const DistanceTable& mTable;
  MatrixOptions mOptions;
  TimeWindowPolicy mWindows;
  int mHorizon;
  WeatherAdjustment mAdjustment;

  static auto logger() -> Poco::Logger&;

  [[nodiscard]] auto window(Priority) const -> int;

  auto weather(const LocationIndex&, BatchCache&) -> std::vector<double>;

  auto primary(const LocationIndex&, BatchCache&) -> TravelMatrix;

  auto fallback(const LocationIndex&, BatchCache&) const -> TravelMatrix;

public:
  GeoTimeMatrixBuilder(MappingService&,
                       WeatherService&,
                       const DistanceTable&,
                       const EngineConfig&);

  /**
   * @brief Build the matrix for every location of the index.
   * @param[in] : Locations of the batch
   * @param[in] : Orders whose priorities set the service windows
   * @param[in] : Node indices of the vehicle depots
   * @param[in] : Lookups shared for the lifetime of the batch
   * @return Never throws for collaborator failures; a mapping failure is
   * reported through TravelMatrix::degraded.
   */
  auto build(const LocationIndex&,
             const std::vector<Order>&,
             const std::vector<size_t>&,
             BatchCache&) -> TravelMatrix;
};

} // namespace loadplan

#endif
