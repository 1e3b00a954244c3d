#include "matrix_builder.hxx"
#include "utils.hxx"
#include <Poco/Runnable.h>
#include <Poco/ThreadPool.h>
#include <algorithm>
#include <atomic>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <memory>

namespace loadplan {

namespace {
// Pulls locations off a shared cursor until none are left, so that the pool
// never holds more workers than it has threads.
class ForecastWorker : public Poco::Runnable
{
private:
  const std::vector<std::string>& mLocations;
  std::atomic<size_t>& mCursor;
  std::vector<double>& mAdjustments;
  WeatherService& mWeather;
  const WeatherAdjustment& mAdjustment;
  BatchCache& mCache;
  int mDays;

public:
  ForecastWorker(const std::vector<std::string>& locations,
                 std::atomic<size_t>& cursor,
                 std::vector<double>& adjustments,
                 WeatherService& weather,
                 const WeatherAdjustment& adjustment,
                 BatchCache& cache,
                 int days)
    : mLocations(locations)
    , mCursor(cursor)
    , mAdjustments(adjustments)
    , mWeather(weather)
    , mAdjustment(adjustment)
    , mCache(cache)
    , mDays(days)
  {
  }

  void run() override
  {
    for (auto idx = mCursor++; idx < mLocations.size(); idx = mCursor++) {
      const auto& location = mLocations[idx];
      auto key = lowered(location);

      if (auto cached = mCache.weather(key)) {
        mAdjustments[idx] = *cached;
        continue;
      }

      double adjustment = 0.0;

      try {
        if (auto forecast = mWeather.forecast(location, mDays)) {
          adjustment = mAdjustment(forecast->condition);
          Poco::Logger::get("weather").debug(
            fmt::format("{}: '{}' -> +{:.0f}%",
                        location,
                        forecast->condition,
                        adjustment * 100));
        }
      } catch (const std::exception& exc) {
        Poco::Logger::get("weather").warning(fmt::format(
          "Forecast for {} unavailable, no adjustment: {}", location, exc.what()));
      }
      mAdjustments[idx] = adjustment;
      mCache.weather(key, adjustment);
    }
  }
};

auto
square(size_t size, double value) -> Matrix
{
  return Matrix(size, std::vector<double>(size, value));
}

auto
well_formed(const Matrix& matrix, size_t size) -> bool
{
  return matrix.size() == size and
         std::ranges::all_of(matrix, [size](const auto& row) {
           return row.size() == size and
                  std::ranges::all_of(row, [](double value) {
                    return not std::isnan(value) and value >= 0.0;
                  });
         });
}
} // namespace

auto
TravelMatrix::size() const -> size_t
{
  return distance_km.size();
}

GeoTimeMatrixBuilder::GeoTimeMatrixBuilder(MappingService& maps,
                                           WeatherService& weather,
                                           const DistanceTable& table,
                                           const EngineConfig& config)
  : mMaps(maps)
  , mWeather(weather)
  , mTable(table)
  , mOptions(config.matrix)
  , mWindows(config.windows)
  , mHorizon(config.solver.horizon_minutes)
  , mAdjustment(config.weather)
{
}

auto
GeoTimeMatrixBuilder::logger() -> Poco::Logger&
{
  return Poco::Logger::get("matrix-builder");
}

auto
GeoTimeMatrixBuilder::window(Priority priority) const -> int
{
  switch (priority) {
    case Priority::HIGH:
      return mWindows.high;
    case Priority::MEDIUM:
      return mWindows.medium;
    default:
      return mWindows.low;
  }
}

auto
GeoTimeMatrixBuilder::weather(const LocationIndex& index, BatchCache& cache)
  -> std::vector<double>
{
  const auto& locations = index.names();
  std::vector<double> adjustments(locations.size(), 0.0);
  std::atomic<size_t> cursor{ 0 };

  auto nWorkers = std::min<size_t>(mOptions.weather_threads, locations.size());
  std::vector<std::unique_ptr<ForecastWorker>> workers;
  workers.reserve(nWorkers);

  Poco::ThreadPool pool(1, std::max<int>(1, static_cast<int>(nWorkers)));

  for (size_t idx = 0; idx < nWorkers; ++idx) {
    workers.emplace_back(std::make_unique<ForecastWorker>(locations,
                                                          cursor,
                                                          adjustments,
                                                          mWeather,
                                                          mAdjustment,
                                                          cache,
                                                          mOptions.forecast_days));
    pool.start(*workers.back());
  }
  pool.joinAll();

  return adjustments;
}

auto
GeoTimeMatrixBuilder::primary(const LocationIndex& index, BatchCache& cache)
  -> TravelMatrix
{
  auto size = index.size();
  auto response = mMaps.route_matrix(index.names());

  if (not well_formed(response.distance_km, size) or
      not well_formed(response.time_min, size)) {
    throw ServiceUnavailable(
      fmt::format("Mapping service returned a malformed matrix for {} "
                  "locations",
                  size));
  }

  TravelMatrix matrix;
  matrix.distance_km = std::move(response.distance_km);
  matrix.time_min = std::move(response.time_min);
  matrix.weather = weather(index, cache);

  for (size_t from = 0; from < size; ++from) {
    matrix.distance_km[from][from] = 0.0;
    matrix.time_min[from][from] = 0.0;

    for (size_t to = 0; to < size; ++to) {
      if (from != to) {
        matrix.time_min[from][to] *= 1.0 + matrix.weather[to];
      }
    }
  }
  return matrix;
}

auto
GeoTimeMatrixBuilder::fallback(const LocationIndex& index,
                               BatchCache& cache) const -> TravelMatrix
{
  auto size = index.size();
  TravelMatrix matrix;
  matrix.distance_km = square(size, 0.0);
  matrix.time_min = square(size, 0.0);
  matrix.weather.assign(size, 0.0);
  matrix.degraded = true;

  for (size_t from = 0; from < size; ++from) {
    for (size_t to = 0; to < size; ++to) {
      if (from == to) {
        continue;
      }
      const auto& source = index.name(from);
      const auto& target = index.name(to);
      auto km = cache.distance(lowered(source), lowered(target), [&]() {
        try {
          return mTable.approximate_distance(source, target);
        } catch (const std::exception& exc) {
          logger().warning(fmt::format(
            "No distance estimate {} -> {}: {}", source, target, exc.what()));
          return std::numeric_limits<double>::infinity();
        }
      });

      if (std::isnan(km) or km < 0.0) {
        km = std::numeric_limits<double>::infinity();
      }
      matrix.distance_km[from][to] = km;
      matrix.time_min[from][to] = km / mOptions.average_speed_kmh * 60.0;
    }
  }
  return matrix;
}

auto
GeoTimeMatrixBuilder::build(const LocationIndex& index,
                            const std::vector<Order>& orders,
                            const std::vector<size_t>& depots,
                            BatchCache& cache) -> TravelMatrix
{
  TravelMatrix matrix;

  try {
    matrix = primary(index, cache);
  } catch (const ServiceUnavailable& exc) {
    logger().warning(fmt::format(
      "Mapping service unavailable, using distance estimates: {}", exc.what()));
    matrix = fallback(index, cache);
  } catch (const std::exception& exc) {
    logger().error(fmt::format(
      "Mapping service failed, using distance estimates: {}", exc.what()));
    matrix = fallback(index, cache);
  }

  std::vector<std::optional<int>> latest(index.size());

  for (const auto& order : orders) {
    auto limit = window(order.priority);

    for (const auto& location : { order.ship_from, order.ship_to }) {
      auto& current = latest[index.node(location)];
      current = current ? std::min(*current, limit) : limit;
    }
  }

  for (auto depot : depots) {
    latest[depot].reset();
  }

  matrix.windows.reserve(index.size());

  for (const auto& limit : latest) {
    matrix.windows.push_back(
      { 0, limit ? std::min(*limit, mHorizon) : mHorizon });
  }

  logger().information(
    fmt::format("Built {}x{} travel matrix ({}), {} cached lookups reused",
                index.size(),
                index.size(),
                matrix.degraded ? "estimated" : "mapped",
                cache.hits()));
  return matrix;
}

} // namespace loadplan
