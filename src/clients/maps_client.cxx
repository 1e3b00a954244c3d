#include "clients/maps_client.hxx"
#include "clients/http.hxx"
#include <fmt/format.h>
#include <fmt/ranges.h>

namespace loadplan {

GoogleMapsClient::GoogleMapsClient(const std::string& uri, std::string key)
  : mBase(base_uri(uri.empty() ? DEFAULT_URI : uri))
  , mKey(std::move(key))
{
}

auto
GoogleMapsClient::logger() -> Poco::Logger&
{
  return Poco::Logger::get("maps-client");
}

auto
GoogleMapsClient::route_matrix(const std::vector<std::string>& locations)
  -> RouteMatrix
{
  if (mKey.empty()) {
    throw ServiceUnavailable("Maps API key not configured");
  }

  if (locations.empty()) {
    return {};
  }

  auto places = fmt::format("{}", fmt::join(locations, "|"));
  Poco::URI uri(mBase);
  uri.setPath("/maps/api/distancematrix/json");
  uri.addQueryParameter("origins", places);
  uri.addQueryParameter("destinations", places);
  uri.addQueryParameter("mode", "driving");
  uri.addQueryParameter("units", "metric");
  uri.addQueryParameter("key", mKey);

  logger().debug(
    fmt::format("Requesting {}x{} matrix", locations.size(), locations.size()));
  return parse(get_json(uri, "Maps API"), locations.size());
}

auto
GoogleMapsClient::parse(const nlohmann::json& data, size_t size) -> RouteMatrix
{
  try {
    auto status = data.at("status").get<std::string>();

    if (status != "OK") {
      throw ServiceUnavailable(fmt::format("Maps API status {}", status));
    }

    const auto& rows = data.at("rows");

    if (rows.size() != size) {
      throw ServiceUnavailable(
        fmt::format("Maps API returned {} rows for {} origins", rows.size(), size));
    }

    RouteMatrix matrix;
    matrix.distance_km.assign(size, std::vector<double>(size, 0.0));
    matrix.time_min.assign(size, std::vector<double>(size, 0.0));

    for (size_t from = 0; from < size; ++from) {
      const auto& elements = rows[from].at("elements");

      if (elements.size() != size) {
        throw ServiceUnavailable(fmt::format(
          "Maps API row {} has {} elements, expected {}", from, elements.size(), size));
      }

      for (size_t to = 0; to < size; ++to) {
        const auto& element = elements[to];
        auto elementStatus = element.at("status").get<std::string>();

        if (elementStatus != "OK") {
          throw ServiceUnavailable(fmt::format(
            "Maps API element {}->{} status {}", from, to, elementStatus));
        }
        matrix.distance_km[from][to] =
          element.at("distance").at("value").get<double>() / 1000.0;
        matrix.time_min[from][to] =
          element.at("duration").at("value").get<double>() / 60.0;
      }
    }
    return matrix;
  } catch (const nlohmann::json::exception& exc) {
    throw ServiceUnavailable(
      fmt::format("Malformed Maps API answer: {}", exc.what()));
  }
}

} // namespace loadplan
