#include "road_network.hxx"
#include "utils.hxx"
#include <Poco/Logger.h>
#include <boost/graph/dijkstra_shortest_paths.hpp>
#include <boost/property_map/property_map.hpp>
#include <cmath>
#include <fmt/format.h>
#include <limits>
#include <vector>

namespace loadplan {

namespace {
constexpr double UNKNOWN = std::numeric_limits<double>::infinity();

auto
logger() -> Poco::Logger&
{
  return Poco::Logger::get("road-network");
}
} // namespace

RoadNetwork::RoadNetwork(double roadFactor)
  : mRoadFactor(roadFactor)
{
  if (not(roadFactor >= 1.0) or not std::isfinite(roadFactor)) {
    throw ConfigurationError(
      fmt::format("Road factor must be finite and >= 1, got {}", roadFactor));
  }
}

auto
RoadNetwork::with_defaults(double roadFactor) -> RoadNetwork
{
  RoadNetwork network(roadFactor);
  network.coordinates("Winnipeg", { 49.8951, -97.1384 });
  network.coordinates("Calgary", { 51.0447, -114.0719 });
  network.coordinates("Edmonton", { 53.5461, -113.4938 });
  network.coordinates("Vancouver", { 49.2827, -123.1207 });
  network.coordinates("Toronto", { 43.6532, -79.3832 });
  network.coordinates("Montreal", { 45.5017, -73.5673 });
  network.coordinates("Regina", { 50.4452, -104.6189 });
  return network;
}

void
RoadNetwork::coordinates(const std::string& location, Coordinates point)
{
  mCoordinates[lowered(location)] = point;
}

auto
RoadNetwork::coordinates(std::string_view location) const
  -> std::optional<Coordinates>
{
  if (auto found = mCoordinates.find(lowered(location));
      found != mCoordinates.end()) {
    return found->second;
  }
  return std::nullopt;
}

auto
RoadNetwork::vertex(const std::string& location) -> Vertex
{
  auto key = lowered(location);

  if (not mVertices.contains(key)) {
    mVertices[key] = boost::add_vertex(location, mGraph);
  }
  return mVertices[key];
}

auto
RoadNetwork::add_leg(const std::string& from, const std::string& to, double km)
  -> bool
{
  if (not std::isfinite(km) or km < 0) {
    logger().warning(
      fmt::format("Ignoring road leg {} -> {} of {} km", from, to, km));
    return false;
  }
  auto source = vertex(from);
  auto target = vertex(to);
  return boost::add_edge(source, target, km, mGraph).second;
}

void
RoadNetwork::load(const nlohmann::json& data)
{
  if (data.contains("road_factor")) {
    auto factor = data["road_factor"].get<double>();

    if (not(factor >= 1.0) or not std::isfinite(factor)) {
      throw ConfigurationError(
        fmt::format("Road factor must be finite and >= 1, got {}", factor));
    }
    mRoadFactor = factor;
  }

  if (data.contains("locations")) {
    for (const auto& location : data["locations"]) {
      coordinates(location.at("name").get<std::string>(),
                  { location.at("latitude").get<double>(),
                    location.at("longitude").get<double>() });
    }
  }

  if (data.contains("legs")) {
    for (const auto& leg : data["legs"]) {
      add_leg(leg.at("from").get<std::string>(),
              leg.at("to").get<std::string>(),
              leg.at("km").get<double>());
    }
  }
  logger().debug(fmt::format("Road network holds {} locations and {} legs",
                             mCoordinates.size(),
                             boost::num_edges(mGraph)));
}

auto
RoadNetwork::road_factor() const -> double
{
  return mRoadFactor;
}

auto
RoadNetwork::shortest_path(Vertex source, Vertex target) const -> double
{
  std::vector<double> distances(boost::num_vertices(mGraph), UNKNOWN);

  boost::dijkstra_shortest_paths(
    mGraph,
    source,
    boost::weight_map(boost::get(boost::edge_bundle, mGraph))
      .distance_map(boost::make_iterator_property_map(
        distances.begin(), boost::get(boost::vertex_index, mGraph)))
      .distance_inf(UNKNOWN));

  return distances[target];
}

auto
RoadNetwork::approximate_distance(std::string_view from,
                                  std::string_view to) const -> double
{
  if (iequals(from, to)) {
    return 0.0;
  }

  auto source = coordinates(from);
  auto target = coordinates(to);

  if (source and target) {
    return haversine_km(source->latitude,
                        source->longitude,
                        target->latitude,
                        target->longitude) *
           mRoadFactor;
  }

  auto sourceVertex = mVertices.find(lowered(from));
  auto targetVertex = mVertices.find(lowered(to));

  if (sourceVertex != mVertices.end() and targetVertex != mVertices.end()) {
    return shortest_path(sourceVertex->second, targetVertex->second);
  }
  return UNKNOWN;
}

} // namespace loadplan
