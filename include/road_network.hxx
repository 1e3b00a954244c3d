/** @file road_network.hxx
 * @brief Offline distance estimates used when the mapping service is down.
 */
#ifndef LOADPLAN_ROAD_NETWORK
#define LOADPLAN_ROAD_NETWORK

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "collaborators.hxx"
#include <boost/graph/adjacency_list.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace loadplan {

struct Coordinates
{
  double latitude;
  double longitude;
};

/**
 * @brief Distance table backed by known coordinates and known road legs.
 * @details Two locations with known coordinates are estimated by their
 * great-circle distance scaled by a road factor. Otherwise the estimate is
 * the shortest path over the known road legs. Pairs connected by neither are
 * reported as +infinity.
 */
class RoadNetwork : public DistanceTable
{
private:
  using Graph = boost::adjacency_list<boost::vecS,
                                      boost::vecS,
                                      boost::undirectedS,
                                      std::string,
                                      double>;
  using Vertex = boost::graph_traits<Graph>::vertex_descriptor;

  Graph mGraph;
  std::unordered_map<std::string, Vertex> mVertices;
  std::unordered_map<std::string, Coordinates> mCoordinates;
  double mRoadFactor;

  auto vertex(const std::string&) -> Vertex;

  [[nodiscard]] auto shortest_path(Vertex, Vertex) const -> double;

public:
  explicit RoadNetwork(double = 1.0);

  // Seeded with the major Canadian cities the rate sheets cover.
  static auto with_defaults(double = 1.0) -> RoadNetwork;

  void coordinates(const std::string&, Coordinates);

  [[nodiscard]] auto coordinates(std::string_view) const
    -> std::optional<Coordinates>;

  // Returns false when the leg is rejected (negative or non-finite length).
  auto add_leg(const std::string&, const std::string&, double) -> bool;

  /**
   * @brief Merge a network description.
   * @param[in] : {"road_factor": x, "locations": [{"name", "latitude",
   * "longitude"}], "legs": [{"from", "to", "km"}]}
   */
  void load(const nlohmann::json&);

  [[nodiscard]] auto road_factor() const -> double;

  [[nodiscard]] auto approximate_distance(std::string_view,
                                          std::string_view) const
    -> double override;
};

} // namespace loadplan

#endif
