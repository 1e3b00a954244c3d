#ifndef LOADPLAN_CLIENTS_MAPS_CLIENT
#define LOADPLAN_CLIENTS_MAPS_CLIENT

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "collaborators.hxx"
#include <Poco/Logger.h>
#include <Poco/URI.h>
#include <nlohmann/json.hpp>
#include <string>

namespace loadplan {

// Google Distance Matrix API, driving mode, metric units.
class GoogleMapsClient : public MappingService
{
private:
  Poco::URI mBase;
  std::string mKey;

  static auto logger() -> Poco::Logger&;

public:
  static constexpr auto DEFAULT_URI = "https://maps.googleapis.com";

  GoogleMapsClient(const std::string&, std::string);

  auto route_matrix(const std::vector<std::string>&) -> RouteMatrix override;

  /**
   * @brief Decode a distance matrix answer into km and minutes.
   * @throws ServiceUnavailable when the answer or any element is not OK or
   * the matrix is not square over the given number of locations.
   */
  static auto parse(const nlohmann::json&, size_t) -> RouteMatrix;
};

} // namespace loadplan

#endif
