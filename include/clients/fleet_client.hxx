#ifndef LOADPLAN_CLIENTS_FLEET_CLIENT
#define LOADPLAN_CLIENTS_FLEET_CLIENT

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "collaborators.hxx"
#include <cpr/cpr.h>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

namespace loadplan {

// Samsara fleet API, bearer token authentication.
class SamsaraFleetClient : public FleetRegistry
{
private:
  std::string mBase;
  std::string mToken;

  auto vehicles(std::string_view) -> nlohmann::json;

public:
  static constexpr auto DEFAULT_URI = "https://api.samsara.com/v1";
  static constexpr auto UNKNOWN_WAREHOUSE = "Unknown";

  SamsaraFleetClient(const std::string&, std::string);

  auto list_available_trucks() -> std::vector<Truck> override;

  auto list_available_trailers() -> std::vector<Trailer> override;

  static auto parse_trucks(const nlohmann::json&) -> std::vector<Truck>;

  static auto parse_trailers(const nlohmann::json&) -> std::vector<Trailer>;
};

} // namespace loadplan

#endif
