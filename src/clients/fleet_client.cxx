#include "clients/fleet_client.hxx"
#include <Poco/Logger.h>
#include <fmt/format.h>

namespace loadplan {

namespace {
auto
logger() -> Poco::Logger&
{
  return Poco::Logger::get("fleet-client");
}

auto
warehouse(const nlohmann::json& vehicle) -> std::string
{
  if (vehicle.contains("location") and
      vehicle["location"].contains("warehouse")) {
    return vehicle["location"]["warehouse"].get<std::string>();
  }
  return SamsaraFleetClient::UNKNOWN_WAREHOUSE;
}

auto
flag(const nlohmann::json& vehicle, const char* key) -> bool
{
  return vehicle.contains(key) and vehicle[key].is_boolean() and
         vehicle[key].get<bool>();
}
} // namespace

SamsaraFleetClient::SamsaraFleetClient(const std::string& uri,
                                       std::string token)
  : mBase(uri.empty() ? DEFAULT_URI : uri)
  , mToken(std::move(token))
{
}

auto
SamsaraFleetClient::vehicles(std::string_view type) -> nlohmann::json
{
  cpr::Session session;
  session.SetUrl(cpr::Url{ fmt::format("{}/fleet/vehicles", mBase) });
  session.SetParameters(cpr::Parameters{ { "vehicleStatus", "available" },
                                         { "types", std::string(type) } });
  session.SetHeader(
    { { "Content-Type", "application/json" }, { "Accept", "application/json" } });
  session.SetBearer(cpr::Bearer{ mToken });
  session.SetTimeout(cpr::Timeout{ 30000 });

  auto response = session.Get();

  if (response.error) {
    throw ServiceUnavailable(
      fmt::format("Fleet API request failed: {}", response.error.message));
  }

  if (response.status_code != 200) {
    throw ServiceUnavailable(fmt::format(
      "Fleet API answered {} for {}", response.status_code, type));
  }

  try {
    return nlohmann::json::parse(response.text).at("data");
  } catch (const nlohmann::json::exception& exc) {
    throw ServiceUnavailable(
      fmt::format("Malformed Fleet API answer: {}", exc.what()));
  }
}

auto
SamsaraFleetClient::list_available_trucks() -> std::vector<Truck>
{
  auto trucks = parse_trucks(vehicles("truck"));
  logger().information(fmt::format("{} trucks available", trucks.size()));
  return trucks;
}

auto
SamsaraFleetClient::list_available_trailers() -> std::vector<Trailer>
{
  auto trailers = parse_trailers(vehicles("trailer"));
  logger().information(fmt::format("{} trailers available", trailers.size()));
  return trailers;
}

auto
SamsaraFleetClient::parse_trucks(const nlohmann::json& data)
  -> std::vector<Truck>
{
  std::vector<Truck> trucks;

  try {
    for (const auto& vehicle : data) {
      Truck truck;
      truck.id = vehicle.at("id").get<std::string>();
      truck.name = vehicle.value("name", truck.id);

      if (vehicle.contains("driver") and vehicle["driver"].is_object()) {
        truck.driver = vehicle["driver"].value("name", "");
      }
      truck.current_hours = vehicle.value("engineHours", 0.0);
      truck.max_hours = Truck::DEFAULT_MAX_HOURS;
      truck.warehouse = warehouse(vehicle);
      trucks.push_back(std::move(truck));
    }
  } catch (const nlohmann::json::exception& exc) {
    throw ServiceUnavailable(fmt::format("Malformed truck record: {}", exc.what()));
  }
  return trucks;
}

auto
SamsaraFleetClient::parse_trailers(const nlohmann::json& data)
  -> std::vector<Trailer>
{
  std::vector<Trailer> trailers;

  try {
    for (const auto& vehicle : data) {
      Trailer trailer;
      trailer.id = vehicle.at("id").get<std::string>();
      trailer.name = vehicle.value("name", trailer.id);
      trailer.max_weight_kg = vehicle.at("maxWeightKg").get<double>();
      trailer.current_weight_kg = vehicle.value("currentWeightKg", 0.0);
      trailer.warehouse = warehouse(vehicle);

      if (flag(vehicle, "hasPalletJack")) {
        trailer.capabilities |= Trailer::PALLET_JACK;
      }
      if (flag(vehicle, "refrigerated")) {
        trailer.capabilities |= Trailer::REFRIGERATED;
      }
      if (flag(vehicle, "heated")) {
        trailer.capabilities |= Trailer::HEATED;
      }
      if (flag(vehicle, "hazmat")) {
        trailer.capabilities |= Trailer::HAZMAT;
      }
      trailers.push_back(std::move(trailer));
    }
  } catch (const nlohmann::json::exception& exc) {
    throw ServiceUnavailable(
      fmt::format("Malformed trailer record: {}", exc.what()));
  }
  return trailers;
}

} // namespace loadplan
