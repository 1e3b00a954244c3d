#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#ifndef JSON_HAS_RANGES
#define JSON_HAS_RANGES 1
#endif

#include "file_reader.hxx"
#include "transportation/serialization.hxx"
#include <Poco/Logger.h>
#include <fmt/format.h>
#include <fstream>

namespace loadplan {

namespace {
auto
logger() -> Poco::Logger&
{
  return Poco::Logger::get("file-reader");
}
} // namespace

auto
read_documents(const std::filesystem::path& dataFile)
  -> std::vector<nlohmann::json>
{
  std::ifstream inFile(dataFile);

  if (not inFile) {
    throw Error(fmt::format("Unable to open {}", dataFile.string()));
  }

  std::vector<nlohmann::json> entries;

  try {
    while ((inFile >> std::ws).peek() != std::ifstream::traits_type::eof()) {
      nlohmann::json entry;
      inFile >> entry;

      if (entry.is_array()) {
        entries.insert(entries.end(), entry.begin(), entry.end());
      } else {
        entries.push_back(std::move(entry));
      }
    }
  } catch (const nlohmann::json::exception& exc) {
    throw Error(
      fmt::format("Unable to parse {}: {}", dataFile.string(), exc.what()));
  }
  logger().debug(
    fmt::format("Read {} entries from {}", entries.size(), dataFile.string()));
  return entries;
}

auto
read_orders(const std::filesystem::path& dataFile) -> std::vector<Order>
{
  std::vector<Order> orders;

  for (const auto& entry : read_documents(dataFile)) {
    try {
      orders.push_back(entry.get<Order>());
    } catch (const std::exception& exc) {
      throw Error(fmt::format(
        "Invalid order #{} in {}: {}", orders.size(), dataFile.string(), exc.what()));
    }
  }
  return orders;
}

FileFleetRegistry::FileFleetRegistry(const std::filesystem::path& dataFile)
{
  std::ifstream inFile(dataFile);

  if (not inFile) {
    throw Error(fmt::format("Unable to open {}", dataFile.string()));
  }

  try {
    auto data = nlohmann::json::parse(inFile);
    mTrucks = data.value("trucks", nlohmann::json::array()).get<std::vector<Truck>>();
    mTrailers =
      data.value("trailers", nlohmann::json::array()).get<std::vector<Trailer>>();
  } catch (const std::exception& exc) {
    throw Error(
      fmt::format("Invalid fleet file {}: {}", dataFile.string(), exc.what()));
  }
  logger().information(fmt::format("Fleet file {}: {} trucks, {} trailers",
                                   dataFile.string(),
                                   mTrucks.size(),
                                   mTrailers.size()));
}

FileFleetRegistry::FileFleetRegistry(std::vector<Truck> trucks,
                                     std::vector<Trailer> trailers)
  : mTrucks(std::move(trucks))
  , mTrailers(std::move(trailers))
{
}

auto
FileFleetRegistry::list_available_trucks() -> std::vector<Truck>
{
  return mTrucks;
}

auto
FileFleetRegistry::list_available_trailers() -> std::vector<Trailer>
{
  return mTrailers;
}

} // namespace loadplan
