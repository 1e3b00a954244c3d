#ifndef LOADPLAN_FILE_READER
#define LOADPLAN_FILE_READER

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#include "collaborators.hxx"
#include <filesystem>
#include <nlohmann/json.hpp>
#include <vector>

namespace loadplan {

/**
 * @brief Read every JSON document of a file.
 * @details A file holding a single array yields its elements; otherwise the
 * file is read as a stream of concatenated (typically newline separated)
 * documents.
 * @throws Error when the file cannot be opened or parsed.
 */
auto
read_documents(const std::filesystem::path&) -> std::vector<nlohmann::json>;

auto
read_orders(const std::filesystem::path&) -> std::vector<Order>;

// Fleet snapshot kept on disk as {"trucks": [...], "trailers": [...]}.
class FileFleetRegistry : public FleetRegistry
{
private:
  std::vector<Truck> mTrucks;
  std::vector<Trailer> mTrailers;

public:
  explicit FileFleetRegistry(const std::filesystem::path&);

  FileFleetRegistry(std::vector<Truck>, std::vector<Trailer>);

  auto list_available_trucks() -> std::vector<Truck> override;

  auto list_available_trailers() -> std::vector<Trailer> override;
};

} // namespace loadplan

#endif
