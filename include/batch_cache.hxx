#ifndef LOADPLAN_BATCH_CACHE
#define LOADPLAN_BATCH_CACHE

#include "hash.hxx"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace loadplan {

struct LocationPair
{
  std::string from;
  std::string to;

  auto operator==(const LocationPair&) const -> bool = default;
};

/**
 * @brief Lookups memoised for the lifetime of one optimisation batch.
 * @details Created by the engine for every batch and handed to the matrix
 * builder by reference; nothing is evicted and nothing outlives the batch.
 * Safe to share between the weather lookup threads.
 */
class BatchCache
{
private:
  mutable std::mutex mMutex;
  std::unordered_map<LocationPair, double> mDistances;
  std::unordered_map<std::string, double> mWeather;
  size_t mHits = 0;

public:
  // Returns the memoised distance or stores the computed one.
  auto distance(const std::string&,
                const std::string&,
                const std::function<double()>&) -> double;

  [[nodiscard]] auto weather(const std::string&) const -> std::optional<double>;

  void weather(const std::string&, double);

  [[nodiscard]] auto hits() const -> size_t;

  [[nodiscard]] auto size() const -> size_t;
};

} // namespace loadplan

#endif
