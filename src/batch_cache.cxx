#include "batch_cache.hxx"

namespace loadplan {

auto
BatchCache::distance(const std::string& from,
                     const std::string& to,
                     const std::function<double()>& compute) -> double
{
  LocationPair key{ from, to };
  {
    std::lock_guard lock(mMutex);

    if (auto found = mDistances.find(key); found != mDistances.end()) {
      ++mHits;
      return found->second;
    }
  }

  auto value = compute();
  std::lock_guard lock(mMutex);
  mDistances.emplace(std::move(key), value);
  return value;
}

auto
BatchCache::weather(const std::string& location) const -> std::optional<double>
{
  std::lock_guard lock(mMutex);

  if (auto found = mWeather.find(location); found != mWeather.end()) {
    return found->second;
  }
  return std::nullopt;
}

void
BatchCache::weather(const std::string& location, double adjustment)
{
  std::lock_guard lock(mMutex);
  mWeather[location] = adjustment;
}

auto
BatchCache::hits() const -> size_t
{
  std::lock_guard lock(mMutex);
  return mHits;
}

auto
BatchCache::size() const -> size_t
{
  std::lock_guard lock(mMutex);
  return mDistances.size() + mWeather.size();
}

} // namespace loadplan
