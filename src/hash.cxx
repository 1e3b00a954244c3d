#include "hash.hxx"
#include "batch_cache.hxx"
#include <boost/container_hash/hash.hpp>

namespace std {

auto hash<loadplan::LocationPair>::operator()(
    const loadplan::LocationPair &pair) const -> size_t {
  size_t seed = std::hash<std::string>()(pair.from);
  boost::hash_combine(seed, pair.to);
  return seed;
}

} // namespace std
