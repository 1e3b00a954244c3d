#ifndef LOADPLAN_HASH
#define LOADPLAN_HASH

#include <functional>

namespace loadplan {
struct LocationPair;
} // namespace loadplan

namespace std {

template <> struct hash<loadplan::LocationPair> {
public:
  auto operator()(const loadplan::LocationPair &) const -> size_t;
};

} // namespace std

#endif
