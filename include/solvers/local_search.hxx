/** @file local_search.hxx
 * @brief Improvement moves and the ruin step of ruin and recreate.
 */
#ifndef LOADPLAN_SOLVERS_LOCAL_SEARCH
#define LOADPLAN_SOLVERS_LOCAL_SEARCH

#include "solvers/route_state.hxx"
#include <chrono>
#include <random>

namespace loadplan::solvers {

/**
 * @brief First improvement descent over the move neighbourhoods.
 */
class LocalSearch
{
private:
  const Instance& mInstance;
  std::chrono::steady_clock::time_point mDeadline;
  size_t mMoves = 0;

  [[nodiscard]] auto expired() const -> bool;

  auto reinsert(Plan&) -> bool;

  auto relocate(Plan&) -> bool;

  auto exchange(Plan&) -> bool;

  auto two_opt(Plan&) -> bool;

  auto remove(Plan&) -> bool;

public:
  LocalSearch(const Instance&, std::chrono::steady_clock::time_point);

  // Applies improving moves until none is left or the deadline passes.
  void run(Plan&);

  [[nodiscard]] auto moves() const -> size_t;
};

/**
 * @brief Unroute a random cluster of stops.
 * @details Picks a routed stop at random and removes it together with its
 * nearest routed neighbours, then drops whatever deliveries lost their
 * pickup so that every route stays feasible.
 */
void
ruin(const Instance&, Plan&, std::mt19937&);

} // namespace loadplan::solvers

#endif
