/** @file cheapest_insertion.hxx
 * @brief Construction and repair by cheapest feasible insertion.
 */
#ifndef LOADPLAN_SOLVERS_CHEAPEST_INSERTION
#define LOADPLAN_SOLVERS_CHEAPEST_INSERTION

#include "solvers/route_state.hxx"
#include <chrono>
#include <optional>
#include <vector>

namespace loadplan::solvers {

struct Insertion
{
  size_t vehicle = 0;
  std::vector<size_t> stops;
  Schedule schedule;
  // Change of the objective, negative when the insertion pays off.
  double delta = 0.0;
};

/**
 * @brief Cheapest feasible way of routing a node.
 * @details Tries the node alone at every position of every route and, when
 * the node is a delivery whose pickup is not routed yet, the pickup and the
 * delivery together with the pickup first. Routes left unexamined when the
 * deadline passes are skipped, the best insertion seen so far is returned.
 */
auto
best_insertion(const Instance&,
               const Plan&,
               size_t,
               std::chrono::steady_clock::time_point)
  -> std::optional<Insertion>;

/**
 * @brief Global cheapest insertion: repeatedly apply the cheapest insertion
 * over all unrouted demand nodes until none is feasible or the deadline
 * passes. The deadline is polled between nodes, so an interrupted
 * construction leaves a feasible partial plan.
 * @return Number of insertions applied
 */
auto
insert_cheapest(const Instance&,
                Plan&,
                std::chrono::steady_clock::time_point) -> size_t;

} // namespace loadplan::solvers

#endif
