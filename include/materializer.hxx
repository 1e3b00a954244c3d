/** @file materializer.hxx
 * @brief Trailer binding and persistence of the orders of accepted routes.
 */
#ifndef LOADPLAN_MATERIALIZER
#define LOADPLAN_MATERIALIZER

#include "collaborators.hxx"
#include "economics.hxx"
#include <Poco/Logger.h>
#include <string>
#include <string_view>
#include <vector>

namespace loadplan {

enum class UnassignedReason : uint8_t
{
  NOT_PENDING = 0,
  NO_FLEET = 1,
  NO_ROUTE = 2,
  UNPROFITABLE = 3,
  NO_TRAILER = 4,
  PERSISTENCE_FAILED = 5,
  // Id already used by an earlier order of the batch.
  DUPLICATE_ORDER = 6,
};

auto
to_string(UnassignedReason) -> std::string_view;

struct Unassigned
{
  std::string order_id;
  UnassignedReason reason;
};

struct Materialized
{
  std::vector<OrderAssignment> assignments;
  std::vector<Unassigned> unassigned;
};

/**
 * @brief Binds the orders of accepted routes to trailers and persists the
 * resulting assignments.
 * @details Routes are processed strictly in the given order. Within a route
 * the most valuable orders are bound first. The first trailer of the pool
 * that qualifies wins and its running weight grows by the order's weight.
 */
class AssignmentMaterializer
{
private:
  AssignmentStore& mStore;
  std::string mActor;

  static auto logger() -> Poco::Logger&;

public:
  AssignmentMaterializer(AssignmentStore&, std::string);

  // Same warehouse, enough spare weight and every required capability.
  [[nodiscard]] static auto qualifies(const Trailer&, const Order&) -> bool;

  auto materialize(const std::vector<RouteMetrics>&,
                   const std::vector<Order>&,
                   std::vector<Trailer>&,
                   timestamp) -> Materialized;
};

} // namespace loadplan

#endif
