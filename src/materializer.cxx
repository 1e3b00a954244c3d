#include "materializer.hxx"
#include "utils.hxx"
#include <algorithm>
#include <fmt/format.h>
#include <iterator>
#include <numeric>

namespace loadplan {

auto
to_string(UnassignedReason reason) -> std::string_view
{
  switch (reason) {
    case UnassignedReason::NOT_PENDING:
      return "not_pending";
    case UnassignedReason::NO_FLEET:
      return "no_fleet";
    case UnassignedReason::NO_ROUTE:
      return "no_route";
    case UnassignedReason::UNPROFITABLE:
      return "unprofitable";
    case UnassignedReason::NO_TRAILER:
      return "no_trailer";
    case UnassignedReason::DUPLICATE_ORDER:
      return "duplicate_order";
    default:
      return "persistence_failed";
  }
}

AssignmentMaterializer::AssignmentMaterializer(AssignmentStore& store,
                                               std::string actor)
  : mStore(store)
  , mActor(std::move(actor))
{
}

auto
AssignmentMaterializer::logger() -> Poco::Logger&
{
  return Poco::Logger::get("materializer");
}

auto
AssignmentMaterializer::qualifies(const Trailer& trailer, const Order& order)
  -> bool
{
  return iequals(trailer.warehouse, order.ship_from) and
         trailer.available_kg() >= order.weight_kg and trailer.covers(order);
}

auto
AssignmentMaterializer::materialize(const std::vector<RouteMetrics>& routes,
                                    const std::vector<Order>& orders,
                                    std::vector<Trailer>& trailers,
                                    timestamp assignedAt) -> Materialized
{
  Materialized result;

  for (const auto& metrics : routes) {
    const auto& route = metrics.route;
    std::vector<size_t> binding(route.orders.size());
    std::iota(binding.begin(), binding.end(), size_t{ 0 });
    std::ranges::stable_sort(binding, [&metrics](size_t lhs, size_t rhs) {
      return metrics.order_revenue[lhs] > metrics.order_revenue[rhs];
    });
    std::vector<OrderAssignment> bound;

    for (auto sequence : binding) {
      const auto& order = orders.at(route.orders[sequence]);
      auto trailer = std::ranges::find_if(
        trailers, [&order](const auto& t) { return qualifies(t, order); });

      if (trailer == trailers.end()) {
        logger().warning(
          fmt::format("No trailer at {} can take order {} ({:.0f} kg), "
                      "needs manual assignment",
                      order.ship_from,
                      order.id,
                      order.weight_kg));
        result.unassigned.push_back(
          { order.id, UnassignedReason::NO_TRAILER });
        continue;
      }

      OrderAssignment assignment{ order.id,    route.truck_id, trailer->id,
                                  sequence,    mActor,         assignedAt };

      try {
        mStore.save_assignment(assignment);
        mStore.update_order_status(order.id, OrderStatus::ASSIGNED);
      } catch (const StoreError& exc) {
        logger().error(fmt::format(
          "Failed to persist assignment of order {}: {}", order.id, exc.what()));
        result.unassigned.push_back(
          { order.id, UnassignedReason::PERSISTENCE_FAILED });
        continue;
      }

      trailer->current_weight_kg += order.weight_kg;
      logger().debug(
        fmt::format("Order {} -> truck {}, trailer {} ({:.0f}/{:.0f} kg)",
                    order.id,
                    route.truck_id,
                    trailer->id,
                    trailer->current_weight_kg,
                    trailer->max_weight_kg));
      bound.push_back(std::move(assignment));
    }

    std::ranges::sort(bound, {}, &OrderAssignment::sequence);
    std::ranges::move(bound, std::back_inserter(result.assignments));
  }
  return result;
}

} // namespace loadplan
