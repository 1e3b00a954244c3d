#include "transportation.hxx"
#include "errors.hxx"
#include "utils.hxx"
#include <algorithm>
#include <fmt/format.h>

namespace loadplan {

auto
Order::needs(requirement_t requirement) const -> bool
{
  return (requirements & requirement) != 0;
}

auto
Truck::remaining_duty() const -> minutes
{
  auto remaining = std::max(0.0, max_hours - current_hours);
  return minutes(static_cast<int64_t>(remaining * 60));
}

auto
Trailer::has(capability_t capability) const -> bool
{
  return (capabilities & capability) != 0;
}

auto
Trailer::available_kg() const -> double
{
  return max_weight_kg - current_weight_kg;
}

auto
Trailer::covers(const Order& order) const -> bool
{
  return (capabilities & order.requirements) == order.requirements;
}

auto
to_string(Priority priority) -> std::string_view
{
  switch (priority) {
    case Priority::LOW:
      return "low";
    case Priority::HIGH:
      return "high";
    default:
      return "medium";
  }
}

auto
to_string(OrderStatus status) -> std::string_view
{
  switch (status) {
    case OrderStatus::ASSIGNED:
      return "assigned";
    case OrderStatus::IN_TRANSIT:
      return "in_transit";
    case OrderStatus::DELIVERED:
      return "delivered";
    case OrderStatus::CANCELLED:
      return "cancelled";
    default:
      return "pending";
  }
}

auto
parse_priority(std::string_view value) -> Priority
{
  auto key = lowered(value);

  if (key == "low")
    return Priority::LOW;
  if (key == "high")
    return Priority::HIGH;
  return Priority::MEDIUM;
}

auto
parse_status(std::string_view value) -> OrderStatus
{
  auto key = lowered(value);

  if (key == "pending")
    return OrderStatus::PENDING;
  if (key == "assigned")
    return OrderStatus::ASSIGNED;
  if (key == "in_transit")
    return OrderStatus::IN_TRANSIT;
  if (key == "delivered")
    return OrderStatus::DELIVERED;
  if (key == "cancelled")
    return OrderStatus::CANCELLED;
  throw Error(fmt::format("Unknown order status '{}'", value));
}

} // namespace loadplan
