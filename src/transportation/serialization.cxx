#include "transportation/serialization.hxx"
#include <array>
#include <utility>

namespace loadplan {

namespace {
using json_t = nlohmann::json;

constexpr std::array<std::pair<const char*, Order::requirement_t>, 4>
  REQUIREMENT_KEYS{ { { "requires_refrigeration", Order::REFRIGERATION },
                      { "requires_heating", Order::HEATING },
                      { "hazardous", Order::HAZARDOUS },
                      { "requires_pallet_jack", Order::PALLET_JACK } } };

constexpr std::array<std::pair<const char*, Trailer::capability_t>, 4>
  CAPABILITY_KEYS{ { { "refrigerated", Trailer::REFRIGERATED },
                     { "heated", Trailer::HEATED },
                     { "hazmat", Trailer::HAZMAT },
                     { "has_pallet_jack", Trailer::PALLET_JACK } } };

template<typename T>
auto
value_or(const json_t& data, const char* key, T fallback) -> T
{
  if (data.contains(key) and not data[key].is_null()) {
    return data[key].get<T>();
  }
  return fallback;
}
} // namespace

void
to_json(json_t& data, const Order& order)
{
  auto requirements = json_t::object();

  for (const auto& [key, bit] : REQUIREMENT_KEYS) {
    requirements[key] = order.needs(bit);
  }

  data = json_t{ { "id", order.id },
                 { "customer_id", order.customer_id },
                 { "customer_name", order.customer_name },
                 { "ship_from", order.ship_from },
                 { "ship_to", order.ship_to },
                 { "pickup_date", to_iso8601(order.pickup_date) },
                 { "status", std::string(to_string(order.status)) },
                 { "priority", std::string(to_string(order.priority)) },
                 { "weight_kg", order.weight_kg },
                 { "special_requirements", requirements },
                 { "notes", order.notes } };
  data["delivery_date"] = order.delivery_date
                            ? json_t(to_iso8601(*order.delivery_date))
                            : json_t(nullptr);
  data["volume_m3"] =
    order.volume_m3 ? json_t(*order.volume_m3) : json_t(nullptr);
}

void
from_json(const json_t& data, Order& order)
{
  data.at("id").get_to(order.id);
  data.at("ship_from").get_to(order.ship_from);
  data.at("ship_to").get_to(order.ship_to);
  data.at("weight_kg").get_to(order.weight_kg);

  order.customer_id = value_or<std::string>(data, "customer_id", "");
  order.customer_name = value_or<std::string>(data, "customer_name", "");
  order.notes = value_or<std::string>(data, "notes", "");
  order.priority =
    parse_priority(value_or<std::string>(data, "priority", "medium"));
  order.status = parse_status(value_or<std::string>(data, "status", "pending"));

  if (auto pickup = value_or<std::string>(data, "pickup_date", "");
      not pickup.empty()) {
    order.pickup_date = parse_datetime(pickup);
  }

  if (auto delivery = value_or<std::string>(data, "delivery_date", "");
      not delivery.empty()) {
    order.delivery_date = parse_datetime(delivery);
  }

  if (data.contains("volume_m3") and not data["volume_m3"].is_null()) {
    order.volume_m3 = data["volume_m3"].get<double>();
  }

  order.requirements = Order::NONE;

  if (data.contains("special_requirements")) {
    const auto& requirements = data["special_requirements"];

    for (const auto& [key, bit] : REQUIREMENT_KEYS) {
      if (value_or(requirements, key, false)) {
        order.requirements |= bit;
      }
    }
  }
}

void
to_json(json_t& data, const Truck& truck)
{
  data = json_t{ { "id", truck.id },
                 { "name", truck.name },
                 { "driver", truck.driver },
                 { "current_hours", truck.current_hours },
                 { "max_hours", truck.max_hours },
                 { "warehouse", truck.warehouse } };
}

void
from_json(const json_t& data, Truck& truck)
{
  data.at("id").get_to(truck.id);
  data.at("warehouse").get_to(truck.warehouse);
  truck.name = value_or<std::string>(data, "name", truck.id);
  truck.driver = value_or<std::string>(data, "driver", "");
  truck.current_hours = value_or(data, "current_hours", 0.0);
  truck.max_hours = value_or(data, "max_hours", Truck::DEFAULT_MAX_HOURS);
}

void
to_json(json_t& data, const Trailer& trailer)
{
  data = json_t{ { "id", trailer.id },
                 { "name", trailer.name },
                 { "warehouse", trailer.warehouse },
                 { "max_weight_kg", trailer.max_weight_kg },
                 { "current_weight_kg", trailer.current_weight_kg } };

  for (const auto& [key, bit] : CAPABILITY_KEYS) {
    data[key] = trailer.has(bit);
  }
}

void
from_json(const json_t& data, Trailer& trailer)
{
  data.at("id").get_to(trailer.id);
  data.at("warehouse").get_to(trailer.warehouse);
  data.at("max_weight_kg").get_to(trailer.max_weight_kg);
  trailer.name = value_or<std::string>(data, "name", trailer.id);
  trailer.current_weight_kg = value_or(data, "current_weight_kg", 0.0);
  trailer.capabilities = Trailer::NONE;

  for (const auto& [key, bit] : CAPABILITY_KEYS) {
    if (value_or(data, key, false)) {
      trailer.capabilities |= bit;
    }
  }
}

void
to_json(json_t& data, const OrderAssignment& assignment)
{
  data = json_t{ { "order_id", assignment.order_id },
                 { "truck_id", assignment.truck_id },
                 { "trailer_id", assignment.trailer_id },
                 { "sequence", assignment.sequence },
                 { "assigned_by", assignment.assigned_by },
                 { "assigned_at", to_iso8601(assignment.assigned_at) } };
}

void
from_json(const json_t& data, OrderAssignment& assignment)
{
  data.at("order_id").get_to(assignment.order_id);
  data.at("truck_id").get_to(assignment.truck_id);
  data.at("trailer_id").get_to(assignment.trailer_id);
  data.at("sequence").get_to(assignment.sequence);
  data.at("assigned_by").get_to(assignment.assigned_by);
  assignment.assigned_at =
    parse_datetime(data.at("assigned_at").get<std::string>());
}

} // namespace loadplan
