#ifndef LOADPLAN_TRANSPORTATION_SERIALIZATION
#define LOADPLAN_TRANSPORTATION_SERIALIZATION

#ifndef JSON_HAS_CPP_20
#define JSON_HAS_CPP_20
#endif

#ifndef JSON_HAS_RANGES
#define JSON_HAS_RANGES 1
#endif

#include "transportation.hxx"
#include <nlohmann/json.hpp>

namespace loadplan {

void
to_json(nlohmann::json&, const Order&);

void
from_json(const nlohmann::json&, Order&);

void
to_json(nlohmann::json&, const Truck&);

void
from_json(const nlohmann::json&, Truck&);

void
to_json(nlohmann::json&, const Trailer&);

void
from_json(const nlohmann::json&, Trailer&);

void
to_json(nlohmann::json&, const OrderAssignment&);

void
from_json(const nlohmann::json&, OrderAssignment&);

} // namespace loadplan

#endif
