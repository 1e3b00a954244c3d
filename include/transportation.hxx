#ifndef LOADPLAN_TRANSPORTATION
#define LOADPLAN_TRANSPORTATION

#include "date_utils.hxx"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace loadplan {

enum class Priority : uint8_t
{
  LOW = 0,
  MEDIUM = 1,
  HIGH = 2,
};

enum class OrderStatus : uint8_t
{
  PENDING = 0,
  ASSIGNED = 1,
  IN_TRANSIT = 2,
  DELIVERED = 3,
  CANCELLED = 4,
};

struct Order
{
  // Bit positions line up with Trailer::capability_t so that a trailer
  // covers an order when it carries every bit the order asks for.
  enum requirement_t : uint8_t
  {
    NONE = 0b0000,
    REFRIGERATION = 0b0001,
    HEATING = 0b0010,
    HAZARDOUS = 0b0100,
    PALLET_JACK = 0b1000,
  };

  std::string id;
  std::string customer_id;
  std::string customer_name;
  std::string ship_from;
  std::string ship_to;
  timestamp pickup_date{};
  std::optional<timestamp> delivery_date;
  OrderStatus status = OrderStatus::PENDING;
  Priority priority = Priority::MEDIUM;
  double weight_kg = 0.0;
  std::optional<double> volume_m3;
  uint8_t requirements = NONE;
  std::string notes;

  [[nodiscard]] auto needs(requirement_t) const -> bool;
};

struct Truck
{
  static constexpr double DEFAULT_MAX_HOURS = 10.0;

  std::string id;
  std::string name;
  std::string driver;
  std::string warehouse;
  double current_hours = 0.0;
  double max_hours = DEFAULT_MAX_HOURS;

  // Duty time left before the driver reaches max_hours, never negative.
  [[nodiscard]] auto remaining_duty() const -> minutes;
};

struct Trailer
{
  enum capability_t : uint8_t
  {
    NONE = 0b0000,
    REFRIGERATED = 0b0001,
    HEATED = 0b0010,
    HAZMAT = 0b0100,
    PALLET_JACK = 0b1000,
  };

  std::string id;
  std::string name;
  std::string warehouse;
  double max_weight_kg = 0.0;
  double current_weight_kg = 0.0;
  uint8_t capabilities = NONE;

  [[nodiscard]] auto has(capability_t) const -> bool;

  [[nodiscard]] auto available_kg() const -> double;

  [[nodiscard]] auto covers(const Order&) const -> bool;
};

struct OrderAssignment
{
  std::string order_id;
  std::string truck_id;
  std::string trailer_id;
  size_t sequence = 0;
  std::string assigned_by;
  timestamp assigned_at{};
};

auto
to_string(Priority) -> std::string_view;

auto
to_string(OrderStatus) -> std::string_view;

// Case-insensitive; anything unrecognised is treated as MEDIUM.
auto
parse_priority(std::string_view) -> Priority;

auto
parse_status(std::string_view) -> OrderStatus;

} // namespace loadplan

#endif
