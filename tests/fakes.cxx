#include "fakes.hxx"
#include "utils.hxx"
#include <stdexcept>

namespace loadplan::testing {

void
FakeMapping::leg(const std::string& from,
                 const std::string& to,
                 double km,
                 double minutes)
{
  mLegs[{ lowered(from), lowered(to) }] = { km, minutes };
  mLegs[{ lowered(to), lowered(from) }] = { km, minutes };
}

auto
FakeMapping::route_matrix(const std::vector<std::string>& locations)
  -> RouteMatrix
{
  ++calls;

  if (failing) {
    throw ServiceUnavailable("mapping service down");
  }

  if (not crash.empty()) {
    throw std::runtime_error(crash);
  }

  auto size = locations.size();
  RouteMatrix matrix{ Matrix(size, std::vector<double>(size, 0.0)),
                      Matrix(size, std::vector<double>(size, 0.0)) };

  for (size_t from = 0; from < size; ++from) {
    for (size_t to = 0; to < size; ++to) {
      if (from == to) {
        continue;
      }
      auto found =
        mLegs.find({ lowered(locations[from]), lowered(locations[to]) });

      if (found == mLegs.end()) {
        throw ServiceUnavailable("NOT_FOUND");
      }
      matrix.distance_km[from][to] = found->second.km;
      matrix.time_min[from][to] = found->second.minutes;
    }
  }
  return matrix;
}

auto
FakeMapping::approximate_distance(std::string_view from,
                                  std::string_view to) const -> double
{
  ++mLookups;

  if (iequals(from, to)) {
    return 0.0;
  }

  if (not table_crash.empty()) {
    throw std::runtime_error(table_crash);
  }

  auto found = mLegs.find({ lowered(from), lowered(to) });
  return found == mLegs.end() ? std::numeric_limits<double>::infinity()
                              : found->second.km;
}

auto
FakeMapping::lookups() const -> size_t
{
  return mLookups;
}

void
FakeWeather::condition(const std::string& location, const std::string& text)
{
  std::lock_guard lock(mMutex);
  mConditions[location] = text;
}

void
FakeWeather::fail(const std::string& location)
{
  std::lock_guard lock(mMutex);
  mFailing.insert(location);
}

auto
FakeWeather::forecast(const std::string& location, int)
  -> std::optional<Forecast>
{
  ++calls;
  std::lock_guard lock(mMutex);

  if (mFailing.contains(location)) {
    throw ServiceUnavailable("forecast quota exceeded");
  }

  if (auto found = mConditions.find(location); found != mConditions.end()) {
    return Forecast{ found->second };
  }
  return std::nullopt;
}

auto
FakeFleet::list_available_trucks() -> std::vector<Truck>
{
  ++calls;

  if (failing) {
    throw ServiceUnavailable("fleet registry down");
  }
  return trucks;
}

auto
FakeFleet::list_available_trailers() -> std::vector<Trailer>
{
  ++calls;

  if (failing) {
    throw ServiceUnavailable("fleet registry down");
  }
  return trailers;
}

void
FlakyStore::save_assignment(const OrderAssignment& assignment)
{
  if (rejected.contains(assignment.order_id)) {
    throw StoreError("disk full");
  }
  MemoryAssignmentStore::save_assignment(assignment);
}

auto
make_order(const std::string& id,
           const std::string& from,
           const std::string& to,
           double weightKg,
           Priority priority) -> Order
{
  Order order;
  order.id = id;
  order.customer_id = "C-1";
  order.customer_name = "Prairie Foods";
  order.ship_from = from;
  order.ship_to = to;
  order.weight_kg = weightKg;
  order.priority = priority;
  order.pickup_date = parse_date("2024-03-01");
  return order;
}

auto
make_truck(const std::string& id,
           const std::string& warehouse,
           double currentHours) -> Truck
{
  Truck truck;
  truck.id = id;
  truck.name = id;
  truck.driver = "Driver " + id;
  truck.warehouse = warehouse;
  truck.current_hours = currentHours;
  return truck;
}

auto
make_trailer(const std::string& id,
             const std::string& warehouse,
             double maxWeightKg,
             uint8_t capabilities) -> Trailer
{
  Trailer trailer;
  trailer.id = id;
  trailer.name = id;
  trailer.warehouse = warehouse;
  trailer.max_weight_kg = maxWeightKg;
  trailer.capabilities = capabilities;
  return trailer;
}

} // namespace loadplan::testing
