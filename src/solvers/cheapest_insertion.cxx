#include "solvers/cheapest_insertion.hxx"

namespace loadplan::solvers {

namespace {
auto
gain(const Instance& instance, const Plan& plan, size_t node) -> double
{
  return instance.is_demand(node) and not plan.routed(node)
           ? instance.options().drop_penalty
           : 0.0;
}

void
consider(std::optional<Insertion>& best, Insertion&& candidate)
{
  if (not best or candidate.delta < best->delta - EPSILON) {
    best = std::move(candidate);
  }
}
} // namespace

auto
best_insertion(const Instance& instance,
               const Plan& plan,
               size_t node,
               std::chrono::steady_clock::time_point deadline)
  -> std::optional<Insertion>
{
  std::optional<Insertion> best;

  if (plan.routed(node)) {
    return best;
  }

  for (size_t vehicle = 0; vehicle < plan.vehicles(); ++vehicle) {
    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
    if (instance.depot(vehicle) == node) {
      continue;
    }

    const auto& route = plan.route(vehicle);
    auto current = plan.schedule(vehicle).distance_km;

    for (size_t pos = 0; pos <= route.size(); ++pos) {
      auto stops = route;
      stops.insert(stops.begin() + pos, node);

      if (auto schedule = instance.evaluate(vehicle, stops)) {
        auto delta = schedule->distance_km - current -
                     gain(instance, plan, node);
        consider(best, { vehicle, std::move(stops), *schedule, delta });
      }
    }

    for (auto origin : instance.origins(node)) {
      if (origin == node or origin == instance.depot(vehicle) or
          plan.routed(origin)) {
        continue;
      }

      for (size_t first = 0; first <= route.size(); ++first) {
        for (size_t second = first + 1; second <= route.size() + 1; ++second) {
          auto stops = route;
          stops.insert(stops.begin() + first, origin);
          stops.insert(stops.begin() + second, node);

          if (auto schedule = instance.evaluate(vehicle, stops)) {
            auto delta = schedule->distance_km - current -
                         gain(instance, plan, node) -
                         gain(instance, plan, origin);
            consider(best, { vehicle, std::move(stops), *schedule, delta });
          }
        }
      }
    }
  }
  return best;
}

auto
insert_cheapest(const Instance& instance,
                Plan& plan,
                std::chrono::steady_clock::time_point deadline) -> size_t
{
  size_t applied = 0;

  while (true) {
    std::optional<Insertion> best;

    for (auto node : plan.unrouted(instance)) {
      if (std::chrono::steady_clock::now() >= deadline) {
        break;
      }
      if (auto candidate = best_insertion(instance, plan, node, deadline)) {
        consider(best, std::move(*candidate));
      }
    }

    if (not best or best->delta >= -EPSILON) {
      break;
    }
    plan.update(best->vehicle, std::move(best->stops), best->schedule);
    ++applied;

    if (std::chrono::steady_clock::now() >= deadline) {
      break;
    }
  }
  return applied;
}

} // namespace loadplan::solvers
