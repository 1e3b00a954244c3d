#include "solvers/local_search.hxx"
#include "solvers/cheapest_insertion.hxx"
#include <algorithm>
#include <cmath>

namespace loadplan::solvers {

LocalSearch::LocalSearch(const Instance& instance,
                         std::chrono::steady_clock::time_point deadline)
  : mInstance(instance)
  , mDeadline(deadline)
{
}

auto
LocalSearch::expired() const -> bool
{
  return std::chrono::steady_clock::now() >= mDeadline;
}

auto
LocalSearch::moves() const -> size_t
{
  return mMoves;
}

void
LocalSearch::run(Plan& plan)
{
  while (not expired()) {
    if (reinsert(plan) or relocate(plan) or exchange(plan) or two_opt(plan) or
        remove(plan)) {
      ++mMoves;
      continue;
    }
    break;
  }
}

auto
LocalSearch::reinsert(Plan& plan) -> bool
{
  for (auto node : plan.unrouted(mInstance)) {
    if (expired()) {
      return false;
    }
    if (auto insertion = best_insertion(mInstance, plan, node, mDeadline);
        insertion and insertion->delta < -EPSILON) {
      plan.update(
        insertion->vehicle, std::move(insertion->stops), insertion->schedule);
      return true;
    }
  }
  return false;
}

auto
LocalSearch::relocate(Plan& plan) -> bool
{
  for (size_t source = 0; source < plan.vehicles(); ++source) {
    for (size_t from = 0; from < plan.route(source).size(); ++from) {
      auto shortened = plan.route(source);
      auto node = shortened[from];
      shortened.erase(shortened.begin() + from);

      auto shortenedSchedule = mInstance.evaluate(source, shortened);

      for (size_t target = 0; target < plan.vehicles(); ++target) {
        if (target != source and
            (not shortenedSchedule or mInstance.depot(target) == node)) {
          continue;
        }

        const auto& base = target == source ? shortened : plan.route(target);
        auto before = plan.schedule(source).distance_km +
                      (target == source ? 0.0
                                        : plan.schedule(target).distance_km);

        for (size_t to = 0; to <= base.size(); ++to) {
          if (target == source and to == from) {
            continue;
          }
          auto stops = base;
          stops.insert(stops.begin() + to, node);
          auto schedule = mInstance.evaluate(target, stops);

          if (not schedule) {
            continue;
          }

          auto after =
            schedule->distance_km +
            (target == source ? 0.0 : shortenedSchedule->distance_km);

          if (after < before - EPSILON) {
            if (target != source) {
              plan.update(source, std::move(shortened), *shortenedSchedule);
            }
            plan.update(target, std::move(stops), *schedule);
            return true;
          }
        }
      }

      if (expired()) {
        return false;
      }
    }
  }
  return false;
}

auto
LocalSearch::exchange(Plan& plan) -> bool
{
  for (size_t first = 0; first < plan.vehicles(); ++first) {
    for (size_t second = first; second < plan.vehicles(); ++second) {
      const auto& left = plan.route(first);
      const auto& right = plan.route(second);

      for (size_t i = 0; i < left.size(); ++i) {
        for (size_t j = first == second ? i + 1 : 0; j < right.size(); ++j) {
          if (first == second) {
            auto stops = left;
            std::swap(stops[i], stops[j]);
            auto schedule = mInstance.evaluate(first, stops);

            if (schedule and schedule->distance_km <
                               plan.schedule(first).distance_km - EPSILON) {
              plan.update(first, std::move(stops), *schedule);
              return true;
            }
            continue;
          }

          auto leftStops = left;
          auto rightStops = right;
          std::swap(leftStops[i], rightStops[j]);

          auto leftSchedule = mInstance.evaluate(first, leftStops);

          if (not leftSchedule) {
            continue;
          }
          auto rightSchedule = mInstance.evaluate(second, rightStops);

          if (not rightSchedule) {
            continue;
          }

          auto before = plan.schedule(first).distance_km +
                        plan.schedule(second).distance_km;
          auto after = leftSchedule->distance_km + rightSchedule->distance_km;

          if (after < before - EPSILON) {
            plan.update(first, std::move(leftStops), *leftSchedule);
            plan.update(second, std::move(rightStops), *rightSchedule);
            return true;
          }
        }
      }

      if (expired()) {
        return false;
      }
    }
  }
  return false;
}

auto
LocalSearch::two_opt(Plan& plan) -> bool
{
  for (size_t vehicle = 0; vehicle < plan.vehicles(); ++vehicle) {
    const auto& route = plan.route(vehicle);

    for (size_t i = 0; i + 1 < route.size(); ++i) {
      for (size_t j = i + 1; j < route.size(); ++j) {
        auto stops = route;
        std::reverse(stops.begin() + i, stops.begin() + j + 1);
        auto schedule = mInstance.evaluate(vehicle, stops);

        if (schedule and schedule->distance_km <
                           plan.schedule(vehicle).distance_km - EPSILON) {
          plan.update(vehicle, std::move(stops), *schedule);
          return true;
        }
      }

      if (expired()) {
        return false;
      }
    }
  }
  return false;
}

auto
LocalSearch::remove(Plan& plan) -> bool
{
  auto penalty = mInstance.options().drop_penalty;

  for (size_t vehicle = 0; vehicle < plan.vehicles(); ++vehicle) {
    if (expired()) {
      return false;
    }

    for (size_t pos = 0; pos < plan.route(vehicle).size(); ++pos) {
      auto stops = plan.route(vehicle);
      auto node = stops[pos];
      stops.erase(stops.begin() + pos);
      auto schedule = mInstance.evaluate(vehicle, stops);

      if (not schedule) {
        continue;
      }

      auto delta = schedule->distance_km -
                   plan.schedule(vehicle).distance_km +
                   (mInstance.is_demand(node) ? penalty : 0.0);

      if (delta < -EPSILON) {
        plan.update(vehicle, std::move(stops), *schedule);
        return true;
      }
    }
  }
  return false;
}

void
ruin(const Instance& instance, Plan& plan, std::mt19937& generator)
{
  std::vector<size_t> routed;

  for (size_t vehicle = 0; vehicle < plan.vehicles(); ++vehicle) {
    const auto& route = plan.route(vehicle);
    routed.insert(routed.end(), route.begin(), route.end());
  }

  if (routed.empty()) {
    return;
  }

  std::uniform_int_distribution<size_t> pick(0, routed.size() - 1);
  std::uniform_int_distribution<size_t> amount(
    1, std::max<size_t>(1, routed.size() / 3));

  auto seed = routed[pick(generator)];
  auto count = amount(generator);
  const auto& distances = instance.problem().distance_km;

  auto closeness = [&distances, seed](size_t node) {
    return std::min(distances[seed][node], distances[node][seed]);
  };
  std::ranges::sort(routed, [&closeness](size_t lhs, size_t rhs) {
    return closeness(lhs) < closeness(rhs);
  });
  routed.resize(count);

  for (size_t vehicle = 0; vehicle < plan.vehicles(); ++vehicle) {
    auto stops = plan.route(vehicle);
    std::erase_if(stops, [&routed](size_t node) {
      return std::ranges::find(routed, node) != routed.end();
    });

    auto schedule = instance.evaluate(vehicle, stops);

    while (not schedule and not stops.empty()) {
      auto pos = instance.unsupported(vehicle, stops);
      stops.erase(pos < stops.size() ? stops.begin() + pos
                                     : std::prev(stops.end()));
      schedule = instance.evaluate(vehicle, stops);
    }
    plan.update(vehicle, std::move(stops), schedule.value_or(Schedule{}));
  }
}

} // namespace loadplan::solvers
