#ifndef LOADPLAN_MEMORY_STORE
#define LOADPLAN_MEMORY_STORE

#include "collaborators.hxx"
#include <mutex>
#include <unordered_map>
#include <vector>

namespace loadplan {

// Keeps everything in process. Used for dry runs and in tests.
class MemoryAssignmentStore : public AssignmentStore
{
private:
  mutable std::mutex mMutex;
  std::vector<OrderAssignment> mAssignments;
  std::unordered_map<std::string, OrderStatus> mStatuses;

public:
  void save_assignment(const OrderAssignment& assignment) override
  {
    std::lock_guard lock(mMutex);
    mAssignments.push_back(assignment);
  }

  void update_order_status(const std::string& orderId,
                           OrderStatus status) override
  {
    std::lock_guard lock(mMutex);
    mStatuses[orderId] = status;
  }

  [[nodiscard]] auto assignments() const -> std::vector<OrderAssignment>
  {
    std::lock_guard lock(mMutex);
    return mAssignments;
  }

  [[nodiscard]] auto status(const std::string& orderId) const
    -> std::optional<OrderStatus>
  {
    std::lock_guard lock(mMutex);

    if (auto found = mStatuses.find(orderId); found != mStatuses.end()) {
      return found->second;
    }
    return std::nullopt;
  }
};

} // namespace loadplan

#endif
