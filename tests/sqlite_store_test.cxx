#include "sqlite_store.hxx"
#include <filesystem>
#include <gtest/gtest.h>

namespace loadplan {
namespace {

auto
assignment(const std::string& orderId, size_t sequence) -> OrderAssignment
{
  return { orderId, "T-1", "TR-1", sequence, "planner",
           parse_datetime("2024-03-01T09:00:00Z") };
}

TEST(SqliteAssignmentStore, SavesAndReadsAssignments)
{
  SqliteAssignmentStore store(":memory:");

  store.save_assignment(assignment("O-1", 0));
  store.save_assignment(assignment("O-2", 1));

  auto saved = store.assignments();
  ASSERT_EQ(saved.size(), 2u);
  EXPECT_EQ(saved[0].order_id, "O-1");
  EXPECT_EQ(saved[1].sequence, 1u);
  EXPECT_EQ(saved[1].assigned_by, "planner");
  EXPECT_EQ(to_iso8601(saved[1].assigned_at), "2024-03-01T09:00:00Z");
}

TEST(SqliteAssignmentStore, KeepsLatestStatus)
{
  SqliteAssignmentStore store(":memory:");

  EXPECT_FALSE(store.status("O-1").has_value());

  store.update_order_status("O-1", OrderStatus::ASSIGNED);
  store.update_order_status("O-1", OrderStatus::IN_TRANSIT);

  EXPECT_EQ(store.status("O-1"), OrderStatus::IN_TRANSIT);
}

TEST(SqliteAssignmentStore, PersistsAcrossConnections)
{
  auto path = std::filesystem::temp_directory_path() / "loadplan-store.db";
  std::filesystem::remove(path);
  {
    SqliteAssignmentStore store(path.string());
    store.save_assignment(assignment("O-9", 3));
    store.update_order_status("O-9", OrderStatus::ASSIGNED);
  }

  SqliteAssignmentStore reopened(path.string());
  EXPECT_EQ(reopened.assignments().size(), 1u);
  EXPECT_EQ(reopened.status("O-9"), OrderStatus::ASSIGNED);
  std::filesystem::remove(path);
}

TEST(SqliteAssignmentStore, FailsToOpenUnwritablePath)
{
  EXPECT_THROW((SqliteAssignmentStore{ "/nonexistent-dir/loadplan.db" }),
               StoreError);
}

} // namespace
} // namespace loadplan
