#ifndef LOADPLAN_SQLITE_STORE
#define LOADPLAN_SQLITE_STORE

#include "collaborators.hxx"
#include <memory>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace loadplan {

/**
 * @brief Persists assignments and order statuses in a SQLite database.
 * @details Tables are created on open. Every failure is raised as
 * StoreError. Pass ":memory:" for a private in-memory database.
 */
class SqliteAssignmentStore : public AssignmentStore
{
private:
  struct Closer
  {
    void operator()(sqlite3*) const;
  };

  struct Finalizer
  {
    void operator()(sqlite3_stmt*) const;
  };

  using statement_t = std::unique_ptr<sqlite3_stmt, Finalizer>;

  mutable std::mutex mMutex;
  std::unique_ptr<sqlite3, Closer> mDb;
  statement_t mInsertAssignment;
  statement_t mUpsertStatus;
  statement_t mSelectAssignments;
  statement_t mSelectStatus;

  void exec(const char*);

  auto prepare(const char*) -> statement_t;

  void step_done(sqlite3_stmt*, const char*);

public:
  explicit SqliteAssignmentStore(const std::string&);

  void save_assignment(const OrderAssignment&) override;

  void update_order_status(const std::string&, OrderStatus) override;

  [[nodiscard]] auto assignments() const -> std::vector<OrderAssignment>;

  [[nodiscard]] auto status(const std::string&) const
    -> std::optional<OrderStatus>;
};

} // namespace loadplan

#endif
