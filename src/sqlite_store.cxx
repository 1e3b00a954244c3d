#include "sqlite_store.hxx"
#include <Poco/Logger.h>
#include <fmt/format.h>

namespace loadplan {

namespace {
auto
logger() -> Poco::Logger&
{
  return Poco::Logger::get("sqlite-store");
}

void
bind_text(sqlite3_stmt* stmt, int idx, const std::string& value)
{
  sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

auto
column_text(sqlite3_stmt* stmt, int col) -> std::string
{
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : "";
}

constexpr auto SCHEMA = R"(
CREATE TABLE IF NOT EXISTS order_assignments (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  order_id TEXT NOT NULL,
  truck_id TEXT NOT NULL,
  trailer_id TEXT NOT NULL,
  sequence INTEGER NOT NULL,
  assigned_by TEXT NOT NULL,
  assigned_at TEXT NOT NULL
);
CREATE TABLE IF NOT EXISTS order_status (
  order_id TEXT PRIMARY KEY,
  status TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)";
} // namespace

void
SqliteAssignmentStore::Closer::operator()(sqlite3* db) const
{
  sqlite3_close(db);
}

void
SqliteAssignmentStore::Finalizer::operator()(sqlite3_stmt* stmt) const
{
  sqlite3_finalize(stmt);
}

SqliteAssignmentStore::SqliteAssignmentStore(const std::string& path)
{
  sqlite3* db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(),
                           &db,
                           SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE |
                             SQLITE_OPEN_FULLMUTEX,
                           nullptr);
  mDb.reset(db);

  if (rc != SQLITE_OK) {
    throw StoreError(fmt::format("Unable to open {}: {}",
                                 path,
                                 db ? sqlite3_errmsg(db) : "out of memory"));
  }

  if (sqlite3_busy_timeout(mDb.get(), 5000) != SQLITE_OK) {
    throw StoreError(sqlite3_errmsg(mDb.get()));
  }
  exec(SCHEMA);

  mInsertAssignment = prepare(
    "INSERT INTO order_assignments(order_id,truck_id,trailer_id,sequence,"
    "assigned_by,assigned_at) VALUES(?,?,?,?,?,?);");
  mUpsertStatus = prepare(
    "INSERT INTO order_status(order_id,status,updated_at) VALUES(?,?,?) "
    "ON CONFLICT(order_id) DO UPDATE SET status=excluded.status,"
    "updated_at=excluded.updated_at;");
  mSelectAssignments = prepare(
    "SELECT order_id,truck_id,trailer_id,sequence,assigned_by,assigned_at "
    "FROM order_assignments ORDER BY id;");
  mSelectStatus = prepare("SELECT status FROM order_status WHERE order_id=?;");

  logger().information(fmt::format("Assignment store open at {}", path));
}

void
SqliteAssignmentStore::exec(const char* sql)
{
  char* err = nullptr;

  if (sqlite3_exec(mDb.get(), sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string message = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw StoreError(message);
  }
}

auto
SqliteAssignmentStore::prepare(const char* sql) -> statement_t
{
  sqlite3_stmt* stmt = nullptr;

  if (sqlite3_prepare_v2(mDb.get(), sql, -1, &stmt, nullptr) != SQLITE_OK) {
    throw StoreError(
      fmt::format("sqlite prepare: {}", sqlite3_errmsg(mDb.get())));
  }
  return statement_t(stmt);
}

void
SqliteAssignmentStore::step_done(sqlite3_stmt* stmt, const char* what)
{
  int rc = sqlite3_step(stmt);
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);

  if (rc != SQLITE_DONE) {
    throw StoreError(
      fmt::format("{} failed: {}", what, sqlite3_errmsg(mDb.get())));
  }
}

void
SqliteAssignmentStore::save_assignment(const OrderAssignment& assignment)
{
  std::lock_guard lock(mMutex);
  auto* stmt = mInsertAssignment.get();

  bind_text(stmt, 1, assignment.order_id);
  bind_text(stmt, 2, assignment.truck_id);
  bind_text(stmt, 3, assignment.trailer_id);
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(assignment.sequence));
  bind_text(stmt, 5, assignment.assigned_by);
  bind_text(stmt, 6, to_iso8601(assignment.assigned_at));
  step_done(stmt, "Saving assignment");
}

void
SqliteAssignmentStore::update_order_status(const std::string& orderId,
                                           OrderStatus status)
{
  std::lock_guard lock(mMutex);
  auto* stmt = mUpsertStatus.get();

  bind_text(stmt, 1, orderId);
  bind_text(stmt, 2, std::string(to_string(status)));
  bind_text(stmt, 3, to_iso8601(now()));
  step_done(stmt, "Updating order status");
}

auto
SqliteAssignmentStore::assignments() const -> std::vector<OrderAssignment>
{
  std::lock_guard lock(mMutex);
  auto* stmt = mSelectAssignments.get();
  std::vector<OrderAssignment> rows;
  int rc = SQLITE_ROW;

  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    OrderAssignment assignment;
    assignment.order_id = column_text(stmt, 0);
    assignment.truck_id = column_text(stmt, 1);
    assignment.trailer_id = column_text(stmt, 2);
    assignment.sequence = static_cast<size_t>(sqlite3_column_int64(stmt, 3));
    assignment.assigned_by = column_text(stmt, 4);
    assignment.assigned_at = parse_datetime(column_text(stmt, 5));
    rows.push_back(std::move(assignment));
  }
  sqlite3_reset(stmt);

  if (rc != SQLITE_DONE) {
    throw StoreError(fmt::format("Reading assignments failed: {}",
                                 sqlite3_errmsg(mDb.get())));
  }
  return rows;
}

auto
SqliteAssignmentStore::status(const std::string& orderId) const
  -> std::optional<OrderStatus>
{
  std::lock_guard lock(mMutex);
  auto* stmt = mSelectStatus.get();
  bind_text(stmt, 1, orderId);

  std::optional<OrderStatus> result;
  int rc = sqlite3_step(stmt);

  if (rc == SQLITE_ROW) {
    result = parse_status(column_text(stmt, 0));
  }
  sqlite3_reset(stmt);
  sqlite3_clear_bindings(stmt);

  if (rc != SQLITE_ROW and rc != SQLITE_DONE) {
    throw StoreError(fmt::format("Reading status of {} failed: {}",
                                 orderId,
                                 sqlite3_errmsg(mDb.get())));
  }
  return result;
}

} // namespace loadplan
