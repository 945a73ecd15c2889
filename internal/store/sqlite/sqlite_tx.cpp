#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"

namespace seat::store::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    SEAT_LOG_WARN("SQLite rollback failed", {observability::StringField("path", db_->path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  finished_ = true;
}

} // namespace seat::store::sqlite
