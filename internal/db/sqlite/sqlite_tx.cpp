#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace lotcost::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode)
    : db_(std::move(db)), guard_(db_->TransactionMutex()), mode_(mode) {
  db_->Exec(mode_ == TxMode::kRead ? "BEGIN;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    LOTCOST_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception&) {
    // A failed COMMIT can leave the transaction open; never leak the lock.
    if (!sqlite3_get_autocommit(db_->Handle()) &&
        sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK) {
      LOTCOST_LOG_ERROR("sqlite rollback after failed commit failed",
                        {observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
    }
    finished_ = true;
    throw;
  }
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
}

} // namespace lotcost::db::sqlite
