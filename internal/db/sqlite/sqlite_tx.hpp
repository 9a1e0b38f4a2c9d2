#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace lotcost::db::sqlite {

/*
  SQLite transaction wrapper.

  kReadWrite uses BEGIN IMMEDIATE:
    - grabs the database write lock up front, which is what RowLock::kForUpdate
      asks for
    - a second writer waits (busy timeout) instead of failing mid-transaction

  kRead uses a deferred BEGIN. Under WAL it reads a snapshot and never waits
  on a writer holding another connection. The connection mutex is still held
  because the sqlite3 handle is shared.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, TxMode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  // On failure the transaction is rolled back before the exception leaves.
  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }
  TxMode Mode() const { return mode_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> guard_;
  TxMode mode_;
  bool finished_ = false;
};

}
