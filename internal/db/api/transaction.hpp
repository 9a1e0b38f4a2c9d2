#pragma once

namespace lotcost::db {

// What a transaction intends to do. kRead transactions never write and
// never take a write lock, so they are not blocked by (and never block)
// a concurrent writer beyond what a plain read requires.
enum class TxMode {
  kReadWrite,
  kRead,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Reads inside the transaction see its own writes
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws if the backend cannot make the writes durable; the
    writes are then discarded

  SQLite: BEGIN IMMEDIATE (kRead: deferred BEGIN)
  Postgres: pqxx::work (kRead: pqxx::read_transaction)
  Memory: snapshot copy-on-write, optimistic commit (kRead: no conflict check)
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has completed
  virtual bool IsFinished() const = 0;
};

}
