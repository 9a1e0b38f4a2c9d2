#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace lotcost::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of the repository; the
  transaction mutex serializes them in-process, BEGIN IMMEDIATE serializes
  them against other processes.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Held by a SqliteTransaction for its whole lifetime.
  std::mutex& TransactionMutex() {
    return tx_mutex_;
  }

 private:
  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(int busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace lotcost::db::sqlite
