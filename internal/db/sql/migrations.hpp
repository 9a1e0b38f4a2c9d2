#pragma once

#include <string>
#include <vector>

namespace lotcost::db::sql {

/*
  Backend-agnostic migration execution.

  Each backend implements ExecuteSQL().
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

/*
  Runs migrations in order. Every statement is idempotent
  (CREATE ... IF NOT EXISTS), so bootstrapping an existing database is a
  no-op.
*/

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql);

// Quantities and costs are INTEGER micro-units (util::Decimal raw values).
const std::vector<std::string>& SqliteSchema();

// Quantities and costs are NUMERIC(20,6).
const std::vector<std::string>& PostgresSchema();

} // namespace lotcost::db::sql
