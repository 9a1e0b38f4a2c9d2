#pragma once

#include <memory>
#include <pqxx/pqxx>
#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace lotcost::db::postgres {

class PgTransaction final : public db::Transaction {
public:
  PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode);
  ~PgTransaction();

  // pqxx::work, or pqxx::read_transaction for TxMode::kRead.
  pqxx::transaction_base& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::transaction_base> tx_;
  bool finished_ = false;
};

}
