#include "pg_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace lotcost::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, TxMode mode)
{
  conn_ = pool->Acquire();
  if (mode == TxMode::kRead) {
    tx_ = std::make_unique<pqxx::read_transaction>(*conn_);
  } else {
    tx_ = std::make_unique<pqxx::work>(*conn_);
  }
}

PgTransaction::~PgTransaction() {
  if (finished_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    LOTCOST_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }
  // pqxx aborts the work itself when commit throws.
  finished_ = true;
  tx_->commit();
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

}
