#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace lotcost::db::sqlite {

/*
  SQLite backend.

  Quantities and costs are stored as INTEGER micro-units (Decimal::Raw()),
  dates as "YYYY-MM-DD" TEXT so lexical order is FIFO order.

  Writes report backend errors as Result; reads throw std::runtime_error.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) override;

  Result InsertItem(Transaction&, const model::ItemRecord&) override;
  std::optional<model::ItemRecord> GetItem(Transaction&, const std::string&) override;
  std::vector<model::ItemRecord> ListItems(Transaction&) override;

  Result InsertLot(Transaction&, model::LotRecord&) override;
  std::optional<model::LotRecord> GetLot(Transaction&, uint64_t lot_id, RowLock) override;
  std::vector<model::LotRecord> ListLotsForItem(Transaction&, const std::string& item_id,
                                                const util::Decimal& min_remaining, RowLock) override;
  Result UpdateLot(Transaction&, const model::LotRecord&) override;

  Result InsertAdjustment(Transaction&, const model::AdjustmentRecord&) override;
  std::vector<model::AdjustmentRecord> ListAdjustments(Transaction&, uint64_t lot_id) override;
  Result InsertConsumption(Transaction&, const model::ConsumptionRecord&) override;
  std::vector<model::ConsumptionRecord> ListConsumptions(Transaction&, const std::string& context_id) override;

  std::optional<model::WeightedAverageRecord> GetWeightedAverage(Transaction&, const std::string& item_id,
                                                                 RowLock) override;
  Result UpsertWeightedAverage(Transaction&, const model::WeightedAverageRecord&) override;

  Result InsertPurchase(Transaction&, model::PurchaseRecord&) override;
  std::vector<model::PurchaseRecord> ListPurchases(Transaction&, const std::string& item_id) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static sqlite3*           WriteHandle(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
