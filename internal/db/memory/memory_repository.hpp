#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace lotcost::db::memory {

class MemoryTransaction;

/*
  In-process backend used by tests and the default CLI config.

  Isolation is serializable: a transaction commits only if no other
  transaction committed since it began, so row locks are implied.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::ItemRecord> items;

    // Keyed by id, so iteration order is creation order.
    std::map<uint64_t, model::LotRecord> lots;
    uint64_t next_lot_id = 1;

    std::vector<model::AdjustmentRecord>  adjustments;
    std::vector<model::ConsumptionRecord> consumptions;

    std::unordered_map<std::string, model::WeightedAverageRecord> weighted_average;

    std::vector<model::PurchaseRecord> purchases;
    uint64_t next_purchase_id = 1;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

}
