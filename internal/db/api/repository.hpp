#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/adjustment_record.hpp"
#include "internal/db/model/consumption_record.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/db/model/lot_record.hpp"
#include "internal/db/model/purchase_record.hpp"
#include "internal/db/model/weighted_average_record.hpp"

namespace lotcost::db {

// Lock requested on rows returned by a read.
enum class RowLock {
  kNone,
  // Write lock held until the transaction ends (SELECT ... FOR UPDATE).
  kForUpdate,
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - Reads with RowLock::kForUpdate serialize against every other writer of
    the same rows until the transaction ends. The engines depend on this
    for the read-then-write sequence of consumption and adjustment.
  - Lots, adjustments, consumptions and purchases are never deleted.
    Adjustments and consumptions are never updated.

  The DB is the source of truth for:
    lots and their remaining quantities
    weighted-average state
    audit and consumption ledgers
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Writes inside a kRead transaction are a logic error.
  virtual std::unique_ptr<Transaction> Begin(TxMode mode = TxMode::kReadWrite) = 0;

  // ---------------------------------------------------------------------
  // Items
  // ---------------------------------------------------------------------

  virtual Result InsertItem(Transaction&, const model::ItemRecord&) = 0;

  virtual std::optional<model::ItemRecord> GetItem(Transaction&, const std::string& item_id) = 0;

  virtual std::vector<model::ItemRecord> ListItems(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Lots
  // ---------------------------------------------------------------------

  // Assigns lot.id.
  virtual Result InsertLot(Transaction&, model::LotRecord& lot) = 0;

  virtual std::optional<model::LotRecord> GetLot(Transaction&, uint64_t lot_id, RowLock lock) = 0;

  // Lots of the item with quantity_remaining >= min_remaining, ordered by
  // acquisition_date ascending, then id ascending.
  virtual std::vector<model::LotRecord> ListLotsForItem(Transaction&, const std::string& item_id,
                                                        const util::Decimal& min_remaining, RowLock lock) = 0;

  virtual Result UpdateLot(Transaction&, const model::LotRecord&) = 0;

  // ---------------------------------------------------------------------
  // Audit (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertAdjustment(Transaction&, const model::AdjustmentRecord&) = 0;

  // Newest first.
  virtual std::vector<model::AdjustmentRecord> ListAdjustments(Transaction&, uint64_t lot_id) = 0;

  virtual Result InsertConsumption(Transaction&, const model::ConsumptionRecord&) = 0;

  // In insertion order.
  virtual std::vector<model::ConsumptionRecord> ListConsumptions(Transaction&, const std::string& context_id) = 0;

  // ---------------------------------------------------------------------
  // Weighted average
  // ---------------------------------------------------------------------

  virtual std::optional<model::WeightedAverageRecord> GetWeightedAverage(Transaction&, const std::string& item_id,
                                                                         RowLock lock) = 0;

  virtual Result UpsertWeightedAverage(Transaction&, const model::WeightedAverageRecord&) = 0;

  // ---------------------------------------------------------------------
  // Pricing history
  // ---------------------------------------------------------------------

  // Assigns purchase.id.
  virtual Result InsertPurchase(Transaction&, model::PurchaseRecord& purchase) = 0;

  // Newest purchase_date first, then highest id first.
  virtual std::vector<model::PurchaseRecord> ListPurchases(Transaction&, const std::string& item_id) = 0;
};

} // namespace lotcost::db
