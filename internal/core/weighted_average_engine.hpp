#pragma once

#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace lotcost::core {

struct WeightedAverageState {
  std::string   item_id;
  util::Decimal current_quantity;
  util::Decimal weighted_average_cost;
};

// Exactly one of the two forms must be set.
struct InventoryAdjustment {
  std::optional<util::Decimal> absolute_quantity;
  std::optional<util::Decimal> percentage_of_current; // 0..100
};

// Where an acquisition came from; recorded in the pricing history.
struct PurchaseInfo {
  std::optional<util::Date> purchase_date; // today when unset
  std::string               supplier_id;
};

/*
  Weighted-average costing for bulk items that are not lot tracked.

  One running (current_quantity, weighted_average_cost) pair per item.
  Acquisitions re-average the cost; adjustments only move the quantity.
*/
class WeightedAverageEngine {
 public:
  static constexpr int kCostPlaces = 4;

  explicit WeightedAverageEngine(std::shared_ptr<db::Repository> repository);

  // added_unit_cost is per base unit. Throws util::ValidationError for
  // added_quantity <= 0 or added_unit_cost < 0.
  WeightedAverageState RecordAcquisition(const std::string& item_id, const util::Decimal& added_quantity,
                                         const util::Decimal& added_unit_cost, const PurchaseInfo& purchase = {});

  WeightedAverageState AdjustInventory(const std::string& item_id, const InventoryAdjustment& adjustment);

  // Zero state for an item that has never been acquired.
  WeightedAverageState GetState(const std::string& item_id);
  WeightedAverageState GetState(db::Transaction& tx, const std::string& item_id);

  // (cq*ca + aq*ac) / (cq + aq), half-up to kCostPlaces; ac when cq == 0.
  static util::Decimal CalculateWeightedAverage(const util::Decimal& current_quantity,
                                                const util::Decimal& current_average,
                                                const util::Decimal& added_quantity,
                                                const util::Decimal& added_unit_cost);

 private:
  db::model::ItemRecord RequireWeightedItem(db::Transaction& tx, const std::string& item_id);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace lotcost::core
