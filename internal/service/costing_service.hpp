#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/adjustment_engine.hpp"
#include "internal/core/blended_cost_calculator.hpp"
#include "internal/core/fifo_engine.hpp"
#include "internal/core/lot_ledger.hpp"
#include "internal/core/weighted_average_engine.hpp"
#include "service_context.hpp"

namespace lotcost::service {

/*
  Single entry point for callers (CLI, production recording, recipe
  costing).

  Every call is logged under its route name on failure and the engine
  exception is rethrown unchanged.
*/
class CostingService {
 public:
  explicit CostingService(ServiceContext ctx);

  // Items
  db::model::ItemRecord              RegisterItem(const db::model::ItemRecord& item);
  db::model::ItemRecord              GetItem(const std::string& item_id);
  std::vector<db::model::ItemRecord> ListItems();

  // FIFO lots
  core::AcquisitionResult                   RecordLot(const core::AcquisitionRequest& request);
  core::ConsumptionResult                   Consume(const core::ConsumptionRequest& request);
  std::vector<db::model::LotRecord>         Lots(const std::string& item_id);
  std::vector<db::model::ConsumptionRecord> ConsumptionsForContext(const std::string& context_id);

  // Manual adjustments
  db::model::AdjustmentRecord              Adjust(const core::AdjustmentRequest& request);
  std::vector<db::model::AdjustmentRecord> History(uint64_t lot_id);

  // Weighted average
  core::WeightedAverageState RecordBulkAcquisition(const std::string& item_id, const util::Decimal& quantity,
                                                   const util::Decimal& unit_cost, const core::PurchaseInfo& purchase);
  core::WeightedAverageState AdjustBulkInventory(const std::string& item_id, const core::InventoryAdjustment& adjustment);
  core::WeightedAverageState BulkState(const std::string& item_id);

  // Costing and stock
  core::CostEstimate       EstimateCost(const std::vector<core::Requirement>& requirements);
  util::Decimal            InventoryValue(const std::optional<std::string>& item_id);
  util::Decimal            AvailableQuantity(const std::string& item_id);
  core::AvailabilityReport CheckAvailability(const std::vector<core::Requirement>& requirements);

 private:
  ServiceContext ctx_;
};

} // namespace lotcost::service
