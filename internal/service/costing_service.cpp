#include "costing_service.hpp"

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/core/item_catalog.hpp"
#include "internal/observability/logging.hpp"

namespace lotcost::service {

namespace {

int64_t ElapsedMicros(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started_at).count();
}

template <typename Fn>
auto ObserveCall(std::string_view route, Fn&& fn) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      LOTCOST_LOG_DEBUG("call completed", {observability::StringField("route", route),
                                           observability::IntField("elapsed_us", ElapsedMicros(started_at))});
      return;
    } else {
      auto result = fn();
      LOTCOST_LOG_DEBUG("call completed", {observability::StringField("route", route),
                                           observability::IntField("elapsed_us", ElapsedMicros(started_at))});
      return result;
    }
  } catch (const std::exception& ex) {
    LOTCOST_LOG_ERROR("call failed", {observability::StringField("route", route),
                                      observability::StringField("error", ex.what()),
                                      observability::IntField("elapsed_us", ElapsedMicros(started_at))});
    throw;
  }
}

} // namespace

CostingService::CostingService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

db::model::ItemRecord CostingService::RegisterItem(const db::model::ItemRecord& item) {
  return ObserveCall("CostingService.RegisterItem", [&] { return ctx_.catalog->Register(item); });
}

db::model::ItemRecord CostingService::GetItem(const std::string& item_id) {
  return ObserveCall("CostingService.GetItem", [&] { return ctx_.catalog->Get(item_id); });
}

std::vector<db::model::ItemRecord> CostingService::ListItems() {
  return ObserveCall("CostingService.ListItems", [&] { return ctx_.catalog->List(); });
}

core::AcquisitionResult CostingService::RecordLot(const core::AcquisitionRequest& request) {
  return ObserveCall("CostingService.RecordLot", [&] { return ctx_.ledger->RecordAcquisition(request); });
}

core::ConsumptionResult CostingService::Consume(const core::ConsumptionRequest& request) {
  return ObserveCall("CostingService.Consume", [&] { return ctx_.fifo->Consume(request); });
}

std::vector<db::model::LotRecord> CostingService::Lots(const std::string& item_id) {
  return ObserveCall("CostingService.Lots", [&] { return ctx_.ledger->Lots(item_id); });
}

std::vector<db::model::ConsumptionRecord> CostingService::ConsumptionsForContext(const std::string& context_id) {
  return ObserveCall("CostingService.ConsumptionsForContext",
                     [&] { return ctx_.ledger->ConsumptionsForContext(context_id); });
}

db::model::AdjustmentRecord CostingService::Adjust(const core::AdjustmentRequest& request) {
  return ObserveCall("CostingService.Adjust", [&] { return ctx_.adjustments->Adjust(request); });
}

std::vector<db::model::AdjustmentRecord> CostingService::History(uint64_t lot_id) {
  return ObserveCall("CostingService.History", [&] { return ctx_.adjustments->History(lot_id); });
}

core::WeightedAverageState CostingService::RecordBulkAcquisition(const std::string& item_id,
                                                                 const util::Decimal& quantity,
                                                                 const util::Decimal& unit_cost,
                                                                 const core::PurchaseInfo& purchase) {
  return ObserveCall("CostingService.RecordBulkAcquisition",
                     [&] { return ctx_.weighted_average->RecordAcquisition(item_id, quantity, unit_cost, purchase); });
}

core::WeightedAverageState CostingService::AdjustBulkInventory(const std::string&               item_id,
                                                               const core::InventoryAdjustment& adjustment) {
  return ObserveCall("CostingService.AdjustBulkInventory",
                     [&] { return ctx_.weighted_average->AdjustInventory(item_id, adjustment); });
}

core::WeightedAverageState CostingService::BulkState(const std::string& item_id) {
  return ObserveCall("CostingService.BulkState", [&] { return ctx_.weighted_average->GetState(item_id); });
}

core::CostEstimate CostingService::EstimateCost(const std::vector<core::Requirement>& requirements) {
  return ObserveCall("CostingService.EstimateCost", [&] { return ctx_.blended->EstimateBreakdown(requirements); });
}

util::Decimal CostingService::InventoryValue(const std::optional<std::string>& item_id) {
  return ObserveCall("CostingService.InventoryValue", [&] { return ctx_.ledger->InventoryValue(item_id); });
}

util::Decimal CostingService::AvailableQuantity(const std::string& item_id) {
  return ObserveCall("CostingService.AvailableQuantity", [&] { return ctx_.ledger->AvailableQuantity(item_id); });
}

core::AvailabilityReport CostingService::CheckAvailability(const std::vector<core::Requirement>& requirements) {
  return ObserveCall("CostingService.CheckAvailability",
                     [&] { return ctx_.ledger->CheckAvailability(requirements); });
}

} // namespace lotcost::service
