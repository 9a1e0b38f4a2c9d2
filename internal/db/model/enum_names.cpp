#include "internal/db/model/adjustment_record.hpp"
#include "internal/db/model/item_record.hpp"

namespace lotcost::db::model {

std::string_view ToString(ItemDomain domain) {
  switch (domain) {
    case ItemDomain::kIngredient:
      return "ingredient";
    case ItemDomain::kInventoryItem:
      return "inventory_item";
    case ItemDomain::kMaterial:
      return "material";
  }
  return "unknown";
}

std::string_view ToString(CostingMethod method) {
  switch (method) {
    case CostingMethod::kFifo:
      return "fifo";
    case CostingMethod::kWeightedAverage:
      return "weighted_average";
  }
  return "unknown";
}

std::optional<ItemDomain> ParseItemDomain(std::string_view text) {
  if (text == "ingredient") return ItemDomain::kIngredient;
  if (text == "inventory_item") return ItemDomain::kInventoryItem;
  if (text == "material") return ItemDomain::kMaterial;
  return std::nullopt;
}

std::optional<CostingMethod> ParseCostingMethod(std::string_view text) {
  if (text == "fifo") return CostingMethod::kFifo;
  if (text == "weighted_average") return CostingMethod::kWeightedAverage;
  return std::nullopt;
}

std::string_view ToString(AdjustmentType type) {
  switch (type) {
    case AdjustmentType::kAdd:
      return "add";
    case AdjustmentType::kSubtract:
      return "subtract";
    case AdjustmentType::kSet:
      return "set";
    case AdjustmentType::kPercentage:
      return "percentage";
  }
  return "unknown";
}

std::string_view ToString(ReasonCode reason) {
  switch (reason) {
    case ReasonCode::kSpoilage:
      return "spoilage";
    case ReasonCode::kGift:
      return "gift";
    case ReasonCode::kCorrection:
      return "correction";
    case ReasonCode::kAdHocUsage:
      return "ad_hoc_usage";
    case ReasonCode::kPhysicalCount:
      return "physical_count";
    case ReasonCode::kOther:
      return "other";
  }
  return "unknown";
}

std::optional<AdjustmentType> ParseAdjustmentType(std::string_view text) {
  if (text == "add") return AdjustmentType::kAdd;
  if (text == "subtract") return AdjustmentType::kSubtract;
  if (text == "set") return AdjustmentType::kSet;
  if (text == "percentage") return AdjustmentType::kPercentage;
  return std::nullopt;
}

std::optional<ReasonCode> ParseReasonCode(std::string_view text) {
  if (text == "spoilage") return ReasonCode::kSpoilage;
  if (text == "gift") return ReasonCode::kGift;
  if (text == "correction") return ReasonCode::kCorrection;
  if (text == "ad_hoc_usage") return ReasonCode::kAdHocUsage;
  if (text == "physical_count") return ReasonCode::kPhysicalCount;
  if (text == "other") return ReasonCode::kOther;
  return std::nullopt;
}

} // namespace lotcost::db::model
