#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/util/decimal.hpp"

namespace lotcost::db::model {

// Which catalog the item belongs to. The engines treat all three the same.
enum class ItemDomain {
  kIngredient,
  kInventoryItem,
  kMaterial,
};

// Mutually exclusive per item.
enum class CostingMethod {
  kFifo,
  kWeightedAverage,
};

/*
  Trackable good.

  base_unit is the unit every lot quantity of this item is stored in.
  density_g_per_ml lets the unit converter bridge weight and volume.
*/
struct ItemRecord {
  std::string   id;
  std::string   name;
  ItemDomain    domain         = ItemDomain::kIngredient;
  std::string   base_unit;
  CostingMethod costing_method = CostingMethod::kFifo;

  std::optional<util::Decimal> density_g_per_ml;
  std::optional<std::string>   preferred_supplier_id;
};

std::string_view             ToString(ItemDomain domain);
std::string_view             ToString(CostingMethod method);
std::optional<ItemDomain>    ParseItemDomain(std::string_view text);
std::optional<CostingMethod> ParseCostingMethod(std::string_view text);

} // namespace lotcost::db::model
