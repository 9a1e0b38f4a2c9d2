#pragma once

#include <cstdint>
#include <string>

#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace lotcost::db::model {

// Pricing history row. unit_price is per base unit of the item.
struct PurchaseRecord {
  uint64_t      id = 0;
  std::string   item_id;
  std::string   supplier_id;
  util::Date    purchase_date;
  util::Decimal unit_price;
  uint64_t      lot_id = 0; // 0 for weighted-average acquisitions
};

} // namespace lotcost::db::model
