#pragma once

#include <cstdint>
#include <string>

#include "internal/util/decimal.hpp"

namespace lotcost::db::model {

/*
  Ledger row for one lot drawn down by a committed consumption.

  context_id ties the rows of one request to the caller's production run or
  assembly; it may be empty.
*/
struct ConsumptionRecord {
  std::string id; // UUID
  uint64_t    lot_id = 0;
  std::string item_id;
  std::string context_id;

  util::Decimal quantity; // base units
  util::Decimal unit_cost;

  uint64_t created_at_ms = 0;
};

} // namespace lotcost::db::model
