#pragma once

#include <cstdint>
#include <string>

#include "internal/util/decimal.hpp"

namespace lotcost::db::model {

// Running state of a weighted-average costed item. No lots exist for it.
struct WeightedAverageRecord {
  std::string   item_id;
  util::Decimal current_quantity;
  util::Decimal weighted_average_cost;
  uint64_t      updated_at_ms = 0;
};

} // namespace lotcost::db::model
