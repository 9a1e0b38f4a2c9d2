#pragma once

#include <optional>

#include "internal/db/api/transaction.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/util/decimal.hpp"

namespace lotcost::core {

/*
  Fallback price for quantity that on-hand stock cannot cover.

  Prices are per base unit of the item. std::nullopt means no history;
  callers must not substitute zero.
*/
class PricingSource {
 public:
  virtual ~PricingSource() = default;

  virtual std::optional<util::Decimal> PriceFor(db::Transaction& tx, const db::model::ItemRecord& item) = 0;
};

} // namespace lotcost::core
