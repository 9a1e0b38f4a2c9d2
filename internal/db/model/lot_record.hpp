#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace lotcost::db::model {

/*
  One acquisition of an item, in base units.

  IMPORTANT:
  - id is assigned by the repository on insert and increases with creation
    order; it breaks acquisition_date ties in FIFO walks.
  - 0 <= quantity_remaining <= quantity_original at all times.
  - Lots are never deleted, even at zero remaining.
  - notes is append-only; adjustments add one timestamped line each.
*/
struct LotRecord {
  uint64_t    id = 0;
  std::string item_id;

  util::Date acquisition_date;

  util::Decimal quantity_original;
  util::Decimal quantity_remaining;
  util::Decimal unit_cost; // per base unit, may be zero

  std::optional<util::Date>  expiration_date;
  std::optional<std::string> location;
  std::string                notes;
};

} // namespace lotcost::db::model
