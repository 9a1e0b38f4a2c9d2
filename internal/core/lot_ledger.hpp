#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/fifo_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pricing/price_history.hpp"
#include "internal/units/unit_converter.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace lotcost::core {

struct AcquisitionRequest {
  std::string   item_id;
  util::Decimal quantity;  // in `unit`
  std::string   unit;
  util::Decimal unit_cost; // per `unit`
  util::Date    acquisition_date;

  std::optional<util::Date>  expiration_date;
  std::optional<std::string> location;
  std::string                notes;
  std::string                supplier_id;
};

struct AcquisitionResult {
  db::model::LotRecord  lot; // base units, id assigned
  pricing::PriceChange  price_change;
};

struct AvailabilityShortfall {
  std::string   item_id;
  util::Decimal needed;
  util::Decimal available;
  std::string   unit; // requirement unit, or the item's base unit if the reverse conversion failed
};

struct AvailabilityReport {
  bool                               can_fulfill = true;
  std::vector<AvailabilityShortfall> missing;
};

/*
  Lot lifecycle and stock queries around the FIFO engine.

  RecordAcquisition creates a lot and its pricing-history row in one
  transaction. Every query is read-only and rolls its transaction back.
*/
class LotLedger {
 public:
  LotLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<FifoEngine> fifo,
            std::shared_ptr<const units::UnitConverter> converter, std::shared_ptr<pricing::PriceHistory> prices);

  // Throws util::ItemNotFound, util::ValidationError (item not FIFO-costed,
  // quantity <= 0, unit cost < 0, expiration before acquisition) and
  // util::UnitConversionError.
  AcquisitionResult RecordAcquisition(const AcquisitionRequest& request);

  // Base units. Lots at or below the dust threshold are ignored;
  // weighted-average items report their running quantity.
  util::Decimal AvailableQuantity(const std::string& item_id);

  // Sum of remaining x unit cost for one item, or every item when unset.
  util::Decimal InventoryValue(const std::optional<std::string>& item_id = std::nullopt);

  // Each requirement is checked on its own against current stock.
  AvailabilityReport CheckAvailability(const std::vector<Requirement>& requirements);

  // Ledger rows of committed consumptions, in the order they were written.
  std::vector<db::model::ConsumptionRecord> ConsumptionsForContext(const std::string& context_id);

  // Every lot of the item, depleted ones included, in FIFO order.
  std::vector<db::model::LotRecord> Lots(const std::string& item_id);

 private:
  util::Decimal AvailableQuantity(db::Transaction& tx, const db::model::ItemRecord& item);
  util::Decimal ItemValue(db::Transaction& tx, const db::model::ItemRecord& item);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<FifoEngine>                 fifo_;
  std::shared_ptr<const units::UnitConverter> converter_;
  std::shared_ptr<pricing::PriceHistory>      prices_;
};

} // namespace lotcost::core
