#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/units/unit_converter.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace lotcost::core {

enum class ConsumptionMode {
  kPreview,
  kCommit,
};

struct ConsumptionRequest {
  std::string     item_id;
  util::Decimal   quantity_needed; // in `unit`
  std::string     unit;
  ConsumptionMode mode = ConsumptionMode::kPreview;
  std::string     context_id; // production run or assembly reference, may be empty
};

// One line of a recipe or production plan.
struct Requirement {
  std::string   item_id;
  util::Decimal quantity_needed;
  std::string   unit;
};

// One lot drawn down by a consumption, in base units.
struct LotConsumption {
  uint64_t      lot_id = 0;
  util::Decimal quantity_consumed;
  util::Decimal unit_cost;
  util::Decimal remaining_in_lot; // after this consumption (would-be value in preview)
  util::Date    acquisition_date;
};

struct ConsumptionResult {
  util::Decimal consumed_quantity;
  std::string   consumed_unit; // request unit, or the base unit if the reverse conversion failed
  util::Decimal shortfall;
  std::string   shortfall_unit;
  bool          satisfied = false;
  util::Decimal total_cost;

  std::vector<LotConsumption> breakdown; // FIFO order

  util::Decimal consumed_base;
  util::Decimal shortfall_base;
  std::string   base_unit;
};

// Lot unit costs are stored per base unit at Decimal precision, so a lot
// bought in a coarse unit can be valued a few micro-units off its price.
struct FifoOptions {
  // Lots at or below this remaining quantity are dust and never drawn.
  util::Decimal dust_threshold = util::Decimal::FromRaw(1'000); // 0.001
};

/*
  FIFO consumption engine.

  Lots are drawn oldest acquisition_date first, ties by lot id (creation
  order). Never by cost or remaining quantity.

  CRITICAL GUARANTEES:
  - Preview never writes; two previews with no commit in between return
    identical results.
  - Commit mode reduces every drawn lot and appends one consumption ledger
    row per lot inside a single transaction, read with RowLock::kForUpdate.
    Any failure leaves no lot reduced.
  - A shortfall is not an error: the result carries satisfied=false.

  Errors: util::ItemNotFound, util::ValidationError (quantity <= 0, item not
  FIFO-costed), util::UnitConversionError, util::TransactionFailure.
*/
class FifoEngine {
 public:
  FifoEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const units::UnitConverter> converter,
             FifoOptions options = {});

  // Owns its transaction: committed in commit mode, rolled back in preview.
  ConsumptionResult Consume(const ConsumptionRequest& request);

  // Runs inside a caller-owned transaction. The caller commits; in commit
  // mode the lot writes become durable only with that commit.
  ConsumptionResult Consume(db::Transaction& tx, const ConsumptionRequest& request);

  const FifoOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<const units::UnitConverter> converter_;
  FifoOptions                                 options_;
};

std::string_view ToString(ConsumptionMode mode);

} // namespace lotcost::core
