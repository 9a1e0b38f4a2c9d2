#include "internal/core/fifo_engine.hpp"

#include <tuple>
#include <utility>

#include "internal/core/engine_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace lotcost::core {

using util::Decimal;

namespace {

// Base-unit value re-expressed in the request unit. The forward conversion
// already succeeded, so a failure here falls back to the base unit.
std::pair<Decimal, std::string> FromBaseUnits(const units::UnitConverter& converter, const db::model::ItemRecord& item,
                                              const Decimal& base_quantity, const std::string& request_unit) {
  const auto converted = converter.Convert(base_quantity, item.base_unit, request_unit, ContextFor(item));
  if (!converted.ok) {
    LOTCOST_LOG_WARN("reverse unit conversion failed, reporting base units",
                     {observability::StringField("item_id", item.id), observability::StringField("from", item.base_unit),
                      observability::StringField("to", request_unit), observability::StringField("error", converted.error)});
    return {base_quantity, item.base_unit};
  }
  return {converted.quantity, request_unit};
}

} // namespace

std::string_view ToString(ConsumptionMode mode) {
  return mode == ConsumptionMode::kCommit ? "commit" : "preview";
}

FifoEngine::FifoEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<const units::UnitConverter> converter,
                       FifoOptions options)
    : repository_(std::move(repository)), converter_(std::move(converter)), options_(options) {
}

ConsumptionResult FifoEngine::Consume(const ConsumptionRequest& request) {
  return GuardStorage("consume " + request.item_id, [&] {
    const bool commit = request.mode == ConsumptionMode::kCommit;
    auto       tx     = repository_->Begin(commit ? db::TxMode::kReadWrite : db::TxMode::kRead);
    auto       result = Consume(*tx, request);
    if (commit) {
      CommitOrThrow(*tx, "consume " + request.item_id);
    } else {
      tx->Rollback();
    }
    return result;
  });
}

ConsumptionResult FifoEngine::Consume(db::Transaction& tx, const ConsumptionRequest& request) {
  if (!request.quantity_needed.IsPositive()) {
    throw util::ValidationError("consume " + request.item_id + ": quantity must be positive, got " +
                                request.quantity_needed.ToString());
  }

  const bool commit = request.mode == ConsumptionMode::kCommit;

  return GuardStorage("consume " + request.item_id, [&] {
    const auto item = RequireItem(*repository_, tx, request.item_id);
    if (item.costing_method != db::model::CostingMethod::kFifo) {
      throw util::ValidationError("consume " + item.id + ": item is costed by " +
                                  std::string(db::model::ToString(item.costing_method)) + ", not fifo");
    }

    // Fails the whole call before anything is read or written.
    const Decimal needed_base = ToBaseUnits(*converter_, item, request.quantity_needed, request.unit);

    const Decimal epsilon        = options_.dust_threshold;
    const Decimal above_epsilon  = Decimal::FromRaw(epsilon.Raw() + 1);
    const auto    lock           = commit ? db::RowLock::kForUpdate : db::RowLock::kNone;
    auto          lots           = repository_->ListLotsForItem(tx, item.id, above_epsilon, lock);
    const auto    now_ms         = util::ToUnixMillis(util::Now());

    ConsumptionResult result;
    result.base_unit  = item.base_unit;
    Decimal remaining = needed_base;

    for (auto& lot : lots) {
      if (remaining <= epsilon) {
        break;
      }

      const Decimal take = util::Min(lot.quantity_remaining, remaining);
      result.total_cost += take * lot.unit_cost;
      remaining -= take;

      LotConsumption entry;
      entry.lot_id            = lot.id;
      entry.quantity_consumed = take;
      entry.unit_cost         = lot.unit_cost;
      entry.remaining_in_lot  = lot.quantity_remaining - take;
      entry.acquisition_date  = lot.acquisition_date;

      if (commit) {
        lot.quantity_remaining = entry.remaining_in_lot;
        ThrowIfDbError(repository_->UpdateLot(tx, lot), "consume " + item.id + ": update lot " + std::to_string(lot.id));

        db::model::ConsumptionRecord ledger;
        ledger.id            = util::NewId();
        ledger.lot_id        = lot.id;
        ledger.item_id       = item.id;
        ledger.context_id    = request.context_id;
        ledger.quantity      = take;
        ledger.unit_cost     = lot.unit_cost;
        ledger.created_at_ms = now_ms;
        ThrowIfDbError(repository_->InsertConsumption(tx, ledger),
                       "consume " + item.id + ": record consumption of lot " + std::to_string(lot.id));
      }

      result.breakdown.push_back(entry);
    }

    // Residue at or below the dust threshold counts as satisfied.
    result.shortfall_base = remaining <= epsilon ? Decimal{} : remaining;
    result.consumed_base  = needed_base - remaining;
    result.satisfied      = result.shortfall_base.IsZero();

    std::tie(result.consumed_quantity, result.consumed_unit) =
        FromBaseUnits(*converter_, item, result.consumed_base, request.unit);
    if (result.shortfall_base.IsZero()) {
      result.shortfall      = Decimal{};
      result.shortfall_unit = request.unit;
    } else {
      std::tie(result.shortfall, result.shortfall_unit) =
          FromBaseUnits(*converter_, item, result.shortfall_base, request.unit);
    }

    const std::initializer_list<observability::LogField> fields = {
        observability::StringField("item_id", item.id),
        observability::StringField("mode", ToString(request.mode)),
        observability::DecimalField("requested_base", needed_base),
        observability::DecimalField("consumed_base", result.consumed_base),
        observability::DecimalField("shortfall_base", result.shortfall_base),
        observability::DecimalField("total_cost", result.total_cost),
        observability::IntField("lots", static_cast<int64_t>(result.breakdown.size())),
        observability::StringField("context_id", request.context_id)};
    if (commit) {
      observability::Log(spdlog::level::info, "fifo consumption applied", fields);
    } else {
      observability::Log(spdlog::level::debug, "fifo consumption previewed", fields);
    }
    return result;
  });
}

} // namespace lotcost::core
