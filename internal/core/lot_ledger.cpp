#include "internal/core/lot_ledger.hpp"

#include "internal/core/engine_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lotcost::core {

using util::Decimal;

LotLedger::LotLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<FifoEngine> fifo,
                     std::shared_ptr<const units::UnitConverter> converter,
                     std::shared_ptr<pricing::PriceHistory> prices)
    : repository_(std::move(repository)),
      fifo_(std::move(fifo)),
      converter_(std::move(converter)),
      prices_(std::move(prices)) {
}

AcquisitionResult LotLedger::RecordAcquisition(const AcquisitionRequest& request) {
  const auto label = "acquisition of " + request.item_id;
  if (!request.quantity.IsPositive()) {
    throw util::ValidationError(label + ": quantity must be positive, got " + request.quantity.ToString());
  }
  if (request.unit_cost.IsNegative()) {
    throw util::ValidationError(label + ": unit cost must not be negative, got " + request.unit_cost.ToString());
  }
  if (request.expiration_date && *request.expiration_date < request.acquisition_date) {
    throw util::ValidationError(label + ": expiration " + request.expiration_date->ToString() +
                                " precedes acquisition " + request.acquisition_date.ToString());
  }

  return GuardStorage(label, [&] {
    auto       tx   = repository_->Begin();
    const auto item = RequireItem(*repository_, *tx, request.item_id);
    if (item.costing_method != db::model::CostingMethod::kFifo) {
      throw util::ValidationError(label + ": item is costed by " +
                                  std::string(db::model::ToString(item.costing_method)) +
                                  "; record a weighted-average acquisition instead");
    }

    const Decimal base_quantity = ToBaseUnits(*converter_, item, request.quantity, request.unit);
    if (!base_quantity.IsPositive()) {
      throw util::ValidationError(label + ": " + request.quantity.ToString() + " " + request.unit +
                                  " is zero in base unit " + item.base_unit);
    }
    // Re-expressed per base unit with one rounding. The lot's value can differ
    // from the amount paid by up to half a micro-unit per base unit.
    const Decimal base_unit_cost = Decimal::MulDiv(request.quantity, request.unit_cost, base_quantity, Decimal::kScale);

    // Compare before this purchase joins the history.
    auto change = prices_->DetectPriceChange(*tx, item.id, base_unit_cost, request.acquisition_date);

    db::model::LotRecord lot;
    lot.item_id            = item.id;
    lot.acquisition_date   = request.acquisition_date;
    lot.quantity_original  = base_quantity;
    lot.quantity_remaining = base_quantity;
    lot.unit_cost          = base_unit_cost;
    lot.expiration_date    = request.expiration_date;
    lot.location           = request.location;
    lot.notes              = request.notes;
    ThrowIfDbError(repository_->InsertLot(*tx, lot), label);

    db::model::PurchaseRecord purchase;
    purchase.item_id       = item.id;
    purchase.supplier_id   = request.supplier_id;
    purchase.purchase_date = request.acquisition_date;
    purchase.unit_price    = base_unit_cost;
    purchase.lot_id        = lot.id;
    ThrowIfDbError(repository_->InsertPurchase(*tx, purchase), label + ": purchase");

    CommitOrThrow(*tx, label);

    LOTCOST_LOG_INFO("lot created", {observability::StringField("item_id", item.id),
                                     observability::IntField("lot_id", static_cast<int64_t>(lot.id)),
                                     observability::DecimalField("quantity", base_quantity),
                                     observability::StringField("base_unit", item.base_unit),
                                     observability::DecimalField("unit_cost", base_unit_cost),
                                     observability::StringField("acquired", lot.acquisition_date.ToString())});

    if (change.level != pricing::PriceAlertLevel::kNone) {
      const auto level = change.level == pricing::PriceAlertLevel::kCritical ? spdlog::level::err : spdlog::level::warn;
      observability::Log(level, "price change alert",
                         {observability::StringField("item_id", item.id),
                          observability::StringField("level", pricing::ToString(change.level)),
                          observability::DecimalField("average_price", change.average_price.value_or(Decimal{})),
                          observability::DecimalField("new_price", change.new_price),
                          observability::StringField("message", change.message)});
    }
    return AcquisitionResult{lot, change};
  });
}

Decimal LotLedger::AvailableQuantity(const std::string& item_id) {
  return GuardStorage("available quantity of " + item_id, [&] {
    auto       tx        = repository_->Begin(db::TxMode::kRead);
    const auto item      = RequireItem(*repository_, *tx, item_id);
    const auto available = AvailableQuantity(*tx, item);
    tx->Rollback();
    return available;
  });
}

Decimal LotLedger::AvailableQuantity(db::Transaction& tx, const db::model::ItemRecord& item) {
  if (item.costing_method == db::model::CostingMethod::kWeightedAverage) {
    const auto state = repository_->GetWeightedAverage(tx, item.id, db::RowLock::kNone);
    return state ? state->current_quantity : Decimal{};
  }

  const Decimal above_dust = Decimal::FromRaw(fifo_->options().dust_threshold.Raw() + 1);
  Decimal       total;
  for (const auto& lot : repository_->ListLotsForItem(tx, item.id, above_dust, db::RowLock::kNone)) {
    total += lot.quantity_remaining;
  }
  return total;
}

Decimal LotLedger::ItemValue(db::Transaction& tx, const db::model::ItemRecord& item) {
  if (item.costing_method == db::model::CostingMethod::kWeightedAverage) {
    const auto state = repository_->GetWeightedAverage(tx, item.id, db::RowLock::kNone);
    return state ? state->current_quantity * state->weighted_average_cost : Decimal{};
  }

  Decimal value;
  for (const auto& lot : repository_->ListLotsForItem(tx, item.id, Decimal{}, db::RowLock::kNone)) {
    value += lot.quantity_remaining * lot.unit_cost;
  }
  return value;
}

Decimal LotLedger::InventoryValue(const std::optional<std::string>& item_id) {
  return GuardStorage("inventory value", [&] {
    auto    tx = repository_->Begin(db::TxMode::kRead);
    Decimal total;
    if (item_id) {
      total = ItemValue(*tx, RequireItem(*repository_, *tx, *item_id));
    } else {
      for (const auto& item : repository_->ListItems(*tx)) {
        total += ItemValue(*tx, item);
      }
    }
    tx->Rollback();
    return total;
  });
}

AvailabilityReport LotLedger::CheckAvailability(const std::vector<Requirement>& requirements) {
  return GuardStorage("check availability", [&] {
    AvailabilityReport report;
    auto               tx = repository_->Begin(db::TxMode::kRead);

    for (const auto& requirement : requirements) {
      const auto item = RequireItem(*repository_, *tx, requirement.item_id);

      // needed and available always share one unit: the requirement's, or
      // the base unit when the on-hand amount cannot be converted back.
      AvailabilityShortfall entry{item.id, requirement.quantity_needed, Decimal{}, requirement.unit};
      if (item.costing_method == db::model::CostingMethod::kFifo) {
        ConsumptionRequest request{item.id, requirement.quantity_needed, requirement.unit, ConsumptionMode::kPreview, {}};
        const auto preview = fifo_->Consume(*tx, request);
        if (preview.satisfied) continue;
        if (preview.consumed_unit == requirement.unit) {
          entry.available = preview.consumed_quantity;
        } else {
          entry.needed    = preview.consumed_base + preview.shortfall_base;
          entry.available = preview.consumed_base;
          entry.unit      = preview.base_unit;
        }
      } else {
        if (!requirement.quantity_needed.IsPositive()) {
          throw util::ValidationError("check " + item.id + ": quantity must be positive, got " +
                                      requirement.quantity_needed.ToString());
        }
        const Decimal needed_base = ToBaseUnits(*converter_, item, requirement.quantity_needed, requirement.unit);
        const Decimal on_hand     = AvailableQuantity(*tx, item);
        if (on_hand >= needed_base) continue;
        const auto back = converter_->Convert(on_hand, item.base_unit, requirement.unit, ContextFor(item));
        if (back.ok) {
          entry.available = back.quantity;
        } else {
          entry.needed    = needed_base;
          entry.available = on_hand;
          entry.unit      = item.base_unit;
        }
      }

      report.can_fulfill = false;
      LOTCOST_LOG_DEBUG("requirement short", {observability::StringField("item_id", item.id),
                                              observability::DecimalField("needed", entry.needed),
                                              observability::DecimalField("available", entry.available),
                                              observability::StringField("unit", entry.unit)});
      report.missing.push_back(std::move(entry));
    }

    tx->Rollback();
    return report;
  });
}

std::vector<db::model::ConsumptionRecord> LotLedger::ConsumptionsForContext(const std::string& context_id) {
  return GuardStorage("consumptions for context " + context_id, [&] {
    auto tx   = repository_->Begin(db::TxMode::kRead);
    auto rows = repository_->ListConsumptions(*tx, context_id);
    tx->Rollback();
    return rows;
  });
}

std::vector<db::model::LotRecord> LotLedger::Lots(const std::string& item_id) {
  return GuardStorage("lots of " + item_id, [&] {
    auto tx = repository_->Begin(db::TxMode::kRead);
    RequireItem(*repository_, *tx, item_id);
    auto lots = repository_->ListLotsForItem(*tx, item_id, Decimal{}, db::RowLock::kNone);
    tx->Rollback();
    return lots;
  });
}

} // namespace lotcost::core
