#include "internal/core/weighted_average_engine.hpp"

#include "internal/core/engine_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lotcost::core {

using util::Decimal;

namespace {

WeightedAverageState ToState(const db::model::WeightedAverageRecord& record) {
  return {record.item_id, record.current_quantity, record.weighted_average_cost};
}

} // namespace

WeightedAverageEngine::WeightedAverageEngine(std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)) {
}

Decimal WeightedAverageEngine::CalculateWeightedAverage(const Decimal& current_quantity, const Decimal& current_average,
                                                        const Decimal& added_quantity, const Decimal& added_unit_cost) {
  if (current_quantity.IsZero()) {
    return added_unit_cost;
  }
  return Decimal::WeightedMean(current_quantity, current_average, added_quantity, added_unit_cost, kCostPlaces);
}

db::model::ItemRecord WeightedAverageEngine::RequireWeightedItem(db::Transaction& tx, const std::string& item_id) {
  auto item = RequireItem(*repository_, tx, item_id);
  if (item.costing_method != db::model::CostingMethod::kWeightedAverage) {
    throw util::ValidationError("item " + item_id + " is costed by " +
                                std::string(db::model::ToString(item.costing_method)) + ", not weighted_average");
  }
  return item;
}

WeightedAverageState WeightedAverageEngine::RecordAcquisition(const std::string& item_id, const Decimal& added_quantity,
                                                              const Decimal& added_unit_cost,
                                                              const PurchaseInfo& purchase) {
  if (!added_quantity.IsPositive()) {
    throw util::ValidationError("acquisition of " + item_id + ": quantity must be positive, got " +
                                added_quantity.ToString());
  }
  if (added_unit_cost.IsNegative()) {
    throw util::ValidationError("acquisition of " + item_id + ": unit cost must not be negative, got " +
                                added_unit_cost.ToString());
  }

  return GuardStorage("weighted-average acquisition of " + item_id, [&] {
    auto tx = repository_->Begin();
    RequireWeightedItem(*tx, item_id);

    auto record = repository_->GetWeightedAverage(*tx, item_id, db::RowLock::kForUpdate)
                      .value_or(db::model::WeightedAverageRecord{item_id, Decimal{}, Decimal{}, 0});

    const Decimal previous_average = record.weighted_average_cost;
    record.weighted_average_cost   = CalculateWeightedAverage(record.current_quantity, record.weighted_average_cost,
                                                              added_quantity, added_unit_cost);
    record.current_quantity += added_quantity;
    record.updated_at_ms = util::ToUnixMillis(util::Now());
    ThrowIfDbError(repository_->UpsertWeightedAverage(*tx, record), "weighted-average acquisition of " + item_id);

    db::model::PurchaseRecord row;
    row.item_id       = item_id;
    row.supplier_id   = purchase.supplier_id;
    row.purchase_date = purchase.purchase_date.value_or(util::Date::Today());
    row.unit_price    = added_unit_cost;
    ThrowIfDbError(repository_->InsertPurchase(*tx, row), "weighted-average acquisition of " + item_id + ": purchase");

    CommitOrThrow(*tx, "weighted-average acquisition of " + item_id);

    LOTCOST_LOG_INFO("weighted-average acquisition recorded",
                     {observability::StringField("item_id", item_id),
                      observability::DecimalField("added_quantity", added_quantity),
                      observability::DecimalField("added_unit_cost", added_unit_cost),
                      observability::DecimalField("previous_average", previous_average),
                      observability::DecimalField("new_average", record.weighted_average_cost),
                      observability::DecimalField("current_quantity", record.current_quantity)});
    return ToState(record);
  });
}

WeightedAverageState WeightedAverageEngine::AdjustInventory(const std::string& item_id,
                                                            const InventoryAdjustment& adjustment) {
  if (adjustment.absolute_quantity.has_value() == adjustment.percentage_of_current.has_value()) {
    throw util::ValidationError("inventory adjustment of " + item_id +
                                ": exactly one of absolute quantity or percentage must be given");
  }
  if (adjustment.percentage_of_current &&
      (adjustment.percentage_of_current->IsNegative() || *adjustment.percentage_of_current > Decimal::FromInt(100))) {
    throw util::ValidationError("inventory adjustment of " + item_id + ": percentage must be within [0, 100], got " +
                                adjustment.percentage_of_current->ToString());
  }

  return GuardStorage("inventory adjustment of " + item_id, [&] {
    auto tx = repository_->Begin();
    RequireWeightedItem(*tx, item_id);

    auto record = repository_->GetWeightedAverage(*tx, item_id, db::RowLock::kForUpdate)
                      .value_or(db::model::WeightedAverageRecord{item_id, Decimal{}, Decimal{}, 0});

    const Decimal before = record.current_quantity;
    const Decimal after  = adjustment.absolute_quantity
                               ? *adjustment.absolute_quantity
                               : Decimal::MulDiv(before, *adjustment.percentage_of_current, Decimal::FromInt(100),
                                                  Decimal::kScale);
    if (after.IsNegative()) {
      throw util::ValidationError("inventory adjustment of " + item_id + ": resulting quantity " + after.ToString() +
                                  " would be negative (current " + before.ToString() + ")");
    }

    // The cost basis survives recounts untouched.
    record.current_quantity = after;
    record.updated_at_ms    = util::ToUnixMillis(util::Now());
    ThrowIfDbError(repository_->UpsertWeightedAverage(*tx, record), "inventory adjustment of " + item_id);
    CommitOrThrow(*tx, "inventory adjustment of " + item_id);

    LOTCOST_LOG_INFO("weighted-average inventory adjusted",
                     {observability::StringField("item_id", item_id), observability::DecimalField("before", before),
                      observability::DecimalField("after", after)});
    return ToState(record);
  });
}

WeightedAverageState WeightedAverageEngine::GetState(const std::string& item_id) {
  return GuardStorage("weighted-average state of " + item_id, [&] {
    auto tx    = repository_->Begin(db::TxMode::kRead);
    auto state = GetState(*tx, item_id);
    tx->Rollback();
    return state;
  });
}

WeightedAverageState WeightedAverageEngine::GetState(db::Transaction& tx, const std::string& item_id) {
  RequireWeightedItem(tx, item_id);
  auto record = repository_->GetWeightedAverage(tx, item_id, db::RowLock::kNone);
  if (!record) {
    return WeightedAverageState{item_id, Decimal{}, Decimal{}};
  }
  return ToState(*record);
}

} // namespace lotcost::core
