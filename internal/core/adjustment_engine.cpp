#include "internal/core/adjustment_engine.hpp"

#include <stdexcept>

#include "internal/core/engine_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace lotcost::core {

using db::model::AdjustmentType;
using db::model::ReasonCode;
using util::Decimal;

namespace {

std::string LotLabel(uint64_t lot_id) {
  return "lot " + std::to_string(lot_id);
}

// "[2025-01-15T08:30:00Z] subtract 2 (spoilage) by desktop-user: mouse damage"
std::string AuditLine(const db::model::AdjustmentRecord& record, util::TimePoint at) {
  std::string line = "[" + util::FormatTimestamp(at) + "] " + std::string(db::model::ToString(record.adjustment_type)) +
                     " " + record.value_applied.ToString() + " (" + std::string(db::model::ToString(record.reason_code)) +
                     ") by " + record.created_by + ": " + record.quantity_before.ToString() + " -> " +
                     record.quantity_after.ToString();
  if (!record.notes.empty()) {
    line += "; " + record.notes;
  }
  return line;
}

} // namespace

AdjustmentEngine::AdjustmentEngine(std::shared_ptr<db::Repository> repository, AdjustmentOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

Decimal AdjustmentEngine::ResultingQuantity(AdjustmentType type, const Decimal& current, const Decimal& value) {
  switch (type) {
    case AdjustmentType::kAdd:
      return current + value;
    case AdjustmentType::kSubtract:
      return current - value;
    case AdjustmentType::kSet:
      return value;
    case AdjustmentType::kPercentage:
      return Decimal::MulDiv(current, value, Decimal::FromInt(100), kPercentagePlaces);
  }
  throw std::invalid_argument("unknown adjustment type");
}

db::model::AdjustmentRecord AdjustmentEngine::Adjust(const AdjustmentRequest& request) {
  const auto label = LotLabel(request.lot_id);

  return GuardStorage("adjust " + label, [&] {
    auto tx  = repository_->Begin();
    auto lot = repository_->GetLot(*tx, request.lot_id, db::RowLock::kForUpdate);
    if (!lot) {
      throw util::LotNotFound(request.lot_id);
    }

    const auto type_name = std::string(db::model::ToString(request.type));
    if (request.type == AdjustmentType::kPercentage) {
      if (request.value.IsNegative() || request.value > Decimal::FromInt(100)) {
        throw util::ValidationError("adjust " + label + ": percentage must be within [0, 100], got " +
                                    request.value.ToString());
      }
    } else if (request.value.IsNegative()) {
      throw util::ValidationError("adjust " + label + ": " + type_name + " value must not be negative, got " +
                                  request.value.ToString());
    }

    const Decimal before = lot->quantity_remaining;
    const Decimal after  = ResultingQuantity(request.type, before, request.value);
    if (after.IsNegative()) {
      throw util::ValidationError("adjust " + label + ": " + type_name + " " + request.value.ToString() +
                                  " would leave " + after.ToString() + " (current " + before.ToString() + ")");
    }
    if (after > lot->quantity_original) {
      throw util::ValidationError("adjust " + label + ": " + type_name + " " + request.value.ToString() +
                                  " would raise remaining to " + after.ToString() + " above original " +
                                  lot->quantity_original.ToString());
    }
    if (request.reason == ReasonCode::kOther && request.notes.empty()) {
      throw util::ValidationError("adjust " + label + ": notes are required for reason 'other'");
    }

    const auto now = util::Now();

    db::model::AdjustmentRecord record;
    record.id              = util::NewId();
    record.lot_id          = lot->id;
    record.adjustment_type = request.type;
    record.value_applied   = request.value;
    record.quantity_before = before;
    record.quantity_after  = after;
    record.cost_impact     = (after - before).Abs() * lot->unit_cost;
    record.reason_code     = request.reason;
    record.notes           = request.notes;
    record.created_at_ms   = util::ToUnixMillis(now);
    record.created_by      = request.created_by.value_or(options_.default_actor);

    lot->quantity_remaining = after;
    if (!lot->notes.empty()) lot->notes += '\n';
    lot->notes += AuditLine(record, now);

    ThrowIfDbError(repository_->UpdateLot(*tx, *lot), "adjust " + label);
    ThrowIfDbError(repository_->InsertAdjustment(*tx, record), "adjust " + label + ": audit record");
    CommitOrThrow(*tx, "adjust " + label);

    LOTCOST_LOG_INFO("lot adjusted",
                     {observability::IntField("lot_id", static_cast<int64_t>(lot->id)),
                      observability::StringField("item_id", lot->item_id), observability::StringField("type", type_name),
                      observability::StringField("reason", db::model::ToString(record.reason_code)),
                      observability::DecimalField("before", before), observability::DecimalField("after", after),
                      observability::DecimalField("cost_impact", record.cost_impact),
                      observability::StringField("created_by", record.created_by)});
    return record;
  });
}

std::vector<db::model::AdjustmentRecord> AdjustmentEngine::History(uint64_t lot_id) {
  return GuardStorage("adjustment history of " + LotLabel(lot_id), [&] {
    auto tx = repository_->Begin(db::TxMode::kRead);
    if (!repository_->GetLot(*tx, lot_id, db::RowLock::kNone)) {
      throw util::LotNotFound(lot_id);
    }
    auto history = repository_->ListAdjustments(*tx, lot_id);
    tx->Rollback();
    return history;
  });
}

} // namespace lotcost::core
