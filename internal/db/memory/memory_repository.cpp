#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace lotcost::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TxMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result MemoryRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.items.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "item " + r.id);
  s.items[r.id] = r;
  return Result::Ok();
}

std::optional<model::ItemRecord> MemoryRepository::GetItem(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.items.find(id);
  if (it == s.items.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ItemRecord> MemoryRepository::ListItems(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::ItemRecord> out;
  out.reserve(s.items.size());
  for (const auto& [_, item] : s.items) {
    out.push_back(item);
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return out;
}

// ------------------------------------------------------------------
// Lots
// ------------------------------------------------------------------

Result MemoryRepository::InsertLot(Transaction& t, model::LotRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.items.contains(r.item_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown item " + r.item_id);
  if (r.quantity_remaining.IsNegative() || r.quantity_remaining > r.quantity_original || r.unit_cost.IsNegative()) {
    return Result::Err(ErrorCode::ConstraintViolation, "lot quantities out of range for item " + r.item_id);
  }
  r.id         = s.next_lot_id++;
  s.lots[r.id] = r;
  return Result::Ok();
}

std::optional<model::LotRecord> MemoryRepository::GetLot(Transaction& t, uint64_t lot_id, RowLock) {
  const auto& s  = TX(t).View();
  auto        it = s.lots.find(lot_id);
  if (it == s.lots.end()) return std::nullopt;
  return it->second;
}

std::vector<model::LotRecord> MemoryRepository::ListLotsForItem(Transaction& t, const std::string& item_id,
                                                                const util::Decimal& min_remaining, RowLock) {
  std::vector<model::LotRecord> out;
  for (const auto& [_, lot] : TX(t).View().lots) {
    if (lot.item_id == item_id && lot.quantity_remaining >= min_remaining) out.push_back(lot);
  }
  // Map iteration already yields id order; stable_sort keeps it within a date.
  std::stable_sort(out.begin(), out.end(),
                   [](const auto& a, const auto& b) { return a.acquisition_date < b.acquisition_date; });
  return out;
}

Result MemoryRepository::UpdateLot(Transaction& t, const model::LotRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.lots.find(r.id);
  if (it == s.lots.end()) return Result::Err(ErrorCode::NotFound, "lot " + std::to_string(r.id));
  if (r.quantity_remaining.IsNegative() || r.quantity_remaining > it->second.quantity_original) {
    return Result::Err(ErrorCode::ConstraintViolation, "lot " + std::to_string(r.id) + " remaining out of range");
  }
  // Identity and acquisition fields are immutable.
  auto& lot              = it->second;
  lot.quantity_remaining = r.quantity_remaining;
  lot.unit_cost          = r.unit_cost;
  lot.expiration_date    = r.expiration_date;
  lot.location           = r.location;
  lot.notes              = r.notes;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::InsertAdjustment(Transaction& t, const model::AdjustmentRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.lots.contains(r.lot_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown lot " + std::to_string(r.lot_id));
  s.adjustments.push_back(r);
  return Result::Ok();
}

std::vector<model::AdjustmentRecord> MemoryRepository::ListAdjustments(Transaction& t, uint64_t lot_id) {
  std::vector<model::AdjustmentRecord> out;
  const auto&                          adjustments = TX(t).View().adjustments;
  for (auto it = adjustments.rbegin(); it != adjustments.rend(); ++it) {
    if (it->lot_id == lot_id) out.push_back(*it);
  }
  return out;
}

Result MemoryRepository::InsertConsumption(Transaction& t, const model::ConsumptionRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.lots.contains(r.lot_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown lot " + std::to_string(r.lot_id));
  s.consumptions.push_back(r);
  return Result::Ok();
}

std::vector<model::ConsumptionRecord> MemoryRepository::ListConsumptions(Transaction& t, const std::string& context_id) {
  std::vector<model::ConsumptionRecord> out;
  for (const auto& c : TX(t).View().consumptions)
    if (c.context_id == context_id) out.push_back(c);
  return out;
}

// ------------------------------------------------------------------
// Weighted average
// ------------------------------------------------------------------

std::optional<model::WeightedAverageRecord> MemoryRepository::GetWeightedAverage(Transaction& t, const std::string& item_id,
                                                                                 RowLock) {
  const auto& s  = TX(t).View();
  auto        it = s.weighted_average.find(item_id);
  if (it == s.weighted_average.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertWeightedAverage(Transaction& t, const model::WeightedAverageRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.items.contains(r.item_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown item " + r.item_id);
  s.weighted_average[r.item_id] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Pricing history
// ------------------------------------------------------------------

Result MemoryRepository::InsertPurchase(Transaction& t, model::PurchaseRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.items.contains(r.item_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown item " + r.item_id);
  r.id = s.next_purchase_id++;
  s.purchases.push_back(r);
  return Result::Ok();
}

std::vector<model::PurchaseRecord> MemoryRepository::ListPurchases(Transaction& t, const std::string& item_id) {
  std::vector<model::PurchaseRecord> out;
  for (const auto& p : TX(t).View().purchases)
    if (p.item_id == item_id) out.push_back(p);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.purchase_date != b.purchase_date) return a.purchase_date > b.purchase_date;
    return a.id > b.id;
  });
  return out;
}

} // namespace lotcost::db::memory
