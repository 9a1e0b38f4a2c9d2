#include "internal/core/adjustment_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"

namespace {

using lotcost::core::AdjustmentEngine;
using lotcost::core::AdjustmentOptions;
using lotcost::core::AdjustmentRequest;
using lotcost::db::RowLock;
using lotcost::db::memory::MemoryRepository;
using lotcost::db::model::AdjustmentType;
using lotcost::db::model::ItemRecord;
using lotcost::db::model::LotRecord;
using lotcost::db::model::ReasonCode;
using lotcost::test::FailingRepository;
using lotcost::test::FailingWrite;
using lotcost::util::Date;
using lotcost::util::Decimal;

Decimal D(const char* text) {
  return Decimal::Parse(text);
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  AdjustmentEngine                  engine{repo, AdjustmentOptions{"tester"}};
  uint64_t                          lot_id = 0;

  // 20 of 25 remaining at 0.50.
  Fixture() {
    auto       tx = repo->Begin();
    ItemRecord item;
    item.id        = "walnuts";
    item.name      = "Walnuts";
    item.base_unit = "g";
    assert(repo->InsertItem(*tx, item));

    LotRecord lot;
    lot.item_id            = "walnuts";
    lot.acquisition_date   = Date::Parse("2025-05-01");
    lot.quantity_original  = D("25");
    lot.quantity_remaining = D("20");
    lot.unit_cost          = D("0.5");
    lot.notes              = "received damp";
    assert(repo->InsertLot(*tx, lot));
    lot_id = lot.id;
    tx->Commit();
  }

  LotRecord Lot() {
    auto tx  = repo->Begin();
    auto lot = repo->GetLot(*tx, lot_id, RowLock::kNone);
    assert(lot.has_value());
    return *lot;
  }
};

AdjustmentRequest Request(uint64_t lot_id, AdjustmentType type, const char* value, ReasonCode reason) {
  AdjustmentRequest request;
  request.lot_id = lot_id;
  request.type   = type;
  request.value  = D(value);
  request.reason = reason;
  return request;
}

template <typename Fn>
std::string ValidationMessage(Fn&& fn) {
  try {
    fn();
  } catch (const lotcost::util::ValidationError& e) {
    return e.what();
  }
  return {};
}

void TestResultingQuantityPerType() {
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kAdd, D("10"), D("2.5")) == D("12.5"));
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kSubtract, D("10"), D("2.5")) == D("7.5"));
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kSet, D("10"), D("3")) == D("3"));
  // 7.777 * 33.33 / 100 = 2.5920741 -> 2.59
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kPercentage, D("7.777"), D("33.33")) == D("2.59"));
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kPercentage, D("0.05"), D("50")) == D("0.03"));
  // Rounded once: 0.00499999 goes to 0.00, exactly 0.005 goes to 0.01.
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kPercentage, D("1"), D("0.499999")).IsZero());
  assert(AdjustmentEngine::ResultingQuantity(AdjustmentType::kPercentage, D("1"), D("0.5")) == D("0.01"));
}

void TestSubtractWritesLotAndAudit() {
  Fixture f;
  auto    request = Request(f.lot_id, AdjustmentType::kSubtract, "4", ReasonCode::kSpoilage);
  request.notes   = "mould on top layer";

  auto record = f.engine.Adjust(request);
  assert(!record.id.empty());
  assert(record.quantity_before == D("20"));
  assert(record.quantity_after == D("16"));
  assert(record.cost_impact == D("2"));
  assert(record.created_by == "tester");
  assert(record.created_at_ms > 0);

  auto lot = f.Lot();
  assert(lot.quantity_remaining == D("16"));
  // Existing notes are kept and one audit line is appended.
  assert(lot.notes.rfind("received damp\n[", 0) == 0);
  assert(lot.notes.find("subtract 4 (spoilage) by tester: 20 -> 16; mould on top layer") != std::string::npos);
}

void TestHistoryIsNewestFirst() {
  Fixture f;
  auto    first      = f.engine.Adjust(Request(f.lot_id, AdjustmentType::kSet, "18", ReasonCode::kPhysicalCount));
  auto    request    = Request(f.lot_id, AdjustmentType::kPercentage, "50", ReasonCode::kCorrection);
  request.created_by = "auditor";
  auto second        = f.engine.Adjust(request);

  assert(second.quantity_after == D("9"));
  assert(second.created_by == "auditor");
  assert(second.cost_impact == D("4.5"));

  auto history = f.engine.History(f.lot_id);
  assert(history.size() == 2);
  assert(history[0].id == second.id);
  assert(history[1].id == first.id);
}

void TestSubtractBeyondRemainingLeavesLotUntouched() {
  Fixture f;
  const auto before = f.Lot();

  auto message = ValidationMessage(
      [&] { (void)f.engine.Adjust(Request(f.lot_id, AdjustmentType::kSubtract, "20.01", ReasonCode::kGift)); });
  assert(!message.empty());
  // The message names the requested and current values.
  assert(message.find("20.01") != std::string::npos);
  assert(message.find("current 20") != std::string::npos);

  const auto after = f.Lot();
  assert(after.quantity_remaining == before.quantity_remaining);
  assert(after.notes == before.notes);
  assert(f.engine.History(f.lot_id).empty());
}

void TestBoundsAndReasonRules() {
  Fixture f;

  assert(!ValidationMessage([&] {
            (void)f.engine.Adjust(Request(f.lot_id, AdjustmentType::kPercentage, "101", ReasonCode::kCorrection));
          }).empty());
  assert(!ValidationMessage([&] {
            (void)f.engine.Adjust(Request(f.lot_id, AdjustmentType::kAdd, "-1", ReasonCode::kCorrection));
          }).empty());
  // Above quantity_original.
  assert(!ValidationMessage([&] {
            (void)f.engine.Adjust(Request(f.lot_id, AdjustmentType::kAdd, "5.5", ReasonCode::kCorrection));
          }).empty());
  assert(!ValidationMessage([&] {
            (void)f.engine.Adjust(Request(f.lot_id, AdjustmentType::kSubtract, "1", ReasonCode::kOther));
          }).empty());

  auto request  = Request(f.lot_id, AdjustmentType::kAdd, "5", ReasonCode::kOther);
  request.notes = "found a second bag";
  auto record   = f.engine.Adjust(request);
  assert(record.quantity_after == D("25"));

  // Subtracting everything is allowed and leaves the lot at zero.
  record = f.engine.Adjust(Request(f.lot_id, AdjustmentType::kSubtract, "25", ReasonCode::kAdHocUsage));
  assert(record.quantity_after.IsZero());
  assert(f.Lot().quantity_remaining.IsZero());
}

void TestUnknownLot() {
  Fixture f;
  bool    threw = false;
  try {
    (void)f.engine.Adjust(Request(f.lot_id + 100, AdjustmentType::kPercentage, "500", ReasonCode::kOther));
  } catch (const lotcost::util::LotNotFound& e) {
    // Existence is checked before the value.
    threw = e.lot_id() == f.lot_id + 100;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.engine.History(9999);
  } catch (const lotcost::util::LotNotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestAuditFailureRollsBackLot() {
  Fixture f;
  const auto before = f.Lot();

  auto             failing = std::make_shared<FailingRepository>(f.repo, FailingWrite::kInsertAdjustment);
  AdjustmentEngine engine{failing, AdjustmentOptions{"tester"}};

  bool threw = false;
  try {
    (void)engine.Adjust(Request(f.lot_id, AdjustmentType::kSubtract, "5", ReasonCode::kSpoilage));
  } catch (const lotcost::util::TransactionFailure& e) {
    threw = std::string(e.what()).find("disk full") != std::string::npos;
  }
  assert(threw);

  // The lot update ran before the audit insert failed; neither survives.
  const auto after = f.Lot();
  assert(after.quantity_remaining == before.quantity_remaining);
  assert(after.notes == before.notes);
  assert(f.engine.History(f.lot_id).empty());
}

} // namespace

int main() {
  TestResultingQuantityPerType();
  TestSubtractWritesLotAndAudit();
  TestHistoryIsNewestFirst();
  TestSubtractBeyondRemainingLeavesLotUntouched();
  TestBoundsAndReasonRules();
  TestUnknownLot();
  TestAuditFailureRollsBackLot();

  std::cout << "lotcost_unit_adjustment_engine: pass\n";
  return 0;
}
