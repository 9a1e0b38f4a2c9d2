#include "internal/core/fifo_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/units/unit_converter.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"

namespace {

using lotcost::core::ConsumptionMode;
using lotcost::core::ConsumptionRequest;
using lotcost::core::FifoEngine;
using lotcost::db::Repository;
using lotcost::db::memory::MemoryRepository;
using lotcost::db::model::CostingMethod;
using lotcost::db::model::ItemRecord;
using lotcost::db::model::LotRecord;
using lotcost::test::FailingRepository;
using lotcost::test::FailingWrite;
using lotcost::units::StandardUnitConverter;
using lotcost::util::Date;
using lotcost::util::Decimal;

Decimal D(const char* text) {
  return Decimal::Parse(text);
}

void SeedItem(Repository& repo, const std::string& id, const std::string& base_unit,
              CostingMethod method = CostingMethod::kFifo) {
  auto       tx = repo.Begin();
  ItemRecord item;
  item.id             = id;
  item.name           = id;
  item.base_unit      = base_unit;
  item.costing_method = method;
  assert(repo.InsertItem(*tx, item));
  tx->Commit();
}

uint64_t SeedLot(Repository& repo, const std::string& item_id, const char* date, const char* qty, const char* cost) {
  auto      tx = repo.Begin();
  LotRecord lot;
  lot.item_id            = item_id;
  lot.acquisition_date   = Date::Parse(date);
  lot.quantity_original  = D(qty);
  lot.quantity_remaining = D(qty);
  lot.unit_cost          = D(cost);
  assert(repo.InsertLot(*tx, lot));
  tx->Commit();
  return lot.id;
}

std::vector<LotRecord> AllLots(Repository& repo, const std::string& item_id) {
  auto tx   = repo.Begin();
  auto lots = repo.ListLotsForItem(*tx, item_id, Decimal{}, lotcost::db::RowLock::kNone);
  tx->Rollback();
  return lots;
}

ConsumptionRequest Request(const std::string& item_id, const char* qty, const std::string& unit, ConsumptionMode mode) {
  ConsumptionRequest request;
  request.item_id         = item_id;
  request.quantity_needed = D(qty);
  request.unit            = unit;
  request.mode            = mode;
  return request;
}

struct Fixture {
  std::shared_ptr<MemoryRepository> repo   = std::make_shared<MemoryRepository>();
  std::shared_ptr<FifoEngine>       engine = std::make_shared<FifoEngine>(repo, std::make_shared<StandardUnitConverter>());
  uint64_t                          lot1   = 0;
  uint64_t                          lot2   = 0;
  uint64_t                          lot3   = 0;

  // 10 / 15 / 20 units dated 2025-01-01, 2025-01-15, 2025-02-01.
  Fixture() {
    SeedItem(*repo, "flour", "g");
    lot1 = SeedLot(*repo, "flour", "2025-01-01", "10", "0.10");
    lot2 = SeedLot(*repo, "flour", "2025-01-15", "15", "0.20");
    lot3 = SeedLot(*repo, "flour", "2025-02-01", "20", "0.30");
  }
};

void TestCommitDrainsOldestLotFirst() {
  Fixture f;
  auto    result = f.engine->Consume(Request("flour", "12", "g", ConsumptionMode::kCommit));

  assert(result.satisfied);
  assert(result.consumed_quantity == D("12"));
  assert(result.shortfall.IsZero());
  assert(result.breakdown.size() == 2);
  assert(result.breakdown[0].lot_id == f.lot1);
  assert(result.breakdown[0].quantity_consumed == D("10"));
  assert(result.breakdown[0].remaining_in_lot.IsZero());
  assert(result.breakdown[1].lot_id == f.lot2);
  assert(result.breakdown[1].quantity_consumed == D("2"));
  assert(result.breakdown[1].remaining_in_lot == D("13"));
  // 10 * 0.10 + 2 * 0.20
  assert(result.total_cost == D("1.4"));

  const auto lots = AllLots(*f.repo, "flour");
  assert(lots.size() == 3);
  assert(lots[0].quantity_remaining.IsZero());
  assert(lots[1].quantity_remaining == D("13"));
  assert(lots[2].quantity_remaining == D("20"));
}

void TestSameDateLotsDrawInCreationOrder() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto engine = FifoEngine(repo, std::make_shared<StandardUnitConverter>());
  SeedItem(*repo, "sugar", "g");
  // Cheaper and larger lot created second must not jump the queue.
  const auto first  = SeedLot(*repo, "sugar", "2025-03-01", "5", "0.50");
  const auto second = SeedLot(*repo, "sugar", "2025-03-01", "50", "0.01");

  auto result = engine.Consume(Request("sugar", "6", "g", ConsumptionMode::kPreview));
  assert(result.breakdown.size() == 2);
  assert(result.breakdown[0].lot_id == first);
  assert(result.breakdown[1].lot_id == second);
}

void TestExactBoundaryEmptiesEveryLot() {
  Fixture f;
  auto    result = f.engine->Consume(Request("flour", "45", "g", ConsumptionMode::kCommit));

  assert(result.satisfied);
  assert(result.shortfall.IsZero());
  assert(result.consumed_base == D("45"));
  for (const auto& lot : AllLots(*f.repo, "flour")) {
    assert(lot.quantity_remaining.IsZero());
  }
  // Depleted lots are kept for audit.
  assert(AllLots(*f.repo, "flour").size() == 3);
}

void TestOverRequestReportsShortfall() {
  Fixture f;
  auto    result = f.engine->Consume(Request("flour", "50", "g", ConsumptionMode::kCommit));

  assert(!result.satisfied);
  assert(result.consumed_quantity == D("45"));
  assert(result.shortfall == D("5"));
  assert(result.consumed_quantity + result.shortfall == D("50"));
  // 1.0 + 3.0 + 6.0
  assert(result.total_cost == D("10"));
}

void TestPreviewIsIdempotentAndWritesNothing() {
  Fixture f;
  auto    first  = f.engine->Consume(Request("flour", "30", "g", ConsumptionMode::kPreview));
  auto    second = f.engine->Consume(Request("flour", "30", "g", ConsumptionMode::kPreview));

  assert(first.total_cost == second.total_cost);
  assert(first.consumed_quantity == second.consumed_quantity);
  assert(first.breakdown.size() == second.breakdown.size());
  for (std::size_t i = 0; i < first.breakdown.size(); ++i) {
    assert(first.breakdown[i].lot_id == second.breakdown[i].lot_id);
    assert(first.breakdown[i].remaining_in_lot == second.breakdown[i].remaining_in_lot);
  }
  // Would-be remaining is reported, stored remaining is untouched.
  assert(first.breakdown[2].remaining_in_lot == D("15"));
  const auto lots = AllLots(*f.repo, "flour");
  assert(lots[0].quantity_remaining == D("10"));
  assert(lots[1].quantity_remaining == D("15"));
  assert(lots[2].quantity_remaining == D("20"));

  auto tx = f.repo->Begin();
  assert(f.repo->ListConsumptions(*tx, "").empty());
}

void TestCommitConservesTotalRemaining() {
  Fixture f;
  auto    sum = [&] {
    Decimal total;
    for (const auto& lot : AllLots(*f.repo, "flour")) total += lot.quantity_remaining;
    return total;
  };

  const Decimal before = sum();
  auto          result = f.engine->Consume(Request("flour", "17.25", "g", ConsumptionMode::kCommit));
  assert(before - sum() == result.consumed_base);
  for (const auto& lot : AllLots(*f.repo, "flour")) {
    assert(!lot.quantity_remaining.IsNegative());
  }
}

void TestRequestUnitIsConvertedBothWays() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto engine = FifoEngine(repo, std::make_shared<StandardUnitConverter>());
  SeedItem(*repo, "butter", "g");
  SeedLot(*repo, "butter", "2025-01-01", "1500", "0.01");

  auto result = engine.Consume(Request("butter", "2", "kg", ConsumptionMode::kPreview));
  assert(result.consumed_base == D("1500"));
  assert(result.consumed_quantity == D("1.5"));
  assert(result.consumed_unit == "kg");
  assert(result.shortfall == D("0.5"));
  assert(result.shortfall_unit == "kg");
  assert(result.shortfall_base == D("500"));
}

void TestDustLotsAreSkippedAndResidueSnaps() {
  auto repo   = std::make_shared<MemoryRepository>();
  auto engine = FifoEngine(repo, std::make_shared<StandardUnitConverter>());
  SeedItem(*repo, "salt", "g");
  SeedLot(*repo, "salt", "2025-01-01", "0.0005", "1");
  const auto real = SeedLot(*repo, "salt", "2025-01-02", "4", "0.5");

  auto result = engine.Consume(Request("salt", "4.0009", "g", ConsumptionMode::kPreview));
  assert(result.breakdown.size() == 1);
  assert(result.breakdown[0].lot_id == real);
  assert(result.satisfied);
  assert(result.shortfall.IsZero());
}

void TestLedgerRowsCarryContext() {
  Fixture f;
  auto    request    = Request("flour", "12", "g", ConsumptionMode::kCommit);
  request.context_id = "production-7";
  (void)f.engine->Consume(request);

  auto tx   = f.repo->Begin();
  auto rows = f.repo->ListConsumptions(*tx, "production-7");
  assert(rows.size() == 2);
  assert(rows[0].lot_id == f.lot1);
  assert(rows[0].quantity == D("10"));
  assert(rows[1].lot_id == f.lot2);
  assert(rows[1].unit_cost == D("0.2"));
}

void TestRejectsBadRequests() {
  Fixture f;

  bool threw = false;
  try {
    (void)f.engine->Consume(Request("flour", "0", "g", ConsumptionMode::kCommit));
  } catch (const lotcost::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)f.engine->Consume(Request("rye", "1", "g", ConsumptionMode::kCommit));
  } catch (const lotcost::util::ItemNotFound& e) {
    threw = e.item_id() == "rye";
  }
  assert(threw);

  threw = false;
  try {
    (void)f.engine->Consume(Request("flour", "1", "cup", ConsumptionMode::kCommit));
  } catch (const lotcost::util::UnitConversionError&) {
    threw = true;
  }
  assert(threw && "volume to weight without density must fail");

  SeedItem(*f.repo, "oil", "ml", CostingMethod::kWeightedAverage);
  threw = false;
  try {
    (void)f.engine->Consume(Request("oil", "1", "ml", ConsumptionMode::kPreview));
  } catch (const lotcost::util::ValidationError&) {
    threw = true;
  }
  assert(threw && "weighted-average items are not lot tracked");
}

void TestFailureMidWalkRollsBackEarlierLots() {
  Fixture f;
  auto    failing = std::make_shared<FailingRepository>(f.repo, FailingWrite::kUpdateLot, 2);
  auto    engine  = FifoEngine(failing, std::make_shared<StandardUnitConverter>());

  bool threw = false;
  try {
    (void)engine.Consume(Request("flour", "30", "g", ConsumptionMode::kCommit));
  } catch (const lotcost::util::TransactionFailure& e) {
    threw = std::string(e.what()).find("disk full") != std::string::npos;
  }
  assert(threw);

  // Lot 1 was written before lot 2 failed; none of it may be visible.
  const auto lots = AllLots(*f.repo, "flour");
  assert(lots[0].quantity_remaining == D("10"));
  assert(lots[1].quantity_remaining == D("15"));
  assert(lots[2].quantity_remaining == D("20"));

  auto tx = f.repo->Begin();
  assert(f.repo->ListConsumptions(*tx, "").empty());
}

void TestLedgerRowFailureRollsBackLots() {
  Fixture f;
  // Both lot updates succeed; the second consumption row fails.
  auto failing = std::make_shared<FailingRepository>(f.repo, FailingWrite::kInsertConsumption, 2);
  auto engine  = FifoEngine(failing, std::make_shared<StandardUnitConverter>());

  bool threw = false;
  try {
    (void)engine.Consume(Request("flour", "12", "g", ConsumptionMode::kCommit));
  } catch (const lotcost::util::TransactionFailure&) {
    threw = true;
  }
  assert(threw);

  const auto lots = AllLots(*f.repo, "flour");
  assert(lots[0].quantity_remaining == D("10"));
  assert(lots[1].quantity_remaining == D("15"));

  auto tx = f.repo->Begin();
  assert(f.repo->ListConsumptions(*tx, "").empty());
}

} // namespace

int main() {
  TestCommitDrainsOldestLotFirst();
  TestSameDateLotsDrawInCreationOrder();
  TestExactBoundaryEmptiesEveryLot();
  TestOverRequestReportsShortfall();
  TestPreviewIsIdempotentAndWritesNothing();
  TestCommitConservesTotalRemaining();
  TestRequestUnitIsConvertedBothWays();
  TestDustLotsAreSkippedAndResidueSnaps();
  TestLedgerRowsCarryContext();
  TestRejectsBadRequests();
  TestFailureMidWalkRollsBackEarlierLots();
  TestLedgerRowFailureRollsBackLots();

  std::cout << "lotcost_unit_fifo_engine: pass\n";
  return 0;
}
