#include "internal/core/weighted_average_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/failing_repository.hpp"

namespace {

using lotcost::core::InventoryAdjustment;
using lotcost::core::PurchaseInfo;
using lotcost::core::WeightedAverageEngine;
using lotcost::db::memory::MemoryRepository;
using lotcost::db::model::CostingMethod;
using lotcost::db::model::ItemRecord;
using lotcost::test::FailingRepository;
using lotcost::test::FailingWrite;
using lotcost::util::Date;
using lotcost::util::Decimal;

Decimal D(const char* text) {
  return Decimal::Parse(text);
}

std::shared_ptr<MemoryRepository> RepoWithItem(const std::string& id, CostingMethod method) {
  auto       repo = std::make_shared<MemoryRepository>();
  auto       tx   = repo->Begin();
  ItemRecord item;
  item.id             = id;
  item.name           = id;
  item.base_unit      = "each";
  item.costing_method = method;
  assert(repo->InsertItem(*tx, item));
  tx->Commit();
  return repo;
}

template <typename Fn>
bool ThrowsValidation(Fn&& fn) {
  try {
    fn();
  } catch (const lotcost::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestFormulaRoundsToFourPlaces() {
  assert(WeightedAverageEngine::CalculateWeightedAverage(D("200"), D("0.12"), D("100"), D("0.15")) == D("0.13"));
  // First acquisition seeds the average.
  assert(WeightedAverageEngine::CalculateWeightedAverage(Decimal{}, Decimal{}, D("7"), D("1.23456")) == D("1.23456"));
  // (1 * 1 + 2 * 0.5) / 3 = 0.666666... -> 0.6667
  assert(WeightedAverageEngine::CalculateWeightedAverage(D("1"), D("1"), D("2"), D("0.5")) == D("0.6667"));
  // One rounding step: 0.0001 / 2.000001 = 0.0000499999... -> 0.0000, while
  // 0.0001 / 2 = 0.00005 sits on the half and goes up.
  assert(WeightedAverageEngine::CalculateWeightedAverage(D("1"), D("0.0001"), D("1.000001"), D("0")).IsZero());
  assert(WeightedAverageEngine::CalculateWeightedAverage(D("1"), D("0.0001"), D("1"), D("0")) == D("0.0001"));
}

void TestAcquisitionsReaverage() {
  auto                  repo = RepoWithItem("eggs", CostingMethod::kWeightedAverage);
  WeightedAverageEngine engine(repo);

  auto state = engine.RecordAcquisition("eggs", D("200"), D("0.12"));
  assert(state.current_quantity == D("200"));
  assert(state.weighted_average_cost == D("0.12"));

  state = engine.RecordAcquisition("eggs", D("100"), D("0.15"), PurchaseInfo{Date::Parse("2025-04-02"), "farm"});
  assert(state.current_quantity == D("300"));
  assert(state.weighted_average_cost.ToString(4) == "0.1300");

  auto stored = engine.GetState("eggs");
  assert(stored.current_quantity == D("300"));
  assert(stored.weighted_average_cost == D("0.13"));

  // Both acquisitions feed the pricing history, newest first.
  auto tx        = repo->Begin();
  auto purchases = repo->ListPurchases(*tx, "eggs");
  assert(purchases.size() == 2);
  assert(purchases[0].supplier_id == "farm" || purchases[1].supplier_id == "farm");
  for (const auto& p : purchases) assert(p.lot_id == 0);
}

void TestAdjustmentKeepsCostBasis() {
  auto                  repo = RepoWithItem("eggs", CostingMethod::kWeightedAverage);
  WeightedAverageEngine engine(repo);
  (void)engine.RecordAcquisition("eggs", D("200"), D("0.12"));

  auto state = engine.AdjustInventory("eggs", InventoryAdjustment{D("150"), std::nullopt});
  assert(state.current_quantity == D("150"));
  assert(state.weighted_average_cost == D("0.12"));

  state = engine.AdjustInventory("eggs", InventoryAdjustment{std::nullopt, D("50")});
  assert(state.current_quantity == D("75"));
  assert(state.weighted_average_cost == D("0.12"));

  state = engine.AdjustInventory("eggs", InventoryAdjustment{std::nullopt, D("0")});
  assert(state.current_quantity.IsZero());
  assert(state.weighted_average_cost == D("0.12"));
}

void TestValidation() {
  auto                  repo = RepoWithItem("eggs", CostingMethod::kWeightedAverage);
  WeightedAverageEngine engine(repo);

  assert(ThrowsValidation([&] { (void)engine.RecordAcquisition("eggs", D("0"), D("1")); }));
  assert(ThrowsValidation([&] { (void)engine.RecordAcquisition("eggs", D("1"), D("-0.01")); }));
  assert(ThrowsValidation([&] { (void)engine.AdjustInventory("eggs", InventoryAdjustment{}); }));
  assert(ThrowsValidation([&] { (void)engine.AdjustInventory("eggs", InventoryAdjustment{D("1"), D("50")}); }));
  assert(ThrowsValidation([&] { (void)engine.AdjustInventory("eggs", InventoryAdjustment{std::nullopt, D("100.5")}); }));
  assert(ThrowsValidation([&] { (void)engine.AdjustInventory("eggs", InventoryAdjustment{D("-3"), std::nullopt}); }));

  // Nothing was written by the failed calls.
  auto state = engine.GetState("eggs");
  assert(state.current_quantity.IsZero());
  assert(state.weighted_average_cost.IsZero());

  bool missing = false;
  try {
    (void)engine.RecordAcquisition("ghost", D("1"), D("1"));
  } catch (const lotcost::util::ItemNotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestFifoItemsAreRejected() {
  auto                  repo = RepoWithItem("flour", CostingMethod::kFifo);
  WeightedAverageEngine engine(repo);
  assert(ThrowsValidation([&] { (void)engine.RecordAcquisition("flour", D("1"), D("1")); }));
  assert(ThrowsValidation([&] { (void)engine.GetState("flour"); }));
}

void TestPurchaseFailureLeavesStateUntouched() {
  auto                  repo = RepoWithItem("eggs", CostingMethod::kWeightedAverage);
  WeightedAverageEngine engine(repo);
  (void)engine.RecordAcquisition("eggs", D("200"), D("0.12"), PurchaseInfo{Date::Parse("2025-03-01"), "farm"});

  WeightedAverageEngine failing(std::make_shared<FailingRepository>(repo, FailingWrite::kInsertPurchase));
  bool                  threw = false;
  try {
    (void)failing.RecordAcquisition("eggs", D("100"), D("0.15"), PurchaseInfo{Date::Parse("2025-03-02"), "farm"});
  } catch (const lotcost::util::TransactionFailure& e) {
    threw = std::string(e.what()).find("disk full") != std::string::npos;
  }
  assert(threw);

  // The upsert ran before the purchase row failed; neither survives.
  auto state = engine.GetState("eggs");
  assert(state.current_quantity == D("200"));
  assert(state.weighted_average_cost == D("0.12"));

  auto tx = repo->Begin(lotcost::db::TxMode::kRead);
  assert(repo->ListPurchases(*tx, "eggs").size() == 1);
}

} // namespace

int main() {
  TestFormulaRoundsToFourPlaces();
  TestAcquisitionsReaverage();
  TestAdjustmentKeepsCostBasis();
  TestValidation();
  TestFifoItemsAreRejected();
  TestPurchaseFailureLeavesStateUntouched();

  std::cout << "lotcost_unit_weighted_average_engine: pass\n";
  return 0;
}
