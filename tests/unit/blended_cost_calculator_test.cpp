#include "internal/core/blended_cost_calculator.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/pricing/price_history.hpp"
#include "internal/units/unit_converter.hpp"
#include "internal/util/errors.hpp"

namespace {

using lotcost::core::BlendedCostCalculator;
using lotcost::core::FifoEngine;
using lotcost::core::PricingSource;
using lotcost::core::Requirement;
using lotcost::db::Repository;
using lotcost::db::RowLock;
using lotcost::db::memory::MemoryRepository;
using lotcost::db::model::CostingMethod;
using lotcost::db::model::ItemRecord;
using lotcost::db::model::LotRecord;
using lotcost::units::StandardUnitConverter;
using lotcost::util::Date;
using lotcost::util::Decimal;

Decimal D(const char* text) {
  return Decimal::Parse(text);
}

// Fixed fallback prices per item.
class FixedPrices final : public PricingSource {
 public:
  explicit FixedPrices(std::map<std::string, Decimal> prices) : prices_(std::move(prices)) {
  }

  std::optional<Decimal> PriceFor(lotcost::db::Transaction&, const ItemRecord& item) override {
    auto it = prices_.find(item.id);
    if (it == prices_.end()) return std::nullopt;
    return it->second;
  }

 private:
  std::map<std::string, Decimal> prices_;
};

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

void SeedLot(Repository& repo, const std::string& item_id, const char* date, const char* qty, const char* cost) {
  auto      tx = repo.Begin();
  LotRecord lot;
  lot.item_id            = item_id;
  lot.acquisition_date   = Date::Parse(date);
  lot.quantity_original  = D(qty);
  lot.quantity_remaining = D(qty);
  lot.unit_cost          = D(cost);
  assert(repo.InsertLot(*tx, lot));
  tx->Commit();
}

struct Fixture {
  std::shared_ptr<MemoryRepository>      repo      = std::make_shared<MemoryRepository>();
  std::shared_ptr<StandardUnitConverter> converter = std::make_shared<StandardUnitConverter>();
  std::shared_ptr<FifoEngine>            fifo      = std::make_shared<FifoEngine>(repo, converter);

  BlendedCostCalculator Calculator(std::map<std::string, Decimal> prices) {
    return BlendedCostCalculator(repo, fifo, converter, std::make_shared<FixedPrices>(std::move(prices)));
  }
};

void TestShortfallPricedFromFallback() {
  Fixture f;
  SeedItem(*f.repo, "vanilla", "each");
  SeedLot(*f.repo, "vanilla", "2025-01-01", "2", "0.10");

  auto calculator = f.Calculator({{"vanilla", D("0.15")}});
  auto estimate   = calculator.EstimateBreakdown({Requirement{"vanilla", D("3"), "each"}});

  assert(estimate.total_cost == D("0.35"));
  assert(estimate.lines.size() == 1);
  assert(estimate.lines[0].on_hand_cost == D("0.2"));
  assert(estimate.lines[0].fallback_cost == D("0.15"));
  assert(estimate.lines[0].shortfall_base == D("1"));
  assert(estimate.lines[0].fallback_unit_price == D("0.15"));

  // Read-only: the lot is still full.
  auto tx   = f.repo->Begin();
  auto lots = f.repo->ListLotsForItem(*tx, "vanilla", Decimal{}, RowLock::kNone);
  assert(lots[0].quantity_remaining == D("2"));
}

void TestSatisfiedRequirementIgnoresFallback() {
  Fixture f;
  SeedItem(*f.repo, "sugar", "g");
  SeedLot(*f.repo, "sugar", "2025-01-01", "500", "0.002");
  SeedLot(*f.repo, "sugar", "2025-02-01", "500", "0.004");

  // No price for sugar: fine as long as nothing is short.
  auto calculator = f.Calculator({});
  assert(calculator.EstimateCost({Requirement{"sugar", D("0.75"), "kg"}}) == D("2"));
}

void TestSumsAcrossRequirementsAndEmptyIsZero() {
  Fixture f;
  SeedItem(*f.repo, "flour", "g");
  SeedItem(*f.repo, "yeast", "g");
  SeedLot(*f.repo, "flour", "2025-01-01", "1000", "0.001");

  auto calculator = f.Calculator({{"yeast", D("0.05")}});
  assert(calculator.EstimateCost({}).IsZero());

  auto estimate = calculator.EstimateBreakdown(
      {Requirement{"flour", D("500"), "g"}, Requirement{"yeast", D("7"), "g"}});
  // 500 * 0.001 + 7 * 0.05
  assert(estimate.total_cost == D("0.85"));
  assert(estimate.lines[1].on_hand_cost.IsZero());
}

void TestMissingPriceFailsNamingItem() {
  Fixture f;
  SeedItem(*f.repo, "saffron", "g");
  SeedLot(*f.repo, "saffron", "2025-01-01", "1", "8");

  auto calculator = f.Calculator({});
  bool threw      = false;
  try {
    (void)calculator.EstimateCost({Requirement{"saffron", D("2"), "g"}});
  } catch (const lotcost::util::NoPricingHistory& e) {
    threw = e.item_id() == "saffron";
  }
  assert(threw);
}

void TestWeightedAverageItemsUseRunningAverage() {
  Fixture f;
  SeedItem(*f.repo, "eggs", "each", CostingMethod::kWeightedAverage);
  {
    auto tx = f.repo->Begin();
    assert(f.repo->UpsertWeightedAverage(*tx, {"eggs", D("10"), D("0.25"), 0}));
    tx->Commit();
  }

  auto calculator = f.Calculator({{"eggs", D("0.30")}});
  auto estimate   = calculator.EstimateBreakdown({Requirement{"eggs", D("1"), "dozen"}});
  // 10 * 0.25 on hand, 2 * 0.30 short.
  assert(estimate.lines[0].covered_base == D("10"));
  assert(estimate.lines[0].shortfall_base == D("2"));
  assert(estimate.total_cost == D("3.1"));
}

void TestHistoryPricingSource() {
  auto repo      = std::make_shared<MemoryRepository>();
  auto converter = std::make_shared<StandardUnitConverter>();
  auto fifo      = std::make_shared<FifoEngine>(repo, converter);
  auto prices    = std::make_shared<lotcost::pricing::PriceHistory>(repo);
  SeedItem(*repo, "cocoa", "g");
  SeedLot(*repo, "cocoa", "2025-01-01", "100", "0.02");
  {
    auto                               tx = repo->Begin();
    lotcost::db::model::PurchaseRecord purchase;
    purchase.item_id       = "cocoa";
    purchase.purchase_date = Date::Parse("2025-03-01");
    purchase.unit_price    = D("0.03");
    assert(repo->InsertPurchase(*tx, purchase));
    tx->Commit();
  }

  BlendedCostCalculator calculator(repo, fifo, converter, prices);
  // 100 * 0.02 + 50 * 0.03
  assert(calculator.EstimateCost({Requirement{"cocoa", D("150"), "g"}}) == D("3.5"));
}

} // namespace

int main() {
  TestShortfallPricedFromFallback();
  TestSatisfiedRequirementIgnoresFallback();
  TestSumsAcrossRequirementsAndEmptyIsZero();
  TestMissingPriceFailsNamingItem();
  TestWeightedAverageItemsUseRunningAverage();
  TestHistoryPricingSource();

  std::cout << "lotcost_unit_blended_cost_calculator: pass\n";
  return 0;
}
