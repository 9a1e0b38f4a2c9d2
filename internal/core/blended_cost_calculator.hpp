#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/fifo_engine.hpp"
#include "internal/core/pricing_source.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/units/unit_converter.hpp"
#include "internal/util/decimal.hpp"

namespace lotcost::core {

struct RequirementCost {
  std::string   item_id;
  util::Decimal on_hand_cost;  // FIFO (or weighted-average) cost of the covered part
  util::Decimal fallback_cost; // shortfall priced from history
  util::Decimal total_cost;

  util::Decimal                covered_base;
  util::Decimal                shortfall_base;
  std::optional<util::Decimal> fallback_unit_price; // set only when a shortfall was priced
};

struct CostEstimate {
  util::Decimal                total_cost;
  std::vector<RequirementCost> lines; // in requirement order
};

/*
  Blended cost of a list of requirements.

  Per requirement: the FIFO preview cost of what is on hand, plus the
  shortfall priced by the PricingSource. Weighted-average items cost their
  on-hand part at the running average instead.

  Read-only: everything runs in one transaction that is rolled back.
  Throws util::NoPricingHistory when a shortfall cannot be priced; an
  empty requirement list costs zero.
*/
class BlendedCostCalculator {
 public:
  BlendedCostCalculator(std::shared_ptr<db::Repository> repository, std::shared_ptr<FifoEngine> fifo,
                        std::shared_ptr<const units::UnitConverter> converter, std::shared_ptr<PricingSource> pricing);

  util::Decimal EstimateCost(const std::vector<Requirement>& requirements);

  CostEstimate EstimateBreakdown(const std::vector<Requirement>& requirements);

 private:
  RequirementCost Estimate(db::Transaction& tx, const Requirement& requirement);

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<FifoEngine>                 fifo_;
  std::shared_ptr<const units::UnitConverter> converter_;
  std::shared_ptr<PricingSource>              pricing_;
};

} // namespace lotcost::core
