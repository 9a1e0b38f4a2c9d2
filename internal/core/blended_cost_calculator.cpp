#include "internal/core/blended_cost_calculator.hpp"

#include "internal/core/engine_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lotcost::core {

using util::Decimal;

BlendedCostCalculator::BlendedCostCalculator(std::shared_ptr<db::Repository> repository,
                                             std::shared_ptr<FifoEngine> fifo,
                                             std::shared_ptr<const units::UnitConverter> converter,
                                             std::shared_ptr<PricingSource> pricing)
    : repository_(std::move(repository)),
      fifo_(std::move(fifo)),
      converter_(std::move(converter)),
      pricing_(std::move(pricing)) {
}

Decimal BlendedCostCalculator::EstimateCost(const std::vector<Requirement>& requirements) {
  return EstimateBreakdown(requirements).total_cost;
}

CostEstimate BlendedCostCalculator::EstimateBreakdown(const std::vector<Requirement>& requirements) {
  CostEstimate estimate;
  if (requirements.empty()) {
    return estimate;
  }

  return GuardStorage("estimate cost", [&] {
    auto tx = repository_->Begin(db::TxMode::kRead);
    for (const auto& requirement : requirements) {
      auto line = Estimate(*tx, requirement);
      estimate.total_cost += line.total_cost;
      estimate.lines.push_back(std::move(line));
    }
    tx->Rollback();

    LOTCOST_LOG_DEBUG("blended cost estimated",
                      {observability::IntField("requirements", static_cast<int64_t>(requirements.size())),
                       observability::DecimalField("total_cost", estimate.total_cost)});
    return estimate;
  });
}

RequirementCost BlendedCostCalculator::Estimate(db::Transaction& tx, const Requirement& requirement) {
  const auto item = RequireItem(*repository_, tx, requirement.item_id);

  RequirementCost line;
  line.item_id = item.id;

  if (item.costing_method == db::model::CostingMethod::kFifo) {
    ConsumptionRequest request;
    request.item_id         = item.id;
    request.quantity_needed = requirement.quantity_needed;
    request.unit            = requirement.unit;
    request.mode            = ConsumptionMode::kPreview;

    const auto preview  = fifo_->Consume(tx, request);
    line.on_hand_cost   = preview.total_cost;
    line.covered_base   = preview.consumed_base;
    line.shortfall_base = preview.shortfall_base;
  } else {
    if (!requirement.quantity_needed.IsPositive()) {
      throw util::ValidationError("estimate " + item.id + ": quantity must be positive, got " +
                                  requirement.quantity_needed.ToString());
    }
    const Decimal needed  = ToBaseUnits(*converter_, item, requirement.quantity_needed, requirement.unit);
    const auto    state   = repository_->GetWeightedAverage(tx, item.id, db::RowLock::kNone);
    const Decimal on_hand = state ? state->current_quantity : Decimal{};
    line.covered_base   = util::Min(needed, on_hand);
    line.shortfall_base = needed - line.covered_base;
    line.on_hand_cost   = state ? line.covered_base * state->weighted_average_cost : Decimal{};
  }

  if (line.shortfall_base.IsPositive()) {
    const auto price = pricing_->PriceFor(tx, item);
    if (!price) {
      throw util::NoPricingHistory(item.id);
    }
    line.fallback_unit_price = *price;
    line.fallback_cost       = line.shortfall_base * *price;
  }

  line.total_cost = line.on_hand_cost + line.fallback_cost;
  return line;
}

} // namespace lotcost::core
