#pragma once

#include <memory>

namespace lotcost::core {
class ItemCatalog;
class FifoEngine;
class WeightedAverageEngine;
class AdjustmentEngine;
class BlendedCostCalculator;
class LotLedger;
} // namespace lotcost::core

namespace lotcost::service {

/*
  Dependency container handed to the costing service.
*/
struct ServiceContext {
  std::shared_ptr<lotcost::core::ItemCatalog>           catalog;
  std::shared_ptr<lotcost::core::FifoEngine>            fifo;
  std::shared_ptr<lotcost::core::WeightedAverageEngine> weighted_average;
  std::shared_ptr<lotcost::core::AdjustmentEngine>      adjustments;
  std::shared_ptr<lotcost::core::BlendedCostCalculator> blended;
  std::shared_ptr<lotcost::core::LotLedger>             ledger;
};

} // namespace lotcost::service
