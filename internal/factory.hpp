#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/core/adjustment_engine.hpp"
#include "internal/core/blended_cost_calculator.hpp"
#include "internal/core/fifo_engine.hpp"
#include "internal/core/item_catalog.hpp"
#include "internal/core/lot_ledger.hpp"
#include "internal/core/weighted_average_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/pricing/price_history.hpp"
#include "internal/service/costing_service.hpp"
#include "internal/units/unit_converter.hpp"

namespace lotcost::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects used by the CLI and tests.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<const units::UnitConverter> converter;

  std::shared_ptr<core::ItemCatalog>           catalog;
  std::shared_ptr<core::FifoEngine>            fifo;
  std::shared_ptr<core::WeightedAverageEngine> weighted_average;
  std::shared_ptr<core::AdjustmentEngine>      adjustments;
  std::shared_ptr<pricing::PriceHistory>       prices;
  std::shared_ptr<core::BlendedCostCalculator> blended;
  std::shared_ptr<core::LotLedger>             ledger;

  std::shared_ptr<service::CostingService> service;
};

// Options read from the config sections. Malformed decimals, an unknown
// pricing strategy or out-of-range thresholds throw std::invalid_argument.
core::FifoOptions       FifoOptionsFrom(const runtime::config::RuntimeConfig& config);
core::AdjustmentOptions AdjustmentOptionsFrom(const runtime::config::RuntimeConfig& config);
pricing::PricingOptions PricingOptionsFrom(const runtime::config::RuntimeConfig& config);

/*
  Opens the configured backend and bootstraps its schema.

  Throws std::runtime_error when the backend was not enabled at build time.
*/
std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Constructs the entire engine graph based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config);

// Same graph over an existing repository (tests, parity checks).
RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::Repository>       repository);

} // namespace lotcost::factory
