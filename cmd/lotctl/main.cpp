#include <cstdint>
#include <iostream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/model/adjustment_record.hpp"
#include "internal/db/model/item_record.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pricing/price_history.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

using lotcost::util::Date;
using lotcost::util::Decimal;

namespace {

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void Usage() {
  std::cout << "Usage: lotctl [--config <config.yaml>] <command> [args]\n"
            << "  item-add <id> <name> <base_unit> [costing=fifo|weighted_average]\n"
            << "           [domain=ingredient|inventory_item|material] [density=<g/ml>] [supplier=<id>]\n"
            << "  items\n"
            << "  lot-add <item_id> <quantity> <unit> <unit_cost> <YYYY-MM-DD>\n"
            << "          [expires=<YYYY-MM-DD>] [location=<text>] [supplier=<id>] [notes=<text>]\n"
            << "  lots <item_id>\n"
            << "  consume <item_id> <quantity> <unit> [--commit] [context=<id>]\n"
            << "  ledger <context_id>\n"
            << "  adjust <lot_id> <add|subtract|set|percentage> <value> <reason> [notes=<text>] [by=<actor>]\n"
            << "  history <lot_id>\n"
            << "  wavg-acquire <item_id> <quantity> <unit_cost> [supplier=<id>] [date=<YYYY-MM-DD>]\n"
            << "  wavg-adjust <item_id> (quantity=<q> | percent=<0..100>)\n"
            << "  wavg-state <item_id>\n"
            << "  estimate <item_id>:<quantity>:<unit> ...\n"
            << "  check <item_id>:<quantity>:<unit> ...\n"
            << "  value [item_id]\n";
}

Decimal DecimalArg(const std::string& text, const char* what) {
  auto parsed = Decimal::TryParse(text);
  if (!parsed) throw UsageError(std::string("invalid ") + what + ": '" + text + "'");
  return *parsed;
}

Date DateArg(const std::string& text, const char* what) {
  auto parsed = Date::TryParse(text);
  if (!parsed) throw UsageError(std::string("invalid ") + what + " (expected YYYY-MM-DD): '" + text + "'");
  return *parsed;
}

uint64_t LotIdArg(const std::string& text) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw UsageError("invalid lot id: '" + text + "'");
  }
  try {
    return std::stoull(text);
  } catch (const std::out_of_range&) {
    throw UsageError("invalid lot id: '" + text + "'");
  }
}

/*
  Positional arguments followed by key=value options and --flags.
*/
struct Args {
  std::vector<std::string>           positional;
  std::map<std::string, std::string> options;
  bool                               commit = false;

  const std::string& At(std::size_t i) const {
    if (i >= positional.size()) throw UsageError("missing argument");
    return positional[i];
  }

  std::optional<std::string> Option(const std::string& key) const {
    auto it = options.find(key);
    if (it == options.end()) return std::nullopt;
    return it->second;
  }
};

Args SplitArgs(const std::vector<std::string>& raw) {
  Args args;
  for (const auto& arg : raw) {
    if (arg == "--commit") {
      args.commit = true;
      continue;
    }
    const auto eq = arg.find('=');
    if (eq != std::string::npos && eq > 0 && args.positional.size() > 0 && arg.find(':') == std::string::npos) {
      args.options[arg.substr(0, eq)] = arg.substr(eq + 1);
    } else {
      args.positional.push_back(arg);
    }
  }
  return args;
}

// "flour:2.5:kg"
lotcost::core::Requirement RequirementArg(const std::string& text) {
  const auto first = text.find(':');
  const auto last  = text.rfind(':');
  if (first == std::string::npos || first == last) {
    throw UsageError("invalid requirement (expected item:quantity:unit): '" + text + "'");
  }
  lotcost::core::Requirement req;
  req.item_id         = text.substr(0, first);
  req.quantity_needed = DecimalArg(text.substr(first + 1, last - first - 1), "requirement quantity");
  req.unit            = text.substr(last + 1);
  return req;
}

std::vector<lotcost::core::Requirement> RequirementArgs(const Args& args) {
  if (args.positional.empty()) throw UsageError("at least one requirement is needed");
  std::vector<lotcost::core::Requirement> out;
  for (const auto& text : args.positional) out.push_back(RequirementArg(text));
  return out;
}

void PrintItem(const lotcost::db::model::ItemRecord& item) {
  std::cout << "item=" << item.id << " name=\"" << item.name << "\" domain=" << ToString(item.domain)
            << " base_unit=" << item.base_unit << " costing=" << ToString(item.costing_method);
  if (item.density_g_per_ml) std::cout << " density=" << *item.density_g_per_ml;
  if (item.preferred_supplier_id) std::cout << " supplier=" << *item.preferred_supplier_id;
  std::cout << "\n";
}

void PrintLot(const lotcost::db::model::LotRecord& lot) {
  std::cout << "lot=" << lot.id << " item=" << lot.item_id << " acquired=" << lot.acquisition_date.ToString()
            << " original=" << lot.quantity_original << " remaining=" << lot.quantity_remaining
            << " unit_cost=" << lot.unit_cost;
  if (lot.expiration_date) std::cout << " expires=" << lot.expiration_date->ToString();
  if (lot.location) std::cout << " location=" << *lot.location;
  std::cout << "\n";
}

void PrintState(const lotcost::core::WeightedAverageState& state) {
  std::cout << "item=" << state.item_id << " quantity=" << state.current_quantity
            << " average_cost=" << state.weighted_average_cost.ToString(lotcost::core::WeightedAverageEngine::kCostPlaces)
            << "\n";
}

int Run(lotcost::service::CostingService& svc, const std::string& cmd, const Args& args) {
  using namespace lotcost;

  // ------------------------------------------------------------

  if (cmd == "item-add") {
    db::model::ItemRecord item;
    item.id        = args.At(0);
    item.name      = args.At(1);
    item.base_unit = args.At(2);
    if (auto costing = args.Option("costing")) {
      auto parsed = db::model::ParseCostingMethod(*costing);
      if (!parsed) throw UsageError("unknown costing method: " + *costing);
      item.costing_method = *parsed;
    }
    if (auto domain = args.Option("domain")) {
      auto parsed = db::model::ParseItemDomain(*domain);
      if (!parsed) throw UsageError("unknown item domain: " + *domain);
      item.domain = *parsed;
    }
    if (auto density = args.Option("density")) item.density_g_per_ml = DecimalArg(*density, "density");
    if (auto supplier = args.Option("supplier")) item.preferred_supplier_id = *supplier;

    PrintItem(svc.RegisterItem(item));
    return 0;
  }

  if (cmd == "items") {
    for (const auto& item : svc.ListItems()) PrintItem(item);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "lot-add") {
    core::AcquisitionRequest req;
    req.item_id          = args.At(0);
    req.quantity         = DecimalArg(args.At(1), "quantity");
    req.unit             = args.At(2);
    req.unit_cost        = DecimalArg(args.At(3), "unit cost");
    req.acquisition_date = DateArg(args.At(4), "acquisition date");
    if (auto expires = args.Option("expires")) req.expiration_date = DateArg(*expires, "expiration date");
    if (auto location = args.Option("location")) req.location = *location;
    req.supplier_id = args.Option("supplier").value_or("");
    req.notes       = args.Option("notes").value_or("");

    auto result = svc.RecordLot(req);
    PrintLot(result.lot);
    if (result.price_change.level != pricing::PriceAlertLevel::kNone) {
      std::cout << "price_alert=" << ToString(result.price_change.level) << " " << result.price_change.message << "\n";
    }
    return 0;
  }

  if (cmd == "lots") {
    for (const auto& lot : svc.Lots(args.At(0))) PrintLot(lot);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "consume") {
    core::ConsumptionRequest req;
    req.item_id         = args.At(0);
    req.quantity_needed = DecimalArg(args.At(1), "quantity");
    req.unit            = args.At(2);
    req.mode            = args.commit ? core::ConsumptionMode::kCommit : core::ConsumptionMode::kPreview;
    req.context_id      = args.Option("context").value_or("");

    auto result = svc.Consume(req);
    for (const auto& line : result.breakdown) {
      std::cout << "lot=" << line.lot_id << " acquired=" << line.acquisition_date.ToString()
                << " consumed=" << line.quantity_consumed << " unit_cost=" << line.unit_cost
                << " remaining=" << line.remaining_in_lot << "\n";
    }
    std::cout << "mode=" << ToString(req.mode) << " consumed=" << result.consumed_quantity << " " << result.consumed_unit
              << " shortfall=" << result.shortfall << " " << result.shortfall_unit
              << " satisfied=" << (result.satisfied ? "true" : "false") << " total_cost=" << result.total_cost << "\n";
    return 0;
  }

  if (cmd == "ledger") {
    for (const auto& row : svc.ConsumptionsForContext(args.At(0))) {
      std::cout << "lot=" << row.lot_id << " item=" << row.item_id << " quantity=" << row.quantity
                << " unit_cost=" << row.unit_cost << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "adjust") {
    core::AdjustmentRequest req;
    req.lot_id = LotIdArg(args.At(0));
    auto type  = db::model::ParseAdjustmentType(args.At(1));
    if (!type) throw UsageError("unknown adjustment type: " + args.At(1));
    req.type  = *type;
    req.value = DecimalArg(args.At(2), "adjustment value");
    auto reason = db::model::ParseReasonCode(args.At(3));
    if (!reason) throw UsageError("unknown reason code: " + args.At(3));
    req.reason     = *reason;
    req.notes      = args.Option("notes").value_or("");
    req.created_by = args.Option("by");

    auto record = svc.Adjust(req);
    std::cout << "adjustment=" << record.id << " lot=" << record.lot_id << " before=" << record.quantity_before
              << " after=" << record.quantity_after << " cost_impact=" << record.cost_impact << "\n";
    return 0;
  }

  if (cmd == "history") {
    for (const auto& record : svc.History(LotIdArg(args.At(0)))) {
      std::cout << util::FormatTimestamp(util::FromUnixMillis(record.created_at_ms)) << " "
                << ToString(record.adjustment_type) << " " << record.value_applied << " ("
                << ToString(record.reason_code) << ") by " << record.created_by << ": " << record.quantity_before
                << " -> " << record.quantity_after;
      if (!record.notes.empty()) std::cout << "; " << record.notes;
      std::cout << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "wavg-acquire") {
    core::PurchaseInfo purchase;
    purchase.supplier_id = args.Option("supplier").value_or("");
    if (auto date = args.Option("date")) purchase.purchase_date = DateArg(*date, "purchase date");

    PrintState(svc.RecordBulkAcquisition(args.At(0), DecimalArg(args.At(1), "quantity"),
                                         DecimalArg(args.At(2), "unit cost"), purchase));
    return 0;
  }

  if (cmd == "wavg-adjust") {
    core::InventoryAdjustment adjustment;
    if (auto quantity = args.Option("quantity")) adjustment.absolute_quantity = DecimalArg(*quantity, "quantity");
    if (auto percent = args.Option("percent")) adjustment.percentage_of_current = DecimalArg(*percent, "percent");

    PrintState(svc.AdjustBulkInventory(args.At(0), adjustment));
    return 0;
  }

  if (cmd == "wavg-state") {
    PrintState(svc.BulkState(args.At(0)));
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "estimate") {
    auto estimate = svc.EstimateCost(RequirementArgs(args));
    for (const auto& line : estimate.lines) {
      std::cout << "item=" << line.item_id << " on_hand_cost=" << line.on_hand_cost
                << " fallback_cost=" << line.fallback_cost << " total=" << line.total_cost << "\n";
    }
    std::cout << "total_cost=" << estimate.total_cost << "\n";
    return 0;
  }

  if (cmd == "check") {
    auto report = svc.CheckAvailability(RequirementArgs(args));
    for (const auto& missing : report.missing) {
      std::cout << "item=" << missing.item_id << " needed=" << missing.needed << " available=" << missing.available
                << " " << missing.unit << "\n";
    }
    std::cout << "can_fulfill=" << (report.can_fulfill ? "true" : "false") << "\n";
    return 0;
  }

  if (cmd == "value") {
    std::optional<std::string> item_id;
    if (!args.positional.empty()) item_id = args.positional.front();
    std::cout << "inventory_value=" << svc.InventoryValue(item_id) << "\n";
    return 0;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  std::vector<std::string> raw(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (raw.size() >= 2 && raw[0] == "--config") {
    config_path = raw[1];
    raw.erase(raw.begin(), raw.begin() + 2);
  }
  if (raw.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = raw.front();
  raw.erase(raw.begin());

  const Args args = SplitArgs(raw);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path ? lotcost::config::ConfigLoader::LoadFromYaml(*config_path)
                              : lotcost::config::ConfigLoader::Defaults();
    lotcost::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engines (dependency graph)
    // ------------------------------------------------------------
    auto deps = lotcost::factory::BuildRuntime(config);
    const int rc = Run(*deps.service, cmd, args);

    lotcost::observability::ShutdownLogging();
    return rc;
  } catch (const UsageError& e) {
    std::cerr << e.what() << "\n";
    Usage();
    lotcost::observability::ShutdownLogging();
    return 1;
  } catch (const std::exception& e) {
    LOTCOST_LOG_ERROR("command failed", {lotcost::observability::StringField("command", cmd),
                                         lotcost::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    lotcost::observability::ShutdownLogging();
    return 2;
  }
}
