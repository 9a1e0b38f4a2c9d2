#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"

namespace {

using lotcost::config::ConfigLoader;
using lotcost::util::Decimal;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "lotcost_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

template <typename Fn>
bool ThrowsInvalidArgument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestFullFileLoads() {
  const auto yaml_path = WriteYaml("full", R"(logging:
  level: debug
database:
  sqlite:
    path: "/var/lib/lotcost/ledger.db"
    busy_timeout_ms: 2500
costing:
  dust_threshold: 0.10
  default_actor: "bakery-front"
pricing:
  strategy: historical_average
  average_window_days: 30
  warning_change_percent: 15
  critical_change_percent: "35.5"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/lotcost/ledger.db");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  // Unquoted decimals keep their literal text.
  assert(config.costing().dust_threshold() == "0.10");
  assert(config.costing().default_actor() == "bakery-front");
  assert(config.pricing().strategy() == "historical_average");
  assert(config.pricing().average_window_days() == 30);
  assert(config.pricing().warning_change_percent() == "15");
  assert(config.pricing().critical_change_percent() == "35.5");

  const auto pricing = lotcost::factory::PricingOptionsFrom(config);
  assert(pricing.strategy == lotcost::pricing::PricingStrategy::kHistoricalAverage);
  assert(pricing.average_window_days == 30);
  assert(pricing.warning_change_percent == Decimal::FromInt(15));
  assert(pricing.critical_change_percent == Decimal::Parse("35.5"));
  assert(lotcost::factory::FifoOptionsFrom(config).dust_threshold == Decimal::Parse("0.1"));
  assert(lotcost::factory::AdjustmentOptionsFrom(config).default_actor == "bakery-front");
}

void TestEmptyMemorySectionSelectsBackend() {
  auto config = ConfigLoader::LoadFromYamlString("database:\n  memory:\n");
  assert(config.database().has_memory());
  assert(!config.database().has_sqlite());

  // Unset sections fall back to the engine defaults.
  assert(lotcost::factory::FifoOptionsFrom(config).dust_threshold == Decimal::Parse("0.001"));
  assert(lotcost::factory::AdjustmentOptionsFrom(config).default_actor == "desktop-user");
  const auto pricing = lotcost::factory::PricingOptionsFrom(config);
  assert(pricing.strategy == lotcost::pricing::PricingStrategy::kMostRecent);
  assert(pricing.average_window_days == 60);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash", R"(database:
  sqlite:
    path: "C:\\lotcost\\\"quoted\"\\db.sqlite"
costing:
  default_actor: "true"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\lotcost\\\"quoted\"\\db.sqlite");
  // Quoted, so a string and not a bool.
  assert(config.costing().default_actor() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field", R"(costing:
  dust_threshold: "0.001"
  fifo_order: newest_first
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/lotcost/config.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestDefaults() {
  auto config = ConfigLoader::Defaults();
  assert(config.database().has_memory());
  assert(config.costing().dust_threshold() == "0.001");
  assert(config.pricing().strategy() == "most_recent");

  const auto pricing = lotcost::factory::PricingOptionsFrom(config);
  assert(pricing.warning_change_percent == Decimal::FromInt(20));
  assert(pricing.critical_change_percent == Decimal::FromInt(40));
}

void TestBadOptionValues() {
  auto config = ConfigLoader::Defaults();
  config.mutable_costing()->set_dust_threshold("a pinch");
  assert(ThrowsInvalidArgument([&] { (void)lotcost::factory::FifoOptionsFrom(config); }));
  config.mutable_costing()->set_dust_threshold("-0.5");
  assert(ThrowsInvalidArgument([&] { (void)lotcost::factory::FifoOptionsFrom(config); }));

  config = ConfigLoader::Defaults();
  config.mutable_pricing()->set_strategy("cheapest");
  assert(ThrowsInvalidArgument([&] { (void)lotcost::factory::PricingOptionsFrom(config); }));

  config = ConfigLoader::Defaults();
  config.mutable_pricing()->set_warning_change_percent("50");
  assert(ThrowsInvalidArgument([&] { (void)lotcost::factory::PricingOptionsFrom(config); }));

  config = ConfigLoader::Defaults();
  config.mutable_pricing()->set_warning_change_percent("0");
  assert(ThrowsInvalidArgument([&] { (void)lotcost::factory::PricingOptionsFrom(config); }));

  // Bad settings fail the whole graph before any engine is built.
  config = ConfigLoader::Defaults();
  config.mutable_pricing()->set_critical_change_percent("ten");
  assert(ThrowsInvalidArgument([&] { (void)lotcost::factory::BuildRuntime(config); }));
}

} // namespace

int main() {
  TestFullFileLoads();
  TestEmptyMemorySectionSelectsBackend();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();
  TestDefaults();
  TestBadOptionValues();

  std::cout << "lotcost_unit_config_loader: pass\n";
  return 0;
}
