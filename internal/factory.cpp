#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/decimal.hpp"
#if LOTCOST_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if LOTCOST_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace lotcost::factory {

namespace {

util::Decimal DecimalSetting(const std::string& text, const util::Decimal& fallback, const char* name) {
  if (text.empty()) {
    return fallback;
  }
  auto parsed = util::Decimal::TryParse(text);
  if (!parsed) {
    throw std::invalid_argument(std::string("config ") + name + ": not a decimal: '" + text + "'");
  }
  return *parsed;
}

#if LOTCOST_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(db::sqlite::SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

 private:
  db::sqlite::SqliteDB& db_;
};
#endif

#if LOTCOST_DB_POSTGRES
// Whole schema in one transaction; nothing is applied if a statement fails.
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : tx_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

  void Commit() {
    tx_.commit();
  }

 private:
  pqxx::work tx_;
};
#endif

} // namespace

core::FifoOptions FifoOptionsFrom(const runtime::config::RuntimeConfig& config) {
  core::FifoOptions options;
  options.dust_threshold = DecimalSetting(config.costing().dust_threshold(), options.dust_threshold, "costing.dust_threshold");
  if (options.dust_threshold.IsNegative()) {
    throw std::invalid_argument("config costing.dust_threshold must be >= 0");
  }
  return options;
}

core::AdjustmentOptions AdjustmentOptionsFrom(const runtime::config::RuntimeConfig& config) {
  core::AdjustmentOptions options;
  if (!config.costing().default_actor().empty()) {
    options.default_actor = config.costing().default_actor();
  }
  return options;
}

pricing::PricingOptions PricingOptionsFrom(const runtime::config::RuntimeConfig& config) {
  const auto&             section = config.pricing();
  pricing::PricingOptions options;

  auto strategy = pricing::ParsePricingStrategy(section.strategy());
  if (!strategy) {
    throw std::invalid_argument("config pricing.strategy: unknown strategy '" + section.strategy() + "'");
  }
  options.strategy = *strategy;

  if (section.average_window_days() > 0) {
    options.average_window_days = static_cast<int>(section.average_window_days());
  }
  options.warning_change_percent =
      DecimalSetting(section.warning_change_percent(), options.warning_change_percent, "pricing.warning_change_percent");
  options.critical_change_percent = DecimalSetting(section.critical_change_percent(), options.critical_change_percent,
                                                   "pricing.critical_change_percent");

  if (!options.warning_change_percent.IsPositive() || options.critical_change_percent < options.warning_change_percent) {
    throw std::invalid_argument("config pricing: need 0 < warning_change_percent <= critical_change_percent");
  }
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if LOTCOST_DB_SQLITE
    const auto& section    = database.sqlite();
    const int   timeout_ms = section.busy_timeout_ms() > 0 ? static_cast<int>(section.busy_timeout_ms()) : 5000;
    auto        sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(section.path(), timeout_ms);

    SqliteMigrationExecutor executor(*sqlite_db);
    db::sql::RunMigrations(executor, db::sql::SqliteSchema());

    LOTCOST_LOG_INFO("storage ready", {observability::StringField("backend", "sqlite"),
                                       observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if LOTCOST_DB_POSTGRES
    const auto& section = database.postgres();
    const auto  max     = section.max_connections() > 0 ? static_cast<std::size_t>(section.max_connections()) : 16;
    auto        pool    = std::make_shared<db::postgres::PgPool>(section.connection_uri(), max);
    {
      auto                conn = pool->Acquire();
      PgMigrationExecutor executor(*conn);
      db::sql::RunMigrations(executor, db::sql::PostgresSchema());
      executor.Commit();
    }

    LOTCOST_LOG_INFO("storage ready", {observability::StringField("backend", "postgres"),
                                       observability::IntField("max_connections", static_cast<int64_t>(max))});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  LOTCOST_LOG_INFO("storage ready", {observability::StringField("backend", "memory")});
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<db::Repository>       repository) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Collaborators
  // ------------------------------------------------------------------
  deps.repository = std::move(repository);
  deps.converter  = std::make_shared<units::StandardUnitConverter>();

  // ------------------------------------------------------------------
  // Engines
  // ------------------------------------------------------------------
  deps.catalog          = std::make_shared<core::ItemCatalog>(deps.repository, deps.converter);
  deps.fifo             = std::make_shared<core::FifoEngine>(deps.repository, deps.converter, FifoOptionsFrom(config));
  deps.weighted_average = std::make_shared<core::WeightedAverageEngine>(deps.repository);
  deps.adjustments      = std::make_shared<core::AdjustmentEngine>(deps.repository, AdjustmentOptionsFrom(config));
  deps.prices           = std::make_shared<pricing::PriceHistory>(deps.repository, PricingOptionsFrom(config));
  deps.blended          = std::make_shared<core::BlendedCostCalculator>(deps.repository, deps.fifo, deps.converter, deps.prices);
  deps.ledger           = std::make_shared<core::LotLedger>(deps.repository, deps.fifo, deps.converter, deps.prices);

  // ------------------------------------------------------------------
  // Service
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.catalog          = deps.catalog;
  ctx.fifo             = deps.fifo;
  ctx.weighted_average = deps.weighted_average;
  ctx.adjustments      = deps.adjustments;
  ctx.blended          = deps.blended;
  ctx.ledger           = deps.ledger;

  deps.service = std::make_shared<service::CostingService>(std::move(ctx));
  return deps;
}

RuntimeDependencies BuildRuntime(const runtime::config::RuntimeConfig& config) {
  return BuildRuntime(config, BuildRepository(config));
}

} // namespace lotcost::factory
