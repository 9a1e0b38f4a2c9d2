#include "internal/db/sql/migrations.hpp"

namespace lotcost::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS items ("
      " id TEXT PRIMARY KEY, name TEXT NOT NULL, domain TEXT NOT NULL, base_unit TEXT NOT NULL,"
      " costing_method TEXT NOT NULL, density_g_per_ml INTEGER, preferred_supplier_id TEXT);",

      "CREATE TABLE IF NOT EXISTS lots ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, item_id TEXT NOT NULL REFERENCES items(id),"
      " acquisition_date TEXT NOT NULL, quantity_original INTEGER NOT NULL, quantity_remaining INTEGER NOT NULL,"
      " unit_cost INTEGER NOT NULL, expiration_date TEXT, location TEXT, notes TEXT NOT NULL DEFAULT '',"
      " CHECK (quantity_remaining >= 0 AND quantity_remaining <= quantity_original), CHECK (unit_cost >= 0));",

      "CREATE INDEX IF NOT EXISTS idx_lots_item_fifo ON lots(item_id, acquisition_date, id);",

      "CREATE TABLE IF NOT EXISTS lot_adjustments ("
      " id TEXT PRIMARY KEY, lot_id INTEGER NOT NULL REFERENCES lots(id), adjustment_type TEXT NOT NULL,"
      " value_applied INTEGER NOT NULL, quantity_before INTEGER NOT NULL, quantity_after INTEGER NOT NULL,"
      " cost_impact INTEGER NOT NULL, reason_code TEXT NOT NULL, notes TEXT NOT NULL DEFAULT '',"
      " created_at_ms INTEGER NOT NULL, created_by TEXT NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_lot_adjustments_lot ON lot_adjustments(lot_id);",

      "CREATE TABLE IF NOT EXISTS lot_consumptions ("
      " id TEXT PRIMARY KEY, lot_id INTEGER NOT NULL REFERENCES lots(id), item_id TEXT NOT NULL,"
      " context_id TEXT NOT NULL DEFAULT '', quantity INTEGER NOT NULL, unit_cost INTEGER NOT NULL,"
      " created_at_ms INTEGER NOT NULL);",

      "CREATE INDEX IF NOT EXISTS idx_lot_consumptions_context ON lot_consumptions(context_id);",

      "CREATE TABLE IF NOT EXISTS weighted_average ("
      " item_id TEXT PRIMARY KEY REFERENCES items(id), current_quantity INTEGER NOT NULL,"
      " weighted_average_cost INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL,"
      " CHECK (current_quantity >= 0));",

      "CREATE TABLE IF NOT EXISTS purchases ("
      " id INTEGER PRIMARY KEY AUTOINCREMENT, item_id TEXT NOT NULL REFERENCES items(id),"
      " supplier_id TEXT NOT NULL DEFAULT '', purchase_date TEXT NOT NULL, unit_price INTEGER NOT NULL,"
      " lot_id INTEGER NOT NULL DEFAULT 0);",

      "CREATE INDEX IF NOT EXISTS idx_purchases_item ON purchases(item_id, purchase_date);",

      // Audit tables are append-only; lots are retained forever.
      "CREATE TRIGGER IF NOT EXISTS lot_adjustments_append_only BEFORE UPDATE ON lot_adjustments"
      " BEGIN SELECT RAISE(ABORT, 'lot_adjustments is append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS lot_adjustments_no_delete BEFORE DELETE ON lot_adjustments"
      " BEGIN SELECT RAISE(ABORT, 'lot_adjustments is append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS lot_consumptions_append_only BEFORE UPDATE ON lot_consumptions"
      " BEGIN SELECT RAISE(ABORT, 'lot_consumptions is append-only'); END;",
      "CREATE TRIGGER IF NOT EXISTS lots_no_delete BEFORE DELETE ON lots"
      " BEGIN SELECT RAISE(ABORT, 'lots are retained for audit'); END;",
  };
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS items ("
      " id TEXT PRIMARY KEY, name TEXT NOT NULL, domain TEXT NOT NULL, base_unit TEXT NOT NULL,"
      " costing_method TEXT NOT NULL, density_g_per_ml NUMERIC(20,6), preferred_supplier_id TEXT);",

      "CREATE TABLE IF NOT EXISTS lots ("
      " id BIGSERIAL PRIMARY KEY, item_id TEXT NOT NULL REFERENCES items(id),"
      " acquisition_date DATE NOT NULL, quantity_original NUMERIC(20,6) NOT NULL,"
      " quantity_remaining NUMERIC(20,6) NOT NULL, unit_cost NUMERIC(20,6) NOT NULL,"
      " expiration_date DATE, location TEXT, notes TEXT NOT NULL DEFAULT '',"
      " CHECK (quantity_remaining >= 0 AND quantity_remaining <= quantity_original), CHECK (unit_cost >= 0));",

      "CREATE INDEX IF NOT EXISTS idx_lots_item_fifo ON lots(item_id, acquisition_date, id);",

      "CREATE TABLE IF NOT EXISTS lot_adjustments ("
      " id UUID PRIMARY KEY, lot_id BIGINT NOT NULL REFERENCES lots(id), adjustment_type TEXT NOT NULL,"
      " value_applied NUMERIC(20,6) NOT NULL, quantity_before NUMERIC(20,6) NOT NULL,"
      " quantity_after NUMERIC(20,6) NOT NULL, cost_impact NUMERIC(20,6) NOT NULL, reason_code TEXT NOT NULL,"
      " notes TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, created_by TEXT NOT NULL,"
      " seq BIGSERIAL);",

      "CREATE INDEX IF NOT EXISTS idx_lot_adjustments_lot ON lot_adjustments(lot_id);",

      "CREATE TABLE IF NOT EXISTS lot_consumptions ("
      " id UUID PRIMARY KEY, lot_id BIGINT NOT NULL REFERENCES lots(id), item_id TEXT NOT NULL,"
      " context_id TEXT NOT NULL DEFAULT '', quantity NUMERIC(20,6) NOT NULL, unit_cost NUMERIC(20,6) NOT NULL,"
      " created_at_ms BIGINT NOT NULL, seq BIGSERIAL);",

      "CREATE INDEX IF NOT EXISTS idx_lot_consumptions_context ON lot_consumptions(context_id);",

      "CREATE TABLE IF NOT EXISTS weighted_average ("
      " item_id TEXT PRIMARY KEY REFERENCES items(id), current_quantity NUMERIC(20,6) NOT NULL,"
      " weighted_average_cost NUMERIC(20,6) NOT NULL, updated_at_ms BIGINT NOT NULL,"
      " CHECK (current_quantity >= 0));",

      "CREATE TABLE IF NOT EXISTS purchases ("
      " id BIGSERIAL PRIMARY KEY, item_id TEXT NOT NULL REFERENCES items(id),"
      " supplier_id TEXT NOT NULL DEFAULT '', purchase_date DATE NOT NULL, unit_price NUMERIC(20,6) NOT NULL,"
      " lot_id BIGINT NOT NULL DEFAULT 0);",

      "CREATE INDEX IF NOT EXISTS idx_purchases_item ON purchases(item_id, purchase_date);",
  };
  return kSchema;
}

} // namespace lotcost::db::sql
