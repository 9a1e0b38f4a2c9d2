#include "pg_repository.hpp"

#include <stdexcept>

namespace lotcost::db::postgres {

using lotcost::util::Date;
using lotcost::util::Decimal;

namespace {

std::optional<std::string> OptDecimalText(const std::optional<Decimal>& v) {
  if (!v) return std::nullopt;
  return v->ToString();
}

std::optional<std::string> OptDateText(const std::optional<Date>& d) {
  if (!d) return std::nullopt;
  return d->ToString();
}

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

Decimal NumericField(const pqxx::field& f) {
  return Decimal::Parse(f.c_str());
}

std::optional<Decimal> OptNumericField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return NumericField(f);
}

std::optional<Date> OptDateField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return Date::Parse(f.c_str());
}

std::optional<std::string> OptTextField(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

template <typename Enum>
Enum EnumField(const pqxx::field& f, std::optional<Enum> (*parse)(std::string_view)) {
  auto parsed = parse(f.c_str());
  if (!parsed) {
    throw std::runtime_error(std::string("postgres: unknown enum value in column: '") + f.c_str() + "'");
  }
  return *parsed;
}

model::ItemRecord ReadItem(const pqxx::row& row) {
  model::ItemRecord r;
  r.id                    = row[0].c_str();
  r.name                  = row[1].c_str();
  r.domain                = EnumField(row[2], &model::ParseItemDomain);
  r.base_unit             = row[3].c_str();
  r.costing_method        = EnumField(row[4], &model::ParseCostingMethod);
  r.density_g_per_ml      = OptNumericField(row[5]);
  r.preferred_supplier_id = OptTextField(row[6]);
  return r;
}

// Column order of the prepared lot statements (see PgPool).
model::LotRecord ReadLot(const pqxx::row& row) {
  model::LotRecord r;
  r.id                 = row[0].as<uint64_t>();
  r.item_id            = row[1].c_str();
  r.acquisition_date   = Date::Parse(row[2].c_str());
  r.quantity_original  = NumericField(row[3]);
  r.quantity_remaining = NumericField(row[4]);
  r.unit_cost          = NumericField(row[5]);
  r.expiration_date    = OptDateField(row[6]);
  r.location           = OptTextField(row[7]);
  r.notes              = Text(row[8]);
  return r;
}

model::AdjustmentRecord ReadAdjustment(const pqxx::row& row) {
  model::AdjustmentRecord r;
  r.id              = row[0].c_str();
  r.lot_id          = row[1].as<uint64_t>();
  r.adjustment_type = EnumField(row[2], &model::ParseAdjustmentType);
  r.value_applied   = NumericField(row[3]);
  r.quantity_before = NumericField(row[4]);
  r.quantity_after  = NumericField(row[5]);
  r.cost_impact     = NumericField(row[6]);
  r.reason_code     = EnumField(row[7], &model::ParseReasonCode);
  r.notes           = Text(row[8]);
  r.created_at_ms   = row[9].as<uint64_t>();
  r.created_by      = row[10].c_str();
  return r;
}

model::ConsumptionRecord ReadConsumption(const pqxx::row& row) {
  model::ConsumptionRecord r;
  r.id            = row[0].c_str();
  r.lot_id        = row[1].as<uint64_t>();
  r.item_id       = row[2].c_str();
  r.context_id    = Text(row[3]);
  r.quantity      = NumericField(row[4]);
  r.unit_cost     = NumericField(row[5]);
  r.created_at_ms = row[6].as<uint64_t>();
  return r;
}

model::PurchaseRecord ReadPurchase(const pqxx::row& row) {
  model::PurchaseRecord r;
  r.id            = row[0].as<uint64_t>();
  r.item_id       = row[1].c_str();
  r.supplier_id   = Text(row[2]);
  r.purchase_date = Date::Parse(row[3].c_str());
  r.unit_price    = NumericField(row[4]);
  r.lot_id        = row[5].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(TxMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result PgRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO items(id,name,domain,base_unit,costing_method,density_g_per_ml,preferred_supplier_id) "
        "VALUES($1,$2,$3,$4,$5,$6::numeric,$7);",
        r.id, r.name, std::string(model::ToString(r.domain)), r.base_unit,
        std::string(model::ToString(r.costing_method)), OptDecimalText(r.density_g_per_ml), r.preferred_supplier_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ItemRecord> PgRepository::GetItem(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,name,domain,base_unit,costing_method,density_g_per_ml::text,preferred_supplier_id "
      "FROM items WHERE id=$1;",
      id);
  if (res.empty()) return std::nullopt;
  return ReadItem(res[0]);
}

std::vector<model::ItemRecord> PgRepository::ListItems(Transaction& t) {
  auto res = TX(t).Work().exec(
      "SELECT id,name,domain,base_unit,costing_method,density_g_per_ml::text,preferred_supplier_id "
      "FROM items ORDER BY id;");

  std::vector<model::ItemRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadItem(row));
  return out;
}

// ------------------------------------------------------------------
// Lots
// ------------------------------------------------------------------

Result PgRepository::InsertLot(Transaction& t, model::LotRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO lots(item_id,acquisition_date,quantity_original,quantity_remaining,unit_cost,"
        "expiration_date,location,notes) "
        "VALUES($1,$2::date,$3::numeric,$4::numeric,$5::numeric,$6::date,$7,$8) RETURNING id;",
        r.item_id, r.acquisition_date.ToString(), r.quantity_original.ToString(), r.quantity_remaining.ToString(),
        r.unit_cost.ToString(), OptDateText(r.expiration_date), r.location, r.notes);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LotRecord> PgRepository::GetLot(Transaction& t, uint64_t lot_id, RowLock lock) {
  auto res = TX(t).Work().exec_prepared(lock == RowLock::kForUpdate ? "get_lot_for_update" : "get_lot", lot_id);
  if (res.empty()) return std::nullopt;
  return ReadLot(res[0]);
}

std::vector<model::LotRecord> PgRepository::ListLotsForItem(Transaction& t, const std::string& item_id,
                                                            const util::Decimal& min_remaining, RowLock lock) {
  auto res = TX(t).Work().exec_prepared(lock == RowLock::kForUpdate ? "lots_for_item_for_update" : "lots_for_item",
                                        item_id, min_remaining.ToString());

  std::vector<model::LotRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadLot(row));
  return out;
}

Result PgRepository::UpdateLot(Transaction& t, const model::LotRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_lot", r.id, r.quantity_remaining.ToString(), r.unit_cost.ToString(),
                                          OptDateText(r.expiration_date), r.location, r.notes);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "lot " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result PgRepository::InsertAdjustment(Transaction& t, const model::AdjustmentRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO lot_adjustments(id,lot_id,adjustment_type,value_applied,quantity_before,quantity_after,"
        "cost_impact,reason_code,notes,created_at_ms,created_by) "
        "VALUES($1::uuid,$2,$3,$4::numeric,$5::numeric,$6::numeric,$7::numeric,$8,$9,$10,$11);",
        r.id, r.lot_id, std::string(model::ToString(r.adjustment_type)), r.value_applied.ToString(),
        r.quantity_before.ToString(), r.quantity_after.ToString(), r.cost_impact.ToString(),
        std::string(model::ToString(r.reason_code)), r.notes, r.created_at_ms, r.created_by);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AdjustmentRecord> PgRepository::ListAdjustments(Transaction& t, uint64_t lot_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id::text,lot_id,adjustment_type,value_applied::text,quantity_before::text,quantity_after::text,"
      "cost_impact::text,reason_code,notes,created_at_ms,created_by "
      "FROM lot_adjustments WHERE lot_id=$1 ORDER BY seq DESC;",
      lot_id);

  std::vector<model::AdjustmentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadAdjustment(row));
  return out;
}

Result PgRepository::InsertConsumption(Transaction& t, const model::ConsumptionRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO lot_consumptions(id,lot_id,item_id,context_id,quantity,unit_cost,created_at_ms) "
        "VALUES($1::uuid,$2,$3,$4,$5::numeric,$6::numeric,$7);",
        r.id, r.lot_id, r.item_id, r.context_id, r.quantity.ToString(), r.unit_cost.ToString(), r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ConsumptionRecord> PgRepository::ListConsumptions(Transaction& t, const std::string& context_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id::text,lot_id,item_id,context_id,quantity::text,unit_cost::text,created_at_ms "
      "FROM lot_consumptions WHERE context_id=$1 ORDER BY seq ASC;",
      context_id);

  std::vector<model::ConsumptionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadConsumption(row));
  return out;
}

// ------------------------------------------------------------------
// Weighted average
// ------------------------------------------------------------------

std::optional<model::WeightedAverageRecord> PgRepository::GetWeightedAverage(Transaction& t, const std::string& item_id,
                                                                             RowLock lock) {
  std::string sql =
      "SELECT item_id,current_quantity::text,weighted_average_cost::text,updated_at_ms "
      "FROM weighted_average WHERE item_id=$1";
  if (lock == RowLock::kForUpdate) sql += " FOR UPDATE";

  auto res = TX(t).Work().exec_params(sql, item_id);
  if (res.empty()) return std::nullopt;

  model::WeightedAverageRecord r;
  r.item_id               = res[0][0].c_str();
  r.current_quantity      = NumericField(res[0][1]);
  r.weighted_average_cost = NumericField(res[0][2]);
  r.updated_at_ms         = res[0][3].as<uint64_t>();
  return r;
}

Result PgRepository::UpsertWeightedAverage(Transaction& t, const model::WeightedAverageRecord& r) {
  try {
    TX(t).Work().exec_params(
        "INSERT INTO weighted_average(item_id,current_quantity,weighted_average_cost,updated_at_ms) "
        "VALUES($1,$2::numeric,$3::numeric,$4) "
        "ON CONFLICT(item_id) DO UPDATE SET current_quantity=EXCLUDED.current_quantity,"
        "weighted_average_cost=EXCLUDED.weighted_average_cost,updated_at_ms=EXCLUDED.updated_at_ms;",
        r.item_id, r.current_quantity.ToString(), r.weighted_average_cost.ToString(), r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Pricing history
// ------------------------------------------------------------------

Result PgRepository::InsertPurchase(Transaction& t, model::PurchaseRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO purchases(item_id,supplier_id,purchase_date,unit_price,lot_id) "
        "VALUES($1,$2,$3::date,$4::numeric,$5) RETURNING id;",
        r.item_id, r.supplier_id, r.purchase_date.ToString(), r.unit_price.ToString(), r.lot_id);
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::PurchaseRecord> PgRepository::ListPurchases(Transaction& t, const std::string& item_id) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,item_id,supplier_id,purchase_date::text,unit_price::text,lot_id "
      "FROM purchases WHERE item_id=$1 ORDER BY purchase_date DESC, id DESC;",
      item_id);

  std::vector<model::PurchaseRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadPurchase(row));
  return out;
}

} // namespace lotcost::db::postgres
