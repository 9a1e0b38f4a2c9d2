#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace lotcost::db::sqlite {

using lotcost::db::ErrorCode;
using lotcost::db::Result;
using lotcost::util::Date;
using lotcost::util::Decimal;

namespace {

// Finalizes on every exit path.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }
  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

[[noreturn]] void ThrowDb(sqlite3* db, const char* what) {
  throw std::runtime_error(std::string("sqlite ") + what + ": " + sqlite3_errmsg(db));
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDecimal(sqlite3_stmt* st, int idx, const Decimal& v) {
  BindI64(st, idx, v.Raw());
}

void BindDate(sqlite3_stmt* st, int idx, const Date& d) {
  BindText(st, idx, d.ToString());
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptDecimal(sqlite3_stmt* st, int idx, const std::optional<Decimal>& v) {
  if (v) {
    BindDecimal(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptDate(sqlite3_stmt* st, int idx, const std::optional<Date>& d) {
  if (d) {
    BindDate(st, idx, *d);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

Decimal ColDecimal(sqlite3_stmt* st, int col) {
  return Decimal::FromRaw(static_cast<int64_t>(sqlite3_column_int64(st, col)));
}

Date ColDate(sqlite3_stmt* st, int col) {
  auto text   = ColText(st, col);
  auto parsed = Date::TryParse(text);
  if (!parsed) {
    throw std::runtime_error("sqlite: malformed date column: '" + text + "'");
  }
  return *parsed;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

std::optional<Decimal> ColOptDecimal(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColDecimal(st, col);
}

std::optional<Date> ColOptDate(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColDate(st, col);
}

template <typename Enum>
Enum ColEnum(sqlite3_stmt* st, int col, std::optional<Enum> (*parse)(std::string_view)) {
  auto text   = ColText(st, col);
  auto parsed = parse(text);
  if (!parsed) {
    throw std::runtime_error("sqlite: unknown enum value in column: '" + text + "'");
  }
  return *parsed;
}

std::string EnumText(std::string_view name) {
  return std::string(name);
}

constexpr const char* kItemColumns =
    "id,name,domain,base_unit,costing_method,density_g_per_ml,preferred_supplier_id";

model::ItemRecord ReadItem(sqlite3_stmt* st) {
  model::ItemRecord r;
  r.id                    = ColText(st, 0);
  r.name                  = ColText(st, 1);
  r.domain                = ColEnum(st, 2, &model::ParseItemDomain);
  r.base_unit             = ColText(st, 3);
  r.costing_method        = ColEnum(st, 4, &model::ParseCostingMethod);
  r.density_g_per_ml      = ColOptDecimal(st, 5);
  r.preferred_supplier_id = ColOptText(st, 6);
  return r;
}

constexpr const char* kLotColumns =
    "id,item_id,acquisition_date,quantity_original,quantity_remaining,unit_cost,"
    "expiration_date,location,notes";

model::LotRecord ReadLot(sqlite3_stmt* st) {
  model::LotRecord r;
  r.id                 = ColU64(st, 0);
  r.item_id            = ColText(st, 1);
  r.acquisition_date   = ColDate(st, 2);
  r.quantity_original  = ColDecimal(st, 3);
  r.quantity_remaining = ColDecimal(st, 4);
  r.unit_cost          = ColDecimal(st, 5);
  r.expiration_date    = ColOptDate(st, 6);
  r.location           = ColOptText(st, 7);
  r.notes              = ColText(st, 8);
  return r;
}

model::AdjustmentRecord ReadAdjustment(sqlite3_stmt* st) {
  model::AdjustmentRecord r;
  r.id              = ColText(st, 0);
  r.lot_id          = ColU64(st, 1);
  r.adjustment_type = ColEnum(st, 2, &model::ParseAdjustmentType);
  r.value_applied   = ColDecimal(st, 3);
  r.quantity_before = ColDecimal(st, 4);
  r.quantity_after  = ColDecimal(st, 5);
  r.cost_impact     = ColDecimal(st, 6);
  r.reason_code     = ColEnum(st, 7, &model::ParseReasonCode);
  r.notes           = ColText(st, 8);
  r.created_at_ms   = ColU64(st, 9);
  r.created_by      = ColText(st, 10);
  return r;
}

model::ConsumptionRecord ReadConsumption(sqlite3_stmt* st) {
  model::ConsumptionRecord r;
  r.id            = ColText(st, 0);
  r.lot_id        = ColU64(st, 1);
  r.item_id       = ColText(st, 2);
  r.context_id    = ColText(st, 3);
  r.quantity      = ColDecimal(st, 4);
  r.unit_cost     = ColDecimal(st, 5);
  r.created_at_ms = ColU64(st, 6);
  return r;
}

model::PurchaseRecord ReadPurchase(sqlite3_stmt* st) {
  model::PurchaseRecord r;
  r.id            = ColU64(st, 0);
  r.item_id       = ColText(st, 1);
  r.supplier_id   = ColText(st, 2);
  r.purchase_date = ColDate(st, 3);
  r.unit_price    = ColDecimal(st, 4);
  r.lot_id        = ColU64(st, 5);
  return r;
}

// Steps a prepared query to completion, collecting every row.
template <typename Row>
std::vector<Row> CollectRows(sqlite3* db, sqlite3_stmt* st, Row (*read)(sqlite3_stmt*)) {
  std::vector<Row> out;
  int              rc;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(read(st));
  }
  if (rc != SQLITE_DONE) ThrowDb(db, "step");
  return out;
}

template <typename Row>
std::optional<Row> SingleRow(sqlite3* db, sqlite3_stmt* st, Row (*read)(sqlite3_stmt*)) {
  int rc = sqlite3_step(st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowDb(db, "step");
  return read(st);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
  return std::make_unique<SqliteTransaction>(db_, mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

sqlite3* SqliteRepository::WriteHandle(Transaction& t) {
  auto& tx = TX(t);
  if (tx.Mode() == TxMode::kRead) {
    throw std::logic_error("write in a read-only transaction");
  }
  return tx.Handle();
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT: {
      const int ext = sqlite3_extended_errcode(db);
      if (ext == SQLITE_CONSTRAINT_PRIMARYKEY || ext == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    }
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Items
// ------------------------------------------------------------------

Result SqliteRepository::InsertItem(Transaction& t, const model::ItemRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "INSERT INTO items(id,name,domain,base_unit,costing_method,density_g_per_ml,preferred_supplier_id) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.name);
  BindText(st.get(), 3, EnumText(model::ToString(r.domain)));
  BindText(st.get(), 4, r.base_unit);
  BindText(st.get(), 5, EnumText(model::ToString(r.costing_method)));
  BindOptDecimal(st.get(), 6, r.density_g_per_ml);
  BindOptText(st.get(), 7, r.preferred_supplier_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::ItemRecord> SqliteRepository::GetItem(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kItemColumns + " FROM items WHERE id=?;";
  Statement         st(db, sql.c_str());
  if (!st) ThrowDb(db, "prepare");

  BindText(st.get(), 1, id);
  return SingleRow(db, st.get(), &ReadItem);
}

std::vector<model::ItemRecord> SqliteRepository::ListItems(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kItemColumns + " FROM items ORDER BY id;";
  Statement         st(db, sql.c_str());
  if (!st) ThrowDb(db, "prepare");

  return CollectRows(db, st.get(), &ReadItem);
}

// ------------------------------------------------------------------
// Lots
// ------------------------------------------------------------------

Result SqliteRepository::InsertLot(Transaction& t, model::LotRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "INSERT INTO lots(item_id,acquisition_date,quantity_original,quantity_remaining,unit_cost,"
               "expiration_date,location,notes) VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.item_id);
  BindDate(st.get(), 2, r.acquisition_date);
  BindDecimal(st.get(), 3, r.quantity_original);
  BindDecimal(st.get(), 4, r.quantity_remaining);
  BindDecimal(st.get(), 5, r.unit_cost);
  BindOptDate(st.get(), 6, r.expiration_date);
  BindOptText(st.get(), 7, r.location);
  BindText(st.get(), 8, r.notes);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::LotRecord> SqliteRepository::GetLot(Transaction& t, uint64_t lot_id, RowLock) {
  auto* db = TX(t).Handle();

  // BEGIN IMMEDIATE already holds the database write lock.
  const std::string sql = std::string("SELECT ") + kLotColumns + " FROM lots WHERE id=?;";
  Statement         st(db, sql.c_str());
  if (!st) ThrowDb(db, "prepare");

  BindU64(st.get(), 1, lot_id);
  return SingleRow(db, st.get(), &ReadLot);
}

std::vector<model::LotRecord> SqliteRepository::ListLotsForItem(Transaction& t, const std::string& item_id,
                                                                const util::Decimal& min_remaining, RowLock) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kLotColumns +
                          " FROM lots WHERE item_id=? AND quantity_remaining>=?"
                          " ORDER BY acquisition_date ASC, id ASC;";
  Statement st(db, sql.c_str());
  if (!st) ThrowDb(db, "prepare");

  BindText(st.get(), 1, item_id);
  BindDecimal(st.get(), 2, min_remaining);
  return CollectRows(db, st.get(), &ReadLot);
}

Result SqliteRepository::UpdateLot(Transaction& t, const model::LotRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "UPDATE lots SET quantity_remaining=?,unit_cost=?,expiration_date=?,location=?,notes=? "
               "WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindDecimal(st.get(), 1, r.quantity_remaining);
  BindDecimal(st.get(), 2, r.unit_cost);
  BindOptDate(st.get(), 3, r.expiration_date);
  BindOptText(st.get(), 4, r.location);
  BindText(st.get(), 5, r.notes);
  BindU64(st.get(), 6, r.id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "lot " + std::to_string(r.id));
  return Result::Ok();
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertAdjustment(Transaction& t, const model::AdjustmentRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "INSERT INTO lot_adjustments(id,lot_id,adjustment_type,value_applied,quantity_before,"
               "quantity_after,cost_impact,reason_code,notes,created_at_ms,created_by) "
               "VALUES(?,?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.lot_id);
  BindText(st.get(), 3, EnumText(model::ToString(r.adjustment_type)));
  BindDecimal(st.get(), 4, r.value_applied);
  BindDecimal(st.get(), 5, r.quantity_before);
  BindDecimal(st.get(), 6, r.quantity_after);
  BindDecimal(st.get(), 7, r.cost_impact);
  BindText(st.get(), 8, EnumText(model::ToString(r.reason_code)));
  BindText(st.get(), 9, r.notes);
  BindU64(st.get(), 10, r.created_at_ms);
  BindText(st.get(), 11, r.created_by);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::AdjustmentRecord> SqliteRepository::ListAdjustments(Transaction& t, uint64_t lot_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,lot_id,adjustment_type,value_applied,quantity_before,quantity_after,cost_impact,"
               "reason_code,notes,created_at_ms,created_by "
               "FROM lot_adjustments WHERE lot_id=? ORDER BY rowid DESC;");
  if (!st) ThrowDb(db, "prepare");

  BindU64(st.get(), 1, lot_id);
  return CollectRows(db, st.get(), &ReadAdjustment);
}

Result SqliteRepository::InsertConsumption(Transaction& t, const model::ConsumptionRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "INSERT INTO lot_consumptions(id,lot_id,item_id,context_id,quantity,unit_cost,created_at_ms) "
               "VALUES(?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindU64(st.get(), 2, r.lot_id);
  BindText(st.get(), 3, r.item_id);
  BindText(st.get(), 4, r.context_id);
  BindDecimal(st.get(), 5, r.quantity);
  BindDecimal(st.get(), 6, r.unit_cost);
  BindU64(st.get(), 7, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::ConsumptionRecord> SqliteRepository::ListConsumptions(Transaction& t, const std::string& context_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,lot_id,item_id,context_id,quantity,unit_cost,created_at_ms "
               "FROM lot_consumptions WHERE context_id=? ORDER BY rowid ASC;");
  if (!st) ThrowDb(db, "prepare");

  BindText(st.get(), 1, context_id);
  return CollectRows(db, st.get(), &ReadConsumption);
}

// ------------------------------------------------------------------
// Weighted average
// ------------------------------------------------------------------

std::optional<model::WeightedAverageRecord> SqliteRepository::GetWeightedAverage(Transaction& t,
                                                                                 const std::string& item_id, RowLock) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT item_id,current_quantity,weighted_average_cost,updated_at_ms "
               "FROM weighted_average WHERE item_id=?;");
  if (!st) ThrowDb(db, "prepare");

  BindText(st.get(), 1, item_id);
  return SingleRow(db, st.get(), +[](sqlite3_stmt* row) {
    model::WeightedAverageRecord r;
    r.item_id               = ColText(row, 0);
    r.current_quantity      = ColDecimal(row, 1);
    r.weighted_average_cost = ColDecimal(row, 2);
    r.updated_at_ms         = ColU64(row, 3);
    return r;
  });
}

Result SqliteRepository::UpsertWeightedAverage(Transaction& t, const model::WeightedAverageRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "INSERT INTO weighted_average(item_id,current_quantity,weighted_average_cost,updated_at_ms) "
               "VALUES(?,?,?,?) "
               "ON CONFLICT(item_id) DO UPDATE SET current_quantity=excluded.current_quantity, "
               "weighted_average_cost=excluded.weighted_average_cost, updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.item_id);
  BindDecimal(st.get(), 2, r.current_quantity);
  BindDecimal(st.get(), 3, r.weighted_average_cost);
  BindU64(st.get(), 4, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Pricing history
// ------------------------------------------------------------------

Result SqliteRepository::InsertPurchase(Transaction& t, model::PurchaseRecord& r) {
  auto* db = WriteHandle(t);

  Statement st(db,
               "INSERT INTO purchases(item_id,supplier_id,purchase_date,unit_price,lot_id) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.item_id);
  BindText(st.get(), 2, r.supplier_id);
  BindDate(st.get(), 3, r.purchase_date);
  BindDecimal(st.get(), 4, r.unit_price);
  BindU64(st.get(), 5, r.lot_id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::vector<model::PurchaseRecord> SqliteRepository::ListPurchases(Transaction& t, const std::string& item_id) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT id,item_id,supplier_id,purchase_date,unit_price,lot_id "
               "FROM purchases WHERE item_id=? ORDER BY purchase_date DESC, id DESC;");
  if (!st) ThrowDb(db, "prepare");

  BindText(st.get(), 1, item_id);
  return CollectRows(db, st.get(), &ReadPurchase);
}

} // namespace lotcost::db::sqlite
