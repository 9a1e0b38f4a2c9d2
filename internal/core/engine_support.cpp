#include "internal/core/engine_support.hpp"

namespace lotcost::core {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    default:
      throw util::TransactionFailure(message + " (" + db::ToString(result.code) + ")");
  }
}

void CommitOrThrow(db::Transaction& tx, const std::string& context) {
  try {
    tx.Commit();
  } catch (const std::exception& e) {
    throw util::TransactionFailure(context + ": commit failed: " + e.what());
  }
}

db::model::ItemRecord RequireItem(db::Repository& repo, db::Transaction& tx, const std::string& item_id) {
  auto item = repo.GetItem(tx, item_id);
  if (!item) {
    throw util::ItemNotFound(item_id);
  }
  return *item;
}

units::ConversionContext ContextFor(const db::model::ItemRecord& item) {
  return units::ConversionContext{item.name, item.density_g_per_ml};
}

util::Decimal ToBaseUnits(const units::UnitConverter& converter, const db::model::ItemRecord& item,
                          const util::Decimal& quantity, const std::string& unit) {
  const auto converted = converter.Convert(quantity, unit, item.base_unit, ContextFor(item));
  if (!converted.ok) {
    throw util::UnitConversionError("item " + item.id + ": cannot convert " + quantity.ToString() + " " + unit +
                                    " to base unit " + item.base_unit + ": " + converted.error);
  }
  return converted.quantity;
}

} // namespace lotcost::core
