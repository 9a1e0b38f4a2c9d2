#include "internal/core/item_catalog.hpp"

#include "internal/core/engine_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace lotcost::core {

ItemCatalog::ItemCatalog(std::shared_ptr<db::Repository> repository,
                         std::shared_ptr<const units::UnitConverter> converter)
    : repository_(std::move(repository)), converter_(std::move(converter)) {
}

db::model::ItemRecord ItemCatalog::Register(const db::model::ItemRecord& item) {
  if (item.id.empty()) {
    throw util::ValidationError("item id must not be empty");
  }
  if (item.name.empty()) {
    throw util::ValidationError("item " + item.id + ": name must not be empty");
  }
  // The base unit must convert to itself; that rejects unknown units.
  const auto identity = converter_->Convert(util::Decimal::FromInt(1), item.base_unit, item.base_unit, ContextFor(item));
  if (!identity.ok) {
    throw util::ValidationError("item " + item.id + ": unusable base unit '" + item.base_unit + "': " + identity.error);
  }
  if (item.density_g_per_ml && !item.density_g_per_ml->IsPositive()) {
    throw util::ValidationError("item " + item.id + ": density must be positive, got " +
                                item.density_g_per_ml->ToString());
  }

  return GuardStorage("register item " + item.id, [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->InsertItem(*tx, item), "register item " + item.id);
    CommitOrThrow(*tx, "register item " + item.id);

    LOTCOST_LOG_INFO("item registered",
                     {observability::StringField("item_id", item.id),
                      observability::StringField("domain", db::model::ToString(item.domain)),
                      observability::StringField("base_unit", item.base_unit),
                      observability::StringField("costing_method", db::model::ToString(item.costing_method))});
    return item;
  });
}

db::model::ItemRecord ItemCatalog::Get(const std::string& item_id) {
  return GuardStorage("get item " + item_id, [&] {
    auto tx   = repository_->Begin(db::TxMode::kRead);
    auto item = RequireItem(*repository_, *tx, item_id);
    tx->Rollback();
    return item;
  });
}

std::vector<db::model::ItemRecord> ItemCatalog::List() {
  return GuardStorage("list items", [&] {
    auto tx    = repository_->Begin(db::TxMode::kRead);
    auto items = repository_->ListItems(*tx);
    tx->Rollback();
    return items;
  });
}

} // namespace lotcost::core
