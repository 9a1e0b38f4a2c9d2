#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/units/unit_converter.hpp"

namespace lotcost::core {

/*
  Registration and lookup of trackable items.

  Ingredients, inventory items and materials share one record shape; the
  domain is informational and the engines never branch on it.
*/
class ItemCatalog {
 public:
  ItemCatalog(std::shared_ptr<db::Repository> repository, std::shared_ptr<const units::UnitConverter> converter);

  // Throws util::ValidationError for an empty id or name, an unknown base
  // unit or a non-positive density; util::AlreadyExists for a duplicate id.
  db::model::ItemRecord Register(const db::model::ItemRecord& item);

  // Throws util::ItemNotFound.
  db::model::ItemRecord Get(const std::string& item_id);

  std::vector<db::model::ItemRecord> List();

 private:
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<const units::UnitConverter> converter_;
};

} // namespace lotcost::core
