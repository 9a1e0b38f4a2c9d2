#pragma once

#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/units/unit_converter.hpp"
#include "internal/util/errors.hpp"

namespace lotcost::core {

/*
  Helpers shared by the engines.

  Engines report storage failures as util::TransactionFailure (duplicates as
  util::AlreadyExists). The open transaction is rolled back by its
  destructor while the exception unwinds.
*/

void ThrowIfDbError(const db::Result& result, const std::string& context);

// Commit; backend exceptions (write conflict, failed COMMIT) become
// util::TransactionFailure.
void CommitOrThrow(db::Transaction& tx, const std::string& context);

// Throws util::ItemNotFound.
db::model::ItemRecord RequireItem(db::Repository& repo, db::Transaction& tx, const std::string& item_id);

units::ConversionContext ContextFor(const db::model::ItemRecord& item);

// Converts `quantity` from `unit` into the item's base unit or throws
// util::UnitConversionError.
util::Decimal ToBaseUnits(const units::UnitConverter& converter, const db::model::ItemRecord& item,
                          const util::Decimal& quantity, const std::string& unit);

/*
  Runs fn; engine errors pass through untouched, any other exception
  (backend read failure, decimal overflow) is reported as
  util::TransactionFailure naming the operation.
*/
template <typename Fn>
auto GuardStorage(std::string_view operation, Fn&& fn) {
  try {
    return std::forward<Fn>(fn)();
  } catch (const util::Error&) {
    throw;
  } catch (const std::exception& e) {
    throw util::TransactionFailure(std::string(operation) + ": " + e.what());
  }
}

} // namespace lotcost::core
