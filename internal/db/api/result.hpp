#pragma once

#include <string>
#include <utility>

namespace lotcost::db {

// Outcome codes shared by every ledger backend. Repositories translate
// sqlite3 / pqxx failures into these before returning.
enum class ErrorCode {
  OK = 0,
  NotFound,            // update of a lot id that does not exist
  AlreadyExists,       // duplicate item id or ledger row id
  Conflict,            // concurrent writer committed first
  Busy,                // database locked past the busy timeout
  ConstraintViolation, // remaining > original, remaining < 0, orphan row
  SerializationFailure,
  IOError,
  Corruption,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() { return {}; }
  static Result Err(ErrorCode c, std::string msg = {}) { return {c, std::move(msg)}; }

  explicit operator bool() const { return code == ErrorCode::OK; }
};

} // namespace lotcost::db
