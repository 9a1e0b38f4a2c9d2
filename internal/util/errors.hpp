#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace lotcost::util {

/*
  Central error types.

  Every engine operation reports failure by throwing one of these.
  Messages always name the offending item, lot or value.
*/

// Common base so callers can tell engine errors from backend exceptions.
class Error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class ItemNotFound : public Error {
 public:
  explicit ItemNotFound(const std::string& item_id) : Error("item not found: " + item_id), item_id_(item_id) {
  }

  const std::string& item_id() const {
    return item_id_;
  }

 private:
  std::string item_id_;
};

class LotNotFound : public Error {
 public:
  explicit LotNotFound(uint64_t lot_id) : Error("lot not found: " + std::to_string(lot_id)), lot_id_(lot_id) {
  }

  uint64_t lot_id() const {
    return lot_id_;
  }

 private:
  uint64_t lot_id_;
};

class UnitConversionError : public Error {
 public:
  explicit UnitConversionError(const std::string& msg) : Error(msg) {
  }
};

class ValidationError : public Error {
 public:
  explicit ValidationError(const std::string& msg) : Error(msg) {
  }
};

class NoPricingHistory : public Error {
 public:
  explicit NoPricingHistory(const std::string& item_id)
      : Error("no pricing history to cover shortfall of item: " + item_id), item_id_(item_id) {
  }

  const std::string& item_id() const {
    return item_id_;
  }

 private:
  std::string item_id_;
};

// Storage failure during a write; the in-progress transaction has been
// rolled back by the time the caller sees this.
class TransactionFailure : public Error {
 public:
  explicit TransactionFailure(const std::string& msg) : Error(msg) {
  }
};

class AlreadyExists : public Error {
 public:
  explicit AlreadyExists(const std::string& msg) : Error(msg) {
  }
};

} // namespace lotcost::util
