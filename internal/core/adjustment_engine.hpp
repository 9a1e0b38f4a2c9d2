#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/adjustment_record.hpp"
#include "internal/util/decimal.hpp"

namespace lotcost::core {

struct AdjustmentRequest {
  uint64_t                   lot_id = 0;
  db::model::AdjustmentType  type   = db::model::AdjustmentType::kSubtract;
  util::Decimal              value;
  db::model::ReasonCode      reason = db::model::ReasonCode::kCorrection;
  std::string                notes;
  std::optional<std::string> created_by; // AdjustmentOptions::default_actor when unset
};

struct AdjustmentOptions {
  std::string default_actor = "desktop-user";
};

/*
  Manual lot adjustments (spoilage, gifts, corrections, recounts).

  Validation runs in this order and nothing is written on failure:
    1. the lot exists                        util::LotNotFound
    2. value within bounds for the type      util::ValidationError
    3. resulting quantity >= 0               util::ValidationError
    4. resulting quantity <= original        util::ValidationError
    5. notes present for reason `other`      util::ValidationError

  On success the lot update, its appended note line and the audit record
  are written in one transaction.
*/
class AdjustmentEngine {
 public:
  static constexpr int kPercentagePlaces = 2;

  explicit AdjustmentEngine(std::shared_ptr<db::Repository> repository, AdjustmentOptions options = {});

  db::model::AdjustmentRecord Adjust(const AdjustmentRequest& request);

  // Audit records of a lot, newest first. Throws util::LotNotFound.
  std::vector<db::model::AdjustmentRecord> History(uint64_t lot_id);

  // Resulting quantity for `type`, before range checks.
  static util::Decimal ResultingQuantity(db::model::AdjustmentType type, const util::Decimal& current,
                                         const util::Decimal& value);

 private:
  std::shared_ptr<db::Repository> repository_;
  AdjustmentOptions               options_;
};

} // namespace lotcost::core
