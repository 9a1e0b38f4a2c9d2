#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/util/decimal.hpp"

namespace lotcost::db::model {

enum class AdjustmentType {
  kAdd,
  kSubtract,
  kSet,
  kPercentage,
};

enum class ReasonCode {
  kSpoilage,
  kGift,
  kCorrection,
  kAdHocUsage,
  kPhysicalCount,
  kOther,
};

/*
  Audit row for a manual lot adjustment.

  Immutable once inserted: the repository exposes no update or delete for
  it. Written in the same transaction as the lot mutation it describes.
*/
struct AdjustmentRecord {
  std::string id; // UUID
  uint64_t    lot_id = 0;

  AdjustmentType adjustment_type = AdjustmentType::kSubtract;
  util::Decimal  value_applied;
  util::Decimal  quantity_before;
  util::Decimal  quantity_after;
  util::Decimal  cost_impact;

  ReasonCode  reason_code = ReasonCode::kCorrection;
  std::string notes;

  uint64_t    created_at_ms = 0;
  std::string created_by;
};

std::string_view              ToString(AdjustmentType type);
std::string_view              ToString(ReasonCode reason);
std::optional<AdjustmentType> ParseAdjustmentType(std::string_view text);
std::optional<ReasonCode>     ParseReasonCode(std::string_view text);

} // namespace lotcost::db::model
