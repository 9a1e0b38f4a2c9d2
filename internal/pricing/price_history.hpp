#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/core/pricing_source.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/decimal.hpp"
#include "internal/util/time.hpp"

namespace lotcost::pricing {

enum class PricingStrategy {
  kMostRecent,
  kHistoricalAverage,
};

struct PricingOptions {
  PricingStrategy strategy            = PricingStrategy::kMostRecent;
  int             average_window_days = 60;
  // Absolute change, in percent of the historical average.
  util::Decimal warning_change_percent  = util::Decimal::FromInt(20);
  util::Decimal critical_change_percent = util::Decimal::FromInt(40);
};

enum class PriceAlertLevel {
  kNone,
  kWarning,
  kCritical,
};

struct PriceChange {
  std::optional<util::Decimal> average_price; // unset without history in the window
  util::Decimal                new_price;
  std::optional<util::Decimal> change_percent; // signed, one decimal place
  PriceAlertLevel              level = PriceAlertLevel::kNone;
  std::string                  message;
};

/*
  Pricing history over the purchases table.

  - MostRecentPrice: newest purchase from the item's preferred supplier,
    else newest purchase from any supplier.
  - HistoricalAverage: mean unit price of purchases dated within
    average_window_days before `as_of`.
  - PriceFor: the configured strategy; historical_average falls back to
    the most recent price when the window is empty.
*/
class PriceHistory final : public core::PricingSource {
 public:
  PriceHistory(std::shared_ptr<db::Repository> repository, PricingOptions options = {});

  std::optional<util::Decimal> PriceFor(db::Transaction& tx, const db::model::ItemRecord& item) override;

  std::optional<util::Decimal> MostRecentPrice(db::Transaction& tx, const db::model::ItemRecord& item);
  std::optional<util::Decimal> HistoricalAverage(db::Transaction& tx, const std::string& item_id,
                                                 const util::Date& as_of);

  // Compares new_price with the historical average ending at `as_of`.
  PriceChange DetectPriceChange(db::Transaction& tx, const std::string& item_id, const util::Decimal& new_price,
                                const util::Date& as_of);

  // Pure classification against the configured thresholds.
  PriceChange Classify(const std::optional<util::Decimal>& average_price, const util::Decimal& new_price) const;

  const PricingOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  PricingOptions                  options_;
};

std::string_view                ToString(PriceAlertLevel level);
std::string_view                ToString(PricingStrategy strategy);
std::optional<PricingStrategy> ParsePricingStrategy(std::string_view text);

} // namespace lotcost::pricing
