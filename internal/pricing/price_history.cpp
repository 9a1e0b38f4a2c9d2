#include "internal/pricing/price_history.hpp"

namespace lotcost::pricing {

using util::Decimal;

std::string_view ToString(PriceAlertLevel level) {
  switch (level) {
    case PriceAlertLevel::kNone:
      return "none";
    case PriceAlertLevel::kWarning:
      return "warning";
    case PriceAlertLevel::kCritical:
      return "critical";
  }
  return "unknown";
}

std::string_view ToString(PricingStrategy strategy) {
  return strategy == PricingStrategy::kHistoricalAverage ? "historical_average" : "most_recent";
}

std::optional<PricingStrategy> ParsePricingStrategy(std::string_view text) {
  if (text.empty() || text == "most_recent") return PricingStrategy::kMostRecent;
  if (text == "historical_average") return PricingStrategy::kHistoricalAverage;
  return std::nullopt;
}

PriceHistory::PriceHistory(std::shared_ptr<db::Repository> repository, PricingOptions options)
    : repository_(std::move(repository)), options_(std::move(options)) {
}

std::optional<Decimal> PriceHistory::PriceFor(db::Transaction& tx, const db::model::ItemRecord& item) {
  if (options_.strategy == PricingStrategy::kHistoricalAverage) {
    if (auto average = HistoricalAverage(tx, item.id, util::Date::Today())) {
      return average;
    }
  }
  return MostRecentPrice(tx, item);
}

std::optional<Decimal> PriceHistory::MostRecentPrice(db::Transaction& tx, const db::model::ItemRecord& item) {
  // Newest first.
  const auto purchases = repository_->ListPurchases(tx, item.id);
  if (purchases.empty()) {
    return std::nullopt;
  }

  if (item.preferred_supplier_id && !item.preferred_supplier_id->empty()) {
    for (const auto& p : purchases) {
      if (p.supplier_id == *item.preferred_supplier_id) {
        return p.unit_price;
      }
    }
  }
  return purchases.front().unit_price;
}

std::optional<Decimal> PriceHistory::HistoricalAverage(db::Transaction& tx, const std::string& item_id,
                                                       const util::Date& as_of) {
  const auto cutoff = as_of.AddDays(-options_.average_window_days);

  Decimal total;
  int64_t count = 0;
  for (const auto& p : repository_->ListPurchases(tx, item_id)) {
    if (p.purchase_date < cutoff || p.purchase_date > as_of) continue;
    total += p.unit_price;
    ++count;
  }
  if (count == 0) {
    return std::nullopt;
  }
  return total / Decimal::FromInt(count);
}

PriceChange PriceHistory::DetectPriceChange(db::Transaction& tx, const std::string& item_id, const Decimal& new_price,
                                            const util::Date& as_of) {
  return Classify(HistoricalAverage(tx, item_id, as_of), new_price);
}

PriceChange PriceHistory::Classify(const std::optional<Decimal>& average_price, const Decimal& new_price) const {
  PriceChange change;
  change.average_price = average_price;
  change.new_price     = new_price;

  if (!average_price) {
    change.message = "no historical data for comparison";
    return change;
  }
  if (average_price->IsZero()) {
    change.message = "historical average is zero, no baseline for comparison";
    return change;
  }

  const Decimal delta   = new_price - *average_price;
  const Decimal percent = (delta / *average_price * Decimal::FromInt(100)).Round(1);
  const Decimal size    = percent.Abs();
  change.change_percent = percent;

  if (size >= options_.critical_change_percent) {
    change.level = PriceAlertLevel::kCritical;
  } else if (size >= options_.warning_change_percent) {
    change.level = PriceAlertLevel::kWarning;
  }

  change.message = std::string("price ") + (delta.IsNegative() ? "decreased" : "increased") + " by " +
                   size.ToString(1) + "%";
  if (change.level == PriceAlertLevel::kWarning) change.message += " (WARNING)";
  if (change.level == PriceAlertLevel::kCritical) change.message += " (CRITICAL)";
  return change;
}

} // namespace lotcost::pricing
