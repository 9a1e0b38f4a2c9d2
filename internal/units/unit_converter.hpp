#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/util/decimal.hpp"

namespace lotcost::units {

enum class UnitFamily {
  kWeight,
  kVolume,
  kCount,
  kLength,
  kArea,
};

// What the converter may know about the item being converted.
struct ConversionContext {
  std::string                  item_name;
  std::optional<util::Decimal> density_g_per_ml;
};

struct ConversionResult {
  util::Decimal quantity;
  bool          ok = false;
  std::string   error;

  static ConversionResult Ok(util::Decimal q) {
    return {q, true, {}};
  }

  static ConversionResult Fail(std::string msg) {
    return {util::Decimal{}, false, std::move(msg)};
  }
};

/*
  Unit conversion collaborator.

  Convert() must be deterministic and unit-family aware: it fails (ok=false)
  instead of throwing when the units are unknown or incompatible.
*/
class UnitConverter {
 public:
  virtual ~UnitConverter() = default;

  virtual ConversionResult Convert(const util::Decimal& quantity, std::string_view from_unit, std::string_view to_unit,
                                   const ConversionContext& context) const = 0;
};

/*
  Table-driven converter over the standard kitchen and workshop units.

  Each family converts through one reference unit (g, ml, each, cm, sq_cm).
  Weight and volume bridge through density_g_per_ml when the context has
  one. Unit names are case-insensitive; "fl oz", "count" and "piece" are
  accepted aliases.
*/
class StandardUnitConverter final : public UnitConverter {
 public:
  ConversionResult Convert(const util::Decimal& quantity, std::string_view from_unit, std::string_view to_unit,
                           const ConversionContext& context) const override;

  static std::optional<UnitFamily> FamilyOf(std::string_view unit);
  static bool                      IsKnownUnit(std::string_view unit);
};

std::string_view ToString(UnitFamily family);

} // namespace lotcost::units
