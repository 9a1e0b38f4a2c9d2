#include "internal/units/unit_converter.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace lotcost::units {

using util::Decimal;

namespace {

struct UnitDef {
  std::string_view name;
  UnitFamily       family;
  int64_t          to_reference_raw; // reference units per unit, 6 fractional digits
};

constexpr int64_t kMicro = Decimal::kOne;

// Reference units: g, ml, each, cm, sq_cm.
constexpr std::array<UnitDef, 34> kUnits = {{
    {"g", UnitFamily::kWeight, 1 * kMicro},
    {"kg", UnitFamily::kWeight, 1000 * kMicro},
    {"mg", UnitFamily::kWeight, 1'000},
    {"oz", UnitFamily::kWeight, 28'349'523},
    {"lb", UnitFamily::kWeight, 453'592'370},

    {"ml", UnitFamily::kVolume, 1 * kMicro},
    {"l", UnitFamily::kVolume, 1000 * kMicro},
    {"tsp", UnitFamily::kVolume, 4'928'922},
    {"tbsp", UnitFamily::kVolume, 14'786'765},
    {"cup", UnitFamily::kVolume, 236'588'237},
    {"fl_oz", UnitFamily::kVolume, 29'573'530},
    {"fl oz", UnitFamily::kVolume, 29'573'530},
    {"pt", UnitFamily::kVolume, 473'176'473},
    {"qt", UnitFamily::kVolume, 946'352'946},
    {"gal", UnitFamily::kVolume, 3'785'411'784},

    {"each", UnitFamily::kCount, 1 * kMicro},
    {"count", UnitFamily::kCount, 1 * kMicro},
    {"piece", UnitFamily::kCount, 1 * kMicro},
    {"dozen", UnitFamily::kCount, 12 * kMicro},

    {"mm", UnitFamily::kLength, 100'000},
    {"cm", UnitFamily::kLength, 1 * kMicro},
    {"m", UnitFamily::kLength, 100 * kMicro},
    {"in", UnitFamily::kLength, 2'540'000},
    {"inch", UnitFamily::kLength, 2'540'000},
    {"ft", UnitFamily::kLength, 30'480'000},
    {"feet", UnitFamily::kLength, 30'480'000},
    {"yd", UnitFamily::kLength, 91'440'000},
    {"yard", UnitFamily::kLength, 91'440'000},

    {"sq_cm", UnitFamily::kArea, 1 * kMicro},
    {"sq_m", UnitFamily::kArea, 10'000 * kMicro},
    {"sq_in", UnitFamily::kArea, 6'451'600},
    {"sq_ft", UnitFamily::kArea, 929'030'400},
    {"square_inch", UnitFamily::kArea, 6'451'600},
    {"square_foot", UnitFamily::kArea, 929'030'400},
}};

std::string Normalize(std::string_view unit) {
  std::string out(unit);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

const UnitDef* Find(std::string_view unit) {
  const auto normalized = Normalize(unit);
  for (const auto& def : kUnits) {
    if (def.name == normalized) return &def;
  }
  return nullptr;
}

} // namespace

std::string_view ToString(UnitFamily family) {
  switch (family) {
    case UnitFamily::kWeight:
      return "weight";
    case UnitFamily::kVolume:
      return "volume";
    case UnitFamily::kCount:
      return "count";
    case UnitFamily::kLength:
      return "length";
    case UnitFamily::kArea:
      return "area";
  }
  return "unknown";
}

std::optional<UnitFamily> StandardUnitConverter::FamilyOf(std::string_view unit) {
  const auto* def = Find(unit);
  if (!def) return std::nullopt;
  return def->family;
}

bool StandardUnitConverter::IsKnownUnit(std::string_view unit) {
  return Find(unit) != nullptr;
}

ConversionResult StandardUnitConverter::Convert(const Decimal& quantity, std::string_view from_unit,
                                                std::string_view to_unit, const ConversionContext& context) const {
  if (quantity.IsNegative()) {
    return ConversionResult::Fail("cannot convert negative quantity " + quantity.ToString());
  }
  const auto* from = Find(from_unit);
  if (!from) return ConversionResult::Fail("unknown unit: " + std::string(from_unit));
  const auto* to = Find(to_unit);
  if (!to) return ConversionResult::Fail("unknown unit: " + std::string(to_unit));

  if (from->to_reference_raw == to->to_reference_raw && from->family == to->family) {
    return ConversionResult::Ok(quantity);
  }

  const Decimal from_factor = Decimal::FromRaw(from->to_reference_raw);
  const Decimal to_factor   = Decimal::FromRaw(to->to_reference_raw);

  try {
    if (from->family == to->family) {
      return ConversionResult::Ok(quantity * from_factor / to_factor);
    }

    const bool weight_volume = (from->family == UnitFamily::kWeight && to->family == UnitFamily::kVolume) ||
                               (from->family == UnitFamily::kVolume && to->family == UnitFamily::kWeight);
    if (!weight_volume) {
      return ConversionResult::Fail("cannot convert " + std::string(from_unit) + " (" +
                                    std::string(ToString(from->family)) + ") to " + std::string(to_unit) + " (" +
                                    std::string(ToString(to->family)) + ")");
    }
    if (!context.density_g_per_ml || !context.density_g_per_ml->IsPositive()) {
      return ConversionResult::Fail("cannot convert " + std::string(from_unit) + " to " + std::string(to_unit) +
                                    ": no density for " +
                                    (context.item_name.empty() ? std::string("item") : context.item_name));
    }

    const Decimal reference = quantity * from_factor; // grams or millilitres
    const Decimal bridged   = from->family == UnitFamily::kVolume ? reference * *context.density_g_per_ml
                                                                  : reference / *context.density_g_per_ml;
    return ConversionResult::Ok(bridged / to_factor);
  } catch (const std::overflow_error& e) {
    return ConversionResult::Fail(std::string("conversion overflow: ") + e.what());
  }
}

} // namespace lotcost::units
