#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace lotcost::util {

/*
  Signed base-10 fixed point with 6 fractional digits.

  Used for every quantity, unit cost and percentage. Products and quotients
  are computed in 128 bits and rounded half-up (half away from zero) back to
  6 digits; results that do not fit in 64 bits throw std::overflow_error.

  Per-unit costs are therefore exact only to 0.000001. A cost re-expressed
  per gram (1 lb at 4.99 is 453.59237 g at 0.011001) values the lot at
  4.98997, not 4.99.
*/
class Decimal {
 public:
  static constexpr int     kScale = 6;
  static constexpr int64_t kOne   = 1'000'000;

  constexpr Decimal() = default;

  static constexpr Decimal FromRaw(int64_t raw) {
    Decimal d;
    d.raw_ = raw;
    return d;
  }

  static Decimal FromInt(int64_t value);

  // Throws std::invalid_argument on malformed input. Digits beyond the 6th
  // fractional place are rounded half-up.
  static Decimal                Parse(std::string_view text);
  static std::optional<Decimal> TryParse(std::string_view text);

  constexpr int64_t Raw() const {
    return raw_;
  }

  // Shortest form without trailing zeros ("0.13", "12", "-0.5").
  std::string ToString() const;
  // Rounded to exactly `places` fractional digits ("0.1300").
  std::string ToString(int places) const;

  Decimal Round(int places) const;
  Decimal Abs() const;

  // a * b / divisor computed exactly and rounded half-up once, to `places`
  // fractional digits. Throws std::domain_error on a zero divisor.
  static Decimal MulDiv(const Decimal& a, const Decimal& b, const Decimal& divisor, int places);

  // (q1 * v1 + q2 * v2) / (q1 + q2), exact until a single half-up rounding
  // to `places` fractional digits.
  static Decimal WeightedMean(const Decimal& q1, const Decimal& v1, const Decimal& q2, const Decimal& v2,
                              int places);

  constexpr bool IsZero() const {
    return raw_ == 0;
  }
  constexpr bool IsNegative() const {
    return raw_ < 0;
  }
  constexpr bool IsPositive() const {
    return raw_ > 0;
  }

  Decimal operator+(const Decimal& other) const;
  Decimal operator-(const Decimal& other) const;
  Decimal operator*(const Decimal& other) const;
  // Throws std::domain_error on division by zero.
  Decimal operator/(const Decimal& other) const;
  Decimal operator-() const;

  Decimal& operator+=(const Decimal& other);
  Decimal& operator-=(const Decimal& other);

  constexpr auto operator<=>(const Decimal&) const = default;
  constexpr bool operator==(const Decimal&) const  = default;

 private:
  int64_t raw_ = 0;
};

inline Decimal Min(const Decimal& a, const Decimal& b) {
  return b < a ? b : a;
}

inline Decimal Max(const Decimal& a, const Decimal& b) {
  return a < b ? b : a;
}

std::ostream& operator<<(std::ostream& out, const Decimal& value);

} // namespace lotcost::util
