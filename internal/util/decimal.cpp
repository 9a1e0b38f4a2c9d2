#include "decimal.hpp"

#include <limits>
#include <stdexcept>

namespace lotcost::util {

namespace {

using Wide = __int128;

constexpr int64_t kPow10[] = {1, 10, 100, 1'000, 10'000, 100'000, 1'000'000};

int64_t Narrow(Wide value, const char* op) {
  if (value > std::numeric_limits<int64_t>::max() || value < std::numeric_limits<int64_t>::min()) {
    throw std::overflow_error(std::string("decimal overflow in ") + op);
  }
  return static_cast<int64_t>(value);
}

// Integer division rounding half away from zero.
Wide DivideHalfUp(Wide num, Wide den) {
  Wide q = num / den;
  Wide r = num % den;
  if (r < 0) r = -r;
  const Wide abs_den = den < 0 ? -den : den;
  if (2 * r >= abs_den) {
    q += ((num < 0) != (den < 0)) ? -1 : 1;
  }
  return q;
}

void CheckPlaces(int places) {
  if (places < 0 || places > Decimal::kScale) {
    throw std::invalid_argument("decimal places out of range: " + std::to_string(places));
  }
}

// `product` carries 2 * kScale fractional digits and `divisor` kScale.
// The quotient is rounded once at `places` digits, then rescaled.
int64_t QuotientAt(Wide product, int64_t divisor, int places, const char* op) {
  if (divisor == 0) {
    throw std::domain_error(std::string("decimal division by zero in ") + op);
  }
  const Wide q = DivideHalfUp(product, static_cast<Wide>(divisor) * kPow10[Decimal::kScale - places]);
  return Narrow(q * kPow10[Decimal::kScale - places], op);
}

} // namespace

Decimal Decimal::MulDiv(const Decimal& a, const Decimal& b, const Decimal& divisor, int places) {
  CheckPlaces(places);
  return FromRaw(QuotientAt(static_cast<Wide>(a.raw_) * b.raw_, divisor.raw_, places, "MulDiv"));
}

Decimal Decimal::WeightedMean(const Decimal& q1, const Decimal& v1, const Decimal& q2, const Decimal& v2,
                              int places) {
  CheckPlaces(places);
  const Wide    total_value    = static_cast<Wide>(q1.raw_) * v1.raw_ + static_cast<Wide>(q2.raw_) * v2.raw_;
  const int64_t total_quantity = Narrow(static_cast<Wide>(q1.raw_) + q2.raw_, "WeightedMean");
  return FromRaw(QuotientAt(total_value, total_quantity, places, "WeightedMean"));
}

Decimal Decimal::FromInt(int64_t value) {
  return FromRaw(Narrow(static_cast<Wide>(value) * kOne, "FromInt"));
}

std::optional<Decimal> Decimal::TryParse(std::string_view text) {
  std::size_t pos = 0;
  while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) ++pos;
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) text.remove_suffix(1);

  bool negative = false;
  if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
    negative = text[pos] == '-';
    ++pos;
  }

  Wide int_part   = 0;
  Wide frac_part  = 0;
  int  frac_count = 0;
  bool round_up   = false;
  bool any_digit  = false;
  bool seen_point = false;

  for (; pos < text.size(); ++pos) {
    const char c = text[pos];
    if (c == '.') {
      if (seen_point) return std::nullopt;
      seen_point = true;
      continue;
    }
    if (c < '0' || c > '9') return std::nullopt;
    any_digit = true;
    const int digit = c - '0';
    if (!seen_point) {
      int_part = int_part * 10 + digit;
      if (int_part > std::numeric_limits<int64_t>::max() / kOne) return std::nullopt;
    } else if (frac_count < kScale) {
      frac_part = frac_part * 10 + digit;
      ++frac_count;
    } else if (frac_count == kScale) {
      round_up = digit >= 5;
      ++frac_count;
    }
  }
  if (!any_digit) return std::nullopt;

  const int used = frac_count > kScale ? kScale : frac_count;
  Wide      raw  = int_part * kOne + frac_part * kPow10[kScale - used];
  if (round_up) ++raw;
  if (negative) raw = -raw;
  if (raw > std::numeric_limits<int64_t>::max() || raw < std::numeric_limits<int64_t>::min()) return std::nullopt;
  return FromRaw(static_cast<int64_t>(raw));
}

Decimal Decimal::Parse(std::string_view text) {
  auto parsed = TryParse(text);
  if (!parsed) {
    throw std::invalid_argument("invalid decimal: '" + std::string(text) + "'");
  }
  return *parsed;
}

std::string Decimal::ToString(int places) const {
  if (places < 0 || places > kScale) {
    throw std::invalid_argument("decimal places out of range: " + std::to_string(places));
  }
  const int64_t rounded = Round(places).raw_;
  const bool    negative = rounded < 0;
  // Magnitude in 128 bits so INT64_MIN does not overflow on negation.
  Wide          magnitude = negative ? -static_cast<Wide>(rounded) : static_cast<Wide>(rounded);

  const auto  whole = static_cast<uint64_t>(magnitude / kOne);
  const auto  frac  = static_cast<uint64_t>(magnitude % kOne);
  std::string out   = negative ? "-" : "";
  out += std::to_string(whole);
  if (places > 0) {
    std::string digits = std::to_string(frac);
    digits.insert(0, static_cast<std::size_t>(kScale) - digits.size(), '0');
    out += '.';
    out += digits.substr(0, static_cast<std::size_t>(places));
  }
  return out;
}

std::string Decimal::ToString() const {
  std::string out = ToString(kScale);
  while (out.back() == '0') out.pop_back();
  if (out.back() == '.') out.pop_back();
  if (out == "-0") out = "0";
  return out;
}

Decimal Decimal::Round(int places) const {
  if (places >= kScale) return *this;
  if (places < 0) {
    throw std::invalid_argument("decimal places out of range: " + std::to_string(places));
  }
  const int64_t factor = kPow10[kScale - places];
  const Wide    q      = DivideHalfUp(raw_, factor);
  return FromRaw(Narrow(q * factor, "Round"));
}

Decimal Decimal::Abs() const {
  return raw_ < 0 ? -*this : *this;
}

Decimal Decimal::operator+(const Decimal& other) const {
  return FromRaw(Narrow(static_cast<Wide>(raw_) + other.raw_, "add"));
}

Decimal Decimal::operator-(const Decimal& other) const {
  return FromRaw(Narrow(static_cast<Wide>(raw_) - other.raw_, "subtract"));
}

Decimal Decimal::operator*(const Decimal& other) const {
  const Wide product = static_cast<Wide>(raw_) * other.raw_;
  return FromRaw(Narrow(DivideHalfUp(product, kOne), "multiply"));
}

Decimal Decimal::operator/(const Decimal& other) const {
  if (other.raw_ == 0) {
    throw std::domain_error("decimal division by zero");
  }
  const Wide numerator = static_cast<Wide>(raw_) * kOne;
  return FromRaw(Narrow(DivideHalfUp(numerator, other.raw_), "divide"));
}

Decimal Decimal::operator-() const {
  return FromRaw(Narrow(-static_cast<Wide>(raw_), "negate"));
}

Decimal& Decimal::operator+=(const Decimal& other) {
  *this = *this + other;
  return *this;
}

Decimal& Decimal::operator-=(const Decimal& other) {
  *this = *this - other;
  return *this;
}

std::ostream& operator<<(std::ostream& out, const Decimal& value) {
  return out << value.ToString();
}

} // namespace lotcost::util
