#include "internal/util/decimal.hpp"

#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

using lotcost::util::Decimal;

void TestParseAndFormat() {
  assert(Decimal::Parse("0.13").Raw() == 130'000);
  assert(Decimal::Parse("-2.5").Raw() == -2'500'000);
  assert(Decimal::Parse("+7").Raw() == 7'000'000);
  assert(Decimal::Parse(".5").Raw() == 500'000);
  assert(Decimal::Parse(" 12. ").Raw() == 12'000'000);
  // Seventh fractional digit rounds half-up.
  assert(Decimal::Parse("0.0000005").Raw() == 1);
  assert(Decimal::Parse("0.0000004").Raw() == 0);

  assert(Decimal::Parse("0.130000").ToString() == "0.13");
  assert(Decimal::Parse("12").ToString() == "12");
  assert(Decimal::Parse("-0.5").ToString() == "-0.5");
  assert(Decimal{}.ToString() == "0");
  assert(Decimal::Parse("0.13").ToString(4) == "0.1300");
  assert(Decimal::Parse("2.345").ToString(2) == "2.35");
  assert(Decimal::Parse("-2.345").ToString(2) == "-2.35");
  assert(Decimal::Parse("7").ToString(0) == "7");

  std::ostringstream out;
  out << Decimal::Parse("1.250");
  assert(out.str() == "1.25");
}

void TestMalformedInput() {
  assert(!Decimal::TryParse("").has_value());
  assert(!Decimal::TryParse("-").has_value());
  assert(!Decimal::TryParse(".").has_value());
  assert(!Decimal::TryParse("1.2.3").has_value());
  assert(!Decimal::TryParse("1e3").has_value());
  assert(!Decimal::TryParse("abc").has_value());
  assert(!Decimal::TryParse("99999999999999").has_value());

  bool threw = false;
  try {
    (void)Decimal::Parse("twelve");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestArithmeticRoundsHalfUp() {
  const Decimal a = Decimal::Parse("0.1");
  const Decimal b = Decimal::Parse("0.2");
  assert(a + b == Decimal::Parse("0.3"));
  assert(a - b == Decimal::Parse("-0.1"));
  assert(Decimal::Parse("1.5") * Decimal::Parse("0.003") == Decimal::Parse("0.0045"));
  // 2 / 3 = 0.6666666... -> 0.666667
  assert(Decimal::FromInt(2) / Decimal::FromInt(3) == Decimal::Parse("0.666667"));
  assert(Decimal::FromInt(-2) / Decimal::FromInt(3) == Decimal::Parse("-0.666667"));
  // 0.000001 * 0.5 sits exactly on the half.
  assert(Decimal::FromRaw(1) * Decimal::Parse("0.5") == Decimal::FromRaw(1));

  Decimal total;
  total += Decimal::Parse("1.25");
  total -= Decimal::Parse("0.5");
  assert(total == Decimal::Parse("0.75"));

  assert(Decimal::Parse("0.66665").Round(4) == Decimal::Parse("0.6667"));
  assert(Decimal::Parse("-53.846").Round(1) == Decimal::Parse("-53.8"));
  assert(Decimal::Parse("-3").Abs() == Decimal::FromInt(3));
  assert(Min(a, b) == a);
  assert(Max(a, b) == b);
  assert(Decimal::Parse("-0.000001").IsNegative());
  assert(!Decimal{}.IsPositive());
}

void TestArithmeticFailures() {
  bool threw = false;
  try {
    (void)(Decimal::FromInt(1) / Decimal{});
  } catch (const std::domain_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)(Decimal::FromInt(9'000'000'000'000) * Decimal::FromInt(9'000));
  } catch (const std::overflow_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRoundsOnceToPlaces() {
  const Decimal hundred = Decimal::FromInt(100);
  // 1 * 0.499999 / 100 = 0.00499999: a single rounding to 2 places is 0.00,
  // where rounding to 6 first would give 0.005 and then 0.01.
  assert(Decimal::MulDiv(Decimal::FromInt(1), Decimal::Parse("0.499999"), hundred, 2).IsZero());
  assert(Decimal::MulDiv(Decimal::FromInt(1), Decimal::Parse("0.5"), hundred, 2) == Decimal::Parse("0.01"));
  assert(Decimal::MulDiv(Decimal::FromInt(-1), Decimal::Parse("0.5"), hundred, 2) == Decimal::Parse("-0.01"));
  assert(Decimal::MulDiv(Decimal::FromInt(2), Decimal::FromInt(1), Decimal::FromInt(3), 6) ==
         Decimal::Parse("0.666667"));

  // (1 * 0.0001 + 1.000001 * 0) / 2.000001 = 0.0000499999...
  assert(Decimal::WeightedMean(Decimal::FromInt(1), Decimal::Parse("0.0001"), Decimal::Parse("1.000001"), Decimal{}, 4)
             .IsZero());
  assert(Decimal::WeightedMean(Decimal::FromInt(1), Decimal::Parse("0.0001"), Decimal::FromInt(1), Decimal{}, 4) ==
         Decimal::Parse("0.0001"));
  assert(Decimal::WeightedMean(Decimal::FromInt(100), Decimal::Parse("0.10"), Decimal::FromInt(200),
                               Decimal::Parse("0.13"), 4) == Decimal::Parse("0.12"));

  bool threw = false;
  try {
    (void)Decimal::MulDiv(Decimal::FromInt(1), Decimal::FromInt(1), Decimal{}, 2);
  } catch (const std::domain_error&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)Decimal::WeightedMean(Decimal::FromInt(1), Decimal::FromInt(1), Decimal::FromInt(-1), Decimal{}, 4);
  } catch (const std::domain_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParseAndFormat();
  TestMalformedInput();
  TestArithmeticRoundsHalfUp();
  TestArithmeticFailures();
  TestRoundsOnceToPlaces();

  std::cout << "lotcost_unit_decimal: pass\n";
  return 0;
}
