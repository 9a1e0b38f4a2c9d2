#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lotcost::util {

/*
  Time utilities. All clock reads go through here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// "2025-01-15T08:30:00Z"
std::string FormatTimestamp(TimePoint tp);

/*
  Calendar date, proleptic Gregorian.

  Acquisition and expiration dates are whole days; ordering is the FIFO key,
  so equality and comparison are by (year, month, day).
*/
struct Date {
  int      year  = 1970;
  unsigned month = 1;
  unsigned day   = 1;

  static Date                Today();
  static Date                FromDays(int64_t days_since_epoch);
  // Throws std::invalid_argument on anything but a valid "YYYY-MM-DD".
  static Date                Parse(std::string_view text);
  static std::optional<Date> TryParse(std::string_view text);

  int64_t     DaysSinceEpoch() const;
  Date        AddDays(int64_t days) const;
  std::string ToString() const;

  auto operator<=>(const Date&) const = default;
  bool operator==(const Date&) const  = default;
};

} // namespace lotcost::util
