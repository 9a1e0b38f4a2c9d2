#include "time.hpp"

#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace lotcost::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

std::string FormatTimestamp(TimePoint tp) {
  const std::time_t secs = Clock::to_time_t(tp);
  std::tm           utc{};
  gmtime_r(&secs, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

Date Date::Today() {
  const auto days = std::chrono::floor<std::chrono::days>(Now());
  return FromDays(days.time_since_epoch().count());
}

Date Date::FromDays(int64_t days_since_epoch) {
  const std::chrono::year_month_day ymd{std::chrono::sys_days{std::chrono::days{days_since_epoch}}};
  return Date{static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day())};
}

std::optional<Date> Date::TryParse(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  auto digits = [&](std::size_t from, std::size_t count) -> std::optional<int> {
    int value = 0;
    for (std::size_t i = from; i < from + count; ++i) {
      if (text[i] < '0' || text[i] > '9') return std::nullopt;
      value = value * 10 + (text[i] - '0');
    }
    return value;
  };
  const auto y = digits(0, 4);
  const auto m = digits(5, 2);
  const auto d = digits(8, 2);
  if (!y || !m || !d) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{*y}, std::chrono::month{static_cast<unsigned>(*m)},
                                        std::chrono::day{static_cast<unsigned>(*d)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }
  return Date{*y, static_cast<unsigned>(*m), static_cast<unsigned>(*d)};
}

Date Date::Parse(std::string_view text) {
  auto parsed = TryParse(text);
  if (!parsed) {
    throw std::invalid_argument("invalid date (expected YYYY-MM-DD): '" + std::string(text) + "'");
  }
  return *parsed;
}

int64_t Date::DaysSinceEpoch() const {
  const std::chrono::sys_days days{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
  return days.time_since_epoch().count();
}

Date Date::AddDays(int64_t days) const {
  return FromDays(DaysSinceEpoch() + days);
}

std::string Date::ToString() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
  return buf;
}

} // namespace lotcost::util
