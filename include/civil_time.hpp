#pragma once

#include <cstdint>

namespace matrixclock {

struct LocalTime {
  int32_t year;
  uint8_t month;   // 1..12
  uint8_t day;     // 1..31
  uint8_t hour;    // 0..23
  uint8_t minute;
  uint8_t second;
  uint8_t weekday;  // 0 = Sunday
  uint32_t millisOfDay;
};

/** Converts Unix milliseconds plus a UTC offset (minutes) into a civil date and time. */
inline LocalTime toLocalTime(uint64_t epochMs, int32_t offsetMinutes) {
  int64_t ms = static_cast<int64_t>(epochMs) + static_cast<int64_t>(offsetMinutes) * 60000LL;
  int64_t days = ms / 86400000LL;
  int64_t rem = ms % 86400000LL;
  if (rem < 0) {
    rem += 86400000LL;
    --days;
  }

  LocalTime out;
  out.millisOfDay = static_cast<uint32_t>(rem);
  out.hour = static_cast<uint8_t>(rem / 3600000LL);
  out.minute = static_cast<uint8_t>((rem / 60000LL) % 60);
  out.second = static_cast<uint8_t>((rem / 1000LL) % 60);
  int64_t wd = (days + 4) % 7;  // 1970-01-01 was a Thursday
  out.weekday = static_cast<uint8_t>(wd < 0 ? wd + 7 : wd);

  // Days since 1970-01-01 to proleptic Gregorian date.
  int64_t z = days + 719468;
  int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  int64_t doe = z - era * 146097;
  int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  int64_t mp = (5 * doy + 2) / 153;
  int64_t d = doy - (153 * mp + 2) / 5 + 1;
  int64_t m = mp < 10 ? mp + 3 : mp - 9;
  int64_t y = yoe + era * 400 + (m <= 2 ? 1 : 0);
  out.year = static_cast<int32_t>(y);
  out.month = static_cast<uint8_t>(m);
  out.day = static_cast<uint8_t>(d);
  return out;
}

}  // namespace matrixclock
