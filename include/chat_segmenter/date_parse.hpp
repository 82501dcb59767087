#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

// Broken-down wall-clock time, no zone attached.
struct CivilDateTime {
  int year = 1970, month = 1, day = 1;
  int hour = 0, minute = 0, second = 0;
};

bool is_leap_year(int y);
int  days_in_month(int y, int m);

// Range check of every field (day against the real month length).
bool is_valid_civil(const CivilDateTime& c);

// Days since 1970-01-01 for a proleptic Gregorian date.
std::int64_t days_from_civil(int y, unsigned m, unsigned d);

// Seconds since epoch, treating `c` as UTC wall time.
std::int64_t civil_to_epoch(const CivilDateTime& c);

// Inverse of civil_to_epoch.
CivilDateTime epoch_to_civil(std::int64_t epoch_seconds);

// "2023-02-01T14:30:05+01:00" for the given instant at its offset.
std::string format_rfc3339(std::int64_t epoch_seconds, int offset_minutes);

// "local" | "UTC" | "Z" | "+HH:MM" | "-HH:MM" | "+HHMM" -> minutes east of UTC.
// "local" is resolved from the process timezone at call time.
std::optional<int> resolve_utc_offset(std::string_view tz);

}
