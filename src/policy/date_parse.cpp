#include "chat_segmenter/date_parse.hpp"
#include <cctype>
#include <charconv>
#include <cstdio>
#include <ctime>
#include <string_view>

// NOTE: Calendar math is proleptic Gregorian (days_from_civil / civil_from_days
// after H. Hinnant). No leap seconds.

namespace cs {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  for (char c : s) if (!is_digit(c)) return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static constexpr int dim[] = {31,28,31,30,31,30,31,31,30,31,30,31};
  if (m < 1 || m > 12) return 0;
  return (m == 2 && is_leap_year(y)) ? 29 : dim[m - 1];
}

bool is_valid_civil(const CivilDateTime& c) {
  if (c.month < 1 || c.month > 12) return false;
  if (c.day < 1 || c.day > days_in_month(c.year, c.month)) return false;
  if (c.hour < 0 || c.hour > 23) return false;
  if (c.minute < 0 || c.minute > 59) return false;
  if (c.second < 0 || c.second > 59) return false;
  return true;
}

std::int64_t days_from_civil(int y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);            // [0, 399]
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1; // [0, 365]
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
  return static_cast<std::int64_t>(era) * 146097 + static_cast<std::int64_t>(doe) - 719468;
}

std::int64_t civil_to_epoch(const CivilDateTime& c) {
  const std::int64_t days = days_from_civil(c.year, static_cast<unsigned>(c.month),
                                            static_cast<unsigned>(c.day));
  return days * 86400 + c.hour * 3600LL + c.minute * 60LL + c.second;
}

CivilDateTime epoch_to_civil(std::int64_t t) {
  std::int64_t days = t / 86400;
  std::int64_t secs = t % 86400;
  if (secs < 0) { secs += 86400; --days; }

  days += 719468;
  const std::int64_t era = (days >= 0 ? days : days - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(days - era * 146097);
  const unsigned yoe = (doe - doe/1460 + doe/36524 - doe/146096) / 365;
  const unsigned doy = doe - (365*yoe + yoe/4 - yoe/100);
  const unsigned mp  = (5*doy + 2) / 153;
  const unsigned d   = doy - (153*mp + 2)/5 + 1;
  const unsigned m   = mp < 10 ? mp + 3 : mp - 9;

  CivilDateTime c;
  c.year   = static_cast<int>(static_cast<std::int64_t>(yoe) + era * 400 + (m <= 2));
  c.month  = static_cast<int>(m);
  c.day    = static_cast<int>(d);
  c.hour   = static_cast<int>(secs / 3600);
  c.minute = static_cast<int>((secs % 3600) / 60);
  c.second = static_cast<int>(secs % 60);
  return c;
}

std::string format_rfc3339(std::int64_t epoch_seconds, int offset_minutes) {
  const CivilDateTime c = epoch_to_civil(epoch_seconds + offset_minutes * 60LL);
  const int off = offset_minutes < 0 ? -offset_minutes : offset_minutes;
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d%c%02d:%02d",
                c.year, c.month, c.day, c.hour, c.minute, c.second,
                offset_minutes < 0 ? '-' : '+', off / 60, off % 60);
  return buf;
}

static int local_offset_minutes_now() {
  const std::time_t now = std::time(nullptr);
  std::tm lt{};
#if defined(_WIN32)
  localtime_s(&lt, &now);
#else
  localtime_r(&now, &lt);
#endif
  CivilDateTime c;
  c.year = lt.tm_year + 1900; c.month = lt.tm_mon + 1; c.day = lt.tm_mday;
  c.hour = lt.tm_hour; c.minute = lt.tm_min; c.second = lt.tm_sec;
  return static_cast<int>((civil_to_epoch(c) - static_cast<std::int64_t>(now)) / 60);
}

std::optional<int> resolve_utc_offset(std::string_view tz) {
  if (tz.empty() || ieq(tz, "local")) return local_offset_minutes_now();
  if (ieq(tz, "utc") || ieq(tz, "z") || ieq(tz, "gmt")) return 0;

  if (tz[0] != '+' && tz[0] != '-') return std::nullopt;
  const int sign = tz[0] == '-' ? -1 : 1;
  std::string_view rest = tz.substr(1);

  int hh = 0, mm = 0;
  if (rest.size() == 5 && rest[2] == ':') {
    if (!parse_int(rest.substr(0,2), hh) || !parse_int(rest.substr(3,2), mm)) return std::nullopt;
  } else if (rest.size() == 4) {
    if (!parse_int(rest.substr(0,2), hh) || !parse_int(rest.substr(2,2), mm)) return std::nullopt;
  } else if (rest.size() == 2) {
    if (!parse_int(rest, hh)) return std::nullopt;
  } else {
    return std::nullopt;
  }
  if (hh > 14 || mm > 59) return std::nullopt;
  return sign * (hh * 60 + mm);
}

}
