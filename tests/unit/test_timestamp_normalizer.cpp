#include "chat_segmenter/date_parse.hpp"
#include "chat_segmenter/timestamp_normalizer.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

static cs::TimestampNormalizer utc() {
  cs::TimestampNormalizer::Config c;
  c.reference_timezone = "UTC";
  return cs::TimestampNormalizer(c);
}

int main() {
  const auto n = utc();

  // Bracketed, seconds present: 1 Feb 2023 14:30:05
  auto a = n.normalize("01/02/2023, 14:30:05");
  check(a && a->epoch_seconds == 1675261805, "bracketed dmy hms epoch");
  check(a && a->offset_minutes == 0, "UTC offset 0");
  check(n.matching_grammar("01/02/2023, 14:30:05") == "bracketed_dmy_hms", "bracketed wins tie-break");

  // 12-hour, two-digit year
  auto b = n.normalize("01/02/23, 2:30 PM");
  check(b && b->epoch_seconds == 1675261800, "dmy 12h pm");
  check(n.matching_grammar("01/02/23, 2:30 pm") == "dmy_12h", "meridiem is case-insensitive");

  // 12 AM is midnight, 12 PM is noon
  auto midnight = n.normalize("01/02/2023, 12:00 AM");
  auto noon = n.normalize("01/02/2023, 12:00 PM");
  check(midnight && noon && noon->epoch_seconds - midnight->epoch_seconds == 12 * 3600, "12 AM / 12 PM");

  // narrow no-break space before the meridiem
  auto nb = n.normalize("01/02/23, 2:30\xE2\x80\xAFPM");
  check(nb && nb->epoch_seconds == 1675261800, "U+202F before PM");

  // 24-hour without seconds, and ISO
  auto c = n.normalize("01/02/2023, 14:30");
  check(c && c->epoch_seconds == 1675261800, "dmy 24h");
  auto iso = n.normalize("2023-02-01T14:30:05");
  check(iso && iso->epoch_seconds == 1675261805, "iso8601 T");
  check(n.normalize("2023-02-01 14:30:05").has_value(), "iso8601 space");

  // iOS short year with seconds, and forms without the comma
  auto short_year = n.normalize("01/02/23, 14:30:05");
  check(short_year && short_year->epoch_seconds == 1675261805, "dmy hms two-digit year");
  check(n.matching_grammar("01/02/23, 14:30:05") == "dmy_hms", "dmy_hms reads two-digit year");
  auto no_comma = n.normalize("01/02/2023 14:30");
  check(no_comma && no_comma->epoch_seconds == 1675261800, "dmy 24h without comma");
  auto no_comma_hms = n.normalize("01/02/23 14:30:05");
  check(no_comma_hms && no_comma_hms->epoch_seconds == 1675261805, "dmy hms without comma");
  auto no_comma_12h = n.normalize("01/02/23 2:30 PM");
  check(no_comma_12h && no_comma_12h->epoch_seconds == 1675261800, "dmy 12h without comma");
  check(!n.normalize("01/02/202314:30"), "date glued to time rejected");
  check(!n.normalize("01/02/023, 14:30:05"), "three-digit year rejected");

  // Leap day
  auto leap = n.normalize("29/02/2024, 23:59:59");
  check(leap && leap->epoch_seconds == 1709251199, "leap day 2024");

  // Calendar violations
  cs::ParseError err;
  check(!n.normalize("29/02/2023, 10:00:00", &err), "29 Feb 2023 rejected");
  check(err.kind == cs::ParseError::Kind::InvalidTimestamp, "InvalidTimestamp kind");
  check(err.text == "29/02/2023, 10:00:00", "error keeps the text");
  check(!n.normalize("99/99/2023, 10:00:00"), "99/99 rejected");
  check(!n.normalize("31/04/2023, 10:00:00"), "31 April rejected");
  check(!n.normalize("01/02/2023, 24:00:00"), "hour 24 rejected");
  check(!n.normalize("01/02/2023, 10:60:00"), "minute 60 rejected");
  check(!n.normalize("01/02/2023, 13:00 PM"), "13 PM rejected");
  check(!n.normalize("01/02/2023, 0:30 AM"), "0 AM rejected");
  check(!n.normalize("yesterday"), "free text rejected");
  check(!n.normalize(""), "empty rejected");

  // Two-digit year pivot
  auto y69 = n.normalize("01/01/69, 10:00 AM");
  auto y70 = n.normalize("01/01/70, 10:00 AM");
  check(y69 && cs::epoch_to_civil(y69->epoch_seconds).year == 2069, "69 -> 2069");
  check(y70 && cs::epoch_to_civil(y70->epoch_seconds).year == 1970, "70 -> 1970");

  // Fixed offset: same wall clock, earlier instant east of UTC
  cs::TimestampNormalizer::Config plus2;
  plus2.reference_timezone = "+02:00";
  cs::TimestampNormalizer east(plus2);
  auto e = east.normalize("01/02/2023, 14:30:05");
  check(e && e->epoch_seconds == 1675261805 - 7200, "+02:00 shifts epoch");
  check(e && e->offset_minutes == 120, "+02:00 offset kept");
  check(e && cs::format_rfc3339(e->epoch_seconds, e->offset_minutes) == "2023-02-01T14:30:05+02:00",
        "rfc3339 reproduces wall clock");

  // Priority order decides ambiguous dates
  cs::TimestampNormalizer::Config us;
  us.reference_timezone = "UTC";
  us.grammar_order = {"mdy_12h", "dmy_12h"};
  cs::TimestampNormalizer mdy(us);
  auto m = mdy.normalize("01/02/23, 2:30 PM");
  check(m && cs::epoch_to_civil(m->epoch_seconds).month == 1 && cs::epoch_to_civil(m->epoch_seconds).day == 2,
        "mdy first reads 01/02 as Jan 2");
  // 13/02 is not a valid M/D, falls through to D/M
  auto fall = mdy.normalize("13/02/23, 2:30 PM");
  check(fall && cs::epoch_to_civil(fall->epoch_seconds).month == 2, "falls through to next grammar");

  // Bad configuration
  bool threw = false;
  try {
    cs::TimestampNormalizer::Config bad; bad.grammar_order = {"nope"};
    cs::TimestampNormalizer x(bad);
  } catch (const std::invalid_argument&) { threw = true; }
  check(threw, "unknown grammar throws");
  threw = false;
  try {
    cs::TimestampNormalizer::Config bad; bad.reference_timezone = "Mars/Olympus";
    cs::TimestampNormalizer x(bad);
  } catch (const std::invalid_argument&) { threw = true; }
  check(threw, "unknown timezone throws");

  check(cs::resolve_utc_offset("-0530") == -330, "-0530");
  check(cs::resolve_utc_offset("Z") == 0, "Z");
  check(!cs::resolve_utc_offset("+15:00"), "+15:00 out of range");

  if (failures) { std::cerr << "[FAIL] " << failures << " timestamp checks failed\n"; return 1; }
  std::cout << "[PASS] timestamp normalizer\n";
  return 0;
}
