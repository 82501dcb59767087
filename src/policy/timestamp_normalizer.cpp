#include "chat_segmenter/timestamp_normalizer.hpp"

#include <re2/re2.h>
#include <charconv>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cs {

namespace {

enum class FieldOrder { DMY, MDY, YMD };

// Fold U+00A0 / U+202F (narrow no-break space before AM/PM) to ' ' and trim.
std::string fold_spaces(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i+1]) == 0xA0) {
      out.push_back(' '); i += 1; continue;
    }
    if (c == 0xE2 && i + 2 < s.size() && static_cast<unsigned char>(s[i+1]) == 0x80 &&
        static_cast<unsigned char>(s[i+2]) == 0xAF) {
      out.push_back(' '); i += 2; continue;
    }
    out.push_back(static_cast<char>(c));
  }
  size_t b = 0, e = out.size();
  while (b < e && (out[b] == ' ' || out[b] == '\t')) ++b;
  while (e > b && (out[e-1] == ' ' || out[e-1] == '\t')) --e;
  return out.substr(b, e - b);
}

bool to_int(const std::string& s, int& out) {
  if (s.empty()) return false;
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  return ec == std::errc() && p == s.data() + s.size();
}

// Capture layout shared by every pattern:
//   1..3 date fields (order per FieldOrder), 4 hour, 5 minute,
//   6 second (optional), 7 meridiem (12-hour grammars only).
class RegexGrammar final : public TimestampGrammar {
public:
  RegexGrammar(std::string name, const char* pattern, FieldOrder order, bool twelve_hour)
    : name_(std::move(name)), re_(pattern), order_(order), twelve_hour_(twelve_hour) {
    if (!re_.ok()) throw std::invalid_argument("bad grammar pattern for " + name_ + ": " + re_.error());
  }

  const std::string& name() const override { return name_; }

  std::optional<CivilDateTime> try_parse(std::string_view text) const override {
    std::string g[7];
    const RE2::Arg a0(&g[0]), a1(&g[1]), a2(&g[2]), a3(&g[3]), a4(&g[4]), a5(&g[5]), a6(&g[6]);
    const RE2::Arg* args[] = {&a0, &a1, &a2, &a3, &a4, &a5, &a6};
    const int n = re_.NumberOfCapturingGroups();
    if (n < 5 || n > 7) return std::nullopt;
    if (!RE2::FullMatchN(re2::StringPiece(text.data(), text.size()), re_, args, n))
      return std::nullopt;

    int f0 = 0, f1 = 0, f2 = 0;
    if (!to_int(g[0], f0) || !to_int(g[1], f1) || !to_int(g[2], f2)) return std::nullopt;

    CivilDateTime c;
    switch (order_) {
      case FieldOrder::DMY: c.day = f0;  c.month = f1; c.year = f2; break;
      case FieldOrder::MDY: c.month = f0; c.day = f1;  c.year = f2; break;
      case FieldOrder::YMD: c.year = f0;  c.month = f1; c.day = f2; break;
    }
    if (g[2].size() == 2 && order_ != FieldOrder::YMD) c.year += (c.year >= 70 ? 1900 : 2000);

    if (!to_int(g[3], c.hour) || !to_int(g[4], c.minute)) return std::nullopt;
    if (!g[5].empty() && !to_int(g[5], c.second)) return std::nullopt;

    if (twelve_hour_) {
      if (c.hour < 1 || c.hour > 12) return std::nullopt;
      const bool pm = !g[6].empty() && (g[6][0] == 'p' || g[6][0] == 'P');
      if (pm && c.hour < 12) c.hour += 12;
      if (!pm && c.hour == 12) c.hour = 0;
    }

    if (!is_valid_civil(c)) return std::nullopt;
    return c;
  }

private:
  std::string name_;
  RE2 re_;
  FieldOrder order_;
  bool twelve_hour_;
};

}

const std::vector<std::string>& builtin_grammar_names() {
  static const std::vector<std::string> names = {
    "bracketed_dmy_hms", "dmy_hms", "dmy_12h", "dmy_24h", "iso8601", "mdy_12h", "mdy_hms"};
  return names;
}

const std::vector<std::string>& default_grammar_order() {
  static const std::vector<std::string> order = {
    "bracketed_dmy_hms", "dmy_hms", "dmy_12h", "dmy_24h", "iso8601"};
  return order;
}

// Date and time are split by ", " or by whitespace alone; the comma is optional
// in every slash grammar so that each shape HeaderGrammar accepts has a reader.
std::unique_ptr<TimestampGrammar> make_builtin_grammar(std::string_view name) {
  if (name == "bracketed_dmy_hms")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{1,2})/(\d{1,2})/(\d{4})(?:,\s*|\s+)(\d{1,2}):(\d{2}):(\d{2}))",
      FieldOrder::DMY, false);
  if (name == "dmy_hms")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{1,2})/(\d{1,2})/(\d{2}|\d{4})(?:,\s*|\s+)(\d{1,2}):(\d{2}):(\d{2}))",
      FieldOrder::DMY, false);
  if (name == "dmy_12h")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{1,2})/(\d{1,2})/(\d{2}|\d{4})(?:,\s*|\s+)(\d{1,2}):(\d{2})(?::(\d{2}))?\s*((?i:am|pm)))",
      FieldOrder::DMY, true);
  if (name == "dmy_24h")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{1,2})/(\d{1,2})/(\d{2}|\d{4})(?:,\s*|\s+)(\d{1,2}):(\d{2}))",
      FieldOrder::DMY, false);
  if (name == "iso8601")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{4})-(\d{2})-(\d{2})[T ](\d{2}):(\d{2}):(\d{2}))",
      FieldOrder::YMD, false);
  if (name == "mdy_12h")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{1,2})/(\d{1,2})/(\d{2}|\d{4})(?:,\s*|\s+)(\d{1,2}):(\d{2})(?::(\d{2}))?\s*((?i:am|pm)))",
      FieldOrder::MDY, true);
  if (name == "mdy_hms")
    return std::make_unique<RegexGrammar>(std::string(name),
      R"((\d{1,2})/(\d{1,2})/(\d{2}|\d{4})(?:,\s*|\s+)(\d{1,2}):(\d{2}):(\d{2}))",
      FieldOrder::MDY, false);
  return nullptr;
}

TimestampNormalizer::TimestampNormalizer() : TimestampNormalizer(Config{}) {}

TimestampNormalizer::TimestampNormalizer(const Config& cfg) {
  auto off = resolve_utc_offset(cfg.reference_timezone);
  if (!off) throw std::invalid_argument("unknown reference timezone: " + cfg.reference_timezone);
  offset_minutes_ = *off;

  grammars_.reserve(cfg.grammar_order.size());
  for (const auto& n : cfg.grammar_order) {
    auto g = make_builtin_grammar(n);
    if (!g) throw std::invalid_argument("unknown timestamp grammar: " + n);
    grammars_.push_back(std::move(g));
  }
}

std::optional<AbsoluteTimestamp> TimestampNormalizer::normalize(std::string_view text,
                                                                ParseError* err) const {
  const std::string folded = fold_spaces(text);
  for (const auto& g : grammars_) {
    if (auto c = g->try_parse(folded)) {
      AbsoluteTimestamp ts;
      ts.offset_minutes = offset_minutes_;
      ts.epoch_seconds = civil_to_epoch(*c) - offset_minutes_ * 60LL;
      return ts;
    }
  }
  if (err) {
    err->kind = ParseError::Kind::InvalidTimestamp;
    err->text = std::string(text);
    err->detail = "no grammar matched and validated";
  }
  return std::nullopt;
}

std::string TimestampNormalizer::matching_grammar(std::string_view text) const {
  const std::string folded = fold_spaces(text);
  for (const auto& g : grammars_) if (g->try_parse(folded)) return g->name();
  return {};
}

}
