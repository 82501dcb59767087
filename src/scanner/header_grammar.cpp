#include "chat_segmenter/header_grammar.hpp"

#include <re2/re2.h>
#include <string>
#include <string_view>

namespace cs {

// Timestamp shape only; calendar validation belongs to TimestampNormalizer.
// \x{00A0} and \x{202F} show up around the meridiem in newer exports.
// Every shape here has a built-in grammar that can read it.
static const std::string kSp = R"([\s\x{00A0}\x{202F}])";
static const std::string kTs =
    R"(\d{1,2}/\d{1,2}/(?:\d{2}|\d{4}),?)" + kSp + R"(+\d{1,2}:\d{2}(?::\d{2})?(?:)" + kSp +
    R"(*(?i:am|pm))?|\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2})";

static const std::string kBracketHeader = R"(\[()" + kTs + R"()\]\s*([^:]+):\s+(.*\S.*))";
static const std::string kDashHeader    = "(" + kTs + R"()\s+-\s+([^:]+):\s+(.*\S.*))";
static const std::string kBracketNotice = R"(\[()" + kTs + R"()\]\s*([^:]*\S[^:]*))";
static const std::string kDashNotice    = "(" + kTs + R"()\s+-\s+([^:]*\S[^:]*))";

std::string_view strip_leading_marks(std::string_view s) {
  while (true) {
    if (s.size() >= 3 && (unsigned char)s[0] == 0xEF && (unsigned char)s[1] == 0xBB && (unsigned char)s[2] == 0xBF) {
      s.remove_prefix(3); continue;                                  // BOM
    }
    if (s.size() >= 3 && (unsigned char)s[0] == 0xE2 && (unsigned char)s[1] == 0x80 &&
        ((unsigned char)s[2] == 0x8E || (unsigned char)s[2] == 0x8F)) {
      s.remove_prefix(3); continue;                                  // LRM / RLM
    }
    return s;
  }
}

std::string_view trim(std::string_view s) {
  auto sp = [](char c){ return c==' ' || c=='\t' || c=='\r' || c=='\n' || c=='\f' || c=='\v'; };
  while (!s.empty() && sp(s.front())) s.remove_prefix(1);
  while (!s.empty() && sp(s.back()))  s.remove_suffix(1);
  return s;
}

struct HeaderGrammar::Impl {
  RE2 bracket_header{kBracketHeader};
  RE2 dash_header{kDashHeader};
  RE2 bracket_notice{kBracketNotice};
  RE2 dash_notice{kDashNotice};

  bool match_header(re2::StringPiece line, MessageHeader& h) const {
    std::string ts, sender, content;
    if (!RE2::FullMatch(line, bracket_header, &ts, &sender, &content) &&
        !RE2::FullMatch(line, dash_header, &ts, &sender, &content))
      return false;
    h.timestamp_text = std::move(ts);
    h.sender = std::string(trim(sender));
    h.content_first_line = std::string(trim(strip_leading_marks(trim(content))));
    return true;
  }

  bool match_notice(re2::StringPiece line, MessageHeader& h) const {
    std::string ts, text;
    if (!RE2::FullMatch(line, bracket_notice, &ts, &text) &&
        !RE2::FullMatch(line, dash_notice, &ts, &text))
      return false;
    h.timestamp_text = std::move(ts);
    h.sender.clear();
    h.content_first_line = std::string(trim(strip_leading_marks(trim(text))));
    return true;
  }
};

HeaderGrammar::HeaderGrammar() : p_(new Impl) {}
HeaderGrammar::~HeaderGrammar() { delete p_; }

LineMatch HeaderGrammar::match(std::string_view line) const {
  LineMatch m;
  const std::string_view s = strip_leading_marks(line);
  const re2::StringPiece sp(s.data(), s.size());
  if (p_->match_header(sp, m.header))      m.kind = LineKind::MessageHeader;
  else if (p_->match_notice(sp, m.header)) m.kind = LineKind::Notice;
  return m;
}

std::optional<std::string> HeaderGrammar::sender_of(std::string_view line) const {
  const std::string_view s = strip_leading_marks(line);
  MessageHeader h;
  if (!p_->match_header(re2::StringPiece(s.data(), s.size()), h)) return std::nullopt;
  return h.sender;
}

}
