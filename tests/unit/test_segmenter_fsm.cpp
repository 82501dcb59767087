#include "chat_segmenter/header_grammar.hpp"
#include "chat_segmenter/metrics.hpp"
#include "chat_segmenter/segmenter_fsm.hpp"
#include "chat_segmenter/timestamp_normalizer.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

struct Run {
  bool ok = true;
  std::vector<cs::Message> out;
  cs::ParseError err;
  std::vector<cs::ParseError> skipped;
};

static Run segment(const std::vector<std::string>& lines, cs::SegmenterFsm::Config cfg = {},
                   cs::MetricsRegistry* metrics = nullptr) {
  cs::TimestampNormalizer::Config nc;
  nc.reference_timezone = "UTC";
  const cs::TimestampNormalizer norm(nc);
  const cs::HeaderGrammar headers;
  cs::SegmenterFsm fsm(norm, headers, std::move(cfg), metrics);

  Run r;
  auto sink = [&](cs::Message&& m){ r.out.push_back(std::move(m)); };
  for (const auto& l : lines) {
    if (!fsm.feed(l, sink)) { r.ok = false; break; }
  }
  if (r.ok) r.ok = fsm.finish(sink);
  r.err = fsm.error();
  r.skipped = fsm.skipped();
  return r;
}

int main() {
  // Header, continuation, header
  {
    auto r = segment({"[01/02/2023, 14:30:05] Alice: Hello there",
                      "how are you?",
                      "[01/02/2023, 14:31:00] Bob: <Media omitted>"});
    check(r.ok && r.out.size() == 2, "two messages");
    if (r.out.size() == 2) {
      check(r.out[0].id == 1 && r.out[1].id == 2, "ids 1,2");
      check(r.out[0].sender == "Alice" && r.out[0].content == "Hello there\nhow are you?", "alice joined");
      check(r.out[0].message_type == cs::MessageType::Text, "alice text");
      check(r.out[0].timestamp.epoch_seconds == 1675261805, "alice timestamp");
      check(r.out[1].sender == "Bob" && r.out[1].message_type == cs::MessageType::Media, "bob media");
      check(!r.out[0].sentiment_score, "sentiment left empty");
    }
  }

  // Link anywhere in the content
  {
    auto r = segment({"01/02/23, 2:30 PM - Alice: check https://example.com"});
    check(r.ok && r.out.size() == 1 && r.out[0].message_type == cs::MessageType::Link, "link message");
  }

  // Sender-less notice emits nothing
  {
    auto r = segment({"01/02/2023, 09:00:00 AM - Security code changed"});
    check(r.ok && r.out.empty(), "notice dropped");
  }

  // Invalid date stops the scan and nothing is kept
  {
    auto r = segment({"[01/02/2023, 14:30:05] Alice: fine",
                      "[99/99/2023, 10:00:00] Alice: bad date",
                      "[01/02/2023, 14:31:00] Bob: after"});
    check(!r.ok, "strict failure");
    check(r.err.kind == cs::ParseError::Kind::InvalidTimestamp, "InvalidTimestamp");
    check(r.err.line == 2, "error line 2");
    check(r.err.text == "99/99/2023, 10:00:00", "error text");
    check(r.out.empty(), "pending message discarded");
  }

  // Continuations kept verbatim, blank lines included
  {
    auto r = segment({"[01/02/2023, 14:32:10] Alice: list:",
                      "  - milk  ",
                      "",
                      "\t- eggs"});
    check(r.ok && r.out.size() == 1, "one multi-line message");
    if (!r.out.empty())
      check(r.out[0].content == "list:\n  - milk  \n\n\t- eggs", "continuations verbatim");
  }

  // Lines before the first header are dropped
  {
    cs::MetricsRegistry metrics;
    auto r = segment({"exported from phone", "", "[01/02/2023, 14:30:05] Alice: hi"}, {}, &metrics);
    check(r.ok && r.out.size() == 1 && r.out[0].content == "hi", "leading orphans ignored");
    auto s = metrics.snapshot(1.0);
    check(s.orphan_lines == 2 && s.lines == 3 && s.headers == 1 && s.messages == 1, "orphan counters");
  }

  // A notice between messages seals the pending one; text after it is orphaned
  {
    auto r = segment({"[01/02/2023, 14:30:05] Alice: one",
                      "01/02/2023, 14:30:30 - Bob left",
                      "stray",
                      "[01/02/2023, 14:31:00] Bob: two"});
    check(r.ok && r.out.size() == 2, "notice between messages");
    if (r.out.size() == 2) {
      check(r.out[0].content == "one", "notice not appended");
      check(r.out[1].id == 2, "ids stay contiguous");
    }
  }

  // System header with a sender is filtered by pattern...
  const std::vector<std::string> sys_lines = {
    "[01/02/2023, 14:29:00] Family: Messages and calls are end-to-end encrypted.",
    "[01/02/2023, 14:30:05] Alice: hi"};
  {
    auto r = segment(sys_lines);
    check(r.ok && r.out.size() == 1 && r.out[0].sender == "Alice" && r.out[0].id == 1, "system header filtered");
  }
  // ...and kept when the pattern list is empty
  {
    cs::SegmenterFsm::Config cfg;
    cfg.system_notice_patterns.clear();
    auto r = segment(sys_lines, cfg);
    check(r.ok && r.out.size() == 2 && r.out[0].sender == "Family", "non-filtering variant keeps it");
  }

  // Lenient: bad header becomes continuation text and is reported
  {
    cs::SegmenterFsm::Config cfg;
    cfg.on_error = cs::SegmenterFsm::OnTimestampError::Lenient;
    auto r = segment({"[01/02/2023, 14:30:05] Alice: fine",
                      "[31/02/2023, 10:00:00] Bob: impossible",
                      "[01/02/2023, 14:31:00] Alice: after"}, cfg);
    check(r.ok && r.out.size() == 2, "lenient keeps going");
    check(r.skipped.size() == 1 && r.skipped[0].line == 2, "lenient records the skip");
    if (r.out.size() == 2)
      check(r.out[0].content == "fine\n[31/02/2023, 10:00:00] Bob: impossible", "bad header kept as text");
  }

  // Header whose content is only marks is not emitted
  {
    auto r = segment({"[01/02/2023, 14:30:05] Alice: \xE2\x80\x8E",
                      "[01/02/2023, 14:31:00] Bob: yo"});
    check(r.ok && r.out.size() == 1 && r.out[0].sender == "Bob" && r.out[0].id == 1, "mark-only header skipped");
  }
  // ...but a continuation gives it content, with no leading separator
  {
    auto r = segment({"[01/02/2023, 14:30:05] Alice: \xE2\x80\x8E",
                      "photo caption",
                      "[01/02/2023, 14:31:00] Bob: yo"});
    check(r.ok && r.out.size() == 2, "mark-only header with continuation kept");
    if (r.out.size() == 2) {
      check(r.out[0].sender == "Alice" && r.out[0].content == "photo caption", "no leading separator");
      check(r.out[1].id == 2, "bob follows");
    }
  }

  // Short-year and comma-less timestamps segment under the default grammars
  {
    auto r = segment({"[01/02/23, 14:30:05] Alice: hi",
                      "01/02/23, 14:30:05 - Bob: hi",
                      "01/02/2023 14:30 - Carol: hi"});
    check(r.ok && r.out.size() == 3, "short-year and comma-less headers parse");
    if (r.out.size() == 3) {
      check(r.out[0].timestamp.epoch_seconds == 1675261805, "bracketed short year");
      check(r.out[1].timestamp.epoch_seconds == 1675261805, "dash short year");
      check(r.out[2].timestamp.epoch_seconds == 1675261800 && r.out[2].sender == "Carol", "comma-less dash");
    }
  }

  // Empty input
  {
    auto r = segment({});
    check(r.ok && r.out.empty(), "empty input");
  }

  if (failures) { std::cerr << "[FAIL] " << failures << " segmenter checks failed\n"; return 1; }
  std::cout << "[PASS] segmenter fsm\n";
  return 0;
}
