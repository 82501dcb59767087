#include "chat_segmenter/messages_json.hpp"
#include <simdjson.h>
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  cs::Message m;
  m.id = 7;
  m.timestamp = {1675261805, 60};
  m.sender = "Al \"the\" ice";
  m.content = "line one\nline\ttwo \\ end";
  m.message_type = cs::MessageType::VoiceNote;

  std::vector<cs::Message> msgs = {m};
  cs::ParseError skipped;
  skipped.kind = cs::ParseError::Kind::InvalidTimestamp;
  skipped.line = 4;
  skipped.text = "31/02/2023, 10:00:00";
  std::vector<cs::ParseError> errs = {skipped};

  cs::MessagesJsonPayload p;
  p.source = "chat.txt";
  p.user_identity = "Alice";
  p.reference_timezone = "+01:00";
  p.stats.lines = 12;
  p.stats.messages = 1;
  p.messages = &msgs;
  p.skipped = &errs;

  const std::string json = cs::MessagesJsonWriter::to_json(p);

  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(json);
    auto doc = parser.iterate(padded);

    std::string_view source = doc["source"].get_string();
    check(source == "chat.txt", "source");
    std::string_view user = doc["user_identity"].get_string();
    check(user == "Alice", "user_identity");
    uint64_t lines = doc["stats"]["lines"].get_uint64();
    check(lines == 12, "stats.lines");

    // 15:30 on Wednesday 2023-02-01 at +01:00
    simdjson::ondemand::object chat = doc["chat_stats"].get_object();
    uint64_t total = chat["total_messages"].get_uint64();
    check(total == 1, "chat_stats.total_messages");
    std::string_view start = chat["date_range"]["start"].get_string();
    check(start == "2023-02-01", "chat_stats.date_range.start");
    size_t shares = 0;
    for (auto v : chat["by_sender"].get_array()) {
      double pct = v["percentage"].get_double();
      check(pct == 100.0, "single sender has 100%");
      ++shares;
    }
    check(shares == 1, "one sender share");
    std::string_view busiest = chat["busiest_day"].get_string();
    check(busiest == "Wednesday", "busiest day uses the local wall clock");
    uint64_t hour = chat["busiest_hour"].get_uint64();
    check(hour == 15, "busiest hour at +01:00");

    size_t n = 0;
    for (auto v : doc["messages"].get_array()) {
      simdjson::ondemand::object o = v.get_object();
      uint64_t id = o["id"].get_uint64();
      check(id == 7, "id");
      std::string_view ts = o["timestamp"].get_string();
      check(ts == "2023-02-01T15:30:05+01:00", "timestamp rfc3339: " + std::string(ts));
      int64_t epoch = o["epoch_seconds"].get_int64();
      check(epoch == 1675261805, "epoch");
      std::string_view sender = o["sender"].get_string();
      check(sender == "Al \"the\" ice", "escaped sender round trip");
      std::string_view content = o["content"].get_string();
      check(content == "line one\nline\ttwo \\ end", "escaped content round trip");
      std::string_view type = o["type"].get_string();
      check(type == "voice_note", "type tag");
      check(o["sentiment_score"].is_null(), "sentiment null");
      ++n;
    }
    check(n == 1, "one message");

    size_t e = 0;
    for (auto v : doc["errors"].get_array()) {
      simdjson::ondemand::object o = v.get_object();
      std::string_view kind = o["kind"].get_string();
      check(kind == "InvalidTimestamp", "error kind");
      uint64_t line = o["line"].get_uint64();
      check(line == 4, "error line");
      ++e;
    }
    check(e == 1, "one error");
  } catch (const simdjson::simdjson_error& ex) {
    std::cerr << "[FAIL] json did not parse: " << ex.what() << "\n" << json << "\n";
    return 1;
  }

  check(cs::MessagesJsonWriter::senders_json({"Bob", "Alice"}) == R"({"senders":["Alice","Bob"]})",
        "senders sorted");

  cs::ParseError io;
  io.kind = cs::ParseError::Kind::IoError;
  io.text = "x.txt";
  io.detail = "No such file or directory";
  check(cs::MessagesJsonWriter::error_json(io) ==
        R"({"error":{"kind":"IoError","line":0,"text":"x.txt","detail":"No such file or directory"}})",
        "error json");

  if (failures) { std::cerr << "[FAIL] " << failures << " json checks failed\n"; return 1; }
  std::cout << "[PASS] messages json\n";
  return 0;
}
