#include "chat_segmenter/messages_json.hpp"
#include "chat_segmenter/chat_stats.hpp"
#include "chat_segmenter/date_parse.hpp"

#include <algorithm>
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>
#include <string_view>

namespace cs {

static void esc(std::ostringstream& o, std::string_view s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8]; std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void write_message(std::ostringstream& o, const Message& m) {
  o << "{\"id\":" << m.id << ",";
  o << "\"timestamp\":"; esc(o, format_rfc3339(m.timestamp.epoch_seconds, m.timestamp.offset_minutes)); o << ",";
  o << "\"epoch_seconds\":" << m.timestamp.epoch_seconds << ",";
  o << "\"sender\":"; esc(o, m.sender); o << ",";
  o << "\"content\":"; esc(o, m.content); o << ",";
  o << "\"type\":"; esc(o, to_string(m.message_type)); o << ",";
  o << "\"sentiment_score\":";
  if (m.sentiment_score) o << safe_num(*m.sentiment_score); else o << "null";
  o << "}";
}

static void write_error(std::ostringstream& o, const ParseError& e) {
  o << "{\"kind\":"; esc(o, kind_name(e.kind));
  o << ",\"line\":" << e.line;
  o << ",\"text\":"; esc(o, e.text);
  o << ",\"detail\":"; esc(o, e.detail);
  o << "}";
}

static void write_chat_stats(std::ostringstream& o, const ChatStatistics& c) {
  o << "{\"total_messages\":" << c.total_messages;
  o << ",\"date_range\":{\"start\":"; esc(o, c.first_date);
  o << ",\"end\":"; esc(o, c.last_date); o << "}";
  o << ",\"by_sender\":[";
  for (size_t i=0;i<c.by_sender.size();++i){
    if (i) o << ",";
    o << "{\"sender\":"; esc(o, c.by_sender[i].sender);
    o << ",\"count\":" << c.by_sender[i].count;
    o << ",\"percentage\":" << safe_num(c.by_sender[i].percentage) << "}";
  }
  o << "],\"by_weekday\":[";
  for (int d=0; d<7; ++d){
    if (d) o << ",";
    o << "{\"day\":"; esc(o, weekday_name(d));
    o << ",\"count\":" << c.by_weekday[d] << "}";
  }
  o << "],\"by_hour\":[";
  for (int h=0; h<24; ++h){
    if (h) o << ",";
    o << c.by_hour[h];
  }
  o << "],\"busiest_day\":"; esc(o, c.busiest_day);
  o << ",\"quietest_day\":"; esc(o, c.quietest_day);
  o << ",\"busiest_hour\":" << c.busiest_hour;
  o << ",\"active_days\":" << c.active_days;
  o << ",\"average_messages_per_day\":" << safe_num(c.avg_messages_per_day);
  o << "}";
}

std::string MessagesJsonWriter::message_json(const Message& m) {
  std::ostringstream o;
  write_message(o, m);
  return o.str();
}

std::string MessagesJsonWriter::to_json(const MessagesJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"source\":";             esc(o, p.source);             o << ",";
  o << "\"user_identity\":";      esc(o, p.user_identity);      o << ",";
  o << "\"reference_timezone\":"; esc(o, p.reference_timezone); o << ",";

  const ScanStats& s = p.stats;
  o << "\"stats\":{";
  o << "\"lines\":" << s.lines << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"headers\":" << s.headers << ",";
  o << "\"system_lines\":" << s.system_lines << ",";
  o << "\"continuations\":" << s.continuations << ",";
  o << "\"orphan_lines\":" << s.orphan_lines << ",";
  o << "\"messages\":" << s.messages << ",";
  o << "\"timestamp_errors\":" << s.timestamp_errors << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"lines_per_sec\":" << safe_num(s.lines_per_sec) << ",";
  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "]},";

  o << "\"chat_stats\":";
  write_chat_stats(o, compute_chat_statistics(p.messages ? *p.messages : std::vector<Message>{}));
  o << ",";

  o << "\"messages\":[";
  if (p.messages) {
    for (size_t i=0;i<p.messages->size();++i){
      if (i) o << ",";
      write_message(o, (*p.messages)[i]);
    }
  }
  o << "],";

  o << "\"errors\":[";
  if (p.skipped) {
    for (size_t i=0;i<p.skipped->size();++i){
      if (i) o << ",";
      write_error(o, (*p.skipped)[i]);
    }
  }
  o << "]";

  o << "}";
  return o.str();
}

std::string MessagesJsonWriter::senders_json(const std::unordered_set<std::string>& senders) {
  std::vector<std::string> sorted(senders.begin(), senders.end());
  std::sort(sorted.begin(), sorted.end());
  std::ostringstream o;
  o << "{\"senders\":[";
  for (size_t i=0;i<sorted.size();++i){
    if (i) o << ",";
    esc(o, sorted[i]);
  }
  o << "]}";
  return o.str();
}

std::string MessagesJsonWriter::error_json(const ParseError& e) {
  std::ostringstream o;
  o << "{\"error\":";
  write_error(o, e);
  o << "}";
  return o.str();
}

}
