#include "chat_segmenter/chat_parser.hpp"
#include "chat_segmenter/chunk_reader.hpp"
#include "chat_segmenter/metrics.hpp"

#include <stdexcept>
#include <string_view>
#include <utility>

namespace cs {

std::vector<std::string> split_lines(std::string_view text) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start < text.size()) {
    size_t pos = text.find('\n', start);
    if (pos == std::string_view::npos) pos = text.size();
    std::string_view line = text.substr(start, pos - start);
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    out.emplace_back(line);
    start = pos + 1;
  }
  return out;
}

static ParserConfig checked(ParserConfig cfg) {
  std::string err;
  if (!cfg.validate(&err)) throw std::invalid_argument(err);
  return cfg;
}

ChatParser::ChatParser() : ChatParser(ParserConfig{}) {}

ChatParser::ChatParser(ParserConfig cfg)
  : cfg_(checked(std::move(cfg))),
    normalizer_(cfg_.normalizer_config()),
    headers_() {}

static void from_vector(const std::vector<std::string>& lines, const std::function<bool(std::string_view)>& sink,
                        MetricsRegistry* metrics) {
  for (const auto& l : lines) {
    if (metrics) metrics->add_bytes(l.size() + 1);
    if (!sink(l)) break;
  }
}

static void from_file(const std::string& path, const std::function<bool(std::string_view)>& sink,
                      ParseError& io, MetricsRegistry* metrics) {
  ChunkReader reader(path);
  const bool ok = reader.for_each_line(sink);
  if (metrics) metrics->add_bytes(reader.bytes_read());
  if (!ok) {
    io.kind = ParseError::Kind::IoError;
    io.text = path;
    io.line = 0;
    io.detail = reader.error_text();
  }
}

bool ChatParser::run(const LineSource& source, SegmenterFsm::OnTimestampError mode,
                     std::vector<Message>& out, std::vector<ParseError>* skipped,
                     ParseError* err, MetricsRegistry* metrics) const {
  out.clear();
  if (metrics) metrics->start_stage("segment");

  SegmenterFsm::Config fcfg;
  fcfg.system_notice_patterns = cfg_.system_notice_patterns;
  fcfg.on_error = mode;
  SegmenterFsm fsm(normalizer_, headers_, std::move(fcfg), metrics);

  std::vector<Message> sealed;
  auto on_message = [&](Message&& m){ sealed.push_back(std::move(m)); };

  ParseError io;
  source([&](std::string_view line){ return fsm.feed(line, on_message); }, io);
  const bool finished = io.ok() && fsm.finish(on_message);

  if (metrics) metrics->end_stage("segment");

  if (!io.ok()) { if (err) *err = std::move(io); return false; }
  if (!finished) { if (err) *err = fsm.error(); return false; }

  if (skipped) *skipped = fsm.skipped();
  out = std::move(sealed);
  return true;
}

bool ChatParser::parse_lines(const std::vector<std::string>& lines, std::vector<Message>& out,
                             ParseError* err, MetricsRegistry* metrics) const {
  return run([&](const LineSink& sink, ParseError&){ from_vector(lines, sink, metrics); },
             SegmenterFsm::OnTimestampError::Strict, out, nullptr, err, metrics);
}

bool ChatParser::parse_text(std::string_view text, std::vector<Message>& out,
                            ParseError* err, MetricsRegistry* metrics) const {
  return parse_lines(split_lines(text), out, err, metrics);
}

bool ChatParser::parse_file(const std::string& path, std::vector<Message>& out,
                            ParseError* err, MetricsRegistry* metrics) const {
  return run([&](const LineSink& sink, ParseError& io){ from_file(path, sink, io, metrics); },
             SegmenterFsm::OnTimestampError::Strict, out, nullptr, err, metrics);
}

ChatParser::LenientResult ChatParser::parse_lines_lenient(const std::vector<std::string>& lines,
                                                          MetricsRegistry* metrics) const {
  LenientResult r;
  (void)run([&](const LineSink& sink, ParseError&){ from_vector(lines, sink, metrics); },
            SegmenterFsm::OnTimestampError::Lenient, r.messages, &r.skipped, nullptr, metrics);
  return r;
}

ChatParser::LenientResult ChatParser::parse_text_lenient(std::string_view text,
                                                         MetricsRegistry* metrics) const {
  return parse_lines_lenient(split_lines(text), metrics);
}

bool ChatParser::parse_file_lenient(const std::string& path, LenientResult& out,
                                    ParseError* err, MetricsRegistry* metrics) const {
  out.skipped.clear();
  return run([&](const LineSink& sink, ParseError& io){ from_file(path, sink, io, metrics); },
             SegmenterFsm::OnTimestampError::Lenient, out.messages, &out.skipped, err, metrics);
}

std::unordered_set<std::string> ChatParser::detect_senders(const std::vector<std::string>& lines) const {
  std::unordered_set<std::string> out;
  for (const auto& l : lines) {
    if (auto s = headers_.sender_of(l)) out.insert(std::move(*s));
  }
  return out;
}

std::unordered_set<std::string> ChatParser::detect_senders_text(std::string_view text) const {
  return detect_senders(split_lines(text));
}

bool ChatParser::detect_senders_file(const std::string& path, std::unordered_set<std::string>& out,
                                     ParseError* err) const {
  out.clear();
  std::unordered_set<std::string> found;
  ChunkReader reader(path);
  const bool ok = reader.for_each_line([&](std::string_view line){
    if (auto s = headers_.sender_of(line)) found.insert(std::move(*s));
    return true;
  });
  if (!ok) {
    if (err) {
      err->kind = ParseError::Kind::IoError;
      err->text = path;
      err->line = 0;
      err->detail = reader.error_text();
    }
    return false;
  }
  out = std::move(found);
  return true;
}

}
