#pragma once
#include "chat_segmenter/header_grammar.hpp"
#include "chat_segmenter/message.hpp"
#include "chat_segmenter/parse_error.hpp"
#include "chat_segmenter/parser_config.hpp"
#include "chat_segmenter/segmenter_fsm.hpp"
#include "chat_segmenter/timestamp_normalizer.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace cs {

class MetricsRegistry;

// Splits on '\n' and drops one trailing '\r' per line. A trailing newline
// does not produce an empty last line.
std::vector<std::string> split_lines(std::string_view text);

// Entry point for hosts. Holds the immutable pieces (normalizer, header
// grammar, config); every call builds its own SegmenterFsm, so one parser
// can serve concurrent calls.
class ChatParser {
public:
  struct LenientResult {
    std::vector<Message> messages;
    std::vector<ParseError> skipped;  // headers whose timestamp failed
  };

  ChatParser();                          // ParserConfig{}
  explicit ChatParser(ParserConfig cfg); // throws std::invalid_argument if !cfg.validate()

  // All-or-nothing: on failure `out` is empty and `err` says why.
  bool parse_lines(const std::vector<std::string>& lines, std::vector<Message>& out,
                   ParseError* err = nullptr, MetricsRegistry* metrics = nullptr) const;
  bool parse_text(std::string_view text, std::vector<Message>& out,
                  ParseError* err = nullptr, MetricsRegistry* metrics = nullptr) const;
  bool parse_file(const std::string& path, std::vector<Message>& out,
                  ParseError* err = nullptr, MetricsRegistry* metrics = nullptr) const;

  // Keeps going past bad header timestamps. Only I/O errors fail (file form).
  LenientResult parse_lines_lenient(const std::vector<std::string>& lines,
                                    MetricsRegistry* metrics = nullptr) const;
  LenientResult parse_text_lenient(std::string_view text,
                                   MetricsRegistry* metrics = nullptr) const;
  bool parse_file_lenient(const std::string& path, LenientResult& out,
                          ParseError* err = nullptr, MetricsRegistry* metrics = nullptr) const;

  // Distinct sender groups of message header lines. No timestamp validation.
  std::unordered_set<std::string> detect_senders(const std::vector<std::string>& lines) const;
  std::unordered_set<std::string> detect_senders_text(std::string_view text) const;
  bool detect_senders_file(const std::string& path, std::unordered_set<std::string>& out,
                           ParseError* err = nullptr) const;

  const ParserConfig& config() const noexcept { return cfg_; }
  const TimestampNormalizer& normalizer() const noexcept { return normalizer_; }
  const HeaderGrammar& headers() const noexcept { return headers_; }

private:
  // Drives a line callback over some input; fills `io` on read failure.
  using LineSink = std::function<bool(std::string_view)>;
  using LineSource = std::function<void(const LineSink&, ParseError& io)>;

  bool run(const LineSource& source, SegmenterFsm::OnTimestampError mode,
           std::vector<Message>& out, std::vector<ParseError>* skipped,
           ParseError* err, MetricsRegistry* metrics) const;

  ParserConfig cfg_;
  TimestampNormalizer normalizer_;
  HeaderGrammar headers_;
};

}
