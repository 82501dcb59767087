#pragma once
#include "chat_segmenter/message.hpp"
#include "chat_segmenter/message_classifier.hpp"
#include "chat_segmenter/parse_error.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

class TimestampNormalizer;
class HeaderGrammar;
class MetricsRegistry;

// Line-at-a-time message segmenter.
//
// Holds at most one in-progress message. A header line seals the pending
// message and opens a new one; a notice or filtered system header seals the
// pending message and opens nothing; any other line is appended to the
// pending message (or dropped if nothing is pending). finish() seals the
// last one. Ids are assigned at sealing, starting at 1.
class SegmenterFsm {
public:
  // Strict: an unparseable header timestamp stops the scan.
  // Lenient: the header is recorded in skipped() and kept as continuation text.
  enum class OnTimestampError { Strict, Lenient };

  struct Config {
    std::vector<std::string> system_notice_patterns = default_system_notice_patterns();
    OnTimestampError on_error = OnTimestampError::Strict;
    std::string line_separator = "\n";
  };

  using MessageCallback = std::function<void(Message&&)>;

  // `normalizer`, `headers` and `metrics` must outlive the segmenter.
  SegmenterFsm(const TimestampNormalizer& normalizer, const HeaderGrammar& headers,
               Config cfg, MetricsRegistry* metrics = nullptr);
  ~SegmenterFsm();

  SegmenterFsm(const SegmenterFsm&) = delete;
  SegmenterFsm& operator=(const SegmenterFsm&) = delete;

  // Returns false once a strict timestamp failure happened; see error().
  bool feed(std::string_view line, const MessageCallback& on_message);
  bool finish(const MessageCallback& on_message);

  const ParseError& error() const { return err_; }
  const std::vector<ParseError>& skipped() const { return skipped_; }
  std::uint64_t messages() const { return emitted_; }
  std::uint64_t line_no() const { return line_no_; }
  bool has_pending() const;

private:
  struct Impl; Impl* p_;
  std::uint64_t emitted_{0};
  std::uint64_t line_no_{0};
  ParseError err_;
  std::vector<ParseError> skipped_;
};

}
