#include "chat_segmenter/segmenter_fsm.hpp"
#include "chat_segmenter/header_grammar.hpp"
#include "chat_segmenter/metrics.hpp"
#include "chat_segmenter/timestamp_normalizer.hpp"

#include <optional>
#include <string_view>
#include <utility>

namespace cs {

struct PendingMessage {
  AbsoluteTimestamp timestamp;
  std::string sender;
  std::string content;
};

struct SegmenterFsm::Impl {
  const TimestampNormalizer& normalizer;
  const HeaderGrammar& headers;
  Config cfg;
  MetricsRegistry* metrics;
  std::optional<PendingMessage> pending;

  void seal(std::uint64_t& emitted, const MessageCallback& on_message) {
    if (!pending) return;
    PendingMessage done = std::move(*pending);
    pending.reset();
    if (done.content.empty()) return;  // header held only bidi marks

    Message m;
    m.id = ++emitted;
    m.timestamp = done.timestamp;
    m.sender = std::move(done.sender);
    m.content = std::move(done.content);
    m.message_type = classify_content(m.content);
    if (metrics) metrics->add_message();
    on_message(std::move(m));
  }

  void append(std::string_view line) {
    if (!pending->content.empty()) pending->content.append(cfg.line_separator);
    pending->content.append(line.data(), line.size());
    if (metrics) metrics->add_continuation();
  }

  void continuation_or_orphan(std::string_view line) {
    if (pending) append(line);
    else if (metrics) metrics->add_orphan();
  }
};

SegmenterFsm::SegmenterFsm(const TimestampNormalizer& normalizer, const HeaderGrammar& headers,
                           Config cfg, MetricsRegistry* metrics)
  : p_(new Impl{normalizer, headers, std::move(cfg), metrics, std::nullopt}) {}

SegmenterFsm::~SegmenterFsm() { delete p_; }

bool SegmenterFsm::has_pending() const { return p_->pending.has_value(); }

bool SegmenterFsm::feed(std::string_view line, const MessageCallback& on_message) {
  if (!err_.ok()) return false;
  ++line_no_;
  if (p_->metrics) p_->metrics->add_line();

  LineMatch m = p_->headers.match(line);

  if (m.kind == LineKind::Other) {
    p_->continuation_or_orphan(line);
    return true;
  }

  if (m.kind == LineKind::Notice ||
      is_system_notice(m.header.content_first_line, p_->cfg.system_notice_patterns)) {
    p_->seal(emitted_, on_message);
    if (p_->metrics) p_->metrics->add_system_line();
    return true;
  }

  ParseError perr;
  auto ts = p_->normalizer.normalize(m.header.timestamp_text, &perr);
  if (!ts) {
    perr.line = line_no_;
    if (p_->metrics) p_->metrics->add_timestamp_error();
    if (p_->cfg.on_error == OnTimestampError::Strict) {
      p_->pending.reset();
      err_ = std::move(perr);
      return false;
    }
    skipped_.push_back(std::move(perr));
    p_->continuation_or_orphan(line);
    return true;
  }

  p_->seal(emitted_, on_message);
  if (p_->metrics) p_->metrics->add_header();
  p_->pending = PendingMessage{*ts, std::move(m.header.sender),
                               std::move(m.header.content_first_line)};
  return true;
}

bool SegmenterFsm::finish(const MessageCallback& on_message) {
  if (!err_.ok()) return false;
  p_->seal(emitted_, on_message);
  return true;
}

}
