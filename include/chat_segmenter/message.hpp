#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cs {

enum class MessageType { Text, Media, Link, VoiceNote, Card, System };

// Lowercase wire name ("text", "media", "link", "voice_note", "card", "system").
std::string_view to_string(MessageType t);

// Absolute instant plus the UTC offset it was interpreted under.
struct AbsoluteTimestamp {
  std::int64_t epoch_seconds = 0;  // UTC
  int offset_minutes = 0;          // east of UTC

  bool operator==(const AbsoluteTimestamp& o) const {
    return epoch_seconds == o.epoch_seconds && offset_minutes == o.offset_minutes;
  }
  bool operator!=(const AbsoluteTimestamp& o) const { return !(*this == o); }
};

// Per-line result of a header grammar match; discarded once absorbed.
struct MessageHeader {
  std::string timestamp_text;
  std::string sender;
  std::string content_first_line;
};

struct Message {
  std::uint64_t id = 0;
  AbsoluteTimestamp timestamp;
  std::string sender;
  std::string content;
  MessageType message_type = MessageType::Text;
  std::optional<double> sentiment_score;  // filled by external scorers only
};

}
