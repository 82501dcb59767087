#include "chat_segmenter/message.hpp"
#include "chat_segmenter/parse_error.hpp"

namespace cs {

std::string_view to_string(MessageType t) {
  switch (t) {
    case MessageType::Text:      return "text";
    case MessageType::Media:     return "media";
    case MessageType::Link:      return "link";
    case MessageType::VoiceNote: return "voice_note";
    case MessageType::Card:      return "card";
    case MessageType::System:    return "system";
    default:                     return "text";
  }
}

const char* kind_name(ParseError::Kind k) {
  switch (k) {
    case ParseError::Kind::IoError:          return "IoError";
    case ParseError::Kind::InvalidTimestamp: return "InvalidTimestamp";
    default:                                 return "None";
  }
}

std::string ParseError::message() const {
  std::string out = kind_name(kind);
  if (line) out += " at line " + std::to_string(line);
  if (!text.empty()) out += ": '" + text + "'";
  if (!detail.empty()) out += " (" + detail + ")";
  return out;
}

}
