#include "chat_segmenter/message_classifier.hpp"

#include <initializer_list>
#include <string_view>

namespace cs {

static bool contains_any(std::string_view s, const std::vector<std::string>& needles) {
  for (const auto& n : needles) {
    if (!n.empty() && s.find(n) != std::string_view::npos) return true;
  }
  return false;
}

const ContentMarkers& default_content_markers() {
  static const ContentMarkers m{};
  return m;
}

const std::vector<std::string>& default_system_notice_patterns() {
  static const std::vector<std::string> p = {
    "Messages and calls are end-to-end encrypted",
    "Messages to this group are now secured with end-to-end encryption",
    "Security code changed",
    "security code with",
    "created group",
    "created this group",
    "You were added",
    "You were removed",
    "changed the subject",
    "changed this group's icon",
    "changed the group description",
    "This message was deleted",
    "You deleted this message",
    "You blocked this contact",
    "You unblocked this contact",
  };
  return p;
}

bool contains_url(std::string_view s) {
  for (std::string_view scheme : {std::string_view("http://"), std::string_view("https://")}) {
    size_t pos = 0;
    while ((pos = s.find(scheme, pos)) != std::string_view::npos) {
      const size_t host = pos + scheme.size();
      if (host < s.size() && s[host] != ' ' && s[host] != '\t' && s[host] != '\n') return true;
      pos = host;
    }
  }
  return false;
}

MessageType classify_content(std::string_view content, const ContentMarkers& markers) {
  if (contains_any(content, markers.media))        return MessageType::Media;
  if (contains_url(content))                       return MessageType::Link;
  if (contains_any(content, markers.voice_note))   return MessageType::VoiceNote;
  if (contains_any(content, markers.contact_card)) return MessageType::Card;
  return MessageType::Text;
}

bool is_system_notice(std::string_view content, const std::vector<std::string>& patterns) {
  return contains_any(content, patterns);
}

}
