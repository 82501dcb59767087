#pragma once
#include "chat_segmenter/message.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cs {

// Markers checked by classify_content, in priority order:
// media -> link -> voice note -> contact card -> text.
struct ContentMarkers {
  std::vector<std::string> media = {"<Media omitted>", "image omitted", "video omitted",
                                    "sticker omitted", "GIF omitted", "document omitted"};
  std::vector<std::string> voice_note = {"Voice note", "audio omitted"};
  std::vector<std::string> contact_card = {"Contact card", "contact card omitted",
                                           ".vcf (file attached)"};
};

const ContentMarkers& default_content_markers();

// Known platform notices (encryption, group creation / membership,
// deletions, security code changes). Substring match, case-sensitive.
const std::vector<std::string>& default_system_notice_patterns();

// True when `s` holds an http:// or https:// URL anywhere.
bool contains_url(std::string_view s);

MessageType classify_content(std::string_view content,
                             const ContentMarkers& markers = default_content_markers());

bool is_system_notice(std::string_view content, const std::vector<std::string>& patterns);

}
