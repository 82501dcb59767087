#include "chat_segmenter/chat_parser.hpp"
#include "chat_segmenter/message_classifier.hpp"
#include <iostream>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool cond, const std::string& what) {
  if (!cond) { std::cerr << "[FAIL] " << what << "\n"; ++failures; }
}

int main() {
  using cs::MessageType;
  using cs::classify_content;

  check(classify_content("Hello there") == MessageType::Text, "text");
  check(classify_content("<Media omitted>") == MessageType::Media, "media");
  check(classify_content("image omitted") == MessageType::Media, "ios image");
  check(classify_content("check https://example.com") == MessageType::Link, "link inside text");
  check(classify_content("http://a.b") == MessageType::Link, "http link");
  check(classify_content("https:// nothing") == MessageType::Text, "scheme without host");
  check(classify_content("audio omitted") == MessageType::VoiceNote, "voice note");
  check(classify_content("Contact card omitted") == MessageType::Card, "contact card");
  check(classify_content("Jane.vcf (file attached)") == MessageType::Card, "vcf attachment");

  // media beats link, link beats voice note
  check(classify_content("<Media omitted> https://x.y") == MessageType::Media, "media first");
  check(classify_content("Voice note https://x.y") == MessageType::Link, "link before voice note");

  cs::ContentMarkers custom;
  custom.media = {"<Medien ausgeschlossen>"};
  check(classify_content("<Medien ausgeschlossen>", custom) == MessageType::Media, "custom media marker");
  check(classify_content("<Media omitted>", custom) == MessageType::Text, "default marker replaced");

  const auto& sys = cs::default_system_notice_patterns();
  check(cs::is_system_notice("Messages and calls are end-to-end encrypted. Tap to learn more.", sys),
        "encryption notice");
  check(cs::is_system_notice("Alice created group \"Trip\"", sys), "group created");
  check(!cs::is_system_notice("<Media omitted>", sys), "media is not a notice");
  check(!cs::is_system_notice("I left early", sys), "ordinary text");
  check(!cs::is_system_notice("Security code changed", {}), "empty pattern list filters nothing");

  // Classifying sealed content again yields the type it was sealed with
  {
    cs::ParserConfig cfg;
    cfg.reference_timezone = "UTC";
    cs::ChatParser parser(cfg);
    std::vector<cs::Message> out;
    const bool ok = parser.parse_lines({"[01/02/2023, 14:30:05] Alice: Hello there",
                                        "how are you?",
                                        "[01/02/2023, 14:31:00] Bob: <Media omitted>",
                                        "01/02/23, 2:30 PM - Alice: check https://example.com"},
                                       out);
    check(ok && out.size() == 3, "sealed messages for reclassification");
    for (const auto& m : out)
      check(classify_content(m.content) == m.message_type,
            "reclassify message " + std::to_string(m.id) + " as " + std::string(cs::to_string(m.message_type)));
  }

  check(cs::to_string(MessageType::VoiceNote) == "voice_note", "to_string voice_note");
  check(cs::to_string(MessageType::Card) == "card", "to_string card");
  check(cs::to_string(MessageType::System) == "system", "to_string system");

  if (failures) { std::cerr << "[FAIL] " << failures << " classifier checks failed\n"; return 1; }
  std::cout << "[PASS] message classifier\n";
  return 0;
}
