#pragma once
#include "chat_segmenter/message.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace cs {

enum class LineKind {
  MessageHeader,  // "<ts> <sender>: <content>"
  Notice,         // "<ts> <text>" with no sender segment
  Other           // continuation candidate
};

struct LineMatch {
  LineKind kind = LineKind::Other;
  MessageHeader header;  // sender empty for Notice; content_first_line holds the notice text
};

// Removes a leading UTF-8 BOM and any leading U+200E / U+200F marks.
std::string_view strip_leading_marks(std::string_view s);

// Trims ASCII whitespace at both ends.
std::string_view trim(std::string_view s);

// Line-level recognizer for the bracketed and dashed header layouts.
// Immutable after construction; match() may be called concurrently.
class HeaderGrammar {
public:
  HeaderGrammar();
  ~HeaderGrammar();
  HeaderGrammar(const HeaderGrammar&) = delete;
  HeaderGrammar& operator=(const HeaderGrammar&) = delete;

  LineMatch match(std::string_view line) const;

  // Sender group only; nullopt for notices and non-header lines.
  std::optional<std::string> sender_of(std::string_view line) const;

private:
  struct Impl; Impl* p_;
};

}
