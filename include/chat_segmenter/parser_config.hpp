#pragma once
#include "chat_segmenter/message_classifier.hpp"
#include "chat_segmenter/timestamp_normalizer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cs {

struct ParserConfig {
  // "local" | "UTC" | "+HH:MM" ...; resolved once per parser.
  std::string reference_timezone = "local";

  // Tie-break order for TimestampNormalizer; names from builtin_grammar_names().
  std::vector<std::string> grammar_priority_order = default_grammar_order();

  // Empty list keeps system headers as ordinary messages.
  std::vector<std::string> system_notice_patterns = default_system_notice_patterns();

  // Carried to the output for downstream "self vs other"; parsing ignores it.
  std::string user_identity;

  bool validate(std::string* err = nullptr) const;

  TimestampNormalizer::Config normalizer_config() const;
};

// Loads a JSON object with any of the keys above. Missing keys keep the
// values already in `cfg`. Returns false (and fills `err`) on I/O, syntax or
// type errors, or when the result fails validate().
bool load_parser_config(const std::string& path, ParserConfig& cfg, std::string* err = nullptr);

// "a, b,c" -> {"a","b","c"}; empty items dropped.
std::vector<std::string> split_list(std::string_view s, char sep = ',');

}
