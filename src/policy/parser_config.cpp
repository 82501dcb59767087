#include "chat_segmenter/parser_config.hpp"
#include "chat_segmenter/date_parse.hpp"
#include "chat_segmenter/header_grammar.hpp"

#include <simdjson.h>
#include <algorithm>
#include <iostream>
#include <string>
#include <string_view>

namespace cs {

bool ParserConfig::validate(std::string* err) const {
  if (!resolve_utc_offset(reference_timezone)) {
    if (err) *err = "reference_timezone not understood: '" + reference_timezone + "'";
    return false;
  }
  if (grammar_priority_order.empty()) {
    if (err) *err = "grammar_priority_order is empty";
    return false;
  }
  const auto& known = builtin_grammar_names();
  for (const auto& g : grammar_priority_order) {
    if (std::find(known.begin(), known.end(), g) == known.end()) {
      if (err) *err = "unknown grammar in grammar_priority_order: '" + g + "'";
      return false;
    }
  }
  return true;
}

TimestampNormalizer::Config ParserConfig::normalizer_config() const {
  TimestampNormalizer::Config c;
  c.grammar_order = grammar_priority_order;
  c.reference_timezone = reference_timezone;
  return c;
}

std::vector<std::string> split_list(std::string_view s, char sep) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    size_t pos = s.find(sep, start);
    if (pos == std::string_view::npos) pos = s.size();
    auto item = trim(s.substr(start, pos - start));
    if (!item.empty()) out.emplace_back(item);
    start = pos + 1;
  }
  return out;
}

static std::vector<std::string> read_string_array(simdjson::ondemand::value v) {
  std::vector<std::string> out;
  for (auto el : v.get_array()) {
    std::string_view s = el.get_string();
    out.emplace_back(s);
  }
  return out;
}

bool load_parser_config(const std::string& path, ParserConfig& cfg, std::string* err) {
  ParserConfig next = cfg;
  try {
    simdjson::ondemand::parser parser;
    simdjson::padded_string json = simdjson::padded_string::load(path);
    simdjson::ondemand::document doc = parser.iterate(json);
    simdjson::ondemand::object root = doc.get_object();

    for (auto field : root) {
      std::string_view key = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      if (key == "reference_timezone") {
        std::string_view s = v.get_string();
        next.reference_timezone = std::string(s);
      } else if (key == "grammar_priority_order") {
        next.grammar_priority_order = read_string_array(v);
      } else if (key == "system_notice_patterns") {
        next.system_notice_patterns = read_string_array(v);
      } else if (key == "user_identity") {
        std::string_view s = v.get_string();
        next.user_identity = std::string(s);
      } else {
        std::cerr << "[config] ignoring unknown key '" << key << "' in " << path << "\n";
      }
    }
  } catch (const simdjson::simdjson_error& e) {
    if (err) *err = path + ": " + e.what();
    return false;
  }

  std::string verr;
  if (!next.validate(&verr)) {
    if (err) *err = path + ": " + verr;
    return false;
  }
  cfg = std::move(next);
  return true;
}

}
