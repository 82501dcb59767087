#pragma once
#include "chat_segmenter/date_parse.hpp"
#include "chat_segmenter/message.hpp"
#include "chat_segmenter/parse_error.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cs {

// One textual timestamp notation. try_parse returns the civil fields only
// when the text matches the shape AND every field is in range.
class TimestampGrammar {
public:
  virtual ~TimestampGrammar() = default;
  virtual const std::string& name() const = 0;
  virtual std::optional<CivilDateTime> try_parse(std::string_view text) const = 0;
};

// Built-in grammars: "bracketed_dmy_hms", "dmy_hms", "dmy_12h", "dmy_24h",
// "iso8601", "mdy_12h", "mdy_hms". Returns nullptr for an unknown name.
std::unique_ptr<TimestampGrammar> make_builtin_grammar(std::string_view name);

const std::vector<std::string>& builtin_grammar_names();
const std::vector<std::string>& default_grammar_order();

class TimestampNormalizer {
public:
  struct Config {
    std::vector<std::string> grammar_order = default_grammar_order();
    std::string reference_timezone = "local";
  };

  TimestampNormalizer();  // default Config{}

  // Throws std::invalid_argument on an unknown grammar name or timezone.
  explicit TimestampNormalizer(const Config& cfg);

  // First grammar (in priority order) that matches and validates wins.
  // On failure `err` (if given) gets InvalidTimestamp with the text.
  std::optional<AbsoluteTimestamp> normalize(std::string_view text,
                                             ParseError* err = nullptr) const;

  // Name of the grammar that would accept `text`, or empty.
  std::string matching_grammar(std::string_view text) const;

  int offset_minutes() const noexcept { return offset_minutes_; }
  std::size_t grammar_count() const noexcept { return grammars_.size(); }

private:
  std::vector<std::unique_ptr<TimestampGrammar>> grammars_;
  int offset_minutes_{0};
};

}
