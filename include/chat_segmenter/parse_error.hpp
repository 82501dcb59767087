#pragma once
#include <cstdint>
#include <string>

namespace cs {

struct ParseError {
  enum class Kind { None, IoError, InvalidTimestamp };

  Kind kind = Kind::None;
  std::string text;          // offending timestamp text, or the path for IoError
  std::uint64_t line = 0;    // 1-based; 0 when not tied to a line
  std::string detail;        // errno text / extra context

  bool ok() const noexcept { return kind == Kind::None; }
  void clear() { kind = Kind::None; text.clear(); line = 0; detail.clear(); }

  // "InvalidTimestamp at line 4: '99/99/2023, 10:00:00'"
  std::string message() const;
};

const char* kind_name(ParseError::Kind k);

}
