#pragma once

#include "position.hpp"

#include <cstddef>
#include <string_view>

namespace lexemizer {

// Forward-only cursor over UTF-8 source text. Tracks byte offset, line and
// column as code points are consumed. Never reads out of range: every peek
// past the last code point yields kEndOfInput.
class Cursor {
public:
  // Not a Unicode scalar value, so it cannot collide with decoded text.
  static constexpr char32_t kEndOfInput = 0x110000;
  // Substituted for bytes that do not start a well-formed UTF-8 sequence.
  static constexpr char32_t kReplacement = 0xFFFD;

  explicit Cursor(std::string_view source);

  // Code point `ahead` positions after the current one (0 = current).
  char32_t peek(std::size_t ahead = 0) const;

  // Consume one code point; returns it, or kEndOfInput at the end.
  char32_t advance();

  // Consume `count` code points.
  void advance(std::size_t count);

  bool is_eof() const { return position_.offset >= source_.size(); }
  const Position &position() const { return position_; }
  std::size_t offset() const { return position_.offset; }
  std::string_view source() const { return source_; }

  // Source text from `start` up to the current offset.
  std::string_view slice_from(std::size_t start) const;

  template <typename Pred> void eat_while(Pred pred) {
    while (!is_eof() && pred(peek())) {
      advance();
    }
  }

private:
  // Decode the code point starting at byte `offset`; `width` receives its
  // encoded length (at least 1 when not at the end).
  char32_t decode(std::size_t offset, std::size_t &width) const;

  std::string_view source_;
  Position position_{};
};

} // namespace lexemizer
