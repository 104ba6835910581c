#pragma once

#include <cstddef>

namespace lexemizer {

// A point in the source text.
struct Position {
  std::size_t offset{0}; // 0-based byte offset.
  std::size_t line{1};   // 1-based line number.
  std::size_t column{1}; // 1-based column, counted in code points.
};

// Half-open range [begin, end) of source text.
struct Span {
  Position begin{};
  Position end{};

  std::size_t length() const { return end.offset - begin.offset; }
  bool empty() const { return end.offset == begin.offset; }
};

inline bool operator==(const Position &a, const Position &b) {
  return a.offset == b.offset && a.line == b.line && a.column == b.column;
}

inline bool operator!=(const Position &a, const Position &b) {
  return !(a == b);
}

inline bool operator==(const Span &a, const Span &b) {
  return a.begin == b.begin && a.end == b.end;
}

inline bool operator!=(const Span &a, const Span &b) { return !(a == b); }

} // namespace lexemizer
