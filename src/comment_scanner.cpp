#include "comment_scanner.hpp"

namespace lexemizer {
namespace {

bool at_line_end(const Cursor &cursor) {
  char32_t c = cursor.peek();
  return c == U'\n' || (c == U'\r' && cursor.peek(1) == U'\n');
}

void eat_rest_of_line(Cursor &cursor) {
  while (!cursor.is_eof() && !at_line_end(cursor)) {
    cursor.advance();
  }
}

} // namespace

CommentScan scan_line_comment(Cursor &cursor) {
  CommentScan scan;
  char32_t third = cursor.peek(2);
  scan.is_doc =
      third == U'!' || (third == U'/' && cursor.peek(3) != U'/');

  cursor.advance(2);
  eat_rest_of_line(cursor);
  return scan;
}

CommentScan scan_block_comment(Cursor &cursor) {
  CommentScan scan;
  char32_t third = cursor.peek(2);
  char32_t fourth = cursor.peek(3);
  scan.is_doc = third == U'!' ||
                (third == U'*' && fourth != U'*' && fourth != U'/');

  cursor.advance(2);
  std::size_t depth = 1;
  while (!cursor.is_eof()) {
    char32_t c = cursor.advance();
    // Both characters of a delimiter are consumed together, so "/*/" does
    // not close the comment it opens.
    if (c == U'/' && cursor.peek() == U'*') {
      cursor.advance();
      ++depth;
    } else if (c == U'*' && cursor.peek() == U'/') {
      cursor.advance();
      if (--depth == 0) {
        return scan;
      }
    }
  }

  scan.terminated = false;
  return scan;
}

bool at_shebang(const Cursor &cursor) {
  return cursor.offset() == 0 && cursor.peek() == U'#' &&
         cursor.peek(1) == U'!' && cursor.peek(2) != U'[';
}

void scan_shebang(Cursor &cursor) {
  cursor.advance(2);
  eat_rest_of_line(cursor);
}

} // namespace lexemizer
