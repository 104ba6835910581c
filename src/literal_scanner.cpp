#include "literal_scanner.hpp"
#include "char_class.hpp"

#include <algorithm>

namespace lexemizer {
namespace {

bool eat_decimal_digits(Cursor &cursor) {
  bool has_digits = false;
  for (;;) {
    char32_t c = cursor.peek();
    if (is_ascii_digit(c)) {
      has_digits = true;
    } else if (c != U'_') {
      break;
    }
    cursor.advance();
  }
  return has_digits;
}

bool eat_hexadecimal_digits(Cursor &cursor) {
  bool has_digits = false;
  for (;;) {
    char32_t c = cursor.peek();
    if (is_hex_digit(c)) {
      has_digits = true;
    } else if (c != U'_') {
      break;
    }
    cursor.advance();
  }
  return has_digits;
}

bool is_digit_or_separator(char32_t c) {
  return is_ascii_digit(c) || c == U'_';
}

// `e`/`E`, an optional sign, then a digit or separator.
bool at_exponent(const Cursor &cursor) {
  char32_t marker = cursor.peek();
  if (marker != U'e' && marker != U'E') {
    return false;
  }
  char32_t next = cursor.peek(1);
  if (next == U'+' || next == U'-') {
    return is_digit_or_separator(cursor.peek(2));
  }
  return is_digit_or_separator(next);
}

void eat_exponent(Cursor &cursor) {
  cursor.advance(); // e or E
  if (cursor.peek() == U'+' || cursor.peek() == U'-') {
    cursor.advance();
  }
  eat_decimal_digits(cursor);
}

} // namespace

LiteralKind scan_number(Cursor &cursor) {
  char32_t first = cursor.advance();

  if (first == U'0') {
    switch (cursor.peek()) {
    case U'b':
    case U'o':
      cursor.advance();
      if (!eat_decimal_digits(cursor)) {
        return LiteralKind::Integer;
      }
      break;
    case U'x':
      cursor.advance();
      if (!eat_hexadecimal_digits(cursor)) {
        return LiteralKind::Integer;
      }
      break;
    default:
      eat_decimal_digits(cursor);
      break;
    }
  } else {
    eat_decimal_digits(cursor);
  }

  // A dot only belongs to the number when a digit follows it, which keeps
  // `1..2`, `1.max(2)` and a trailing `1.` out of the literal.
  if (cursor.peek() == U'.' && is_ascii_digit(cursor.peek(1))) {
    cursor.advance();
    eat_decimal_digits(cursor);
    if (at_exponent(cursor)) {
      eat_exponent(cursor);
    }
    return LiteralKind::Float;
  }

  if (at_exponent(cursor)) {
    eat_exponent(cursor);
    return LiteralKind::Float;
  }
  return LiteralKind::Integer;
}

bool scan_double_quoted(Cursor &cursor) {
  cursor.advance(); // opening quote
  while (!cursor.is_eof()) {
    char32_t c = cursor.advance();
    if (c == U'"') {
      return true;
    }
    if (c == U'\\' && (cursor.peek() == U'\\' || cursor.peek() == U'"')) {
      cursor.advance();
    }
  }
  return false;
}

bool scan_single_quoted(Cursor &cursor) {
  cursor.advance(); // opening quote

  // One plain character followed by the closing quote, including `'''`.
  if (cursor.peek(1) == U'\'' && cursor.peek() != U'\\') {
    cursor.advance(2);
    return true;
  }

  for (;;) {
    char32_t c = cursor.peek();
    if (c == U'\'') {
      cursor.advance();
      return true;
    }
    if (c == Cursor::kEndOfInput) {
      return false;
    }
    if (c == U'\\') {
      cursor.advance();
    }
    cursor.advance();
  }
}

std::optional<std::uint32_t> raw_string_hashes(const Cursor &cursor,
                                               std::size_t prefix_length) {
  // Prefixes are ASCII, so code points and bytes line up here.
  std::string_view rest = cursor.source().substr(
      std::min(cursor.offset() + prefix_length, cursor.source().size()));
  std::size_t hashes = rest.find_first_not_of('#');
  if (hashes == std::string_view::npos || rest[hashes] != '"') {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(hashes);
}

bool scan_raw_string(Cursor &cursor, std::size_t prefix_length,
                     std::uint32_t hashes) {
  cursor.advance(prefix_length + hashes + 1);

  while (!cursor.is_eof()) {
    if (cursor.advance() != U'"') {
      continue;
    }
    // Only as many hashes as opened; extra ones are separate lexemes.
    std::uint32_t closing = 0;
    while (closing < hashes && cursor.peek() == U'#') {
      cursor.advance();
      ++closing;
    }
    if (closing == hashes) {
      return true;
    }
  }
  return false;
}

QuoteScan scan_lifetime_or_char(Cursor &cursor) {
  QuoteScan scan;
  bool can_be_lifetime =
      cursor.peek(2) != U'\'' && is_id_start(cursor.peek(1));

  if (!can_be_lifetime) {
    scan.terminated = scan_single_quoted(cursor);
    if (scan.terminated) {
      eat_literal_suffix(cursor);
    }
    return scan;
  }

  cursor.advance(2);
  cursor.eat_while(is_id_continue);

  if (cursor.peek() == U'\'') {
    // `'abc'`: a character literal with too many characters.
    cursor.advance();
    return scan;
  }

  scan.is_lifetime = true;
  return scan;
}

void eat_literal_suffix(Cursor &cursor) { eat_identifier(cursor); }

bool eat_identifier(Cursor &cursor) {
  if (!is_id_start(cursor.peek())) {
    return false;
  }
  cursor.advance();
  cursor.eat_while(is_id_continue);
  return true;
}

} // namespace lexemizer
