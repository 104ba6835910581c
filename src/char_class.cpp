#include "char_class.hpp"

#include <unicode/uchar.h>

namespace lexemizer {

bool is_whitespace(char32_t c) {
  switch (c) {
  case U'\t':
  case U'\n':
  case U'\v':
  case U'\f':
  case U'\r':
  case U' ':
  case U'\u0085': // next line
  case U'\u200E': // left-to-right mark
  case U'\u200F': // right-to-left mark
  case U'\u2028': // line separator
  case U'\u2029': // paragraph separator
    return true;
  default:
    return false;
  }
}

bool is_id_start(char32_t c) {
  if (c < 0x80) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
  }
  if (c > 0x10FFFF) {
    return false;
  }
  return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_XID_START) != 0;
}

bool is_id_continue(char32_t c) {
  if (c < 0x80) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_';
  }
  if (c > 0x10FFFF) {
    return false;
  }
  return u_hasBinaryProperty(static_cast<UChar32>(c), UCHAR_XID_CONTINUE) !=
         0;
}

bool is_ascii_digit(char32_t c) { return c >= '0' && c <= '9'; }

bool is_hex_digit(char32_t c) {
  return is_ascii_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

} // namespace lexemizer
