#include "lexeme_checker.hpp"
#include "char_class.hpp"
#include "cursor.hpp"

#include <algorithm>
#include <array>
#include <string_view>

#include <llvm/Support/FormatVariadic.h>

namespace lexemizer {
namespace {

constexpr std::uint32_t kMaxRawHashes = 255;

constexpr std::array<std::string_view, 12> kIntegerSuffixes = {
    "u8", "u16", "u32", "u64", "u128", "usize",
    "i8", "i16", "i32", "i64", "i128", "isize",
};

constexpr std::array<std::string_view, 2> kFloatSuffixes = {"f32", "f64"};

template <std::size_t N>
bool contains(const std::array<std::string_view, N> &list,
              std::string_view value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

unsigned digit_value(char32_t c) {
  if (c <= U'9') {
    return static_cast<unsigned>(c - U'0');
  }
  return static_cast<unsigned>((c | 0x20) - U'a') + 10;
}

const char *base_name(unsigned base) {
  switch (base) {
  case 2:
    return "binary";
  case 8:
    return "octal";
  case 16:
    return "hexadecimal";
  default:
    return "decimal";
  }
}

const char *unterminated_message(LiteralKind kind) {
  switch (kind) {
  case LiteralKind::Char:
    return "unterminated character literal";
  case LiteralKind::ByteChar:
    return "unterminated byte constant";
  case LiteralKind::String:
    return "unterminated double quote string";
  case LiteralKind::ByteString:
    return "unterminated double quote byte string";
  case LiteralKind::RawString:
    return "unterminated raw string";
  case LiteralKind::RawByteString:
    return "unterminated raw byte string";
  case LiteralKind::Integer:
  case LiteralKind::Float:
    break;
  }
  return "unterminated literal";
}

} // namespace

const char *to_string(Severity severity) {
  switch (severity) {
  case Severity::Error:
    return "error";
  case Severity::Warning:
    return "warning";
  }
  return "unknown";
}

Position locate(const Lexeme &lexeme, std::size_t offset) {
  Cursor cursor(lexeme.text);
  while (!cursor.is_eof() && cursor.offset() < offset) {
    cursor.advance();
  }

  const Position &relative = cursor.position();
  Position at = lexeme.span.begin;
  at.offset += relative.offset;
  if (relative.line > 1) {
    at.line += relative.line - 1;
    at.column = relative.column;
  } else {
    at.column += relative.column - 1;
  }
  return at;
}

void LexemeChecker::check(const std::vector<Lexeme> &lexemes) {
  for (const auto &lexeme : lexemes) {
    check(lexeme);
  }
}

void LexemeChecker::check(const Lexeme &lexeme) {
  switch (lexeme.kind) {
  case LexemeKind::Unknown:
    error(lexeme, "unknown start of token: " + lexeme.text);
    return;
  case LexemeKind::BlockComment:
    if (!lexeme.terminated) {
      error(lexeme, "unterminated block comment");
      return;
    }
    if (lexeme.is_doc) {
      check_doc_comment(lexeme);
    }
    return;
  case LexemeKind::LineComment:
    if (lexeme.is_doc) {
      check_doc_comment(lexeme);
    }
    return;
  case LexemeKind::Literal:
    break;
  case LexemeKind::Whitespace:
  case LexemeKind::Identifier:
  case LexemeKind::Keyword:
  case LexemeKind::Lifetime:
  case LexemeKind::Operator:
  case LexemeKind::Punctuation:
    return;
  }

  bool is_raw = lexeme.literal == LiteralKind::RawString ||
                lexeme.literal == LiteralKind::RawByteString;
  if (is_raw && lexeme.hash_count > kMaxRawHashes) {
    error(lexeme,
          llvm::formatv("too many `#` symbols: raw strings may be delimited "
                        "by up to {0} `#` symbols",
                        kMaxRawHashes)
              .str());
    return;
  }

  if (!lexeme.terminated) {
    error(lexeme, unterminated_message(lexeme.literal));
    return;
  }

  switch (lexeme.literal) {
  case LiteralKind::Integer:
  case LiteralKind::Float:
    check_number(lexeme);
    break;
  case LiteralKind::Char:
  case LiteralKind::ByteChar:
  case LiteralKind::String:
  case LiteralKind::ByteString:
    check_quoted(lexeme);
    break;
  case LiteralKind::RawString:
  case LiteralKind::RawByteString:
    check_raw_string(lexeme);
    break;
  }
}

bool LexemeChecker::has_errors() const {
  return std::any_of(
      diagnostics_.begin(), diagnostics_.end(),
      [](const Diagnostic &d) { return d.severity == Severity::Error; });
}

void LexemeChecker::check_number(const Lexeme &lexeme) {
  std::string_view text = lexeme.text;
  std::size_t i = 0;
  unsigned base = 10;

  if (text.size() > 1 && text[0] == '0') {
    switch (text[1]) {
    case 'b':
      base = 2;
      break;
    case 'o':
      base = 8;
      break;
    case 'x':
      base = 16;
      break;
    default:
      break;
    }
    if (base != 10) {
      i = 2;
    }
  }

  bool has_digits = false;
  for (; i < text.size(); ++i) {
    char32_t c = static_cast<unsigned char>(text[i]);
    if (c == U'_') {
      continue;
    }
    if (base == 16 ? !is_hex_digit(c) : !is_ascii_digit(c)) {
      break;
    }
    if (digit_value(c) >= base) {
      error(lexeme,
            llvm::formatv("invalid digit for a base {0} literal", base).str(),
            i);
      return;
    }
    has_digits = true;
  }

  if (base != 10 && !has_digits) {
    error(lexeme, "no valid digits found for number");
    return;
  }

  if (lexeme.literal == LiteralKind::Float) {
    if (base != 10) {
      error(lexeme, llvm::formatv("{0} float literal is not supported",
                                  base_name(base))
                        .str());
      return;
    }
    if (i < text.size() && text[i] == '.') {
      ++i;
      while (i < text.size() && (is_ascii_digit(text[i]) || text[i] == '_')) {
        ++i;
      }
    }
    if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
      std::size_t exponent = i++;
      if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
        ++i;
      }
      bool exponent_digits = false;
      while (i < text.size() && (is_ascii_digit(text[i]) || text[i] == '_')) {
        exponent_digits = exponent_digits || text[i] != '_';
        ++i;
      }
      if (!exponent_digits) {
        error(lexeme, "expected at least one digit in exponent", exponent);
        return;
      }
    }
  }

  std::string_view suffix = text.substr(i);
  if (suffix.empty()) {
    return;
  }

  bool valid = false;
  if (lexeme.literal == LiteralKind::Float) {
    valid = contains(kFloatSuffixes, suffix);
  } else {
    valid = contains(kIntegerSuffixes, suffix) ||
            (base == 10 && contains(kFloatSuffixes, suffix));
  }
  if (!valid) {
    error(lexeme,
          llvm::formatv("invalid suffix `{0}` for {1} literal",
                        llvm::StringRef(suffix.data(), suffix.size()),
                        lexeme.literal == LiteralKind::Float ? "float"
                                                             : "number")
              .str(),
          i);
  }
}

void LexemeChecker::check_quoted(const Lexeme &lexeme) {
  bool is_byte = lexeme.literal == LiteralKind::ByteChar ||
                 lexeme.literal == LiteralKind::ByteString;
  bool is_char = lexeme.literal == LiteralKind::Char ||
                 lexeme.literal == LiteralKind::ByteChar;

  Cursor cursor(lexeme.text);
  if (is_byte) {
    cursor.advance(); // b
  }
  char32_t quote = cursor.advance();

  std::size_t count = 0;
  for (;;) {
    if (cursor.is_eof()) {
      return;
    }
    std::size_t start = cursor.offset();
    char32_t c = cursor.advance();
    if (c == quote) {
      break;
    }
    ++count;

    if (c == U'\\') {
      if (!check_escape(lexeme, cursor, start, is_byte, is_char)) {
        return;
      }
      continue;
    }
    if (is_byte && c >= 0x80) {
      error(lexeme,
            is_char ? "non-ASCII character in byte constant"
                    : "non-ASCII character in byte string literal",
            start);
      return;
    }
    if (c == U'\r' && cursor.peek() != U'\n') {
      error(lexeme, "bare CR not allowed in string, use \\r instead", start);
      return;
    }
    if (is_char && (c == U'\n' || c == U'\r' || c == U'\t')) {
      error(lexeme, "character constant must be escaped", start);
      return;
    }
  }

  if (is_char) {
    if (count == 0 && cursor.peek() == U'\'') {
      error(lexeme, "character constant must be escaped: `'`",
            cursor.offset());
      return;
    }
    if (count == 0) {
      error(lexeme, "empty character literal");
      return;
    }
    if (count > 1) {
      error(lexeme, "character literal may only contain one codepoint");
      return;
    }
  }

  if (!cursor.is_eof()) {
    error(lexeme, "suffixes on string literals are invalid", cursor.offset());
  }
}

bool LexemeChecker::check_escape(const Lexeme &lexeme, Cursor &cursor,
                                 std::size_t start, bool is_byte,
                                 bool is_char) {
  char32_t c = cursor.advance();
  switch (c) {
  case U'n':
  case U'r':
  case U't':
  case U'\\':
  case U'0':
  case U'\'':
  case U'"':
    return true;

  case U'x': {
    char32_t high = cursor.peek();
    char32_t low = cursor.peek(1);
    if (!is_hex_digit(high) || !is_hex_digit(low)) {
      error(lexeme, "numeric character escape is too short", start);
      return false;
    }
    cursor.advance(2);
    if (!is_byte && digit_value(high) * 16 + digit_value(low) > 0x7F) {
      error(lexeme, "out of range hex escape: must be at most \\x7F", start);
      return false;
    }
    return true;
  }

  case U'u': {
    if (is_byte) {
      error(lexeme, "unicode escape in byte string", start);
      return false;
    }
    if (cursor.peek() != U'{') {
      error(lexeme, "incorrect unicode escape sequence", start);
      return false;
    }
    cursor.advance();

    std::uint32_t value = 0;
    std::size_t digits = 0;
    for (;;) {
      char32_t d = cursor.peek();
      if (d == U'}') {
        cursor.advance();
        break;
      }
      if (d == U'_' && digits > 0) {
        cursor.advance();
        continue;
      }
      if (!is_hex_digit(d)) {
        error(lexeme, "unterminated unicode escape", start);
        return false;
      }
      if (++digits > 6) {
        error(lexeme, "overlong unicode escape", start);
        return false;
      }
      value = value * 16 + digit_value(d);
      cursor.advance();
    }

    if (digits == 0) {
      error(lexeme, "empty unicode escape", start);
      return false;
    }
    if (value > 0x10FFFF) {
      error(lexeme, "invalid unicode character escape: must be at most 10FFFF",
            start);
      return false;
    }
    if (value >= 0xD800 && value <= 0xDFFF) {
      error(lexeme,
            "invalid unicode character escape: must not be a surrogate",
            start);
      return false;
    }
    return true;
  }

  case U'\r':
    if (is_char || cursor.peek() != U'\n') {
      break;
    }
    cursor.advance();
    cursor.eat_while(is_whitespace);
    return true;

  case U'\n':
    // Line continuation.
    if (is_char) {
      break;
    }
    cursor.eat_while(is_whitespace);
    return true;

  default:
    break;
  }

  std::string escaped =
      lexeme.text.substr(start + 1, cursor.offset() - start - 1);
  error(lexeme, "unknown character escape: `" + visible_snippet(escaped) + "`",
        start);
  return false;
}

void LexemeChecker::check_raw_string(const Lexeme &lexeme) {
  bool is_byte = lexeme.literal == LiteralKind::RawByteString;
  std::string_view text = lexeme.text;
  std::size_t content = (is_byte ? 2 : 1) + lexeme.hash_count + 1;

  std::string closing = "\"" + std::string(lexeme.hash_count, '#');
  std::size_t close = text.find(closing, content);
  if (close == std::string_view::npos) {
    return;
  }

  Cursor cursor(text.substr(content, close - content));
  while (!cursor.is_eof()) {
    std::size_t at = content + cursor.offset();
    char32_t c = cursor.advance();
    if (is_byte && c >= 0x80) {
      error(lexeme, "non-ASCII character in raw byte string literal", at);
      return;
    }
    if (c == U'\r' && cursor.peek() != U'\n') {
      error(lexeme, "bare CR not allowed in raw string", at);
      return;
    }
  }

  std::size_t end = close + closing.size();
  if (end < text.size()) {
    error(lexeme, "suffixes on string literals are invalid", end);
  }
}

void LexemeChecker::check_doc_comment(const Lexeme &lexeme) {
  const std::string &text = lexeme.text;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text[i] == '\r' && (i + 1 == text.size() || text[i + 1] != '\n')) {
      warning(lexeme, "bare CR not allowed in doc-comment", i);
      return;
    }
  }
}

void LexemeChecker::error(const Lexeme &lexeme, const std::string &message,
                          std::size_t offset) {
  diagnostics_.emplace_back(Severity::Error, message, lexeme.span,
                            locate(lexeme, offset));
}

void LexemeChecker::warning(const Lexeme &lexeme, const std::string &message,
                            std::size_t offset) {
  diagnostics_.emplace_back(Severity::Warning, message, lexeme.span,
                            locate(lexeme, offset));
}

} // namespace lexemizer
