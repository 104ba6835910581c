#pragma once

#include "position.hpp"
#include "symbol.hpp"

#include <cstdint>
#include <string>

namespace llvm {
class raw_ostream;
}

namespace lexemizer {

enum class LexemeKind {
  Whitespace,
  LineComment,
  BlockComment,
  Identifier,
  Keyword,
  Lifetime,
  Literal,
  Operator,
  Punctuation,
  Unknown,
};

enum class LiteralKind {
  Integer,
  Float,
  Char,
  ByteChar,
  String,
  ByteString,
  RawString,
  RawByteString,
};

// One classified run of source text. Payload fields only carry meaning for
// the kinds noted beside them.
struct Lexeme {
  LexemeKind kind{LexemeKind::Unknown};
  std::string text{}; // Exact source slice, never unescaped.
  Span span{};

  LiteralKind literal{LiteralKind::Integer}; // Literal
  Symbol symbol{Symbol::Semi};               // Operator, Punctuation
  std::uint32_t hash_count{0};               // RawString, RawByteString
  bool is_doc{false};                        // LineComment, BlockComment
  bool is_raw{false};                        // Identifier
  bool terminated{true};                     // BlockComment, Literal

  // Whitespace and non-doc comments.
  bool is_trivia() const;
};

bool operator==(const Lexeme &a, const Lexeme &b);
bool operator!=(const Lexeme &a, const Lexeme &b);

const char *to_string(LexemeKind kind);
const char *to_string(LiteralKind kind);

// Kind plus its payload, e.g. "Literal(RawString#2)" or
// "BlockComment(doc, unterminated)".
std::string describe(const Lexeme &lexeme);

// Source text with line breaks made visible: "\n" -> "<NL>", "\r" -> "<CR>".
std::string visible_snippet(const std::string &text);

// One table row: description, byte offset, line:column and snippet.
void print_lexeme(const Lexeme &lexeme, llvm::raw_ostream &os);

} // namespace lexemizer
