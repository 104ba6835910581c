#include "lexeme.hpp"

#include <llvm/Support/FormatVariadic.h>
#include <llvm/Support/raw_ostream.h>

namespace lexemizer {

bool Lexeme::is_trivia() const {
  switch (kind) {
  case LexemeKind::Whitespace:
    return true;
  case LexemeKind::LineComment:
  case LexemeKind::BlockComment:
    return !is_doc;
  case LexemeKind::Identifier:
  case LexemeKind::Keyword:
  case LexemeKind::Lifetime:
  case LexemeKind::Literal:
  case LexemeKind::Operator:
  case LexemeKind::Punctuation:
  case LexemeKind::Unknown:
    return false;
  }
  return false;
}

bool operator==(const Lexeme &a, const Lexeme &b) {
  return a.kind == b.kind && a.text == b.text && a.span == b.span &&
         a.literal == b.literal && a.symbol == b.symbol &&
         a.hash_count == b.hash_count && a.is_doc == b.is_doc &&
         a.is_raw == b.is_raw && a.terminated == b.terminated;
}

bool operator!=(const Lexeme &a, const Lexeme &b) { return !(a == b); }

const char *to_string(LexemeKind kind) {
  switch (kind) {
  case LexemeKind::Whitespace:
    return "Whitespace";
  case LexemeKind::LineComment:
    return "LineComment";
  case LexemeKind::BlockComment:
    return "BlockComment";
  case LexemeKind::Identifier:
    return "Identifier";
  case LexemeKind::Keyword:
    return "Keyword";
  case LexemeKind::Lifetime:
    return "Lifetime";
  case LexemeKind::Literal:
    return "Literal";
  case LexemeKind::Operator:
    return "Operator";
  case LexemeKind::Punctuation:
    return "Punctuation";
  case LexemeKind::Unknown:
    return "Unknown";
  }
  return "Unknown";
}

const char *to_string(LiteralKind kind) {
  switch (kind) {
  case LiteralKind::Integer:
    return "Integer";
  case LiteralKind::Float:
    return "Float";
  case LiteralKind::Char:
    return "Char";
  case LiteralKind::ByteChar:
    return "ByteChar";
  case LiteralKind::String:
    return "String";
  case LiteralKind::ByteString:
    return "ByteString";
  case LiteralKind::RawString:
    return "RawString";
  case LiteralKind::RawByteString:
    return "RawByteString";
  }
  return "Unknown";
}

std::string describe(const Lexeme &lexeme) {
  std::string out = to_string(lexeme.kind);
  std::string detail;
  auto add = [&detail](const std::string &part) {
    if (!detail.empty()) {
      detail += ", ";
    }
    detail += part;
  };

  switch (lexeme.kind) {
  case LexemeKind::LineComment:
  case LexemeKind::BlockComment:
    if (lexeme.is_doc) {
      add("doc");
    }
    if (!lexeme.terminated) {
      add("unterminated");
    }
    break;
  case LexemeKind::Identifier:
    if (lexeme.is_raw) {
      add("raw");
    }
    break;
  case LexemeKind::Literal: {
    std::string literal = to_string(lexeme.literal);
    if (lexeme.literal == LiteralKind::RawString ||
        lexeme.literal == LiteralKind::RawByteString) {
      literal += "#" + std::to_string(lexeme.hash_count);
    }
    add(literal);
    if (!lexeme.terminated) {
      add("unterminated");
    }
    break;
  }
  case LexemeKind::Operator:
  case LexemeKind::Punctuation:
    add(to_string(lexeme.symbol));
    break;
  case LexemeKind::Whitespace:
  case LexemeKind::Keyword:
  case LexemeKind::Lifetime:
  case LexemeKind::Unknown:
    break;
  }

  if (!detail.empty()) {
    out += "(" + detail + ")";
  }
  return out;
}

std::string visible_snippet(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text) {
    if (c == '\n') {
      out += "<NL>";
    } else if (c == '\r') {
      out += "<CR>";
    } else {
      out.push_back(c);
    }
  }
  return out;
}

void print_lexeme(const Lexeme &lexeme, llvm::raw_ostream &os) {
  std::string location = llvm::formatv("{0}:{1}", lexeme.span.begin.line,
                                       lexeme.span.begin.column);
  os << llvm::formatv("{0,-30} {1,6}  {2,-8} {3}\n", describe(lexeme),
                      lexeme.span.begin.offset, location,
                      visible_snippet(lexeme.text));
}

} // namespace lexemizer
