#include "lexemizer.hpp"
#include "char_class.hpp"
#include "comment_scanner.hpp"
#include "literal_scanner.hpp"
#include "symbol.hpp"

namespace lexemizer {

Lexemizer::Lexemizer(std::string_view source, const EditionConfig &config)
    : cursor_(source), config_(config) {}

std::optional<Lexeme> Lexemizer::next_lexeme() {
  if (cursor_.is_eof()) {
    return std::nullopt;
  }

  if (at_shebang(cursor_)) {
    return lex_shebang();
  }

  char32_t c = cursor_.peek();
  char32_t next = cursor_.peek(1);

  if (is_whitespace(c)) {
    return lex_whitespace();
  }
  if (c == U'/' && (next == U'/' || next == U'*')) {
    return lex_comment();
  }
  if (c == U'\'') {
    return lex_quote();
  }
  if (c == U'"') {
    return lex_string(LiteralKind::String);
  }
  if (c == U'b') {
    if (next == U'"') {
      return lex_string(LiteralKind::ByteString);
    }
    if (next == U'\'') {
      return lex_byte_char();
    }
    if (next == U'r') {
      if (auto hashes = raw_string_hashes(cursor_, 2)) {
        return lex_raw_string(LiteralKind::RawByteString, 2, *hashes);
      }
    }
  }
  if (c == U'r') {
    if (auto hashes = raw_string_hashes(cursor_, 1)) {
      return lex_raw_string(LiteralKind::RawString, 1, *hashes);
    }
    if (next == U'#' && is_id_start(cursor_.peek(2))) {
      return lex_raw_identifier();
    }
  }
  if (is_ascii_digit(c)) {
    return lex_number();
  }
  if (is_id_start(c)) {
    return lex_identifier_or_keyword();
  }
  return lex_symbol_or_unknown();
}

std::vector<Lexeme> Lexemizer::lexemize_all() {
  std::vector<Lexeme> lexemes;
  while (auto lexeme = next_lexeme()) {
    lexemes.push_back(std::move(*lexeme));
  }
  return lexemes;
}

Lexeme Lexemizer::lex_shebang() {
  Position start = cursor_.position();
  scan_shebang(cursor_);
  return make_lexeme(LexemeKind::LineComment, start);
}

Lexeme Lexemizer::lex_whitespace() {
  Position start = cursor_.position();
  cursor_.eat_while(is_whitespace);
  return make_lexeme(LexemeKind::Whitespace, start);
}

Lexeme Lexemizer::lex_comment() {
  Position start = cursor_.position();
  bool block = cursor_.peek(1) == U'*';
  CommentScan scan =
      block ? scan_block_comment(cursor_) : scan_line_comment(cursor_);

  Lexeme lexeme = make_lexeme(
      block ? LexemeKind::BlockComment : LexemeKind::LineComment, start);
  lexeme.is_doc = scan.is_doc;
  lexeme.terminated = scan.terminated;
  return lexeme;
}

Lexeme Lexemizer::lex_quote() {
  Position start = cursor_.position();
  QuoteScan scan = scan_lifetime_or_char(cursor_);
  if (scan.is_lifetime) {
    return make_lexeme(LexemeKind::Lifetime, start);
  }
  return make_literal(LiteralKind::Char, start, scan.terminated);
}

Lexeme Lexemizer::lex_string(LiteralKind kind) {
  Position start = cursor_.position();
  if (kind == LiteralKind::ByteString) {
    cursor_.advance(); // b
  }
  bool terminated = scan_double_quoted(cursor_);
  if (terminated) {
    eat_literal_suffix(cursor_);
  }
  return make_literal(kind, start, terminated);
}

Lexeme Lexemizer::lex_raw_string(LiteralKind kind, std::size_t prefix_length,
                                 std::uint32_t hashes) {
  Position start = cursor_.position();
  bool terminated = scan_raw_string(cursor_, prefix_length, hashes);
  if (terminated) {
    eat_literal_suffix(cursor_);
  }
  Lexeme lexeme = make_literal(kind, start, terminated);
  lexeme.hash_count = hashes;
  return lexeme;
}

Lexeme Lexemizer::lex_byte_char() {
  Position start = cursor_.position();
  cursor_.advance(); // b
  bool terminated = scan_single_quoted(cursor_);
  if (terminated) {
    eat_literal_suffix(cursor_);
  }
  return make_literal(LiteralKind::ByteChar, start, terminated);
}

Lexeme Lexemizer::lex_number() {
  Position start = cursor_.position();
  LiteralKind kind = scan_number(cursor_);
  eat_literal_suffix(cursor_);
  return make_literal(kind, start, true);
}

Lexeme Lexemizer::lex_identifier_or_keyword() {
  Position start = cursor_.position();
  eat_identifier(cursor_);

  std::string_view word = cursor_.slice_from(start.offset);
  if (word == "_") {
    Lexeme lexeme = make_lexeme(LexemeKind::Punctuation, start);
    lexeme.symbol = Symbol::Underscore;
    return lexeme;
  }

  bool is_keyword =
      config_.is_keyword(llvm::StringRef(word.data(), word.size()));
  return make_lexeme(is_keyword ? LexemeKind::Keyword : LexemeKind::Identifier,
                     start);
}

Lexeme Lexemizer::lex_raw_identifier() {
  Position start = cursor_.position();
  cursor_.advance(2); // r#
  eat_identifier(cursor_);
  Lexeme lexeme = make_lexeme(LexemeKind::Identifier, start);
  lexeme.is_raw = true;
  return lexeme;
}

Lexeme Lexemizer::lex_symbol_or_unknown() {
  Position start = cursor_.position();
  if (auto match = match_symbol(cursor_)) {
    cursor_.advance(match->length);
    Lexeme lexeme = make_lexeme(symbol_class(match->symbol) ==
                                        SymbolClass::Operator
                                    ? LexemeKind::Operator
                                    : LexemeKind::Punctuation,
                                start);
    lexeme.symbol = match->symbol;
    return lexeme;
  }

  // Nothing matched: consume a single code point so scanning always makes
  // progress.
  cursor_.advance();
  return make_lexeme(LexemeKind::Unknown, start);
}

Lexeme Lexemizer::make_lexeme(LexemeKind kind, const Position &start) const {
  Lexeme lexeme;
  lexeme.kind = kind;
  lexeme.text = std::string(cursor_.slice_from(start.offset));
  lexeme.span = Span{start, cursor_.position()};
  return lexeme;
}

Lexeme Lexemizer::make_literal(LiteralKind kind, const Position &start,
                               bool terminated) const {
  Lexeme lexeme = make_lexeme(LexemeKind::Literal, start);
  lexeme.literal = kind;
  lexeme.terminated = terminated;
  return lexeme;
}

llvm::Expected<std::vector<Lexeme>> lexemize(std::string_view source,
                                             Edition edition) {
  auto config = make_edition_config(edition);
  if (!config) {
    return config.takeError();
  }

  Lexemizer lexemizer(source, *config);
  return lexemizer.lexemize_all();
}

} // namespace lexemizer
