#pragma once

#include "cursor.hpp"
#include "edition.hpp"
#include "lexeme.hpp"

#include <optional>
#include <string_view>
#include <vector>

#include <llvm/Support/Error.h>

namespace lexemizer {

// Splits source text into lexemes, one per call. The source is borrowed and
// must outlive the Lexemizer; the produced lexemes own their text.
class Lexemizer {
public:
  Lexemizer(std::string_view source, const EditionConfig &config);

  // Produce the next lexeme; returns std::nullopt when the input is
  // exhausted.
  std::optional<Lexeme> next_lexeme();

  // Convenience: drain the rest of the input.
  std::vector<Lexeme> lexemize_all();

  bool at_end() const { return cursor_.is_eof(); }

private:
  Lexeme lex_shebang();
  Lexeme lex_whitespace();
  Lexeme lex_comment();
  Lexeme lex_quote();
  Lexeme lex_string(LiteralKind kind);
  Lexeme lex_raw_string(LiteralKind kind, std::size_t prefix_length,
                        std::uint32_t hashes);
  Lexeme lex_byte_char();
  Lexeme lex_number();
  Lexeme lex_identifier_or_keyword();
  Lexeme lex_raw_identifier();
  Lexeme lex_symbol_or_unknown();

  Lexeme make_lexeme(LexemeKind kind, const Position &start) const;
  Lexeme make_literal(LiteralKind kind, const Position &start,
                      bool terminated) const;

  Cursor cursor_;
  EditionConfig config_;
};

// Lexemize a whole compilation unit. Only an unsupported edition fails; any
// text at all produces a complete lexeme sequence.
llvm::Expected<std::vector<Lexeme>>
lexemize(std::string_view source, Edition edition = Edition::Rust2018);

} // namespace lexemizer
