#pragma once

#include "diagnostic.hpp"
#include "lexeme.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lexemizer {

class Cursor;

// Validates lexemes the lexemizer accepted without judging them: unknown
// characters, unterminated literals, malformed numbers and escapes. Lexemes
// are only read, never changed.
class LexemeChecker {
public:
  LexemeChecker() = default;

  void check(const std::vector<Lexeme> &lexemes);
  void check(const Lexeme &lexeme);

  bool has_errors() const;
  const std::vector<Diagnostic> &diagnostics() const { return diagnostics_; }

private:
  void check_number(const Lexeme &lexeme);
  void check_quoted(const Lexeme &lexeme);
  void check_raw_string(const Lexeme &lexeme);
  void check_doc_comment(const Lexeme &lexeme);

  // Escape after a backslash at byte `start`; the cursor sits past the
  // backslash. Returns false if it was reported.
  bool check_escape(const Lexeme &lexeme, Cursor &cursor, std::size_t start,
                    bool is_byte, bool is_char);

  void error(const Lexeme &lexeme, const std::string &message,
             std::size_t offset = 0);
  void warning(const Lexeme &lexeme, const std::string &message,
               std::size_t offset = 0);

  std::vector<Diagnostic> diagnostics_;
};

// Position of byte `offset` of the lexeme's text in the source.
Position locate(const Lexeme &lexeme, std::size_t offset);

} // namespace lexemizer
