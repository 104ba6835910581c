#pragma once

#include "cursor.hpp"

#include <cstddef>
#include <optional>
#include <string_view>

namespace lexemizer {

enum class SymbolClass {
  Operator,
  Punctuation,
};

// Every operator and punctuation spelling of the 2018 edition.
enum class Symbol {
  // Operators
  Plus,      // +
  Minus,     // -
  Star,      // *
  Slash,     // /
  Percent,   // %
  Caret,     // ^
  Not,       // !
  And,       // &
  Or,        // |
  AndAnd,    // &&
  OrOr,      // ||
  Shl,       // <<
  Shr,       // >>
  PlusEq,    // +=
  MinusEq,   // -=
  StarEq,    // *=
  SlashEq,   // /=
  PercentEq, // %=
  CaretEq,   // ^=
  AndEq,     // &=
  OrEq,      // |=
  ShlEq,     // <<=
  ShrEq,     // >>=
  Eq,        // =
  EqEq,      // ==
  Ne,        // !=
  Gt,        // >
  Lt,        // <
  Ge,        // >=
  Le,        // <=
  DotDot,    // ..
  DotDotDot, // ...
  DotDotEq,  // ..=

  // Punctuation
  OpenParen,    // (
  CloseParen,   // )
  OpenBracket,  // [
  CloseBracket, // ]
  OpenBrace,    // {
  CloseBrace,   // }
  Comma,        // ,
  Semi,         // ;
  Colon,        // :
  PathSep,      // ::
  Dot,          // .
  RArrow,       // ->
  FatArrow,     // =>
  Pound,        // #
  Dollar,       // $
  Question,     // ?
  At,           // @
  Underscore,   // _
};

struct SymbolMatch {
  Symbol symbol;
  std::size_t length; // in bytes; all spellings are ASCII
};

// Longest table entry starting at the cursor, trying 3, 2 then 1 characters.
std::optional<SymbolMatch> match_symbol(const Cursor &cursor);

// Exact table lookup of a complete spelling.
std::optional<Symbol> lookup_symbol(std::string_view spelling);

std::string_view spelling(Symbol symbol);
SymbolClass symbol_class(Symbol symbol);
const char *to_string(Symbol symbol);

} // namespace lexemizer
