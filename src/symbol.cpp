#include "symbol.hpp"

#include <algorithm>
#include <array>

namespace lexemizer {
namespace {

struct SymbolInfo {
  Symbol symbol;
  std::string_view spelling;
  SymbolClass klass;
  const char *name;
};

constexpr SymbolClass kOp = SymbolClass::Operator;
constexpr SymbolClass kPunct = SymbolClass::Punctuation;

// Indexed by Symbol; keep in enum order.
constexpr std::array<SymbolInfo, 51> kSymbols = {{
    {Symbol::Plus, "+", kOp, "Plus"},
    {Symbol::Minus, "-", kOp, "Minus"},
    {Symbol::Star, "*", kOp, "Star"},
    {Symbol::Slash, "/", kOp, "Slash"},
    {Symbol::Percent, "%", kOp, "Percent"},
    {Symbol::Caret, "^", kOp, "Caret"},
    {Symbol::Not, "!", kOp, "Not"},
    {Symbol::And, "&", kOp, "And"},
    {Symbol::Or, "|", kOp, "Or"},
    {Symbol::AndAnd, "&&", kOp, "AndAnd"},
    {Symbol::OrOr, "||", kOp, "OrOr"},
    {Symbol::Shl, "<<", kOp, "Shl"},
    {Symbol::Shr, ">>", kOp, "Shr"},
    {Symbol::PlusEq, "+=", kOp, "PlusEq"},
    {Symbol::MinusEq, "-=", kOp, "MinusEq"},
    {Symbol::StarEq, "*=", kOp, "StarEq"},
    {Symbol::SlashEq, "/=", kOp, "SlashEq"},
    {Symbol::PercentEq, "%=", kOp, "PercentEq"},
    {Symbol::CaretEq, "^=", kOp, "CaretEq"},
    {Symbol::AndEq, "&=", kOp, "AndEq"},
    {Symbol::OrEq, "|=", kOp, "OrEq"},
    {Symbol::ShlEq, "<<=", kOp, "ShlEq"},
    {Symbol::ShrEq, ">>=", kOp, "ShrEq"},
    {Symbol::Eq, "=", kOp, "Eq"},
    {Symbol::EqEq, "==", kOp, "EqEq"},
    {Symbol::Ne, "!=", kOp, "Ne"},
    {Symbol::Gt, ">", kOp, "Gt"},
    {Symbol::Lt, "<", kOp, "Lt"},
    {Symbol::Ge, ">=", kOp, "Ge"},
    {Symbol::Le, "<=", kOp, "Le"},
    {Symbol::DotDot, "..", kOp, "DotDot"},
    {Symbol::DotDotDot, "...", kOp, "DotDotDot"},
    {Symbol::DotDotEq, "..=", kOp, "DotDotEq"},
    {Symbol::OpenParen, "(", kPunct, "OpenParen"},
    {Symbol::CloseParen, ")", kPunct, "CloseParen"},
    {Symbol::OpenBracket, "[", kPunct, "OpenBracket"},
    {Symbol::CloseBracket, "]", kPunct, "CloseBracket"},
    {Symbol::OpenBrace, "{", kPunct, "OpenBrace"},
    {Symbol::CloseBrace, "}", kPunct, "CloseBrace"},
    {Symbol::Comma, ",", kPunct, "Comma"},
    {Symbol::Semi, ";", kPunct, "Semi"},
    {Symbol::Colon, ":", kPunct, "Colon"},
    {Symbol::PathSep, "::", kPunct, "PathSep"},
    {Symbol::Dot, ".", kPunct, "Dot"},
    {Symbol::RArrow, "->", kPunct, "RArrow"},
    {Symbol::FatArrow, "=>", kPunct, "FatArrow"},
    {Symbol::Pound, "#", kPunct, "Pound"},
    {Symbol::Dollar, "$", kPunct, "Dollar"},
    {Symbol::Question, "?", kPunct, "Question"},
    {Symbol::At, "@", kPunct, "At"},
    {Symbol::Underscore, "_", kPunct, "Underscore"},
}};

constexpr std::size_t kMaxSymbolLength = 3;

const SymbolInfo &info(Symbol symbol) {
  return kSymbols[static_cast<std::size_t>(symbol)];
}

} // namespace

std::optional<Symbol> lookup_symbol(std::string_view spelling) {
  auto it = std::find_if(kSymbols.begin(), kSymbols.end(),
                         [spelling](const SymbolInfo &entry) {
                           return entry.spelling == spelling;
                         });
  if (it == kSymbols.end()) {
    return std::nullopt;
  }
  return it->symbol;
}

std::optional<SymbolMatch> match_symbol(const Cursor &cursor) {
  // Gather up to three ASCII characters of lookahead; spellings never
  // contain anything else.
  char buffer[kMaxSymbolLength] = {};
  std::size_t available = 0;
  while (available < kMaxSymbolLength) {
    char32_t c = cursor.peek(available);
    if (c == Cursor::kEndOfInput || c >= 0x80) {
      break;
    }
    buffer[available++] = static_cast<char>(c);
  }

  for (std::size_t length = available; length > 0; --length) {
    if (auto symbol = lookup_symbol(std::string_view(buffer, length))) {
      return SymbolMatch{*symbol, length};
    }
  }
  return std::nullopt;
}

std::string_view spelling(Symbol symbol) { return info(symbol).spelling; }

SymbolClass symbol_class(Symbol symbol) { return info(symbol).klass; }

const char *to_string(Symbol symbol) { return info(symbol).name; }

} // namespace lexemizer
