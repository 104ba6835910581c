#include "lexemizer.hpp"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <utility>
#include <vector>

using lexemizer::Lexeme;
using lexemizer::LexemeKind;
using lexemizer::LiteralKind;
using lexemizer::Symbol;

namespace {

std::vector<Lexeme> lex(std::string_view source) {
  auto lexemes = lexemizer::lexemize(source);
  if (!lexemes) {
    ADD_FAILURE() << llvm::toString(lexemes.takeError());
    return {};
  }
  return std::move(*lexemes);
}

// Drops whitespace and non-doc comments.
std::vector<Lexeme> lex_significant(std::string_view source) {
  std::vector<Lexeme> out;
  for (auto &lexeme : lex(source)) {
    if (!lexeme.is_trivia()) {
      out.push_back(std::move(lexeme));
    }
  }
  return out;
}

void expect_sequence(
    const std::vector<Lexeme> &lexemes,
    std::initializer_list<std::pair<LexemeKind, std::string_view>> expected) {
  ASSERT_EQ(lexemes.size(), expected.size());
  std::size_t i = 0;
  for (auto [kind, text] : expected) {
    EXPECT_EQ(lexemes[i].kind, kind) << "lexeme " << i << ": "
                                     << lexemes[i].text;
    EXPECT_EQ(lexemes[i].text, text) << "lexeme " << i;
    ++i;
  }
}

// The partition properties every lexeme sequence must satisfy.
void expect_partition(std::string_view source) {
  auto lexemes = lex(source);
  std::string joined;
  std::size_t offset = 0;
  for (const auto &lexeme : lexemes) {
    EXPECT_FALSE(lexeme.span.empty()) << "empty lexeme at " << offset;
    EXPECT_EQ(lexeme.span.begin.offset, offset);
    EXPECT_EQ(lexeme.span.length(), lexeme.text.size());
    offset = lexeme.span.end.offset;
    joined += lexeme.text;
  }
  EXPECT_EQ(offset, source.size());
  EXPECT_EQ(joined, source);
}

TEST(LexemizerTest, EmptyInput) { EXPECT_TRUE(lex("").empty()); }

TEST(LexemizerTest, SimpleFunction) {
  expect_sequence(lex_significant("fn main() { let x = 1; }"),
                  {
                      {LexemeKind::Keyword, "fn"},
                      {LexemeKind::Identifier, "main"},
                      {LexemeKind::Punctuation, "("},
                      {LexemeKind::Punctuation, ")"},
                      {LexemeKind::Punctuation, "{"},
                      {LexemeKind::Keyword, "let"},
                      {LexemeKind::Identifier, "x"},
                      {LexemeKind::Operator, "="},
                      {LexemeKind::Literal, "1"},
                      {LexemeKind::Punctuation, ";"},
                      {LexemeKind::Punctuation, "}"},
                  });
}

TEST(LexemizerTest, WhitespaceRunIsOneLexeme) {
  expect_sequence(lex("  \t\n\r\n x"),
                  {
                      {LexemeKind::Whitespace, "  \t\n\r\n "},
                      {LexemeKind::Identifier, "x"},
                  });
}

TEST(LexemizerTest, PartitionsArbitraryInput) {
  expect_partition("fn main() {\n    println!(\"hi\");\n}\n");
  expect_partition("/* unterminated /* nested */");
  expect_partition("\"unterminated");
  expect_partition("r##\"raw\"# still raw");
  expect_partition("'a 'b' '\\u{1F600}' b'x' '");
  expect_partition("\xFF\xFE~`\\\xE2\x82");
  expect_partition("x\xF0\x9F\x98\x80y");
  expect_partition("#!/bin/run\r\n#![attr] 0x 1e 1.. .5");
}

TEST(LexemizerTest, RepeatedCallsAgree) {
  const char *source = "let r = r#\"x\"#; 'a: loop { break 'a; } // end";
  EXPECT_EQ(lex(source), lex(source));
}

TEST(LexemizerTest, ConcurrentCallsAgreeWithSequentialOnes) {
  const std::vector<std::string> sources = {
      "fn main() { let x = 1..=2; }\n",
      "/* a /* b */ c */ 'a: loop { break 'a; }",
      "let r = br##\"raw\"##; let c = '\\u{1F600}';",
      "0x_ff_u8 1.5e-3f64 \"open",
  };
  std::vector<std::vector<Lexeme>> expected;
  for (const auto &source : sources) {
    expected.push_back(lex(source));
  }

  constexpr int kRounds = 50;
  std::vector<std::vector<Lexeme>> results(sources.size());
  std::vector<std::thread> threads;
  for (std::size_t i = 0; i < sources.size(); ++i) {
    threads.emplace_back([&, i] {
      for (int round = 0; round < kRounds; ++round) {
        auto lexemes = lexemizer::lexemize(sources[i]);
        if (!lexemes) {
          llvm::consumeError(lexemes.takeError());
          results[i].clear();
          return;
        }
        results[i] = std::move(*lexemes);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  for (std::size_t i = 0; i < sources.size(); ++i) {
    EXPECT_EQ(results[i], expected[i]) << sources[i];
  }
}

TEST(LexemizerTest, NextLexemeIsLazy) {
  auto config = lexemizer::make_edition_config(lexemizer::Edition::Rust2018);
  ASSERT_TRUE(static_cast<bool>(config));

  std::string source = "a + b";
  lexemizer::Lexemizer lexer(source, *config);
  EXPECT_FALSE(lexer.at_end());

  std::vector<Lexeme> pulled;
  while (auto lexeme = lexer.next_lexeme()) {
    pulled.push_back(*lexeme);
  }
  EXPECT_TRUE(lexer.at_end());
  EXPECT_FALSE(lexer.next_lexeme().has_value());
  EXPECT_EQ(pulled, lex(source));
  EXPECT_EQ(pulled.size(), 5u);
}

TEST(LexemizerTest, Positions) {
  auto lexemes = lex_significant("a\n  b\xC3\xA9 c");
  ASSERT_EQ(lexemes.size(), 3u);

  EXPECT_EQ(lexemes[1].text, "b\xC3\xA9");
  EXPECT_EQ(lexemes[1].span.begin.offset, 4u);
  EXPECT_EQ(lexemes[1].span.begin.line, 2u);
  EXPECT_EQ(lexemes[1].span.begin.column, 3u);
  EXPECT_EQ(lexemes[1].span.end.column, 5u);

  // Columns count code points, offsets count bytes.
  EXPECT_EQ(lexemes[2].span.begin.offset, 8u);
  EXPECT_EQ(lexemes[2].span.begin.column, 6u);
}

TEST(LexemizerTest, InclusiveRangeIsOneOperator) {
  auto lexemes = lex_significant("a..=b");
  expect_sequence(lexemes, {
                               {LexemeKind::Identifier, "a"},
                               {LexemeKind::Operator, "..="},
                               {LexemeKind::Identifier, "b"},
                           });
  EXPECT_EQ(lexemes[1].symbol, Symbol::DotDotEq);
}

TEST(LexemizerTest, LongestSymbolMatch) {
  auto lexemes = lex_significant("x <<= 1 >> 2 :: -> => ... != &&");
  std::vector<Symbol> symbols;
  for (const auto &lexeme : lexemes) {
    if (lexeme.kind == LexemeKind::Operator ||
        lexeme.kind == LexemeKind::Punctuation) {
      symbols.push_back(lexeme.symbol);
    }
  }
  std::vector<Symbol> expected = {Symbol::ShlEq,    Symbol::Shr,
                                  Symbol::PathSep,  Symbol::RArrow,
                                  Symbol::FatArrow, Symbol::DotDotDot,
                                  Symbol::Ne,       Symbol::AndAnd};
  EXPECT_EQ(symbols, expected);
}

TEST(LexemizerTest, OperatorAndPunctuationClasses) {
  auto lexemes = lex_significant("+ . ; ? @ $ #");
  EXPECT_EQ(lexemes[0].kind, LexemeKind::Operator);
  for (std::size_t i = 1; i < lexemes.size(); ++i) {
    EXPECT_EQ(lexemes[i].kind, LexemeKind::Punctuation) << lexemes[i].text;
  }
}

TEST(LexemizerTest, KeywordsAreWholeWords) {
  auto lexemes = lex_significant("match match2 r#match _ _x __");
  expect_sequence(lexemes, {
                               {LexemeKind::Keyword, "match"},
                               {LexemeKind::Identifier, "match2"},
                               {LexemeKind::Identifier, "r#match"},
                               {LexemeKind::Punctuation, "_"},
                               {LexemeKind::Identifier, "_x"},
                               {LexemeKind::Identifier, "__"},
                           });
  EXPECT_FALSE(lexemes[1].is_raw);
  EXPECT_TRUE(lexemes[2].is_raw);
  EXPECT_EQ(lexemes[3].symbol, Symbol::Underscore);
}

TEST(LexemizerTest, ReservedAndStrictKeywords) {
  for (const auto &lexeme : lex_significant("async await dyn try union "
                                            "Self self abstract yield")) {
    EXPECT_EQ(lexeme.kind, LexemeKind::Keyword) << lexeme.text;
  }
}

TEST(LexemizerTest, UnicodeIdentifiers) {
  auto lexemes = lex_significant("h\xC3\xA9llo \xE4\xB8\xAD\xE6\x96\x87 "
                                 "a\xCC\x81");
  expect_sequence(lexemes,
                  {
                      {LexemeKind::Identifier, "h\xC3\xA9llo"},
                      {LexemeKind::Identifier, "\xE4\xB8\xAD\xE6\x96\x87"},
                      {LexemeKind::Identifier, "a\xCC\x81"},
                  });
}

TEST(LexemizerTest, RawIdentifierNeedsIdentifierStart) {
  expect_sequence(lex("r##x"), {
                                   {LexemeKind::Identifier, "r"},
                                   {LexemeKind::Punctuation, "#"},
                                   {LexemeKind::Punctuation, "#"},
                                   {LexemeKind::Identifier, "x"},
                               });
}

TEST(LexemizerTest, LifetimeVersusChar) {
  auto lifetime = lex("'a");
  ASSERT_EQ(lifetime.size(), 1u);
  EXPECT_EQ(lifetime[0].kind, LexemeKind::Lifetime);

  auto character = lex("'a'");
  ASSERT_EQ(character.size(), 1u);
  EXPECT_EQ(character[0].kind, LexemeKind::Literal);
  EXPECT_EQ(character[0].literal, LiteralKind::Char);
  EXPECT_TRUE(character[0].terminated);

  expect_sequence(lex_significant("&'static str 'outer: '_"),
                  {
                      {LexemeKind::Operator, "&"},
                      {LexemeKind::Lifetime, "'static"},
                      {LexemeKind::Identifier, "str"},
                      {LexemeKind::Lifetime, "'outer"},
                      {LexemeKind::Punctuation, ":"},
                      {LexemeKind::Lifetime, "'_"},
                  });
}

TEST(LexemizerTest, CharLiterals) {
  for (const char *source :
       {"'\\n'", "'\\''", "'''", "'\\u{1F600}'", "'\xE4\xB8\xAD'", "'abc'"}) {
    auto lexemes = lex(source);
    ASSERT_EQ(lexemes.size(), 1u) << source;
    EXPECT_EQ(lexemes[0].kind, LexemeKind::Literal) << source;
    EXPECT_EQ(lexemes[0].literal, LiteralKind::Char) << source;
    EXPECT_TRUE(lexemes[0].terminated) << source;
  }
}

TEST(LexemizerTest, DigitAfterQuoteIsNotALifetime) {
  auto lexemes = lex("'0");
  ASSERT_EQ(lexemes.size(), 1u);
  EXPECT_EQ(lexemes[0].kind, LexemeKind::Literal);
  EXPECT_EQ(lexemes[0].literal, LiteralKind::Char);
  EXPECT_FALSE(lexemes[0].terminated);
}

TEST(LexemizerTest, UnterminatedCharRunsToEndOfInput) {
  auto lexemes = lex("'ab\nc");
  ASSERT_GE(lexemes.size(), 1u);
  EXPECT_EQ(lexemes[0].kind, LexemeKind::Lifetime);
  EXPECT_EQ(lexemes[0].text, "'ab");

  auto open = lex("' ;\nfoo // x");
  ASSERT_EQ(open.size(), 1u);
  EXPECT_EQ(open[0].literal, LiteralKind::Char);
  EXPECT_FALSE(open[0].terminated);
  EXPECT_EQ(open[0].text, "' ;\nfoo // x");
  EXPECT_EQ(open[0].span.end.line, 2u);

  auto escaped = lex("'\\");
  ASSERT_EQ(escaped.size(), 1u);
  EXPECT_FALSE(escaped[0].terminated);
  EXPECT_EQ(escaped[0].text, "'\\");
}

TEST(LexemizerTest, IntegerLiterals) {
  for (const char *source :
       {"0", "42", "1_000", "0xFF", "0xff_u8", "0o777", "0b1010_1010",
        "7usize", "1f32", "0b", "0b102"}) {
    auto lexemes = lex(source);
    ASSERT_EQ(lexemes.size(), 1u) << source;
    EXPECT_EQ(lexemes[0].kind, LexemeKind::Literal) << source;
    EXPECT_EQ(lexemes[0].literal, LiteralKind::Integer) << source;
    EXPECT_EQ(lexemes[0].text, source);
  }
}

TEST(LexemizerTest, FloatLiterals) {
  for (const char *source :
       {"1.5", "0.0", "1e10", "1E-3", "2.5e+8", "1.5e-3f64", "3.0f32",
        "1_0.2_5"}) {
    auto lexemes = lex(source);
    ASSERT_EQ(lexemes.size(), 1u) << source;
    EXPECT_EQ(lexemes[0].literal, LiteralKind::Float) << source;
    EXPECT_EQ(lexemes[0].text, source);
  }
}

TEST(LexemizerTest, DotWithoutDigitLeavesTheNumber) {
  expect_sequence(lex("1."), {
                                 {LexemeKind::Literal, "1"},
                                 {LexemeKind::Punctuation, "."},
                             });
  expect_sequence(lex("1..2"), {
                                   {LexemeKind::Literal, "1"},
                                   {LexemeKind::Operator, ".."},
                                   {LexemeKind::Literal, "2"},
                               });
  expect_sequence(lex("1.max(2)"), {
                                       {LexemeKind::Literal, "1"},
                                       {LexemeKind::Punctuation, "."},
                                       {LexemeKind::Identifier, "max"},
                                       {LexemeKind::Punctuation, "("},
                                       {LexemeKind::Literal, "2"},
                                       {LexemeKind::Punctuation, ")"},
                                   });
  expect_sequence(lex("x.0.1"), {
                                    {LexemeKind::Identifier, "x"},
                                    {LexemeKind::Punctuation, "."},
                                    {LexemeKind::Literal, "0.1"},
                                });
}

TEST(LexemizerTest, ExponentNeedsDigit) {
  // `e` with nothing numeric after it is a suffix, not an exponent.
  auto lexemes = lex("1e");
  ASSERT_EQ(lexemes.size(), 1u);
  EXPECT_EQ(lexemes[0].literal, LiteralKind::Integer);

  auto separator = lex("1e_");
  ASSERT_EQ(separator.size(), 1u);
  EXPECT_EQ(separator[0].literal, LiteralKind::Float);
}

TEST(LexemizerTest, StringLiterals) {
  auto lexemes = lex_significant(
      "\"a\\\"b\" b\"bytes\" \"multi\nline\" \"with\\\\\" \"s\"suffix");
  ASSERT_EQ(lexemes.size(), 5u);
  EXPECT_EQ(lexemes[0].literal, LiteralKind::String);
  EXPECT_EQ(lexemes[0].text, "\"a\\\"b\"");
  EXPECT_EQ(lexemes[1].literal, LiteralKind::ByteString);
  EXPECT_EQ(lexemes[2].text, "\"multi\nline\"");
  EXPECT_EQ(lexemes[3].text, "\"with\\\\\"");
  EXPECT_EQ(lexemes[4].text, "\"s\"suffix");
  for (const auto &lexeme : lexemes) {
    EXPECT_TRUE(lexeme.terminated) << lexeme.text;
  }
}

TEST(LexemizerTest, UnterminatedStringRunsToEnd) {
  auto lexemes = lex("\"abc\nfn main");
  ASSERT_EQ(lexemes.size(), 1u);
  EXPECT_EQ(lexemes[0].literal, LiteralKind::String);
  EXPECT_FALSE(lexemes[0].terminated);
  EXPECT_EQ(lexemes[0].text, "\"abc\nfn main");
}

TEST(LexemizerTest, ByteLiterals) {
  auto lexemes = lex_significant("b'x' b'\\x7f' br\"raw\" br##\"a\"##");
  ASSERT_EQ(lexemes.size(), 4u);
  EXPECT_EQ(lexemes[0].literal, LiteralKind::ByteChar);
  EXPECT_EQ(lexemes[1].literal, LiteralKind::ByteChar);
  EXPECT_EQ(lexemes[2].literal, LiteralKind::RawByteString);
  EXPECT_EQ(lexemes[2].hash_count, 0u);
  EXPECT_EQ(lexemes[3].literal, LiteralKind::RawByteString);
  EXPECT_EQ(lexemes[3].hash_count, 2u);
}

TEST(LexemizerTest, RawStringHashes) {
  auto one = lex("r#\"a \"quoted\" b\"#");
  ASSERT_EQ(one.size(), 1u);
  EXPECT_EQ(one[0].literal, LiteralKind::RawString);
  EXPECT_EQ(one[0].hash_count, 1u);
  EXPECT_TRUE(one[0].terminated);

  // A shorter closing run does not end the literal.
  auto two = lex("r##\"a\"# b\"##");
  ASSERT_EQ(two.size(), 1u);
  EXPECT_EQ(two[0].hash_count, 2u);
  EXPECT_TRUE(two[0].terminated);

  // Extra closing hashes belong to the next lexeme.
  expect_sequence(lex("r#\"a\"##"), {
                                        {LexemeKind::Literal, "r#\"a\"#"},
                                        {LexemeKind::Punctuation, "#"},
                                    });

  auto plain = lex("r\"C:\\path\\\"");
  ASSERT_EQ(plain.size(), 1u);
  EXPECT_EQ(plain[0].hash_count, 0u);
  EXPECT_EQ(plain[0].text, "r\"C:\\path\\\"");
}

TEST(LexemizerTest, UnterminatedRawString) {
  auto lexemes = lex("r#\"never closed\"");
  ASSERT_EQ(lexemes.size(), 1u);
  EXPECT_EQ(lexemes[0].literal, LiteralKind::RawString);
  EXPECT_FALSE(lexemes[0].terminated);
}

TEST(LexemizerTest, LineComments) {
  auto lexemes = lex("// plain\n/// outer doc\n//! inner doc\n//// not doc");
  std::vector<Lexeme> comments;
  for (const auto &lexeme : lexemes) {
    if (lexeme.kind == LexemeKind::LineComment) {
      comments.push_back(lexeme);
    }
  }
  ASSERT_EQ(comments.size(), 4u);
  EXPECT_EQ(comments[0].text, "// plain");
  EXPECT_FALSE(comments[0].is_doc);
  EXPECT_TRUE(comments[1].is_doc);
  EXPECT_TRUE(comments[2].is_doc);
  EXPECT_FALSE(comments[3].is_doc);
}

TEST(LexemizerTest, LineCommentExcludesCrLf) {
  expect_sequence(lex("// a\r\nb"), {
                                        {LexemeKind::LineComment, "// a"},
                                        {LexemeKind::Whitespace, "\r\n"},
                                        {LexemeKind::Identifier, "b"},
                                    });
}

TEST(LexemizerTest, BlockCommentsNest) {
  expect_sequence(lex("/* a /* b */ c */x"),
                  {
                      {LexemeKind::BlockComment, "/* a /* b */ c */"},
                      {LexemeKind::Identifier, "x"},
                  });

  auto open = lex("/* /* */");
  ASSERT_EQ(open.size(), 1u);
  EXPECT_EQ(open[0].kind, LexemeKind::BlockComment);
  EXPECT_FALSE(open[0].terminated);
}

TEST(LexemizerTest, BlockDocComments) {
  struct Case {
    const char *source;
    bool is_doc;
  };
  for (const Case &c : {Case{"/** doc */", true}, Case{"/*! inner */", true},
                        Case{"/**/", false}, Case{"/***/", false},
                        Case{"/* plain */", false}}) {
    auto lexemes = lex(c.source);
    ASSERT_EQ(lexemes.size(), 1u) << c.source;
    EXPECT_EQ(lexemes[0].kind, LexemeKind::BlockComment) << c.source;
    EXPECT_EQ(lexemes[0].is_doc, c.is_doc) << c.source;
    EXPECT_TRUE(lexemes[0].terminated) << c.source;
  }
}

TEST(LexemizerTest, DocCommentsAreNotTrivia) {
  auto lexemes = lex_significant("/// doc\nfn");
  expect_sequence(lexemes, {
                               {LexemeKind::LineComment, "/// doc"},
                               {LexemeKind::Keyword, "fn"},
                           });
}

TEST(LexemizerTest, Shebang) {
  expect_sequence(lex("#!/usr/bin/env run\nfn"),
                  {
                      {LexemeKind::LineComment, "#!/usr/bin/env run"},
                      {LexemeKind::Whitespace, "\n"},
                      {LexemeKind::Keyword, "fn"},
                  });
}

TEST(LexemizerTest, InnerAttributeIsNotAShebang) {
  expect_sequence(lex_significant("#![no_std]"),
                  {
                      {LexemeKind::Punctuation, "#"},
                      {LexemeKind::Operator, "!"},
                      {LexemeKind::Punctuation, "["},
                      {LexemeKind::Identifier, "no_std"},
                      {LexemeKind::Punctuation, "]"},
                  });
}

TEST(LexemizerTest, ShebangOnlyAtStart) {
  expect_sequence(lex_significant("x #!y"), {
                                                {LexemeKind::Identifier, "x"},
                                                {LexemeKind::Punctuation, "#"},
                                                {LexemeKind::Operator, "!"},
                                                {LexemeKind::Identifier, "y"},
                                            });
}

TEST(LexemizerTest, UnknownConsumesOneCodePoint) {
  expect_sequence(lex("~`\\"), {
                                   {LexemeKind::Unknown, "~"},
                                   {LexemeKind::Unknown, "`"},
                                   {LexemeKind::Unknown, "\\"},
                               });
  expect_sequence(lex("\xF0\x9F\x98\x80x"),
                  {
                      {LexemeKind::Unknown, "\xF0\x9F\x98\x80"},
                      {LexemeKind::Identifier, "x"},
                  });
}

TEST(LexemizerTest, InvalidUtf8IsUnknownPerByte) {
  expect_sequence(lex("\xFF\xC3"), {
                                       {LexemeKind::Unknown, "\xFF"},
                                       {LexemeKind::Unknown, "\xC3"},
                                   });
}

} // namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
