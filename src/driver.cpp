#include "edition.hpp"
#include "lexeme.hpp"
#include "lexeme_checker.hpp"
#include "lexemizer.hpp"
#include "source_buffer.hpp"

#include <llvm/ADT/SmallVector.h>
#include <llvm/Support/CommandLine.h>
#include <llvm/Support/Error.h>
#include <llvm/Support/WithColor.h>
#include <llvm/Support/raw_ostream.h>

#include <system_error>
#include <vector>

using namespace llvm;

enum class OutputFormat { Table, Tokens };

static cl::opt<std::string> InputFilename(cl::Positional,
                                          cl::desc("<input file | ->"),
                                          cl::init(""));

static cl::opt<std::string>
    EditionName("edition",
                cl::desc("Language edition (only 2018 is supported)"),
                cl::value_desc("year"), cl::init("2018"));

static cl::opt<std::string>
    Expression("e", cl::desc("Lexemize <text> instead of reading a file"),
               cl::value_desc("text"));

static cl::opt<OutputFormat> Format(
    "format", cl::desc("Output format"),
    cl::values(clEnumValN(OutputFormat::Table, "table",
                          "one row per lexeme with offsets (default)"),
               clEnumValN(OutputFormat::Tokens, "tokens",
                          "[Kind] 'text' (line L, col C) per lexeme")),
    cl::init(OutputFormat::Table));

static cl::opt<bool> SkipTrivia(
    "skip-trivia",
    cl::desc("Omit whitespace and non-doc comments from the output"));

static cl::opt<bool>
    Check("check", cl::desc("Validate literals, escapes and suffixes and "
                            "report diagnostics"));

static void printLexeme(const lexemizer::Lexeme &lexeme, raw_ostream &os) {
  os << "[" << lexemizer::to_string(lexeme.kind) << "] ";
  os << "'" << lexemizer::visible_snippet(lexeme.text) << "'";
  os << " (line " << lexeme.span.begin.line << ", col "
     << lexeme.span.begin.column << ")\n";
}

static void printSourceLine(StringRef source,
                            const lexemizer::Diagnostic &diag,
                            raw_ostream &os) {
  SmallVector<StringRef, 32> lines;
  source.split(lines, '\n');

  size_t line = diag.at.line;
  if (line < 1 || line > lines.size()) {
    return;
  }

  StringRef lineContent = lines[line - 1].rtrim('\r');
  os << "  " << line << " | " << lineContent << "\n";
  os << "    | ";

  // Tildes only when the whole lexeme sits on the reported line.
  bool single_line =
      diag.span.begin.line == line && diag.span.end.line == line;
  size_t start_col = single_line ? diag.span.begin.column : diag.at.column;
  size_t end_col = single_line ? diag.span.end.column : diag.at.column + 1;

  for (size_t i = 1; i < start_col; ++i) {
    os << " ";
  }

  if (end_col > start_col + 1) {
    for (size_t i = start_col; i < end_col; ++i) {
      if (i == diag.at.column) {
        WithColor(os, raw_ostream::RED, true) << "^";
      } else {
        WithColor(os, raw_ostream::RED) << "~";
      }
    }
  } else {
    WithColor(os, raw_ostream::RED, true) << "^";
  }

  os << "\n";
}

static void printDiagnostic(const lexemizer::SourceBuffer &buffer,
                            const lexemizer::Diagnostic &diag) {
  raw_ostream &os = diag.severity == lexemizer::Severity::Error
                        ? WithColor::error(errs(), "lexemize")
                        : WithColor::warning(errs(), "lexemize");
  os << buffer.name() << ":" << diag.at.line << ":" << diag.at.column << ": "
     << diag.message << "\n";
  StringRef text(buffer.text().data(), buffer.text().size());
  printSourceLine(text, diag, errs());
}

static ErrorOr<lexemizer::SourceBuffer> loadSource() {
  if (Expression.getNumOccurrences() > 0) {
    return lexemizer::SourceBuffer::from_text(Expression, "<command line>");
  }
  return lexemizer::SourceBuffer::open(InputFilename);
}

static int runLexemizer(const lexemizer::EditionConfig &config) {
  auto bufferOrErr = loadSource();
  if (std::error_code ec = bufferOrErr.getError()) {
    WithColor::error(errs(), "lexemize")
        << "cannot open file '" << InputFilename << "': " << ec.message()
        << "\n";
    return 1;
  }
  const lexemizer::SourceBuffer &buffer = *bufferOrErr;

  lexemizer::Lexemizer lexer(buffer.text(), config);
  auto lexemes = lexer.lexemize_all();

  lexemizer::LexemeChecker checker;
  if (Check) {
    checker.check(lexemes);
  } else {
    // Unknown characters and unterminated constructs are always errors.
    for (const auto &lexeme : lexemes) {
      if (lexeme.kind == lexemizer::LexemeKind::Unknown ||
          !lexeme.terminated) {
        checker.check(lexeme);
      }
    }
  }

  std::vector<const lexemizer::Lexeme *> shown;
  for (const auto &lexeme : lexemes) {
    if (!SkipTrivia || !lexeme.is_trivia()) {
      shown.push_back(&lexeme);
    }
  }

  if (Format.getValue() == OutputFormat::Table) {
    outs() << "Lexemes: " << shown.size() << "\n";
    for (const auto *lexeme : shown) {
      lexemizer::print_lexeme(*lexeme, outs());
    }
  } else {
    for (const auto *lexeme : shown) {
      printLexeme(*lexeme, outs());
    }
  }
  outs().flush();

  for (const auto &diag : checker.diagnostics()) {
    printDiagnostic(buffer, diag);
  }

  return checker.has_errors() ? 1 : 0;
}

int main(int argc, char **argv) {
  cl::ParseCommandLineOptions(argc, argv, "Rust 2018 lexemizer\n");

  if (InputFilename.empty() && Expression.getNumOccurrences() == 0) {
    WithColor::error(errs(), "lexemize")
        << "no input: pass a file, '-' for standard input, or -e <text>\n";
    return 1;
  }

  auto edition = lexemizer::parse_edition(EditionName);
  if (!edition) {
    WithColor::error(errs(), "lexemize") << toString(edition.takeError())
                                         << "\n";
    return 1;
  }

  auto config = lexemizer::make_edition_config(*edition);
  if (!config) {
    WithColor::error(errs(), "lexemize") << toString(config.takeError())
                                         << "\n";
    return 1;
  }

  return runLexemizer(*config);
}
