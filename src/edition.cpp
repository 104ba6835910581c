#include "edition.hpp"

#include <llvm/ADT/StringSwitch.h>

#include <algorithm>
#include <system_error>

namespace lexemizer {
namespace {

// Strict and reserved words of the 2018 edition, sorted for binary search.
// Weak keywords other than `union` are ordinary identifiers.
const llvm::StringRef kRust2018Keywords[] = {
    "Self",   "abstract", "as",      "async",  "await",    "become",
    "box",    "break",    "const",   "continue", "crate",  "do",
    "dyn",    "else",     "enum",    "extern", "false",    "final",
    "fn",     "for",      "if",      "impl",   "in",       "let",
    "loop",   "macro",    "match",   "mod",    "move",     "mut",
    "override", "priv",   "pub",     "ref",    "return",   "self",
    "static", "struct",   "super",   "trait",  "true",     "try",
    "type",   "typeof",   "union",   "unsafe", "unsized",  "use",
    "virtual", "where",   "while",   "yield",
};

} // namespace

bool EditionConfig::is_keyword(llvm::StringRef word) const {
  return std::binary_search(keywords.begin(), keywords.end(), word);
}

llvm::Expected<Edition> parse_edition(llvm::StringRef text) {
  llvm::StringRef year = text.trim();
  year.consume_front_insensitive("rust");
  auto edition = llvm::StringSwitch<llvm::Optional<Edition>>(year)
                     .Case("2015", Edition::Rust2015)
                     .Case("2018", Edition::Rust2018)
                     .Case("2021", Edition::Rust2021)
                     .Default(llvm::None);
  if (!edition) {
    return llvm::createStringError(
        std::make_error_code(std::errc::invalid_argument),
        "unknown edition '%s' (expected 2015, 2018 or 2021)",
        text.str().c_str());
  }
  return *edition;
}

llvm::Expected<EditionConfig> make_edition_config(Edition edition) {
  switch (edition) {
  case Edition::Rust2018:
    return EditionConfig{edition, llvm::makeArrayRef(kRust2018Keywords)};
  case Edition::Rust2015:
  case Edition::Rust2021:
    break;
  }
  return llvm::createStringError(
      std::make_error_code(std::errc::invalid_argument),
      "edition %s is not supported (only 2018 is)", to_string(edition));
}

const char *to_string(Edition edition) {
  switch (edition) {
  case Edition::Rust2015:
    return "2015";
  case Edition::Rust2018:
    return "2018";
  case Edition::Rust2021:
    return "2021";
  }
  return "unknown";
}

} // namespace lexemizer
