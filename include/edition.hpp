#pragma once

#include <llvm/ADT/ArrayRef.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/Support/Error.h>

namespace lexemizer {

enum class Edition {
  Rust2015,
  Rust2018,
  Rust2021,
};

// Immutable per-call configuration handed to the Lexemizer. Owns nothing;
// the keyword table points at static storage.
struct EditionConfig {
  Edition edition{Edition::Rust2018};
  llvm::ArrayRef<llvm::StringRef> keywords{}; // sorted

  bool is_keyword(llvm::StringRef word) const;
};

// "2015", "2018", "2021" (an optional "rust" prefix is accepted).
llvm::Expected<Edition> parse_edition(llvm::StringRef text);

// Fails for editions whose lexical grammar is not implemented.
llvm::Expected<EditionConfig> make_edition_config(Edition edition);

const char *to_string(Edition edition);

} // namespace lexemizer
