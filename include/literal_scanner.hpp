#pragma once

#include "cursor.hpp"
#include "lexeme.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace lexemizer {

// Cursor must be on an ASCII digit. Consumes the digits, any base prefix,
// fraction and exponent; the suffix is left for eat_literal_suffix().
// Returns Integer or Float.
LiteralKind scan_number(Cursor &cursor);

// Cursor must be on the opening `"`. Returns false if the input ends first.
bool scan_double_quoted(Cursor &cursor);

// Cursor must be on the opening `'`. Returns false if the input ends first.
bool scan_single_quoted(Cursor &cursor);

// If the text `prefix_length` characters ahead is `#*"`, returns the number
// of hashes. Used to tell `r"`, `r#"` and `br##"` from identifiers.
std::optional<std::uint32_t> raw_string_hashes(const Cursor &cursor,
                                               std::size_t prefix_length);

// Cursor must be on the `r` / `b` prefix of a raw string already vetted by
// raw_string_hashes(). Returns false if no matching closing delimiter exists.
bool scan_raw_string(Cursor &cursor, std::size_t prefix_length,
                     std::uint32_t hashes);

struct QuoteScan {
  bool is_lifetime{false};
  bool terminated{true};
};

// Cursor must be on `'`. Decides between a lifetime (`'a`, `'static`) and a
// character literal (`'a'`, `'\n'`) by looking past the identifier run.
QuoteScan scan_lifetime_or_char(Cursor &cursor);

// Consumes an identifier-shaped suffix such as `u8` or `f64`, if present.
void eat_literal_suffix(Cursor &cursor);

// Consumes `XID_Start XID_Continue*`; returns false if nothing matched.
bool eat_identifier(Cursor &cursor);

} // namespace lexemizer
