#pragma once

#include "cursor.hpp"

namespace lexemizer {

struct CommentScan {
  bool is_doc{false};
  bool terminated{true};
};

// Cursor must be on "//". Consumes up to, not including, the line break.
// `///` and `//!` are doc comments; `////` is not.
CommentScan scan_line_comment(Cursor &cursor);

// Cursor must be on "/*". Block comments nest. `/**` and `/*!` are doc
// comments, except `/**/` and `/***...`.
CommentScan scan_block_comment(Cursor &cursor);

// True at offset 0 on "#!" that does not open an inner attribute ("#![").
bool at_shebang(const Cursor &cursor);

// Cursor must be on a shebang; consumes the rest of the line.
void scan_shebang(Cursor &cursor);

} // namespace lexemizer
