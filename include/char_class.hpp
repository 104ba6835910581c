#pragma once

namespace lexemizer {

// Pattern_White_Space, which is what the language treats as whitespace.
bool is_whitespace(char32_t c);

// `_` or XID_Start.
bool is_id_start(char32_t c);

// XID_Continue (includes digits and `_`).
bool is_id_continue(char32_t c);

bool is_ascii_digit(char32_t c);
bool is_hex_digit(char32_t c);

} // namespace lexemizer
