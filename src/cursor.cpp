#include "cursor.hpp"

#include <llvm/Support/ConvertUTF.h>

namespace lexemizer {

Cursor::Cursor(std::string_view source) : source_(source) {}

char32_t Cursor::decode(std::size_t offset, std::size_t &width) const {
  width = 0;
  if (offset >= source_.size()) {
    return kEndOfInput;
  }

  auto lead = static_cast<unsigned char>(source_[offset]);
  if (lead < 0x80) {
    width = 1;
    return lead;
  }

  // llvm::UTF8 is unsigned char, so the same bytes are read as UTF8.
  const auto *begin =
      reinterpret_cast<const llvm::UTF8 *>(source_.data() + offset);
  const auto *end =
      reinterpret_cast<const llvm::UTF8 *>(source_.data() + source_.size());
  const llvm::UTF8 *cursor = begin;
  llvm::UTF32 code_point = 0;
  llvm::ConversionResult result = llvm::convertUTF8Sequence(
      &cursor, end, &code_point, llvm::strictConversion);
  if (result != llvm::conversionOK || cursor == begin) {
    // Malformed or truncated sequence: consume the lead byte alone.
    width = 1;
    return kReplacement;
  }

  width = static_cast<std::size_t>(cursor - begin);
  return code_point;
}

char32_t Cursor::peek(std::size_t ahead) const {
  std::size_t offset = position_.offset;
  std::size_t width = 0;
  char32_t c = decode(offset, width);
  while (ahead > 0 && c != kEndOfInput) {
    offset += width;
    c = decode(offset, width);
    --ahead;
  }
  return c;
}

char32_t Cursor::advance() {
  std::size_t width = 0;
  char32_t c = decode(position_.offset, width);
  if (c == kEndOfInput) {
    return c;
  }

  position_.offset += width;
  if (c == U'\n') {
    ++position_.line;
    position_.column = 1;
  } else {
    ++position_.column;
  }
  return c;
}

void Cursor::advance(std::size_t count) {
  for (std::size_t i = 0; i < count && !is_eof(); ++i) {
    advance();
  }
}

std::string_view Cursor::slice_from(std::size_t start) const {
  if (start > position_.offset) {
    return {};
  }
  return source_.substr(start, position_.offset - start);
}

} // namespace lexemizer
