#pragma once

#include <memory>
#include <string_view>

#include <llvm/ADT/StringRef.h>
#include <llvm/Support/ErrorOr.h>
#include <llvm/Support/MemoryBuffer.h>

namespace lexemizer {

// Immutable source text of one compilation unit. Lexemizers borrow its text,
// so it has to outlive them; lexemes copy what they need.
class SourceBuffer {
public:
  // Copies `text`.
  static SourceBuffer from_text(llvm::StringRef text,
                                llvm::StringRef name = "<input>");

  // Reads a file, or standard input when `path` is "-".
  static llvm::ErrorOr<SourceBuffer> open(llvm::StringRef path);

  std::string_view text() const;
  llvm::StringRef name() const { return buffer_->getBufferIdentifier(); }

private:
  explicit SourceBuffer(std::unique_ptr<llvm::MemoryBuffer> buffer);

  std::unique_ptr<llvm::MemoryBuffer> buffer_;
};

} // namespace lexemizer
