#include "source_buffer.hpp"

namespace lexemizer {

SourceBuffer::SourceBuffer(std::unique_ptr<llvm::MemoryBuffer> buffer)
    : buffer_(std::move(buffer)) {}

SourceBuffer SourceBuffer::from_text(llvm::StringRef text,
                                     llvm::StringRef name) {
  return SourceBuffer(llvm::MemoryBuffer::getMemBufferCopy(text, name));
}

llvm::ErrorOr<SourceBuffer> SourceBuffer::open(llvm::StringRef path) {
  auto buffer_or_err =
      llvm::MemoryBuffer::getFileOrSTDIN(path, /*IsText=*/false,
                                         /*RequiresNullTerminator=*/false);
  if (std::error_code ec = buffer_or_err.getError()) {
    return ec;
  }
  return SourceBuffer(std::move(*buffer_or_err));
}

std::string_view SourceBuffer::text() const {
  llvm::StringRef text = buffer_->getBuffer();
  return std::string_view(text.data(), text.size());
}

} // namespace lexemizer
