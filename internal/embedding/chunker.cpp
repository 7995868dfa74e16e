#include "chunker.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace omni::embedding {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsContinuationByte(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

Chunker::Chunker(std::size_t max_chars, std::size_t overlap_chars) : max_chars_(max_chars), overlap_chars_(overlap_chars) {
  if (max_chars_ == 0 || overlap_chars_ >= max_chars_) {
    throw util::InvalidArgument("chunker: overlap must be smaller than the chunk size");
  }
}

std::vector<TextChunk> Chunker::Split(const std::string& content) const {
  std::vector<TextChunk> chunks;
  const std::size_t      n   = content.size();
  std::size_t            pos = 0;

  while (pos < n) {
    while (pos < n && IsSpace(content[pos])) ++pos;
    if (pos >= n) break;

    std::size_t cut = n;
    if (n - pos > max_chars_) {
      const std::size_t limit = pos + max_chars_;
      cut                     = limit;
      // prefer the last whitespace inside the window
      for (std::size_t k = limit; k > pos; --k) {
        if (IsSpace(content[k])) {
          cut = k;
          break;
        }
      }
      if (cut == limit) {
        while (cut > pos + 1 && IsContinuationByte(content[cut])) --cut;
      }
    }

    std::size_t end = cut;
    while (end > pos && IsSpace(content[end - 1])) --end;

    TextChunk chunk;
    chunk.index  = static_cast<uint32_t>(chunks.size());
    chunk.offset = pos;
    chunk.text   = content.substr(pos, end - pos);
    chunks.push_back(std::move(chunk));

    if (cut >= n) break;

    std::size_t next = cut > overlap_chars_ ? cut - overlap_chars_ : 0;
    if (next <= pos) {
      next = cut;
    } else {
      // start the overlap on a word boundary
      while (next < cut && !IsSpace(content[next - 1])) ++next;
    }
    pos = next;
  }

  return chunks;
}

} // namespace omni::embedding
