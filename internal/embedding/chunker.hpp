#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace omni::embedding {

struct TextChunk {
  uint32_t    index  = 0;
  std::size_t offset = 0;
  std::string text;
};

/*
  Splits article content into overlapping windows for embedding.

  Each chunk holds at most max_chars bytes. A cut falls on the last
  whitespace inside the window when there is one; otherwise the window is
  cut hard, backing off so a UTF-8 sequence is never split. The next chunk
  starts overlap_chars before the previous cut, moved forward to a word
  start. Output is a pure function of the inputs.
*/
class Chunker {
 public:
  // Throws util::InvalidArgument unless overlap_chars < max_chars.
  Chunker(std::size_t max_chars, std::size_t overlap_chars);

  std::vector<TextChunk> Split(const std::string& content) const;

 private:
  std::size_t max_chars_;
  std::size_t overlap_chars_;
};

} // namespace omni::embedding
