#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace omni::embedding {

/*
  External embedding model: text -> fixed-length vector.

  Implementations throw util::EmbeddingUnavailable when the model cannot
  answer right now; callers retry those.
*/
class EmbeddingFunction {
 public:
  virtual ~EmbeddingFunction() = default;

  virtual std::vector<float> Embed(const std::string& text, const std::string& model) = 0;

  virtual std::size_t Dimension() const = 0;
};

} // namespace omni::embedding
