#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "embedding_function.hpp"

namespace omni::embedding {

/*
  Deterministic bag-of-words embedder.

  Lowercased alphanumeric tokens are hashed (FNV-1a) into `dimension`
  signed buckets and the result is L2-normalized. Stands in for a real
  model in deployments without one, and in tests.
*/
class HashingEmbedder final : public EmbeddingFunction {
 public:
  explicit HashingEmbedder(std::size_t dimension);

  std::vector<float> Embed(const std::string& text, const std::string& model) override;

  std::size_t Dimension() const override {
    return dimension_;
  }

 private:
  std::size_t dimension_;
};

} // namespace omni::embedding
