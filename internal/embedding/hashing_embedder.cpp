#include "hashing_embedder.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

#include "internal/util/errors.hpp"

namespace omni::embedding {

namespace {

constexpr uint64_t kFnvOffset = 1469598103934665603ull;
constexpr uint64_t kFnvPrime  = 1099511628211ull;

} // namespace

HashingEmbedder::HashingEmbedder(std::size_t dimension) : dimension_(dimension) {
  if (dimension_ == 0) {
    throw util::InvalidArgument("embedding dimension must be positive");
  }
}

std::vector<float> HashingEmbedder::Embed(const std::string& text, const std::string& model) {
  std::vector<float> out(dimension_, 0.0f);

  // the model name seeds the hash so generations do not share buckets
  uint64_t seed = kFnvOffset;
  for (unsigned char c : model) {
    seed = (seed ^ c) * kFnvPrime;
  }

  uint64_t hash   = seed;
  bool     in_tok = false;
  auto     flush  = [&] {
    const auto   bucket = static_cast<std::size_t>(hash % dimension_);
    const float  sign   = ((hash >> 63) & 1u) ? -1.0f : 1.0f;
    out[bucket] += sign;
    hash   = seed;
    in_tok = false;
  };

  for (unsigned char c : text) {
    if (std::isalnum(c)) {
      hash   = (hash ^ static_cast<unsigned char>(std::tolower(c))) * kFnvPrime;
      in_tok = true;
    } else if (in_tok) {
      flush();
    }
  }
  if (in_tok) flush();

  double norm = 0.0;
  for (float v : out) norm += static_cast<double>(v) * v;
  if (norm > 0.0) {
    const auto scale = static_cast<float>(1.0 / std::sqrt(norm));
    for (float& v : out) v *= scale;
  }
  return out;
}

} // namespace omni::embedding
