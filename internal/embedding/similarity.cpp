#include "similarity.hpp"

#include <cmath>
#include <cstddef>
#include <string>

#include "internal/util/errors.hpp"

namespace omni::embedding {

namespace {

void RequireSameLength(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size()) {
    throw util::InvalidArgument("vector length mismatch: " + std::to_string(a.size()) + " vs " + std::to_string(b.size()));
  }
}

} // namespace

double InnerProduct(const std::vector<float>& a, const std::vector<float>& b) {
  RequireSameLength(a, b);
  double dot = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return dot;
}

double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  RequireSameLength(a, b);
  double dot    = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const double x = a[i];
    const double y = b[i];
    dot += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

double Similarity(config::SimilarityMetric metric, const std::vector<float>& a, const std::vector<float>& b) {
  switch (metric) {
    case config::SimilarityMetric::kInnerProduct:
      return InnerProduct(a, b);
    case config::SimilarityMetric::kCosine:
    default:
      return CosineSimilarity(a, b);
  }
}

} // namespace omni::embedding
