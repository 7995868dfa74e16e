#pragma once

#include <vector>

#include "internal/config/runtime_options.hpp"

namespace omni::embedding {

// Vectors must have equal length. Cosine of a zero vector is 0.
double CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b);
double InnerProduct(const std::vector<float>& a, const std::vector<float>& b);

double Similarity(config::SimilarityMetric metric, const std::vector<float>& a, const std::vector<float>& b);

} // namespace omni::embedding
