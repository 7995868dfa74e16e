#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace omni::config {

/*
  Typed runtime options resolved from RuntimeConfig.

  Zero or empty proto fields fall back to the defaults below; the optional
  threshold fields fall back only when unset. Resolve*()
  throws util::InvalidArgument for settings that cannot work together.
*/

struct TrendRule {
  bool   enabled          = false;
  double band             = 0.02;
  double min_daily_return = 0.01;
};

struct SignalOptions {
  std::size_t window_size          = 7;
  std::size_t rsi_period           = 14;
  double      rsi_overbought       = 70.0;
  double      rsi_oversold         = 30.0;
  TrendRule   trend;
  uint64_t    staleness_window_ms  = 24ull * 60 * 60 * 1000;
  uint64_t    sweep_interval_ms    = 60 * 1000;
  std::size_t backfill_batch_size  = 256;
  std::size_t conflict_retry_limit = 3;
};

enum class SimilarityMetric { kCosine, kInnerProduct };

struct EmbeddingOptions {
  std::string      model               = "hashing-v1";
  std::size_t      dimension           = 256;
  SimilarityMetric metric              = SimilarityMetric::kCosine;
  std::size_t      max_chunk_chars     = 1000;
  std::size_t      chunk_overlap_chars = 200;
  std::size_t      workers             = 2;
  uint64_t         retry_base_delay_ms = 500;
  uint64_t         retry_max_delay_ms  = 30 * 1000;
  uint32_t         max_attempts        = 5;
};

SignalOptions    ResolveSignalOptions(const omni::runtime::config::SignalConfig& config);
EmbeddingOptions ResolveEmbeddingOptions(const omni::runtime::config::EmbeddingConfig& config);

const char* ToString(SimilarityMetric metric);

} // namespace omni::config
