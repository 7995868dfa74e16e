#include "runtime_options.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace omni::config {

SignalOptions ResolveSignalOptions(const omni::runtime::config::SignalConfig& config) {
  SignalOptions options;
  if (config.window_size() > 0) options.window_size = config.window_size();
  if (config.rsi_period() > 0) options.rsi_period = config.rsi_period();
  if (config.has_rsi_overbought()) options.rsi_overbought = config.rsi_overbought();
  if (config.has_rsi_oversold()) options.rsi_oversold = config.rsi_oversold();
  if (config.staleness_window_ms() > 0) options.staleness_window_ms = config.staleness_window_ms();
  if (config.sweep_interval_ms() > 0) options.sweep_interval_ms = config.sweep_interval_ms();
  if (config.backfill_batch_size() > 0) options.backfill_batch_size = config.backfill_batch_size();
  if (config.conflict_retry_limit() > 0) options.conflict_retry_limit = config.conflict_retry_limit();

  if (config.has_trend()) {
    options.trend.enabled = config.trend().enabled();
    if (config.trend().has_band()) options.trend.band = config.trend().band();
    if (config.trend().has_min_daily_return()) options.trend.min_daily_return = config.trend().min_daily_return();
  }

  if (!(options.rsi_oversold >= 0.0) || options.rsi_overbought > 100.0 || options.rsi_oversold >= options.rsi_overbought) {
    throw util::InvalidArgument("signals: need 0 <= rsi_oversold < rsi_overbought <= 100, got " + std::to_string(options.rsi_oversold) + " / " +
                                std::to_string(options.rsi_overbought));
  }
  if (!(options.trend.band >= 0.0) || !(options.trend.min_daily_return >= 0.0)) {
    throw util::InvalidArgument("signals: trend band and min_daily_return must not be negative");
  }
  return options;
}

EmbeddingOptions ResolveEmbeddingOptions(const omni::runtime::config::EmbeddingConfig& config) {
  EmbeddingOptions options;
  if (!config.model().empty()) options.model = config.model();
  if (config.dimension() > 0) options.dimension = config.dimension();
  if (config.metric() == omni::runtime::config::SIMILARITY_METRIC_INNER_PRODUCT) options.metric = SimilarityMetric::kInnerProduct;
  if (config.max_chunk_chars() > 0) options.max_chunk_chars = config.max_chunk_chars();
  if (config.chunk_overlap_chars() > 0) options.chunk_overlap_chars = config.chunk_overlap_chars();
  if (config.workers() > 0) options.workers = config.workers();
  if (config.retry_base_delay_ms() > 0) options.retry_base_delay_ms = config.retry_base_delay_ms();
  if (config.retry_max_delay_ms() > 0) options.retry_max_delay_ms = config.retry_max_delay_ms();
  if (config.max_attempts() > 0) options.max_attempts = config.max_attempts();

  if (config.chunk_overlap_chars() == 0 && options.chunk_overlap_chars >= options.max_chunk_chars) {
    options.chunk_overlap_chars = options.max_chunk_chars / 5;
  }
  if (options.chunk_overlap_chars >= options.max_chunk_chars) {
    throw util::InvalidArgument("embedding: chunk_overlap_chars must be smaller than max_chunk_chars");
  }
  if (options.retry_max_delay_ms < options.retry_base_delay_ms) {
    options.retry_max_delay_ms = options.retry_base_delay_ms;
  }
  return options;
}

const char* ToString(SimilarityMetric metric) {
  switch (metric) {
    case SimilarityMetric::kCosine:
      return "cosine";
    case SimilarityMetric::kInnerProduct:
      return "inner_product";
  }
  return "unknown";
}

} // namespace omni::config
