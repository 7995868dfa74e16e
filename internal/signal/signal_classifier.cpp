#include "signal_classifier.hpp"

#include <utility>

namespace omni::signal {

using db::model::SignalKind;

SignalClassifier::SignalClassifier(config::SignalOptions options) : options_(std::move(options)) {
}

SignalKind SignalClassifier::Classify(double price, const IndicatorValues& values) const {
  if (values.rsi) {
    if (*values.rsi > options_.rsi_overbought) return SignalKind::kSell;
    if (*values.rsi < options_.rsi_oversold) return SignalKind::kBuy;
  }

  const auto& trend = options_.trend;
  if (trend.enabled && values.daily_return) {
    const double ret = *values.daily_return;
    if (price > values.ma * (1.0 + trend.band) && ret >= trend.min_daily_return) return SignalKind::kBuy;
    if (price < values.ma * (1.0 - trend.band) && ret <= -trend.min_daily_return) return SignalKind::kSell;
  }

  return SignalKind::kHold;
}

} // namespace omni::signal
