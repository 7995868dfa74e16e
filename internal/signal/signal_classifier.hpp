#pragma once

#include "indicators.hpp"
#include "internal/config/runtime_options.hpp"
#include "internal/db/model/enums.hpp"

namespace omni::signal {

/*
  Maps indicator values to buy / sell / hold.

  RSI thresholds take precedence over the trend rule. A missing RSI skips
  the RSI rules; the trend rule needs a daily return.
*/
class SignalClassifier {
 public:
  explicit SignalClassifier(config::SignalOptions options);

  db::model::SignalKind Classify(double price, const IndicatorValues& values) const;

 private:
  config::SignalOptions options_;
};

} // namespace omni::signal
