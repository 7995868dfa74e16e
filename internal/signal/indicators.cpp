#include "indicators.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/errors.hpp"

namespace omni::signal {

std::size_t RequiredHistory(std::size_t window, std::size_t rsi_period) {
  return std::max({window, rsi_period + 1, std::size_t{2}});
}

IndicatorValues ComputeIndicators(const std::vector<double>& prices, std::size_t window, std::size_t rsi_period) {
  if (prices.empty()) {
    throw util::InvalidArgument("indicators need at least one price");
  }
  if (window == 0) {
    throw util::InvalidArgument("indicator window must be positive");
  }

  IndicatorValues values;
  const std::size_t n    = prices.size();
  const double      last = prices[n - 1];

  if (n >= 2) {
    const double prev = prices[n - 2];
    values.daily_return = (last - prev) / prev;
  }

  const std::size_t count = std::min(window, n);
  const auto        begin = prices.end() - static_cast<std::ptrdiff_t>(count);

  double sum = 0.0;
  for (auto it = begin; it != prices.end(); ++it) sum += *it;
  values.ma = sum / static_cast<double>(count);

  if (count >= 2) {
    double squares = 0.0;
    for (auto it = begin; it != prices.end(); ++it) {
      const double d = *it - values.ma;
      squares += d * d;
    }
    values.stddev = std::sqrt(squares / static_cast<double>(count - 1));
  }

  const std::size_t deltas = std::min(rsi_period, n - 1);
  if (deltas > 0) {
    double gains  = 0.0;
    double losses = 0.0;
    for (std::size_t i = n - deltas; i < n; ++i) {
      const double change = prices[i] - prices[i - 1];
      if (change > 0) {
        gains += change;
      } else {
        losses -= change;
      }
    }
    const double avg_gain = gains / static_cast<double>(deltas);
    const double avg_loss = losses / static_cast<double>(deltas);
    if (avg_loss == 0.0) {
      values.rsi = 100.0;
    } else {
      const double rs = avg_gain / avg_loss;
      values.rsi      = 100.0 - 100.0 / (1.0 + rs);
    }
  }

  return values;
}

} // namespace omni::signal
