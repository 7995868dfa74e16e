#pragma once

#include <cstddef>
#include <optional>
#include <vector>

namespace omni::signal {

/*
  Rolling statistics for the last point of a price series.

  The series is ascending by timestamp and ends at the observation being
  evaluated. Only the trailing `window` prices feed ma / stddev and only the
  trailing `rsi_period` price changes feed rsi.
*/
struct IndicatorValues {
  std::optional<double> daily_return;
  double                ma = 0.0;
  std::optional<double> stddev;
  std::optional<double> rsi;
};

// Throws util::InvalidArgument on an empty series or a zero window.
IndicatorValues ComputeIndicators(const std::vector<double>& prices, std::size_t window, std::size_t rsi_period);

// Number of trailing prices ComputeIndicators reads for these settings.
std::size_t RequiredHistory(std::size_t window, std::size_t rsi_period);

} // namespace omni::signal
