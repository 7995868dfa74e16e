#include <cassert>
#include <cmath>
#include <iostream>
#include <vector>

#include "internal/signal/indicators.hpp"
#include "internal/util/errors.hpp"

namespace {

using omni::signal::ComputeIndicators;
using omni::signal::RequiredHistory;

bool Near(double a, double b, double eps = 1e-9) {
  return std::fabs(a - b) < eps;
}

void TestSevenDayWindow() {
  const std::vector<double> prices = {100, 102, 101, 105, 103, 107, 110};
  const auto                values = ComputeIndicators(prices, 7, 14);

  assert(Near(values.ma, 104.0));
  assert(values.daily_return.has_value());
  assert(Near(*values.daily_return, 3.0 / 107.0));

  // sample standard deviation, n - 1 in the denominator
  assert(values.stddev.has_value());
  assert(Near(*values.stddev, std::sqrt(76.0 / 6.0)));

  // six deltas: gains 2+4+4+3, losses 1+2
  assert(values.rsi.has_value());
  assert(Near(*values.rsi, 100.0 - 100.0 / (1.0 + 13.0 / 3.0)));
}

void TestShortHistoryUsesWhatExists() {
  const auto first = ComputeIndicators({50.0}, 7, 14);
  assert(Near(first.ma, 50.0));
  assert(!first.daily_return.has_value());
  assert(!first.stddev.has_value());
  assert(!first.rsi.has_value());

  const auto second = ComputeIndicators({50.0, 55.0}, 7, 14);
  assert(Near(second.ma, 52.5));
  assert(Near(*second.daily_return, 0.1));
  assert(second.stddev.has_value());
  assert(Near(*second.rsi, 100.0));
}

void TestOnlyTrailingWindowCounts() {
  const auto values = ComputeIndicators({1000, 1000, 1, 2, 3}, 3, 2);
  assert(Near(values.ma, 2.0));
  assert(Near(*values.stddev, 1.0));
  assert(Near(*values.rsi, 100.0));
}

void TestRsiSaturatesWithoutLosses() {
  const auto rising = ComputeIndicators({1, 2, 3, 4, 5}, 7, 14);
  assert(Near(*rising.rsi, 100.0));

  const auto falling = ComputeIndicators({5, 4, 3, 2, 1}, 7, 14);
  assert(Near(*falling.rsi, 0.0));

  const auto flat = ComputeIndicators({7, 7, 7}, 7, 14);
  assert(Near(*flat.rsi, 100.0));
  assert(Near(*flat.stddev, 0.0));
}

void TestRsiStaysInRange() {
  std::vector<double> prices;
  double              price = 100.0;
  for (int i = 0; i < 200; ++i) {
    price *= (i % 3 == 0) ? 0.97 : ((i % 5 == 0) ? 1.08 : 1.01);
    prices.push_back(price);
    const auto values = ComputeIndicators(prices, 7, 14);
    if (values.rsi) {
      assert(*values.rsi >= 0.0 && *values.rsi <= 100.0);
    }
  }
}

void TestDeterministic() {
  const std::vector<double> prices = {3.2, 3.1, 3.5, 3.4, 3.9, 4.2, 4.0, 3.8, 4.4};
  const auto                a      = ComputeIndicators(prices, 7, 14);
  const auto                b      = ComputeIndicators(prices, 7, 14);
  assert(a.ma == b.ma);
  assert(*a.stddev == *b.stddev);
  assert(*a.rsi == *b.rsi);
}

void TestRejectsBadInput() {
  bool threw = false;
  try {
    (void)ComputeIndicators({}, 7, 14);
  } catch (const omni::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)ComputeIndicators({1.0}, 0, 14);
  } catch (const omni::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestRequiredHistory() {
  assert(RequiredHistory(7, 14) == 15);
  assert(RequiredHistory(30, 14) == 30);
  assert(RequiredHistory(1, 0) == 2);
}

} // namespace

int main() {
  TestSevenDayWindow();
  TestShortHistoryUsesWhatExists();
  TestOnlyTrailingWindowCounts();
  TestRsiSaturatesWithoutLosses();
  TestRsiStaysInRange();
  TestDeterministic();
  TestRejectsBadInput();
  TestRequiredHistory();

  std::cout << "omni_unit_indicators: pass\n";
  return 0;
}
