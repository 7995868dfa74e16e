#pragma once

#include <cstdint>
#include <optional>

#include "internal/db/model/enums.hpp"

namespace omni::db::model {

/*
  Derived indicators for one observation.

  Column names keep the 7-day naming even when the configured window differs.
*/
struct SignalRecord {
  uint64_t asset_id     = 0;
  uint64_t timestamp_ms = 0;

  std::optional<double> daily_return;
  double                ma_7d = 0.0;
  std::optional<double> std_7d;
  std::optional<double> rsi;

  SignalKind signal = SignalKind::kHold;
};

} // namespace omni::db::model
