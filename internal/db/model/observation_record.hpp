#pragma once

#include <cstdint>
#include <optional>

namespace omni::db::model {

// One market snapshot; unique per (asset_id, timestamp_ms).
struct ObservationRecord {
  uint64_t asset_id     = 0;
  uint64_t timestamp_ms = 0;

  double price_usd      = 0.0;
  double market_cap_usd = 0.0;
  double volume_24h_usd = 0.0;

  std::optional<double> percent_change_1h;
  std::optional<double> percent_change_24h;
  std::optional<double> percent_change_7d;

  std::optional<double> circulating_supply;
  std::optional<double> total_supply;
  std::optional<double> max_supply;
};

} // namespace omni::db::model
