#pragma once

#include <cstdint>

namespace omni::db::model {

/*
  Progress marker for a batched recompute-forward.

  Present only while the recompute is unfinished. next_timestamp_ms is the
  first signal timestamp that still has to be rewritten.
*/
struct BackfillCheckpointRecord {
  uint64_t asset_id          = 0;
  uint64_t from_timestamp_ms = 0;
  uint64_t next_timestamp_ms = 0;
  uint64_t updated_at_ms     = 0;
};

} // namespace omni::db::model
