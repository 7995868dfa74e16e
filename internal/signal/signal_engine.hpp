#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/config/runtime_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/cancellation.hpp"
#include "signal_classifier.hpp"

namespace omni::signal {

struct ObservationIngest {
  uint64_t asset_id = 0;
  // false when (asset, timestamp) was already stored and nothing was written
  bool stored = false;
  // signal rows rewritten, the new one included
  std::size_t signals_written = 0;
  std::optional<db::model::SignalRecord> signal;
};

struct BackfillResult {
  bool        completed = false;
  std::size_t rows      = 0;
};

/*
  Derives one signal row per stored observation.

  Writers on one asset are serialized by a per-asset mutex; different assets
  proceed in parallel. An observation and every signal it invalidates are
  written in one transaction, so readers see either the old or the new
  series. A late observation (older than the newest signal) rewrites every
  signal from its timestamp forward.

  Large rewrites go through RecomputeForward, which commits in batches and
  keeps a BackfillCheckpoint until the last batch lands. While a checkpoint
  exists the asset's signals are not served.
*/
class SignalEngine {
 public:
  SignalEngine(std::shared_ptr<db::Repository> repository, config::SignalOptions options);

  // Creates the asset on first sight: empty name defaults to the symbol,
  // empty slug to the lowercased symbol.
  ObservationIngest IngestBySymbol(const std::string& symbol, db::model::ObservationRecord observation, const std::string& name = {},
                                   const std::string& slug = {});

  // Throws util::InvalidObservation for a non-positive or non-finite price
  // or a zero timestamp, util::NotFound for an unknown asset.
  ObservationIngest Ingest(uint64_t asset_id, db::model::ObservationRecord observation);

  // Overwrites the stored observation at the same timestamp and rewrites
  // the signals from there on. util::NotFound if no such observation.
  ObservationIngest CorrectObservation(uint64_t asset_id, db::model::ObservationRecord observation);

  BackfillResult RecomputeForward(uint64_t asset_id, uint64_t from_ms, const util::CancellationToken& token);
  BackfillResult RecomputeAll(uint64_t asset_id, const util::CancellationToken& token);

  // Drives every pending checkpoint to completion. Returns the number of
  // assets completed.
  std::size_t ResumeBackfills(const util::CancellationToken& token);

  // Marks active assets whose last observation is older than the staleness
  // window as inactive. Returns the number of assets changed.
  std::size_t SweepStaleAssets(uint64_t now_ms);

  // Absent while the asset has a pending backfill.
  std::optional<db::model::SignalRecord> LatestSignal(uint64_t asset_id);

  // util::InconsistentBackfill while the asset has a pending backfill.
  std::vector<db::model::SignalRecord> SignalHistory(uint64_t asset_id, uint64_t from_ms, uint64_t to_ms);

  const config::SignalOptions& Options() const {
    return options_;
  }

 private:
  std::shared_ptr<std::shared_mutex> AssetMutex(uint64_t asset_id);

  static void Validate(const db::model::ObservationRecord& observation);

  // Rewrites signals for at most `limit` observations at or after from_ms
  // and returns the rows written, ascending by timestamp.
  std::vector<db::model::SignalRecord> DeriveBatch(db::Transaction& tx, uint64_t asset_id, uint64_t from_ms, std::size_t limit);

  // Rewrites every signal at or after from_ms in the caller's transaction.
  std::size_t DeriveForward(db::Transaction& tx, uint64_t asset_id, uint64_t from_ms);

  ObservationIngest WriteObservation(uint64_t asset_id, const db::model::ObservationRecord& observation, bool correction);
  BackfillResult    DrainCheckpoint(uint64_t asset_id, const util::CancellationToken& token, const char* reason);

  std::shared_ptr<db::Repository> repository_;
  config::SignalOptions           options_;
  SignalClassifier                classifier_;

  std::mutex                                                       asset_mutexes_guard_;
  std::unordered_map<uint64_t, std::shared_ptr<std::shared_mutex>> asset_mutexes_;
};

} // namespace omni::signal
