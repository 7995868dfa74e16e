#include "signal_engine.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/api/tx_helpers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace omni::signal {

using db::model::AssetRecord;
using db::model::AssetStatus;
using db::model::BackfillCheckpointRecord;
using db::model::ObservationRecord;
using db::model::SignalRecord;

namespace {

std::string LowerCase(const std::string& text) {
  std::string out = text;
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

} // namespace

SignalEngine::SignalEngine(std::shared_ptr<db::Repository> repository, config::SignalOptions options)
    : repository_(std::move(repository)), options_(std::move(options)), classifier_(options_) {
  if (!repository_) {
    throw std::invalid_argument("SignalEngine requires a repository");
  }
  if (options_.backfill_batch_size == 0) {
    options_.backfill_batch_size = 1;
  }
}

std::shared_ptr<std::shared_mutex> SignalEngine::AssetMutex(uint64_t asset_id) {
  std::lock_guard<std::mutex> lock(asset_mutexes_guard_);
  auto&                       asset_mutex = asset_mutexes_[asset_id];
  if (!asset_mutex) {
    asset_mutex = std::make_shared<std::shared_mutex>();
  }
  return asset_mutex;
}

void SignalEngine::Validate(const ObservationRecord& observation) {
  if (observation.timestamp_ms == 0) {
    throw util::InvalidObservation("observation timestamp is missing");
  }
  // SQL backends store timestamps as signed 64-bit integers
  if (observation.timestamp_ms > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw util::InvalidObservation("observation timestamp is out of range: " + std::to_string(observation.timestamp_ms));
  }
  if (!std::isfinite(observation.price_usd) || observation.price_usd <= 0.0) {
    throw util::InvalidObservation("observation price must be positive and finite");
  }
}

std::vector<SignalRecord> SignalEngine::DeriveBatch(db::Transaction& tx, uint64_t asset_id, uint64_t from_ms, std::size_t limit) {
  const std::size_t history = RequiredHistory(options_.window_size, options_.rsi_period);

  std::vector<double> prices;
  prices.reserve(history + limit);
  for (const auto& prior : repository_->ListObservationsBefore(tx, asset_id, from_ms, history - 1)) {
    prices.push_back(prior.price_usd);
  }

  std::vector<SignalRecord> written;
  for (const auto& observation : repository_->ListObservationsFrom(tx, asset_id, from_ms, limit)) {
    prices.push_back(observation.price_usd);
    if (prices.size() > history) {
      prices.erase(prices.begin(), prices.end() - static_cast<std::ptrdiff_t>(history));
    }

    const auto values = ComputeIndicators(prices, options_.window_size, options_.rsi_period);

    SignalRecord record;
    record.asset_id     = asset_id;
    record.timestamp_ms = observation.timestamp_ms;
    record.daily_return = values.daily_return;
    record.ma_7d        = values.ma;
    record.std_7d       = values.stddev;
    record.rsi          = values.rsi;
    record.signal       = classifier_.Classify(observation.price_usd, values);

    db::ThrowIfDbError(repository_->UpsertSignal(tx, record), "upsert signal");
    written.push_back(record);
  }
  return written;
}

std::size_t SignalEngine::DeriveForward(db::Transaction& tx, uint64_t asset_id, uint64_t from_ms) {
  std::size_t rows = 0;
  for (uint64_t cursor = from_ms;;) {
    const auto batch = DeriveBatch(tx, asset_id, cursor, options_.backfill_batch_size);
    rows += batch.size();
    if (batch.size() < options_.backfill_batch_size) {
      return rows;
    }
    cursor = batch.back().timestamp_ms + 1;
  }
}

ObservationIngest SignalEngine::WriteObservation(uint64_t asset_id, const ObservationRecord& input, bool correction) {
  Validate(input);

  ObservationRecord observation = input;
  observation.asset_id          = asset_id;

  observability::SpanScope span(correction ? "signal.correct_observation" : "signal.ingest_observation");
  span.SetAttribute("asset_id", static_cast<std::int64_t>(asset_id));
  span.SetAttribute("timestamp_ms", static_cast<std::int64_t>(observation.timestamp_ms));

  auto              asset_mutex = AssetMutex(asset_id);
  std::unique_lock  lock(*asset_mutex);
  const auto        started = std::chrono::steady_clock::now();
  bool              late    = false;

  auto result = db::RunWithConflictRetry(options_.conflict_retry_limit, correction ? "correct_observation" : "ingest_observation", [&] {
    ObservationIngest out;
    out.asset_id = asset_id;
    late         = false;

    auto tx    = repository_->Begin();
    auto asset = repository_->GetAssetById(*tx, asset_id);
    if (!asset) {
      throw util::NotFound("asset not found: " + std::to_string(asset_id));
    }

    if (correction) {
      db::ThrowIfDbError(repository_->ReplaceObservation(*tx, observation), "replace observation");
    } else {
      const auto inserted = repository_->InsertObservation(*tx, observation);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        tx->Rollback();
        return out;
      }
      db::ThrowIfDbError(inserted, "insert observation");
    }
    out.stored = true;

    if (const auto newest = repository_->LatestSignal(*tx, asset_id)) {
      late = newest->timestamp_ms > observation.timestamp_ms;
    }

    out.signals_written = DeriveForward(*tx, asset_id, observation.timestamp_ms);
    out.signal          = repository_->GetSignal(*tx, asset_id, observation.timestamp_ms);

    if (!correction) {
      if (asset->first_seen_ms == 0 || observation.timestamp_ms < asset->first_seen_ms) {
        asset->first_seen_ms = observation.timestamp_ms;
      }
      asset->last_seen_ms = std::max(asset->last_seen_ms, observation.timestamp_ms);
      asset->status       = AssetStatus::kActive;
      db::ThrowIfDbError(repository_->UpdateAsset(*tx, *asset), "update asset bounds");
    }

    // The rewrite above covered every stale row of a pending backfill.
    const auto checkpoint = repository_->GetBackfillCheckpoint(*tx, asset_id);
    if (checkpoint && observation.timestamp_ms <= checkpoint->next_timestamp_ms) {
      db::ThrowIfDbError(repository_->DeleteBackfillCheckpoint(*tx, asset_id), "clear backfill checkpoint");
    }

    tx->Commit();
    return out;
  });

  if (!result.stored) {
    OMNI_LOG_DEBUG("Duplicate observation ignored", {observability::UintField("asset_id", asset_id),
                                                     observability::UintField("timestamp_ms", observation.timestamp_ms)});
    return result;
  }

  auto& metrics = observability::Metrics::Instance();
  if (result.signal) {
    metrics.RecordSignal(db::model::ToString(result.signal->signal));
  }
  if (late || correction) {
    const double elapsed = ElapsedMs(started);
    metrics.ObserveRecomputeDurationMs(correction ? "correction" : "late_arrival", elapsed, result.signals_written);
    OMNI_LOG_INFO("Recomputed signals forward",
                  {observability::UintField("asset_id", asset_id), observability::UintField("from_ms", observation.timestamp_ms),
                   observability::UintField("rows", result.signals_written), observability::BoolField("correction", correction),
                   observability::DoubleField("elapsed_ms", elapsed)});
  }
  return result;
}

ObservationIngest SignalEngine::IngestBySymbol(const std::string& symbol, ObservationRecord observation, const std::string& name,
                                               const std::string& slug) {
  if (symbol.empty()) {
    throw util::InvalidObservation("observation symbol is missing");
  }
  Validate(observation);

  const uint64_t asset_id = db::RunWithConflictRetry(options_.conflict_retry_limit, "resolve_asset", [&]() -> uint64_t {
    auto tx = repository_->Begin();
    if (auto existing = repository_->GetAssetBySymbol(*tx, symbol)) {
      tx->Commit();
      return existing->id;
    }

    AssetRecord asset;
    asset.symbol = symbol;
    asset.name   = name.empty() ? symbol : name;
    asset.slug   = slug.empty() ? LowerCase(symbol) : slug;
    asset.status = AssetStatus::kActive;

    const auto inserted = repository_->InsertAsset(*tx, asset);
    if (inserted.code == db::ErrorCode::AlreadyExists) {
      tx->Rollback();
      // Another writer created the symbol first, or the slug belongs to a different symbol.
      auto retry = repository_->Begin();
      auto found = repository_->GetAssetBySymbol(*retry, symbol);
      retry->Commit();
      if (found) {
        return found->id;
      }
      throw util::AlreadyExists("asset slug already taken: " + asset.slug);
    }
    db::ThrowIfDbError(inserted, "insert asset");
    tx->Commit();

    OMNI_LOG_INFO("Asset created from observation", {observability::StringField("symbol", symbol), observability::UintField("asset_id", asset.id)});
    return asset.id;
  });

  return Ingest(asset_id, std::move(observation));
}

ObservationIngest SignalEngine::Ingest(uint64_t asset_id, ObservationRecord observation) {
  return WriteObservation(asset_id, observation, false);
}

ObservationIngest SignalEngine::CorrectObservation(uint64_t asset_id, ObservationRecord observation) {
  return WriteObservation(asset_id, observation, true);
}

BackfillResult SignalEngine::RecomputeForward(uint64_t asset_id, uint64_t from_ms, const util::CancellationToken& token) {
  {
    auto             asset_mutex = AssetMutex(asset_id);
    std::unique_lock lock(*asset_mutex);

    db::RunWithConflictRetry(options_.conflict_retry_limit, "open_backfill", [&] {
      auto tx = repository_->Begin();
      if (!repository_->GetAssetById(*tx, asset_id)) {
        throw util::NotFound("asset not found: " + std::to_string(asset_id));
      }

      BackfillCheckpointRecord checkpoint;
      checkpoint.asset_id          = asset_id;
      checkpoint.from_timestamp_ms = from_ms;
      checkpoint.next_timestamp_ms = from_ms;
      if (const auto pending = repository_->GetBackfillCheckpoint(*tx, asset_id)) {
        checkpoint.from_timestamp_ms = std::min(pending->from_timestamp_ms, from_ms);
        checkpoint.next_timestamp_ms = std::min(pending->next_timestamp_ms, from_ms);
      }
      checkpoint.updated_at_ms = util::NowMillis();

      db::ThrowIfDbError(repository_->UpsertBackfillCheckpoint(*tx, checkpoint), "write backfill checkpoint");
      tx->Commit();
    });
  }

  return DrainCheckpoint(asset_id, token, "rebuild");
}

BackfillResult SignalEngine::RecomputeAll(uint64_t asset_id, const util::CancellationToken& token) {
  return RecomputeForward(asset_id, 0, token);
}

BackfillResult SignalEngine::DrainCheckpoint(uint64_t asset_id, const util::CancellationToken& token, const char* reason) {
  observability::SpanScope span("signal.backfill");
  span.SetAttribute("asset_id", static_cast<std::int64_t>(asset_id));
  span.SetAttribute("reason", std::string_view(reason));

  const auto     started = std::chrono::steady_clock::now();
  BackfillResult result;

  while (!result.completed) {
    if (token.IsCancelled()) {
      OMNI_LOG_INFO("Backfill cancelled, checkpoint kept",
                    {observability::UintField("asset_id", asset_id), observability::UintField("rows", result.rows)});
      span.AddEvent("cancelled");
      return result;
    }

    auto             asset_mutex = AssetMutex(asset_id);
    std::unique_lock lock(*asset_mutex);

    std::size_t batch_rows = 0;
    result.completed       = db::RunWithConflictRetry(options_.conflict_retry_limit, "backfill_batch", [&] {
      batch_rows = 0;
      auto tx    = repository_->Begin();

      auto checkpoint = repository_->GetBackfillCheckpoint(*tx, asset_id);
      if (!checkpoint) {
        tx->Rollback();
        return true;
      }

      const auto batch = DeriveBatch(*tx, asset_id, checkpoint->next_timestamp_ms, options_.backfill_batch_size);
      batch_rows       = batch.size();

      const bool done = batch.size() < options_.backfill_batch_size;
      if (done) {
        db::ThrowIfDbError(repository_->DeleteBackfillCheckpoint(*tx, asset_id), "clear backfill checkpoint");
      } else {
        checkpoint->next_timestamp_ms = batch.back().timestamp_ms + 1;
        checkpoint->updated_at_ms     = util::NowMillis();
        db::ThrowIfDbError(repository_->UpsertBackfillCheckpoint(*tx, *checkpoint), "advance backfill checkpoint");
      }
      tx->Commit();
      return done;
    });
    result.rows += batch_rows;
  }

  const double elapsed = ElapsedMs(started);
  observability::Metrics::Instance().ObserveRecomputeDurationMs(reason, elapsed, result.rows);
  OMNI_LOG_INFO("Backfill completed", {observability::UintField("asset_id", asset_id), observability::StringField("reason", reason),
                                       observability::UintField("rows", result.rows), observability::DoubleField("elapsed_ms", elapsed)});
  return result;
}

std::size_t SignalEngine::ResumeBackfills(const util::CancellationToken& token) {
  std::vector<BackfillCheckpointRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListBackfillCheckpoints(*tx);
    tx->Commit();
  }

  if (!pending.empty()) {
    OMNI_LOG_WARN("Resuming interrupted backfills", {observability::UintField("assets", pending.size())});
  }

  std::size_t completed = 0;
  for (const auto& checkpoint : pending) {
    if (token.IsCancelled()) break;
    if (DrainCheckpoint(checkpoint.asset_id, token, "resume").completed) {
      ++completed;
    }
  }
  return completed;
}

std::size_t SignalEngine::SweepStaleAssets(uint64_t now_ms) {
  std::vector<AssetRecord> assets;
  {
    auto tx = repository_->Begin();
    assets  = repository_->ListAssets(*tx);
    tx->Commit();
  }

  const auto is_stale = [&](const AssetRecord& asset) {
    // assets without observations have nothing to go stale
    return asset.status == AssetStatus::kActive && asset.last_seen_ms != 0 && now_ms > asset.last_seen_ms &&
           now_ms - asset.last_seen_ms > options_.staleness_window_ms;
  };

  std::size_t changed = 0;
  for (const auto& candidate : assets) {
    if (!is_stale(candidate)) continue;

    auto             asset_mutex = AssetMutex(candidate.id);
    std::unique_lock lock(*asset_mutex);

    const bool updated = db::RunWithConflictRetry(options_.conflict_retry_limit, "sweep_stale_asset", [&] {
      auto tx    = repository_->Begin();
      auto asset = repository_->GetAssetById(*tx, candidate.id);
      if (!asset || !is_stale(*asset)) {
        tx->Rollback();
        return false;
      }
      asset->status = AssetStatus::kInactive;
      db::ThrowIfDbError(repository_->UpdateAsset(*tx, *asset), "mark asset inactive");
      tx->Commit();
      return true;
    });

    if (updated) {
      ++changed;
      OMNI_LOG_INFO("Asset marked inactive", {observability::StringField("symbol", candidate.symbol),
                                              observability::UintField("last_seen_ms", candidate.last_seen_ms)});
    }
  }
  return changed;
}

std::optional<SignalRecord> SignalEngine::LatestSignal(uint64_t asset_id) {
  auto              asset_mutex = AssetMutex(asset_id);
  std::shared_lock  lock(*asset_mutex);

  auto tx = repository_->Begin();
  if (repository_->GetBackfillCheckpoint(*tx, asset_id)) {
    tx->Commit();
    return std::nullopt;
  }
  auto latest = repository_->LatestSignal(*tx, asset_id);
  tx->Commit();
  return latest;
}

std::vector<SignalRecord> SignalEngine::SignalHistory(uint64_t asset_id, uint64_t from_ms, uint64_t to_ms) {
  auto             asset_mutex = AssetMutex(asset_id);
  std::shared_lock lock(*asset_mutex);

  auto tx = repository_->Begin();
  if (const auto checkpoint = repository_->GetBackfillCheckpoint(*tx, asset_id)) {
    tx->Commit();
    throw util::InconsistentBackfill("signals for asset " + std::to_string(asset_id) + " are being recomputed from " +
                                     std::to_string(checkpoint->next_timestamp_ms));
  }
  auto rows = repository_->ListSignals(*tx, asset_id, from_ms, to_ms);
  tx->Commit();
  return rows;
}

} // namespace omni::signal
