#include <cassert>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/signal/signal_engine.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

namespace {

using omni::db::model::AssetStatus;
using omni::db::model::ObservationRecord;
using omni::db::model::SignalKind;
using omni::db::model::SignalRecord;
using omni::signal::SignalEngine;

constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

const std::vector<double> kBtcPrices = {100, 102, 101, 105, 103, 107, 110};

struct Fixture {
  std::shared_ptr<omni::db::memory::MemoryRepository> repository = std::make_shared<omni::db::memory::MemoryRepository>();
  std::shared_ptr<SignalEngine>                       engine;

  explicit Fixture(omni::config::SignalOptions options = {}) {
    engine = std::make_shared<SignalEngine>(repository, options);
  }
};

ObservationRecord Observation(uint64_t day, double price) {
  ObservationRecord obs;
  obs.timestamp_ms   = day * kDayMs;
  obs.price_usd      = price;
  obs.market_cap_usd = price * 19'000'000;
  obs.volume_24h_usd = price * 1'000;
  return obs;
}

bool SameSignal(const SignalRecord& a, const SignalRecord& b) {
  return a.timestamp_ms == b.timestamp_ms && a.daily_return == b.daily_return && a.ma_7d == b.ma_7d && a.std_7d == b.std_7d && a.rsi == b.rsi &&
         a.signal == b.signal;
}

bool SameSeries(const std::vector<SignalRecord>& a, const std::vector<SignalRecord>& b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (!SameSignal(a[i], b[i])) return false;
  }
  return true;
}

// Ingests kBtcPrices in timestamp order on a fresh engine.
std::vector<SignalRecord> ReferenceSeries(const omni::config::SignalOptions& options = {}) {
  Fixture    f(options);
  uint64_t   id = 0;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    id = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i])).asset_id;
  }
  return f.engine->SignalHistory(id, 0, UINT64_MAX);
}

template <typename Exception, typename Fn>
void ExpectThrow(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Exception&) {
    threw = true;
  }
  assert(threw);
}

void TestSevenDayWindowSignal() {
  Fixture f;

  omni::signal::ObservationIngest last;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    last = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i]), "Bitcoin", "bitcoin");
    assert(last.stored);
    assert(last.signals_written == 1);
  }

  assert(last.signal.has_value());
  assert(last.signal->timestamp_ms == 7 * kDayMs);
  assert(std::fabs(last.signal->ma_7d - 104.0) < 1e-9);
  assert(std::fabs(*last.signal->daily_return - 3.0 / 107.0) < 1e-12);
  assert(last.signal->rsi.has_value());
  assert(std::fabs(*last.signal->rsi - 81.25) < 1e-9);
  assert(last.signal->signal == SignalKind::kSell);

  const auto history = f.engine->SignalHistory(last.asset_id, 0, UINT64_MAX);
  assert(history.size() == kBtcPrices.size());
  assert(!history.front().daily_return.has_value());
  assert(!history.front().rsi.has_value());
  for (const auto& row : history) {
    if (row.rsi) assert(*row.rsi >= 0.0 && *row.rsi <= 100.0);
  }

  const auto latest = f.engine->LatestSignal(last.asset_id);
  assert(latest.has_value());
  assert(SameSignal(*latest, *last.signal));

  // bounded history query
  const auto middle = f.engine->SignalHistory(last.asset_id, 3 * kDayMs, 5 * kDayMs);
  assert(middle.size() == 3);
  assert(middle.front().timestamp_ms == 3 * kDayMs);
}

void TestLateArrivalRewritesForwardOnly() {
  Fixture  f;
  uint64_t id = 0;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    if (i == 3) continue;
    id = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i])).asset_id;
  }

  const auto before = f.engine->SignalHistory(id, 0, UINT64_MAX);
  assert(before.size() == kBtcPrices.size() - 1);

  const auto late = f.engine->Ingest(id, Observation(4, kBtcPrices[3]));
  assert(late.stored);
  // t4 itself plus t5, t6, t7
  assert(late.signals_written == 4);

  const auto after = f.engine->SignalHistory(id, 0, UINT64_MAX);
  assert(after.size() == kBtcPrices.size());
  for (std::size_t i = 0; i < 3; ++i) {
    assert(SameSignal(before[i], after[i]));
  }

  // the result is the same as if the feed had been in order
  assert(SameSeries(after, ReferenceSeries()));
}

void TestDuplicateObservationIsIgnored() {
  Fixture    f;
  const auto first = f.engine->IngestBySymbol("ETH", Observation(1, 2000.0));
  assert(first.stored);

  const auto again = f.engine->IngestBySymbol("ETH", Observation(1, 9999.0));
  assert(!again.stored);
  assert(again.signals_written == 0);
  assert(again.asset_id == first.asset_id);

  const auto latest = f.engine->LatestSignal(first.asset_id);
  assert(latest.has_value());
  assert(latest->ma_7d == 2000.0);
}

void TestInvalidObservations() {
  Fixture f;
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("BTC", Observation(1, 0.0)); });
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("BTC", Observation(1, -5.0)); });
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("BTC", Observation(1, std::nan(""))); });
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("BTC", Observation(0, 10.0)); });
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("", Observation(1, 10.0)); });

  auto far_future         = Observation(1, 10.0);
  far_future.timestamp_ms = static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("BTC", far_future); });
  far_future.timestamp_ms = UINT64_MAX;
  ExpectThrow<omni::util::InvalidObservation>([&] { f.engine->IngestBySymbol("BTC", far_future); });

  // a rejected observation never creates the asset
  auto tx = f.repository->Begin();
  assert(!f.repository->GetAssetBySymbol(*tx, "BTC").has_value());
  tx->Commit();

  ExpectThrow<omni::util::NotFound>([&] { f.engine->Ingest(12345, Observation(1, 10.0)); });
}

void TestCorrectionRewritesFromTimestamp() {
  Fixture  f;
  uint64_t id = 0;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    id = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i])).asset_id;
  }
  const auto before = f.engine->SignalHistory(id, 0, UINT64_MAX);

  const auto corrected = f.engine->CorrectObservation(id, Observation(5, 90.0));
  assert(corrected.stored);
  assert(corrected.signals_written == 3);

  const auto after = f.engine->SignalHistory(id, 0, UINT64_MAX);
  for (std::size_t i = 0; i < 4; ++i) {
    assert(SameSignal(before[i], after[i]));
  }
  assert(after[4].ma_7d != before[4].ma_7d);
  assert(std::fabs(*after[4].daily_return - (90.0 - 105.0) / 105.0) < 1e-12);

  ExpectThrow<omni::util::NotFound>([&] { f.engine->CorrectObservation(id, Observation(30, 90.0)); });
}

void TestBackfillCancellationKeepsCheckpoint() {
  omni::config::SignalOptions options;
  options.backfill_batch_size = 2;
  Fixture  f(options);
  uint64_t id = 0;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    id = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i])).asset_id;
  }
  const auto expected = f.engine->SignalHistory(id, 0, UINT64_MAX);

  omni::util::CancellationToken cancelled;
  cancelled.Cancel();
  const auto interrupted = f.engine->RecomputeForward(id, 3 * kDayMs, cancelled);
  assert(!interrupted.completed);

  // signals are withheld while the checkpoint is pending
  assert(!f.engine->LatestSignal(id).has_value());
  ExpectThrow<omni::util::InconsistentBackfill>([&] { f.engine->SignalHistory(id, 0, UINT64_MAX); });

  {
    auto tx         = f.repository->Begin();
    auto checkpoint = f.repository->GetBackfillCheckpoint(*tx, id);
    assert(checkpoint.has_value());
    assert(checkpoint->from_timestamp_ms == 3 * kDayMs);
    assert(checkpoint->next_timestamp_ms == 3 * kDayMs);
    tx->Commit();
  }

  omni::util::CancellationToken token;
  assert(f.engine->ResumeBackfills(token) == 1);
  assert(f.engine->ResumeBackfills(token) == 0);

  const auto resumed = f.engine->SignalHistory(id, 0, UINT64_MAX);
  assert(SameSeries(resumed, expected));
  assert(f.engine->LatestSignal(id).has_value());
}

void TestRecomputeAllIsDeterministic() {
  omni::config::SignalOptions options;
  options.backfill_batch_size = 3;
  Fixture  f(options);
  uint64_t id = 0;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    id = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i])).asset_id;
  }
  const auto before = f.engine->SignalHistory(id, 0, UINT64_MAX);

  omni::util::CancellationToken token;
  const auto                    rebuilt = f.engine->RecomputeAll(id, token);
  assert(rebuilt.completed);
  assert(rebuilt.rows == kBtcPrices.size());
  assert(SameSeries(before, f.engine->SignalHistory(id, 0, UINT64_MAX)));

  ExpectThrow<omni::util::NotFound>([&] { f.engine->RecomputeAll(9999, token); });
}

void TestLateArrivalClearsCoveredCheckpoint() {
  omni::config::SignalOptions options;
  options.backfill_batch_size = 2;
  Fixture  f(options);
  uint64_t id = 0;
  for (std::size_t i = 0; i < kBtcPrices.size(); ++i) {
    if (i == 1) continue;
    id = f.engine->IngestBySymbol("BTC", Observation(i + 1, kBtcPrices[i])).asset_id;
  }

  omni::util::CancellationToken cancelled;
  cancelled.Cancel();
  (void)f.engine->RecomputeForward(id, 5 * kDayMs, cancelled);
  assert(!f.engine->LatestSignal(id).has_value());

  // the late write rewrites everything from t2, which covers the pending range
  (void)f.engine->Ingest(id, Observation(2, kBtcPrices[1]));
  assert(SameSeries(f.engine->SignalHistory(id, 0, UINT64_MAX), ReferenceSeries()));
}

void TestStaleAssetSweep() {
  omni::config::SignalOptions options;
  options.staleness_window_ms = 2 * kDayMs;
  Fixture f(options);

  const auto btc = f.engine->IngestBySymbol("BTC", Observation(10, 100.0)).asset_id;
  const auto eth = f.engine->IngestBySymbol("ETH", Observation(12, 100.0)).asset_id;

  assert(f.engine->SweepStaleAssets(12 * kDayMs + 1) == 1);
  assert(f.engine->SweepStaleAssets(12 * kDayMs + 1) == 0);

  auto tx = f.repository->Begin();
  assert(f.repository->GetAssetById(*tx, btc)->status == AssetStatus::kInactive);
  assert(f.repository->GetAssetById(*tx, eth)->status == AssetStatus::kActive);
  assert(f.repository->GetAssetById(*tx, btc)->first_seen_ms == 10 * kDayMs);
  tx->Commit();

  // a fresh observation brings it back
  (void)f.engine->Ingest(btc, Observation(13, 101.0));
  tx = f.repository->Begin();
  const auto revived = f.repository->GetAssetById(*tx, btc);
  assert(revived->status == AssetStatus::kActive);
  assert(revived->last_seen_ms == 13 * kDayMs);
  tx->Commit();
}

void TestSymbolCreation() {
  Fixture f;

  const auto created = f.engine->IngestBySymbol("SOL", Observation(1, 20.0));
  auto       tx      = f.repository->Begin();
  const auto asset   = f.repository->GetAssetById(*tx, created.asset_id);
  assert(asset.has_value());
  assert(asset->name == "SOL");
  assert(asset->slug == "sol");
  assert(asset->first_seen_ms == kDayMs);
  tx->Commit();

  // the slug is taken by SOL
  ExpectThrow<omni::util::AlreadyExists>([&] { f.engine->IngestBySymbol("SOL2", Observation(1, 20.0), "Other", "sol"); });
}

} // namespace

int main() {
  TestSevenDayWindowSignal();
  TestLateArrivalRewritesForwardOnly();
  TestDuplicateObservationIsIgnored();
  TestInvalidObservations();
  TestCorrectionRewritesFromTimestamp();
  TestBackfillCancellationKeepsCheckpoint();
  TestRecomputeAllIsDeterministic();
  TestLateArrivalClearsCoveredCheckpoint();
  TestStaleAssetSweep();
  TestSymbolCreation();

  std::cout << "omni_unit_signal_engine: pass\n";
  return 0;
}
