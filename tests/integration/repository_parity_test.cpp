#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "internal/util/uuid.hpp"

namespace {

using omni::db::ErrorCode;
using omni::db::Repository;
using omni::db::model::ArticleRecord;
using omni::db::model::AssetRecord;
using omni::db::model::AssetStatus;
using omni::db::model::AssetType;
using omni::db::model::BackfillCheckpointRecord;
using omni::db::model::EmbeddingRecord;
using omni::db::model::MentionRecord;
using omni::db::model::ObservationRecord;
using omni::db::model::SignalKind;
using omni::db::model::SignalRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Postgres runs against a shared database, so every key carries a run suffix.
struct Keys {
  std::string suffix;

  std::string Symbol(const std::string& base) const {
    return base + suffix;
  }
  std::string Url(const std::string& path) const {
    return "https://example.com/" + path + "-" + suffix;
  }
};

AssetRecord InsertAsset(Repository& repo, const Keys& keys, const std::string& base) {
  auto        tx = repo.Begin();
  AssetRecord asset;
  asset.symbol = keys.Symbol(base);
  asset.name   = base + " coin";
  asset.slug   = keys.Symbol(base) + "-slug";
  assert(repo.InsertAsset(*tx, asset));
  assert(asset.id != 0);
  tx->Commit();
  return asset;
}

ObservationRecord Observation(uint64_t asset_id, uint64_t ts, double price) {
  ObservationRecord obs;
  obs.asset_id       = asset_id;
  obs.timestamp_ms   = ts;
  obs.price_usd      = price;
  obs.market_cap_usd = price * 1000;
  obs.volume_24h_usd = price * 10;
  return obs;
}

void VerifyAssetUniqueness(Repository& repo, const Keys& keys) {
  const auto asset = InsertAsset(repo, keys, "UNQ");

  auto tx = repo.Begin();
  auto by_symbol = repo.GetAssetBySymbol(*tx, asset.symbol);
  assert(by_symbol.has_value());
  assert(by_symbol->id == asset.id);
  assert(by_symbol->status == AssetStatus::kActive);

  AssetRecord same_symbol = asset;
  same_symbol.id          = 0;
  same_symbol.slug        = asset.slug + "-other";
  assert(repo.InsertAsset(*tx, same_symbol).code == ErrorCode::AlreadyExists);
  tx->Rollback();

  tx = repo.Begin();
  AssetRecord same_slug;
  same_slug.symbol = keys.Symbol("UNQ2");
  same_slug.name   = "other";
  same_slug.slug   = asset.slug;
  assert(repo.InsertAsset(*tx, same_slug).code == ErrorCode::AlreadyExists);
  tx->Rollback();

  tx                  = repo.Begin();
  auto updated        = *repo.GetAssetById(*tx, asset.id);
  updated.status      = AssetStatus::kInactive;
  updated.last_seen_ms = 42;
  assert(repo.UpdateAsset(*tx, updated));
  tx->Commit();

  tx         = repo.Begin();
  auto again = repo.GetAssetById(*tx, asset.id);
  assert(again.has_value());
  assert(again->status == AssetStatus::kInactive);
  assert(again->last_seen_ms == 42);
  tx->Commit();
}

void VerifyObservationsAndSignals(Repository& repo, const Keys& keys) {
  const auto asset = InsertAsset(repo, keys, "OBS");

  {
    auto tx = repo.Begin();
    for (uint64_t ts = 1; ts <= 6; ++ts) {
      assert(repo.InsertObservation(*tx, Observation(asset.id, ts * 1000, 100.0 + ts)));
    }
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    // the stored row is kept on a duplicate timestamp
    assert(repo.InsertObservation(*tx, Observation(asset.id, 3000, 999.0)).code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.GetObservation(*tx, asset.id, 3000)->price_usd == 103.0);
    assert(repo.ReplaceObservation(*tx, Observation(asset.id, 7000, 1.0)).code == ErrorCode::NotFound);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.ReplaceObservation(*tx, Observation(asset.id, 3000, 50.0)));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.GetObservation(*tx, asset.id, 3000)->price_usd == 50.0);

    const auto before = repo.ListObservationsBefore(*tx, asset.id, 5000, 2);
    assert(before.size() == 2);
    assert(before[0].timestamp_ms == 3000);
    assert(before[1].timestamp_ms == 4000);

    const auto from = repo.ListObservationsFrom(*tx, asset.id, 4000, 10);
    assert(from.size() == 3);
    assert(from.front().timestamp_ms == 4000);
    assert(from.back().timestamp_ms == 6000);

    const auto range = repo.ListObservations(*tx, asset.id, 2000, 4000);
    assert(range.size() == 3);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    for (uint64_t ts = 1; ts <= 3; ++ts) {
      SignalRecord signal;
      signal.asset_id     = asset.id;
      signal.timestamp_ms = ts * 1000;
      signal.ma_7d        = 100.0 + ts;
      signal.rsi          = ts == 1 ? std::nullopt : std::optional<double>(55.0);
      signal.signal       = SignalKind::kHold;
      assert(repo.UpsertSignal(*tx, signal));
    }
    SignalRecord overwrite;
    overwrite.asset_id     = asset.id;
    overwrite.timestamp_ms = 3000;
    overwrite.ma_7d        = 1.5;
    overwrite.signal       = SignalKind::kSell;
    assert(repo.UpsertSignal(*tx, overwrite));
    tx->Commit();
  }

  {
    auto tx     = repo.Begin();
    auto latest = repo.LatestSignal(*tx, asset.id);
    assert(latest.has_value());
    assert(latest->timestamp_ms == 3000);
    assert(latest->signal == SignalKind::kSell);
    assert(!latest->rsi.has_value());

    auto first = repo.GetSignal(*tx, asset.id, 1000);
    assert(first.has_value());
    assert(!first->rsi.has_value());
    assert(!first->daily_return.has_value());

    const auto listed = repo.ListSignals(*tx, asset.id, 0, UINT64_MAX);
    assert(listed.size() == 3);
    assert(listed[0].timestamp_ms == 1000);
    assert(listed[2].timestamp_ms == 3000);
    tx->Commit();
  }

  {
    auto                     tx = repo.Begin();
    BackfillCheckpointRecord checkpoint{asset.id, 1000, 2000, NowMs()};
    assert(repo.UpsertBackfillCheckpoint(*tx, checkpoint));
    checkpoint.next_timestamp_ms = 3000;
    assert(repo.UpsertBackfillCheckpoint(*tx, checkpoint));
    tx->Commit();
  }

  {
    auto tx         = repo.Begin();
    auto checkpoint = repo.GetBackfillCheckpoint(*tx, asset.id);
    assert(checkpoint.has_value());
    assert(checkpoint->next_timestamp_ms == 3000);
    bool listed = false;
    for (const auto& pending : repo.ListBackfillCheckpoints(*tx)) {
      listed = listed || pending.asset_id == asset.id;
    }
    assert(listed);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteAsset(*tx, asset.id));
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    assert(!repo.GetAssetById(*tx, asset.id).has_value());
    assert(repo.ListObservations(*tx, asset.id, 0, UINT64_MAX).empty());
    assert(repo.ListSignals(*tx, asset.id, 0, UINT64_MAX).empty());
    assert(!repo.GetBackfillCheckpoint(*tx, asset.id).has_value());
    tx->Commit();
  }
}

void VerifyArticlesMentionsEmbeddings(Repository& repo, const Keys& keys) {
  auto tx = repo.Begin();

  const auto source = repo.GetSourceByName(*tx, "Reuters");
  assert(source.has_value());
  assert(repo.GetSourceById(*tx, source->id)->name == "Reuters");
  assert(repo.ListSources(*tx).size() >= 2);

  const auto markets = repo.GetCategoryByName(*tx, "Markets");
  assert(markets.has_value());
  assert(!repo.GetCategoryByName(*tx, "Gossip").has_value());

  ArticleRecord older;
  older.source_id    = source->id;
  older.title        = "Older";
  older.url          = keys.Url("older");
  older.published_ms = 1000;
  older.fetched_ms   = NowMs();
  older.content      = "older body";
  assert(repo.InsertArticle(*tx, older));

  ArticleRecord newer = older;
  newer.id            = 0;
  newer.title         = "Newer";
  newer.url           = keys.Url("newer");
  newer.published_ms  = 2000;
  newer.sentiment_score = 0.25;
  newer.sentiment_label = "positive";
  assert(repo.InsertArticle(*tx, newer));

  ArticleRecord dup = older;
  dup.id            = 0;
  dup.title         = "Changed title";
  assert(repo.InsertArticle(*tx, dup).code == ErrorCode::AlreadyExists);
  tx->Rollback();

  // The failed insert above aborts a postgres transaction; redo the batch cleanly.
  tx = repo.Begin();
  older.id = 0;
  newer.id = 0;
  assert(repo.InsertArticle(*tx, older));
  assert(repo.InsertArticle(*tx, newer));

  assert(repo.AddArticleCategory(*tx, older.id, markets->id));
  assert(repo.AddArticleCategory(*tx, older.id, markets->id));
  assert(repo.GetArticleCategories(*tx, older.id).size() == 1);

  MentionRecord mention{older.id, AssetType::kCrypto, keys.Symbol("BTC"), 2, false};
  assert(repo.UpsertMention(*tx, mention));
  mention.mention_count = 3;
  mention.is_primary    = true;
  assert(repo.UpsertMention(*tx, mention));
  assert(repo.UpsertMention(*tx, MentionRecord{older.id, AssetType::kStock, keys.Symbol("BTC"), 1, false}));

  const auto stored_mention = repo.GetMention(*tx, older.id, AssetType::kCrypto, keys.Symbol("BTC"));
  assert(stored_mention.has_value());
  assert(stored_mention->mention_count == 5);
  assert(stored_mention->is_primary);
  assert(repo.ListMentionsForArticle(*tx, older.id).size() == 2);
  assert(repo.ListMentionsForAsset(*tx, AssetType::kCrypto, keys.Symbol("BTC")).size() == 1);

  EmbeddingRecord chunk;
  chunk.id              = omni::util::GenerateUUIDString();
  chunk.article_id      = older.id;
  chunk.chunk_index     = 0;
  chunk.chunk_text      = "first";
  chunk.vector          = {0.5f, -0.25f, 1.0f};
  chunk.embedding_model = "parity-model";
  chunk.created_at_ms   = 111;
  assert(repo.UpsertEmbedding(*tx, chunk));

  EmbeddingRecord second = chunk;
  second.id              = omni::util::GenerateUUIDString();
  second.chunk_index     = 1;
  second.chunk_text      = "second";
  assert(repo.UpsertEmbedding(*tx, second));

  EmbeddingRecord reindexed = chunk;
  reindexed.id              = omni::util::GenerateUUIDString();
  reindexed.chunk_text      = "first, revised";
  reindexed.vector          = {1.0f, 0.0f, 0.0f};
  reindexed.created_at_ms   = 999;
  assert(repo.UpsertEmbedding(*tx, reindexed));
  tx->Commit();

  tx = repo.Begin();
  const auto kept = repo.GetEmbedding(*tx, older.id, 0, "parity-model");
  assert(kept.has_value());
  assert(kept->id == chunk.id);
  assert(kept->created_at_ms == 111);
  assert(kept->chunk_text == "first, revised");
  assert(kept->vector == reindexed.vector);

  const auto chunks = repo.ListEmbeddingsForArticle(*tx, older.id, "parity-model");
  assert(chunks.size() == 2);
  assert(chunks[0].chunk_index == 0);
  assert(chunks[1].chunk_index == 1);
  assert(repo.ListEmbeddingsForArticle(*tx, older.id, "other-model").empty());

  const auto recent = repo.ListRecentArticles(*tx, 1000);
  std::size_t newer_pos = recent.size();
  std::size_t older_pos = recent.size();
  for (std::size_t i = 0; i < recent.size(); ++i) {
    if (recent[i].id == newer.id) newer_pos = i;
    if (recent[i].id == older.id) older_pos = i;
  }
  assert(newer_pos < older_pos && older_pos < recent.size());

  auto by_url = repo.GetArticleByUrl(*tx, newer.url);
  assert(by_url.has_value());
  assert(by_url->sentiment_score.has_value() && *by_url->sentiment_score == 0.25);
  assert(!by_url->is_processed);

  by_url->is_processed = true;
  assert(repo.UpdateArticle(*tx, *by_url));
  tx->Commit();

  tx = repo.Begin();
  for (const auto& pending : repo.ListUnprocessedArticles(*tx, 1000)) {
    assert(pending.id != newer.id);
  }

  assert(repo.DeleteEmbeddings(*tx, older.id, "parity-model"));
  assert(repo.ListEmbeddingsForArticle(*tx, older.id, "parity-model").empty());
  assert(repo.UpsertEmbedding(*tx, chunk));
  assert(repo.DeleteArticle(*tx, older.id));
  tx->Commit();

  tx = repo.Begin();
  assert(!repo.GetArticleById(*tx, older.id).has_value());
  assert(repo.ListMentionsForArticle(*tx, older.id).empty());
  assert(repo.GetArticleCategories(*tx, older.id).empty());
  assert(!repo.GetEmbedding(*tx, older.id, 0, "parity-model").has_value());
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const Keys& keys) {
  const std::string symbol = keys.Symbol("RBK");
  {
    auto        tx = repo.Begin();
    AssetRecord asset;
    asset.symbol = symbol;
    asset.name   = "rollback";
    asset.slug   = symbol + "-slug";
    assert(repo.InsertAsset(*tx, asset));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetAssetBySymbol(*check_tx, symbol).has_value());
  check_tx->Commit();
}

void VerifyConcurrentWriters(Repository& repo, const Keys& keys, bool supports_parallel_transactions) {
  if (!supports_parallel_transactions) {
    return;
  }
  const auto asset = InsertAsset(repo, keys, "CNC");

  auto tx1 = repo.Begin();
  auto tx2 = repo.Begin();

  auto r1 = repo.GetAssetById(*tx1, asset.id);
  auto r2 = repo.GetAssetById(*tx2, asset.id);
  assert(r1.has_value() && r2.has_value());

  r1->last_seen_ms = 10;
  r2->last_seen_ms = 20;

  assert(repo.UpdateAsset(*tx1, *r1));
  tx1->Commit();

  // Memory rejects the stale snapshot; postgres serializes the row update.
  assert(repo.UpdateAsset(*tx2, *r2));
  bool conflicted = false;
  try {
    tx2->Commit();
  } catch (const omni::db::TransactionConflict&) {
    conflicted = true;
  }

  auto verify_tx = repo.Begin();
  auto final     = repo.GetAssetById(*verify_tx, asset.id);
  assert(final.has_value());
  assert(final->last_seen_ms == (conflicted ? 10u : 20u));
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const Keys& keys) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo  = backend.make_repository();
  const auto asset = InsertAsset(*repo, keys, "DUR");
  {
    auto tx = repo->Begin();
    assert(repo->InsertObservation(*tx, Observation(asset.id, 5000, 321.0)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto a  = repo->GetAssetBySymbol(*tx, asset.symbol);
  assert(a.has_value());
  assert(a->id == asset.id);
  auto o = repo->GetObservation(*tx, asset.id, 5000);
  assert(o.has_value());
  assert(o->price_usd == 321.0);
  // seeding is idempotent across restarts
  std::size_t reuters = 0;
  for (const auto& source : repo->ListSources(*tx)) {
    if (source.name == "Reuters") ++reuters;
  }
  assert(reuters == 1);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return omni::factory::BuildRepository(omni::runtime::config::RuntimeConfig{}); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
      .supports_parallel_transactions = true,
  };
}

#if OMNI_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("omni_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    omni::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    return omni::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      // the connection mutex is held per transaction
      .supports_parallel_transactions = false,
  };
}
#endif

#if OMNI_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("OMNI_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("OMNI_TEST_POSTGRES_URI is not set");
  }

  auto make_repo = [conninfo = std::string(uri)]() {
    omni::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    config.mutable_database()->mutable_postgres()->set_max_connections(4);
    return omni::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();
  Keys keys{"_" + backend.name + "_" + std::to_string(NowMs())};

  VerifyAssetUniqueness(*repo, keys);
  VerifyObservationsAndSignals(*repo, keys);
  VerifyArticlesMentionsEmbeddings(*repo, keys);
  VerifyRollbackBehavior(*repo, keys);
  VerifyConcurrentWriters(*repo, keys, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, keys);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if OMNI_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if OMNI_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "omni_integration_repository_parity: pass\n";
  return 0;
}
