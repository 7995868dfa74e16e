#include "internal/query/query_views.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/catalog_store.hpp"
#include "internal/content/content_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/hashing_embedder.hpp"
#include "internal/signal/signal_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using omni::db::model::AssetType;
using omni::db::model::SignalKind;
using omni::query::QueryViews;

constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

struct Fixture {
  std::shared_ptr<omni::db::memory::MemoryRepository> repo = std::make_shared<omni::db::memory::MemoryRepository>();
  std::shared_ptr<omni::signal::SignalEngine>         engine;
  std::shared_ptr<omni::embedding::EmbeddingIndex>    index;
  std::unique_ptr<omni::content::ContentStore>        content;
  std::unique_ptr<QueryViews>                         views;

  Fixture() {
    omni::config::EmbeddingOptions options;
    options.model     = "hashing-test";
    options.dimension = 128;
    engine            = std::make_shared<omni::signal::SignalEngine>(repo, omni::config::SignalOptions{});
    index   = std::make_shared<omni::embedding::EmbeddingIndex>(repo, std::make_shared<omni::embedding::HashingEmbedder>(128), options);
    content = std::make_unique<omni::content::ContentStore>(repo, index, nullptr);
    views   = std::make_unique<QueryViews>(repo, engine, index);
  }

  uint64_t Publish(const std::string& slug, uint64_t published_ms, const std::string& body, const std::string& source = "Reuters") {
    omni::content::ArticleInput input;
    input.source_name  = source;
    input.title        = slug;
    input.url          = "https://news.example.com/" + slug;
    input.published_ms = published_ms;
    input.content      = body;
    input.categories   = {"Cryptocurrencies"};
    const auto outcome = content->IngestArticle(input);
    assert(outcome.status == omni::content::IngestStatus::kInserted);
    return outcome.article_id;
  }

  void Prices(const std::string& symbol, const std::vector<double>& prices) {
    for (std::size_t i = 0; i < prices.size(); ++i) {
      omni::db::model::ObservationRecord obs;
      obs.timestamp_ms = (i + 1) * kDayMs;
      obs.price_usd    = prices[i];
      (void)engine->IngestBySymbol(symbol, obs);
    }
  }
};

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

void TestRecentNewsNewestFirst() {
  Fixture f;
  const auto older  = f.Publish("older", 1000, "old news");
  const auto newer  = f.Publish("newer", 3000, "new news", "Yahoo Finance");
  const auto middle = f.Publish("middle", 2000, "middle news");

  const auto recent = f.views->RecentNews(10);
  assert(recent.size() == 3);
  assert(recent[0].article.id == newer);
  assert(recent[0].source_name == "Yahoo Finance");
  assert(recent[1].article.id == middle);
  assert(recent[2].article.id == older);
  assert(recent[2].source_name == "Reuters");
  assert(recent[0].categories.size() == 1);
  assert(recent[0].categories[0] == "Cryptocurrencies");

  assert(f.views->RecentNews(1).size() == 1);
}

void TestAssetNewsAndMentions() {
  Fixture f;
  const auto a = f.Publish("btc-etf", 1000, "etf approval");
  const auto b = f.Publish("btc-halving", 5000, "halving");
  const auto c = f.Publish("eth-upgrade", 3000, "upgrade");

  (void)f.content->RecordMention(a, AssetType::kCrypto, "BTC", 2, true);
  (void)f.content->RecordMention(b, AssetType::kCrypto, "BTC", 1, false);
  (void)f.content->RecordMention(c, AssetType::kCrypto, "ETH", 4, true);
  (void)f.content->RecordMention(c, AssetType::kCrypto, "BTC", 1, false);

  const auto btc = f.views->AssetNews(AssetType::kCrypto, "BTC", 10);
  assert(btc.size() == 3);
  assert(btc[0].article.id == b);
  assert(btc[1].article.id == c);
  assert(btc[2].article.id == a);
  assert(btc[2].mention.mention_count == 2);
  assert(btc[2].mention.is_primary);

  assert(f.views->AssetNews(AssetType::kCrypto, "BTC", 2).size() == 2);
  assert(f.views->AssetNews(AssetType::kStock, "BTC", 10).empty());

  const auto in_c = f.views->AssetsMentionedIn(c);
  assert(in_c.size() == 2);
  ExpectThrow<omni::util::NotFound>([&] { (void)f.views->AssetsMentionedIn(c + 100); });
}

void TestSignalReads() {
  Fixture f;
  f.Prices("BTC", {100, 102, 101, 105, 103, 107, 110});

  const auto latest = f.views->LatestSignal("BTC");
  assert(latest.has_value());
  assert(latest->timestamp_ms == 7 * kDayMs);
  assert(latest->signal == SignalKind::kSell);

  const auto history = f.views->SignalHistory("BTC", 2 * kDayMs, 4 * kDayMs);
  assert(history.size() == 3);
  assert(history.front().timestamp_ms == 2 * kDayMs);
  assert(history.back().timestamp_ms == 4 * kDayMs);

  ExpectThrow<omni::util::InvalidArgument>([&] { (void)f.views->SignalHistory("BTC", 5 * kDayMs, 1 * kDayMs); });
  ExpectThrow<omni::util::NotFound>([&] { (void)f.views->LatestSignal("NOPE"); });
  ExpectThrow<omni::util::NotFound>([&] { (void)f.views->SignalHistory("NOPE", 0, UINT64_MAX); });
}

void TestObservationReads() {
  Fixture f;
  f.Prices("BTC", {100, 102, 101, 105});

  const auto range = f.views->Observations("BTC", 2 * kDayMs, 3 * kDayMs);
  assert(range.size() == 2);
  assert(range[0].timestamp_ms == 2 * kDayMs);
  assert(range[0].price_usd == 102);
  assert(range[1].price_usd == 101);
  assert(f.views->Observations("BTC", 0, UINT64_MAX).size() == 4);

  const auto latest = f.views->LatestObservation("BTC");
  assert(latest.has_value());
  assert(latest->timestamp_ms == 4 * kDayMs);
  assert(latest->price_usd == 105);

  omni::catalog::CatalogStore catalog(f.repo);
  (void)catalog.UpsertAsset("DOT", "Polkadot", "polkadot");
  assert(!f.views->LatestObservation("DOT").has_value());
  assert(f.views->Observations("DOT", 0, UINT64_MAX).empty());

  ExpectThrow<omni::util::InvalidArgument>([&] { (void)f.views->Observations("BTC", 3 * kDayMs, kDayMs); });
  ExpectThrow<omni::util::NotFound>([&] { (void)f.views->LatestObservation("NOPE"); });
}

void TestUnfinishedBackfillHidesSignals() {
  Fixture f;
  f.Prices("SOL", {20, 21, 22});

  uint64_t asset_id = 0;
  {
    auto tx  = f.repo->Begin();
    asset_id = f.repo->GetAssetBySymbol(*tx, "SOL")->id;
    omni::db::model::BackfillCheckpointRecord checkpoint;
    checkpoint.asset_id          = asset_id;
    checkpoint.from_timestamp_ms = 2 * kDayMs;
    checkpoint.next_timestamp_ms = 2 * kDayMs;
    assert(f.repo->UpsertBackfillCheckpoint(*tx, checkpoint));
    tx->Commit();
  }

  assert(!f.views->LatestSignal("SOL").has_value());
  ExpectThrow<omni::util::InconsistentBackfill>([&] { (void)f.views->SignalHistory("SOL", 0, UINT64_MAX); });
  assert(f.views->Outlook("SOL").text == "No data available to determine a trend.");
}

void TestSearchNewsDropsDeletedArticles() {
  Fixture f;
  const auto kept    = f.Publish("kept", 1000, "bitcoin miners expand capacity");
  const auto removed = f.Publish("removed", 2000, "bitcoin miners sell reserves");
  assert(f.index->ChunkAndEmbed(kept).applied);
  assert(f.index->ChunkAndEmbed(removed).applied);

  auto results = f.views->SearchNews("bitcoin miners", 5);
  assert(results.size() == 2);
  for (const auto& result : results) {
    assert(result.hit.chunk.article_id == result.article.id);
    assert(result.source_name == "Reuters");
  }

  // deleted behind the cache's back: the stale chunk is filtered out
  {
    auto tx = f.repo->Begin();
    assert(f.repo->DeleteArticle(*tx, removed));
    tx->Commit();
  }
  results = f.views->SearchNews("bitcoin miners", 5);
  assert(results.size() == 1);
  assert(results[0].article.id == kept);

  omni::embedding::SearchFilter only_kept;
  only_kept.article_ids = {kept};
  assert(f.views->SearchNews("bitcoin", 5, only_kept).size() == 1);
}

void TestOutlookTexts() {
  Fixture f;
  f.Prices("BTC", {100, 102, 101, 105, 103, 107, 110});
  f.Prices("ETH", {110, 107, 103, 105, 101, 102, 100});
  f.Prices("ADA", {1.0});
  omni::catalog::CatalogStore catalog(f.repo);
  (void)catalog.UpsertAsset("DOT", "Polkadot", "polkadot");

  const auto btc = f.views->Outlook("BTC");
  assert(btc.signal->signal == SignalKind::kSell);
  assert(btc.text == "Bearish outlook for BTC based on RSI signal.");

  const auto eth = f.views->Outlook("ETH");
  assert(eth.signal->signal == SignalKind::kBuy);
  assert(eth.text == "Bullish outlook for ETH based on RSI signal.");

  const auto ada = f.views->Outlook("ADA");
  assert(ada.signal->signal == SignalKind::kHold);
  assert(ada.text == "Neutral signals for ADA at the moment.");

  const auto dot = f.views->Outlook("DOT");
  assert(!dot.signal.has_value());
  assert(dot.text == "No data available to determine a trend.");

  ExpectThrow<omni::util::NotFound>([&] { (void)f.views->Outlook("NOPE"); });
}

} // namespace

int main() {
  TestRecentNewsNewestFirst();
  TestAssetNewsAndMentions();
  TestSignalReads();
  TestObservationReads();
  TestUnfinishedBackfillHidesSignals();
  TestSearchNewsDropsDeletedArticles();
  TestOutlookTexts();

  std::cout << "omni_unit_query_views: pass\n";
  return 0;
}
