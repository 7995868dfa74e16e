#include "internal/service/ingest_service.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/catalog/catalog_store.hpp"
#include "internal/content/content_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/embedding_index.hpp"
#include "internal/embedding/hashing_embedder.hpp"
#include "internal/query/query_views.hpp"
#include "internal/service/query_service.hpp"
#include "internal/signal/signal_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace omni::v1;
using omni::service::IngestService;
using omni::service::QueryService;

constexpr uint64_t kDayMs = 24ull * 60 * 60 * 1000;

omni::service::ServiceContext MakeContext() {
  omni::config::EmbeddingOptions embedding;
  embedding.model     = "hashing-test";
  embedding.dimension = 64;

  omni::service::ServiceContext ctx;
  ctx.repository = std::make_shared<omni::db::memory::MemoryRepository>();
  ctx.engine     = std::make_shared<omni::signal::SignalEngine>(ctx.repository, omni::config::SignalOptions{});
  ctx.catalog    = std::make_shared<omni::catalog::CatalogStore>(ctx.repository);
  ctx.index      = std::make_shared<omni::embedding::EmbeddingIndex>(ctx.repository, std::make_shared<omni::embedding::HashingEmbedder>(64), embedding);
  ctx.content    = std::make_shared<omni::content::ContentStore>(ctx.repository, ctx.index, nullptr);
  ctx.views      = std::make_shared<omni::query::QueryViews>(ctx.repository, ctx.engine, ctx.index);
  return ctx;
}

IngestObservationRequest ObservationRequest(const std::string& symbol, uint64_t day, double price) {
  IngestObservationRequest req;
  auto*                    obs = req.mutable_observation();
  obs->set_symbol(symbol);
  obs->set_name(symbol == "BTC" ? "Bitcoin" : "");
  obs->set_slug(symbol == "BTC" ? "bitcoin" : "");
  obs->set_timestamp_ms(day * kDayMs);
  obs->set_price_usd(price);
  obs->set_market_cap_usd(price * 19'000'000);
  obs->set_volume_24h_usd(price * 1'000);
  obs->set_percent_change_24h(1.5);
  return req;
}

IngestArticleRequest ArticleRequest(const std::string& slug) {
  IngestArticleRequest req;
  req.set_source_name("Reuters");
  req.set_title("Headline " + slug);
  req.set_url("https://news.example.com/" + slug);
  req.set_published_ms(1'700'000'000'000ull);
  req.set_content("Bitcoin and ether climbed after the rate decision.");
  req.add_categories("Cryptocurrencies");
  return req;
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

void TestObservationOutcomes() {
  auto          ctx = MakeContext();
  IngestService ingest(ctx);

  const auto first = ingest.IngestObservation(ObservationRequest("BTC", 1, 100));
  assert(first.status() == INGEST_STATUS_INSERTED);
  assert(first.id() != 0);

  const auto again = ingest.IngestObservation(ObservationRequest("BTC", 1, 999));
  assert(again.status() == INGEST_STATUS_DUPLICATE);
  assert(again.id() == first.id());

  const auto bad = ingest.IngestObservation(ObservationRequest("BTC", 2, -1));
  assert(bad.status() == INGEST_STATUS_REJECTED);
  assert(!bad.reason().empty());

  const auto missing = ingest.IngestObservation(IngestObservationRequest{});
  assert(missing.status() == INGEST_STATUS_REJECTED);

  const auto asset = ctx.catalog->FindAsset("BTC");
  assert(asset->name == "Bitcoin");
  assert(asset->slug == "bitcoin");

  auto tx     = ctx.repository->Begin();
  auto stored = ctx.repository->GetObservation(*tx, asset->id, kDayMs);
  tx->Commit();
  assert(stored->price_usd == 100);
  assert(stored->percent_change_24h.has_value());
  assert(!stored->percent_change_1h.has_value());
}

void TestCorrectObservation() {
  auto          ctx = MakeContext();
  IngestService ingest(ctx);
  QueryService  query(ctx);

  for (uint64_t day = 1; day <= 3; ++day) {
    (void)ingest.IngestObservation(ObservationRequest("ETH", day, 2000 + day));
  }

  CorrectObservationRequest fix;
  *fix.mutable_observation() = ObservationRequest("ETH", 2, 1500).observation();
  assert(ingest.CorrectObservation(fix).status() == INGEST_STATUS_INSERTED);

  SignalHistoryRequest history;
  history.set_symbol("ETH");
  const auto rows = query.SignalHistory(history);
  assert(rows.signals_size() == 3);
  assert(std::fabs(rows.signals(1).ma_7d() - (2001.0 + 1500.0) / 2.0) < 1e-9);

  CorrectObservationRequest unknown;
  *unknown.mutable_observation() = ObservationRequest("NOPE", 2, 1).observation();
  ExpectThrow<omni::util::NotFound>([&] { (void)ingest.CorrectObservation(unknown); });

  CorrectObservationRequest absent;
  *absent.mutable_observation() = ObservationRequest("ETH", 9, 1).observation();
  ExpectThrow<omni::util::NotFound>([&] { (void)ingest.CorrectObservation(absent); });

  CorrectObservationRequest invalid;
  *invalid.mutable_observation() = ObservationRequest("ETH", 2, 0).observation();
  assert(ingest.CorrectObservation(invalid).status() == INGEST_STATUS_REJECTED);
}

void TestArticleMentionAndSentiment() {
  auto          ctx = MakeContext();
  IngestService ingest(ctx);
  QueryService  query(ctx);

  const auto inserted = ingest.IngestArticle(ArticleRequest("fed-decision"));
  assert(inserted.status() == INGEST_STATUS_INSERTED);

  const auto duplicate = ingest.IngestArticle(ArticleRequest("fed-decision"));
  assert(duplicate.status() == INGEST_STATUS_DUPLICATE);
  assert(duplicate.id() == inserted.id());

  auto bad_source = ArticleRequest("nobody");
  bad_source.set_source_name("Nobody Weekly");
  assert(ingest.IngestArticle(bad_source).status() == INGEST_STATUS_REJECTED);

  RecordMentionRequest mention;
  mention.mutable_mention()->set_article_id(inserted.id());
  mention.mutable_mention()->set_asset_type(ASSET_TYPE_CRYPTO);
  mention.mutable_mention()->set_asset_symbol("BTC");
  mention.mutable_mention()->set_is_primary(true);
  // zero count means a single mention
  auto recorded = ingest.RecordMention(mention);
  assert(recorded.mention().mention_count() == 1);
  recorded = ingest.RecordMention(mention);
  assert(recorded.mention().mention_count() == 2);
  assert(recorded.mention().is_primary());

  RecordMentionRequest untyped = mention;
  untyped.mutable_mention()->set_asset_type(ASSET_TYPE_UNSPECIFIED);
  ExpectThrow<omni::util::InvalidArgument>([&] { (void)ingest.RecordMention(untyped); });
  ExpectThrow<omni::util::InvalidArgument>([&] { (void)ingest.RecordMention(RecordMentionRequest{}); });

  UpdateSentimentRequest sentiment;
  sentiment.set_article_id(inserted.id());
  sentiment.set_score(0.75);
  sentiment.set_label("positive");
  const auto updated = ingest.UpdateSentiment(sentiment);
  assert(updated.article().sentiment_score() == 0.75);
  assert(updated.article().sentiment_label() == "positive");
  assert(updated.article().source_name() == "Reuters");
  assert(updated.article().categories_size() == 1);

  sentiment.set_article_id(inserted.id() + 100);
  ExpectThrow<omni::util::NotFound>([&] { (void)ingest.UpdateSentiment(sentiment); });

  AssetsMentionedInRequest mentioned;
  mentioned.set_article_id(inserted.id());
  const auto mentions = query.AssetsMentionedIn(mentioned);
  assert(mentions.mentions_size() == 1);
  assert(mentions.mentions(0).asset_symbol() == "BTC");

  AssetNewsRequest news;
  news.set_asset_type(ASSET_TYPE_CRYPTO);
  news.set_symbol("BTC");
  const auto btc_news = query.AssetNews(news);
  assert(btc_news.articles_size() == 1);
  assert(btc_news.articles(0).id() == inserted.id());

  assert(query.RecentNews(RecentNewsRequest{}).articles_size() == 1);
}

void TestQueryService() {
  auto          ctx = MakeContext();
  IngestService ingest(ctx);
  QueryService  query(ctx);

  const std::vector<double> prices = {100, 102, 101, 105, 103, 107, 110};
  for (std::size_t i = 0; i < prices.size(); ++i) {
    (void)ingest.IngestObservation(ObservationRequest("BTC", i + 1, prices[i]));
  }

  LatestSignalRequest latest;
  latest.set_symbol("BTC");
  const auto signal = query.LatestSignal(latest);
  assert(signal.found());
  assert(signal.signal().symbol() == "BTC");
  assert(signal.signal().signal() == SIGNAL_KIND_SELL);
  assert(signal.signal().has_rsi());
  assert(std::fabs(signal.signal().rsi() - 81.25) < 1e-9);

  (void)ctx.catalog->UpsertAsset("DOT", "", "");
  latest.set_symbol("DOT");
  assert(!query.LatestSignal(latest).found());

  ObservationHistoryRequest observations;
  observations.set_symbol("BTC");
  observations.set_from_ms(6 * kDayMs);
  const auto tail = query.ObservationHistory(observations);
  assert(tail.observations_size() == 2);
  assert(tail.observations(0).price_usd() == 107);
  assert(tail.observations(1).symbol() == "BTC");
  assert(tail.observations(1).has_percent_change_24h());
  assert(!tail.observations(1).has_percent_change_1h());

  LatestObservationRequest newest;
  newest.set_symbol("BTC");
  const auto newest_resp = query.LatestObservation(newest);
  assert(newest_resp.found());
  assert(newest_resp.observation().timestamp_ms() == 7 * kDayMs);
  assert(newest_resp.observation().price_usd() == 110);
  newest.set_symbol("DOT");
  assert(!query.LatestObservation(newest).found());

  AssetOutlookRequest outlook;
  outlook.set_symbol("BTC");
  assert(query.AssetOutlook(outlook).outlook() == "Bearish outlook for BTC based on RSI signal.");

  SignalHistoryRequest inverted;
  inverted.set_symbol("BTC");
  inverted.set_from_ms(5 * kDayMs);
  inverted.set_to_ms(2 * kDayMs);
  ExpectThrow<omni::util::InvalidArgument>([&] { (void)query.SignalHistory(inverted); });

  const auto article = ingest.IngestArticle(ArticleRequest("search-me"));
  assert(ctx.index->ChunkAndEmbed(article.id()).applied);

  SearchNewsRequest search;
  search.set_query_text("bitcoin rate decision");
  const auto hits = query.SearchNews(search);
  assert(hits.hits_size() == 1);
  assert(hits.hits(0).article_id() == article.id());
  assert(hits.hits(0).article_url() == "https://news.example.com/search-me");
  assert(hits.hits(0).source_name() == "Reuters");
  assert(hits.hits(0).model() == "hashing-test");

  ExpectThrow<omni::util::InvalidArgument>([&] { (void)query.SearchNews(SearchNewsRequest{}); });

  AssetNewsRequest untyped;
  untyped.set_symbol("BTC");
  ExpectThrow<omni::util::InvalidArgument>([&] { (void)query.AssetNews(untyped); });
}

} // namespace

int main() {
  TestObservationOutcomes();
  TestCorrectObservation();
  TestArticleMentionAndSentiment();
  TestQueryService();

  std::cout << "omni_unit_ingest_service: pass\n";
  return 0;
}
