#include "internal/content/content_store.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <condition_variable>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/content/url.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/embed_scheduler.hpp"
#include "internal/embedding/embedding_index.hpp"
#include "internal/embedding/hashing_embedder.hpp"
#include "internal/util/errors.hpp"

namespace {

using omni::content::ArticleInput;
using omni::content::CanonicalizeUrl;
using omni::content::ContentStore;
using omni::content::IngestStatus;
using omni::db::model::AssetType;

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

// Holds every Embed call until Release().
class GatedEmbedder final : public omni::embedding::EmbeddingFunction {
 public:
  explicit GatedEmbedder(std::size_t dimension) : inner_(dimension) {
  }

  std::vector<float> Embed(const std::string& text, const std::string& model) override {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      ++calls_;
      cv_.notify_all();
      cv_.wait(lock, [&] { return open_; });
    }
    return inner_.Embed(text, model);
  }

  std::size_t Dimension() const override {
    return inner_.Dimension();
  }

  void WaitUntilCalled() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return calls_ > 0; });
  }

  void Release() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    cv_.notify_all();
  }

 private:
  omni::embedding::HashingEmbedder inner_;
  std::mutex                       mutex_;
  std::condition_variable          cv_;
  int                              calls_ = 0;
  bool                             open_  = false;
};

omni::config::EmbeddingOptions IndexOptions() {
  omni::config::EmbeddingOptions options;
  options.model     = "hashing-test";
  options.dimension = 16;
  return options;
}

struct Fixture {
  std::shared_ptr<omni::db::memory::MemoryRepository> repo = std::make_shared<omni::db::memory::MemoryRepository>();
  std::shared_ptr<omni::embedding::EmbedScheduler>    scheduler = std::make_shared<omni::embedding::EmbedScheduler>();
  std::shared_ptr<omni::embedding::EmbeddingIndex>    index;
  std::unique_ptr<ContentStore>                       store;

  Fixture() {
    index = std::make_shared<omni::embedding::EmbeddingIndex>(repo, std::make_shared<omni::embedding::HashingEmbedder>(16), IndexOptions());
    store = std::make_unique<ContentStore>(repo, index, scheduler);
  }
};

ArticleInput Article(const std::string& url, const std::string& title) {
  ArticleInput input;
  input.source_name  = "Reuters";
  input.title        = title;
  input.url          = url;
  input.published_ms = 1'700'000'000'000ull;
  input.summary      = "summary of " + title;
  input.content      = "Bitcoin rallied as traders priced in lower rates.";
  input.categories   = {"Markets", "Cryptocurrencies"};
  return input;
}

void TestCanonicalUrl() {
  assert(CanonicalizeUrl("  HTTPS://News.Example.com:443/markets/btc/?utm_source=feed&id=5#top ") ==
         "https://news.example.com/markets/btc?id=5");
  assert(CanonicalizeUrl("http://example.com:80/") == "http://example.com");
  assert(CanonicalizeUrl("http://example.com:8080/a") == "http://example.com:8080/a");
  assert(CanonicalizeUrl("https://example.com/a?utm_medium=x") == "https://example.com/a");

  ExpectThrow<omni::util::InvalidArgument>([] { (void)CanonicalizeUrl("example.com/article"); });
  ExpectThrow<omni::util::InvalidArgument>([] { (void)CanonicalizeUrl("ftp://example.com/file"); });
  ExpectThrow<omni::util::InvalidArgument>([] { (void)CanonicalizeUrl("https:///path"); });
}

void TestIngestStoresAndQueues() {
  Fixture f;

  const auto outcome = f.store->IngestArticle(Article("https://news.example.com/btc-rally?utm_source=rss", "BTC rallies"));
  assert(outcome.status == IngestStatus::kInserted);
  assert(outcome.article_id != 0);
  assert(f.scheduler->Pending() == 1);

  const auto stored = f.store->GetArticle(outcome.article_id);
  assert(stored.has_value());
  assert(stored->url == "https://news.example.com/btc-rally");
  assert(stored->title == "BTC rallies");
  assert(stored->fetched_ms > 0);
  assert(!stored->is_processed);

  auto tx         = f.repo->Begin();
  auto categories = f.repo->GetArticleCategories(*tx, outcome.article_id);
  tx->Commit();
  assert(categories.size() == 2);

  // lookups canonicalize too
  assert(f.store->FindArticleByUrl("HTTPS://news.example.com/btc-rally/#comments")->id == outcome.article_id);
}

void TestDuplicateUrlLeavesStoredRowUntouched() {
  Fixture f;

  const auto first = f.store->IngestArticle(Article("https://news.example.com/eth", "Original title"));
  assert(first.status == IngestStatus::kInserted);
  f.store->MarkProcessed(first.article_id);

  auto again    = Article("https://NEWS.example.com/eth/", "Rewritten title");
  again.content = "completely different body";
  const auto second = f.store->IngestArticle(again);
  assert(second.status == IngestStatus::kDuplicate);
  assert(second.article_id == first.article_id);

  const auto stored = f.store->GetArticle(first.article_id);
  assert(stored->title == "Original title");
  assert(stored->content == Article("", "").content);
  assert(stored->is_processed);
  // only the first delivery queued work
  assert(f.scheduler->Pending() == 1);
}

void TestRejections() {
  Fixture f;

  const auto bad_url = f.store->IngestArticle(Article("not a url", "t"));
  assert(bad_url.status == IngestStatus::kRejected);
  assert(!bad_url.reason.empty());

  const auto no_title = f.store->IngestArticle(Article("https://news.example.com/untitled", ""));
  assert(no_title.status == IngestStatus::kRejected);

  auto unknown_source        = Article("https://news.example.com/who", "Who wrote this");
  unknown_source.source_name = "Unknown Gazette";
  const auto no_source       = f.store->IngestArticle(unknown_source);
  assert(no_source.status == IngestStatus::kRejected);
  assert(no_source.reason.find("Unknown Gazette") != std::string::npos);

  assert(!f.store->FindArticleByUrl("https://news.example.com/who").has_value());
  assert(f.scheduler->Pending() == 0);

  // unknown categories are skipped, the article is still stored
  auto odd_category       = Article("https://news.example.com/odd", "Odd category");
  odd_category.categories = {"Astrology", "Economy"};
  const auto odd          = f.store->IngestArticle(odd_category);
  assert(odd.status == IngestStatus::kInserted);
  auto tx = f.repo->Begin();
  assert(f.repo->GetArticleCategories(*tx, odd.article_id).size() == 1);
  tx->Commit();

  assert(std::string(omni::content::ToString(IngestStatus::kDuplicate)) == "duplicate");
}

void TestMentionsAccumulate() {
  Fixture f;
  const auto id = f.store->IngestArticle(Article("https://news.example.com/mentions", "Mentions")).article_id;

  auto mention = f.store->RecordMention(id, AssetType::kCrypto, "BTC", 2, false);
  assert(mention.mention_count == 2);
  assert(!mention.is_primary);

  mention = f.store->RecordMention(id, AssetType::kCrypto, "BTC", 3, true);
  assert(mention.mention_count == 5);
  assert(mention.is_primary);

  // is_primary is never cleared by a later mention
  mention = f.store->RecordMention(id, AssetType::kCrypto, "BTC", 1, false);
  assert(mention.mention_count == 6);
  assert(mention.is_primary);

  // the same symbol as a stock is a separate mention
  assert(f.store->RecordMention(id, AssetType::kStock, "BTC", 1, false).mention_count == 1);

  ExpectThrow<omni::util::InvalidArgument>([&] { (void)f.store->RecordMention(id, AssetType::kCrypto, "", 1, false); });
  ExpectThrow<omni::util::InvalidArgument>([&] { (void)f.store->RecordMention(id, AssetType::kCrypto, "ETH", 0, false); });
  ExpectThrow<omni::util::NotFound>([&] { (void)f.store->RecordMention(id + 100, AssetType::kCrypto, "ETH", 1, false); });
}

void TestSentimentAndContentUpdates() {
  Fixture f;
  const auto id = f.store->IngestArticle(Article("https://news.example.com/sentiment", "Sentiment")).article_id;

  f.store->UpdateSentiment(id, -0.4, "negative");
  auto stored = f.store->GetArticle(id);
  assert(stored->sentiment_score.has_value());
  assert(std::fabs(*stored->sentiment_score + 0.4) < 1e-12);
  assert(stored->sentiment_label == "negative");

  ExpectThrow<omni::util::InvalidArgument>([&] { f.store->UpdateSentiment(id, std::numeric_limits<double>::quiet_NaN(), "nan"); });
  ExpectThrow<omni::util::NotFound>([&] { f.store->UpdateSentiment(id + 100, 0.1, "positive"); });

  f.store->MarkProcessed(id);
  assert(f.scheduler->Pending() == 1);

  // unchanged content is a no-op
  assert(!f.store->UpdateContent(id, stored->content));
  assert(f.store->GetArticle(id)->is_processed);
  assert(f.scheduler->Pending() == 1);

  assert(f.store->UpdateContent(id, "A rewritten body."));
  stored = f.store->GetArticle(id);
  assert(stored->content == "A rewritten body.");
  assert(!stored->is_processed);
  assert(f.scheduler->Pending() == 2);

  ExpectThrow<omni::util::NotFound>([&] { (void)f.store->UpdateContent(id + 100, "x"); });
}

void TestContentRewriteHidesOldChunks() {
  Fixture f;
  auto input    = Article("https://news.example.com/halving", "Halving");
  input.content = "bitcoin halving miners rally";
  const auto id = f.store->IngestArticle(input).article_id;

  assert(f.index->ChunkAndEmbed(id).applied);
  (void)f.index->Index(id, 0, std::vector<float>(16, 0.25f), "other-model", "bitcoin halving miners rally");
  auto hits = f.index->SearchText("bitcoin halving miners rally", 5);
  assert(hits.size() == 1);
  assert(hits[0].chunk.article_id == id);

  assert(f.store->UpdateContent(id, "ethereum staking upgrade delayed"));

  // nothing of the old text is searchable before the article is re-embedded
  assert(f.index->CachedChunks() == 0);
  assert(f.index->SearchText("bitcoin halving miners rally", 5).empty());
  {
    auto tx = f.repo->Begin();
    assert(f.repo->ListEmbeddingsForArticle(*tx, id, "hashing-test").empty());
    assert(f.repo->ListEmbeddingsForArticle(*tx, id, "other-model").empty());
    tx->Commit();
  }

  assert(f.index->ChunkAndEmbed(id).applied);
  hits = f.index->SearchText("bitcoin halving miners rally", 5);
  assert(hits.size() == 1);
  assert(hits[0].chunk.chunk_text == "ethereum staking upgrade delayed");
}

void TestDeleteWaitsForInFlightEmbedding() {
  auto repo  = std::make_shared<omni::db::memory::MemoryRepository>();
  auto gate  = std::make_shared<GatedEmbedder>(16);
  auto index = std::make_shared<omni::embedding::EmbeddingIndex>(repo, gate, IndexOptions());
  ContentStore store(repo, index, nullptr);
  const auto   id = store.IngestArticle(Article("https://news.example.com/in-flight", "In flight")).article_id;

  std::thread embedding([&] { (void)index->ChunkAndEmbed(id); });
  gate->WaitUntilCalled();

  std::atomic<bool> deleted{false};
  std::thread       deleting([&] {
    store.DeleteArticle(id);
    deleted.store(true);
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  // the delete queues behind the embedding that already read the article
  assert(!deleted.load());

  gate->Release();
  embedding.join();
  deleting.join();

  assert(deleted.load());
  assert(!store.GetArticle(id).has_value());
  assert(index->CachedChunks() == 0);
  assert(index->SearchText("bitcoin rallied", 5).empty());
}

void TestContentRewriteWaitsForInFlightEmbedding() {
  auto repo      = std::make_shared<omni::db::memory::MemoryRepository>();
  auto gate      = std::make_shared<GatedEmbedder>(16);
  auto index     = std::make_shared<omni::embedding::EmbeddingIndex>(repo, gate, IndexOptions());
  auto scheduler = std::make_shared<omni::embedding::EmbedScheduler>();
  ContentStore store(repo, index, scheduler);
  const auto   id = store.IngestArticle(Article("https://news.example.com/rewrite", "Rewrite")).article_id;

  std::thread embedding([&] { (void)index->ChunkAndEmbed(id); });
  gate->WaitUntilCalled();

  bool        rewritten = false;
  std::thread rewriting([&] { rewritten = store.UpdateContent(id, "solana outage resolved"); });
  gate->Release();
  embedding.join();
  rewriting.join();
  assert(rewritten);

  // the old chunk set was published first and then dropped with the old text
  assert(index->CachedChunks() == 0);
  assert(index->SearchText("bitcoin rallied", 5).empty());
  assert(!store.GetArticle(id)->is_processed);
  assert(scheduler->Pending() == 2);
}

void TestDeleteEvictsChunks() {
  Fixture f;
  const auto id = f.store->IngestArticle(Article("https://news.example.com/delete-me", "Delete me")).article_id;
  f.store->RecordMention(id, AssetType::kCrypto, "BTC", 1, true);

  const auto embedded = f.index->ChunkAndEmbed(id);
  assert(embedded.applied);
  assert(f.index->CachedChunks() == embedded.chunks);
  assert(f.store->GetArticle(id)->is_processed);

  f.store->DeleteArticle(id);
  assert(!f.store->GetArticle(id).has_value());
  assert(f.index->CachedChunks() == 0);

  auto tx = f.repo->Begin();
  assert(f.repo->ListMentionsForArticle(*tx, id).empty());
  assert(f.repo->ListEmbeddingsForArticle(*tx, id, "hashing-test").empty());
  tx->Commit();

  ExpectThrow<omni::util::NotFound>([&] { f.store->DeleteArticle(id); });

  // the url can be ingested again as a new article
  const auto back = f.store->IngestArticle(Article("https://news.example.com/delete-me", "Back again"));
  assert(back.status == IngestStatus::kInserted);
  assert(back.article_id != id);
}

void TestRequeueUnprocessed() {
  Fixture f;
  const auto a = f.store->IngestArticle(Article("https://news.example.com/a", "A")).article_id;
  const auto b = f.store->IngestArticle(Article("https://news.example.com/b", "B")).article_id;
  (void)f.store->IngestArticle(Article("https://news.example.com/c", "C"));
  f.store->MarkProcessed(b);

  // drain what ingestion queued
  while (f.scheduler->Pending() > 0) (void)f.scheduler->Dequeue();

  assert(f.store->RequeueUnprocessed(10) == 2);
  assert(f.scheduler->Pending() == 2);
  assert(f.scheduler->Dequeue()->article_id == a);

  assert(f.store->RequeueUnprocessed(1) == 1);

  // without a scheduler nothing is queued
  ContentStore detached(f.repo, nullptr, nullptr);
  assert(detached.RequeueUnprocessed(10) == 0);
}

} // namespace

int main() {
  TestCanonicalUrl();
  TestIngestStoresAndQueues();
  TestDuplicateUrlLeavesStoredRowUntouched();
  TestRejections();
  TestMentionsAccumulate();
  TestSentimentAndContentUpdates();
  TestContentRewriteHidesOldChunks();
  TestDeleteWaitsForInFlightEmbedding();
  TestContentRewriteWaitsForInFlightEmbedding();
  TestDeleteEvictsChunks();
  TestRequeueUnprocessed();

  std::cout << "omni_unit_content_store: pass\n";
  return 0;
}
