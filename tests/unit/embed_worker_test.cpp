#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/embedding/embed_scheduler.hpp"
#include "internal/embedding/embed_worker.hpp"
#include "internal/embedding/embedding_index.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using omni::embedding::EmbedScheduler;
using omni::embedding::EmbedTask;
using omni::embedding::EmbedWorker;
using omni::embedding::EmbeddingIndex;

// Fails the first `failures` calls with EmbeddingUnavailable.
class FlakyEmbedder final : public omni::embedding::EmbeddingFunction {
 public:
  explicit FlakyEmbedder(int failures) : failures_(failures) {
  }

  std::vector<float> Embed(const std::string&, const std::string&) override {
    const int call = calls.fetch_add(1);
    if (call < failures_) throw omni::util::EmbeddingUnavailable("model warming up");
    return {0.0f, 1.0f, 0.0f};
  }

  std::size_t Dimension() const override {
    return 3;
  }

  std::atomic<int> calls{0};

 private:
  int failures_;
};

omni::config::EmbeddingOptions Options() {
  omni::config::EmbeddingOptions options;
  options.model               = "test-model-v1";
  options.dimension           = 3;
  options.max_chunk_chars     = 200;
  options.chunk_overlap_chars = 20;
  options.retry_base_delay_ms = 1;
  options.retry_max_delay_ms  = 4;
  options.max_attempts        = 3;
  return options;
}

uint64_t AddArticle(omni::db::Repository& repo, const std::string& slug) {
  auto                            tx = repo.Begin();
  omni::db::model::ArticleRecord article;
  article.source_id    = repo.GetSourceByName(*tx, "Reuters")->id;
  article.title        = slug;
  article.url          = "https://news.example.com/" + slug;
  article.published_ms = 1000;
  article.fetched_ms   = 1000;
  article.content      = "Short article body about " + slug + ".";
  assert(repo.InsertArticle(*tx, article));
  tx->Commit();
  return article.id;
}

bool IsProcessed(omni::db::Repository& repo, uint64_t article_id) {
  auto tx      = repo.Begin();
  auto article = repo.GetArticleById(*tx, article_id);
  tx->Commit();
  return article && article->is_processed;
}

template <typename Predicate>
bool WaitFor(Predicate&& predicate) {
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) return true;
    std::this_thread::sleep_for(2ms);
  }
  return predicate();
}

void TestRetryDelayDoublesUpToCap() {
  omni::config::EmbeddingOptions options;
  options.retry_base_delay_ms = 500;
  options.retry_max_delay_ms  = 30000;
  assert(omni::embedding::RetryDelay(options, 1) == 500ms);
  assert(omni::embedding::RetryDelay(options, 2) == 1000ms);
  assert(omni::embedding::RetryDelay(options, 3) == 2000ms);
  assert(omni::embedding::RetryDelay(options, 7) == 30000ms);
  assert(omni::embedding::RetryDelay(options, 200) == 30000ms);
}

void TestSchedulerOrdersByDueTimeThenArrival() {
  EmbedScheduler scheduler;
  const auto     now = std::chrono::steady_clock::now();

  EmbedTask later;
  later.article_id = 3;
  later.not_before = now + 30ms;
  scheduler.Enqueue(later);

  EmbedTask first;
  first.article_id = 1;
  first.not_before = now;
  EmbedTask second = first;
  second.article_id = 2;
  scheduler.Enqueue(first);
  scheduler.Enqueue(second);
  assert(scheduler.Pending() == 3);

  assert(scheduler.Dequeue()->article_id == 1);
  assert(scheduler.Dequeue()->article_id == 2);

  // the delayed task is held back until it is due
  const auto delayed = scheduler.Dequeue();
  assert(delayed->article_id == 3);
  assert(std::chrono::steady_clock::now() >= later.not_before);
  assert(scheduler.Pending() == 0);
}

void TestSchedulerShutdownReleasesWaiters() {
  EmbedScheduler           scheduler;
  std::atomic<bool>        released{false};
  std::thread              waiter([&] {
    assert(!scheduler.Dequeue().has_value());
    released = true;
  });

  std::this_thread::sleep_for(10ms);
  scheduler.Shutdown();
  waiter.join();
  assert(released.load());

  // nothing comes out after shutdown, queued or not
  scheduler.Enqueue(42);
  assert(!scheduler.Dequeue().has_value());
}

void TestWorkerRetriesUnavailableEmbedder() {
  auto repo      = std::make_shared<omni::db::memory::MemoryRepository>();
  auto embedder  = std::make_shared<FlakyEmbedder>(2);
  auto index     = std::make_shared<EmbeddingIndex>(repo, embedder, Options());
  auto scheduler = std::make_shared<EmbedScheduler>();

  const auto id = AddArticle(*repo, "flaky");

  EmbedWorker worker(scheduler, index, Options());
  worker.Start();
  worker.Start();
  scheduler->Enqueue(id);

  assert(WaitFor([&] { return IsProcessed(*repo, id); }));
  assert(embedder->calls.load() == 3);
  assert(index->CachedChunks() == 1);
  worker.Stop();
  worker.Stop();
}

void TestWorkerGivesUpAfterMaxAttempts() {
  auto repo      = std::make_shared<omni::db::memory::MemoryRepository>();
  auto embedder  = std::make_shared<FlakyEmbedder>(1000);
  auto index     = std::make_shared<EmbeddingIndex>(repo, embedder, Options());
  auto scheduler = std::make_shared<EmbedScheduler>();

  const auto id = AddArticle(*repo, "down");

  EmbedWorker worker(scheduler, index, Options());
  worker.Start();
  scheduler->Enqueue(id);

  assert(WaitFor([&] { return embedder->calls.load() >= 3 && scheduler->Pending() == 0; }));
  std::this_thread::sleep_for(30ms);
  assert(embedder->calls.load() == 3);
  assert(!IsProcessed(*repo, id));
  assert(index->CachedChunks() == 0);
  worker.Stop();
}

void TestWorkerDropsDeletedArticles() {
  auto repo      = std::make_shared<omni::db::memory::MemoryRepository>();
  auto embedder  = std::make_shared<FlakyEmbedder>(0);
  auto index     = std::make_shared<EmbeddingIndex>(repo, embedder, Options());
  auto scheduler = std::make_shared<EmbedScheduler>();

  const auto id = AddArticle(*repo, "survivor");

  EmbedWorker worker(scheduler, index, Options());
  worker.Start();
  scheduler->Enqueue(987654);
  scheduler->Enqueue(id);

  // the unknown article is dropped and the worker keeps going
  assert(WaitFor([&] { return IsProcessed(*repo, id); }));
  assert(scheduler->Pending() == 0);
  worker.Stop();
}

void TestStopBeforeStart() {
  auto repo      = std::make_shared<omni::db::memory::MemoryRepository>();
  auto index     = std::make_shared<EmbeddingIndex>(repo, std::make_shared<FlakyEmbedder>(0), Options());
  auto scheduler = std::make_shared<EmbedScheduler>();

  EmbedWorker worker(scheduler, index, Options());
  worker.Stop();
}

} // namespace

int main() {
  TestRetryDelayDoublesUpToCap();
  TestSchedulerOrdersByDueTimeThenArrival();
  TestSchedulerShutdownReleasesWaiters();
  TestWorkerRetriesUnavailableEmbedder();
  TestWorkerGivesUpAfterMaxAttempts();
  TestWorkerDropsDeletedArticles();
  TestStopBeforeStart();

  std::cout << "omni_unit_embed_worker: pass\n";
  return 0;
}
