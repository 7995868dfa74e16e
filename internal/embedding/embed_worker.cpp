#include "embed_worker.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include "embedding_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace omni::embedding {

std::chrono::milliseconds RetryDelay(const config::EmbeddingOptions& options, uint32_t attempt) {
  uint64_t delay = options.retry_base_delay_ms;
  for (uint32_t i = 1; i < attempt && delay < options.retry_max_delay_ms; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, options.retry_max_delay_ms));
}

EmbedWorker::EmbedWorker(std::shared_ptr<EmbedScheduler> scheduler, std::shared_ptr<EmbeddingIndex> index, config::EmbeddingOptions options)
    : scheduler_(std::move(scheduler)), index_(std::move(index)), options_(std::move(options)) {
}

EmbedWorker::~EmbedWorker() {
  Stop();
}

void EmbedWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&EmbedWorker::Run, this);
}

void EmbedWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void EmbedWorker::Run() {
  while (running_) {
    auto task = scheduler_->Dequeue();
    if (!task) break;
    Execute(*task);
  }
}

void EmbedWorker::Execute(const EmbedTask& task) {
  auto& metrics = observability::Metrics::Instance();
  try {
    const auto result = index_->ChunkAndEmbed(task.article_id);
    if (result.applied) {
      metrics.RecordEmbeddingJob(true);
      OMNI_LOG_DEBUG("Article embedded", {observability::UintField("article_id", task.article_id),
                                          observability::UintField("chunks", result.chunks)});
    }
  } catch (const util::EmbeddingUnavailable& e) {
    metrics.RecordEmbeddingJob(false);
    const uint32_t attempt = task.attempt + 1;
    if (attempt >= options_.max_attempts) {
      OMNI_LOG_ERROR("Embedding gave up", {observability::UintField("article_id", task.article_id), observability::UintField("attempts", attempt),
                                           observability::StringField("error", e.what())});
      return;
    }

    const auto delay = RetryDelay(options_, attempt);
    OMNI_LOG_WARN("Embedding unavailable, retrying",
                  {observability::UintField("article_id", task.article_id), observability::UintField("attempt", attempt),
                   observability::IntField("delay_ms", delay.count()), observability::StringField("error", e.what())});

    EmbedTask retry  = task;
    retry.attempt    = attempt;
    retry.not_before = std::chrono::steady_clock::now() + delay;
    scheduler_->Enqueue(retry);
  } catch (const util::NotFound& e) {
    // article deleted after the task was queued
    OMNI_LOG_DEBUG("Embed task dropped", {observability::UintField("article_id", task.article_id), observability::StringField("error", e.what())});
  } catch (const std::exception& e) {
    metrics.RecordEmbeddingJob(false);
    OMNI_LOG_ERROR("Embedding failed", {observability::UintField("article_id", task.article_id), observability::StringField("error", e.what())});
  }
}

} // namespace omni::embedding
