#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "embed_scheduler.hpp"
#include "internal/config/runtime_options.hpp"

namespace omni::embedding {

class EmbeddingIndex;

// Delay before retry number `attempt` (1-based): base * 2^(attempt-1), capped.
std::chrono::milliseconds RetryDelay(const config::EmbeddingOptions& options, uint32_t attempt);

/*
  Background worker that drains the embed queue.

  Executes:
      article content -> chunks -> vectors -> stored chunk set

  EmbeddingUnavailable is retried with exponential backoff up to
  max_attempts; the article stays unprocessed in between.
*/
class EmbedWorker {
 public:
  EmbedWorker(std::shared_ptr<EmbedScheduler> scheduler, std::shared_ptr<EmbeddingIndex> index, config::EmbeddingOptions options);
  ~EmbedWorker();

  void Start();
  void Stop();

 private:
  void Run();
  void Execute(const EmbedTask& task);

  std::shared_ptr<EmbedScheduler> scheduler_;
  std::shared_ptr<EmbeddingIndex> index_;
  config::EmbeddingOptions        options_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace omni::embedding
