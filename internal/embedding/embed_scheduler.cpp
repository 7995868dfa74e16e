#include "embed_scheduler.hpp"

namespace omni::embedding {

void EmbedScheduler::Enqueue(uint64_t article_id) {
  EmbedTask task;
  task.article_id = article_id;
  task.not_before = std::chrono::steady_clock::now();
  Enqueue(task);
}

void EmbedScheduler::Enqueue(const EmbedTask& task) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(Entry{task, next_sequence_++});
  }
  cv_.notify_one();
}

std::optional<EmbedTask> EmbedScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  while (true) {
    if (shutdown_) return std::nullopt;

    if (queue_.empty()) {
      cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });
      continue;
    }

    const auto due = queue_.top().task.not_before;
    if (due <= std::chrono::steady_clock::now()) {
      EmbedTask task = queue_.top().task;
      queue_.pop();
      return task;
    }

    // woken early by Enqueue or Shutdown; re-check the head either way
    cv_.wait_until(lock, due);
  }
}

void EmbedScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t EmbedScheduler::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace omni::embedding
