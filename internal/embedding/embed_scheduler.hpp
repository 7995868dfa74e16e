#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace omni::embedding {

struct EmbedTask {
  uint64_t article_id = 0;
  uint32_t attempt    = 0;

  std::chrono::steady_clock::time_point not_before{};
};

/*
  Thread-safe delayed queue for embed workers.

  Dequeue blocks until the earliest task is due or the scheduler shuts
  down. Tasks with equal due time come out in enqueue order.
*/
class EmbedScheduler {
 public:
  void Enqueue(uint64_t article_id);
  void Enqueue(const EmbedTask& task);

  // blocking wait; nullopt after Shutdown
  std::optional<EmbedTask> Dequeue();

  void Shutdown();

  std::size_t Pending() const;

 private:
  struct Entry {
    EmbedTask task;
    uint64_t  sequence = 0;
  };

  struct Later {
    bool operator()(const Entry& a, const Entry& b) const {
      if (a.task.not_before != b.task.not_before) return a.task.not_before > b.task.not_before;
      return a.sequence > b.sequence;
    }
  };

  mutable std::mutex                                   mutex_;
  std::condition_variable                              cv_;
  std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
  uint64_t                                             next_sequence_ = 0;
  bool                                                 shutdown_      = false;
};

} // namespace omni::embedding
