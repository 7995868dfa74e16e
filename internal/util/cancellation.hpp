#pragma once

#include <atomic>

namespace omni::util {

/*
  Cooperative cancellation flag shared between a caller and a long-running task.
  Long operations poll IsCancelled() between units of work.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace omni::util
