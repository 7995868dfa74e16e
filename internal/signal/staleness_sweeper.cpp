#include "staleness_sweeper.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "signal_engine.hpp"

namespace omni::signal {

StalenessSweeper::StalenessSweeper(std::shared_ptr<SignalEngine> engine, std::chrono::milliseconds interval)
    : engine_(std::move(engine)), interval_(interval) {
}

StalenessSweeper::~StalenessSweeper() {
  Stop();
}

void StalenessSweeper::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_ = true;
  thread_  = std::thread(&StalenessSweeper::Run, this);
}

void StalenessSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void StalenessSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    if (cv_.wait_for(lock, interval_, [&] { return !running_; })) {
      break;
    }

    lock.unlock();
    try {
      const auto changed = engine_->SweepStaleAssets(util::NowMillis());
      if (changed > 0) {
        OMNI_LOG_INFO("Staleness sweep finished", {observability::UintField("inactive", changed)});
      }
    } catch (const std::exception& e) {
      OMNI_LOG_ERROR("Staleness sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace omni::signal
