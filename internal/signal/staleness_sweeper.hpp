#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace omni::signal {

class SignalEngine;

/*
  Background thread that periodically runs SignalEngine::SweepStaleAssets.
*/
class StalenessSweeper {
 public:
  StalenessSweeper(std::shared_ptr<SignalEngine> engine, std::chrono::milliseconds interval);
  ~StalenessSweeper();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<SignalEngine> engine_;
  std::chrono::milliseconds     interval_;

  std::thread             thread_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    running_ = false;
};

} // namespace omni::signal
