#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "internal/observability/cache_stats.hpp"

namespace mediacache::observability {

/*
  Background thread that logs a stats snapshot at a fixed interval.
*/
class StatsReporter {
 public:
  using SnapshotFn = std::function<StatsSnapshot()>;

  StatsReporter(SnapshotFn snapshot, std::chrono::milliseconds interval);
  ~StatsReporter();

  StatsReporter(const StatsReporter&)            = delete;
  StatsReporter& operator=(const StatsReporter&) = delete;

  void Start();
  void Stop();

 private:
  void Run();

  SnapshotFn                snapshot_;
  std::chrono::milliseconds interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    stopping_ = false;
  std::thread             thread_;
};

void LogSnapshot(const StatsSnapshot& snapshot);

} // namespace mediacache::observability
