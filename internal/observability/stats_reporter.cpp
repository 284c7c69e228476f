#include "internal/observability/stats_reporter.hpp"

#include "internal/observability/logging.hpp"

namespace mediacache::observability {

StatsReporter::StatsReporter(SnapshotFn snapshot, std::chrono::milliseconds interval)
    : snapshot_(std::move(snapshot)), interval_(interval) {
}

StatsReporter::~StatsReporter() {
  Stop();
}

void StatsReporter::Start() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = false;
  }
  thread_ = std::thread(&StatsReporter::Run, this);
}

void StatsReporter::Stop() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void StatsReporter::Run() {
  std::unique_lock lock(mutex_);
  while (!cv_.wait_for(lock, interval_, [this] { return stopping_; })) {
    lock.unlock();
    try {
      LogSnapshot(snapshot_());
    } catch (const std::exception& e) {
      MEDIACACHE_LOG_WARN("Stats snapshot failed", {StringField("error", e.what())});
    }
    lock.lock();
  }
}

void LogSnapshot(const StatsSnapshot& s) {
  const uint64_t lookups  = s.cache_hits + s.cache_misses;
  const int64_t  hit_rate = lookups == 0 ? 0 : static_cast<int64_t>(s.cache_hits * 100 / lookups);

  MEDIACACHE_LOG_INFO("Cache stats", {IntField("downloads_started", static_cast<int64_t>(s.downloads_started)),
                                      IntField("downloads_completed", static_cast<int64_t>(s.downloads_completed)),
                                      IntField("downloads_failed", static_cast<int64_t>(s.downloads_failed)),
                                      IntField("bytes_downloaded", static_cast<int64_t>(s.bytes_downloaded)),
                                      IntField("proxy_requests", static_cast<int64_t>(s.proxy_requests)),
                                      IntField("range_requests", static_cast<int64_t>(s.range_requests)),
                                      IntField("hit_rate_percent", hit_rate),
                                      IntField("bytes_served", static_cast<int64_t>(s.bytes_served)),
                                      IntField("wait_timeouts", static_cast<int64_t>(s.wait_timeouts)),
                                      IntField("queue_depth", static_cast<int64_t>(s.queue_depth)),
                                      IntField("in_flight", static_cast<int64_t>(s.in_flight))});
}

} // namespace mediacache::observability
