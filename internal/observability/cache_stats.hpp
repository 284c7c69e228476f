#pragma once

#include <atomic>
#include <cstdint>

namespace mediacache::observability {

struct StatsSnapshot {
  uint64_t downloads_started   = 0;
  uint64_t downloads_completed = 0;
  uint64_t downloads_failed    = 0;
  uint64_t bytes_downloaded    = 0;
  uint64_t proxy_requests      = 0;
  uint64_t range_requests      = 0;
  uint64_t full_requests       = 0;
  uint64_t cache_hits          = 0;
  uint64_t cache_misses        = 0;
  uint64_t bytes_served        = 0;
  uint64_t wait_timeouts       = 0;
  uint64_t queue_depth         = 0;
  uint64_t in_flight           = 0;
};

/*
  Process-wide counters shared by the downloader and the proxy.
*/
class CacheStats {
 public:
  void DownloadStarted() {
    downloads_started_.fetch_add(1, std::memory_order_relaxed);
  }
  void DownloadCompleted(uint64_t bytes) {
    downloads_completed_.fetch_add(1, std::memory_order_relaxed);
    bytes_downloaded_.fetch_add(bytes, std::memory_order_relaxed);
  }
  void DownloadFailed() {
    downloads_failed_.fetch_add(1, std::memory_order_relaxed);
  }

  void ProxyRequest(bool ranged);
  void CacheLookup(bool hit);
  void BytesServed(uint64_t bytes) {
    bytes_served_.fetch_add(bytes, std::memory_order_relaxed);
  }
  void WaitTimeout() {
    wait_timeouts_.fetch_add(1, std::memory_order_relaxed);
  }

  StatsSnapshot Snapshot() const;

 private:
  std::atomic<uint64_t> downloads_started_{0};
  std::atomic<uint64_t> downloads_completed_{0};
  std::atomic<uint64_t> downloads_failed_{0};
  std::atomic<uint64_t> bytes_downloaded_{0};
  std::atomic<uint64_t> proxy_requests_{0};
  std::atomic<uint64_t> range_requests_{0};
  std::atomic<uint64_t> full_requests_{0};
  std::atomic<uint64_t> cache_hits_{0};
  std::atomic<uint64_t> cache_misses_{0};
  std::atomic<uint64_t> bytes_served_{0};
  std::atomic<uint64_t> wait_timeouts_{0};
};

} // namespace mediacache::observability
