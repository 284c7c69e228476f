#include "internal/observability/cache_stats.hpp"

namespace mediacache::observability {

void CacheStats::ProxyRequest(bool ranged) {
  proxy_requests_.fetch_add(1, std::memory_order_relaxed);
  if (ranged) {
    range_requests_.fetch_add(1, std::memory_order_relaxed);
  } else {
    full_requests_.fetch_add(1, std::memory_order_relaxed);
  }
}

void CacheStats::CacheLookup(bool hit) {
  if (hit) {
    cache_hits_.fetch_add(1, std::memory_order_relaxed);
  } else {
    cache_misses_.fetch_add(1, std::memory_order_relaxed);
  }
}

StatsSnapshot CacheStats::Snapshot() const {
  StatsSnapshot s;
  s.downloads_started   = downloads_started_.load(std::memory_order_relaxed);
  s.downloads_completed = downloads_completed_.load(std::memory_order_relaxed);
  s.downloads_failed    = downloads_failed_.load(std::memory_order_relaxed);
  s.bytes_downloaded    = bytes_downloaded_.load(std::memory_order_relaxed);
  s.proxy_requests      = proxy_requests_.load(std::memory_order_relaxed);
  s.range_requests      = range_requests_.load(std::memory_order_relaxed);
  s.full_requests       = full_requests_.load(std::memory_order_relaxed);
  s.cache_hits          = cache_hits_.load(std::memory_order_relaxed);
  s.cache_misses        = cache_misses_.load(std::memory_order_relaxed);
  s.bytes_served        = bytes_served_.load(std::memory_order_relaxed);
  s.wait_timeouts       = wait_timeouts_.load(std::memory_order_relaxed);
  return s;
}

} // namespace mediacache::observability
