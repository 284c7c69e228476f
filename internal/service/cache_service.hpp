#pragma once

#include "api/mediacache/v1.hpp"
#include "internal/service/service_context.hpp"

namespace mediacache::service {

/*
  Operator-facing cache API: registration, status, precache, seek,
  operator retries and counters. Transport agnostic; the gRPC layer
  translates exceptions into status codes.
*/
class CacheService {
 public:
  explicit CacheService(ServiceContext ctx);

  mediacache::v1::RegisterMediaResponse RegisterMedia(const mediacache::v1::RegisterMediaRequest& req);

  mediacache::v1::GetCacheStatusResponse GetCacheStatus(const mediacache::v1::GetCacheStatusRequest& req);

  // Queues [start, end) at MEDIUM.
  mediacache::v1::PrecacheResponse Precache(const mediacache::v1::PrecacheRequest& req);

  mediacache::v1::SeekResponse Seek(const mediacache::v1::SeekRequest& req);

  // Forgets the recorded chunks of [start, end) and fetches them again at HIGH.
  mediacache::v1::RetryRangeResponse RetryRange(const mediacache::v1::RetryRangeRequest& req);

  mediacache::v1::StatsResponse Stats(const mediacache::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace mediacache::service
