#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/service/cache_service.hpp"
#include "mediacache/v1/cache_admin.grpc.pb.h"

namespace mediacache::grpc {

class AdminServer final : public mediacache::v1::CacheAdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<mediacache::service::CacheService> svc);

  ::grpc::Status RegisterMedia(::grpc::ServerContext*, const mediacache::v1::RegisterMediaRequest*,
                               mediacache::v1::RegisterMediaResponse*) override;

  ::grpc::Status GetCacheStatus(::grpc::ServerContext*, const mediacache::v1::GetCacheStatusRequest*,
                                mediacache::v1::GetCacheStatusResponse*) override;

  ::grpc::Status Precache(::grpc::ServerContext*, const mediacache::v1::PrecacheRequest*, mediacache::v1::PrecacheResponse*) override;

  ::grpc::Status Seek(::grpc::ServerContext*, const mediacache::v1::SeekRequest*, mediacache::v1::SeekResponse*) override;

  ::grpc::Status RetryRange(::grpc::ServerContext*, const mediacache::v1::RetryRangeRequest*,
                            mediacache::v1::RetryRangeResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const mediacache::v1::StatsRequest*, mediacache::v1::StatsResponse*) override;

 private:
  std::shared_ptr<mediacache::service::CacheService> service_;
};

} // namespace mediacache::grpc
