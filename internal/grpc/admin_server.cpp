#include "admin_server.hpp"

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"

namespace mediacache::grpc {

using namespace mediacache::v1;

namespace {

template <typename Fn>
::grpc::Status Invoke(const char* route, Fn&& fn) {
  try {
    fn();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    auto status = ToStatus(e);
    MEDIACACHE_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", e.what()),
                                       observability::IntField("code", static_cast<int>(status.error_code()))});
    return status;
  }
}

} // namespace

AdminServer::AdminServer(std::shared_ptr<mediacache::service::CacheService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::RegisterMedia(::grpc::ServerContext*, const RegisterMediaRequest* req, RegisterMediaResponse* resp) {
  return Invoke("CacheAdminService.RegisterMedia", [&] { *resp = service_->RegisterMedia(*req); });
}

::grpc::Status AdminServer::GetCacheStatus(::grpc::ServerContext*, const GetCacheStatusRequest* req, GetCacheStatusResponse* resp) {
  return Invoke("CacheAdminService.GetCacheStatus", [&] { *resp = service_->GetCacheStatus(*req); });
}

::grpc::Status AdminServer::Precache(::grpc::ServerContext*, const PrecacheRequest* req, PrecacheResponse* resp) {
  return Invoke("CacheAdminService.Precache", [&] { *resp = service_->Precache(*req); });
}

::grpc::Status AdminServer::Seek(::grpc::ServerContext*, const SeekRequest* req, SeekResponse* resp) {
  return Invoke("CacheAdminService.Seek", [&] { *resp = service_->Seek(*req); });
}

::grpc::Status AdminServer::RetryRange(::grpc::ServerContext*, const RetryRangeRequest* req, RetryRangeResponse* resp) {
  return Invoke("CacheAdminService.RetryRange", [&] { *resp = service_->RetryRange(*req); });
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  return Invoke("CacheAdminService.Stats", [&] { *resp = service_->Stats(*req); });
}

} // namespace mediacache::grpc
