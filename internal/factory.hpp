#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace mediacache::chunk {
class ChunkManager;
}
namespace mediacache::proxy {
class CacheProxy;
}
namespace mediacache::observability {
class StatsReporter;
class CacheStats;
} // namespace mediacache::observability
namespace mediacache::service {
class CacheService;
}

namespace mediacache::factory {

/*
  Application

  Owns all long-lived components built from the runtime config.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>               repository;
  std::shared_ptr<chunk::ChunkManager>          manager;
  std::shared_ptr<proxy::CacheProxy>            proxy;
  std::shared_ptr<observability::CacheStats>    stats;
  std::shared_ptr<observability::StatsReporter> reporter; // null when stats reporting is off
  std::shared_ptr<service::CacheService>        cache_service;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Composition root of the daemon. The only place that knows the concrete
  database backend and origin client. Workers and the proxy are
  constructed stopped; the caller starts them.
*/
Application Build(const mediacache::runtime::config::RuntimeConfig& config);

// Database backend selected by config.database, schema bootstrapped.
std::shared_ptr<db::Repository> BuildRepository(const mediacache::runtime::config::RuntimeConfig& config);

} // namespace mediacache::factory
