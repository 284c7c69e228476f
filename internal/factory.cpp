#include "factory.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <stdexcept>

#include "internal/chunk/chunk_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/download/chunk_downloader.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/index/cache_index.hpp"
#include "internal/observability/cache_stats.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/stats_reporter.hpp"
#include "internal/origin/curl_origin_client.hpp"
#include "internal/proxy/cache_proxy.hpp"
#include "internal/proxy/stream_registry.hpp"
#include "internal/service/cache_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/chunk_store.hpp"
#if MEDIACACHE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace mediacache::factory {

using mediacache::runtime::config::RuntimeConfig;
using observability::StringField;

namespace {

download::DownloaderOptions DownloaderOptionsFrom(const RuntimeConfig& config) {
  const auto& d = config.downloader();

  download::DownloaderOptions options;
  options.chunk_size            = config.cache().chunk_size_bytes();
  options.retry.max_attempts    = d.max_attempts();
  options.retry.initial_backoff = std::chrono::milliseconds(d.initial_backoff_ms());
  options.retry.max_backoff     = std::chrono::milliseconds(d.max_backoff_ms());
  options.retry.multiplier      = d.backoff_multiplier();
  return options;
}

origin::CurlOriginOptions OriginOptionsFrom(const RuntimeConfig& config) {
  const auto& d = config.downloader();

  origin::CurlOriginOptions options;
  options.connect_timeout  = std::chrono::milliseconds(d.connect_timeout_ms());
  options.transfer_timeout = std::chrono::milliseconds(d.transfer_timeout_ms());
  options.user_agent       = d.user_agent();
  return options;
}

proxy::ProxyOptions ProxyOptionsFrom(const RuntimeConfig& config) {
  const auto& p = config.proxy();

  proxy::ProxyOptions options;
  options.bind_address                = p.bind_address();
  options.port                        = static_cast<uint16_t>(p.port());
  options.advertise_host              = p.advertise_host();
  options.direct_read_threshold_bytes = p.direct_read_threshold_bytes();
  options.chunk_wait_timeout          = std::chrono::milliseconds(p.chunk_wait_timeout_ms());
  options.retry_after_seconds         = p.retry_after_seconds();
  return options;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();

  if (database.has_sqlite()) {
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->BootstrapSchema();
    MEDIACACHE_LOG_INFO("Using sqlite index", {StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  if (database.has_postgres()) {
#if MEDIACACHE_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri());
    db::postgres::PgRepository::BootstrapSchema(*pool);
    MEDIACACHE_LOG_INFO("Using postgres index");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  MEDIACACHE_LOG_WARN("No database configured, cache index is not persistent");
  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistent state
  // ------------------------------------------------------------------
  const std::filesystem::path cache_dir(config.cache().directory());

  app.repository = BuildRepository(config);
  auto cache_index = std::make_shared<index::CacheIndex>(app.repository, cache_dir);
  auto store       = std::make_shared<storage::ChunkStore>(cache_dir);

  // ------------------------------------------------------------------
  // Download pipeline
  // ------------------------------------------------------------------
  app.stats          = std::make_shared<observability::CacheStats>();
  auto origin_client = std::make_shared<origin::CurlOriginClient>(OriginOptionsFrom(config));
  auto downloader =
      std::make_shared<download::ChunkDownloader>(cache_index, store, origin_client, app.stats, DownloaderOptionsFrom(config));

  chunk::ChunkManagerOptions manager_options;
  manager_options.max_concurrent_downloads = config.cache().max_concurrent_downloads();
  manager_options.lookahead_chunks         = config.cache().lookahead_chunks();
  app.manager = std::make_shared<chunk::ChunkManager>(cache_index, downloader, manager_options);

  // ------------------------------------------------------------------
  // Proxy
  // ------------------------------------------------------------------
  auto streams = std::make_shared<proxy::StreamRegistry>();
  app.proxy    = std::make_shared<proxy::CacheProxy>(cache_index, store, downloader, app.manager, streams, app.stats,
                                                     ProxyOptionsFrom(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.index                  = cache_index;
  ctx.store                  = store;
  ctx.downloader             = downloader;
  ctx.manager                = app.manager;
  ctx.streams                = streams;
  ctx.proxy                  = app.proxy;
  ctx.stats                  = app.stats;
  ctx.enable_background_fill = config.cache().enable_background_fill();

  app.cache_service = std::make_shared<service::CacheService>(ctx);
  app.grpc_services.push_back(std::make_unique<grpc::AdminServer>(app.cache_service));

  if (config.stats().enabled()) {
    auto manager = app.manager;
    auto stats   = app.stats;
    app.reporter = std::make_shared<observability::StatsReporter>(
        [stats, manager] {
          auto snapshot        = stats->Snapshot();
          snapshot.queue_depth = manager->QueueDepth();
          snapshot.in_flight   = manager->InFlight();
          return snapshot;
        },
        std::chrono::milliseconds(config.stats().interval_ms()));
  }

  return app;
}

} // namespace mediacache::factory
