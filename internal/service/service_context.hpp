#pragma once

#include <memory>

namespace mediacache::index {
class CacheIndex;
}
namespace mediacache::storage {
class ChunkStore;
}
namespace mediacache::download {
class ChunkDownloader;
}
namespace mediacache::chunk {
class ChunkManager;
}
namespace mediacache::proxy {
class CacheProxy;
class StreamRegistry;
} // namespace mediacache::proxy
namespace mediacache::observability {
class CacheStats;
}

namespace mediacache::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<mediacache::index::CacheIndex>         index;
  std::shared_ptr<mediacache::storage::ChunkStore>       store;
  std::shared_ptr<mediacache::download::ChunkDownloader> downloader;
  std::shared_ptr<mediacache::chunk::ChunkManager>       manager;
  std::shared_ptr<mediacache::proxy::StreamRegistry>     streams;
  std::shared_ptr<mediacache::proxy::CacheProxy>         proxy; // may be null; stream URLs are then relative
  std::shared_ptr<mediacache::observability::CacheStats> stats;

  bool enable_background_fill = false;
};

} // namespace mediacache::service
