#pragma once

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "internal/chunk/chunk_manager.hpp"
#include "internal/download/chunk_downloader.hpp"
#include "internal/index/cache_index.hpp"
#include "internal/observability/cache_stats.hpp"
#include "internal/proxy/stream_registry.hpp"
#include "internal/storage/chunk_store.hpp"

namespace mediacache::proxy {

struct ProxyOptions {
  std::string bind_address{"127.0.0.1"};
  uint16_t    port = 8787; // 0 picks an ephemeral port
  std::string advertise_host{"127.0.0.1"};
  std::string content_type{"video/mp4"};

  // Spans at or above this size are streamed chunk by chunk.
  uint64_t                  direct_read_threshold_bytes = 50ull * 1024 * 1024;
  std::chrono::milliseconds chunk_wait_timeout{30000};
  uint32_t                  retry_after_seconds = 5;
};

/*
  CacheProxy

  HTTP/1.1 front of the cache. Every GET is answered with 206 and an
  exact Content-Range, ranged or not. Missing chunks are requested at
  CRITICAL and awaited; a wait past chunk_wait_timeout fails only this
  request with 503 + Retry-After.

  One thread per connection. The io_context thread accepts connections
  and watches sockets of requests in progress; a client that hangs up
  cancels its own waits, downloads already dispatched keep running.

  Routes:
      GET|HEAD /cache/{source_id}/{media_id}/{quality}
      GET|HEAD /stream/{stream_id}
*/
class CacheProxy {
 public:
  CacheProxy(std::shared_ptr<index::CacheIndex> index, std::shared_ptr<storage::ChunkStore> store,
             std::shared_ptr<download::ChunkDownloader> downloader, std::shared_ptr<chunk::ChunkManager> manager,
             std::shared_ptr<StreamRegistry> streams, std::shared_ptr<observability::CacheStats> stats, ProxyOptions options);
  ~CacheProxy();

  CacheProxy(const CacheProxy&)            = delete;
  CacheProxy& operator=(const CacheProxy&) = delete;

  void Start();
  void Stop();

  // Bound port, valid after Start().
  uint16_t Port() const {
    return port_.load();
  }

  std::string StreamUrl(const std::string& stream_id) const;

 private:
  struct Session {
    std::thread thread;
    int         fd       = -1;
    bool        finished = false;
  };

  void DoAccept();
  void RunSession(uint64_t session_id, boost::asio::ip::tcp::socket socket);
  void ReapFinishedSessions();

  std::shared_ptr<index::CacheIndex>         index_;
  std::shared_ptr<storage::ChunkStore>       store_;
  std::shared_ptr<download::ChunkDownloader> downloader_;
  std::shared_ptr<chunk::ChunkManager>       manager_;
  std::shared_ptr<StreamRegistry>            streams_;
  std::shared_ptr<observability::CacheStats> stats_;
  ProxyOptions                               options_;

  boost::asio::io_context        io_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread                    accept_thread_;
  std::atomic<uint16_t>          port_{0};
  std::atomic<bool>              running_{false};

  std::mutex                  sessions_mutex_;
  std::map<uint64_t, Session> sessions_;
  uint64_t                    next_session_id_ = 1;
};

} // namespace mediacache::proxy
