#include "internal/proxy/cache_proxy.hpp"

#include <sys/socket.h>
#include <unistd.h>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <algorithm>
#include <future>
#include <string_view>
#include <vector>

#include "internal/chunk/cancellation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/proxy/range_header.hpp"
#include "internal/util/errors.hpp"

namespace mediacache::proxy {

namespace beast = boost::beast;
namespace http  = boost::beast::http;
using tcp       = boost::asio::ip::tcp;

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

using Request = http::request<http::empty_body>;

struct Dependencies {
  index::CacheIndex&         index;
  storage::ChunkStore&       store;
  download::ChunkDownloader& downloader;
  chunk::ChunkManager&       manager;
  StreamRegistry&            streams;
  observability::CacheStats& stats;
  const ProxyOptions&        options;
  boost::asio::io_context&   io;
};

/*
  Waits for the peer to hang up on a duplicate of the session descriptor,
  registered with the proxy's io_context so all watched requests share the
  accept thread's reactor. A readable socket with no buffered bytes is a
  disconnect; buffered bytes are a pipelined request and end the watch.
*/
class DisconnectWatch : public std::enable_shared_from_this<DisconnectWatch> {
 public:
  DisconnectWatch(boost::asio::io_context& io, chunk::CancellationToken& token) : socket_(io), token_(token) {
  }

  bool Watch(tcp::socket& session) {
    beast::error_code ec;
    const auto        local = session.local_endpoint(ec);
    if (ec) return false;

    const int fd = ::dup(session.native_handle());
    if (fd < 0) return false;
    socket_.assign(local.protocol(), fd, ec);
    if (ec) {
      ::close(fd);
      return false;
    }
    socket_.non_blocking(true, ec);

    boost::asio::post(socket_.get_executor(), [self = shared_from_this()] { self->Arm(); });
    return true;
  }

  // The token must outlive this call; no cancellation happens after it.
  void Stop() {
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
    }
    boost::asio::post(socket_.get_executor(), [self = shared_from_this()] {
      beast::error_code ec;
      self->socket_.close(ec);
    });
  }

 private:
  void Arm() {
    if (!socket_.is_open()) return;
    socket_.async_wait(tcp::socket::wait_read,
                       [self = shared_from_this()](const beast::error_code& ec) { self->OnReadable(ec); });
  }

  void OnReadable(const beast::error_code& ec) {
    if (ec == boost::asio::error::operation_aborted) return;

    if (!ec) {
      char              byte = 0;
      beast::error_code peek_ec;
      const std::size_t n = socket_.receive(boost::asio::buffer(&byte, 1), tcp::socket::message_peek, peek_ec);
      if (!peek_ec && n > 0) return;
      if (peek_ec == boost::asio::error::would_block || peek_ec == boost::asio::error::try_again) {
        Arm();
        return;
      }
    }

    std::lock_guard lock(mutex_);
    if (!stopped_) token_.Cancel();
  }

  tcp::socket               socket_;
  chunk::CancellationToken& token_;
  std::mutex                mutex_;
  bool                      stopped_ = false;
};

// Scope of one request's disconnect watch.
class DisconnectWatcher {
 public:
  DisconnectWatcher(boost::asio::io_context& io, tcp::socket& session, chunk::CancellationToken& token)
      : watch_(std::make_shared<DisconnectWatch>(io, token)) {
    if (!watch_->Watch(session)) {
      MEDIACACHE_LOG_WARN("Disconnect watch unavailable", {IntField("fd", session.native_handle())});
    }
  }

  ~DisconnectWatcher() {
    watch_->Stop();
  }

  DisconnectWatcher(const DisconnectWatcher&)            = delete;
  DisconnectWatcher& operator=(const DisconnectWatcher&) = delete;

 private:
  std::shared_ptr<DisconnectWatch> watch_;
};

struct Outcome {
  http::status status     = http::status::ok;
  bool         keep_alive = true;
};

// Resolved route of a request.
struct Target {
  std::string_view        route; // "cache" or "stream"
  std::optional<uint64_t> entry_id;
};

std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> parts;
  while (!path.empty()) {
    const auto slash = path.find('/');
    auto       part  = path.substr(0, slash);
    if (!part.empty()) parts.push_back(part);
    if (slash == std::string_view::npos) break;
    path.remove_prefix(slash + 1);
  }
  return parts;
}

Target ResolveTarget(Dependencies& deps, std::string_view target) {
  const auto query = target.find('?');
  if (query != std::string_view::npos) target = target.substr(0, query);

  const auto parts = SplitPath(target);
  if (parts.size() == 4 && parts[0] == "cache") {
    model::CacheKey key{std::string(parts[1]), std::string(parts[2]), std::string(parts[3])};
    auto            entry = deps.index.FindEntry(key);
    return {"cache", entry ? std::optional<uint64_t>(entry->id) : std::nullopt};
  }
  if (parts.size() == 2 && parts[0] == "stream") {
    return {"stream", deps.streams.Resolve(std::string(parts[1]))};
  }
  return {"unknown", std::nullopt};
}

template <typename Body>
void SetCommonHeaders(http::response<Body>& res, const ProxyOptions& options) {
  res.set(http::field::server, "mediacache");
  res.set(http::field::accept_ranges, "bytes");
  res.set(http::field::content_type, options.content_type);
}

bool WriteSimple(tcp::socket& socket, const Request& req, http::status status, std::string_view body,
                 std::optional<uint32_t> retry_after = std::nullopt) {
  http::response<http::string_body> res{status, req.version()};
  res.set(http::field::server, "mediacache");
  res.set(http::field::content_type, "text/plain");
  if (retry_after) res.set(http::field::retry_after, std::to_string(*retry_after));
  res.keep_alive(req.keep_alive());
  if (req.method() != http::verb::head) res.body() = std::string(body);
  res.prepare_payload();

  beast::error_code ec;
  http::write(socket, res, ec);
  return !ec && req.keep_alive();
}

Outcome ServeHead(tcp::socket& socket, const Request& req, const ProxyOptions& options, uint64_t total) {
  http::response<http::empty_body> res{http::status::ok, req.version()};
  SetCommonHeaders(res, options);
  res.set(http::field::content_length, std::to_string(total));
  res.keep_alive(req.keep_alive());

  beast::error_code ec;
  http::write(socket, res, ec);
  return {http::status::ok, !ec && req.keep_alive()};
}

Outcome ServeUnavailable(Dependencies& deps, tcp::socket& socket, const Request& req, uint64_t entry_id, const ByteSpan& span) {
  deps.stats.WaitTimeout();
  MEDIACACHE_LOG_WARN("Chunk wait timed out", {IntField("entry_id", static_cast<int64_t>(entry_id)),
                                               IntField("first", static_cast<int64_t>(span.first)),
                                               IntField("last", static_cast<int64_t>(span.last)),
                                               IntField("timeout_ms", deps.options.chunk_wait_timeout.count())});
  const bool keep = WriteSimple(socket, req, http::status::service_unavailable, "chunk not available yet\n",
                                deps.options.retry_after_seconds);
  return {http::status::service_unavailable, keep};
}

// Waits for the whole span, then answers from one buffer.
Outcome ServeBuffered(Dependencies& deps, tcp::socket& socket, const Request& req, const db::model::CacheEntryRecord& entry,
                      uint64_t total, const ByteSpan& span, chunk::CancellationToken& cancel) {
  deps.manager.RequestRange(entry.id, span.first, span.last + 1, chunk::Priority::kCritical);

  switch (deps.manager.WaitForRange(entry.id, span.first, span.last + 1, deps.options.chunk_wait_timeout, &cancel)) {
    case chunk::WaitStatus::kReady:
      break;
    case chunk::WaitStatus::kTimedOut:
      return ServeUnavailable(deps, socket, req, entry.id, span);
    case chunk::WaitStatus::kCancelled:
      return {http::status::service_unavailable, false};
  }

  auto buffer = deps.store.Read(entry, span.first, span.Length());

  http::response<http::string_body> res{http::status::partial_content, req.version()};
  SetCommonHeaders(res, deps.options);
  res.set(http::field::content_range, ContentRangeValue(span, total));
  res.keep_alive(req.keep_alive());
  res.body().assign(reinterpret_cast<const char*>(buffer->data()), static_cast<std::size_t>(buffer->size()));
  res.prepare_payload();

  beast::error_code ec;
  http::write(socket, res, ec);
  if (ec) return {http::status::partial_content, false};

  deps.stats.BytesServed(span.Length());
  return {http::status::partial_content, req.keep_alive()};
}

// Forwards chunk by chunk, awaiting each missing one at CRITICAL.
Outcome ServeStreamed(Dependencies& deps, tcp::socket& socket, const Request& req, const db::model::CacheEntryRecord& entry,
                      uint64_t total, const ByteSpan& span, chunk::CancellationToken& cancel) {
  const uint64_t chunk_size = deps.manager.ChunkSize();
  const uint64_t end        = span.last + 1;

  auto await_chunk = [&](uint64_t idx) {
    if (deps.manager.HasChunk(entry.id, idx)) return chunk::WaitStatus::kReady;
    deps.manager.RequestChunk(entry.id, idx, chunk::Priority::kCritical);
    return deps.manager.WaitForChunk(entry.id, idx, deps.options.chunk_wait_timeout, &cancel);
  };

  const auto first_chunk = chunk::ChunkIndexFor(span.first, chunk_size);
  const auto last_chunk  = chunk::ChunkIndexFor(span.last, chunk_size);

  // The status line can still change until the first chunk is ready.
  switch (await_chunk(first_chunk)) {
    case chunk::WaitStatus::kReady:
      break;
    case chunk::WaitStatus::kTimedOut:
      return ServeUnavailable(deps, socket, req, entry.id, span);
    case chunk::WaitStatus::kCancelled:
      return {http::status::service_unavailable, false};
  }

  http::response<http::buffer_body> res{http::status::partial_content, req.version()};
  SetCommonHeaders(res, deps.options);
  res.set(http::field::content_range, ContentRangeValue(span, total));
  res.content_length(span.Length());
  res.keep_alive(req.keep_alive());
  res.body().data = nullptr;
  res.body().more = true;

  http::response_serializer<http::buffer_body> serializer{res};
  beast::error_code                            ec;
  http::write_header(socket, serializer, ec);
  if (ec) return {http::status::partial_content, false};

  // Past this point a failure can only drop the connection.
  uint64_t sent = 0;
  try {
    for (uint64_t idx = first_chunk; idx <= last_chunk; ++idx) {
      if (idx != first_chunk) {
        const auto status = await_chunk(idx);
        if (status != chunk::WaitStatus::kReady) {
          if (status == chunk::WaitStatus::kTimedOut) deps.stats.WaitTimeout();
          MEDIACACHE_LOG_WARN("Stream aborted mid-body", {IntField("entry_id", static_cast<int64_t>(entry.id)),
                                                          IntField("chunk", static_cast<int64_t>(idx)),
                                                          IntField("sent", static_cast<int64_t>(sent)),
                                                          BoolField("cancelled", status == chunk::WaitStatus::kCancelled)});
          deps.stats.BytesServed(sent);
          return {http::status::partial_content, false};
        }
      }

      const uint64_t piece_start = std::max(span.first, idx * chunk_size);
      const uint64_t piece_end   = std::min(end, (idx + 1) * chunk_size);
      auto           buffer      = deps.store.Read(entry, piece_start, piece_end - piece_start);

      res.body().data = const_cast<uint8_t*>(buffer->data());
      res.body().size = static_cast<std::size_t>(buffer->size());
      res.body().more = true;
      http::write(socket, serializer, ec);
      if (ec == http::error::need_buffer) ec = {};
      if (ec) {
        deps.stats.BytesServed(sent);
        return {http::status::partial_content, false};
      }
      sent += piece_end - piece_start;
    }
  } catch (const std::exception& e) {
    MEDIACACHE_LOG_ERROR("Stream failed mid-body", {IntField("entry_id", static_cast<int64_t>(entry.id)),
                                                    IntField("sent", static_cast<int64_t>(sent)), StringField("error", e.what())});
    deps.stats.BytesServed(sent);
    return {http::status::partial_content, false};
  }

  res.body().data = nullptr;
  res.body().size = 0;
  res.body().more = false;
  http::write(socket, serializer, ec);

  deps.stats.BytesServed(sent);
  return {http::status::partial_content, !ec && req.keep_alive()};
}

Outcome Serve(Dependencies& deps, tcp::socket& socket, const Request& req, std::string_view& route) {
  if (req.method() != http::verb::get && req.method() != http::verb::head) {
    return {http::status::method_not_allowed,
            WriteSimple(socket, req, http::status::method_not_allowed, "only GET and HEAD are supported\n")};
  }

  const auto target = ResolveTarget(deps, std::string_view(req.target().data(), req.target().size()));
  route             = target.route;
  if (!target.entry_id) {
    return {http::status::not_found, WriteSimple(socket, req, http::status::not_found, "unknown media\n")};
  }

  const auto     entry = deps.downloader.EnsureSize(*target.entry_id);
  const uint64_t total = *entry.expected_total_size;

  if (req.method() == http::verb::head) return ServeHead(socket, req, deps.options, total);

  std::optional<std::string_view> range_header;
  if (auto it = req.find(http::field::range); it != req.end()) {
    range_header = std::string_view(it->value().data(), it->value().size());
  }
  const ByteSpan span   = ResolveRange(range_header, total);
  const bool     ranged = range_header && ParseRangeHeader(*range_header, total).has_value();
  deps.stats.ProxyRequest(ranged);
  deps.index.Touch(entry.id);

  deps.manager.Reprioritize(entry.id, span.first);

  const bool hit = deps.manager.HasByteRange(entry.id, span.first, span.last + 1);
  deps.stats.CacheLookup(hit);

  MEDIACACHE_LOG_DEBUG("Proxy request", {IntField("entry_id", static_cast<int64_t>(entry.id)),
                                         IntField("first", static_cast<int64_t>(span.first)),
                                         IntField("last", static_cast<int64_t>(span.last)), BoolField("ranged", ranged),
                                         BoolField("hit", hit)});

  chunk::CancellationToken cancel;
  DisconnectWatcher        watcher(deps.io, socket, cancel);

  if (span.Length() < deps.options.direct_read_threshold_bytes) {
    return ServeBuffered(deps, socket, req, entry, total, span, cancel);
  }
  return ServeStreamed(deps, socket, req, entry, total, span, cancel);
}

Outcome HandleRequest(Dependencies& deps, tcp::socket& socket, const Request& req) {
  const auto       started = std::chrono::steady_clock::now();
  std::string_view route   = "unknown";
  Outcome          outcome;

  try {
    outcome = Serve(deps, socket, req, route);
  } catch (const util::NotFound& e) {
    outcome = {http::status::not_found, WriteSimple(socket, req, http::status::not_found, std::string(e.what()) + "\n")};
  } catch (const std::exception& e) {
    MEDIACACHE_LOG_ERROR("Proxy request failed", {StringField("target", std::string_view(req.target().data(), req.target().size())),
                                                  StringField("error", e.what())});
    outcome = {http::status::internal_server_error,
               WriteSimple(socket, req, http::status::internal_server_error, "internal error\n")};
  }

  const double latency_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
  auto&        metrics    = observability::Metrics::Instance();
  metrics.RecordProxyRequest(route, static_cast<int>(outcome.status));
  metrics.ObserveProxyLatencyMs(route, latency_ms);
  return outcome;
}

} // namespace

CacheProxy::CacheProxy(std::shared_ptr<index::CacheIndex> index, std::shared_ptr<storage::ChunkStore> store,
                       std::shared_ptr<download::ChunkDownloader> downloader, std::shared_ptr<chunk::ChunkManager> manager,
                       std::shared_ptr<StreamRegistry> streams, std::shared_ptr<observability::CacheStats> stats, ProxyOptions options)
    : index_(std::move(index)),
      store_(std::move(store)),
      downloader_(std::move(downloader)),
      manager_(std::move(manager)),
      streams_(std::move(streams)),
      stats_(std::move(stats)),
      options_(std::move(options)),
      acceptor_(io_) {
}

CacheProxy::~CacheProxy() {
  Stop();
}

std::string CacheProxy::StreamUrl(const std::string& stream_id) const {
  return "http://" + options_.advertise_host + ":" + std::to_string(Port()) + "/stream/" + stream_id;
}

void CacheProxy::Start() {
  if (running_.exchange(true)) return;

  const tcp::endpoint endpoint{boost::asio::ip::make_address(options_.bind_address), options_.port};
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen(boost::asio::socket_base::max_listen_connections);
  port_ = acceptor_.local_endpoint().port();

  work_.emplace(io_.get_executor());
  DoAccept();
  accept_thread_ = std::thread([this] { io_.run(); });

  MEDIACACHE_LOG_INFO("Cache proxy listening", {StringField("address", options_.bind_address), IntField("port", port_.load())});
}

void CacheProxy::DoAccept() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        MEDIACACHE_LOG_WARN("Accept failed", {StringField("error", ec.message())});
      }
      if (!acceptor_.is_open()) return;
    } else {
      ReapFinishedSessions();

      std::lock_guard lock(sessions_mutex_);
      const uint64_t  id = next_session_id_++;
      auto&           session = sessions_[id];
      session.fd              = socket.native_handle();
      session.thread          = std::thread(&CacheProxy::RunSession, this, id, std::move(socket));
    }
    DoAccept();
  });
}

void CacheProxy::RunSession(uint64_t session_id, tcp::socket socket) {
  Dependencies deps{*index_, *store_, *downloader_, *manager_, *streams_, *stats_, options_, io_};

  beast::flat_buffer buffer;
  beast::error_code  ec;
  for (;;) {
    Request req;
    http::read(socket, buffer, req, ec);
    if (ec) break;

    const auto outcome = HandleRequest(deps, socket, req);
    if (!outcome.keep_alive) break;
  }

  socket.shutdown(tcp::socket::shutdown_send, ec);

  std::lock_guard lock(sessions_mutex_);
  auto            it = sessions_.find(session_id);
  if (it != sessions_.end()) {
    it->second.finished = true;
    it->second.fd       = -1;
  }
}

void CacheProxy::ReapFinishedSessions() {
  std::vector<std::thread> done;
  {
    std::lock_guard lock(sessions_mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      if (it->second.finished) {
        done.push_back(std::move(it->second.thread));
        it = sessions_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& t : done) {
    if (t.joinable()) t.join();
  }
}

void CacheProxy::Stop() {
  if (!running_.exchange(false)) return;

  std::promise<void> closed;
  boost::asio::post(io_, [this, &closed] {
    boost::system::error_code ec;
    acceptor_.close(ec);
    closed.set_value();
  });
  closed.get_future().wait();

  // Hanging up on every client wakes blocked reads; the reactor keeps
  // running so disconnect watches cancel pending waits.
  std::vector<std::thread> threads;
  {
    std::lock_guard lock(sessions_mutex_);
    for (auto& [id, session] : sessions_) {
      if (session.fd >= 0) ::shutdown(session.fd, SHUT_RDWR);
      threads.push_back(std::move(session.thread));
    }
    sessions_.clear();
  }
  for (auto& t : threads) {
    if (t.joinable()) t.join();
  }

  work_.reset();
  io_.stop();
  if (accept_thread_.joinable()) accept_thread_.join();

  MEDIACACHE_LOG_INFO("Cache proxy stopped");
}

} // namespace mediacache::proxy
