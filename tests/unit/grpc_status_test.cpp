#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "api/mediacache/v1.hpp"
#include "internal/chunk/chunk_manager.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/admin_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/proxy/stream_registry.hpp"
#include "internal/service/cache_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fake_origin.hpp"

namespace {

using namespace std::chrono_literals;
using mediacache::testing::FakeOrigin;

constexpr uint64_t kChunkSize   = 1024;
constexpr uint64_t kFileSize    = 4 * kChunkSize + 10;
constexpr uint64_t kTotalChunks = 5;

struct Harness {
  std::shared_ptr<FakeOrigin>                   origin;
  mediacache::service::ServiceContext           ctx;
  std::unique_ptr<mediacache::grpc::AdminServer> server;

  explicit Harness(const std::string& name) {
    const auto root = std::filesystem::temp_directory_path() /
                      ("mediacache_grpc_status_" + name + "_" + std::to_string(mediacache::util::NowMs()));

    origin      = std::make_shared<FakeOrigin>(kFileSize);
    ctx.index   = std::make_shared<mediacache::index::CacheIndex>(std::make_shared<mediacache::db::memory::MemoryRepository>(), root);
    ctx.store   = std::make_shared<mediacache::storage::ChunkStore>(root);
    ctx.stats   = std::make_shared<mediacache::observability::CacheStats>();
    ctx.streams = std::make_shared<mediacache::proxy::StreamRegistry>();

    mediacache::download::DownloaderOptions options;
    options.chunk_size            = kChunkSize;
    options.retry.initial_backoff = 1ms;
    ctx.downloader = std::make_shared<mediacache::download::ChunkDownloader>(ctx.index, ctx.store, origin, ctx.stats, options);

    // workers stay stopped so queued requests remain observable
    ctx.manager = std::make_shared<mediacache::chunk::ChunkManager>(ctx.index, ctx.downloader, mediacache::chunk::ChunkManagerOptions{});

    server = std::make_unique<mediacache::grpc::AdminServer>(std::make_shared<mediacache::service::CacheService>(ctx));
  }

  mediacache::v1::RegisterMediaResponse Register(const std::string& media_id, ::grpc::Status* status = nullptr) {
    mediacache::v1::RegisterMediaRequest req;
    req.mutable_key()->set_source_id("src");
    req.mutable_key()->set_media_id(media_id);
    req.mutable_key()->set_quality("1080p");
    req.set_url("http://origin/" + media_id);

    mediacache::v1::RegisterMediaResponse resp;
    ::grpc::ServerContext                 grpc_ctx;
    const auto                            result = server->RegisterMedia(&grpc_ctx, &req, &resp);
    if (status) *status = result;
    return resp;
  }
};

void TestRegisterMediaReturnsEntryAndStreamUrl() {
  Harness h("register");

  ::grpc::Status status;
  auto           resp = h.Register("movie", &status);
  assert(status.ok());
  assert(resp.entry().entry_id() != 0);
  assert(resp.entry().expected_total_size() == kFileSize);
  assert(resp.entry().key().quality() == "1080p");
  assert(!resp.entry().is_complete());
  assert(resp.stream_url().rfind("/stream/", 0) == 0);
  assert(std::filesystem::file_size(resp.entry().file_path()) == kFileSize);

  const auto stream_id = resp.stream_url().substr(std::string("/stream/").size());
  assert(h.ctx.streams->Resolve(stream_id) == resp.entry().entry_id());

  // registering again reuses the entry and the stream id
  auto again = h.Register("movie", &status);
  assert(status.ok());
  assert(again.entry().entry_id() == resp.entry().entry_id());
  assert(again.stream_url() == resp.stream_url());
  assert(h.origin->ProbeCount() == 1);
}

void TestRegisterMediaMissingFieldsReturnsInvalidArgument() {
  Harness h("register_invalid");

  mediacache::v1::RegisterMediaRequest req;
  req.mutable_key()->set_source_id("src");
  req.set_url("http://origin/x");
  mediacache::v1::RegisterMediaResponse resp;
  ::grpc::ServerContext                 grpc_ctx;

  const auto status = h.server->RegisterMedia(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestRegisterMediaWithoutOriginSizeReturnsFailedPrecondition() {
  Harness h("register_no_size");
  h.origin->HideSize();

  ::grpc::Status status;
  h.Register("movie", &status);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestUnknownEntryReturnsNotFound() {
  Harness h("unknown");

  mediacache::v1::GetCacheStatusRequest  req;
  mediacache::v1::GetCacheStatusResponse resp;
  req.set_entry_id(404);
  ::grpc::ServerContext grpc_ctx;
  assert(h.server->GetCacheStatus(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);

  mediacache::v1::SeekRequest  seek;
  mediacache::v1::SeekResponse seek_resp;
  seek.set_entry_id(404);
  ::grpc::ServerContext seek_ctx;
  assert(h.server->Seek(&seek_ctx, &seek, &seek_resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestPrecacheQueuesRangeAtMedium() {
  Harness h("precache");
  const auto entry_id = h.Register("movie").entry().entry_id();

  mediacache::v1::PrecacheRequest  req;
  mediacache::v1::PrecacheResponse resp;
  req.set_entry_id(entry_id);
  req.set_start_byte(kChunkSize + 1);
  ::grpc::ServerContext grpc_ctx;
  assert(h.server->Precache(&grpc_ctx, &req, &resp).ok());
  assert(resp.chunks_requested() == kTotalChunks - 1);

  // empty range
  req.set_start_byte(kFileSize);
  ::grpc::ServerContext empty_ctx;
  assert(h.server->Precache(&empty_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  mediacache::v1::StatsRequest  stats_req;
  mediacache::v1::StatsResponse stats;
  ::grpc::ServerContext         stats_ctx;
  assert(h.server->Stats(&stats_ctx, &stats_req, &stats).ok());
  assert(stats.queue_depth() == kTotalChunks - 1);
  assert(stats.in_flight() == 0);
}

void TestSeekReturnsPositionChunk() {
  Harness h("seek");
  const auto entry_id = h.Register("movie").entry().entry_id();

  mediacache::v1::SeekRequest  req;
  mediacache::v1::SeekResponse resp;
  req.set_entry_id(entry_id);
  req.set_position(2 * kChunkSize + 5);
  ::grpc::ServerContext grpc_ctx;
  assert(h.server->Seek(&grpc_ctx, &req, &resp).ok());
  assert(resp.position_chunk() == 2);

  req.set_position(kFileSize);
  ::grpc::ServerContext past_ctx;
  assert(h.server->Seek(&past_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestRetryRangeForgetsRecordedChunks() {
  Harness h("retry");
  const auto entry_id = h.Register("movie").entry().entry_id();

  h.ctx.index->RecordChunk(entry_id, 0, kChunkSize);
  h.ctx.index->RecordChunk(entry_id, kChunkSize, 2 * kChunkSize);

  mediacache::v1::RetryRangeRequest  req;
  mediacache::v1::RetryRangeResponse resp;
  req.set_entry_id(entry_id);
  req.set_start_byte(0);
  req.set_end_byte(kChunkSize);
  ::grpc::ServerContext grpc_ctx;
  assert(h.server->RetryRange(&grpc_ctx, &req, &resp).ok());
  assert(resp.chunks_requested() == 1);

  mediacache::v1::GetCacheStatusRequest  status_req;
  mediacache::v1::GetCacheStatusResponse status;
  status_req.set_entry_id(entry_id);
  ::grpc::ServerContext status_ctx;
  assert(h.server->GetCacheStatus(&status_ctx, &status_req, &status).ok());
  assert(status.status().cached_chunks() == 1);
  assert(status.status().total_chunks() == kTotalChunks);
  assert(status.available_chunks_size() == 1 && status.available_chunks(0) == 1);
}

void TestErrorMapping() {
  using mediacache::grpc::ToStatus;

  assert(ToStatus(std::invalid_argument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(mediacache::util::NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(mediacache::util::AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(mediacache::util::InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(mediacache::util::OriginError("x", 403)).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(mediacache::util::StorageError("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(ToStatus(mediacache::util::TimeoutError("x")).error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED);
  assert(ToStatus(mediacache::util::NetworkError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(std::runtime_error("x")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestRegisterMediaReturnsEntryAndStreamUrl();
  TestRegisterMediaMissingFieldsReturnsInvalidArgument();
  TestRegisterMediaWithoutOriginSizeReturnsFailedPrecondition();
  TestUnknownEntryReturnsNotFound();
  TestPrecacheQueuesRangeAtMedium();
  TestSeekReturnsPositionChunk();
  TestRetryRangeForgetsRecordedChunks();
  TestErrorMapping();

  std::cout << "mediacache_unit_grpc_status: pass\n";
  return 0;
}
