#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "api/mediacache/v1.hpp"

using namespace mediacache::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  mediacachectl <addr> register <source_id> <media_id> <quality> <url>\n"
            << "  mediacachectl <addr> status <entry_id>\n"
            << "  mediacachectl <addr> precache <entry_id> <start_byte> [end_byte]\n"
            << "  mediacachectl <addr> seek <entry_id> <position>\n"
            << "  mediacachectl <addr> retry <entry_id> <start_byte> [end_byte]\n"
            << "  mediacachectl <addr> stats\n";
}

static std::optional<uint64_t> ParseU64(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto  parsed   = std::stoull(value, &consumed);
    if (consumed != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

// Parses argv[i] as an unsigned integer or exits with a message.
static uint64_t ArgU64(char** argv, int i, const char* what) {
  auto parsed = ParseU64(argv[i]);
  if (!parsed) {
    std::cerr << "invalid " << what << ": " << argv[i] << "\n";
    std::exit(1);
  }
  return *parsed;
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << " (code " << static_cast<int>(status.error_code()) << ")\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = CacheAdminService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------
  if (cmd == "register") {
    if (argc < 7) {
      Usage();
      return 1;
    }

    RegisterMediaRequest req;
    req.mutable_key()->set_source_id(argv[3]);
    req.mutable_key()->set_media_id(argv[4]);
    req.mutable_key()->set_quality(argv[5]);
    req.set_url(argv[6]);

    RegisterMediaResponse resp;
    auto                  status = stub->RegisterMedia(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "entry_id=" << resp.entry().entry_id() << "\n"
              << "size=" << resp.entry().expected_total_size() << "\n"
              << "complete=" << (resp.entry().is_complete() ? "true" : "false") << "\n"
              << "stream_url=" << resp.stream_url() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "status") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetCacheStatusRequest req;
    req.set_entry_id(ArgU64(argv, 3, "entry_id"));

    GetCacheStatusResponse resp;
    auto                   status = stub->GetCacheStatus(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    const auto& s = resp.status();
    std::cout << "cached_chunks=" << s.cached_chunks() << "\n"
              << "total_chunks=" << s.total_chunks() << "\n"
              << "progress_percent=" << s.progress_percent() << "\n"
              << "complete=" << (s.is_complete() ? "true" : "false") << "\n"
              << "available=";
    for (int i = 0; i < resp.available_chunks_size(); ++i) {
      if (i > 0) std::cout << ",";
      std::cout << resp.available_chunks(i);
    }
    std::cout << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "precache") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    PrecacheRequest req;
    req.set_entry_id(ArgU64(argv, 3, "entry_id"));
    req.set_start_byte(ArgU64(argv, 4, "start_byte"));
    if (argc >= 6) req.set_end_byte(ArgU64(argv, 5, "end_byte"));

    PrecacheResponse resp;
    auto             status = stub->Precache(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "chunks_requested=" << resp.chunks_requested() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "seek") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    SeekRequest req;
    req.set_entry_id(ArgU64(argv, 3, "entry_id"));
    req.set_position(ArgU64(argv, 4, "position"));

    SeekResponse resp;
    auto         status = stub->Seek(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "position_chunk=" << resp.position_chunk() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "retry") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    RetryRangeRequest req;
    req.set_entry_id(ArgU64(argv, 3, "entry_id"));
    req.set_start_byte(ArgU64(argv, 4, "start_byte"));
    if (argc >= 6) req.set_end_byte(ArgU64(argv, 5, "end_byte"));

    RetryRangeResponse resp;
    auto               status = stub->RetryRange(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "chunks_requested=" << resp.chunks_requested() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;
    auto          status = stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "downloads_started=" << resp.downloads_started() << "\n"
              << "downloads_completed=" << resp.downloads_completed() << "\n"
              << "downloads_failed=" << resp.downloads_failed() << "\n"
              << "bytes_downloaded=" << resp.bytes_downloaded() << "\n"
              << "proxy_requests=" << resp.proxy_requests() << "\n"
              << "range_requests=" << resp.range_requests() << "\n"
              << "full_requests=" << resp.full_requests() << "\n"
              << "cache_hits=" << resp.cache_hits() << "\n"
              << "cache_misses=" << resp.cache_misses() << "\n"
              << "bytes_served=" << resp.bytes_served() << "\n"
              << "wait_timeouts=" << resp.wait_timeouts() << "\n"
              << "queue_depth=" << resp.queue_depth() << "\n"
              << "in_flight=" << resp.in_flight() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
