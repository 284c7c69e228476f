#include "internal/service/cache_service.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/chunk/chunk_manager.hpp"
#include "internal/download/chunk_downloader.hpp"
#include "internal/index/cache_index.hpp"
#include "internal/observability/cache_stats.hpp"
#include "internal/observability/logging.hpp"
#include "internal/proxy/cache_proxy.hpp"
#include "internal/proxy/stream_registry.hpp"
#include "internal/storage/chunk_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mediacache::service {

using namespace mediacache::v1;
using observability::IntField;
using observability::StringField;

namespace {

void ToProto(const db::model::CacheEntryRecord& record, CacheEntry* out) {
  out->set_entry_id(record.id);
  out->mutable_key()->set_source_id(record.key.source_id);
  out->mutable_key()->set_media_id(record.key.media_id);
  out->mutable_key()->set_quality(record.key.quality);
  out->set_original_url(record.original_url);
  out->set_file_path(record.file_path);
  out->set_expected_total_size(record.expected_total_size.value_or(0));
  out->set_is_complete(record.is_complete);
  *out->mutable_created_at()    = util::MillisToProto(record.created_at_ms);
  *out->mutable_last_accessed() = util::MillisToProto(record.last_accessed_ms);
}

// Resolves an exclusive end where 0 means "to the end of the resource".
uint64_t ResolveEnd(uint64_t end, uint64_t total) {
  return end == 0 ? total : std::min(end, total);
}

} // namespace

CacheService::CacheService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterMediaResponse CacheService::RegisterMedia(const RegisterMediaRequest& req) {
  if (req.key().source_id().empty() || req.key().media_id().empty() || req.key().quality().empty()) {
    throw std::invalid_argument("source_id, media_id and quality are required");
  }
  if (req.url().empty()) throw std::invalid_argument("url is required");

  const model::CacheKey key{req.key().source_id(), req.key().media_id(), req.key().quality()};

  auto entry = ctx_.index->GetOrCreateEntry(key, req.url());
  entry      = ctx_.downloader->EnsureSize(entry.id);
  ctx_.store->OpenOrCreate(entry);

  const std::string stream_id = ctx_.streams->Register(entry.id);

  if (ctx_.enable_background_fill && !entry.is_complete) {
    ctx_.manager->RequestBackgroundFill(entry.id);
  }

  RegisterMediaResponse resp;
  ToProto(entry, resp.mutable_entry());
  resp.set_stream_url(ctx_.proxy ? ctx_.proxy->StreamUrl(stream_id) : "/stream/" + stream_id);

  MEDIACACHE_LOG_INFO("Media registered", {IntField("entry_id", static_cast<int64_t>(entry.id)), StringField("key", key.ToString()),
                                           IntField("total_size", static_cast<int64_t>(entry.expected_total_size.value_or(0))),
                                           StringField("stream_id", stream_id)});
  return resp;
}

GetCacheStatusResponse CacheService::GetCacheStatus(const GetCacheStatusRequest& req) {
  const auto status = ctx_.manager->GetCacheStatus(req.entry_id());

  GetCacheStatusResponse resp;
  auto*                  out = resp.mutable_status();
  out->set_entry_id(status.entry_id);
  out->set_cached_chunks(status.cached_chunks);
  out->set_total_chunks(status.total_chunks);
  out->set_progress_percent(status.progress_percent);
  out->set_is_complete(status.is_complete);

  for (uint64_t idx : ctx_.manager->AvailableChunks(req.entry_id())) resp.add_available_chunks(idx);
  return resp;
}

PrecacheResponse CacheService::Precache(const PrecacheRequest& req) {
  const auto     entry = ctx_.downloader->EnsureSize(req.entry_id());
  const uint64_t end   = ResolveEnd(req.end_byte(), *entry.expected_total_size);
  if (req.start_byte() >= end) throw std::invalid_argument("empty precache range");

  PrecacheResponse resp;
  resp.set_chunks_requested(ctx_.manager->RequestRange(entry.id, req.start_byte(), end, chunk::Priority::kMedium));
  return resp;
}

SeekResponse CacheService::Seek(const SeekRequest& req) {
  SeekResponse resp;
  resp.set_position_chunk(ctx_.manager->Reprioritize(req.entry_id(), req.position()));
  return resp;
}

RetryRangeResponse CacheService::RetryRange(const RetryRangeRequest& req) {
  const auto     entry = ctx_.downloader->EnsureSize(req.entry_id());
  const uint64_t end   = ResolveEnd(req.end_byte(), *entry.expected_total_size);
  if (req.start_byte() >= end) throw std::invalid_argument("empty retry range");

  ctx_.index->ClearChunks(entry.id, req.start_byte(), end);

  RetryRangeResponse resp;
  resp.set_chunks_requested(ctx_.manager->RequestRange(entry.id, req.start_byte(), end, chunk::Priority::kHigh));

  MEDIACACHE_LOG_INFO("Range retry requested", {IntField("entry_id", static_cast<int64_t>(entry.id)),
                                                IntField("start", static_cast<int64_t>(req.start_byte())),
                                                IntField("end", static_cast<int64_t>(end)),
                                                IntField("chunks", static_cast<int64_t>(resp.chunks_requested()))});
  return resp;
}

StatsResponse CacheService::Stats(const StatsRequest&) {
  auto snapshot        = ctx_.stats->Snapshot();
  snapshot.queue_depth = ctx_.manager->QueueDepth();
  snapshot.in_flight   = ctx_.manager->InFlight();

  StatsResponse resp;
  resp.set_downloads_started(snapshot.downloads_started);
  resp.set_downloads_completed(snapshot.downloads_completed);
  resp.set_downloads_failed(snapshot.downloads_failed);
  resp.set_bytes_downloaded(snapshot.bytes_downloaded);
  resp.set_proxy_requests(snapshot.proxy_requests);
  resp.set_range_requests(snapshot.range_requests);
  resp.set_full_requests(snapshot.full_requests);
  resp.set_cache_hits(snapshot.cache_hits);
  resp.set_cache_misses(snapshot.cache_misses);
  resp.set_bytes_served(snapshot.bytes_served);
  resp.set_wait_timeouts(snapshot.wait_timeouts);
  resp.set_queue_depth(snapshot.queue_depth);
  resp.set_in_flight(snapshot.in_flight);
  return resp;
}

} // namespace mediacache::service
