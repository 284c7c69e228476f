#include "internal/download/chunk_downloader.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace mediacache::download {

using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

/*
  Accumulates body blocks and hands them to the store in large writes.
  Flush(true) is the durability point before a chunk is recorded.
*/
class WriteBehindBuffer {
 public:
  WriteBehindBuffer(storage::ChunkStore& store, const db::model::CacheEntryRecord& entry, uint64_t offset, std::size_t capacity)
      : store_(store), entry_(entry), offset_(offset), capacity_(capacity) {
    buffer_.reserve(capacity_);
  }

  void Append(const uint8_t* data, std::size_t size) {
    while (size > 0) {
      const std::size_t take = std::min(size, capacity_ - buffer_.size());
      buffer_.insert(buffer_.end(), data, data + take);
      data += take;
      size -= take;
      if (buffer_.size() == capacity_) Flush(false);
    }
  }

  void Flush(bool fsync) {
    store_.Write(entry_, offset_, buffer_.data(), buffer_.size(), fsync);
    offset_ += buffer_.size();
    buffer_.clear();
  }

  // Next file offset to be written, buffered bytes included.
  uint64_t Position() const {
    return offset_ + buffer_.size();
  }

 private:
  storage::ChunkStore&               store_;
  const db::model::CacheEntryRecord& entry_;
  uint64_t                           offset_;
  std::size_t                        capacity_;
  std::vector<uint8_t>               buffer_;
};

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

std::string_view ToString(DownloadError code) {
  switch (code) {
    case DownloadError::kNone:
      return "ok";
    case DownloadError::kNotFound:
      return "not_found";
    case DownloadError::kNetwork:
      return "network";
    case DownloadError::kOrigin:
      return "origin";
    case DownloadError::kStorage:
      return "storage";
    case DownloadError::kUnknownSize:
      return "unknown_size";
    case DownloadError::kCancelled:
      return "cancelled";
    case DownloadError::kInternal:
      return "internal";
  }
  return "internal";
}

ChunkDownloader::ChunkDownloader(std::shared_ptr<index::CacheIndex> index, std::shared_ptr<storage::ChunkStore> store,
                                 std::shared_ptr<origin::OriginClient> origin, std::shared_ptr<observability::CacheStats> stats,
                                 DownloaderOptions options)
    : index_(std::move(index)), store_(std::move(store)), origin_(std::move(origin)), stats_(std::move(stats)), options_(options) {
  if (options_.chunk_size == 0) throw std::invalid_argument("chunk size must be positive");
  if (options_.write_buffer_bytes == 0) options_.write_buffer_bytes = 1024 * 1024;
}

void ChunkDownloader::SetChunkRecordedCallback(ChunkRecordedFn callback) {
  on_recorded_ = std::move(callback);
}

void ChunkDownloader::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    stopping_ = true;
  }
  cv_.notify_all();
  origin_->Shutdown();
}

bool ChunkDownloader::Stopping() const {
  std::lock_guard lock(mutex_);
  return stopping_;
}

bool ChunkDownloader::IsSequential(uint64_t entry_id) const {
  std::lock_guard lock(mutex_);
  return sequential_entries_.contains(entry_id);
}

bool ChunkDownloader::SleepFor(std::chrono::milliseconds delay) {
  std::unique_lock lock(mutex_);
  return !cv_.wait_for(lock, delay, [this] { return stopping_; });
}

void ChunkDownloader::OnChunkRecorded(uint64_t entry_id, uint64_t chunk_index) {
  if (on_recorded_) on_recorded_(entry_id, chunk_index);
}

db::model::CacheEntryRecord ChunkDownloader::EnsureSize(uint64_t entry_id) {
  auto entry = index_->GetEntry(entry_id);
  if (entry.expected_total_size) return entry;

  std::lock_guard lock(size_mutex_);

  // another worker may have probed while we waited
  entry = index_->GetEntry(entry_id);
  if (entry.expected_total_size) return entry;

  // Accept-Ranges is optional; only a 200 to a ranged fetch selects sequential mode.
  std::optional<uint64_t> total;
  bool                    advertises_ranges = false;
  for (uint32_t attempt = 1;; ++attempt) {
    try {
      auto probe        = origin_->Probe(entry.original_url);
      total             = probe.total_size;
      advertises_ranges = probe.accepts_ranges;
      break;
    } catch (const util::NetworkError& e) {
      if (attempt >= options_.retry.max_attempts || Stopping()) throw;
      const auto delay = options_.retry.BackoffAfter(attempt);
      MEDIACACHE_LOG_WARN("Size probe failed, retrying",
                          {IntField("entry_id", static_cast<int64_t>(entry_id)), IntField("attempt", attempt),
                           IntField("backoff_ms", delay.count()), StringField("error", e.what())});
      if (!SleepFor(delay)) throw;
    }
  }

  if (!total || *total == 0) {
    throw util::InvalidState("origin did not report a size for entry " + std::to_string(entry_id));
  }

  index_->SetExpectedSize(entry_id, *total);
  entry.expected_total_size = *total;
  store_->OpenOrCreate(entry);

  MEDIACACHE_LOG_INFO("Resolved entry size", {IntField("entry_id", static_cast<int64_t>(entry_id)),
                                              IntField("total_size", static_cast<int64_t>(*total)),
                                              IntField("chunks", static_cast<int64_t>(chunk::ChunkCount(*total, options_.chunk_size))),
                                              BoolField("accept_ranges", advertises_ranges)});
  return entry;
}

DownloadResult ChunkDownloader::Download(uint64_t entry_id, uint64_t chunk_index) {
  const auto started = std::chrono::steady_clock::now();
  bool       counted = false;

  auto finish = [&](DownloadResult result) {
    if (counted) {
      if (result) {
        stats_->DownloadCompleted(result.bytes_fetched);
      } else {
        stats_->DownloadFailed();
      }
      observability::Metrics::Instance().ObserveDownloadDurationMs(ToString(result.code), ElapsedMs(started));
    }
    if (!result) {
      MEDIACACHE_LOG_WARN("Chunk download failed",
                          {IntField("entry_id", static_cast<int64_t>(entry_id)), IntField("chunk", static_cast<int64_t>(chunk_index)),
                           StringField("reason", ToString(result.code)), StringField("error", result.message)});
    }
    return result;
  };

  try {
    if (Stopping()) return finish(DownloadResult::Err(DownloadError::kCancelled, "downloader is shutting down"));

    auto entry  = EnsureSize(entry_id);
    auto bounds = chunk::BoundsFor(chunk_index, options_.chunk_size, *entry.expected_total_size);
    if (!bounds) {
      return finish(DownloadResult::Err(DownloadError::kNotFound, "chunk " + std::to_string(chunk_index) + " is past the end"));
    }

    if (index_->ChunkExists(entry_id, bounds->start, bounds->end)) return DownloadResult::Ok(0);

    stats_->DownloadStarted();
    counted = true;

    MEDIACACHE_LOG_DEBUG("Chunk download started",
                         {IntField("entry_id", static_cast<int64_t>(entry_id)), IntField("chunk", static_cast<int64_t>(chunk_index)),
                          IntField("start", static_cast<int64_t>(bounds->start)), IntField("end", static_cast<int64_t>(bounds->end))});

    if (IsSequential(entry_id)) return finish(DownloadSequential(entry, chunk_index, *bounds));

    for (uint32_t attempt = 1;; ++attempt) {
      try {
        const uint64_t bytes = FetchRange(entry, chunk_index, *bounds);
        MEDIACACHE_LOG_DEBUG("Chunk download finished", {IntField("entry_id", static_cast<int64_t>(entry_id)),
                                                         IntField("chunk", static_cast<int64_t>(chunk_index)),
                                                         IntField("bytes", static_cast<int64_t>(bytes)),
                                                         IntField("attempt", attempt)});
        return finish(DownloadResult::Ok(bytes));
      } catch (const util::RangeUnsupported& e) {
        {
          std::lock_guard lock(mutex_);
          sequential_entries_.insert(entry_id);
        }
        MEDIACACHE_LOG_INFO("Origin ignores ranges, switching entry to sequential download",
                            {IntField("entry_id", static_cast<int64_t>(entry_id)), StringField("url", entry.original_url)});
        return finish(DownloadSequential(entry, chunk_index, *bounds));
      } catch (const util::NetworkError& e) {
        if (Stopping()) return finish(DownloadResult::Err(DownloadError::kCancelled, e.what()));
        if (attempt >= options_.retry.max_attempts) throw;

        const auto delay = options_.retry.BackoffAfter(attempt);
        MEDIACACHE_LOG_WARN("Chunk download attempt failed, retrying",
                            {IntField("entry_id", static_cast<int64_t>(entry_id)), IntField("chunk", static_cast<int64_t>(chunk_index)),
                             IntField("attempt", attempt), IntField("backoff_ms", delay.count()), StringField("error", e.what())});
        if (!SleepFor(delay)) return finish(DownloadResult::Err(DownloadError::kCancelled, "shutdown during backoff"));
      }
    }
  } catch (const util::NotFound& e) {
    return finish(DownloadResult::Err(DownloadError::kNotFound, e.what()));
  } catch (const util::OriginError& e) {
    return finish(DownloadResult::Err(DownloadError::kOrigin, e.what()));
  } catch (const util::NetworkError& e) {
    if (Stopping()) return finish(DownloadResult::Err(DownloadError::kCancelled, e.what()));
    return finish(DownloadResult::Err(DownloadError::kNetwork, e.what()));
  } catch (const util::StorageError& e) {
    return finish(DownloadResult::Err(DownloadError::kStorage, e.what()));
  } catch (const util::InvalidState& e) {
    return finish(DownloadResult::Err(DownloadError::kUnknownSize, e.what()));
  } catch (const std::exception& e) {
    return finish(DownloadResult::Err(DownloadError::kInternal, e.what()));
  }
}

uint64_t ChunkDownloader::FetchRange(const db::model::CacheEntryRecord& entry, uint64_t chunk_index, const chunk::ChunkBounds& bounds) {
  origin::FetchRequest request;
  request.url   = entry.original_url;
  request.range = origin::ByteRange{bounds.start, bounds.end - 1};

  WriteBehindBuffer  writer(*store_, entry, bounds.start, options_.write_buffer_bytes);
  uint64_t           received    = 0;
  bool               whole_body  = false;
  std::exception_ptr failure;

  auto on_response = [&](const origin::OriginResponse& response) {
    if (response.status == 200) {
      whole_body = true;
      return false;
    }
    if (response.status != 206 || !response.content_range || response.content_range->first != bounds.start) {
      failure = std::make_exception_ptr(
          util::NetworkError("unexpected response to range request: HTTP " + std::to_string(response.status)));
      return false;
    }
    return true;
  };

  auto on_data = [&](const uint8_t* data, std::size_t size) {
    try {
      const uint64_t take = std::min<uint64_t>(size, bounds.Length() - received);
      writer.Append(data, static_cast<std::size_t>(take));
      received += take;
      return received < bounds.Length();
    } catch (...) {
      failure = std::current_exception();
      return false;
    }
  };

  origin_->Fetch(request, on_response, on_data);

  if (failure) std::rethrow_exception(failure);
  if (whole_body) throw util::RangeUnsupported("origin returned 200 for " + entry.original_url);
  if (received < bounds.Length()) {
    throw util::NetworkError("short body for chunk " + std::to_string(chunk_index) + ": " + std::to_string(received) + " of " +
                             std::to_string(bounds.Length()) + " bytes");
  }

  writer.Flush(true);
  index_->RecordChunk(entry.id, bounds.start, bounds.end);
  index_->RefreshCompleteness(entry.id);
  OnChunkRecorded(entry.id, chunk_index);
  return received;
}

DownloadResult ChunkDownloader::DownloadSequential(const db::model::CacheEntryRecord& entry, uint64_t chunk_index,
                                                   const chunk::ChunkBounds& bounds) {
  std::unique_lock lock(mutex_);
  while (sequential_running_.contains(entry.id)) {
    // a transfer for this entry is already running; it records our chunk too
    cv_.wait(lock, [&] { return stopping_ || !sequential_running_.contains(entry.id); });
    if (stopping_) return DownloadResult::Err(DownloadError::kCancelled, "downloader is shutting down");
  }
  sequential_running_.insert(entry.id);
  lock.unlock();

  std::exception_ptr failure;
  uint64_t           bytes = 0;

  for (uint32_t attempt = 1;; ++attempt) {
    try {
      if (index_->ChunkExists(entry.id, bounds.start, bounds.end)) break;
      bytes = RunSequentialTransfer(entry);
      break;
    } catch (const util::NetworkError& e) {
      if (Stopping() || attempt >= options_.retry.max_attempts) {
        failure = std::current_exception();
        break;
      }
      const auto delay = options_.retry.BackoffAfter(attempt);
      MEDIACACHE_LOG_WARN("Sequential transfer failed, retrying",
                          {IntField("entry_id", static_cast<int64_t>(entry.id)), IntField("attempt", attempt),
                           IntField("backoff_ms", delay.count()), StringField("error", e.what())});
      if (!SleepFor(delay)) {
        failure = std::current_exception();
        break;
      }
    } catch (const std::exception&) {
      failure = std::current_exception();
      break;
    }
  }

  lock.lock();
  sequential_running_.erase(entry.id);
  lock.unlock();
  cv_.notify_all();

  if (failure) std::rethrow_exception(failure);

  if (!index_->ChunkExists(entry.id, bounds.start, bounds.end)) {
    return DownloadResult::Err(DownloadError::kNetwork, "sequential transfer ended before chunk " + std::to_string(chunk_index));
  }
  return DownloadResult::Ok(bytes);
}

uint64_t ChunkDownloader::RunSequentialTransfer(const db::model::CacheEntryRecord& entry) {
  const uint64_t total      = *entry.expected_total_size;
  const uint64_t chunk_size = options_.chunk_size;

  origin::FetchRequest request;
  request.url                = entry.original_url;
  request.unbounded_duration = true;

  MEDIACACHE_LOG_INFO("Sequential transfer started",
                      {IntField("entry_id", static_cast<int64_t>(entry.id)), IntField("total_size", static_cast<int64_t>(total))});

  WriteBehindBuffer  writer(*store_, entry, 0, options_.write_buffer_bytes);
  std::exception_ptr failure;
  uint64_t           next_chunk = 0;

  auto on_response = [&](const origin::OriginResponse& response) {
    const bool from_start = response.status == 200 || (response.status == 206 && response.content_range &&
                                                        response.content_range->first == 0);
    if (!from_start) {
      failure = std::make_exception_ptr(
          util::NetworkError("unexpected response to full request: HTTP " + std::to_string(response.status)));
      return false;
    }
    return true;
  };

  auto on_data = [&](const uint8_t* data, std::size_t size) {
    try {
      while (size > 0 && writer.Position() < total) {
        const uint64_t boundary = std::min((next_chunk + 1) * chunk_size, total);
        const uint64_t take     = std::min<uint64_t>(size, boundary - writer.Position());
        writer.Append(data, static_cast<std::size_t>(take));
        data += take;
        size -= static_cast<std::size_t>(take);

        if (writer.Position() == boundary) {
          writer.Flush(true);
          index_->RecordChunk(entry.id, next_chunk * chunk_size, boundary);
          OnChunkRecorded(entry.id, next_chunk);
          ++next_chunk;
        }
      }
      return writer.Position() < total;
    } catch (...) {
      failure = std::current_exception();
      return false;
    }
  };

  origin_->Fetch(request, on_response, on_data);

  if (failure) std::rethrow_exception(failure);

  const uint64_t received = writer.Position();
  if (received < total) {
    throw util::NetworkError("sequential transfer stopped at " + std::to_string(received) + " of " + std::to_string(total) +
                             " bytes");
  }

  index_->RefreshCompleteness(entry.id);
  MEDIACACHE_LOG_INFO("Sequential transfer finished",
                      {IntField("entry_id", static_cast<int64_t>(entry.id)), IntField("bytes", static_cast<int64_t>(received))});
  return received;
}

} // namespace mediacache::download
