#pragma once

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <unordered_set>

#include "internal/chunk/chunk_math.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/download/download_result.hpp"
#include "internal/download/retry_policy.hpp"
#include "internal/index/cache_index.hpp"
#include "internal/observability/cache_stats.hpp"
#include "internal/origin/origin_client.hpp"
#include "internal/storage/chunk_store.hpp"

namespace mediacache::download {

struct DownloaderOptions {
  uint64_t    chunk_size = chunk::kDefaultChunkSize;
  RetryPolicy retry;
  std::size_t write_buffer_bytes = 1024 * 1024;
};

/*
  ChunkDownloader

  Fetches one chunk's byte range from the origin, writes it through the
  ChunkStore and records it in the CacheIndex. The index write happens
  only after the data is fsync'd.

  When the origin answers a ranged request with 200 the entry switches to
  sequential mode: one whole-file transfer records chunks as their
  boundaries are crossed, and concurrent downloads for that entry wait
  for it.
*/
class ChunkDownloader {
 public:
  // Invoked after every chunk record, including those recorded as a side
  // effect of a sequential transfer.
  using ChunkRecordedFn = std::function<void(uint64_t entry_id, uint64_t chunk_index)>;

  ChunkDownloader(std::shared_ptr<index::CacheIndex> index, std::shared_ptr<storage::ChunkStore> store,
                  std::shared_ptr<origin::OriginClient> origin, std::shared_ptr<observability::CacheStats> stats,
                  DownloaderOptions options);

  void SetChunkRecordedCallback(ChunkRecordedFn callback);

  DownloadResult Download(uint64_t entry_id, uint64_t chunk_index);

  // Returns the entry with its total size resolved, probing the origin and
  // allocating storage when the size was unknown.
  db::model::CacheEntryRecord EnsureSize(uint64_t entry_id);

  bool IsSequential(uint64_t entry_id) const;

  // Interrupts backoff sleeps and running transfers.
  void Shutdown();

  uint64_t ChunkSize() const {
    return options_.chunk_size;
  }

 private:
  uint64_t FetchRange(const db::model::CacheEntryRecord& entry, uint64_t chunk_index, const chunk::ChunkBounds& bounds);

  DownloadResult DownloadSequential(const db::model::CacheEntryRecord& entry, uint64_t chunk_index,
                                    const chunk::ChunkBounds& bounds);
  uint64_t       RunSequentialTransfer(const db::model::CacheEntryRecord& entry);

  void OnChunkRecorded(uint64_t entry_id, uint64_t chunk_index);

  // false when interrupted by Shutdown()
  bool SleepFor(std::chrono::milliseconds delay);
  bool Stopping() const;

  std::shared_ptr<index::CacheIndex>         index_;
  std::shared_ptr<storage::ChunkStore>       store_;
  std::shared_ptr<origin::OriginClient>      origin_;
  std::shared_ptr<observability::CacheStats> stats_;
  DownloaderOptions                          options_;

  ChunkRecordedFn on_recorded_;

  mutable std::mutex           mutex_;
  std::condition_variable      cv_;
  bool                         stopping_ = false;
  std::unordered_set<uint64_t> sequential_entries_;
  std::unordered_set<uint64_t> sequential_running_;

  std::mutex size_mutex_;
};

} // namespace mediacache::download
