#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "internal/chunk/cancellation.hpp"
#include "internal/chunk/chunk_math.hpp"
#include "internal/chunk/priority.hpp"
#include "internal/chunk/request_queue.hpp"
#include "internal/download/chunk_downloader.hpp"
#include "internal/index/cache_index.hpp"

namespace mediacache::chunk {

struct ChunkManagerOptions {
  uint32_t max_concurrent_downloads = 3;
  uint32_t lookahead_chunks         = 10;
};

struct CacheStatus {
  uint64_t entry_id         = 0;
  uint64_t cached_chunks    = 0;
  uint64_t total_chunks     = 0; // 0 while the size is unknown
  double   progress_percent = 0.0;
  bool     is_complete      = false;
};

enum class WaitStatus {
  kReady,
  kTimedOut,
  kCancelled,
};

/*
  ChunkManager

  Owns the request queue, the in-flight set and the waiter signals under
  one mutex. A fixed pool of worker threads pulls the most urgent
  pending request, so at most max_concurrent_downloads transfers run at
  once across all entries.

  Request lifecycle:
      pending -> downloading -> removed (completed or failed)

  Queued requests may be re-prioritized freely; in-flight downloads are
  never preempted.

  Waiters are woken only after the downloader has durably recorded a
  chunk, or when a download fails. A woken waiter re-checks the index and
  keeps waiting until its deadline unless the chunk is present.
*/
class ChunkManager {
 public:
  ChunkManager(std::shared_ptr<index::CacheIndex> index, std::shared_ptr<download::ChunkDownloader> downloader,
               ChunkManagerOptions options);
  ~ChunkManager();

  ChunkManager(const ChunkManager&)            = delete;
  ChunkManager& operator=(const ChunkManager&) = delete;

  void Start();
  void Stop();

  uint64_t ChunkSize() const {
    return chunk_size_;
  }

  // Throws util::NotFound for an unknown entry. False when the size is unknown.
  bool HasChunk(uint64_t entry_id, uint64_t chunk_index);

  // True iff every chunk overlapping [start, end) is recorded.
  bool HasByteRange(uint64_t entry_id, uint64_t start, uint64_t end);

  // No-op for recorded or in-flight chunks. Only raises priority.
  // Returns true when the queue changed.
  bool RequestChunk(uint64_t entry_id, uint64_t chunk_index, Priority priority);

  // Requests every chunk overlapping [start, end). Returns how many were
  // queued or upgraded.
  std::size_t RequestRange(uint64_t entry_id, uint64_t start, uint64_t end, Priority priority);

  WaitStatus WaitForChunk(uint64_t entry_id, uint64_t chunk_index, std::chrono::milliseconds timeout,
                          CancellationToken* cancel = nullptr);

  // Every chunk of [start, end) against one shared deadline.
  WaitStatus WaitForRange(uint64_t entry_id, uint64_t start, uint64_t end, std::chrono::milliseconds timeout,
                          CancellationToken* cancel = nullptr);

  // Seek handling. The chunk at position becomes CRITICAL and the next
  // lookahead_chunks HIGH; queued HIGH requests outside that window drop
  // to LOW and queued LOW requests outside it are cancelled. Entries under
  // background fill then get their missing chunks re-queued at LOW,
  // starting after the window and wrapping to the start of the file.
  // Returns the position chunk.
  uint64_t Reprioritize(uint64_t entry_id, uint64_t position);

  // Drops every queued request of the entry and ends its background fill.
  std::size_t CancelRequests(uint64_t entry_id);

  // Queues every missing chunk at LOW. The entry stays under fill, so
  // Reprioritize re-queues what a seek cancels.
  std::size_t RequestBackgroundFill(uint64_t entry_id);

  CacheStatus GetCacheStatus(uint64_t entry_id);

  std::vector<uint64_t> AvailableChunks(uint64_t entry_id);

  std::size_t QueueDepth() const;
  std::size_t InFlight() const;

 private:
  struct WaitSlot {
    std::condition_variable cv;
    uint64_t                generation = 0;
    std::size_t             waiters    = 0;
  };

  using TimeoutClock = std::chrono::steady_clock;

  void Run();

  WaitStatus WaitUntil(const ChunkKey& key, TimeoutClock::time_point deadline, CancellationToken* cancel);

  // Wakes the waiters of key. Caller holds mutex_.
  void SignalLocked(const ChunkKey& key);

  void OnChunkRecorded(uint64_t entry_id, uint64_t chunk_index);

  // Queues unless recorded or in flight. Caller holds mutex_.
  bool EnqueueLocked(const ChunkKey& key, Priority priority);

  void PublishQueueMetricsLocked() const;

  // Indices of chunks in [first, last] that are fully recorded.
  std::set<uint64_t> RecordedIndices(const db::model::CacheEntryRecord& entry, uint64_t first, uint64_t last);

  std::shared_ptr<index::CacheIndex>         index_;
  std::shared_ptr<download::ChunkDownloader> downloader_;
  ChunkManagerOptions                        options_;
  uint64_t                                   chunk_size_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       work_cv_;
  RequestQueue                                  queue_;
  std::set<ChunkKey>                            in_flight_;
  std::map<ChunkKey, std::shared_ptr<WaitSlot>> slots_;
  std::set<uint64_t>                            fill_entries_;
  bool                                          running_  = false;
  bool                                          stopping_ = false;

  std::vector<std::thread> workers_;
};

} // namespace mediacache::chunk
