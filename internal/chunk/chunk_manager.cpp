#include "internal/chunk/chunk_manager.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace mediacache::chunk {

using observability::IntField;
using observability::StringField;

ChunkManager::ChunkManager(std::shared_ptr<index::CacheIndex> index, std::shared_ptr<download::ChunkDownloader> downloader,
                           ChunkManagerOptions options)
    : index_(std::move(index)), downloader_(std::move(downloader)), options_(options), chunk_size_(downloader_->ChunkSize()) {
  if (options_.max_concurrent_downloads == 0) options_.max_concurrent_downloads = 1;

  downloader_->SetChunkRecordedCallback(
      [this](uint64_t entry_id, uint64_t chunk_index) { OnChunkRecorded(entry_id, chunk_index); });
}

ChunkManager::~ChunkManager() {
  Stop();
}

void ChunkManager::Start() {
  std::lock_guard lock(mutex_);
  if (running_) return;
  running_  = true;
  stopping_ = false;

  for (uint32_t i = 0; i < options_.max_concurrent_downloads; ++i) {
    workers_.emplace_back(&ChunkManager::Run, this);
  }

  MEDIACACHE_LOG_INFO("Chunk manager started", {IntField("workers", options_.max_concurrent_downloads),
                                                IntField("lookahead_chunks", options_.lookahead_chunks),
                                                IntField("chunk_size", static_cast<int64_t>(chunk_size_))});
}

void ChunkManager::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_) return;
    stopping_ = true;
    for (auto& [key, slot] : slots_) slot->cv.notify_all();
  }
  work_cv_.notify_all();
  downloader_->Shutdown();

  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();

  std::lock_guard lock(mutex_);
  running_ = false;
  MEDIACACHE_LOG_INFO("Chunk manager stopped", {IntField("abandoned_requests", static_cast<int64_t>(queue_.Size()))});
}

void ChunkManager::Run() {
  for (;;) {
    ChunkRequest request;
    {
      std::unique_lock lock(mutex_);
      work_cv_.wait(lock, [this] { return stopping_ || !queue_.Empty(); });
      if (stopping_) return;

      request = *queue_.Pop();
      in_flight_.insert(request.key);
      PublishQueueMetricsLocked();
    }

    download::DownloadResult result;
    try {
      result = downloader_->Download(request.key.entry_id, request.key.chunk_index);
    } catch (const std::exception& e) {
      result = download::DownloadResult::Err(download::DownloadError::kInternal, e.what());
      MEDIACACHE_LOG_ERROR("Chunk download threw", {IntField("entry_id", static_cast<int64_t>(request.key.entry_id)),
                                                    IntField("chunk", static_cast<int64_t>(request.key.chunk_index)),
                                                    StringField("error", e.what())});
    }

    {
      std::lock_guard lock(mutex_);
      in_flight_.erase(request.key);
      SignalLocked(request.key);
      PublishQueueMetricsLocked();
    }

    MEDIACACHE_LOG_DEBUG("Chunk request done", {IntField("entry_id", static_cast<int64_t>(request.key.entry_id)),
                                                IntField("chunk", static_cast<int64_t>(request.key.chunk_index)),
                                                StringField("priority", ToString(request.priority)),
                                                StringField("outcome", download::ToString(result.code))});
  }
}

void ChunkManager::SignalLocked(const ChunkKey& key) {
  auto it = slots_.find(key);
  if (it == slots_.end()) return;
  ++it->second->generation;
  it->second->cv.notify_all();
}

void ChunkManager::OnChunkRecorded(uint64_t entry_id, uint64_t chunk_index) {
  std::lock_guard lock(mutex_);
  SignalLocked(ChunkKey{entry_id, chunk_index});
}

void ChunkManager::PublishQueueMetricsLocked() const {
  observability::Metrics::Instance().SetQueueDepth(queue_.Size(), in_flight_.size());
}

bool ChunkManager::EnqueueLocked(const ChunkKey& key, Priority priority) {
  if (in_flight_.contains(key)) return false;
  return queue_.Push(key, priority);
}

std::set<uint64_t> ChunkManager::RecordedIndices(const db::model::CacheEntryRecord& entry, uint64_t first, uint64_t last) {
  std::set<uint64_t> out;
  if (!entry.expected_total_size) return out;
  const uint64_t total = *entry.expected_total_size;

  for (const auto& record : index_->ListChunks(entry.id)) {
    // first chunk that starts inside the record
    for (uint64_t idx = (record.start_byte + chunk_size_ - 1) / chunk_size_; idx <= last; ++idx) {
      auto bounds = BoundsFor(idx, chunk_size_, total);
      if (!bounds || bounds->end > record.end_byte) break;
      if (idx >= first) out.insert(idx);
    }
  }
  return out;
}

bool ChunkManager::HasChunk(uint64_t entry_id, uint64_t chunk_index) {
  auto entry = index_->GetEntry(entry_id);
  if (!entry.expected_total_size) return false;

  auto bounds = BoundsFor(chunk_index, chunk_size_, *entry.expected_total_size);
  if (!bounds) return false;
  return index_->ChunkExists(entry_id, bounds->start, bounds->end);
}

bool ChunkManager::HasByteRange(uint64_t entry_id, uint64_t start, uint64_t end) {
  if (start >= end) return true;

  const auto span = SpanFor(start, end, chunk_size_);
  for (uint64_t idx = span.first; idx <= span.last; ++idx) {
    if (!HasChunk(entry_id, idx)) return false;
  }
  return true;
}

bool ChunkManager::RequestChunk(uint64_t entry_id, uint64_t chunk_index, Priority priority) {
  if (HasChunk(entry_id, chunk_index)) return false;

  std::lock_guard lock(mutex_);
  const bool changed = EnqueueLocked(ChunkKey{entry_id, chunk_index}, priority);
  if (changed) {
    PublishQueueMetricsLocked();
    work_cv_.notify_one();
  }
  return changed;
}

std::size_t ChunkManager::RequestRange(uint64_t entry_id, uint64_t start, uint64_t end, Priority priority) {
  auto entry = index_->GetEntry(entry_id);
  if (entry.expected_total_size) end = std::min(end, *entry.expected_total_size);
  if (start >= end) return 0;

  const auto span     = SpanFor(start, end, chunk_size_);
  const auto recorded = RecordedIndices(entry, span.first, span.last);

  std::size_t changed = 0;
  {
    std::lock_guard lock(mutex_);
    for (uint64_t idx = span.first; idx <= span.last; ++idx) {
      if (recorded.contains(idx)) continue;
      if (EnqueueLocked(ChunkKey{entry_id, idx}, priority)) ++changed;
    }
    if (changed > 0) PublishQueueMetricsLocked();
  }
  if (changed > 0) work_cv_.notify_all();
  return changed;
}

WaitStatus ChunkManager::WaitForChunk(uint64_t entry_id, uint64_t chunk_index, std::chrono::milliseconds timeout,
                                      CancellationToken* cancel) {
  auto entry = index_->GetEntry(entry_id);
  if (entry.expected_total_size && !BoundsFor(chunk_index, chunk_size_, *entry.expected_total_size)) {
    throw util::NotFound("chunk " + std::to_string(chunk_index) + " is past the end of entry " + std::to_string(entry_id));
  }
  return WaitUntil(ChunkKey{entry_id, chunk_index}, TimeoutClock::now() + timeout, cancel);
}

WaitStatus ChunkManager::WaitForRange(uint64_t entry_id, uint64_t start, uint64_t end, std::chrono::milliseconds timeout,
                                      CancellationToken* cancel) {
  const auto deadline = TimeoutClock::now() + timeout;

  auto entry = index_->GetEntry(entry_id);
  if (entry.expected_total_size) end = std::min(end, *entry.expected_total_size);
  if (start >= end) return WaitStatus::kReady;

  const auto span = SpanFor(start, end, chunk_size_);
  for (uint64_t idx = span.first; idx <= span.last; ++idx) {
    const auto status = WaitUntil(ChunkKey{entry_id, idx}, deadline, cancel);
    if (status != WaitStatus::kReady) return status;
  }
  return WaitStatus::kReady;
}

WaitStatus ChunkManager::WaitUntil(const ChunkKey& key, TimeoutClock::time_point deadline, CancellationToken* cancel) {
  std::shared_ptr<WaitSlot> slot;
  {
    std::lock_guard lock(mutex_);
    auto& entry = slots_[key];
    if (!entry) entry = std::make_shared<WaitSlot>();
    ++entry->waiters;
    slot = entry;
  }

  // Releases the slot and the cancellation hook on every exit path.
  struct Registration {
    ChunkManager*             self;
    ChunkKey                  key;
    std::shared_ptr<WaitSlot> slot;
    CancellationToken*        cancel;
    uint64_t                  subscription = 0;

    ~Registration() {
      if (cancel && subscription != 0) cancel->Unsubscribe(subscription);
      std::lock_guard lock(self->mutex_);
      if (--slot->waiters == 0) {
        auto it = self->slots_.find(key);
        if (it != self->slots_.end() && it->second == slot) self->slots_.erase(it);
      }
    }
  } registration{this, key, slot, cancel};

  if (cancel) {
    registration.subscription = cancel->Subscribe([this, slot] {
      std::lock_guard lock(mutex_);
      slot->cv.notify_all();
    });
  }

  for (;;) {
    uint64_t generation = 0;
    {
      std::lock_guard lock(mutex_);
      if (stopping_) return WaitStatus::kCancelled;
      generation = slot->generation;
    }

    // Checked after capturing the generation so a completion racing with
    // this read still wakes the wait below.
    if (HasChunk(key.entry_id, key.chunk_index)) return WaitStatus::kReady;
    if (cancel && cancel->IsCancelled()) return WaitStatus::kCancelled;

    std::unique_lock lock(mutex_);
    const bool woke = slot->cv.wait_until(lock, deadline, [&] {
      return stopping_ || slot->generation != generation || (cancel && cancel->IsCancelled());
    });
    if (!woke) {
      lock.unlock();
      return HasChunk(key.entry_id, key.chunk_index) ? WaitStatus::kReady : WaitStatus::kTimedOut;
    }
  }
}

uint64_t ChunkManager::Reprioritize(uint64_t entry_id, uint64_t position) {
  auto entry = index_->GetEntry(entry_id);

  const uint64_t position_chunk = ChunkIndexFor(position, chunk_size_);
  uint64_t       window_last    = position_chunk + options_.lookahead_chunks;
  uint64_t       total_chunks   = 0;
  if (entry.expected_total_size) {
    total_chunks = ChunkCount(*entry.expected_total_size, chunk_size_);
    if (position_chunk >= total_chunks) {
      throw util::NotFound("position " + std::to_string(position) + " is past the end of entry " + std::to_string(entry_id));
    }
    window_last = std::min(window_last, total_chunks - 1);
  }

  bool filling = false;
  {
    std::lock_guard lock(mutex_);
    filling = fill_entries_.contains(entry_id);
  }

  const auto recorded = (filling && total_chunks > 0) ? RecordedIndices(entry, 0, total_chunks - 1)
                                                      : RecordedIndices(entry, position_chunk, window_last);

  std::size_t demoted   = 0;
  std::size_t cancelled = 0;
  std::size_t refilled  = 0;
  {
    std::lock_guard lock(mutex_);

    for (const auto& request : queue_.PendingFor(entry_id)) {
      const uint64_t idx = request.key.chunk_index;
      if (idx >= position_chunk && idx <= window_last) continue;

      if (request.priority == Priority::kHigh) {
        if (queue_.Reassign(request.key, Priority::kLow)) ++demoted;
      } else if (request.priority == Priority::kLow) {
        if (queue_.Remove(request.key)) ++cancelled;
      }
    }

    for (uint64_t idx = position_chunk; idx <= window_last; ++idx) {
      if (recorded.contains(idx)) continue;
      EnqueueLocked(ChunkKey{entry_id, idx}, idx == position_chunk ? Priority::kCritical : Priority::kHigh);
    }

    if (filling && fill_entries_.contains(entry_id)) {
      auto refill = [&](uint64_t idx) {
        if (recorded.contains(idx)) return;
        if (EnqueueLocked(ChunkKey{entry_id, idx}, Priority::kLow)) ++refilled;
      };
      for (uint64_t idx = window_last + 1; idx < total_chunks; ++idx) refill(idx);
      for (uint64_t idx = 0; idx < position_chunk; ++idx) refill(idx);
    }
    PublishQueueMetricsLocked();
  }
  work_cv_.notify_all();

  MEDIACACHE_LOG_DEBUG("Reprioritized entry", {IntField("entry_id", static_cast<int64_t>(entry_id)),
                                               IntField("position_chunk", static_cast<int64_t>(position_chunk)),
                                               IntField("window_last", static_cast<int64_t>(window_last)),
                                               IntField("demoted", static_cast<int64_t>(demoted)),
                                               IntField("cancelled", static_cast<int64_t>(cancelled)),
                                               IntField("refilled", static_cast<int64_t>(refilled))});
  return position_chunk;
}

std::size_t ChunkManager::CancelRequests(uint64_t entry_id) {
  std::lock_guard lock(mutex_);
  fill_entries_.erase(entry_id);
  const std::size_t removed = queue_.RemoveEntry(entry_id);
  PublishQueueMetricsLocked();
  return removed;
}

std::size_t ChunkManager::RequestBackgroundFill(uint64_t entry_id) {
  auto entry = index_->GetEntry(entry_id);
  if (!entry.expected_total_size) {
    throw util::InvalidState("size of entry " + std::to_string(entry_id) + " is unknown");
  }
  {
    std::lock_guard lock(mutex_);
    fill_entries_.insert(entry_id);
  }
  const std::size_t queued = RequestRange(entry_id, 0, *entry.expected_total_size, Priority::kLow);
  MEDIACACHE_LOG_INFO("Background fill queued",
                      {IntField("entry_id", static_cast<int64_t>(entry_id)), IntField("chunks", static_cast<int64_t>(queued))});
  return queued;
}

CacheStatus ChunkManager::GetCacheStatus(uint64_t entry_id) {
  auto entry = index_->GetEntry(entry_id);

  CacheStatus status;
  status.entry_id = entry_id;
  if (entry.expected_total_size) {
    status.total_chunks = ChunkCount(*entry.expected_total_size, chunk_size_);
    if (status.total_chunks > 0) {
      status.cached_chunks    = RecordedIndices(entry, 0, status.total_chunks - 1).size();
      status.progress_percent = 100.0 * static_cast<double>(status.cached_chunks) / static_cast<double>(status.total_chunks);
    }
  }
  status.is_complete = entry.is_complete || (status.total_chunks > 0 && status.cached_chunks == status.total_chunks);
  return status;
}

std::vector<uint64_t> ChunkManager::AvailableChunks(uint64_t entry_id) {
  auto entry = index_->GetEntry(entry_id);
  if (!entry.expected_total_size) return {};

  const uint64_t total_chunks = ChunkCount(*entry.expected_total_size, chunk_size_);
  if (total_chunks == 0) return {};

  auto recorded = RecordedIndices(entry, 0, total_chunks - 1);
  return {recorded.begin(), recorded.end()};
}

std::size_t ChunkManager::QueueDepth() const {
  std::lock_guard lock(mutex_);
  return queue_.Size();
}

std::size_t ChunkManager::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_.size();
}

} // namespace mediacache::chunk
