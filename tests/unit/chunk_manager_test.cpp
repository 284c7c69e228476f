#include "internal/chunk/chunk_manager.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fake_origin.hpp"

namespace {

using namespace std::chrono_literals;
using mediacache::chunk::CancellationToken;
using mediacache::chunk::ChunkManager;
using mediacache::chunk::Priority;
using mediacache::chunk::WaitStatus;
using mediacache::testing::FakeOrigin;

constexpr uint64_t kChunkSize   = 4096;
constexpr uint64_t kTotalChunks = 11;
constexpr uint64_t kFileSize    = 10 * kChunkSize + 100;

std::filesystem::path FreshRoot(const std::string& name) {
  auto root = std::filesystem::temp_directory_path() /
              ("mediacache_chunk_manager_" + name + "_" + std::to_string(mediacache::util::NowMs()));
  std::filesystem::remove_all(root);
  return root;
}

struct Fixture {
  std::filesystem::path                                    root;
  std::shared_ptr<mediacache::db::Repository>              repository;
  std::shared_ptr<FakeOrigin>                              origin;
  std::shared_ptr<mediacache::index::CacheIndex>           index;
  std::shared_ptr<mediacache::storage::ChunkStore>         store;
  std::shared_ptr<mediacache::download::ChunkDownloader>   downloader;
  std::shared_ptr<ChunkManager>                            manager;
  uint64_t                                                 entry_id = 0;

  Fixture(std::filesystem::path dir, std::shared_ptr<mediacache::db::Repository> repo, uint32_t workers, uint32_t lookahead = 10)
      : root(std::move(dir)), repository(std::move(repo)) {
    origin = std::make_shared<FakeOrigin>(kFileSize);
    index  = std::make_shared<mediacache::index::CacheIndex>(repository, root);
    store  = std::make_shared<mediacache::storage::ChunkStore>(root);

    mediacache::download::DownloaderOptions options;
    options.chunk_size            = kChunkSize;
    options.retry.max_attempts    = 2;
    options.retry.initial_backoff = 1ms;
    options.retry.max_backoff     = 2ms;
    downloader = std::make_shared<mediacache::download::ChunkDownloader>(
        index, store, origin, std::make_shared<mediacache::observability::CacheStats>(), options);

    mediacache::chunk::ChunkManagerOptions manager_options;
    manager_options.max_concurrent_downloads = workers;
    manager_options.lookahead_chunks         = lookahead;
    manager = std::make_shared<ChunkManager>(index, downloader, manager_options);

    entry_id = index->GetOrCreateEntry(mediacache::model::CacheKey{"src", "movie", "hd"}, "http://origin/movie").id;
    downloader->EnsureSize(entry_id);
  }

  Fixture(const std::string& name, uint32_t workers, uint32_t lookahead = 10)
      : Fixture(FreshRoot(name), std::make_shared<mediacache::db::memory::MemoryRepository>(), workers, lookahead) {
  }

  // Chunk indices in the order the origin saw them.
  std::vector<uint64_t> FetchOrder() const {
    std::vector<uint64_t> order;
    for (const auto& range : origin->Fetches()) {
      if (range) order.push_back(range->first / kChunkSize);
    }
    return order;
  }

  void WaitAll(uint64_t first, uint64_t last) {
    for (uint64_t idx = first; idx <= last; ++idx) {
      auto status = manager->WaitForChunk(entry_id, idx, 5s);
      assert(status == WaitStatus::kReady);
    }
  }
};

void TestPriorityOrderWithoutPreemption() {
  Fixture f("priority", 1);
  f.manager->Start();
  f.origin->Hold();

  assert(f.manager->RequestChunk(f.entry_id, 0, Priority::kLow));
  f.origin->WaitForActive(1);

  assert(f.manager->RequestChunk(f.entry_id, 1, Priority::kLow));
  assert(f.manager->RequestChunk(f.entry_id, 2, Priority::kMedium));
  assert(f.manager->RequestChunk(f.entry_id, 3, Priority::kHigh));
  assert(f.manager->RequestChunk(f.entry_id, 4, Priority::kHigh));
  assert(f.manager->RequestChunk(f.entry_id, 5, Priority::kCritical));

  // in flight, not requeued
  assert(!f.manager->RequestChunk(f.entry_id, 0, Priority::kCritical));
  assert(f.manager->QueueDepth() == 5);
  assert(f.manager->InFlight() == 1);

  f.origin->Release();
  f.WaitAll(0, 5);

  const std::vector<uint64_t> expected{0, 5, 3, 4, 2, 1};
  assert(f.FetchOrder() == expected);
}

void TestUpgradeOnlyRaisesPriority() {
  Fixture f("upgrade", 1);
  f.manager->Start();
  f.origin->Hold();

  f.manager->RequestChunk(f.entry_id, 0, Priority::kLow);
  f.origin->WaitForActive(1);

  assert(f.manager->RequestChunk(f.entry_id, 1, Priority::kMedium));
  assert(f.manager->RequestChunk(f.entry_id, 2, Priority::kLow));
  assert(f.manager->RequestChunk(f.entry_id, 2, Priority::kHigh));
  assert(!f.manager->RequestChunk(f.entry_id, 2, Priority::kLow));
  assert(!f.manager->RequestChunk(f.entry_id, 1, Priority::kMedium));
  assert(f.manager->QueueDepth() == 2);

  f.origin->Release();
  f.WaitAll(0, 2);

  const std::vector<uint64_t> expected{0, 2, 1};
  assert(f.FetchOrder() == expected);
}

void TestConcurrencyCeiling() {
  Fixture f("ceiling", 3);
  f.manager->Start();
  f.origin->Hold();

  assert(f.manager->RequestRange(f.entry_id, 0, 6 * kChunkSize, Priority::kHigh) == 6);
  f.origin->WaitForActive(3);
  std::this_thread::sleep_for(50ms);

  assert(f.origin->FetchCount() == 3);
  assert(f.manager->InFlight() == 3);
  assert(f.manager->QueueDepth() == 3);

  f.origin->Release();
  f.WaitAll(0, 5);
  assert(f.origin->FetchCount() == 6);
}

void TestManyWaitersShareOneDownload() {
  Fixture f("waiters", 2);
  f.manager->Start();
  f.origin->Hold();

  f.manager->RequestChunk(f.entry_id, 2, Priority::kCritical);
  f.origin->WaitForActive(1);

  std::atomic<int>         ready{0};
  std::vector<std::thread> waiters;
  for (int i = 0; i < 5; ++i) {
    waiters.emplace_back([&] {
      // a waiter may also ask for the chunk; the request is deduplicated
      f.manager->RequestChunk(f.entry_id, 2, Priority::kCritical);
      if (f.manager->WaitForChunk(f.entry_id, 2, 5s) == WaitStatus::kReady) ++ready;
    });
  }

  std::this_thread::sleep_for(50ms);
  f.origin->Release();
  for (auto& t : waiters) t.join();

  assert(ready == 5);
  assert(f.origin->FetchCount() == 1);
}

void TestReadyChunkReturnsImmediately() {
  Fixture f("ready", 1);
  f.manager->Start();

  f.manager->RequestChunk(f.entry_id, 0, Priority::kCritical);
  f.WaitAll(0, 0);

  assert(f.manager->HasChunk(f.entry_id, 0));
  assert(!f.manager->RequestChunk(f.entry_id, 0, Priority::kCritical));

  const auto started = std::chrono::steady_clock::now();
  assert(f.manager->WaitForChunk(f.entry_id, 0, 0ms) == WaitStatus::kReady);
  assert(std::chrono::steady_clock::now() - started < 1s);
}

void TestWaitTimesOut() {
  Fixture f("timeout", 1);
  f.manager->Start();
  f.origin->Hold();

  f.manager->RequestChunk(f.entry_id, 0, Priority::kCritical);

  const auto started = std::chrono::steady_clock::now();
  assert(f.manager->WaitForChunk(f.entry_id, 0, 100ms) == WaitStatus::kTimedOut);
  assert(std::chrono::steady_clock::now() - started >= 100ms);

  // the download itself is unaffected by the timeout
  f.origin->Release();
  f.WaitAll(0, 0);
}

void TestFailedDownloadDoesNotSatisfyWaiters() {
  Fixture f("failure", 1);
  f.manager->Start();
  f.origin->FailNext(100);

  f.manager->RequestChunk(f.entry_id, 1, Priority::kCritical);
  assert(f.manager->WaitForChunk(f.entry_id, 1, 200ms) == WaitStatus::kTimedOut);
  assert(!f.manager->HasChunk(f.entry_id, 1));
  assert(f.manager->InFlight() == 0);

  // a new request after the failure goes through
  f.origin->FailNext(0);
  assert(f.manager->RequestChunk(f.entry_id, 1, Priority::kCritical));
  f.WaitAll(1, 1);
}

void TestCancellationAffectsOnlyItsWaiter() {
  Fixture f("cancel", 1);
  f.manager->Start();
  f.origin->Hold();

  f.manager->RequestChunk(f.entry_id, 1, Priority::kCritical);
  f.origin->WaitForActive(1);

  CancellationToken  token;
  std::atomic<int>   cancelled_status{-1};
  std::atomic<int>   other_status{-1};

  std::thread cancelled_waiter([&] {
    cancelled_status = static_cast<int>(f.manager->WaitForChunk(f.entry_id, 1, 5s, &token));
  });
  std::thread other_waiter([&] { other_status = static_cast<int>(f.manager->WaitForChunk(f.entry_id, 1, 5s)); });

  std::this_thread::sleep_for(50ms);
  token.Cancel();
  cancelled_waiter.join();
  assert(cancelled_status == static_cast<int>(WaitStatus::kCancelled));
  assert(other_status == -1);

  // the download is not abandoned
  f.origin->Release();
  other_waiter.join();
  assert(other_status == static_cast<int>(WaitStatus::kReady));
  assert(f.manager->HasChunk(f.entry_id, 1));

  // already cancelled tokens return without waiting
  assert(f.manager->WaitForChunk(f.entry_id, 2, 5s, &token) == WaitStatus::kCancelled);
}

void TestWaitForRangeSharesDeadline() {
  Fixture f("range_wait", 3);
  f.manager->Start();

  f.manager->RequestRange(f.entry_id, kChunkSize / 2, 3 * kChunkSize + 1, Priority::kCritical);
  assert(f.manager->WaitForRange(f.entry_id, kChunkSize / 2, 3 * kChunkSize + 1, 5s) == WaitStatus::kReady);
  assert(f.manager->HasByteRange(f.entry_id, 0, 4 * kChunkSize));

  // chunk 4 is never requested
  assert(f.manager->WaitForRange(f.entry_id, 0, 5 * kChunkSize, 100ms) == WaitStatus::kTimedOut);
}

void TestWaitPastEndThrowsNotFound() {
  Fixture f("past_end", 1);
  bool    threw = false;
  try {
    (void)f.manager->WaitForChunk(f.entry_id, kTotalChunks, 10ms);
  } catch (const mediacache::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSeekReprioritizesWindow() {
  Fixture f("seek", 1, 3);
  f.manager->Start();
  f.origin->Hold();

  // park the only worker on chunk 9
  f.manager->RequestChunk(f.entry_id, 9, Priority::kLow);
  f.origin->WaitForActive(1);

  assert(f.manager->RequestRange(f.entry_id, 0, kFileSize, Priority::kLow) == kTotalChunks - 1);
  assert(f.manager->RequestChunk(f.entry_id, 1, Priority::kHigh));

  const uint64_t position_chunk = f.manager->Reprioritize(f.entry_id, 5 * kChunkSize + 17);
  assert(position_chunk == 5);

  // 5 CRITICAL, 6..8 HIGH, 1 demoted to LOW, other LOW requests dropped
  assert(f.manager->QueueDepth() == 5);

  f.origin->Release();
  f.WaitAll(5, 8);
  f.WaitAll(1, 1);

  const std::vector<uint64_t> expected{9, 5, 6, 7, 8, 1};
  assert(f.FetchOrder() == expected);
  assert(!f.manager->HasChunk(f.entry_id, 0));
  assert(!f.manager->HasChunk(f.entry_id, 10));
}

void TestSeekKeepsBackgroundFill() {
  Fixture f("seek_fill", 1, 3);
  f.manager->Start();
  f.origin->Hold();

  f.manager->RequestChunk(f.entry_id, 9, Priority::kLow);
  f.origin->WaitForActive(1);

  assert(f.manager->RequestBackgroundFill(f.entry_id) == kTotalChunks - 1);

  // playback from the start keeps every fill chunk queued
  assert(f.manager->Reprioritize(f.entry_id, 0) == 0);
  assert(f.manager->QueueDepth() == kTotalChunks - 1);

  // a jump to chunk 5 resumes fill after the window, then wraps
  assert(f.manager->Reprioritize(f.entry_id, 5 * kChunkSize) == 5);
  assert(f.manager->QueueDepth() == kTotalChunks - 1);

  f.origin->Release();
  f.WaitAll(0, kTotalChunks - 1);

  // 0 stays CRITICAL, 1..3 drop to LOW ahead of the re-queued 10 and 4
  const std::vector<uint64_t> expected{9, 0, 5, 6, 7, 8, 1, 2, 3, 10, 4};
  assert(f.FetchOrder() == expected);
}

void TestSeekPastEndThrowsNotFound() {
  Fixture f("seek_past_end", 1);
  bool    threw = false;
  try {
    (void)f.manager->Reprioritize(f.entry_id, kFileSize);
  } catch (const mediacache::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCancelRequestsDropsQueue() {
  Fixture f("cancel_requests", 1);

  f.manager->RequestRange(f.entry_id, 0, kFileSize, Priority::kMedium);
  assert(f.manager->QueueDepth() == kTotalChunks);
  assert(f.manager->CancelRequests(f.entry_id) == kTotalChunks);
  assert(f.manager->QueueDepth() == 0);
}

void TestCacheStatusSurvivesRestart() {
  const auto root    = FreshRoot("restart");
  const auto db_path = (root.parent_path() / (root.filename().string() + ".db")).string();

  auto open_repository = [&db_path]() {
    auto db = std::make_shared<mediacache::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<mediacache::db::sqlite::SqliteRepository>(std::move(db));
  };

  {
    Fixture f(root, open_repository(), 2);
    f.manager->Start();
    f.manager->RequestRange(f.entry_id, 0, 2 * kChunkSize, Priority::kHigh);
    f.manager->RequestChunk(f.entry_id, kTotalChunks - 1, Priority::kHigh);
    f.WaitAll(0, 1);
    f.WaitAll(kTotalChunks - 1, kTotalChunks - 1);
    f.manager->Stop();
  }

  Fixture f(root, open_repository(), 2);
  assert(f.origin->ProbeCount() == 0);

  auto status = f.manager->GetCacheStatus(f.entry_id);
  assert(status.total_chunks == kTotalChunks);
  assert(status.cached_chunks == 3);
  assert(!status.is_complete);
  assert(status.progress_percent > 27.0 && status.progress_percent < 28.0);

  const std::vector<uint64_t> expected{0, 1, kTotalChunks - 1};
  assert(f.manager->AvailableChunks(f.entry_id) == expected);

  // recorded chunks are not fetched again
  f.manager->Start();
  assert(f.manager->RequestBackgroundFill(f.entry_id) == kTotalChunks - 3);
  f.WaitAll(0, kTotalChunks - 1);
  assert(f.origin->FetchCount() == kTotalChunks - 3);

  auto done = f.manager->GetCacheStatus(f.entry_id);
  assert(done.is_complete && done.cached_chunks == kTotalChunks);
  f.manager->Stop();

  std::filesystem::remove_all(root);
  std::filesystem::remove(db_path);
}

} // namespace

int main() {
  TestPriorityOrderWithoutPreemption();
  TestUpgradeOnlyRaisesPriority();
  TestConcurrencyCeiling();
  TestManyWaitersShareOneDownload();
  TestReadyChunkReturnsImmediately();
  TestWaitTimesOut();
  TestFailedDownloadDoesNotSatisfyWaiters();
  TestCancellationAffectsOnlyItsWaiter();
  TestWaitForRangeSharesDeadline();
  TestWaitPastEndThrowsNotFound();
  TestSeekReprioritizesWindow();
  TestSeekKeepsBackgroundFill();
  TestSeekPastEndThrowsNotFound();
  TestCancelRequestsDropsQueue();
  TestCacheStatusSurvivesRestart();

  std::cout << "mediacache_unit_chunk_manager: pass\n";
  return 0;
}
