#include "internal/download/chunk_downloader.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "support/fake_origin.hpp"

namespace {

using mediacache::download::ChunkDownloader;
using mediacache::download::DownloadError;
using mediacache::testing::FakeOrigin;

constexpr uint64_t kChunkSize = 16 * 1024;
constexpr uint64_t kFileSize  = 3 * kChunkSize + 1000;

struct Fixture {
  std::filesystem::path                                 root;
  std::shared_ptr<FakeOrigin>                           origin;
  std::shared_ptr<mediacache::index::CacheIndex>        index;
  std::shared_ptr<mediacache::storage::ChunkStore>      store;
  std::shared_ptr<mediacache::observability::CacheStats> stats;
  std::shared_ptr<ChunkDownloader>                      downloader;
  uint64_t                                              entry_id = 0;

  std::mutex                                       recorded_mutex;
  std::vector<std::pair<uint64_t, uint64_t>>       recorded;

  explicit Fixture(const std::string& name) {
    root = std::filesystem::temp_directory_path() /
           ("mediacache_downloader_" + name + "_" + std::to_string(mediacache::util::NowMs()));
    std::filesystem::remove_all(root);

    origin = std::make_shared<FakeOrigin>(kFileSize);
    index  = std::make_shared<mediacache::index::CacheIndex>(std::make_shared<mediacache::db::memory::MemoryRepository>(), root);
    store  = std::make_shared<mediacache::storage::ChunkStore>(root);
    stats  = std::make_shared<mediacache::observability::CacheStats>();

    mediacache::download::DownloaderOptions options;
    options.chunk_size               = kChunkSize;
    options.write_buffer_bytes       = 5000;
    options.retry.max_attempts       = 3;
    options.retry.initial_backoff    = std::chrono::milliseconds(1);
    options.retry.max_backoff        = std::chrono::milliseconds(5);
    downloader = std::make_shared<ChunkDownloader>(index, store, origin, stats, options);
    downloader->SetChunkRecordedCallback([this](uint64_t entry, uint64_t chunk) {
      std::lock_guard lock(recorded_mutex);
      recorded.emplace_back(entry, chunk);
    });

    entry_id = index->GetOrCreateEntry(mediacache::model::CacheKey{"src", name, "hd"}, "http://origin/" + name).id;
  }

  ~Fixture() {
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
  }

  void AssertChunkMatchesOrigin(uint64_t chunk_index) {
    const uint64_t start = chunk_index * kChunkSize;
    const uint64_t end   = std::min(start + kChunkSize, kFileSize);
    auto           entry = index->GetEntry(entry_id);
    auto           data  = store->Read(entry, start, end - start);
    for (uint64_t i = 0; i < end - start; ++i) {
      assert(data->data()[i] == origin->Content()[start + i]);
    }
  }
};

void TestDownloadWritesAndRecordsChunk() {
  Fixture f("basic");

  auto result = f.downloader->Download(f.entry_id, 1);
  assert(result);
  assert(result.bytes_fetched == kChunkSize);
  assert(f.index->ChunkExists(f.entry_id, kChunkSize, 2 * kChunkSize));
  f.AssertChunkMatchesOrigin(1);

  // size probed once and file allocated
  assert(f.origin->ProbeCount() == 1);
  assert(f.index->GetEntry(f.entry_id).expected_total_size == kFileSize);
  assert(std::filesystem::file_size(f.index->GetEntry(f.entry_id).file_path) == kFileSize);

  auto fetches = f.origin->Fetches();
  assert(fetches.size() == 1);
  assert(fetches[0] && fetches[0]->first == kChunkSize && fetches[0]->last == 2 * kChunkSize - 1);

  assert(f.recorded.size() == 1 && f.recorded[0].second == 1);

  auto snapshot = f.stats->Snapshot();
  assert(snapshot.downloads_started == 1);
  assert(snapshot.downloads_completed == 1);
  assert(snapshot.bytes_downloaded == kChunkSize);
}

void TestLastChunkIsShortAndCompletesEntry() {
  Fixture f("last");

  for (uint64_t idx = 0; idx < 4; ++idx) {
    auto result = f.downloader->Download(f.entry_id, idx);
    assert(result);
  }
  assert(f.index->ChunkExists(f.entry_id, 3 * kChunkSize, kFileSize));
  f.AssertChunkMatchesOrigin(3);
  assert(f.index->GetEntry(f.entry_id).is_complete);
}

void TestCachedChunkMakesNoOriginCall() {
  Fixture f("cached");

  assert(f.downloader->Download(f.entry_id, 0));
  assert(f.origin->FetchCount() == 1);

  auto again = f.downloader->Download(f.entry_id, 0);
  assert(again);
  assert(again.bytes_fetched == 0);
  assert(f.origin->FetchCount() == 1);
  assert(f.stats->Snapshot().downloads_started == 1);
}

void TestTransientFailuresAreRetried() {
  Fixture f("retry");
  f.origin->FailNext(2);

  auto result = f.downloader->Download(f.entry_id, 0);
  assert(result);
  assert(f.origin->FetchCount() == 3);
  assert(f.index->ChunkExists(f.entry_id, 0, kChunkSize));
  f.AssertChunkMatchesOrigin(0);
}

void TestExhaustedRetriesReportNetworkError() {
  Fixture f("exhausted");
  f.origin->FailNext(10);

  auto result = f.downloader->Download(f.entry_id, 0);
  assert(!result);
  assert(result.code == DownloadError::kNetwork);
  assert(f.origin->FetchCount() == 3);
  assert(!f.index->ChunkExists(f.entry_id, 0, kChunkSize));
  assert(f.recorded.empty());

  auto snapshot = f.stats->Snapshot();
  assert(snapshot.downloads_failed == 1);
  assert(snapshot.downloads_completed == 0);
}

void TestOriginStatusIsNotRetried() {
  Fixture f("status");
  f.origin->RespondWithStatus(404);

  auto result = f.downloader->Download(f.entry_id, 0);
  assert(result.code == DownloadError::kOrigin);
  assert(f.origin->FetchCount() == 1);
}

void TestChunkPastEndIsNotFound() {
  Fixture f("past_end");

  auto result = f.downloader->Download(f.entry_id, 4);
  assert(result.code == DownloadError::kNotFound);
  assert(f.origin->FetchCount() == 0);
}

void TestMissingSizeIsReported() {
  Fixture f("no_size");
  f.origin->HideSize();

  auto result = f.downloader->Download(f.entry_id, 0);
  assert(result.code == DownloadError::kUnknownSize);
  assert(f.origin->FetchCount() == 0);

  bool threw = false;
  try {
    (void)f.downloader->EnsureSize(f.entry_id);
  } catch (const mediacache::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
}

void TestFullBodyResponseSwitchesToSequential() {
  Fixture f("sequential");
  f.origin->IgnoreRanges();

  auto result = f.downloader->Download(f.entry_id, 2);
  assert(result);
  assert(f.downloader->IsSequential(f.entry_id));

  // one refused ranged request, then a single whole-file transfer
  auto fetches = f.origin->Fetches();
  assert(fetches.size() == 2);
  assert(fetches[0].has_value());
  assert(!fetches[1].has_value());

  for (uint64_t idx = 0; idx < 4; ++idx) {
    const uint64_t start = idx * kChunkSize;
    assert(f.index->ChunkExists(f.entry_id, start, std::min(start + kChunkSize, kFileSize)));
    f.AssertChunkMatchesOrigin(idx);
  }
  assert(f.recorded.size() == 4);
  assert(f.index->GetEntry(f.entry_id).is_complete);

  // later downloads are already satisfied
  assert(f.downloader->Download(f.entry_id, 3));
  assert(f.origin->FetchCount() == 2);
}

void TestMissingAcceptRangesStillFetchesRanges() {
  Fixture f("probe_no_accept_ranges");
  f.origin->ReportNoRanges();

  auto result = f.downloader->Download(f.entry_id, 2);
  assert(result);
  assert(!f.downloader->IsSequential(f.entry_id));
  assert(f.origin->ProbeCount() == 1);

  auto fetches = f.origin->Fetches();
  assert(fetches.size() == 1);
  assert(fetches[0].has_value());
  assert(fetches[0]->first == 2 * kChunkSize);
  f.AssertChunkMatchesOrigin(2);

  // only chunk 2 was transferred
  assert(!f.index->ChunkExists(f.entry_id, 0, kChunkSize));
}

void TestRangesIgnoredAfterProbeFallsBackToSequential() {
  Fixture f("probe_no_ranges");
  f.origin->ReportNoRanges();
  f.origin->IgnoreRanges();

  auto result = f.downloader->Download(f.entry_id, 1);
  assert(result);
  assert(f.downloader->IsSequential(f.entry_id));

  // the ranged attempt comes first even when the probe advertised nothing
  auto fetches = f.origin->Fetches();
  assert(fetches.size() == 2);
  assert(fetches[0].has_value());
  assert(!fetches[1].has_value());
}

void TestShutdownCancelsDownloads() {
  Fixture f("shutdown");
  f.downloader->Shutdown();

  auto result = f.downloader->Download(f.entry_id, 0);
  assert(result.code == DownloadError::kCancelled);
}

} // namespace

int main() {
  TestDownloadWritesAndRecordsChunk();
  TestLastChunkIsShortAndCompletesEntry();
  TestCachedChunkMakesNoOriginCall();
  TestTransientFailuresAreRetried();
  TestExhaustedRetriesReportNetworkError();
  TestOriginStatusIsNotRetried();
  TestChunkPastEndIsNotFound();
  TestMissingSizeIsReported();
  TestFullBodyResponseSwitchesToSequential();
  TestMissingAcceptRangesStillFetchesRanges();
  TestRangesIgnoredAfterProbeFallsBackToSequential();
  TestShutdownCancelsDownloads();

  std::cout << "mediacache_unit_chunk_downloader: pass\n";
  return 0;
}
