#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/cache_key.hpp"

namespace mediacache::index {

/*
  CacheIndex

  Durable record of which byte ranges of each entry are on disk.
  Every call runs in its own transaction; a successful RecordChunk is
  visible to every ChunkExists that starts after it returns.

  Intervals are half-open [start, end).
*/
class CacheIndex {
 public:
  CacheIndex(std::shared_ptr<db::Repository> repository, std::filesystem::path cache_directory);

  // True iff one recorded interval fully covers [start, end).
  bool ChunkExists(uint64_t entry_id, uint64_t start, uint64_t end);

  // Idempotent. Also refreshes last_accessed.
  void RecordChunk(uint64_t entry_id, uint64_t start, uint64_t end);

  std::vector<db::model::CacheChunkRecord> ListChunks(uint64_t entry_id);

  // Creates the entry on first use; refreshes the origin URL otherwise.
  db::model::CacheEntryRecord GetOrCreateEntry(const mediacache::model::CacheKey& key, const std::string& original_url);

  // Throws util::NotFound.
  db::model::CacheEntryRecord GetEntry(uint64_t entry_id);

  std::optional<db::model::CacheEntryRecord> FindEntry(const mediacache::model::CacheKey& key);

  std::vector<db::model::CacheEntryRecord> ListEntries();

  void SetExpectedSize(uint64_t entry_id, uint64_t total_size);
  // False when the entry was already complete.
  bool MarkComplete(uint64_t entry_id);

  // Refreshes last_accessed.
  void Touch(uint64_t entry_id);

  // Drops records overlapping [start, end) so the range is fetched again.
  void ClearChunks(uint64_t entry_id, uint64_t start, uint64_t end);

  // Length of the union of recorded intervals.
  uint64_t CoveredBytes(uint64_t entry_id);

  // Marks the entry complete once coverage reaches the expected size.
  // Returns the resulting completeness flag.
  bool RefreshCompleteness(uint64_t entry_id);

  const std::filesystem::path& CacheDirectory() const {
    return cache_directory_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  std::filesystem::path           cache_directory_;
};

uint64_t UnionLength(const std::vector<db::model::CacheChunkRecord>& ordered_chunks);

} // namespace mediacache::index
