#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace mediacache::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEntry(Transaction&, model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetEntry(Transaction&, uint64_t) override;
  std::optional<model::CacheEntryRecord> FindEntry(Transaction&, const mediacache::model::CacheKey&) override;
  std::vector<model::CacheEntryRecord> ListEntries(Transaction&) override;
  Result UpdateEntry(Transaction&, const model::CacheEntryRecord&) override;
  Result TouchEntry(Transaction&, uint64_t, uint64_t) override;

  Result InsertChunk(Transaction&, const model::CacheChunkRecord&) override;
  bool ChunkCovered(Transaction&, uint64_t, uint64_t, uint64_t) override;
  std::vector<model::CacheChunkRecord> ListChunks(Transaction&, uint64_t) override;
  Result DeleteChunks(Transaction&, uint64_t, uint64_t, uint64_t) override;

private:
  friend class MemoryTransaction;

  struct ChunkBounds {
    uint64_t start;
    uint64_t end;
    bool operator<(const ChunkBounds& o) const {
      return start != o.start ? start < o.start : end < o.end;
    }
  };

  struct State {
    std::map<uint64_t, model::CacheEntryRecord> entries;
    std::unordered_map<uint64_t, std::map<ChunkBounds, model::CacheChunkRecord>> chunks;
    uint64_t next_entry_id = 1;
    uint64_t next_chunk_id = 1;
  };

  // held by a transaction from Begin() until it finishes
  std::mutex tx_mutex_;
  State committed_;
};

}
