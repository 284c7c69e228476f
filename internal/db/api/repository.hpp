#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/cache_chunk_record.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/model/cache_key.hpp"

namespace mediacache::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - InsertChunk is idempotent on (entry, start, end)
  - A committed InsertChunk is visible to every later ChunkCovered

  The DB is the source of truth for:
    cache entries
    downloaded byte ranges
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Cache entries
  // ---------------------------------------------------------------------

  // Assigns record.id on success.
  virtual Result InsertEntry(Transaction&, model::CacheEntryRecord& record) = 0;

  virtual std::optional<model::CacheEntryRecord> GetEntry(Transaction&, uint64_t entry_id) = 0;

  virtual std::optional<model::CacheEntryRecord> FindEntry(Transaction&, const mediacache::model::CacheKey& key) = 0;

  virtual std::vector<model::CacheEntryRecord> ListEntries(Transaction&) = 0;

  // Updates url, file path, expected size and completeness.
  virtual Result UpdateEntry(Transaction&, const model::CacheEntryRecord& record) = 0;

  virtual Result TouchEntry(Transaction&, uint64_t entry_id, uint64_t accessed_at_ms) = 0;

  // ---------------------------------------------------------------------
  // Chunks
  // ---------------------------------------------------------------------

  virtual Result InsertChunk(Transaction&, const model::CacheChunkRecord& record) = 0;

  // True iff one record spans [start, end).
  virtual bool ChunkCovered(Transaction&, uint64_t entry_id, uint64_t start, uint64_t end) = 0;

  // Ordered by start_byte.
  virtual std::vector<model::CacheChunkRecord> ListChunks(Transaction&, uint64_t entry_id) = 0;

  // Removes records overlapping [start, end).
  virtual Result DeleteChunks(Transaction&, uint64_t entry_id, uint64_t start, uint64_t end) = 0;
};

} // namespace mediacache::db
