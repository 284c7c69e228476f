#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace mediacache::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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

  // Creates the cache tables if missing.
  static void BootstrapSchema(PgPool& pool);

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

}
