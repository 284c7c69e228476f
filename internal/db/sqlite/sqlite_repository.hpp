#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace mediacache::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
