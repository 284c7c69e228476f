#include "pg_repository.hpp"

#include "internal/db/sql/migrations.hpp"

namespace mediacache::db::postgres {

namespace {

model::CacheEntryRecord ReadEntry(const pqxx::row& row) {
  model::CacheEntryRecord r;
  r.id            = row[0].as<uint64_t>();
  r.key.source_id = row[1].c_str();
  r.key.media_id  = row[2].c_str();
  r.key.quality   = row[3].c_str();
  r.original_url  = row[4].c_str();
  r.file_path     = row[5].c_str();
  if (!row[6].is_null()) r.expected_total_size = row[6].as<uint64_t>();
  r.is_complete      = row[7].as<bool>();
  r.created_at_ms    = row[8].as<uint64_t>();
  r.last_accessed_ms = row[9].as<uint64_t>();
  return r;
}

class WorkExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& statement) override {
    tx_.exec(statement);
  }

 private:
  pqxx::work& tx_;
};

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);
  WorkExecutor executor(tx);
  sql::RunMigrations(executor, sql::PostgresSchema());
  tx.commit();
}

Result PgRepository::InsertEntry(Transaction& t, model::CacheEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_entry", r.key.source_id, r.key.media_id, r.key.quality, r.original_url,
                                          r.file_path, r.expected_total_size, r.is_complete, r.created_at_ms, r.last_accessed_ms);
    if (res.empty()) return Result::Err(ErrorCode::AlreadyExists, "cache entry exists: " + r.key.ToString());
    r.id = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::CacheEntryRecord> PgRepository::GetEntry(Transaction& t, uint64_t entry_id) {
  auto res = TX(t).Work().exec_prepared("get_entry", entry_id);
  if (res.empty()) return std::nullopt;
  return ReadEntry(res[0]);
}

std::optional<model::CacheEntryRecord> PgRepository::FindEntry(Transaction& t, const mediacache::model::CacheKey& key) {
  auto res = TX(t).Work().exec_prepared("find_entry", key.source_id, key.media_id, key.quality);
  if (res.empty()) return std::nullopt;
  return ReadEntry(res[0]);
}

std::vector<model::CacheEntryRecord> PgRepository::ListEntries(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_entries");

  std::vector<model::CacheEntryRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    records.push_back(ReadEntry(row));
  }
  return records;
}

Result PgRepository::UpdateEntry(Transaction& t, const model::CacheEntryRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_entry", r.id, r.original_url, r.file_path, r.expected_total_size, r.is_complete,
                                          r.last_accessed_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "cache entry " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::TouchEntry(Transaction& t, uint64_t entry_id, uint64_t accessed_at_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("touch_entry", entry_id, accessed_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "cache entry " + std::to_string(entry_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertChunk(Transaction& t, const model::CacheChunkRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_chunk", r.cache_entry_id, r.start_byte, r.end_byte, r.downloaded_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

bool PgRepository::ChunkCovered(Transaction& t, uint64_t entry_id, uint64_t start, uint64_t end) {
  auto res = TX(t).Work().exec_prepared("chunk_covered", entry_id, start, end);
  return !res.empty();
}

std::vector<model::CacheChunkRecord> PgRepository::ListChunks(Transaction& t, uint64_t entry_id) {
  auto res = TX(t).Work().exec_prepared("list_chunks", entry_id);

  std::vector<model::CacheChunkRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::CacheChunkRecord r;
    r.id               = row[0].as<uint64_t>();
    r.cache_entry_id   = row[1].as<uint64_t>();
    r.start_byte       = row[2].as<uint64_t>();
    r.end_byte         = row[3].as<uint64_t>();
    r.downloaded_at_ms = row[4].as<uint64_t>();
    out.push_back(r);
  }
  return out;
}

Result PgRepository::DeleteChunks(Transaction& t, uint64_t entry_id, uint64_t start, uint64_t end) {
  try {
    TX(t).Work().exec_prepared("delete_chunks", entry_id, start, end);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace mediacache::db::postgres
