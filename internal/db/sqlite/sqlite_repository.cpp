#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace mediacache::db::sqlite {

using mediacache::db::ErrorCode;
using mediacache::db::Result;

namespace {

constexpr const char* kEntryColumns =
    "id,source_id,media_id,quality,original_url,file_path,expected_total_size,is_complete,created_at,last_accessed";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptionalU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
    if (v) {
        BindU64(st, idx, *v);
    } else {
        sqlite3_bind_null(st, idx);
    }
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptionalU64(sqlite3_stmt* st, int col) {
    if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
    return ColU64(st, col);
}

model::CacheEntryRecord ReadEntry(sqlite3_stmt* st) {
    model::CacheEntryRecord r;
    r.id                  = ColU64(st, 0);
    r.key.source_id       = ColText(st, 1);
    r.key.media_id        = ColText(st, 2);
    r.key.quality         = ColText(st, 3);
    r.original_url        = ColText(st, 4);
    r.file_path           = ColText(st, 5);
    r.expected_total_size = ColOptionalU64(st, 6);
    r.is_complete         = sqlite3_column_int(st, 7) != 0;
    r.created_at_ms       = ColU64(st, 8);
    r.last_accessed_ms    = ColU64(st, 9);
    return r;
}

// Read paths throw; an empty result always means "no rows".
sqlite3_stmt* PrepareOrThrow(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

void ThrowOnStepError(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        std::string msg = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        throw std::runtime_error("sqlite step: " + msg);
    }
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Cache entries
// ------------------------------------------------------------------

Result SqliteRepository::InsertEntry(Transaction& t, model::CacheEntryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO cache_entries(source_id,media_id,quality,original_url,file_path,expected_total_size,is_complete,created_at,last_accessed) "
        "VALUES(?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.key.source_id);
    BindText(st, 2, r.key.media_id);
    BindText(st, 3, r.key.quality);
    BindText(st, 4, r.original_url);
    BindText(st, 5, r.file_path);
    BindOptionalU64(st, 6, r.expected_total_size);
    sqlite3_bind_int(st, 7, r.is_complete ? 1 : 0);
    BindU64(st, 8, r.created_at_ms);
    BindU64(st, 9, r.last_accessed_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "cache entry exists: " + r.key.ToString());

    auto result = Translate(db, rc);
    if (result) r.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetEntry(Transaction& t, uint64_t entry_id) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, std::string("SELECT ") + kEntryColumns + " FROM cache_entries WHERE id=?;");
    BindU64(st, 1, entry_id);

    int rc = sqlite3_step(st);
    ThrowOnStepError(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEntry(st);
    sqlite3_finalize(st);
    return r;
}

std::optional<model::CacheEntryRecord> SqliteRepository::FindEntry(Transaction& t, const mediacache::model::CacheKey& key) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, std::string("SELECT ") + kEntryColumns +
                                      " FROM cache_entries WHERE source_id=? AND media_id=? AND quality=?;");
    BindText(st, 1, key.source_id);
    BindText(st, 2, key.media_id);
    BindText(st, 3, key.quality);

    int rc = sqlite3_step(st);
    ThrowOnStepError(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadEntry(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::CacheEntryRecord> SqliteRepository::ListEntries(Transaction& t) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db, std::string("SELECT ") + kEntryColumns + " FROM cache_entries ORDER BY id;");

    std::vector<model::CacheEntryRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadEntry(st));
    }
    ThrowOnStepError(db, st, rc);
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateEntry(Transaction& t, const model::CacheEntryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE cache_entries SET original_url=?,file_path=?,expected_total_size=?,is_complete=?,last_accessed=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.original_url);
    BindText(st, 2, r.file_path);
    BindOptionalU64(st, 3, r.expected_total_size);
    sqlite3_bind_int(st, 4, r.is_complete ? 1 : 0);
    BindU64(st, 5, r.last_accessed_ms);
    BindU64(st, 6, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "cache entry " + std::to_string(r.id));
    return result;
}

Result SqliteRepository::TouchEntry(Transaction& t, uint64_t entry_id, uint64_t accessed_at_ms) {
    auto* db = TX(t).Handle();

    const char* sql = "UPDATE cache_entries SET last_accessed=? WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, accessed_at_ms);
    BindU64(st, 2, entry_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "cache entry " + std::to_string(entry_id));
    return result;
}

// ------------------------------------------------------------------
// Chunks
// ------------------------------------------------------------------

Result SqliteRepository::InsertChunk(Transaction& t, const model::CacheChunkRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT OR IGNORE INTO cache_chunks(cache_entry_id,start_byte,end_byte,downloaded_at) VALUES(?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, r.cache_entry_id);
    BindU64(st, 2, r.start_byte);
    BindU64(st, 3, r.end_byte);
    BindU64(st, 4, r.downloaded_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

bool SqliteRepository::ChunkCovered(Transaction& t, uint64_t entry_id, uint64_t start, uint64_t end) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db,
                              "SELECT 1 FROM cache_chunks WHERE cache_entry_id=? AND start_byte<=? AND end_byte>=? LIMIT 1;");
    BindU64(st, 1, entry_id);
    BindU64(st, 2, start);
    BindU64(st, 3, end);

    int rc = sqlite3_step(st);
    ThrowOnStepError(db, st, rc);
    sqlite3_finalize(st);
    return rc == SQLITE_ROW;
}

std::vector<model::CacheChunkRecord> SqliteRepository::ListChunks(Transaction& t, uint64_t entry_id) {
    auto* db = TX(t).Handle();

    auto* st = PrepareOrThrow(db,
                              "SELECT id,cache_entry_id,start_byte,end_byte,downloaded_at FROM cache_chunks "
                              "WHERE cache_entry_id=? ORDER BY start_byte, end_byte;");
    BindU64(st, 1, entry_id);

    std::vector<model::CacheChunkRecord> out;
    int rc = SQLITE_OK;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::CacheChunkRecord r;
        r.id               = ColU64(st, 0);
        r.cache_entry_id   = ColU64(st, 1);
        r.start_byte       = ColU64(st, 2);
        r.end_byte         = ColU64(st, 3);
        r.downloaded_at_ms = ColU64(st, 4);
        out.push_back(r);
    }
    ThrowOnStepError(db, st, rc);
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteChunks(Transaction& t, uint64_t entry_id, uint64_t start, uint64_t end) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM cache_chunks WHERE cache_entry_id=? AND start_byte<? AND end_byte>?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindU64(st, 1, entry_id);
    BindU64(st, 2, end);
    BindU64(st, 3, start);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    return Translate(db, rc);
}

} // namespace mediacache::db::sqlite
