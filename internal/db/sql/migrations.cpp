#include "migrations.hpp"

namespace mediacache::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS cache_entries ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "source_id TEXT NOT NULL, media_id TEXT NOT NULL, quality TEXT NOT NULL, "
      "original_url TEXT NOT NULL, file_path TEXT NOT NULL, "
      "expected_total_size INTEGER, is_complete INTEGER NOT NULL DEFAULT 0, "
      "created_at INTEGER NOT NULL, last_accessed INTEGER NOT NULL, "
      "UNIQUE(source_id, media_id, quality));",

      // the unique constraint doubles as the coverage index
      "CREATE TABLE IF NOT EXISTS cache_chunks ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "cache_entry_id INTEGER NOT NULL REFERENCES cache_entries(id) ON DELETE CASCADE, "
      "start_byte INTEGER NOT NULL, end_byte INTEGER NOT NULL, "
      "downloaded_at INTEGER NOT NULL, "
      "UNIQUE(cache_entry_id, start_byte, end_byte));",

      "SELECT id,source_id,media_id,quality,original_url,file_path,expected_total_size,is_complete,created_at,last_accessed "
      "FROM cache_entries LIMIT 1;",
      "SELECT id,cache_entry_id,start_byte,end_byte,downloaded_at FROM cache_chunks LIMIT 1;"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS cache_entries ("
      "id BIGSERIAL PRIMARY KEY, "
      "source_id TEXT NOT NULL, media_id TEXT NOT NULL, quality TEXT NOT NULL, "
      "original_url TEXT NOT NULL, file_path TEXT NOT NULL, "
      "expected_total_size BIGINT, is_complete BOOLEAN NOT NULL DEFAULT FALSE, "
      "created_at BIGINT NOT NULL, last_accessed BIGINT NOT NULL, "
      "UNIQUE(source_id, media_id, quality));",

      "CREATE TABLE IF NOT EXISTS cache_chunks ("
      "id BIGSERIAL PRIMARY KEY, "
      "cache_entry_id BIGINT NOT NULL REFERENCES cache_entries(id) ON DELETE CASCADE, "
      "start_byte BIGINT NOT NULL, end_byte BIGINT NOT NULL, "
      "downloaded_at BIGINT NOT NULL, "
      "UNIQUE(cache_entry_id, start_byte, end_byte));"};
  return kSchema;
}

} // namespace mediacache::db::sql
