#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace mediacache::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction of the process;
  TxMutex() serializes transactions on it.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure(bool wal_mode);

  // Creates the cache tables if missing.
  void BootstrapSchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace mediacache::db::sqlite
