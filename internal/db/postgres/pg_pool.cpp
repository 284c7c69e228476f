#include "pg_pool.hpp"

namespace mediacache::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  std::unique_ptr<pqxx::connection> conn;
  try {
    conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
  } catch (const std::exception&) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
  return Wrap(conn.release());
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static const std::string kEntryColumns =
      "id,source_id,media_id,quality,original_url,file_path,expected_total_size,is_complete,created_at,last_accessed";

  conn.prepare("get_entry", "SELECT " + kEntryColumns + " FROM cache_entries WHERE id=$1");
  conn.prepare("find_entry",
               "SELECT " + kEntryColumns + " FROM cache_entries WHERE source_id=$1 AND media_id=$2 AND quality=$3");
  conn.prepare("list_entries", "SELECT " + kEntryColumns + " FROM cache_entries ORDER BY id");

  conn.prepare("insert_entry",
               "INSERT INTO cache_entries(source_id,media_id,quality,original_url,file_path,expected_total_size,is_complete,created_at,last_accessed) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9) ON CONFLICT (source_id,media_id,quality) DO NOTHING RETURNING id");

  conn.prepare("update_entry",
               "UPDATE cache_entries SET original_url=$2,file_path=$3,expected_total_size=$4,is_complete=$5,last_accessed=$6 WHERE id=$1");

  conn.prepare("touch_entry", "UPDATE cache_entries SET last_accessed=$2 WHERE id=$1");

  conn.prepare("insert_chunk",
               "INSERT INTO cache_chunks(cache_entry_id,start_byte,end_byte,downloaded_at) VALUES($1,$2,$3,$4) "
               "ON CONFLICT (cache_entry_id,start_byte,end_byte) DO NOTHING");

  conn.prepare("chunk_covered",
               "SELECT 1 FROM cache_chunks WHERE cache_entry_id=$1 AND start_byte<=$2 AND end_byte>=$3 LIMIT 1");

  conn.prepare("list_chunks",
               "SELECT id,cache_entry_id,start_byte,end_byte,downloaded_at FROM cache_chunks "
               "WHERE cache_entry_id=$1 ORDER BY start_byte, end_byte");

  conn.prepare("delete_chunks", "DELETE FROM cache_chunks WHERE cache_entry_id=$1 AND start_byte<$3 AND end_byte>$2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace mediacache::db::postgres
