#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/cache_chunk_record.hpp"
#include "internal/db/model/cache_entry_record.hpp"

#if MEDIACACHE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if MEDIACACHE_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using mediacache::db::ErrorCode;
using mediacache::db::Repository;
using mediacache::db::memory::MemoryRepository;
using mediacache::db::model::CacheChunkRecord;
using mediacache::db::model::CacheEntryRecord;
using mediacache::model::CacheKey;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

CacheEntryRecord MakeEntry(const std::string& media_id) {
  return CacheEntryRecord{.key              = CacheKey{"parity", media_id, "1080p"},
                          .original_url     = "http://origin/" + media_id,
                          .file_path        = "/tmp/" + media_id + ".cache",
                          .created_at_ms    = NowMs(),
                          .last_accessed_ms = NowMs()};
}

CacheChunkRecord MakeChunk(uint64_t entry_id, uint64_t start, uint64_t end) {
  return CacheChunkRecord{.cache_entry_id = entry_id, .start_byte = start, .end_byte = end, .downloaded_at_ms = NowMs()};
}

uint64_t InsertEntry(Repository& repo, const std::string& media_id) {
  auto tx    = repo.Begin();
  auto entry = MakeEntry(media_id);
  assert(repo.InsertEntry(*tx, entry));
  assert(entry.id != 0);
  tx->Commit();
  return entry.id;
}

void VerifyEntryLifecycle(Repository& repo, const std::string& media_id) {
  auto tx = repo.Begin();

  auto entry = MakeEntry(media_id);
  assert(repo.InsertEntry(*tx, entry));
  assert(entry.id != 0);

  auto resolved = repo.GetEntry(*tx, entry.id);
  assert(resolved.has_value());
  assert(resolved->key == entry.key);
  assert(!resolved->expected_total_size.has_value());
  assert(!resolved->is_complete);

  auto found = repo.FindEntry(*tx, entry.key);
  assert(found.has_value() && found->id == entry.id);

  resolved->expected_total_size = 4096;
  resolved->is_complete         = true;
  resolved->original_url        = "http://mirror/" + media_id;
  assert(repo.UpdateEntry(*tx, *resolved));
  assert(repo.TouchEntry(*tx, entry.id, 12345));

  auto updated = repo.GetEntry(*tx, entry.id);
  assert(updated->expected_total_size == 4096u);
  assert(updated->is_complete);
  assert(updated->original_url == "http://mirror/" + media_id);
  assert(updated->last_accessed_ms == 12345);

  // one entry per key
  auto duplicate = MakeEntry(media_id);
  auto conflict  = repo.InsertEntry(*tx, duplicate);
  assert(!conflict);
  assert(conflict.code == ErrorCode::AlreadyExists);

  tx->Commit();

  auto check_tx = repo.Begin();
  assert(repo.GetEntry(*check_tx, entry.id)->is_complete);
  assert(!repo.GetEntry(*check_tx, entry.id + 100000).has_value());
  assert(!repo.FindEntry(*check_tx, CacheKey{"parity", media_id, "480p"}).has_value());

  CacheEntryRecord missing = MakeEntry(media_id + "-missing");
  missing.id               = entry.id + 100000;
  assert(repo.UpdateEntry(*check_tx, missing).code == ErrorCode::NotFound);
  check_tx->Commit();
}

void VerifyChunkCoverage(Repository& repo, const std::string& media_id) {
  const uint64_t entry_id = InsertEntry(repo, media_id);

  auto tx = repo.Begin();
  assert(repo.InsertChunk(*tx, MakeChunk(entry_id, 200, 300)));
  assert(repo.InsertChunk(*tx, MakeChunk(entry_id, 0, 100)));
  assert(repo.InsertChunk(*tx, MakeChunk(entry_id, 100, 200)));
  // idempotent
  assert(repo.InsertChunk(*tx, MakeChunk(entry_id, 100, 200)));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto chunks  = repo.ListChunks(*read_tx, entry_id);
  assert(chunks.size() == 3);
  assert(chunks[0].start_byte == 0 && chunks[1].start_byte == 100 && chunks[2].start_byte == 200);
  assert(chunks[2].end_byte == 300);

  assert(repo.ChunkCovered(*read_tx, entry_id, 0, 100));
  assert(repo.ChunkCovered(*read_tx, entry_id, 110, 190));
  // no single record spans the boundary
  assert(!repo.ChunkCovered(*read_tx, entry_id, 50, 150));
  assert(!repo.ChunkCovered(*read_tx, entry_id, 300, 400));
  read_tx->Commit();

  auto delete_tx = repo.Begin();
  assert(repo.DeleteChunks(*delete_tx, entry_id, 150, 250));
  delete_tx->Commit();

  auto verify_tx = repo.Begin();
  auto remaining = repo.ListChunks(*verify_tx, entry_id);
  assert(remaining.size() == 1);
  assert(remaining[0].start_byte == 0 && remaining[0].end_byte == 100);
  verify_tx->Commit();
}

void VerifyChunkForUnknownEntryRejected(Repository& repo) {
  auto tx     = repo.Begin();
  auto result = repo.InsertChunk(*tx, MakeChunk(987654321, 0, 10));
  assert(!result);
  tx->Rollback();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& media_id) {
  const uint64_t entry_id = InsertEntry(repo, media_id);
  {
    auto tx = repo.Begin();
    assert(repo.InsertChunk(*tx, MakeChunk(entry_id, 0, 64)));
    auto rolled_back = MakeEntry(media_id + "-rolled-back");
    assert(repo.InsertEntry(*tx, rolled_back));
    tx->Rollback();
  }

  auto check_tx = repo.Begin();
  assert(!repo.ChunkCovered(*check_tx, entry_id, 0, 64));
  assert(!repo.FindEntry(*check_tx, CacheKey{"parity", media_id + "-rolled-back", "1080p"}).has_value());
  check_tx->Commit();

  // a transaction dropped without Commit() rolls back as well
  {
    auto tx = repo.Begin();
    assert(repo.InsertChunk(*tx, MakeChunk(entry_id, 64, 128)));
  }
  auto after_tx = repo.Begin();
  assert(!repo.ChunkCovered(*after_tx, entry_id, 64, 128));
  after_tx->Commit();
}

void VerifyConcurrentChunkRecords(Repository& repo, const std::string& media_id) {
  const uint64_t entry_id = InsertEntry(repo, media_id);

  constexpr int            kWriters = 4;
  constexpr int            kPerWriter = 8;
  std::vector<std::thread> writers;
  for (int w = 0; w < kWriters; ++w) {
    writers.emplace_back([&repo, entry_id, w] {
      for (int i = 0; i < kPerWriter; ++i) {
        const uint64_t start = static_cast<uint64_t>(w * kPerWriter + i) * 1000;
        auto           tx    = repo.Begin();
        assert(repo.InsertChunk(*tx, MakeChunk(entry_id, start, start + 1000)));
        tx->Commit();
      }
    });
  }
  for (auto& t : writers) t.join();

  auto tx     = repo.Begin();
  auto chunks = repo.ListChunks(*tx, entry_id);
  assert(chunks.size() == kWriters * kPerWriter);
  for (size_t i = 0; i < chunks.size(); ++i) {
    assert(chunks[i].start_byte == i * 1000);
  }
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& media_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto     repo     = backend.make_repository();
  uint64_t entry_id = 0;
  {
    auto tx    = repo->Begin();
    auto entry = MakeEntry(media_id);
    entry.expected_total_size = 2500;
    assert(repo->InsertEntry(*tx, entry));
    entry_id = entry.id;

    assert(repo->InsertChunk(*tx, MakeChunk(entry_id, 0, 1000)));
    assert(repo->InsertChunk(*tx, MakeChunk(entry_id, 2000, 2500)));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx    = repo->Begin();
  auto entry = repo->FindEntry(*tx, CacheKey{"parity", media_id, "1080p"});
  assert(entry.has_value());
  assert(entry->id == entry_id);
  assert(entry->expected_total_size == 2500u);
  assert(entry->file_path == "/tmp/" + media_id + ".cache");

  assert(repo->ChunkCovered(*tx, entry_id, 0, 1000));
  assert(repo->ChunkCovered(*tx, entry_id, 2000, 2500));
  assert(!repo->ChunkCovered(*tx, entry_id, 1000, 2000));
  assert(repo->ListChunks(*tx, entry_id).size() == 2);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if MEDIACACHE_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  const auto db_path =
      (std::filesystem::temp_directory_path() / ("mediacache_repository_parity_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<mediacache::db::sqlite::SqliteDB>(db_path);
    db->BootstrapSchema();
    return std::make_shared<mediacache::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if MEDIACACHE_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("MEDIACACHE_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("MEDIACACHE_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<mediacache::db::postgres::PgPool>(conninfo);
    mediacache::db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<mediacache::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto run_id = std::to_string(NowMs());
  auto       repo   = backend.make_repository();

  VerifyEntryLifecycle(*repo, backend.name + "-entry-" + run_id);
  VerifyChunkCoverage(*repo, backend.name + "-chunks-" + run_id);
  VerifyChunkForUnknownEntryRejected(*repo);
  VerifyRollbackBehavior(*repo, backend.name + "-rollback-" + run_id);
  VerifyConcurrentChunkRecords(*repo, backend.name + "-concurrent-" + run_id);

  repo.reset();
  VerifyRestartDurability(backend, backend.name + "-durable-" + run_id);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if MEDIACACHE_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if MEDIACACHE_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "mediacache_integration_repository_parity: pass\n";
  return 0;
}
