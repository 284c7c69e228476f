#include "internal/index/cache_index.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mediacache::index {

namespace {

void ThrowIfError(const db::Result& result, const std::string& what) {
  if (result) return;
  if (result.code == db::ErrorCode::NotFound) throw util::NotFound(what + ": " + result.message);
  if (result.code == db::ErrorCode::AlreadyExists) throw util::AlreadyExists(what + ": " + result.message);
  if (result.code == db::ErrorCode::IOError) throw util::StorageError(what + ": " + result.message);
  throw std::runtime_error(what + ": " + db::ToString(result.code) + ": " + result.message);
}

db::model::CacheEntryRecord RequireEntry(db::Repository& repo, db::Transaction& tx, uint64_t entry_id) {
  auto entry = repo.GetEntry(tx, entry_id);
  if (!entry) throw util::NotFound("cache entry " + std::to_string(entry_id) + " not found");
  return *entry;
}

} // namespace

uint64_t UnionLength(const std::vector<db::model::CacheChunkRecord>& ordered_chunks) {
  uint64_t covered = 0;
  uint64_t cursor  = 0;
  for (const auto& chunk : ordered_chunks) {
    const uint64_t start = std::max(chunk.start_byte, cursor);
    if (chunk.end_byte > start) {
      covered += chunk.end_byte - start;
      cursor = chunk.end_byte;
    }
  }
  return covered;
}

CacheIndex::CacheIndex(std::shared_ptr<db::Repository> repository, std::filesystem::path cache_directory)
    : repository_(std::move(repository)), cache_directory_(std::move(cache_directory)) {
}

bool CacheIndex::ChunkExists(uint64_t entry_id, uint64_t start, uint64_t end) {
  auto tx = repository_->Begin();
  return repository_->ChunkCovered(*tx, entry_id, start, end);
}

void CacheIndex::RecordChunk(uint64_t entry_id, uint64_t start, uint64_t end) {
  if (end <= start) throw std::invalid_argument("empty chunk interval");

  const auto now = util::NowMs();

  auto tx = repository_->Begin();

  db::model::CacheChunkRecord record;
  record.cache_entry_id   = entry_id;
  record.start_byte       = start;
  record.end_byte         = end;
  record.downloaded_at_ms = now;

  ThrowIfError(repository_->InsertChunk(*tx, record), "record chunk");
  ThrowIfError(repository_->TouchEntry(*tx, entry_id, now), "touch entry");
  tx->Commit();
}

std::vector<db::model::CacheChunkRecord> CacheIndex::ListChunks(uint64_t entry_id) {
  auto tx = repository_->Begin();
  return repository_->ListChunks(*tx, entry_id);
}

db::model::CacheEntryRecord CacheIndex::GetOrCreateEntry(const mediacache::model::CacheKey& key, const std::string& original_url) {
  const auto now = util::NowMs();

  auto tx = repository_->Begin();

  if (auto existing = repository_->FindEntry(*tx, key)) {
    existing->last_accessed_ms = now;
    if (!original_url.empty()) existing->original_url = original_url;
    ThrowIfError(repository_->UpdateEntry(*tx, *existing), "update entry");
    tx->Commit();
    return *existing;
  }

  db::model::CacheEntryRecord record;
  record.key              = key;
  record.original_url     = original_url;
  record.created_at_ms    = now;
  record.last_accessed_ms = now;
  ThrowIfError(repository_->InsertEntry(*tx, record), "insert entry");

  // the file name needs the assigned id
  record.file_path = storage::common::EntryPath(cache_directory_, record.id).string();
  ThrowIfError(repository_->UpdateEntry(*tx, record), "set entry path");

  tx->Commit();
  return record;
}

db::model::CacheEntryRecord CacheIndex::GetEntry(uint64_t entry_id) {
  auto tx = repository_->Begin();
  return RequireEntry(*repository_, *tx, entry_id);
}

std::optional<db::model::CacheEntryRecord> CacheIndex::FindEntry(const mediacache::model::CacheKey& key) {
  auto tx = repository_->Begin();
  return repository_->FindEntry(*tx, key);
}

std::vector<db::model::CacheEntryRecord> CacheIndex::ListEntries() {
  auto tx = repository_->Begin();
  return repository_->ListEntries(*tx);
}

void CacheIndex::SetExpectedSize(uint64_t entry_id, uint64_t total_size) {
  auto tx    = repository_->Begin();
  auto entry = RequireEntry(*repository_, *tx, entry_id);
  if (entry.expected_total_size == total_size) return;

  entry.expected_total_size = total_size;
  ThrowIfError(repository_->UpdateEntry(*tx, entry), "set expected size");
  tx->Commit();
}

bool CacheIndex::MarkComplete(uint64_t entry_id) {
  auto tx    = repository_->Begin();
  auto entry = RequireEntry(*repository_, *tx, entry_id);
  if (entry.is_complete) return false;

  entry.is_complete = true;
  ThrowIfError(repository_->UpdateEntry(*tx, entry), "mark complete");
  tx->Commit();
  return true;
}

void CacheIndex::Touch(uint64_t entry_id) {
  auto tx = repository_->Begin();
  ThrowIfError(repository_->TouchEntry(*tx, entry_id, util::NowMs()), "touch entry");
  tx->Commit();
}

void CacheIndex::ClearChunks(uint64_t entry_id, uint64_t start, uint64_t end) {
  auto tx    = repository_->Begin();
  auto entry = RequireEntry(*repository_, *tx, entry_id);

  ThrowIfError(repository_->DeleteChunks(*tx, entry_id, start, end), "delete chunks");
  if (entry.is_complete) {
    entry.is_complete = false;
    ThrowIfError(repository_->UpdateEntry(*tx, entry), "clear complete flag");
  }
  tx->Commit();
}

uint64_t CacheIndex::CoveredBytes(uint64_t entry_id) {
  return UnionLength(ListChunks(entry_id));
}

bool CacheIndex::RefreshCompleteness(uint64_t entry_id) {
  {
    auto tx    = repository_->Begin();
    auto entry = RequireEntry(*repository_, *tx, entry_id);
    if (entry.is_complete) return true;
    if (!entry.expected_total_size) return false;

    const auto covered = UnionLength(repository_->ListChunks(*tx, entry_id));
    if (covered < *entry.expected_total_size) return false;
    tx->Rollback();
  }

  MarkComplete(entry_id);
  return true;
}

} // namespace mediacache::index
