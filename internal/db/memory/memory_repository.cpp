#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace mediacache::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertEntry(Transaction& t, model::CacheEntryRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& [_, existing] : s.entries) {
    if (existing.key == r.key) return Result::Err(ErrorCode::AlreadyExists, "cache entry exists: " + r.key.ToString());
  }
  r.id             = s.next_entry_id++;
  s.entries[r.id]  = r;
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetEntry(Transaction& t, uint64_t entry_id) {
  const auto& s  = TX(t).View();
  auto        it = s.entries.find(entry_id);
  if (it == s.entries.end()) return std::nullopt;
  return it->second;
}

std::optional<model::CacheEntryRecord> MemoryRepository::FindEntry(Transaction& t, const mediacache::model::CacheKey& key) {
  for (const auto& [_, entry] : TX(t).View().entries) {
    if (entry.key == key) return entry;
  }
  return std::nullopt;
}

std::vector<model::CacheEntryRecord> MemoryRepository::ListEntries(Transaction& t) {
  const auto&                          s = TX(t).View();
  std::vector<model::CacheEntryRecord> records;
  records.reserve(s.entries.size());
  for (const auto& [_, record] : s.entries) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::UpdateEntry(Transaction& t, const model::CacheEntryRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(r.id);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, "cache entry " + std::to_string(r.id));

  it->second.original_url        = r.original_url;
  it->second.file_path           = r.file_path;
  it->second.expected_total_size = r.expected_total_size;
  it->second.is_complete         = r.is_complete;
  it->second.last_accessed_ms    = r.last_accessed_ms;
  return Result::Ok();
}

Result MemoryRepository::TouchEntry(Transaction& t, uint64_t entry_id, uint64_t accessed_at_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.entries.find(entry_id);
  if (it == s.entries.end()) return Result::Err(ErrorCode::NotFound, "cache entry " + std::to_string(entry_id));
  it->second.last_accessed_ms = accessed_at_ms;
  return Result::Ok();
}

Result MemoryRepository::InsertChunk(Transaction& t, const model::CacheChunkRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.entries.contains(r.cache_entry_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown cache entry " + std::to_string(r.cache_entry_id));
  }

  auto& chunks = s.chunks[r.cache_entry_id];
  const ChunkBounds bounds{r.start_byte, r.end_byte};
  if (chunks.contains(bounds)) return Result::Ok();

  auto stored = r;
  stored.id   = s.next_chunk_id++;
  chunks.emplace(bounds, stored);
  return Result::Ok();
}

bool MemoryRepository::ChunkCovered(Transaction& t, uint64_t entry_id, uint64_t start, uint64_t end) {
  const auto& s  = TX(t).View();
  auto        it = s.chunks.find(entry_id);
  if (it == s.chunks.end()) return false;

  for (const auto& [bounds, _] : it->second) {
    if (bounds.start > start) break;
    if (bounds.end >= end) return true;
  }
  return false;
}

std::vector<model::CacheChunkRecord> MemoryRepository::ListChunks(Transaction& t, uint64_t entry_id) {
  const auto&                          s = TX(t).View();
  std::vector<model::CacheChunkRecord> out;
  auto                                 it = s.chunks.find(entry_id);
  if (it == s.chunks.end()) return out;

  out.reserve(it->second.size());
  for (const auto& [_, record] : it->second) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteChunks(Transaction& t, uint64_t entry_id, uint64_t start, uint64_t end) {
  auto& s  = TX(t).Mutable();
  auto  it = s.chunks.find(entry_id);
  if (it == s.chunks.end()) return Result::Ok();

  std::erase_if(it->second, [&](const auto& item) { return item.first.start < end && item.first.end > start; });
  return Result::Ok();
}

} // namespace mediacache::db::memory
