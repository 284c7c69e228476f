#pragma once

#include <arrow/buffer.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/db/model/cache_entry_record.hpp"

namespace mediacache::storage {

enum class AllocationMode {
  kSparse,
  kPreallocated,
};

/*
  ChunkStore

  One file per cache entry at entry.file_path. Pure positional I/O:
  callers must have confirmed coverage in the index before reading.

  Writers to disjoint offsets and readers anywhere may run concurrently;
  the store takes no locks around I/O.
*/
class ChunkStore {
 public:
  explicit ChunkStore(std::filesystem::path root);

  // Creates the entry file. With a known size it is extended to that size,
  // sparse when the filesystem supports it, zero-filled otherwise.
  // Safe to call again once the size becomes known.
  void OpenOrCreate(const db::model::CacheEntryRecord& entry);

  void Write(const db::model::CacheEntryRecord& entry, uint64_t offset, const uint8_t* data, std::size_t size, bool fsync);

  std::shared_ptr<arrow::Buffer> Read(const db::model::CacheEntryRecord& entry, uint64_t offset, uint64_t length);

  void Remove(const db::model::CacheEntryRecord& entry);

  // Probed once per store on first allocation.
  AllocationMode Mode();

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  AllocationMode ProbeAllocationMode();

  std::filesystem::path root_;

  std::once_flag probe_once_;
  AllocationMode mode_ = AllocationMode::kPreallocated;
};

} // namespace mediacache::storage
