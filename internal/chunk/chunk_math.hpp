#pragma once

#include <algorithm>
#include <cstdint>
#include <optional>

namespace mediacache::chunk {

/*
  Fixed-size chunk arithmetic. Bounds are half-open [start, end); the
  last chunk of a resource is short when the size is not a multiple
  of the chunk size.
*/

constexpr uint64_t kDefaultChunkSize = 10ull * 1024 * 1024;

struct ChunkBounds {
  uint64_t start = 0;
  uint64_t end   = 0;

  uint64_t Length() const {
    return end - start;
  }
};

// Inclusive range of chunk indices.
struct ChunkSpan {
  uint64_t first = 0;
  uint64_t last  = 0;

  uint64_t Count() const {
    return last - first + 1;
  }
};

inline uint64_t ChunkIndexFor(uint64_t offset, uint64_t chunk_size) {
  return offset / chunk_size;
}

inline uint64_t ChunkCount(uint64_t total_size, uint64_t chunk_size) {
  return (total_size + chunk_size - 1) / chunk_size;
}

inline std::optional<ChunkBounds> BoundsFor(uint64_t chunk_index, uint64_t chunk_size, uint64_t total_size) {
  const uint64_t start = chunk_index * chunk_size;
  if (start >= total_size) return std::nullopt;
  return ChunkBounds{start, std::min(start + chunk_size, total_size)};
}

// Chunks overlapping [start, end). Requires start < end.
inline ChunkSpan SpanFor(uint64_t start, uint64_t end, uint64_t chunk_size) {
  return ChunkSpan{ChunkIndexFor(start, chunk_size), ChunkIndexFor(end - 1, chunk_size)};
}

} // namespace mediacache::chunk
