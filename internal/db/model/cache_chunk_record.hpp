#pragma once

#include <cstdint>

namespace mediacache::db::model {

// Half-open interval [start_byte, end_byte) of downloaded data.
struct CacheChunkRecord {
  uint64_t id               = 0;
  uint64_t cache_entry_id   = 0;
  uint64_t start_byte       = 0;
  uint64_t end_byte         = 0;
  uint64_t downloaded_at_ms = 0;
};

} // namespace mediacache::db::model
