#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/cache_key.hpp"

namespace mediacache::db::model {

struct CacheEntryRecord {
  uint64_t                    id = 0;
  mediacache::model::CacheKey key;
  std::string                 original_url;
  std::string                 file_path;
  std::optional<uint64_t>     expected_total_size;
  bool                        is_complete      = false;
  uint64_t                    created_at_ms    = 0;
  uint64_t                    last_accessed_ms = 0;
};

} // namespace mediacache::db::model
