#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace mediacache::storage::common {

inline std::filesystem::path EntryPath(const std::filesystem::path& root, uint64_t entry_id) {
  return root / (std::to_string(entry_id) + ".cache");
}

} // namespace mediacache::storage::common
