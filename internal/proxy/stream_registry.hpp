#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mediacache::proxy {

/*
  Maps opaque stream ids handed to players onto cache entries.
  Ids live for the process lifetime; one id per entry.
*/
class StreamRegistry {
 public:
  std::string Register(uint64_t entry_id);

  std::optional<uint64_t> Resolve(const std::string& stream_id) const;

 private:
  mutable std::mutex                        mutex_;
  std::unordered_map<std::string, uint64_t> entries_by_id_;
  std::unordered_map<uint64_t, std::string> ids_by_entry_;
};

} // namespace mediacache::proxy
