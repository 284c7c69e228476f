#include "internal/proxy/stream_registry.hpp"

#include <stdexcept>

#include "internal/util/uuid.hpp"

namespace mediacache::proxy {

std::string StreamRegistry::Register(uint64_t entry_id) {
  std::lock_guard lock(mutex_);

  if (auto it = ids_by_entry_.find(entry_id); it != ids_by_entry_.end()) return it->second;

  std::string id = util::ToString(util::GenerateUUID());
  entries_by_id_.emplace(id, entry_id);
  ids_by_entry_.emplace(entry_id, id);
  return id;
}

std::optional<uint64_t> StreamRegistry::Resolve(const std::string& stream_id) const {
  // normalizes case and rejects anything that is not a uuid
  std::string canonical;
  try {
    canonical = util::ToString(util::FromString(stream_id));
  } catch (const std::invalid_argument&) {
    return std::nullopt;
  }

  std::lock_guard lock(mutex_);
  auto it = entries_by_id_.find(canonical);
  if (it == entries_by_id_.end()) return std::nullopt;
  return it->second;
}

} // namespace mediacache::proxy
