#include "internal/chunk/request_queue.hpp"

namespace mediacache::chunk {

void RequestQueue::Unlink(const ChunkRequest& request) {
  order_.erase(OrderKey{request.priority, request.sequence});
}

bool RequestQueue::Push(const ChunkKey& key, Priority priority) {
  auto it = pending_.find(key);
  if (it == pending_.end()) {
    ChunkRequest request{key, priority, next_sequence_++};
    order_.emplace(OrderKey{priority, request.sequence}, key);
    pending_.emplace(key, request);
    return true;
  }

  if (!MoreUrgent(priority, it->second.priority)) return false;
  return Reassign(key, priority);
}

bool RequestQueue::Reassign(const ChunkKey& key, Priority priority) {
  auto it = pending_.find(key);
  if (it == pending_.end() || it->second.priority == priority) return false;

  Unlink(it->second);
  it->second.priority = priority;
  order_.emplace(OrderKey{priority, it->second.sequence}, key);
  return true;
}

bool RequestQueue::Remove(const ChunkKey& key) {
  auto it = pending_.find(key);
  if (it == pending_.end()) return false;
  Unlink(it->second);
  pending_.erase(it);
  return true;
}

std::size_t RequestQueue::RemoveEntry(uint64_t entry_id) {
  std::size_t removed = 0;
  auto        it      = pending_.lower_bound(ChunkKey{entry_id, 0});
  while (it != pending_.end() && it->first.entry_id == entry_id) {
    Unlink(it->second);
    it = pending_.erase(it);
    ++removed;
  }
  return removed;
}

std::optional<ChunkRequest> RequestQueue::Pop() {
  if (order_.empty()) return std::nullopt;

  auto first = order_.begin();
  auto it    = pending_.find(first->second);
  order_.erase(first);

  ChunkRequest request = it->second;
  pending_.erase(it);
  return request;
}

std::optional<Priority> RequestQueue::PriorityOf(const ChunkKey& key) const {
  auto it = pending_.find(key);
  if (it == pending_.end()) return std::nullopt;
  return it->second.priority;
}

std::vector<ChunkRequest> RequestQueue::PendingFor(uint64_t entry_id) const {
  std::vector<ChunkRequest> out;
  for (auto it = pending_.lower_bound(ChunkKey{entry_id, 0}); it != pending_.end() && it->first.entry_id == entry_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

} // namespace mediacache::chunk
