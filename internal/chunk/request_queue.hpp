#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "internal/chunk/priority.hpp"

namespace mediacache::chunk {

struct ChunkKey {
  uint64_t entry_id    = 0;
  uint64_t chunk_index = 0;

  auto operator<=>(const ChunkKey&) const = default;
};

struct ChunkRequest {
  ChunkKey key;
  Priority priority = Priority::kLow;
  uint64_t sequence = 0; // enqueue order
};

/*
  RequestQueue

  Pending chunk requests, one per key, ordered by priority then by
  enqueue order. Changing a request's priority keeps its original
  position among equals.

  Not thread-safe; the owner serializes access.
*/
class RequestQueue {
 public:
  // Inserts a request or raises the priority of the queued one.
  // Returns true when the queue changed.
  bool Push(const ChunkKey& key, Priority priority);

  // Sets the priority of a queued request in either direction.
  bool Reassign(const ChunkKey& key, Priority priority);

  bool Remove(const ChunkKey& key);

  // Drops every request of the entry, returns how many were dropped.
  std::size_t RemoveEntry(uint64_t entry_id);

  // Most urgent request, FIFO among equal priorities.
  std::optional<ChunkRequest> Pop();

  std::optional<Priority> PriorityOf(const ChunkKey& key) const;

  std::vector<ChunkRequest> PendingFor(uint64_t entry_id) const;

  std::size_t Size() const {
    return pending_.size();
  }

  bool Empty() const {
    return pending_.empty();
  }

 private:
  struct OrderKey {
    Priority priority;
    uint64_t sequence;

    auto operator<=>(const OrderKey&) const = default;
  };

  void Unlink(const ChunkRequest& request);

  std::map<ChunkKey, ChunkRequest> pending_;
  std::map<OrderKey, ChunkKey>     order_;
  uint64_t                         next_sequence_ = 0;
};

} // namespace mediacache::chunk
