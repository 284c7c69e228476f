#include "internal/chunk/request_queue.hpp"

#include <cassert>
#include <iostream>

namespace {

using mediacache::chunk::ChunkKey;
using mediacache::chunk::Priority;
using mediacache::chunk::RequestQueue;

void TestPopsByPriorityThenFifo() {
  RequestQueue queue;
  assert(queue.Push({1, 0}, Priority::kLow));
  assert(queue.Push({1, 1}, Priority::kHigh));
  assert(queue.Push({1, 2}, Priority::kMedium));
  assert(queue.Push({1, 3}, Priority::kHigh));
  assert(queue.Push({2, 0}, Priority::kCritical));

  assert(queue.Pop()->key == (ChunkKey{2, 0}));
  assert(queue.Pop()->key == (ChunkKey{1, 1}));
  assert(queue.Pop()->key == (ChunkKey{1, 3}));
  assert(queue.Pop()->key == (ChunkKey{1, 2}));
  assert(queue.Pop()->key == (ChunkKey{1, 0}));
  assert(!queue.Pop());
  assert(queue.Empty());
}

void TestPushOnlyRaisesPriority() {
  RequestQueue queue;
  assert(queue.Push({1, 0}, Priority::kHigh));
  assert(queue.Size() == 1);

  // same or lower priority leaves the request alone
  assert(!queue.Push({1, 0}, Priority::kHigh));
  assert(!queue.Push({1, 0}, Priority::kLow));
  assert(queue.PriorityOf({1, 0}) == Priority::kHigh);

  assert(queue.Push({1, 0}, Priority::kCritical));
  assert(queue.PriorityOf({1, 0}) == Priority::kCritical);
  assert(queue.Size() == 1);
}

void TestUpgradeKeepsOriginalOrder() {
  RequestQueue queue;
  queue.Push({1, 0}, Priority::kLow);
  queue.Push({1, 1}, Priority::kHigh);

  // enqueued first, so it precedes the other HIGH request once raised
  queue.Push({1, 0}, Priority::kHigh);
  assert(queue.Pop()->key == (ChunkKey{1, 0}));
  assert(queue.Pop()->key == (ChunkKey{1, 1}));
}

void TestReassignLowersPriority() {
  RequestQueue queue;
  queue.Push({1, 0}, Priority::kHigh);
  queue.Push({1, 1}, Priority::kMedium);

  assert(queue.Reassign({1, 0}, Priority::kLow));
  assert(!queue.Reassign({1, 0}, Priority::kLow));
  assert(!queue.Reassign({9, 9}, Priority::kLow));

  assert(queue.Pop()->key == (ChunkKey{1, 1}));
  auto last = queue.Pop();
  assert(last->key == (ChunkKey{1, 0}) && last->priority == Priority::kLow);
}

void TestRemoveAndRemoveEntry() {
  RequestQueue queue;
  queue.Push({1, 0}, Priority::kLow);
  queue.Push({1, 1}, Priority::kLow);
  queue.Push({2, 0}, Priority::kLow);
  queue.Push({3, 5}, Priority::kHigh);

  assert(queue.Remove({3, 5}));
  assert(!queue.Remove({3, 5}));
  assert(queue.PendingFor(1).size() == 2);

  assert(queue.RemoveEntry(1) == 2);
  assert(queue.PendingFor(1).empty());
  assert(queue.Size() == 1);
  assert(queue.Pop()->key == (ChunkKey{2, 0}));
}

} // namespace

int main() {
  TestPopsByPriorityThenFifo();
  TestPushOnlyRaisesPriority();
  TestUpgradeKeepsOriginalOrder();
  TestReassignLowersPriority();
  TestRemoveAndRemoveEntry();

  std::cout << "mediacache_unit_request_queue: pass\n";
  return 0;
}
