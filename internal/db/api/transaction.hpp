#pragma once

namespace mediacache::db {

/*
  Unit of work against the cache index.

  Every backend guarantees:

  - chunk and entry writes stay invisible until Commit()
  - Rollback() or destruction without Commit() discards them
  - the backend's write lock (sqlite connection mutex, memory snapshot
    mutex) is held from Begin() until Commit() or Rollback(), not until
    destruction, so a finished transaction left in scope never blocks the
    next Begin() on the same thread

  CacheIndex opens exactly one transaction per public call.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  // true once Commit() or Rollback() ran
  virtual bool IsCommitted() const = 0;
};

} // namespace mediacache::db
