#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace mediacache::chunk {

/*
  CancellationToken

  Shared by every wait issued on behalf of one client request. Cancel()
  runs the registered callbacks outside the token lock, so a callback
  may take other locks freely.
*/
class CancellationToken {
 public:
  using Callback = std::function<void()>;

  void Cancel() {
    std::vector<Callback> callbacks;
    {
      std::lock_guard lock(mutex_);
      if (cancelled_.exchange(true)) return;
      for (auto& [id, cb] : callbacks_) callbacks.push_back(std::move(cb));
      callbacks_.clear();
    }
    for (auto& cb : callbacks) cb();
  }

  bool IsCancelled() const {
    return cancelled_.load();
  }

  // Runs the callback immediately when already cancelled.
  uint64_t Subscribe(Callback callback) {
    {
      std::lock_guard lock(mutex_);
      if (!cancelled_) {
        const uint64_t id = next_id_++;
        callbacks_.emplace(id, std::move(callback));
        return id;
      }
    }
    callback();
    return 0;
  }

  void Unsubscribe(uint64_t id) {
    std::lock_guard lock(mutex_);
    callbacks_.erase(id);
  }

 private:
  std::mutex                   mutex_;
  std::atomic<bool>            cancelled_{false};
  std::map<uint64_t, Callback> callbacks_;
  uint64_t                     next_id_ = 1;
};

} // namespace mediacache::chunk
