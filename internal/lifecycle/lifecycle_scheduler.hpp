#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace engram::knowledge {
class KnowledgeStore;
}

namespace engram::lifecycle {

class LifecycleManager;

/*
  Background lifecycle loop.

  Each tick runs the TTL cleanup, the reindex check (a mismatch is logged,
  never fixed automatically) and, when a store is attached, the active
  version reconciliation. A failing tick is logged and the loop goes on.

  Start() and Stop() are idempotent. Stop() wakes the loop and joins it.
*/
class LifecycleScheduler {
 public:
  LifecycleScheduler(std::shared_ptr<LifecycleManager> manager, std::shared_ptr<knowledge::KnowledgeStore> store,
                     std::chrono::milliseconds interval);
  ~LifecycleScheduler();

  LifecycleScheduler(const LifecycleScheduler&)            = delete;
  LifecycleScheduler& operator=(const LifecycleScheduler&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

  // One synchronous tick. Never throws.
  void RunOnce() noexcept;

  std::uint64_t Ticks() const {
    return ticks_;
  }

 private:
  void Loop();

  std::shared_ptr<LifecycleManager>          manager_;
  std::shared_ptr<knowledge::KnowledgeStore> store_;
  std::chrono::milliseconds                  interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::atomic<std::uint64_t> ticks_{0};
};

} // namespace engram::lifecycle
