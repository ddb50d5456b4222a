#include "internal/lifecycle/lifecycle_scheduler.hpp"

#include <stdexcept>
#include <system_error>

#include "internal/knowledge/knowledge_store.hpp"
#include "internal/lifecycle/lifecycle_manager.hpp"
#include "internal/observability/logging.hpp"

namespace engram::lifecycle {

using observability::IntField;
using observability::StringField;

LifecycleScheduler::LifecycleScheduler(std::shared_ptr<LifecycleManager> manager, std::shared_ptr<knowledge::KnowledgeStore> store,
                                       std::chrono::milliseconds interval)
    : manager_(std::move(manager)), store_(std::move(store)), interval_(interval) {
  if (!manager_) throw std::invalid_argument("LifecycleScheduler: manager is null");
  if (interval_.count() <= 0) throw std::invalid_argument("LifecycleScheduler: interval must be positive");
}

LifecycleScheduler::~LifecycleScheduler() {
  try {
    Stop();
  } catch (const std::system_error& e) {
    ENGRAM_LOG_ERROR("lifecycle scheduler shutdown failed", {StringField("error", e.what())});
  }
}

void LifecycleScheduler::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;

  thread_ = std::thread(&LifecycleScheduler::Loop, this);
  ENGRAM_LOG_INFO("lifecycle scheduler started", {IntField("interval_ms", interval_.count())});
}

void LifecycleScheduler::Stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.exchange(false) && !thread_.joinable()) return;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
  ENGRAM_LOG_INFO("lifecycle scheduler stopped", {IntField("ticks", static_cast<std::int64_t>(ticks_.load()))});
}

void LifecycleScheduler::RunOnce() noexcept {
  try {
    const auto report = manager_->CleanupExpired();
    if (report.total_deleted > 0) {
      ENGRAM_LOG_INFO("lifecycle tick removed expired entries", {IntField("deleted", static_cast<std::int64_t>(report.total_deleted))});
    }

    const auto reindex = manager_->CheckReindexNeeded();
    for (const auto& [name, status] : reindex.collections) {
      if (!status.needs_reindex) continue;
      ENGRAM_LOG_WARN("embedding model changed; collection needs reindex",
                      {StringField("collection", name), StringField("stored_model", status.stored_model),
                       StringField("stored_version", status.stored_version), StringField("current_model", status.current_model),
                       StringField("current_version", status.current_version)});
    }

    if (store_) store_->ReconcileActiveVersions();
  } catch (const std::exception& e) {
    ENGRAM_LOG_ERROR("lifecycle tick failed", {StringField("error", e.what())});
  }
  ++ticks_;
}

void LifecycleScheduler::Loop() {
  while (running_) {
    RunOnce();

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, interval_, [this] { return !running_; });
  }
}

} // namespace engram::lifecycle
