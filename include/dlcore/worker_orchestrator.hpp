/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file worker_orchestrator.hpp
 * @brief Dependency-ordered lifecycle of the background workers.
 *
 * Workers are registered with a descriptor (name, category, priority,
 * required flag, dependencies) and a pair of start/stop hooks. StartAll()
 * starts them in topological order, ties broken by priority (higher first)
 * then registration order. A worker whose start fails is isolated: it and
 * everything depending on it end up FAILED, unrelated workers still start.
 *
 * Locking:
 * - op_mutex_ serializes lifecycle operations; hooks run under it.
 * - state_mutex_ guards the per-worker state fields only, so GetStatus(),
 *   IsHealthy() and ReportFailure() never wait on a hook.
 */

#ifndef DLCORE_WORKER_ORCHESTRATOR_HPP_
#define DLCORE_WORKER_ORCHESTRATOR_HPP_

#include "dlcore/clock.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <vector>

namespace dlcore {

// ============================================================================
// Worker types
// ============================================================================

/// A worker whose hooks are running keeps its previous state until they return.
enum class WorkerState : uint8_t { kStopped = 0, kRunning, kFailed };

inline const char* WorkerStateName(WorkerState state) noexcept {
  switch (state) {
    case WorkerState::kStopped: return "STOPPED";
    case WorkerState::kRunning: return "RUNNING";
    case WorkerState::kFailed:  return "FAILED";
  }
  return "UNKNOWN";
}

enum class WorkerCategory : uint8_t {
  kCritical = 0,
  kSync,
  kDownload,
  kAutomation,
  kMaintenance
};

inline const char* WorkerCategoryName(WorkerCategory category) noexcept {
  switch (category) {
    case WorkerCategory::kCritical:    return "critical";
    case WorkerCategory::kSync:        return "sync";
    case WorkerCategory::kDownload:    return "download";
    case WorkerCategory::kAutomation:  return "automation";
    case WorkerCategory::kMaintenance: return "maintenance";
  }
  return "unknown";
}

enum class OrchestratorError : uint8_t {
  kDuplicateName = 0,
  kInvalidName,
  kCapacityFull,
  kDependencyCycle,
  kUnknownWorker,
  kDependencyNotRunning,
  kAlreadyRunning,
  kNotRunning,
  kStartFailed
};

inline const char* OrchestratorErrorName(OrchestratorError error) noexcept {
  switch (error) {
    case OrchestratorError::kDuplicateName:        return "duplicate name";
    case OrchestratorError::kInvalidName:          return "invalid name";
    case OrchestratorError::kCapacityFull:         return "capacity full";
    case OrchestratorError::kDependencyCycle:      return "dependency cycle";
    case OrchestratorError::kUnknownWorker:        return "unknown worker";
    case OrchestratorError::kDependencyNotRunning: return "dependency not running";
    case OrchestratorError::kAlreadyRunning:       return "already running";
    case OrchestratorError::kNotRunning:           return "not running";
    case OrchestratorError::kStartFailed:          return "start failed";
  }
  return "unknown";
}

using WorkerName = FixedString<32>;

static constexpr uint32_t kMaxWorkerDependencies = 8U;

struct WorkerDescriptor {
  WorkerName name;
  FixedString<96> description;
  WorkerCategory category = WorkerCategory::kMaintenance;
  int32_t priority = 0;  ///< Higher starts first among ready workers.
  bool required = true;  ///< Counted by IsHealthy().
  FixedVector<WorkerName, kMaxWorkerDependencies> depends_on;
};

using WorkerStartFn = expected<void, ErrorText> (*)(void* ctx);
using WorkerStopFn = void (*)(void* ctx);

struct WorkerHooks {
  WorkerStartFn start = nullptr;
  WorkerStopFn stop = nullptr;  ///< Optional.
  void* ctx = nullptr;
};

/// Snapshot of one worker.
struct WorkerInfo {
  WorkerName name;
  WorkerCategory category = WorkerCategory::kMaintenance;
  WorkerState state = WorkerState::kStopped;
  int32_t priority = 0;
  bool required = true;
  FixedVector<WorkerName, kMaxWorkerDependencies> depends_on;
  ErrorText last_error;
  optional<uint64_t> started_at;
  optional<uint64_t> stopped_at;
  uint32_t restart_count = 0;
};

struct StartReport {
  uint32_t started = 0;
  uint32_t failed = 0;
  uint32_t skipped = 0;  ///< Already RUNNING.
};

struct OrchestratorStatus {
  std::vector<WorkerInfo> workers;
  uint32_t running = 0;
  uint32_t stopped = 0;
  uint32_t failed = 0;
  bool healthy = true;
};

struct OrchestratorConfig {
  bool auto_recovery = true;
  uint32_t max_restarts = 3;
};

// ============================================================================
// WorkerOrchestrator
// ============================================================================

template <uint32_t MaxWorkers = 32>
class WorkerOrchestrator final {
  static_assert(MaxWorkers > 0, "MaxWorkers must be greater than 0");

 public:
  using VoidResult = expected<void, OrchestratorError>;

  explicit WorkerOrchestrator(const Clock& clock,
                              const OrchestratorConfig& config = OrchestratorConfig())
      : clock_(clock), config_(config) {}

  WorkerOrchestrator(const WorkerOrchestrator&) = delete;
  WorkerOrchestrator& operator=(const WorkerOrchestrator&) = delete;

  /**
   * @brief Add a worker in STOPPED state.
   *
   * Dependencies may name workers registered later. A dependency set that
   * would close a cycle through already registered workers is rejected.
   */
  VoidResult Register(const WorkerDescriptor& descriptor,
                      const WorkerHooks& hooks) {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    if (descriptor.name.empty() || hooks.start == nullptr) {
      return VoidResult::error(OrchestratorError::kInvalidName);
    }
    if (FindIndex(descriptor.name) >= 0) {
      return VoidResult::error(OrchestratorError::kDuplicateName);
    }
    for (const WorkerName& dep : descriptor.depends_on) {
      if (dep == descriptor.name || Reaches(dep, descriptor.name)) {
        DLCORE_LOG_ERROR("Orchestrator", "'%s': dependency cycle via '%s'",
                         descriptor.name.c_str(), dep.c_str());
        return VoidResult::error(OrchestratorError::kDependencyCycle);
      }
    }

    std::lock_guard<std::mutex> state_lock(state_mutex_);
    Entry entry;
    entry.descriptor = descriptor;
    entry.hooks = hooks;
    if (!entries_.push_back(entry)) {
      return VoidResult::error(OrchestratorError::kCapacityFull);
    }
    DLCORE_LOG_DEBUG("Orchestrator", "registered '%s' (%s, priority %d)",
                     descriptor.name.c_str(),
                     WorkerCategoryName(descriptor.category),
                     static_cast<int>(descriptor.priority));
    return VoidResult::success();
  }

  /**
   * @brief Start every worker that is not RUNNING, in dependency order.
   */
  StartReport StartAll() {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    StartReport report;
    const uint32_t n = entries_.size();
    bool done[MaxWorkers] = {};

    for (uint32_t round = 0U; round < n; ++round) {
      int32_t pick = -1;
      for (uint32_t i = 0U; i < n; ++i) {
        if (done[i] || !DependenciesProcessed(i, done)) continue;
        if (pick < 0 || entries_[i].descriptor.priority >
                            entries_[static_cast<uint32_t>(pick)].descriptor.priority) {
          pick = static_cast<int32_t>(i);
        }
      }
      if (pick < 0) break;
      const uint32_t idx = static_cast<uint32_t>(pick);
      done[idx] = true;

      if (StateOf(idx) == WorkerState::kRunning) {
        ++report.skipped;
        continue;
      }
      ErrorText reason;
      if (!DependenciesRunning(idx, &reason)) {
        MarkFailed(idx, reason);
        DLCORE_LOG_WARN("Orchestrator", "'%s' not started: %s",
                        entries_[idx].descriptor.name.c_str(), reason.c_str());
        ++report.failed;
        continue;
      }
      if (StartEntry(idx)) {
        ++report.started;
      } else {
        ++report.failed;
      }
    }
    DLCORE_LOG_INFO("Orchestrator", "start all: %u started, %u failed, %u kept",
                    report.started, report.failed, report.skipped);
    return report;
  }

  /// Start one worker. All of its dependencies must be RUNNING.
  VoidResult Start(const WorkerName& name) {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    const int32_t found = FindIndex(name);
    if (found < 0) return VoidResult::error(OrchestratorError::kUnknownWorker);
    const uint32_t idx = static_cast<uint32_t>(found);
    if (StateOf(idx) == WorkerState::kRunning) {
      return VoidResult::error(OrchestratorError::kAlreadyRunning);
    }
    if (!DependenciesRunning(idx, nullptr)) {
      return VoidResult::error(OrchestratorError::kDependencyNotRunning);
    }
    if (!StartEntry(idx)) return VoidResult::error(OrchestratorError::kStartFailed);
    return VoidResult::success();
  }

  /// Stop one worker. Dependents are left alone.
  VoidResult Stop(const WorkerName& name) {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    const int32_t found = FindIndex(name);
    if (found < 0) return VoidResult::error(OrchestratorError::kUnknownWorker);
    const uint32_t idx = static_cast<uint32_t>(found);
    if (!entries_[idx].hooks_active) {
      return VoidResult::error(OrchestratorError::kNotRunning);
    }
    StopEntry(idx);
    return VoidResult::success();
  }

  /**
   * @brief Stop every started worker, most recently started first.
   * @return Number of workers stopped.
   */
  uint32_t StopAll() {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    uint32_t stopped = 0U;
    while (!start_order_.empty()) {
      const uint32_t idx = start_order_[start_order_.size() - 1U];
      start_order_.pop_back();
      if (!entries_[idx].hooks_active) continue;
      StopEntry(idx);
      ++stopped;
    }
    DLCORE_LOG_INFO("Orchestrator", "stopped %u workers", stopped);
    return stopped;
  }

  /// Stop if started, then start again. Counts as a restart.
  VoidResult Restart(const WorkerName& name) {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    const int32_t found = FindIndex(name);
    if (found < 0) return VoidResult::error(OrchestratorError::kUnknownWorker);
    const uint32_t idx = static_cast<uint32_t>(found);
    if (!DependenciesRunning(idx, nullptr)) {
      return VoidResult::error(OrchestratorError::kDependencyNotRunning);
    }
    if (entries_[idx].hooks_active) StopEntry(idx);
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      ++entries_[idx].restart_count;
    }
    if (!StartEntry(idx)) return VoidResult::error(OrchestratorError::kStartFailed);
    return VoidResult::success();
  }

  /**
   * @brief A running worker reports that it can no longer do its job.
   *
   * Safe to call from inside the worker's own thread or hooks.
   */
  VoidResult ReportFailure(const WorkerName& name, const char* message) {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    const int32_t found = FindIndex(name);
    if (found < 0) return VoidResult::error(OrchestratorError::kUnknownWorker);
    Entry& entry = entries_[static_cast<uint32_t>(found)];
    if (entry.state != WorkerState::kRunning) {
      return VoidResult::error(OrchestratorError::kNotRunning);
    }
    entry.state = WorkerState::kFailed;
    entry.last_error.assign(TruncateToCapacity, message);
    entry.reported_failure = true;
    DLCORE_LOG_ERROR("Orchestrator", "'%s' reported failure: %s",
                     name.c_str(), entry.last_error.c_str());
    return VoidResult::success();
  }

  /**
   * @brief Auto-recovery pass: restart workers that failed while running,
   *        at most max_restarts times each.
   * @return Number of workers restarted.
   */
  uint32_t Supervise() {
    std::lock_guard<std::mutex> op_lock(op_mutex_);
    if (!config_.auto_recovery) return 0U;
    uint32_t restarted = 0U;
    for (uint32_t idx = 0U; idx < entries_.size(); ++idx) {
      bool candidate = false;
      uint32_t restarts = 0U;
      {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        const Entry& entry = entries_[idx];
        candidate = entry.state == WorkerState::kFailed && entry.reported_failure;
        restarts = entry.restart_count;
      }
      if (!candidate) continue;
      if (restarts >= config_.max_restarts) {
        if (!entries_[idx].gave_up) {
          entries_[idx].gave_up = true;
          DLCORE_LOG_ERROR("Orchestrator", "'%s' exceeded %u restarts, giving up",
                           entries_[idx].descriptor.name.c_str(),
                           config_.max_restarts);
        }
        continue;
      }
      if (!DependenciesRunning(idx, nullptr)) continue;

      if (entries_[idx].hooks_active) StopEntry(idx);
      {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        ++entries_[idx].restart_count;
      }
      DLCORE_LOG_WARN("Orchestrator", "auto-restarting '%s' (%u/%u)",
                      entries_[idx].descriptor.name.c_str(), restarts + 1U,
                      config_.max_restarts);
      if (StartEntry(idx)) {
        ++restarted;
      } else {
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        entries_[idx].reported_failure = true;
      }
    }
    return restarted;
  }

  /// TimerTaskFn adapter; @p ctx is the WorkerOrchestrator.
  static void SuperviseTick(void* ctx) {
    (void)static_cast<WorkerOrchestrator*>(ctx)->Supervise();
  }

  /// True iff every required worker is RUNNING.
  bool IsHealthy() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    for (const Entry& entry : entries_) {
      if (entry.descriptor.required && entry.state != WorkerState::kRunning) {
        return false;
      }
    }
    return true;
  }

  OrchestratorStatus GetStatus() const {
    OrchestratorStatus status;
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    status.workers.reserve(entries_.size());
    for (const Entry& entry : entries_) {
      WorkerInfo info;
      info.name = entry.descriptor.name;
      info.category = entry.descriptor.category;
      info.state = entry.state;
      info.priority = entry.descriptor.priority;
      info.required = entry.descriptor.required;
      info.depends_on = entry.descriptor.depends_on;
      info.last_error = entry.last_error;
      info.started_at = entry.started_at;
      info.stopped_at = entry.stopped_at;
      info.restart_count = entry.restart_count;
      status.workers.push_back(info);
      switch (entry.state) {
        case WorkerState::kRunning: ++status.running; break;
        case WorkerState::kFailed:  ++status.failed; break;
        case WorkerState::kStopped: ++status.stopped; break;
      }
      if (entry.descriptor.required && entry.state != WorkerState::kRunning) {
        status.healthy = false;
      }
    }
    return status;
  }

  optional<WorkerState> StateOf(const WorkerName& name) const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    const int32_t found = FindIndex(name);
    if (found < 0) return optional<WorkerState>();
    return entries_[static_cast<uint32_t>(found)].state;
  }

  uint32_t WorkerCount() const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return entries_.size();
  }

 private:
  struct Entry {
    WorkerDescriptor descriptor;
    WorkerHooks hooks;
    WorkerState state = WorkerState::kStopped;
    ErrorText last_error;
    optional<uint64_t> started_at;
    optional<uint64_t> stopped_at;
    uint32_t restart_count = 0;
    bool hooks_active = false;      ///< start hook succeeded, stop not yet run
    bool reported_failure = false;  ///< FAILED while running; eligible for recovery
    bool gave_up = false;
  };

  int32_t FindIndex(const WorkerName& name) const {
    for (uint32_t i = 0U; i < entries_.size(); ++i) {
      if (entries_[i].descriptor.name == name) return static_cast<int32_t>(i);
    }
    return -1;
  }

  /// True if @p from transitively depends on @p target (registered workers only).
  bool Reaches(const WorkerName& from, const WorkerName& target) const {
    bool visited[MaxWorkers] = {};
    int32_t stack[MaxWorkers];
    uint32_t top = 0U;
    const int32_t start = FindIndex(from);
    if (start < 0) return false;
    stack[top++] = start;
    visited[start] = true;
    while (top > 0U) {
      const Entry& entry = entries_[static_cast<uint32_t>(stack[--top])];
      for (const WorkerName& dep : entry.descriptor.depends_on) {
        if (dep == target) return true;
        const int32_t next = FindIndex(dep);
        if (next >= 0 && !visited[next]) {
          visited[next] = true;
          stack[top++] = next;
        }
      }
    }
    return false;
  }

  bool DependenciesProcessed(uint32_t idx, const bool* done) const {
    for (const WorkerName& dep : entries_[idx].descriptor.depends_on) {
      const int32_t d = FindIndex(dep);
      if (d >= 0 && !done[d]) return false;
    }
    return true;
  }

  bool DependenciesRunning(uint32_t idx, ErrorText* reason) const {
    for (const WorkerName& dep : entries_[idx].descriptor.depends_on) {
      const int32_t d = FindIndex(dep);
      char buf[ErrorText::capacity() + 1U];
      if (d < 0) {
        if (reason != nullptr) {
          std::snprintf(buf, sizeof(buf), "unknown dependency '%s'", dep.c_str());
          reason->assign(TruncateToCapacity, buf);
        }
        return false;
      }
      if (StateOf(static_cast<uint32_t>(d)) != WorkerState::kRunning) {
        if (reason != nullptr) {
          std::snprintf(buf, sizeof(buf), "dependency '%s' not running",
                        dep.c_str());
          reason->assign(TruncateToCapacity, buf);
        }
        return false;
      }
    }
    return true;
  }

  WorkerState StateOf(uint32_t idx) const {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    return entries_[idx].state;
  }

  void MarkFailed(uint32_t idx, const ErrorText& reason) {
    std::lock_guard<std::mutex> state_lock(state_mutex_);
    entries_[idx].state = WorkerState::kFailed;
    entries_[idx].last_error = reason;
    entries_[idx].reported_failure = false;
  }

  /// Runs the start hook with op_mutex_ held.
  bool StartEntry(uint32_t idx) {
    Entry& entry = entries_[idx];
    // A worker that reported failure still holds its resources.
    if (entry.hooks_active) StopEntry(idx);
    auto started = entry.hooks.start(entry.hooks.ctx);
    if (!started.has_value()) {
      MarkFailed(idx, started.get_error());
      DLCORE_LOG_ERROR("Orchestrator", "'%s' failed to start: %s",
                       entry.descriptor.name.c_str(),
                       started.get_error().c_str());
      return false;
    }
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      entry.state = WorkerState::kRunning;
      entry.started_at = clock_.NowMs();
      entry.last_error.clear();
      entry.reported_failure = false;
      entry.gave_up = false;
      entry.hooks_active = true;
    }
    (void)start_order_.push_back(idx);
    DLCORE_LOG_INFO("Orchestrator", "'%s' running", entry.descriptor.name.c_str());
    return true;
  }

  /// Runs the stop hook with op_mutex_ held.
  void StopEntry(uint32_t idx) {
    Entry& entry = entries_[idx];
    if (entry.hooks.stop != nullptr) entry.hooks.stop(entry.hooks.ctx);
    {
      std::lock_guard<std::mutex> state_lock(state_mutex_);
      entry.state = WorkerState::kStopped;
      entry.reported_failure = false;
      entry.stopped_at = clock_.NowMs();
      entry.hooks_active = false;
    }
    for (uint32_t i = 0U; i < start_order_.size(); ++i) {
      if (start_order_[i] == idx) {
        for (uint32_t j = i; j + 1U < start_order_.size(); ++j) {
          start_order_[j] = start_order_[j + 1U];
        }
        start_order_.pop_back();
        break;
      }
    }
    DLCORE_LOG_INFO("Orchestrator", "'%s' stopped", entry.descriptor.name.c_str());
  }

  const Clock& clock_;
  OrchestratorConfig config_;
  std::mutex op_mutex_;
  mutable std::mutex state_mutex_;
  FixedVector<Entry, MaxWorkers> entries_;
  FixedVector<uint32_t, MaxWorkers> start_order_;  ///< Indices, oldest first.
};

}  // namespace dlcore

#endif  // DLCORE_WORKER_ORCHESTRATOR_HPP_
