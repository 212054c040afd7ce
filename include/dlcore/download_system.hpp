/**
 * @file download_system.hpp
 * @brief Composition root: owns and wires every download component.
 *
 * Two workers run on two timer threads so neither blocks the other's tick:
 *
 *   retry_scheduler   maintenance timer, priority 20
 *   queue_dispatcher  dispatch timer,    priority 10, depends on retry_scheduler
 *
 * Worker start/stop hooks only add or remove the periodic task; the timer
 * threads themselves run from Start() to Stop(). Tests skip the threads:
 * StartWorkers(), advance a ManualClock, then RunDueTasks().
 */

#ifndef DLCORE_DOWNLOAD_SYSTEM_HPP_
#define DLCORE_DOWNLOAD_SYSTEM_HPP_

#include "dlcore/circuit_breaker.hpp"
#include "dlcore/clock.hpp"
#include "dlcore/config.hpp"
#include "dlcore/download_job.hpp"
#include "dlcore/job_events.hpp"
#include "dlcore/job_queue.hpp"
#include "dlcore/job_store.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/queue_dispatcher.hpp"
#include "dlcore/retry_scheduler.hpp"
#include "dlcore/timer.hpp"
#include "dlcore/transfer_provider.hpp"
#include "dlcore/vocabulary.hpp"
#include "dlcore/worker_orchestrator.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dlcore {

static constexpr char kRetryWorkerName[] = "retry_scheduler";
static constexpr char kDispatchWorkerName[] = "queue_dispatcher";

class DownloadSystem final {
 public:
  using Orchestrator = WorkerOrchestrator<16>;
  using Timer = TimerScheduler<8>;

  /**
   * @param store  Job persistence; an InMemoryJobStore when null.
   */
  explicit DownloadSystem(const Clock& clock,
                          const SystemConfig& config = SystemConfig(),
                          std::unique_ptr<JobStore> store = nullptr)
      : clock_(clock),
        config_(config),
        store_(store ? std::move(store)
                     : std::unique_ptr<JobStore>(new InMemoryJobStore())),
        feed_(config.event_history),
        queue_(*store_, feed_, clock),
        breakers_(clock, config.breaker),
        retry_(queue_, clock, config.retry),
        dispatcher_(queue_, breakers_, providers_, retry_, config.dispatcher),
        dispatch_timer_(clock),
        maintenance_timer_(clock),
        orchestrator_(clock, config.orchestrator) {
    for (const BreakerOverride& entry : config.breaker_overrides) {
      breakers_.Configure(entry.name, entry.config);
    }
    RegisterWorkers();
  }

  ~DownloadSystem() { Stop(); }

  DownloadSystem(const DownloadSystem&) = delete;
  DownloadSystem& operator=(const DownloadSystem&) = delete;

  // --------------------------------------------------------------------------
  // Lifecycle
  // --------------------------------------------------------------------------

  /// Start both timer threads, then every worker.
  expected<StartReport, TimerError> Start() {
    auto dispatch = dispatch_timer_.Start();
    if (!dispatch.has_value() && dispatch.get_error() != TimerError::kAlreadyRunning) {
      return expected<StartReport, TimerError>::error(dispatch.get_error());
    }
    auto maintenance = maintenance_timer_.Start();
    if (!maintenance.has_value() &&
        maintenance.get_error() != TimerError::kAlreadyRunning) {
      dispatch_timer_.Stop();
      return expected<StartReport, TimerError>::error(maintenance.get_error());
    }
    return expected<StartReport, TimerError>::success(StartWorkers());
  }

  /// Start workers and supervision without timer threads.
  StartReport StartWorkers() {
    StartReport report = orchestrator_.StartAll();
    if (config_.orchestrator.auto_recovery && !supervise_task_.has_value()) {
      auto task = maintenance_timer_.Add(config_.supervise_interval_ms,
                                         &Orchestrator::SuperviseTick,
                                         &orchestrator_);
      if (task.has_value()) {
        supervise_task_ = task.value();
      } else {
        DLCORE_LOG_WARN("System", "supervision disabled: no timer slot");
      }
    }
    DLCORE_LOG_INFO("System", "started: %u workers running, healthy=%s",
                    report.started + report.skipped,
                    orchestrator_.IsHealthy() ? "yes" : "no");
    return report;
  }

  /// Stop every worker, then the timer threads. Idempotent.
  void Stop() {
    (void)orchestrator_.StopAll();
    if (supervise_task_.has_value()) {
      (void)maintenance_timer_.Remove(supervise_task_.value());
      supervise_task_.reset();
    }
    dispatch_timer_.Stop();
    maintenance_timer_.Stop();
  }

  /// Fire due periodic tasks once on the calling thread.
  uint32_t RunDueTasks() {
    return maintenance_timer_.RunDue() + dispatch_timer_.RunDue();
  }

  // --------------------------------------------------------------------------
  // Providers
  // --------------------------------------------------------------------------

  bool RegisterProvider(const DependencyName& name, TransferProvider* provider) {
    return providers_.Register(name, provider);
  }

  void SetBlocklist(const SourceBlocklist* blocklist) {
    dispatcher_.SetBlocklist(blocklist);
  }

  // --------------------------------------------------------------------------
  // Queries
  // --------------------------------------------------------------------------

  JobQueue::Result GetJob(JobId id) const { return queue_.Get(id); }

  JobPage ListJobs(const JobFilter& filter, uint32_t offset, uint32_t limit) const {
    return queue_.List(filter, offset, limit);
  }

  QueueStats QueueStatistics() const { return queue_.Stats(); }

  optional<CircuitBreakerSnapshot> BreakerSnapshot(const DependencyName& name) const {
    return breakers_.Snapshot(name);
  }

  std::vector<CircuitBreakerSnapshot> BreakerSnapshots() const {
    return breakers_.SnapshotAll();
  }

  OrchestratorStatus WorkerStatus() const { return orchestrator_.GetStatus(); }

  bool IsHealthy() const { return orchestrator_.IsHealthy(); }

  // --------------------------------------------------------------------------
  // Commands
  // --------------------------------------------------------------------------

  /// A request pre-filled with the configured retry budget.
  NewJob MakeJob(const std::string& track_reference,
                 const DependencyName& dependency) const {
    NewJob request;
    request.track_reference = track_reference;
    request.dependency = dependency;
    request.max_retries = config_.default_max_retries;
    return request;
  }

  /// New jobs for a dependency whose breaker is OPEN start as WAITING.
  expected<JobId, JobError> Enqueue(NewJob request) {
    if (!request.dependency.empty() &&
        breakers_.StateOf(request.dependency) == BreakerState::kOpen &&
        request.initial_status != JobStatus::kWaiting) {
      DLCORE_LOG_DEBUG("System", "'%s' is open, enqueueing as WAITING",
                       request.dependency.c_str());
      request.initial_status = JobStatus::kWaiting;
    }
    return queue_.Enqueue(request);
  }

  JobQueue::Result Cancel(JobId id) { return dispatcher_.CancelJob(id); }
  JobQueue::Result Pause(JobId id) { return dispatcher_.PauseJob(id); }
  JobQueue::Result Resume(JobId id) { return queue_.Resume(id); }
  JobQueue::Result SetPriority(JobId id, int32_t priority) {
    return queue_.SetPriority(id, priority);
  }
  JobQueue::Result Retry(JobId id) { return queue_.Retry(id); }

  BatchResult CancelMany(const std::vector<JobId>& ids) {
    return ApplyToEach(ids, [this](JobId id) { return dispatcher_.CancelJob(id); });
  }
  BatchResult PauseMany(const std::vector<JobId>& ids) {
    return ApplyToEach(ids, [this](JobId id) { return dispatcher_.PauseJob(id); });
  }
  BatchResult ResumeMany(const std::vector<JobId>& ids) {
    return queue_.ResumeMany(ids);
  }
  BatchResult SetPriorityMany(const std::vector<JobId>& ids, int32_t priority) {
    return queue_.SetPriorityMany(ids, priority);
  }
  BatchResult RetryMany(const std::vector<JobId>& ids) {
    return queue_.RetryMany(ids);
  }
  BatchResult RetryAllFailed() { return queue_.RetryAllFailed(); }

  void PauseDispatching() { dispatcher_.Pause(); }
  void ResumeDispatching() { dispatcher_.Resume(); }
  bool IsDispatchingPaused() const noexcept { return dispatcher_.IsPaused(); }

  void ResetBreaker(const DependencyName& name) { breakers_.Reset(name); }

  Orchestrator::VoidResult StartWorker(const WorkerName& name) {
    return orchestrator_.Start(name);
  }
  Orchestrator::VoidResult StopWorker(const WorkerName& name) {
    return orchestrator_.Stop(name);
  }
  Orchestrator::VoidResult RestartWorker(const WorkerName& name) {
    return orchestrator_.Restart(name);
  }

  // --------------------------------------------------------------------------
  // Components
  // --------------------------------------------------------------------------

  JobQueue& Queue() noexcept { return queue_; }
  JobEventFeed& Events() noexcept { return feed_; }
  CircuitBreakerRegistry& Breakers() noexcept { return breakers_; }
  RetryScheduler& Retries() noexcept { return retry_; }
  QueueDispatcher& Dispatcher() noexcept { return dispatcher_; }
  ProviderRegistry& Providers() noexcept { return providers_; }
  Orchestrator& Workers() noexcept { return orchestrator_; }
  const SystemConfig& Settings() const noexcept { return config_; }

 private:
  void RegisterWorkers() {
    WorkerDescriptor retry_worker;
    retry_worker.name = WorkerName(kRetryWorkerName);
    retry_worker.description = "Schedules backoff retries of failed jobs";
    retry_worker.category = WorkerCategory::kDownload;
    retry_worker.priority = 20;
    retry_worker.required = true;
    WorkerHooks retry_hooks;
    retry_hooks.start = &DownloadSystem::StartRetryWorker;
    retry_hooks.stop = &DownloadSystem::StopRetryWorker;
    retry_hooks.ctx = this;

    WorkerDescriptor dispatch_worker;
    dispatch_worker.name = WorkerName(kDispatchWorkerName);
    dispatch_worker.description = "Starts eligible jobs under the concurrency cap";
    dispatch_worker.category = WorkerCategory::kDownload;
    dispatch_worker.priority = 10;
    dispatch_worker.required = true;
    (void)dispatch_worker.depends_on.push_back(WorkerName(kRetryWorkerName));
    WorkerHooks dispatch_hooks;
    dispatch_hooks.start = &DownloadSystem::StartDispatchWorker;
    dispatch_hooks.stop = &DownloadSystem::StopDispatchWorker;
    dispatch_hooks.ctx = this;

    auto r1 = orchestrator_.Register(retry_worker, retry_hooks);
    auto r2 = orchestrator_.Register(dispatch_worker, dispatch_hooks);
    if (!r1.has_value() || !r2.has_value()) {
      DLCORE_LOG_FATAL("System", "built-in worker registration failed");
    }
  }

  static expected<void, ErrorText> AddTask(Timer& timer, uint32_t period_ms,
                                           TimerTaskFn fn, void* ctx,
                                           optional<TimerTaskId>& slot) {
    if (slot.has_value()) return expected<void, ErrorText>::success();
    auto task = timer.Add(period_ms, fn, ctx);
    if (!task.has_value()) {
      return expected<void, ErrorText>::error(
          task.get_error() == TimerError::kSlotsFull
              ? ErrorText("timer slots full")
              : ErrorText("invalid timer period"));
    }
    slot = task.value();
    return expected<void, ErrorText>::success();
  }

  static void RemoveTask(Timer& timer, optional<TimerTaskId>& slot) {
    if (!slot.has_value()) return;
    (void)timer.Remove(slot.value());
    slot.reset();
  }

  static expected<void, ErrorText> StartRetryWorker(void* ctx) {
    auto* self = static_cast<DownloadSystem*>(ctx);
    return AddTask(self->maintenance_timer_, self->config_.retry_sweep_interval_ms,
                   &RetryScheduler::SweepTick, &self->retry_, self->retry_task_);
  }

  static void StopRetryWorker(void* ctx) {
    auto* self = static_cast<DownloadSystem*>(ctx);
    RemoveTask(self->maintenance_timer_, self->retry_task_);
  }

  static expected<void, ErrorText> StartDispatchWorker(void* ctx) {
    auto* self = static_cast<DownloadSystem*>(ctx);
    return AddTask(self->dispatch_timer_, self->config_.dispatcher.tick_interval_ms,
                   &QueueDispatcher::TickThunk, &self->dispatcher_,
                   self->dispatch_task_);
  }

  static void StopDispatchWorker(void* ctx) {
    auto* self = static_cast<DownloadSystem*>(ctx);
    RemoveTask(self->dispatch_timer_, self->dispatch_task_);
  }

  const Clock& clock_;
  SystemConfig config_;
  std::unique_ptr<JobStore> store_;
  JobEventFeed feed_;
  JobQueue queue_;
  CircuitBreakerRegistry breakers_;
  RetryScheduler retry_;
  ProviderRegistry providers_;
  QueueDispatcher dispatcher_;
  Timer dispatch_timer_;
  Timer maintenance_timer_;
  Orchestrator orchestrator_;

  optional<TimerTaskId> retry_task_;
  optional<TimerTaskId> dispatch_task_;
  optional<TimerTaskId> supervise_task_;
};

}  // namespace dlcore

#endif  // DLCORE_DOWNLOAD_SYSTEM_HPP_
