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
 * @file queue_dispatcher.hpp
 * @brief Moves eligible jobs into transfer under a global concurrency cap.
 *
 * One Tick():
 *   1. bail out if paused or the cap is already reached;
 *   2. fetch up to (cap - DOWNLOADING) eligible jobs in dispatch order;
 *   3. ask the dependency's breaker for admission, skipping refused jobs
 *      without touching them;
 *   4. claim the job (compare-and-set) and submit it to its provider.
 *
 * Only selection holds slot_mutex_. Each selected job reserves a slot until
 * its claim lands, and DOWNLOADING plus reserved never exceeds the cap.
 * Breaker, claim and provider calls run per job with no shared lock, so a
 * slow provider never delays another job's dispatch. Outcomes arrive
 * through the TransferSink interface and are matched to the claim by the
 * attempt number; callbacks for an older attempt are dropped.
 *
 * Breaker signalling:
 * - completion records a success;
 * - a retryable failure (including a Submit() error) records a failure;
 * - a permanent failure is a property of the job, not the dependency, and
 *   only gives back the probe if this attempt held it.
 */

#ifndef DLCORE_QUEUE_DISPATCHER_HPP_
#define DLCORE_QUEUE_DISPATCHER_HPP_

#include "dlcore/circuit_breaker.hpp"
#include "dlcore/download_job.hpp"
#include "dlcore/job_queue.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/retry_scheduler.hpp"
#include "dlcore/transfer_provider.hpp"
#include "dlcore/vocabulary.hpp"

#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace dlcore {

struct DispatcherConfig {
  uint32_t max_concurrent = 3;      ///< 1..kMaxConcurrentLimit
  uint32_t tick_interval_ms = 5000;
  bool start_paused = false;
};

static constexpr uint32_t kMaxConcurrentLimit = 256U;

struct DispatcherStats {
  uint64_t ticks = 0;
  uint64_t dispatched = 0;
  uint64_t refused_by_breaker = 0;
  uint64_t claim_conflicts = 0;
  uint64_t submit_failures = 0;
  uint64_t completed = 0;
  uint64_t failed = 0;
  uint64_t blocked = 0;
  uint64_t unroutable = 0;     ///< No provider registered for the dependency.
  uint64_t stale_callbacks = 0;
};

// ============================================================================
// QueueDispatcher
// ============================================================================

class QueueDispatcher final : public TransferSink {
 public:
  QueueDispatcher(JobQueue& queue, CircuitBreakerRegistry& breakers,
                  ProviderRegistry& providers, RetryScheduler& retry,
                  const DispatcherConfig& config = DispatcherConfig(),
                  const SourceBlocklist* blocklist = nullptr)
      : queue_(queue),
        breakers_(breakers),
        providers_(providers),
        retry_(retry),
        blocklist_(blocklist),
        max_concurrent_(Clamp(config.max_concurrent)),
        paused_(config.start_paused) {}

  QueueDispatcher(const QueueDispatcher&) = delete;
  QueueDispatcher& operator=(const QueueDispatcher&) = delete;

  /**
   * @brief Run one dispatch pass.
   * @return Number of jobs handed to a provider.
   */
  uint32_t Tick() {
    stats_.ticks.fetch_add(1U, std::memory_order_relaxed);
    std::vector<DownloadJob> batch;
    const SourceBlocklist* blocklist = nullptr;
    uint32_t running = 0U;
    {
      std::lock_guard<std::mutex> slot_lock(slot_mutex_);
      if (paused_.load(std::memory_order_acquire)) return 0U;
      const uint32_t cap = max_concurrent_.load(std::memory_order_relaxed);
      running = queue_.CountDownloading();
      const uint32_t busy = running + static_cast<uint32_t>(reserved_.size());
      if (busy >= cap) return 0U;
      const uint32_t room = cap - busy;
      // Jobs reserved by a concurrent tick are still eligible until claimed.
      const uint32_t fetch = room + static_cast<uint32_t>(reserved_.size());
      for (const DownloadJob& job : queue_.NextEligible(fetch)) {
        if (batch.size() >= room) break;
        if (IsReserved(job.id)) continue;
        reserved_.push_back(job.id);
        batch.push_back(job);
      }
      blocklist = blocklist_;
    }

    uint32_t dispatched = 0U;
    for (const DownloadJob& job : batch) {
      if (Dispatch(job, blocklist)) ++dispatched;
    }
    if (dispatched > 0U) {
      DLCORE_LOG_DEBUG("Dispatcher", "tick: %u dispatched, %u already running",
                       dispatched, running);
    }
    return dispatched;
  }

  /// TimerTaskFn adapter; @p ctx is the QueueDispatcher.
  static void TickThunk(void* ctx) {
    (void)static_cast<QueueDispatcher*>(ctx)->Tick();
  }

  /// Stop starting new transfers. In-flight transfers run to completion.
  void Pause() {
    if (!paused_.exchange(true, std::memory_order_acq_rel)) {
      DLCORE_LOG_INFO("Dispatcher", "dispatching paused");
    }
  }

  void Resume() {
    if (paused_.exchange(false, std::memory_order_acq_rel)) {
      DLCORE_LOG_INFO("Dispatcher", "dispatching resumed");
    }
  }

  bool IsPaused() const noexcept {
    return paused_.load(std::memory_order_acquire);
  }

  /// @return false if @p limit is outside 1..kMaxConcurrentLimit.
  bool SetMaxConcurrent(uint32_t limit) {
    if (limit == 0U || limit > kMaxConcurrentLimit) return false;
    max_concurrent_.store(limit, std::memory_order_relaxed);
    return true;
  }

  uint32_t MaxConcurrent() const noexcept {
    return max_concurrent_.load(std::memory_order_relaxed);
  }

  void SetBlocklist(const SourceBlocklist* blocklist) {
    std::lock_guard<std::mutex> slot_lock(slot_mutex_);
    blocklist_ = blocklist;
  }

  /**
   * @brief User cancel. Applied to the job first, then the provider is asked
   *        to abort a running transfer. A provider error is only logged.
   */
  JobQueue::Result CancelJob(JobId id) {
    DownloadJob previous;
    auto result = queue_.Cancel(id, &previous);
    if (result.has_value()) AbortTransfer(previous, "cancel");
    return result;
  }

  /// User pause, with the same provider handling as CancelJob().
  JobQueue::Result PauseJob(JobId id) {
    DownloadJob previous;
    auto result = queue_.Pause(id, &previous);
    if (result.has_value()) AbortTransfer(previous, "pause");
    return result;
  }

  DispatcherStats Stats() const {
    DispatcherStats out;
    out.ticks = stats_.ticks.load(std::memory_order_relaxed);
    out.dispatched = stats_.dispatched.load(std::memory_order_relaxed);
    out.refused_by_breaker =
        stats_.refused_by_breaker.load(std::memory_order_relaxed);
    out.claim_conflicts = stats_.claim_conflicts.load(std::memory_order_relaxed);
    out.submit_failures = stats_.submit_failures.load(std::memory_order_relaxed);
    out.completed = stats_.completed.load(std::memory_order_relaxed);
    out.failed = stats_.failed.load(std::memory_order_relaxed);
    out.blocked = stats_.blocked.load(std::memory_order_relaxed);
    out.unroutable = stats_.unroutable.load(std::memory_order_relaxed);
    out.stale_callbacks = stats_.stale_callbacks.load(std::memory_order_relaxed);
    return out;
  }

  // --------------------------------------------------------------------------
  // TransferSink
  // --------------------------------------------------------------------------

  void OnTransferProgress(JobId job_id, uint32_t attempt,
                          uint64_t bytes_transferred,
                          uint64_t bytes_total) override {
    auto updated =
        queue_.RecordProgress(job_id, attempt, bytes_transferred, bytes_total);
    if (!updated.has_value()) NoteDropped(job_id, attempt, updated.get_error());
  }

  void OnTransferCompleted(JobId job_id, uint32_t attempt,
                           uint64_t bytes_transferred,
                           const std::string& final_path) override {
    auto done = queue_.Complete(job_id, attempt, bytes_transferred, final_path);
    if (!done.has_value()) {
      NoteDropped(job_id, attempt, done.get_error());
      return;
    }
    stats_.completed.fetch_add(1U, std::memory_order_relaxed);
    (void)UntrackProbe(job_id, attempt);
    breakers_.RecordSuccess(done.value().dependency);
  }

  void OnTransferFailed(JobId job_id, uint32_t attempt,
                        const TransferFailure& failure) override {
    auto current = queue_.Get(job_id);
    if (!current.has_value()) {
      NoteDropped(job_id, attempt, current.get_error());
      return;
    }
    (void)HandleFailure(job_id, attempt, current.value().dependency, failure);
  }

 private:
  struct AtomicStats {
    std::atomic<uint64_t> ticks{0};
    std::atomic<uint64_t> dispatched{0};
    std::atomic<uint64_t> refused_by_breaker{0};
    std::atomic<uint64_t> claim_conflicts{0};
    std::atomic<uint64_t> submit_failures{0};
    std::atomic<uint64_t> completed{0};
    std::atomic<uint64_t> failed{0};
    std::atomic<uint64_t> blocked{0};
    std::atomic<uint64_t> unroutable{0};
    std::atomic<uint64_t> stale_callbacks{0};
  };

  static uint32_t Clamp(uint32_t limit) noexcept {
    if (limit == 0U) return 1U;
    return (limit > kMaxConcurrentLimit) ? kMaxConcurrentLimit : limit;
  }

  /// Holds a reserved slot until Release() or scope exit.
  class SlotReservation final {
   public:
    SlotReservation(QueueDispatcher& owner, JobId id) noexcept
        : owner_(owner), id_(id) {}
    ~SlotReservation() { Release(); }

    SlotReservation(const SlotReservation&) = delete;
    SlotReservation& operator=(const SlotReservation&) = delete;

    void Release() {
      if (released_) return;
      released_ = true;
      owner_.ReleaseSlot(id_);
    }

   private:
    QueueDispatcher& owner_;
    JobId id_;
    bool released_ = false;
  };

  bool IsReserved(JobId id) const {
    for (const JobId& reserved : reserved_) {
      if (reserved == id) return true;
    }
    return false;
  }

  void ReleaseSlot(JobId id) {
    std::lock_guard<std::mutex> slot_lock(slot_mutex_);
    for (size_t i = 0U; i < reserved_.size(); ++i) {
      if (reserved_[i] == id) {
        reserved_[i] = reserved_.back();
        reserved_.pop_back();
        return;
      }
    }
  }

  /// Steps 3 and 4 for one reserved candidate. No dispatcher lock is held.
  bool Dispatch(const DownloadJob& job, const SourceBlocklist* blocklist) {
    SlotReservation slot(*this, job.id);
    TransferProvider* provider = providers_.Find(job.dependency);
    if (provider == nullptr) {
      stats_.unroutable.fetch_add(1U, std::memory_order_relaxed);
      DLCORE_LOG_WARN("Dispatcher", "job %" PRIu64 ": no provider for '%s'",
                      job.id.value(), job.dependency.c_str());
      return false;
    }

    const Admission admission = breakers_.TryAcquire(job.dependency);
    if (admission == Admission::kRejected) {
      stats_.refused_by_breaker.fetch_add(1U, std::memory_order_relaxed);
      return false;
    }
    bool holds_probe = (admission == Admission::kProbe);
    if (holds_probe && provider->SupportsProbe()) {
      if (!provider->Probe()) {
        breakers_.RecordFailure(job.dependency);
        DLCORE_LOG_DEBUG("Dispatcher", "probe of '%s' failed",
                         job.dependency.c_str());
        return false;
      }
      breakers_.RecordSuccess(job.dependency);
      holds_probe = false;
    }

    ExternalId stale;
    auto claimed = queue_.Claim(job.id, job.status, &stale);
    // A claimed job is counted as DOWNLOADING from here on.
    slot.Release();
    if (!claimed.has_value()) {
      stats_.claim_conflicts.fetch_add(1U, std::memory_order_relaxed);
      if (holds_probe) breakers_.ReleaseProbe(job.dependency);
      return false;
    }
    const DownloadJob& active = claimed.value();

    if (!stale.empty()) {
      auto aborted = provider->Cancel(stale);
      if (!aborted.has_value()) {
        DLCORE_LOG_DEBUG("Dispatcher",
                         "job %" PRIu64 ": stale transfer %s not cancelled: %s",
                         job.id.value(), stale.c_str(),
                         aborted.get_error().message.c_str());
      }
    }

    if (holds_probe) TrackProbe(active.id, active.attempt);

    if (blocklist != nullptr && blocklist->IsBlocked(active.source_descriptor)) {
      stats_.blocked.fetch_add(1U, std::memory_order_relaxed);
      TransferFailure failure;
      failure.code = FailureCode::kSourceBlocked;
      failure.message = "source is blocklisted";
      (void)HandleFailure(active.id, active.attempt, active.dependency, failure);
      return false;
    }

    TransferRequest request;
    request.job_id = active.id;
    request.attempt = active.attempt;
    request.track_reference = active.track_reference;
    request.source_descriptor = active.source_descriptor;
    request.target_location = active.target_location;
    request.dependency = active.dependency;
    request.sink = this;

    auto submitted = provider->Submit(request);
    if (!submitted.has_value()) {
      stats_.submit_failures.fetch_add(1U, std::memory_order_relaxed);
      (void)HandleFailure(active.id, active.attempt, active.dependency,
                          submitted.get_error());
      return false;
    }

    stats_.dispatched.fetch_add(1U, std::memory_order_relaxed);
    const ExternalId& external_id = submitted.value();
    auto recorded = queue_.RecordExternalId(active.id, active.attempt, external_id);
    if (!recorded.has_value()) {
      // The attempt ended before Submit() returned. If the user stopped it,
      // the transfer is orphaned and must be aborted here.
      auto now_row = queue_.Get(active.id);
      if (now_row.has_value() && now_row.value().attempt == active.attempt &&
          (now_row.value().status == JobStatus::kCancelled ||
           now_row.value().status == JobStatus::kPaused)) {
        DownloadJob orphan = now_row.value();
        orphan.external_id = external_id;
        AbortTransfer(orphan, "orphaned");
      }
      return true;
    }
    DLCORE_LOG_INFO("Dispatcher", "job %" PRIu64 " -> '%s' as %s (attempt %u)",
                    active.id.value(), active.dependency.c_str(),
                    external_id.c_str(), active.attempt);
    return true;
  }

  /**
   * @brief FAILED for the given attempt, breaker signal, retry decision.
   * @return false if the attempt was no longer current.
   */
  bool HandleFailure(JobId id, uint32_t attempt, const DependencyName& dependency,
                     const TransferFailure& failure) {
    auto failed = queue_.Fail(id, attempt, failure.code, failure.message);
    if (!failed.has_value()) {
      NoteDropped(id, attempt, failed.get_error());
      return false;
    }
    stats_.failed.fetch_add(1U, std::memory_order_relaxed);
    const bool held_probe = UntrackProbe(id, attempt);
    if (IsRetryable(failure.code)) {
      breakers_.RecordFailure(dependency);
    } else if (held_probe) {
      breakers_.ReleaseProbe(dependency);
    }
    auto decision = retry_.OnJobFailed(id);
    if (!decision.has_value()) {
      DLCORE_LOG_DEBUG("Dispatcher", "job %" PRIu64 ": retry decision skipped: %s",
                       id.value(), JobErrorName(decision.get_error()));
    }
    return true;
  }

  struct ProbeHolder {
    JobId job_id;
    uint32_t attempt = 0;
  };

  void TrackProbe(JobId id, uint32_t attempt) {
    std::lock_guard<std::mutex> lock(probe_mutex_);
    probe_holders_.push_back(ProbeHolder{id, attempt});
  }

  /// @return true if (id, attempt) was holding a half-open probe.
  bool UntrackProbe(JobId id, uint32_t attempt) {
    std::lock_guard<std::mutex> lock(probe_mutex_);
    for (size_t i = 0U; i < probe_holders_.size(); ++i) {
      if (probe_holders_[i].job_id == id && probe_holders_[i].attempt == attempt) {
        probe_holders_[i] = probe_holders_.back();
        probe_holders_.pop_back();
        return true;
      }
    }
    return false;
  }

  /// A stopped transfer gives its probe back without an outcome.
  void AbortTransfer(const DownloadJob& previous, const char* reason) {
    if (UntrackProbe(previous.id, previous.attempt)) {
      breakers_.ReleaseProbe(previous.dependency);
    }
    if (previous.external_id.empty()) return;
    TransferProvider* provider = providers_.Find(previous.dependency);
    if (provider == nullptr) return;
    auto aborted = provider->Cancel(previous.external_id);
    if (!aborted.has_value()) {
      DLCORE_LOG_WARN("Dispatcher",
                      "job %" PRIu64 ": provider abort (%s) of %s failed: %s",
                      previous.id.value(), reason, previous.external_id.c_str(),
                      aborted.get_error().message.c_str());
    }
  }

  void NoteDropped(JobId id, uint32_t attempt, JobError error) {
    stats_.stale_callbacks.fetch_add(1U, std::memory_order_relaxed);
    DLCORE_LOG_DEBUG("Dispatcher", "job %" PRIu64 " attempt %u: callback dropped (%s)",
                     id.value(), attempt, JobErrorName(error));
  }

  JobQueue& queue_;
  CircuitBreakerRegistry& breakers_;
  ProviderRegistry& providers_;
  RetryScheduler& retry_;
  const SourceBlocklist* blocklist_;

  std::mutex slot_mutex_;  ///< Guards reserved_ and blocklist_.
  std::vector<JobId> reserved_;
  std::atomic<uint32_t> max_concurrent_;
  std::atomic<bool> paused_;
  AtomicStats stats_;

  std::mutex probe_mutex_;
  std::vector<ProbeHolder> probe_holders_;
};

}  // namespace dlcore

#endif  // DLCORE_QUEUE_DISPATCHER_HPP_
