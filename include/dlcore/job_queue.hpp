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
 * @file job_queue.hpp
 * @brief Download job state machine enforcement, priority queue and queue
 *        commands.
 *
 * JobQueue is the only writer of job rows. Every status change:
 *   1. is checked against CanTransition(),
 *   2. is applied with a per-row compare-and-set on the observed status,
 *   3. is published on the JobEventFeed.
 * A rejected edge returns JobError::kInvalidTransition, leaves the row
 * untouched and logs a warning.
 *
 * Callers:
 * - user actions: Cancel / Pause / Resume / SetPriority / Retry and batches
 * - QueueDispatcher: Claim / RecordExternalId / RecordProgress / Complete / Fail
 * - RetryScheduler: ScheduleRetry / ExhaustRetries / ClearRetryWindow
 * - external stall monitor: MarkStalled / FailStalled
 */

#ifndef DLCORE_JOB_QUEUE_HPP_
#define DLCORE_JOB_QUEUE_HPP_

#include "dlcore/clock.hpp"
#include "dlcore/download_job.hpp"
#include "dlcore/job_events.hpp"
#include "dlcore/job_store.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <cinttypes>
#include <cstdio>
#include <string>
#include <vector>

namespace dlcore {

// ============================================================================
// Query / batch result types
// ============================================================================

/**
 * @brief Per-status job counts.
 */
struct QueueStats {
  uint32_t by_status[kJobStatusCount] = {};
  uint32_t total = 0;

  uint32_t Count(JobStatus status) const noexcept {
    return by_status[static_cast<uint32_t>(status)];
  }

  /// Jobs that still need work: WAITING, PENDING, QUEUED, DOWNLOADING, STALLED.
  uint32_t Active() const noexcept {
    return Count(JobStatus::kWaiting) + Count(JobStatus::kPending) +
           Count(JobStatus::kQueued) + Count(JobStatus::kDownloading) +
           Count(JobStatus::kStalled);
  }

  uint32_t InProgress() const noexcept {
    return Count(JobStatus::kDownloading);
  }

  /**
   * @brief One-line summary such as "2 downloading, 5 waiting, 1 failed",
   *        or "idle" when nothing is active, paused or failed.
   */
  std::string Summary() const {
    struct Part {
      JobStatus status;
      const char* label;
    };
    static constexpr Part kParts[] = {
        {JobStatus::kDownloading, "downloading"},
        {JobStatus::kStalled, "stalled"},
        {JobStatus::kQueued, "queued"},
        {JobStatus::kPending, "pending"},
        {JobStatus::kWaiting, "waiting"},
        {JobStatus::kPaused, "paused"},
        {JobStatus::kFailed, "failed"},
    };
    std::string out;
    for (const Part& part : kParts) {
      const uint32_t n = Count(part.status);
      if (n == 0U) continue;
      if (!out.empty()) out += ", ";
      out += std::to_string(n);
      out += ' ';
      out += part.label;
    }
    return out.empty() ? std::string("idle") : out;
  }
};

struct JobPage {
  std::vector<DownloadJob> jobs;
  uint32_t total = 0;  ///< Matching rows before pagination.
  uint32_t offset = 0;
  uint32_t limit = 0;
};

struct BatchItem {
  JobId id;
  bool ok = false;
  JobError error = JobError::kNotFound;  ///< Meaningful only when !ok.
};

/**
 * @brief Per-item outcome of a batch command. Never a single verdict.
 */
struct BatchResult {
  std::vector<BatchItem> items;
  uint32_t succeeded = 0;
  uint32_t failed = 0;

  bool AllSucceeded() const noexcept { return failed == 0U; }
};

/**
 * @brief Run @p action (JobId -> expected<..., JobError>) for every id and
 *        collect the outcomes.
 */
template <typename Fn>
BatchResult ApplyToEach(const std::vector<JobId>& ids, Fn&& action) {
  BatchResult result;
  result.items.reserve(ids.size());
  for (const JobId id : ids) {
    auto outcome = action(id);
    BatchItem item;
    item.id = id;
    item.ok = outcome.has_value();
    if (item.ok) {
      ++result.succeeded;
    } else {
      item.error = outcome.get_error();
      ++result.failed;
    }
    result.items.push_back(item);
  }
  return result;
}

// ============================================================================
// JobQueue
// ============================================================================

class JobQueue final {
 public:
  using Result = expected<DownloadJob, JobError>;

  JobQueue(JobStore& store, JobEventFeed& feed, const Clock& clock) noexcept
      : store_(store), feed_(feed), clock_(clock) {}

  JobQueue(const JobQueue&) = delete;
  JobQueue& operator=(const JobQueue&) = delete;

  // --------------------------------------------------------------------------
  // Creation and queries
  // --------------------------------------------------------------------------

  /**
   * @brief Create a job in WAITING or PENDING.
   *
   * @return The new id, or kInvalidArgument for an empty dependency name or
   *         any other initial status.
   */
  expected<JobId, JobError> Enqueue(const NewJob& request) {
    if (request.dependency.empty() ||
        (request.initial_status != JobStatus::kWaiting &&
         request.initial_status != JobStatus::kPending)) {
      return expected<JobId, JobError>::error(JobError::kInvalidArgument);
    }

    DownloadJob job;
    job.track_reference = request.track_reference;
    job.dependency = request.dependency;
    job.provider_kind = request.provider_kind;
    job.status = request.initial_status;
    job.priority = request.priority;
    job.max_retries = request.max_retries;
    job.source_descriptor = request.source_descriptor;
    job.target_location = request.target_location;
    job.created_at = clock_.NowMs();

    auto created = store_.Create(job);
    if (!created.has_value()) {
      return expected<JobId, JobError>::error(created.get_error());
    }
    const DownloadJob& stored = created.value();
    (void)feed_.Publish(JobEvent::From(stored, JobEventKind::kCreated,
                                       stored.status, job.created_at));
    DLCORE_LOG_DEBUG("JobQueue", "job %" PRIu64 " created (%s, dep=%s, prio=%d)",
                     stored.id.value(), JobStatusName(stored.status),
                     stored.dependency.c_str(), stored.priority);
    return expected<JobId, JobError>::success(stored.id);
  }

  Result Get(JobId id) const { return store_.Get(id); }

  JobPage List(const JobFilter& filter, uint32_t offset, uint32_t limit,
               JobOrder order = JobOrder::kNewestFirst) const {
    JobPage page;
    page.jobs = store_.Query(filter, order, offset, limit);
    page.total = store_.Count(filter);
    page.offset = offset;
    page.limit = limit;
    return page;
  }

  QueueStats Stats() const {
    QueueStats stats;
    for (uint32_t i = 0U; i < kJobStatusCount; ++i) {
      const uint32_t n = store_.Count(
          JobFilter::ByStatus(StatusBit(static_cast<JobStatus>(i))));
      stats.by_status[i] = n;
      stats.total += n;
    }
    return stats;
  }

  /// Up to @p limit dispatch-eligible jobs in dispatch order.
  std::vector<DownloadJob> NextEligible(uint32_t limit) const {
    if (limit == 0U) return {};
    return store_.Query(JobFilter::Eligible(clock_.NowMs()), JobOrder::kDispatch,
                        0U, limit);
  }

  std::vector<DownloadJob> Query(const JobFilter& filter, JobOrder order,
                                 uint32_t limit) const {
    return store_.Query(filter, order, 0U, limit);
  }

  uint32_t CountDownloading() const {
    return store_.Count(
        JobFilter::ByStatus(StatusBit(JobStatus::kDownloading)));
  }

  // --------------------------------------------------------------------------
  // User actions
  // --------------------------------------------------------------------------

  /**
   * @brief Cancel a WAITING, PENDING, QUEUED or DOWNLOADING job.
   *
   * @param previous  Receives the row as it was before the cancel, so the
   *                  caller can abort the provider transfer it referenced.
   */
  Result Cancel(JobId id, DownloadJob* previous = nullptr) {
    const uint64_t now = clock_.NowMs();
    return Transition(id, JobStatus::kCancelled, "cancel", previous,
                      [now](DownloadJob& job) {
                        job.external_id.clear();
                        job.next_retry_at.reset();
                        job.completed_at = now;
                      });
  }

  /// Pause a QUEUED or DOWNLOADING job. The external id is kept.
  Result Pause(JobId id, DownloadJob* previous = nullptr) {
    return Transition(id, JobStatus::kPaused, "pause", previous,
                      [](DownloadJob&) {});
  }

  /// Resume a PAUSED job to QUEUED at the back of its priority tier.
  Result Resume(JobId id) {
    const uint64_t seq = store_.NextSequence();
    return Transition(id, JobStatus::kQueued, "resume", nullptr,
                      [seq](DownloadJob& job) { job.queue_seq = seq; });
  }

  /// Metadata-only priority change. Order inside the new tier is unchanged.
  Result SetPriority(JobId id, int32_t priority) {
    auto updated = store_.Update(id, [priority](DownloadJob& job) {
      job.priority = priority;
      return true;
    });
    if (updated.has_value()) {
      const DownloadJob& job = updated.value();
      (void)feed_.Publish(JobEvent::From(job, JobEventKind::kPriorityChanged,
                                         job.status, clock_.NowMs()));
    }
    return updated;
  }

  /**
   * @brief Manual retry: FAILED -> WAITING with a fresh retry budget.
   */
  Result Retry(JobId id) {
    return Transition(id, JobStatus::kWaiting, "retry", nullptr,
                      [](DownloadJob& job) {
                        job.retry_count = 0U;
                        job.next_retry_at.reset();
                        job.error_message.clear();
                        job.failure_code = FailureCode::kNone;
                        job.external_id.clear();
                        ResetProgress(job);
                      });
  }

  BatchResult CancelMany(const std::vector<JobId>& ids) {
    return ApplyToEach(ids, [this](JobId id) { return Cancel(id); });
  }

  BatchResult PauseMany(const std::vector<JobId>& ids) {
    return ApplyToEach(ids, [this](JobId id) { return Pause(id); });
  }

  BatchResult ResumeMany(const std::vector<JobId>& ids) {
    return ApplyToEach(ids, [this](JobId id) { return Resume(id); });
  }

  BatchResult SetPriorityMany(const std::vector<JobId>& ids, int32_t priority) {
    return ApplyToEach(ids,
                     [this, priority](JobId id) { return SetPriority(id, priority); });
  }

  BatchResult RetryMany(const std::vector<JobId>& ids) {
    return ApplyToEach(ids, [this](JobId id) { return Retry(id); });
  }

  /**
   * @brief Manual retry applied to every terminally FAILED job.
   *
   * Jobs that still have retry budget for a retryable failure are left to
   * the retry scheduler.
   */
  BatchResult RetryAllFailed() {
    const std::vector<DownloadJob> failed = store_.Query(
        JobFilter::ByStatus(StatusBit(JobStatus::kFailed)),
        JobOrder::kOldestFirst, 0U, 0U);
    std::vector<JobId> ids;
    ids.reserve(failed.size());
    for (const DownloadJob& job : failed) {
      if (job.retry_count < job.max_retries && IsRetryable(job.failure_code)) {
        continue;
      }
      ids.push_back(job.id);
    }
    BatchResult result = RetryMany(ids);
    DLCORE_LOG_INFO("JobQueue", "retry all failed: %u reset, %u skipped, %u pending retry",
                    result.succeeded, result.failed,
                    static_cast<uint32_t>(failed.size() - ids.size()));
    return result;
  }

  // --------------------------------------------------------------------------
  // Dispatcher hooks
  // --------------------------------------------------------------------------

  /**
   * @brief Claim an eligible job for a transfer attempt.
   *
   * Moves @p observed to DOWNLOADING along legal edges
   * (WAITING/PENDING -> QUEUED -> DOWNLOADING, QUEUED -> DOWNLOADING,
   * STALLED -> DOWNLOADING) in a single compare-and-set, so two claimers
   * can never both win. The attempt counter is bumped and progress reset.
   *
   * @param stale_external_id  Receives an external id left over from an
   *                           earlier attempt (cleared from the row).
   * @return The claimed row, kConflict if the job moved or is no longer
   *         eligible, kInvalidTransition if @p observed has no claim path.
   */
  Result Claim(JobId id, JobStatus observed,
               ExternalId* stale_external_id = nullptr) {
    JobStatus path[3];
    uint32_t hops = 0U;
    path[hops++] = observed;
    if (observed == JobStatus::kWaiting || observed == JobStatus::kPending) {
      path[hops++] = JobStatus::kQueued;
    }
    path[hops++] = JobStatus::kDownloading;
    for (uint32_t i = 0U; i + 1U < hops; ++i) {
      if (!CanTransition(path[i], path[i + 1U])) {
        DLCORE_LOG_WARN("JobQueue",
                        "job %" PRIu64 ": no claim path from %s", id.value(),
                        JobStatusName(observed));
        return Result::error(JobError::kInvalidTransition);
      }
    }

    const uint64_t now = clock_.NowMs();
    ExternalId stale;
    auto claimed = store_.CompareAndSet(id, observed, [&](DownloadJob& job) {
      if (!IsDispatchEligible(job, now)) return false;
      stale = job.external_id;
      job.external_id.clear();
      job.status = JobStatus::kDownloading;
      job.attempt += 1U;
      job.started_at = now;
      job.next_retry_at.reset();
      ResetProgress(job);
      return true;
    });
    if (!claimed.has_value()) return claimed;

    if (stale_external_id != nullptr) *stale_external_id = stale;
    DownloadJob hop = claimed.value();
    for (uint32_t i = 0U; i + 1U < hops; ++i) {
      hop.status = path[i + 1U];
      (void)feed_.Publish(
          JobEvent::From(hop, JobEventKind::kStatusChanged, path[i], now));
    }
    return claimed;
  }

  /// Record the provider's id for the current attempt.
  Result RecordExternalId(JobId id, uint32_t attempt,
                          const ExternalId& external_id) {
    auto updated = store_.CompareAndSet(
        id, JobStatus::kDownloading, [&](DownloadJob& job) {
          if (job.attempt != attempt) return false;
          job.external_id = external_id;
          return true;
        });
    if (!updated.has_value()) return Result::error(ClassifyMiss(id, attempt));
    return updated;
  }

  Result RecordProgress(JobId id, uint32_t attempt, uint64_t bytes_transferred,
                        uint64_t bytes_total) {
    auto updated = store_.CompareAndSet(
        id, JobStatus::kDownloading, [&](DownloadJob& job) {
          if (job.attempt != attempt) return false;
          job.bytes_transferred = bytes_transferred;
          job.bytes_total = bytes_total;
          job.progress_percent = Percent(bytes_transferred, bytes_total);
          return true;
        });
    if (!updated.has_value()) return Result::error(ClassifyMiss(id, attempt));
    const DownloadJob& job = updated.value();
    (void)feed_.Publish(JobEvent::From(job, JobEventKind::kProgress,
                                       job.status, clock_.NowMs()));
    return updated;
  }

  /// DOWNLOADING -> COMPLETED for the current attempt.
  Result Complete(JobId id, uint32_t attempt, uint64_t bytes_transferred,
                  const std::string& final_path) {
    const uint64_t now = clock_.NowMs();
    auto updated = store_.CompareAndSet(
        id, JobStatus::kDownloading, [&](DownloadJob& job) {
          if (job.attempt != attempt) return false;
          job.status = JobStatus::kCompleted;
          job.completed_at = now;
          job.bytes_transferred = bytes_transferred;
          if (job.bytes_total < bytes_transferred) job.bytes_total = bytes_transferred;
          job.progress_percent = 100.0;
          if (!final_path.empty()) job.target_location = final_path;
          job.external_id.clear();
          job.error_message.clear();
          job.failure_code = FailureCode::kNone;
          return true;
        });
    if (!updated.has_value()) return Result::error(ClassifyMiss(id, attempt));
    (void)feed_.Publish(JobEvent::From(updated.value(),
                                       JobEventKind::kStatusChanged,
                                       JobStatus::kDownloading, now));
    DLCORE_LOG_INFO("JobQueue", "job %" PRIu64 " completed (%" PRIu64 " bytes)",
                    id.value(), bytes_transferred);
    return updated;
  }

  /// DOWNLOADING -> FAILED for the current attempt.
  Result Fail(JobId id, uint32_t attempt, FailureCode code,
              const std::string& message) {
    const uint64_t now = clock_.NowMs();
    auto updated = store_.CompareAndSet(
        id, JobStatus::kDownloading, [&](DownloadJob& job) {
          if (job.attempt != attempt) return false;
          job.status = JobStatus::kFailed;
          RecordError(job, code, message, now);
          return true;
        });
    if (!updated.has_value()) return Result::error(ClassifyMiss(id, attempt));
    (void)feed_.Publish(JobEvent::From(updated.value(),
                                       JobEventKind::kStatusChanged,
                                       JobStatus::kDownloading, now));
    DLCORE_LOG_WARN("JobQueue", "job %" PRIu64 " failed: %s (%s)", id.value(),
                    message.c_str(), FailureCodeName(code));
    return updated;
  }

  // --------------------------------------------------------------------------
  // Retry scheduler hooks
  // --------------------------------------------------------------------------

  /**
   * @brief FAILED -> WAITING with a backoff timer. Clears the external id
   *        and source descriptor so the next attempt resolves a fresh source.
   *
   * Applies only while the row still carries @p observed_retry_count, so two
   * schedulers racing on the same failure cannot both consume a retry.
   */
  Result ScheduleRetry(JobId id, uint32_t observed_retry_count,
                       uint64_t next_retry_at) {
    const uint64_t now = clock_.NowMs();
    auto updated = store_.CompareAndSet(
        id, JobStatus::kFailed, [&](DownloadJob& job) {
          if (job.retry_count != observed_retry_count) return false;
          job.status = JobStatus::kWaiting;
          job.retry_count = observed_retry_count + 1U;
          job.next_retry_at = next_retry_at;
          job.external_id.clear();
          job.source_descriptor.clear();
          ResetProgress(job);
          return true;
        });
    if (!updated.has_value()) return updated;
    (void)feed_.Publish(JobEvent::From(updated.value(),
                                       JobEventKind::kStatusChanged,
                                       JobStatus::kFailed, now));
    return updated;
  }

  /// Mark a FAILED job's budget as spent; it stays FAILED.
  Result ExhaustRetries(JobId id, uint32_t retry_count) {
    return store_.Update(id, [retry_count](DownloadJob& job) {
      if (job.status != JobStatus::kFailed) return false;
      job.retry_count = retry_count;
      job.next_retry_at.reset();
      return true;
    });
  }

  /**
   * @brief Drop an elapsed backoff timer from a WAITING job.
   * @return kConflict if the job is not WAITING or its window is still open.
   */
  Result ClearRetryWindow(JobId id) {
    const uint64_t now = clock_.NowMs();
    auto updated = store_.Update(id, [now](DownloadJob& job) {
      if (job.status != JobStatus::kWaiting || !job.next_retry_at.has_value() ||
          job.next_retry_at.value() > now) {
        return false;
      }
      job.next_retry_at.reset();
      return true;
    });
    if (updated.has_value()) {
      (void)feed_.Publish(JobEvent::From(updated.value(),
                                         JobEventKind::kStatusChanged,
                                         JobStatus::kWaiting, now));
    }
    return updated;
  }

  // --------------------------------------------------------------------------
  // Stall monitor hooks
  // --------------------------------------------------------------------------

  /// DOWNLOADING -> STALLED. The job becomes dispatch-eligible again.
  Result MarkStalled(JobId id) {
    return Transition(id, JobStatus::kStalled, "mark stalled", nullptr,
                      [](DownloadJob&) {});
  }

  /// STALLED -> FAILED with FailureCode::kStalled.
  Result FailStalled(JobId id, const std::string& message) {
    const uint64_t now = clock_.NowMs();
    return Transition(id, JobStatus::kFailed, "fail stalled", nullptr,
                      [&](DownloadJob& job) {
                        RecordError(job, FailureCode::kStalled, message, now);
                      });
  }

 private:
  static constexpr uint32_t kCasRounds = 4U;

  static void ResetProgress(DownloadJob& job) noexcept {
    job.progress_percent = 0.0;
    job.bytes_transferred = 0U;
  }

  static void RecordError(DownloadJob& job, FailureCode code,
                          const std::string& message, uint64_t now) {
    job.error_message = message;
    job.failure_code = code;
    job.last_error_at = now;
    job.external_id.clear();
    job.next_retry_at.reset();
  }

  static double Percent(uint64_t done, uint64_t total) noexcept {
    if (total == 0U) return 0.0;
    if (done >= total) return 100.0;
    return static_cast<double>(done) * 100.0 / static_cast<double>(total);
  }

  /**
   * @brief Validate and apply a user or scheduler transition to @p to.
   *
   * Re-reads and re-validates if the status moves between the read and the
   * compare-and-set.
   */
  template <typename Fn>
  Result Transition(JobId id, JobStatus to, const char* action,
                    DownloadJob* previous, Fn&& apply) {
    for (uint32_t round = 0U; round < kCasRounds; ++round) {
      auto current = store_.Get(id);
      if (!current.has_value()) return current;
      const JobStatus from = current.value().status;
      if (!CanTransition(from, to)) {
        DLCORE_LOG_WARN("JobQueue",
                        "job %" PRIu64 ": %s rejected, invalid transition %s -> %s",
                        id.value(), action, JobStatusName(from),
                        JobStatusName(to));
        return Result::error(JobError::kInvalidTransition);
      }

      DownloadJob before;
      auto updated = store_.CompareAndSet(id, from, [&](DownloadJob& job) {
        before = job;
        job.status = to;
        apply(job);
        return true;
      });
      if (updated.has_value()) {
        if (previous != nullptr) *previous = before;
        (void)feed_.Publish(JobEvent::From(updated.value(),
                                           JobEventKind::kStatusChanged, from,
                                           clock_.NowMs()));
        DLCORE_LOG_DEBUG("JobQueue", "job %" PRIu64 ": %s %s -> %s", id.value(),
                         action, JobStatusName(from), JobStatusName(to));
        return updated;
      }
      if (updated.get_error() != JobError::kConflict) return updated;
    }
    return Result::error(JobError::kConflict);
  }

  /// Explain why an attempt-scoped compare-and-set did not apply.
  JobError ClassifyMiss(JobId id, uint32_t attempt) const {
    auto current = store_.Get(id);
    if (!current.has_value()) return current.get_error();
    if (current.value().attempt != attempt) return JobError::kStaleAttempt;
    return JobError::kConflict;
  }

  JobStore& store_;
  JobEventFeed& feed_;
  const Clock& clock_;
};

}  // namespace dlcore

#endif  // DLCORE_JOB_QUEUE_HPP_
