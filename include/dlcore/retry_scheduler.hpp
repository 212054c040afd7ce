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
 * @file retry_scheduler.hpp
 * @brief Exponential backoff for failed jobs.
 *
 * A failure increments retry_count. While the incremented count is below
 * max_retries the job goes back to WAITING with
 *
 *   next_retry_at = now + min(base_delay * 2^(previous retry_count), max_delay)
 *
 * and the dispatcher ignores it until the timer elapses. Otherwise, and for
 * permanent failure codes, the job stays FAILED with its budget spent until a
 * manual retry.
 *
 * The periodic Sweep() never transfers anything. It clears elapsed timers and
 * schedules FAILED jobs that still have budget but were never scheduled
 * (for example failures recorded while the scheduler was stopped).
 */

#ifndef DLCORE_RETRY_SCHEDULER_HPP_
#define DLCORE_RETRY_SCHEDULER_HPP_

#include "dlcore/clock.hpp"
#include "dlcore/download_job.hpp"
#include "dlcore/job_queue.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <atomic>
#include <cinttypes>
#include <cstdint>
#include <mutex>
#include <vector>

namespace dlcore {

struct RetryPolicy {
  uint64_t base_delay_ms = 60000;
  uint64_t max_delay_ms = 3600000;
};

/**
 * @brief min(base * 2^retry_count, max), saturating instead of overflowing.
 */
inline uint64_t ComputeBackoffMs(const RetryPolicy& policy,
                                 uint32_t retry_count) noexcept {
  if (policy.base_delay_ms == 0U) return 0U;
  if (policy.base_delay_ms >= policy.max_delay_ms) return policy.max_delay_ms;
  uint64_t delay = policy.base_delay_ms;
  for (uint32_t i = 0U; i < retry_count; ++i) {
    if (delay > policy.max_delay_ms / 2U) return policy.max_delay_ms;
    delay *= 2U;
  }
  return (delay < policy.max_delay_ms) ? delay : policy.max_delay_ms;
}

struct RetrySchedulerConfig {
  RetryPolicy policy;
  uint32_t max_per_sweep = 50;  ///< Upper bound on jobs touched per sweep.
};

enum class RetryDecision : uint8_t {
  kScheduled = 0,  ///< Back to WAITING with a timer.
  kExhausted,      ///< Budget spent; stays FAILED.
  kPermanent       ///< Non-retryable failure code; budget zeroed.
};

struct RetryStats {
  uint64_t sweeps = 0;
  uint64_t scheduled = 0;
  uint64_t exhausted = 0;
  uint64_t permanent = 0;
  uint64_t activated = 0;  ///< Elapsed timers cleared by sweeps.
  uint32_t last_sweep_scheduled = 0;
  uint32_t last_sweep_activated = 0;
};

// ============================================================================
// RetryScheduler
// ============================================================================

class RetryScheduler final {
 public:
  RetryScheduler(JobQueue& queue, const Clock& clock,
                 const RetrySchedulerConfig& config = RetrySchedulerConfig())
      : queue_(queue), clock_(clock), config_(config) {}

  RetryScheduler(const RetryScheduler&) = delete;
  RetryScheduler& operator=(const RetryScheduler&) = delete;

  uint64_t ComputeDelayMs(uint32_t retry_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ComputeBackoffMs(config_.policy, retry_count);
  }

  void SetPolicy(const RetryPolicy& policy) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.policy = policy;
  }

  /**
   * @brief Decide what happens to a job that just reached FAILED.
   *
   * @return The decision, kInvalidTransition if the job is not FAILED, or
   *         the queue error if the row moved concurrently.
   */
  expected<RetryDecision, JobError> OnJobFailed(JobId id) {
    using R = expected<RetryDecision, JobError>;
    auto current = queue_.Get(id);
    if (!current.has_value()) return R::error(current.get_error());
    const DownloadJob& job = current.value();
    if (job.status != JobStatus::kFailed) {
      return R::error(JobError::kInvalidTransition);
    }

    if (job.retry_count >= job.max_retries) {
      return R::success(RetryDecision::kExhausted);
    }

    if (!IsRetryable(job.failure_code)) {
      auto spent = queue_.ExhaustRetries(id, job.max_retries);
      if (!spent.has_value()) return R::error(spent.get_error());
      stats_.permanent.fetch_add(1U, std::memory_order_relaxed);
      DLCORE_LOG_INFO("Retry", "job %" PRIu64 ": %s is permanent, not retrying",
                      id.value(), FailureCodeName(job.failure_code));
      return R::success(RetryDecision::kPermanent);
    }

    const uint32_t next_count = job.retry_count + 1U;
    if (next_count >= job.max_retries) {
      auto spent = queue_.ExhaustRetries(id, next_count);
      if (!spent.has_value()) return R::error(spent.get_error());
      stats_.exhausted.fetch_add(1U, std::memory_order_relaxed);
      DLCORE_LOG_WARN("Retry", "job %" PRIu64 ": retries exhausted (%u/%u)",
                      id.value(), next_count, job.max_retries);
      return R::success(RetryDecision::kExhausted);
    }

    const uint64_t delay = ComputeDelayMs(job.retry_count);
    const uint64_t due = clock_.NowMs() + delay;
    auto scheduled = queue_.ScheduleRetry(id, job.retry_count, due);
    if (!scheduled.has_value()) return R::error(scheduled.get_error());
    stats_.scheduled.fetch_add(1U, std::memory_order_relaxed);
    DLCORE_LOG_INFO("Retry",
                    "job %" PRIu64 ": retry %u/%u in %" PRIu64 " ms",
                    id.value(), next_count, job.max_retries, delay);
    return R::success(RetryDecision::kScheduled);
  }

  /**
   * @brief One sweep. Per-job errors are logged and skipped.
   * @return Number of jobs changed.
   */
  uint32_t Sweep() {
    uint32_t max_jobs = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      max_jobs = config_.max_per_sweep;
    }
    const uint64_t now = clock_.NowMs();

    JobFilter due;
    due.status_mask = StatusBit(JobStatus::kWaiting);
    due.retry_due_at = now;
    uint32_t activated = 0U;
    for (const DownloadJob& job :
         queue_.Query(due, JobOrder::kDispatch, max_jobs)) {
      if (queue_.ClearRetryWindow(job.id).has_value()) ++activated;
    }

    uint32_t scheduled = 0U;
    const uint32_t remaining = (max_jobs > activated) ? (max_jobs - activated) : 0U;
    if (remaining > 0U) {
      JobFilter unscheduled;
      unscheduled.status_mask = StatusBit(JobStatus::kFailed);
      unscheduled.retry_budget_left = true;
      for (const DownloadJob& job :
           queue_.Query(unscheduled, JobOrder::kOldestFirst, remaining)) {
        auto decision = OnJobFailed(job.id);
        if (!decision.has_value()) {
          DLCORE_LOG_DEBUG("Retry", "job %" PRIu64 " skipped: %s",
                           job.id.value(), JobErrorName(decision.get_error()));
          continue;
        }
        if (decision.value() == RetryDecision::kScheduled) ++scheduled;
      }
    }

    stats_.sweeps.fetch_add(1U, std::memory_order_relaxed);
    stats_.activated.fetch_add(activated, std::memory_order_relaxed);
    stats_.last_sweep_activated.store(activated, std::memory_order_relaxed);
    stats_.last_sweep_scheduled.store(scheduled, std::memory_order_relaxed);
    if (activated + scheduled > 0U) {
      DLCORE_LOG_DEBUG("Retry", "sweep: %u ready, %u scheduled", activated,
                       scheduled);
    }
    return activated + scheduled;
  }

  /// TimerTaskFn adapter; @p ctx is the RetryScheduler.
  static void SweepTick(void* ctx) {
    (void)static_cast<RetryScheduler*>(ctx)->Sweep();
  }

  RetryStats Stats() const {
    RetryStats out;
    out.sweeps = stats_.sweeps.load(std::memory_order_relaxed);
    out.scheduled = stats_.scheduled.load(std::memory_order_relaxed);
    out.exhausted = stats_.exhausted.load(std::memory_order_relaxed);
    out.permanent = stats_.permanent.load(std::memory_order_relaxed);
    out.activated = stats_.activated.load(std::memory_order_relaxed);
    out.last_sweep_scheduled =
        stats_.last_sweep_scheduled.load(std::memory_order_relaxed);
    out.last_sweep_activated =
        stats_.last_sweep_activated.load(std::memory_order_relaxed);
    return out;
  }

 private:
  struct AtomicStats {
    std::atomic<uint64_t> sweeps{0};
    std::atomic<uint64_t> scheduled{0};
    std::atomic<uint64_t> exhausted{0};
    std::atomic<uint64_t> permanent{0};
    std::atomic<uint64_t> activated{0};
    std::atomic<uint32_t> last_sweep_scheduled{0};
    std::atomic<uint32_t> last_sweep_activated{0};
  };

  JobQueue& queue_;
  const Clock& clock_;
  mutable std::mutex mutex_;  ///< Guards config_.
  RetrySchedulerConfig config_;
  AtomicStats stats_;
};

}  // namespace dlcore

#endif  // DLCORE_RETRY_SCHEDULER_HPP_
