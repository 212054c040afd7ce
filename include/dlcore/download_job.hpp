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
 * @file download_job.hpp
 * @brief Download job record and its status state machine.
 *
 * Status edges:
 *
 *   WAITING     -> PENDING | QUEUED | CANCELLED
 *   PENDING     -> QUEUED | CANCELLED
 *   QUEUED      -> DOWNLOADING | PAUSED | CANCELLED
 *   DOWNLOADING -> COMPLETED | FAILED | PAUSED | STALLED | CANCELLED
 *   PAUSED      -> QUEUED
 *   STALLED     -> DOWNLOADING | FAILED
 *   FAILED      -> WAITING
 *
 * COMPLETED and CANCELLED are terminal; FAILED is terminal once the retry
 * budget is spent. Only CanTransition() edges are ever applied.
 */

#ifndef DLCORE_DOWNLOAD_JOB_HPP_
#define DLCORE_DOWNLOAD_JOB_HPP_

#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <cstdint>
#include <string>

namespace dlcore {

// ============================================================================
// JobStatus
// ============================================================================

enum class JobStatus : uint8_t {
  kWaiting = 0,
  kPending,
  kQueued,
  kDownloading,
  kPaused,
  kStalled,
  kCompleted,
  kFailed,
  kCancelled
};

static constexpr uint32_t kJobStatusCount = 9U;

inline const char* JobStatusName(JobStatus status) noexcept {
  switch (status) {
    case JobStatus::kWaiting:     return "WAITING";
    case JobStatus::kPending:     return "PENDING";
    case JobStatus::kQueued:      return "QUEUED";
    case JobStatus::kDownloading: return "DOWNLOADING";
    case JobStatus::kPaused:      return "PAUSED";
    case JobStatus::kStalled:     return "STALLED";
    case JobStatus::kCompleted:   return "COMPLETED";
    case JobStatus::kFailed:      return "FAILED";
    case JobStatus::kCancelled:   return "CANCELLED";
  }
  return "UNKNOWN";
}

/// Bit for @p status in a status mask (see JobFilter).
constexpr uint32_t StatusBit(JobStatus status) noexcept {
  return 1U << static_cast<uint32_t>(status);
}

static constexpr uint32_t kAllStatuses = (1U << kJobStatusCount) - 1U;

/// Statuses the dispatcher may pick up (STALLED counts as newly QUEUED).
static constexpr uint32_t kDispatchableStatuses =
    StatusBit(JobStatus::kWaiting) | StatusBit(JobStatus::kPending) |
    StatusBit(JobStatus::kQueued) | StatusBit(JobStatus::kStalled);

/// Statuses in which the provider-assigned external id may be set.
static constexpr uint32_t kExternalIdStatuses =
    StatusBit(JobStatus::kQueued) | StatusBit(JobStatus::kDownloading) |
    StatusBit(JobStatus::kPaused) | StatusBit(JobStatus::kStalled);

/**
 * @brief True when @p from -> @p to is an edge of the job state machine.
 */
inline bool CanTransition(JobStatus from, JobStatus to) noexcept {
  switch (from) {
    case JobStatus::kWaiting:
      return to == JobStatus::kQueued || to == JobStatus::kPending ||
             to == JobStatus::kCancelled;
    case JobStatus::kPending:
      return to == JobStatus::kQueued || to == JobStatus::kCancelled;
    case JobStatus::kQueued:
      return to == JobStatus::kDownloading || to == JobStatus::kPaused ||
             to == JobStatus::kCancelled;
    case JobStatus::kDownloading:
      return to == JobStatus::kCompleted || to == JobStatus::kFailed ||
             to == JobStatus::kPaused || to == JobStatus::kStalled ||
             to == JobStatus::kCancelled;
    case JobStatus::kPaused:
      return to == JobStatus::kQueued;
    case JobStatus::kStalled:
      return to == JobStatus::kDownloading || to == JobStatus::kFailed;
    case JobStatus::kFailed:
      return to == JobStatus::kWaiting;
    case JobStatus::kCompleted:
    case JobStatus::kCancelled:
      return false;
  }
  return false;
}

inline bool IsTerminal(JobStatus status) noexcept {
  return status == JobStatus::kCompleted || status == JobStatus::kCancelled;
}

// ============================================================================
// FailureCode
// ============================================================================

/**
 * @brief Why a transfer attempt failed.
 *
 * Codes that describe the source itself (gone, invalid, blocked) or local
 * conditions a retry cannot fix are permanent; everything else is transient.
 */
enum class FailureCode : uint8_t {
  kNone = 0,
  kTimeout,
  kConnectionError,
  kProviderUnavailable,
  kRateLimited,
  kPeerOffline,
  kTransferFailed,
  kQueueTimeout,
  kStalled,
  kSourceNotFound,
  kInvalidSource,
  kSourceBlocked,
  kDiskFull,
  kUnknown
};

inline const char* FailureCodeName(FailureCode code) noexcept {
  switch (code) {
    case FailureCode::kNone:                return "none";
    case FailureCode::kTimeout:             return "timeout";
    case FailureCode::kConnectionError:     return "connection_error";
    case FailureCode::kProviderUnavailable: return "provider_unavailable";
    case FailureCode::kRateLimited:         return "rate_limited";
    case FailureCode::kPeerOffline:         return "peer_offline";
    case FailureCode::kTransferFailed:      return "transfer_failed";
    case FailureCode::kQueueTimeout:        return "queue_timeout";
    case FailureCode::kStalled:             return "stalled";
    case FailureCode::kSourceNotFound:      return "source_not_found";
    case FailureCode::kInvalidSource:       return "invalid_source";
    case FailureCode::kSourceBlocked:       return "source_blocked";
    case FailureCode::kDiskFull:            return "disk_full";
    case FailureCode::kUnknown:             return "unknown";
  }
  return "unknown";
}

inline bool IsRetryable(FailureCode code) noexcept {
  switch (code) {
    case FailureCode::kSourceNotFound:
    case FailureCode::kInvalidSource:
    case FailureCode::kSourceBlocked:
    case FailureCode::kDiskFull:
      return false;
    default:
      return true;
  }
}

// ============================================================================
// ProviderKind
// ============================================================================

/// Informational tag for the kind of transfer backend behind a dependency.
enum class ProviderKind : uint8_t {
  kPeer = 0,
  kUsenet,
  kTorrent,
  kDirect,
  kUnknown
};

inline const char* ProviderKindName(ProviderKind kind) noexcept {
  switch (kind) {
    case ProviderKind::kPeer:    return "peer";
    case ProviderKind::kUsenet:  return "usenet";
    case ProviderKind::kTorrent: return "torrent";
    case ProviderKind::kDirect:  return "direct";
    case ProviderKind::kUnknown: return "unknown";
  }
  return "unknown";
}

// ============================================================================
// JobError
// ============================================================================

enum class JobError : uint8_t {
  kNotFound = 0,
  kInvalidTransition,  ///< Edge not in the state machine; job unchanged.
  kConflict,           ///< Status changed concurrently; compare-and-set lost.
  kInvalidArgument,
  kStaleAttempt        ///< Callback for an attempt that is no longer current.
};

inline const char* JobErrorName(JobError err) noexcept {
  switch (err) {
    case JobError::kNotFound:          return "not_found";
    case JobError::kInvalidTransition: return "invalid_transition";
    case JobError::kConflict:          return "conflict";
    case JobError::kInvalidArgument:   return "invalid_argument";
    case JobError::kStaleAttempt:      return "stale_attempt";
  }
  return "unknown";
}

// ============================================================================
// DownloadJob
// ============================================================================

using DependencyName = FixedString<32>;
using ExternalId = FixedString<64>;

/**
 * @brief One requested transfer of one media item.
 *
 * Timestamps are monotonic milliseconds read from the system Clock.
 */
struct DownloadJob {
  JobId id;
  std::string track_reference;
  DependencyName dependency;  ///< Provider and breaker name.
  ProviderKind provider_kind = ProviderKind::kUnknown;

  JobStatus status = JobStatus::kWaiting;
  int32_t priority = 0;
  uint32_t retry_count = 0;
  uint32_t max_retries = 3;

  ExternalId external_id;  ///< Empty until accepted by the provider.
  std::string source_descriptor;
  std::string target_location;

  double progress_percent = 0.0;
  uint64_t bytes_transferred = 0;
  uint64_t bytes_total = 0;

  std::string error_message;
  FailureCode failure_code = FailureCode::kNone;
  optional<uint64_t> last_error_at;

  uint64_t created_at = 0;
  optional<uint64_t> started_at;
  optional<uint64_t> completed_at;
  optional<uint64_t> next_retry_at;

  uint64_t queue_seq = 0;  ///< FIFO key inside a priority tier.
  uint32_t attempt = 0;    ///< Incremented on every dispatch claim.
};

/**
 * @brief Request to create a job. Only WAITING and PENDING are valid
 *        initial statuses.
 */
struct NewJob {
  std::string track_reference;
  DependencyName dependency;
  ProviderKind provider_kind = ProviderKind::kUnknown;
  int32_t priority = 0;
  uint32_t max_retries = 3;
  std::string source_descriptor;
  std::string target_location;
  JobStatus initial_status = JobStatus::kWaiting;
};

/**
 * @brief Dispatch eligibility: dispatchable status and no pending backoff.
 */
inline bool IsDispatchEligible(const DownloadJob& job, uint64_t now_ms) noexcept {
  if ((StatusBit(job.status) & kDispatchableStatuses) == 0U) return false;
  return !job.next_retry_at.has_value() || job.next_retry_at.value() <= now_ms;
}

/**
 * @brief Dispatch order: priority descending, then queue_seq ascending.
 */
inline bool DispatchOrderLess(const DownloadJob& a,
                              const DownloadJob& b) noexcept {
  if (a.priority != b.priority) return a.priority > b.priority;
  return a.queue_seq < b.queue_seq;
}

}  // namespace dlcore

#endif  // DLCORE_DOWNLOAD_JOB_HPP_
