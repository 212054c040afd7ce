/**
 * @file job_events.hpp
 * @brief Change feed of job status and progress deltas.
 *
 * Two delivery modes over the same sequence-numbered stream:
 * - push: Subscribe() a callback, invoked on the publishing thread after the
 *   feed lock is released;
 * - pull: Poll() from a cursor over a bounded history. A cursor that fell
 *   behind the history reports a gap so the reader can re-query the queue.
 */

#ifndef DLCORE_JOB_EVENTS_HPP_
#define DLCORE_JOB_EVENTS_HPP_

#include "dlcore/download_job.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace dlcore {

enum class JobEventKind : uint8_t {
  kCreated = 0,
  kStatusChanged,
  kProgress,
  kPriorityChanged
};

inline const char* JobEventKindName(JobEventKind kind) noexcept {
  switch (kind) {
    case JobEventKind::kCreated:         return "created";
    case JobEventKind::kStatusChanged:   return "status";
    case JobEventKind::kProgress:        return "progress";
    case JobEventKind::kPriorityChanged: return "priority";
  }
  return "unknown";
}

/**
 * @brief One delta. For kCreated and kProgress old_status == new_status.
 */
struct JobEvent {
  uint64_t seq = 0;  ///< Assigned by the feed, starts at 1.
  JobId job_id;
  JobEventKind kind = JobEventKind::kCreated;
  JobStatus old_status = JobStatus::kWaiting;
  JobStatus new_status = JobStatus::kWaiting;
  int32_t priority = 0;
  uint32_t retry_count = 0;
  double progress_percent = 0.0;
  uint64_t bytes_transferred = 0;
  uint64_t bytes_total = 0;
  uint64_t at_ms = 0;

  static JobEvent From(const DownloadJob& job, JobEventKind kind,
                       JobStatus old_status, uint64_t now_ms) {
    JobEvent ev;
    ev.job_id = job.id;
    ev.kind = kind;
    ev.old_status = old_status;
    ev.new_status = job.status;
    ev.priority = job.priority;
    ev.retry_count = job.retry_count;
    ev.progress_percent = job.progress_percent;
    ev.bytes_transferred = job.bytes_transferred;
    ev.bytes_total = job.bytes_total;
    ev.at_ms = now_ms;
    return ev;
  }
};

using JobEventFn = void (*)(const JobEvent& event, void* ctx);

enum class FeedError : uint8_t { kSubscribersFull = 0, kInvalidCallback };

/**
 * @brief Result of a pull. next_cursor is passed to the following Poll().
 */
struct FeedPoll {
  std::vector<JobEvent> events;
  uint64_t next_cursor = 0;
  bool gap = false;  ///< Events between the cursor and events[0] were dropped.
};

// ============================================================================
// JobEventFeed
// ============================================================================

class JobEventFeed final {
 public:
  static constexpr uint32_t kMaxSubscribers = 16U;

  explicit JobEventFeed(uint32_t history_capacity = 256U)
      : history_(history_capacity == 0U ? 1U : history_capacity) {}

  JobEventFeed(const JobEventFeed&) = delete;
  JobEventFeed& operator=(const JobEventFeed&) = delete;

  expected<SubscriptionId, FeedError> Subscribe(JobEventFn fn,
                                                void* ctx = nullptr) {
    if (fn == nullptr) {
      return expected<SubscriptionId, FeedError>::error(
          FeedError::kInvalidCallback);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < kMaxSubscribers; ++i) {
      if (!subscribers_[i].active) {
        subscribers_[i].fn = fn;
        subscribers_[i].ctx = ctx;
        subscribers_[i].id = next_sub_id_++;
        subscribers_[i].active = true;
        return expected<SubscriptionId, FeedError>::success(
            SubscriptionId(subscribers_[i].id));
      }
    }
    return expected<SubscriptionId, FeedError>::error(
        FeedError::kSubscribersFull);
  }

  /// A delivery already in progress on another thread may still arrive.
  bool Unsubscribe(SubscriptionId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < kMaxSubscribers; ++i) {
      if (subscribers_[i].active && subscribers_[i].id == id.value()) {
        subscribers_[i].active = false;
        return true;
      }
    }
    return false;
  }

  /**
   * @brief Append @p event to the history and deliver it to subscribers.
   * @return The sequence number assigned.
   */
  uint64_t Publish(JobEvent event) {
    Subscriber targets[kMaxSubscribers];
    uint32_t target_count = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      event.seq = ++latest_seq_;
      history_[Index(event.seq)] = event;
      for (uint32_t i = 0U; i < kMaxSubscribers; ++i) {
        if (subscribers_[i].active) targets[target_count++] = subscribers_[i];
      }
    }
    for (uint32_t i = 0U; i < target_count; ++i) {
      targets[i].fn(event, targets[i].ctx);
    }
    return event.seq;
  }

  /**
   * @brief Events with seq > @p cursor, oldest first, at most @p max_events.
   */
  FeedPoll Poll(uint64_t cursor, uint32_t max_events = 64U) const {
    FeedPoll out;
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t cap = history_.size();
    const uint64_t oldest = (latest_seq_ > cap) ? (latest_seq_ - cap + 1U) : 1U;
    uint64_t next = cursor + 1U;
    if (next < oldest && latest_seq_ > 0U) {
      out.gap = true;
      next = oldest;
    }
    while (next <= latest_seq_ && out.events.size() < max_events) {
      out.events.push_back(history_[Index(next)]);
      ++next;
    }
    out.next_cursor = next - 1U;
    return out;
  }

  uint64_t LatestSeq() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_seq_;
  }

  uint32_t SubscriberCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < kMaxSubscribers; ++i) {
      if (subscribers_[i].active) ++count;
    }
    return count;
  }

 private:
  struct Subscriber {
    JobEventFn fn = nullptr;
    void* ctx = nullptr;
    uint32_t id = 0;
    bool active = false;
  };

  size_t Index(uint64_t seq) const noexcept {
    return static_cast<size_t>((seq - 1U) % history_.size());
  }

  mutable std::mutex mutex_;
  std::vector<JobEvent> history_;
  uint64_t latest_seq_ = 0;
  Subscriber subscribers_[kMaxSubscribers];
  uint32_t next_sub_id_ = 1;
};

}  // namespace dlcore

#endif  // DLCORE_JOB_EVENTS_HPP_
