/**
 * @file job_store.hpp
 * @brief Job persistence interface and the bundled in-memory engine.
 *
 * The store is a plain record engine: it assigns ids and ordering sequence
 * numbers and performs per-row compare-and-set on status. State machine
 * rules live one level up in JobQueue.
 *
 * InMemoryJobStore locking:
 * - rows_mutex_ (shared) guards the row table; only Create() takes it
 *   exclusively.
 * - each Row has its own mutex, so compare-and-set on different jobs never
 *   contends.
 */

#ifndef DLCORE_JOB_STORE_HPP_
#define DLCORE_JOB_STORE_HPP_

#include "dlcore/download_job.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <iterator>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace dlcore {

// ============================================================================
// Query types
// ============================================================================

/**
 * @brief Row predicate. Default-constructed filter matches every job.
 */
struct JobFilter {
  uint32_t status_mask = kAllStatuses;  ///< OR of StatusBit() values.
  DependencyName dependency;            ///< Empty matches any dependency.
  std::string track_reference;          ///< Empty matches any track.
  optional<uint64_t> eligible_at;       ///< Set: only jobs eligible at t.
  optional<uint64_t> retry_due_at;      ///< Set: only jobs whose timer <= t.
  bool retry_budget_left = false;       ///< Only retryable, unspent budgets.

  bool Matches(const DownloadJob& job) const noexcept {
    if ((StatusBit(job.status) & status_mask) == 0U) return false;
    if (!dependency.empty() && job.dependency != dependency) return false;
    if (!track_reference.empty() && job.track_reference != track_reference)
      return false;
    if (eligible_at.has_value() && !IsDispatchEligible(job, eligible_at.value()))
      return false;
    if (retry_due_at.has_value() &&
        (!job.next_retry_at.has_value() ||
         job.next_retry_at.value() > retry_due_at.value())) {
      return false;
    }
    if (retry_budget_left &&
        (job.retry_count >= job.max_retries || !IsRetryable(job.failure_code))) {
      return false;
    }
    return true;
  }

  static JobFilter ByStatus(uint32_t mask) {
    JobFilter f;
    f.status_mask = mask;
    return f;
  }

  static JobFilter Eligible(uint64_t now_ms) {
    JobFilter f;
    f.status_mask = kDispatchableStatuses;
    f.eligible_at = now_ms;
    return f;
  }
};

enum class JobOrder : uint8_t {
  kDispatch = 0,   ///< priority DESC, queue_seq ASC
  kNewestFirst,    ///< created_at DESC, id DESC
  kOldestFirst     ///< created_at ASC, id ASC
};

// ============================================================================
// JobStore - persistence interface
// ============================================================================

class JobStore {
 public:
  /// Edits a row in place. Returning false abandons the edit.
  using Mutator = function_ref<bool(DownloadJob&)>;

  virtual ~JobStore() = default;

  /**
   * @brief Insert @p job, assigning its id and queue_seq.
   * @return The stored record.
   */
  virtual expected<DownloadJob, JobError> Create(const DownloadJob& job) = 0;

  virtual expected<DownloadJob, JobError> Get(JobId id) const = 0;

  /**
   * @brief Apply @p mutate only if the row's status equals @p expected_status.
   *
   * @return The updated record, or
   *         - kNotFound  if the id is unknown,
   *         - kConflict  if the status differs or the mutator declined.
   */
  virtual expected<DownloadJob, JobError> CompareAndSet(
      JobId id, JobStatus expected_status, Mutator mutate) = 0;

  /**
   * @brief Metadata update that must not change status.
   *
   * @return kInvalidArgument if the mutator changed status (edit discarded),
   *         kConflict if the mutator declined.
   */
  virtual expected<DownloadJob, JobError> Update(JobId id, Mutator mutate) = 0;

  /**
   * @brief Matching rows in @p order, skipping @p offset, at most @p limit
   *        (0 = unlimited).
   */
  virtual std::vector<DownloadJob> Query(const JobFilter& filter,
                                         JobOrder order, uint32_t offset,
                                         uint32_t limit) const = 0;

  virtual uint32_t Count(const JobFilter& filter) const = 0;

  /// Next value of the store-wide ordering counter. Strictly increasing.
  virtual uint64_t NextSequence() = 0;
};

// ============================================================================
// InMemoryJobStore
// ============================================================================

class InMemoryJobStore final : public JobStore {
 public:
  InMemoryJobStore() = default;

  InMemoryJobStore(const InMemoryJobStore&) = delete;
  InMemoryJobStore& operator=(const InMemoryJobStore&) = delete;

  expected<DownloadJob, JobError> Create(const DownloadJob& job) override {
    std::unique_ptr<Row> row(new Row());
    row->job = job;
    row->job.id = JobId(next_id_.fetch_add(1U, std::memory_order_relaxed));
    row->job.queue_seq = NextSequence();
    DownloadJob stored = row->job;

    std::unique_lock<std::shared_mutex> lock(rows_mutex_);
    rows_.emplace(stored.id.value(), std::move(row));
    return expected<DownloadJob, JobError>::success(std::move(stored));
  }

  expected<DownloadJob, JobError> Get(JobId id) const override {
    std::shared_lock<std::shared_mutex> lock(rows_mutex_);
    const Row* row = FindRow(id);
    if (row == nullptr) {
      return expected<DownloadJob, JobError>::error(JobError::kNotFound);
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    return expected<DownloadJob, JobError>::success(row->job);
  }

  expected<DownloadJob, JobError> CompareAndSet(JobId id,
                                                JobStatus expected_status,
                                                Mutator mutate) override {
    std::shared_lock<std::shared_mutex> lock(rows_mutex_);
    Row* row = FindRow(id);
    if (row == nullptr) {
      return expected<DownloadJob, JobError>::error(JobError::kNotFound);
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    if (row->job.status != expected_status) {
      return expected<DownloadJob, JobError>::error(JobError::kConflict);
    }
    DownloadJob draft = row->job;
    if (!mutate(draft)) {
      return expected<DownloadJob, JobError>::error(JobError::kConflict);
    }
    draft.id = row->job.id;
    row->job = draft;
    return expected<DownloadJob, JobError>::success(std::move(draft));
  }

  expected<DownloadJob, JobError> Update(JobId id, Mutator mutate) override {
    std::shared_lock<std::shared_mutex> lock(rows_mutex_);
    Row* row = FindRow(id);
    if (row == nullptr) {
      return expected<DownloadJob, JobError>::error(JobError::kNotFound);
    }
    std::lock_guard<std::mutex> row_lock(row->mutex);
    DownloadJob draft = row->job;
    if (!mutate(draft)) {
      return expected<DownloadJob, JobError>::error(JobError::kConflict);
    }
    if (draft.status != row->job.status) {
      return expected<DownloadJob, JobError>::error(JobError::kInvalidArgument);
    }
    draft.id = row->job.id;
    row->job = draft;
    return expected<DownloadJob, JobError>::success(std::move(draft));
  }

  std::vector<DownloadJob> Query(const JobFilter& filter, JobOrder order,
                                 uint32_t offset,
                                 uint32_t limit) const override {
    std::vector<DownloadJob> matches = Collect(filter);
    switch (order) {
      case JobOrder::kDispatch:
        std::sort(matches.begin(), matches.end(), DispatchOrderLess);
        break;
      case JobOrder::kNewestFirst:
        std::sort(matches.begin(), matches.end(),
                  [](const DownloadJob& a, const DownloadJob& b) {
                    if (a.created_at != b.created_at)
                      return a.created_at > b.created_at;
                    return b.id < a.id;
                  });
        break;
      case JobOrder::kOldestFirst:
        std::sort(matches.begin(), matches.end(),
                  [](const DownloadJob& a, const DownloadJob& b) {
                    if (a.created_at != b.created_at)
                      return a.created_at < b.created_at;
                    return a.id < b.id;
                  });
        break;
    }

    if (offset >= matches.size()) return {};
    auto first = matches.begin() + offset;
    auto last = (limit == 0U || matches.size() - offset <= limit)
                    ? matches.end()
                    : first + limit;
    return std::vector<DownloadJob>(std::make_move_iterator(first),
                                    std::make_move_iterator(last));
  }

  uint32_t Count(const JobFilter& filter) const override {
    std::shared_lock<std::shared_mutex> lock(rows_mutex_);
    uint32_t count = 0U;
    for (const auto& entry : rows_) {
      std::lock_guard<std::mutex> row_lock(entry.second->mutex);
      if (filter.Matches(entry.second->job)) ++count;
    }
    return count;
  }

  uint64_t NextSequence() override {
    return next_seq_.fetch_add(1U, std::memory_order_relaxed);
  }

  /// Number of stored rows.
  uint32_t Size() const {
    std::shared_lock<std::shared_mutex> lock(rows_mutex_);
    return static_cast<uint32_t>(rows_.size());
  }

 private:
  struct Row {
    mutable std::mutex mutex;
    DownloadJob job;
  };

  Row* FindRow(JobId id) const {
    auto it = rows_.find(id.value());
    return (it == rows_.end()) ? nullptr : it->second.get();
  }

  std::vector<DownloadJob> Collect(const JobFilter& filter) const {
    std::vector<DownloadJob> out;
    std::shared_lock<std::shared_mutex> lock(rows_mutex_);
    out.reserve(rows_.size());
    for (const auto& entry : rows_) {
      std::lock_guard<std::mutex> row_lock(entry.second->mutex);
      if (filter.Matches(entry.second->job)) out.push_back(entry.second->job);
    }
    return out;
  }

  mutable std::shared_mutex rows_mutex_;
  std::unordered_map<uint64_t, std::unique_ptr<Row>> rows_;
  std::atomic<uint64_t> next_id_{1};
  std::atomic<uint64_t> next_seq_{1};
};

}  // namespace dlcore

#endif  // DLCORE_JOB_STORE_HPP_
