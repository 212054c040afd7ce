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
 * @file circuit_breaker.hpp
 * @brief Per-dependency circuit breaker and the registry that owns them.
 *
 *   CLOSED --(consecutive failures >= threshold)--> OPEN
 *   OPEN   --(recovery timeout elapsed, next request)--> HALF_OPEN (one probe)
 *   HALF_OPEN --(probe success)--> CLOSED
 *   HALF_OPEN --(probe failure)--> OPEN (recovery window restarts)
 *
 * Each breaker is one mutex-guarded cell. The OPEN -> HALF_OPEN flip and the
 * probe grant happen under that mutex, so exactly one concurrent caller gets
 * the probe.
 */

#ifndef DLCORE_CIRCUIT_BREAKER_HPP_
#define DLCORE_CIRCUIT_BREAKER_HPP_

#include "dlcore/clock.hpp"
#include "dlcore/download_job.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <cinttypes>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace dlcore {

enum class BreakerState : uint8_t { kClosed = 0, kOpen, kHalfOpen };

inline const char* BreakerStateName(BreakerState state) noexcept {
  switch (state) {
    case BreakerState::kClosed:   return "CLOSED";
    case BreakerState::kOpen:     return "OPEN";
    case BreakerState::kHalfOpen: return "HALF_OPEN";
  }
  return "UNKNOWN";
}

/// Outcome of asking a breaker for permission.
enum class Admission : uint8_t {
  kRejected = 0,
  kAllowed,  ///< CLOSED: normal request.
  kProbe     ///< HALF_OPEN: the single recovery probe.
};

struct BreakerConfig {
  uint32_t failure_threshold = 5;
  uint64_t recovery_timeout_ms = 60000;
};

/**
 * @brief Read-only copy of one breaker's state and counters.
 */
struct CircuitBreakerSnapshot {
  DependencyName name;
  BreakerState state = BreakerState::kClosed;
  uint32_t consecutive_failures = 0;
  uint32_t consecutive_successes = 0;
  uint64_t total_requests = 0;
  uint64_t total_failures = 0;
  uint64_t total_successes = 0;
  uint32_t failure_threshold = 0;
  uint64_t recovery_timeout_ms = 0;
  optional<uint64_t> last_failure_at;
  uint64_t last_state_change_at = 0;
  bool probe_in_flight = false;
  uint64_t retry_after_ms = 0;  ///< Remaining OPEN time, 0 otherwise.
};

// ============================================================================
// CircuitBreaker
// ============================================================================

class CircuitBreaker final {
 public:
  CircuitBreaker(const DependencyName& name, const BreakerConfig& config,
                 const Clock& clock) noexcept
      : name_(name),
        config_(config),
        clock_(clock),
        last_state_change_at_(clock.NowMs()) {}

  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  /**
   * @brief Ask to send one request. An OPEN breaker whose recovery window
   *        has elapsed flips to HALF_OPEN here and grants the probe.
   */
  Admission TryAcquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t now = clock_.NowMs();
    switch (state_) {
      case BreakerState::kClosed:
        ++total_requests_;
        return Admission::kAllowed;
      case BreakerState::kOpen:
        if (now < last_state_change_at_ + config_.recovery_timeout_ms) {
          return Admission::kRejected;
        }
        ChangeState(BreakerState::kHalfOpen, now);
        probe_in_flight_ = true;
        ++total_requests_;
        return Admission::kProbe;
      case BreakerState::kHalfOpen:
        if (probe_in_flight_) return Admission::kRejected;
        probe_in_flight_ = true;
        ++total_requests_;
        return Admission::kProbe;
    }
    return Admission::kRejected;
  }

  bool AllowRequest() { return TryAcquire() != Admission::kRejected; }

  void RecordSuccess() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_successes_;
    ++consecutive_successes_;
    if (state_ == BreakerState::kHalfOpen) {
      consecutive_failures_ = 0U;
      probe_in_flight_ = false;
      ChangeState(BreakerState::kClosed, clock_.NowMs());
    } else if (state_ == BreakerState::kClosed) {
      consecutive_failures_ = 0U;
    }
  }

  void RecordFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t now = clock_.NowMs();
    ++total_failures_;
    ++consecutive_failures_;
    consecutive_successes_ = 0U;
    last_failure_at_ = now;
    if (state_ == BreakerState::kHalfOpen) {
      probe_in_flight_ = false;
      ChangeState(BreakerState::kOpen, now);
    } else if (state_ == BreakerState::kClosed &&
               consecutive_failures_ >= config_.failure_threshold) {
      ChangeState(BreakerState::kOpen, now);
    }
  }

  /**
   * @brief Return a probe that produced no outcome (for example the job was
   *        claimed by someone else), so the next caller may probe instead.
   */
  void ReleaseProbe() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == BreakerState::kHalfOpen) probe_in_flight_ = false;
  }

  /// Operator reset to CLOSED. Lifetime counters are kept.
  void Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    consecutive_failures_ = 0U;
    consecutive_successes_ = 0U;
    probe_in_flight_ = false;
    if (state_ != BreakerState::kClosed) {
      ChangeState(BreakerState::kClosed, clock_.NowMs());
    }
    DLCORE_LOG_INFO("Breaker", "'%s' manually reset", name_.c_str());
  }

  void Configure(const BreakerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
  }

  /// Current state without side effects (an elapsed OPEN stays OPEN here).
  BreakerState State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
  }

  CircuitBreakerSnapshot Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t now = clock_.NowMs();
    CircuitBreakerSnapshot snap;
    snap.name = name_;
    snap.state = state_;
    snap.consecutive_failures = consecutive_failures_;
    snap.consecutive_successes = consecutive_successes_;
    snap.total_requests = total_requests_;
    snap.total_failures = total_failures_;
    snap.total_successes = total_successes_;
    snap.failure_threshold = config_.failure_threshold;
    snap.recovery_timeout_ms = config_.recovery_timeout_ms;
    snap.last_failure_at = last_failure_at_;
    snap.last_state_change_at = last_state_change_at_;
    snap.probe_in_flight = probe_in_flight_;
    if (state_ == BreakerState::kOpen) {
      const uint64_t reopen = last_state_change_at_ + config_.recovery_timeout_ms;
      snap.retry_after_ms = (reopen > now) ? (reopen - now) : 0U;
    }
    return snap;
  }

  const DependencyName& Name() const noexcept { return name_; }

 private:
  void ChangeState(BreakerState next, uint64_t now) {
    const BreakerState prev = state_;
    state_ = next;
    last_state_change_at_ = now;
    if (next == BreakerState::kOpen) {
      DLCORE_LOG_WARN("Breaker",
                      "'%s' %s -> OPEN after %u consecutive failures, retry in "
                      "%" PRIu64 " ms",
                      name_.c_str(), BreakerStateName(prev),
                      consecutive_failures_, config_.recovery_timeout_ms);
    } else {
      DLCORE_LOG_INFO("Breaker", "'%s' %s -> %s", name_.c_str(),
                      BreakerStateName(prev), BreakerStateName(next));
    }
  }

  const DependencyName name_;
  BreakerConfig config_;
  const Clock& clock_;

  mutable std::mutex mutex_;
  BreakerState state_ = BreakerState::kClosed;
  uint32_t consecutive_failures_ = 0;
  uint32_t consecutive_successes_ = 0;
  uint64_t total_requests_ = 0;
  uint64_t total_failures_ = 0;
  uint64_t total_successes_ = 0;
  optional<uint64_t> last_failure_at_;
  uint64_t last_state_change_at_;
  bool probe_in_flight_ = false;
};

// ============================================================================
// CircuitBreakerRegistry
// ============================================================================

/**
 * @brief Owns one breaker per dependency name, created on first reference.
 *
 * Breakers are never removed, so references returned by Get() stay valid for
 * the registry's lifetime.
 */
class CircuitBreakerRegistry final {
 public:
  explicit CircuitBreakerRegistry(const Clock& clock,
                                  const BreakerConfig& defaults = BreakerConfig())
      : clock_(clock), defaults_(defaults) {}

  CircuitBreakerRegistry(const CircuitBreakerRegistry&) = delete;
  CircuitBreakerRegistry& operator=(const CircuitBreakerRegistry&) = delete;

  CircuitBreaker& Get(const DependencyName& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) return *it->second;
    auto override_it = overrides_.find(name);
    const BreakerConfig& cfg =
        (override_it != overrides_.end()) ? override_it->second : defaults_;
    std::unique_ptr<CircuitBreaker> breaker(new CircuitBreaker(name, cfg, clock_));
    CircuitBreaker& ref = *breaker;
    breakers_.emplace(name, std::move(breaker));
    return ref;
  }

  Admission TryAcquire(const DependencyName& name) { return Get(name).TryAcquire(); }
  bool AllowRequest(const DependencyName& name) { return Get(name).AllowRequest(); }
  void RecordSuccess(const DependencyName& name) { Get(name).RecordSuccess(); }
  void RecordFailure(const DependencyName& name) { Get(name).RecordFailure(); }
  void ReleaseProbe(const DependencyName& name) { Get(name).ReleaseProbe(); }
  void Reset(const DependencyName& name) { Get(name).Reset(); }

  /**
   * @brief Per-dependency configuration. Applies now if the breaker exists,
   *        otherwise when it is first referenced.
   */
  void Configure(const DependencyName& name, const BreakerConfig& config) {
    CircuitBreaker* existing = nullptr;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      overrides_[name] = config;
      auto it = breakers_.find(name);
      if (it != breakers_.end()) existing = it->second.get();
    }
    if (existing != nullptr) existing->Configure(config);
  }

  /// Defaults for breakers created from now on.
  void SetDefaults(const BreakerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaults_ = config;
  }

  /// State of @p name; a never-referenced dependency reads as CLOSED.
  BreakerState StateOf(const DependencyName& name) const {
    const CircuitBreaker* breaker = Find(name);
    return (breaker == nullptr) ? BreakerState::kClosed : breaker->State();
  }

  optional<CircuitBreakerSnapshot> Snapshot(const DependencyName& name) const {
    const CircuitBreaker* breaker = Find(name);
    if (breaker == nullptr) return {};
    return breaker->Snapshot();
  }

  std::vector<CircuitBreakerSnapshot> SnapshotAll() const {
    std::vector<const CircuitBreaker*> all;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      all.reserve(breakers_.size());
      for (const auto& entry : breakers_) all.push_back(entry.second.get());
    }
    std::vector<CircuitBreakerSnapshot> out;
    out.reserve(all.size());
    for (const CircuitBreaker* breaker : all) out.push_back(breaker->Snapshot());
    return out;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(breakers_.size());
  }

 private:
  const CircuitBreaker* Find(const DependencyName& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    return (it == breakers_.end()) ? nullptr : it->second.get();
  }

  const Clock& clock_;
  mutable std::mutex mutex_;
  BreakerConfig defaults_;
  std::map<DependencyName, BreakerConfig> overrides_;
  std::map<DependencyName, std::unique_ptr<CircuitBreaker>> breakers_;
};

}  // namespace dlcore

#endif  // DLCORE_CIRCUIT_BREAKER_HPP_
