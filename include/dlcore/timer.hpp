/**
 * @file timer.hpp
 * @brief Periodic task scheduler driven by an injectable Clock.
 *
 * Every periodic activity in dlcore (dispatcher tick, retry sweep,
 * orchestrator supervision) is a task registered here rather than a sleep
 * loop of its own. Deadlines are read from a Clock, so a test can advance a
 * ManualClock and call RunDue() instead of waiting in real time. Start()
 * runs the same RunDue() from a background thread.
 *
 * Due callbacks are collected under the slot mutex and invoked after it is
 * released, so a callback may Add() or Remove() tasks on its own scheduler.
 * Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef DLCORE_TIMER_HPP_
#define DLCORE_TIMER_HPP_

#include "dlcore/clock.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

namespace dlcore {

// ============================================================================
// TimerTaskFn - Callback type for timer tasks
// ============================================================================

/**
 * @brief Plain function pointer invoked by the scheduler on each period tick.
 *
 * @param ctx  User-supplied opaque context pointer (may be nullptr).
 */
using TimerTaskFn = void (*)(void* ctx);

// ============================================================================
// TimerScheduler
// ============================================================================

/**
 * @brief Fixed-capacity periodic scheduler.
 *
 * @tparam MaxTasks  Number of task slots.
 *
 * Typical usage:
 *
 *   dlcore::SteadyClock clock;
 *   dlcore::TimerScheduler<8> sched(clock);
 *   sched.Add(5000, &QueueDispatcher::TickThunk, &dispatcher);
 *   sched.Start();
 *   // ...
 *   sched.Stop();
 *
 * Non-copyable, non-movable.
 */
template <uint32_t MaxTasks = 16>
class TimerScheduler final {
  static_assert(MaxTasks > 0U, "TimerScheduler needs at least one slot");

 public:
  explicit TimerScheduler(const Clock& clock) noexcept : clock_(clock) {}

  ~TimerScheduler() { Stop(); }

  TimerScheduler(const TimerScheduler&) = delete;
  TimerScheduler& operator=(const TimerScheduler&) = delete;
  TimerScheduler(TimerScheduler&&) = delete;
  TimerScheduler& operator=(TimerScheduler&&) = delete;

  // --------------------------------------------------------------------------
  // Task Management
  // --------------------------------------------------------------------------

  /**
   * @brief Register a periodic task. The first firing is one period from now.
   *
   * @return TimerTaskId on success, or
   *         - kInvalidPeriod if period_ms == 0 or fn is nullptr,
   *         - kSlotsFull     if all slots are occupied.
   */
  expected<TimerTaskId, TimerError> Add(uint32_t period_ms, TimerTaskFn fn,
                                        void* ctx = nullptr) {
    if (period_ms == 0U || fn == nullptr) {
      return expected<TimerTaskId, TimerError>::error(
          TimerError::kInvalidPeriod);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxTasks; ++i) {
      if (!slots_[i].active) {
        slots_[i].fn = fn;
        slots_[i].ctx = ctx;
        slots_[i].period_ms = period_ms;
        slots_[i].next_fire_ms = clock_.NowMs() + period_ms;
        slots_[i].id = next_id_++;
        slots_[i].active = true;
        return expected<TimerTaskId, TimerError>::success(
            TimerTaskId(slots_[i].id));
      }
    }
    return expected<TimerTaskId, TimerError>::error(TimerError::kSlotsFull);
  }

  /**
   * @brief Remove a task. A firing already collected by RunDue() on another
   *        thread may still complete after Remove() returns.
   *
   * @return Success, or TimerError::kNotRunning if the id is unknown.
   */
  expected<void, TimerError> Remove(TimerTaskId task_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (uint32_t i = 0U; i < MaxTasks; ++i) {
      if (slots_[i].active && slots_[i].id == task_id.value()) {
        slots_[i].active = false;
        return expected<void, TimerError>::success();
      }
    }
    return expected<void, TimerError>::error(TimerError::kNotRunning);
  }

  /**
   * @brief Fire every task whose deadline has passed, once each.
   *
   * A task that missed several periods fires once and its deadline moves to
   * the next period boundary after now.
   *
   * @return Number of callbacks invoked.
   */
  uint32_t RunDue() {
    Due due[MaxTasks];
    uint32_t count = 0U;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      const uint64_t now = clock_.NowMs();
      for (uint32_t i = 0U; i < MaxTasks; ++i) {
        TaskSlot& slot = slots_[i];
        if (!slot.active || now < slot.next_fire_ms) continue;
        due[count].fn = slot.fn;
        due[count].ctx = slot.ctx;
        ++count;
        slot.next_fire_ms += slot.period_ms;
        while (slot.next_fire_ms <= now) {
          slot.next_fire_ms += slot.period_ms;
        }
      }
    }
    for (uint32_t i = 0U; i < count; ++i) {
      due[i].fn(due[i].ctx);
    }
    return count;
  }

  /**
   * @brief Milliseconds until the earliest deadline, or UINT64_MAX when idle.
   */
  uint64_t MsUntilNextDue() const {
    std::lock_guard<std::mutex> lock(mutex_);
    const uint64_t now = clock_.NowMs();
    uint64_t min_remaining = UINT64_MAX;
    for (uint32_t i = 0U; i < MaxTasks; ++i) {
      if (!slots_[i].active) continue;
      const uint64_t remaining =
          (slots_[i].next_fire_ms > now) ? (slots_[i].next_fire_ms - now) : 0U;
      if (remaining < min_remaining) min_remaining = remaining;
    }
    return min_remaining;
  }

  // --------------------------------------------------------------------------
  // Background Thread
  // --------------------------------------------------------------------------

  /**
   * @brief Start the background thread that calls RunDue().
   *
   * @return Success, or TimerError::kAlreadyRunning.
   */
  expected<void, TimerError> Start() {
    bool expected_state = false;
    if (!running_.compare_exchange_strong(expected_state, true,
                                          std::memory_order_acq_rel)) {
      return expected<void, TimerError>::error(TimerError::kAlreadyRunning);
    }
    worker_ = std::thread(&TimerScheduler::ScheduleLoop, this);
    return expected<void, TimerError>::success();
  }

  /**
   * @brief Stop the background thread (blocks until it exits).
   *
   * Safe to call when not running. Must not be called from a task callback.
   */
  void Stop() {
    {
      std::lock_guard<std::mutex> lock(wake_mutex_);
      running_.store(false, std::memory_order_release);
    }
    wake_cv_.notify_all();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  bool IsRunning() const noexcept {
    return running_.load(std::memory_order_acquire);
  }

  uint32_t TaskCount() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t count = 0U;
    for (uint32_t i = 0U; i < MaxTasks; ++i) {
      if (slots_[i].active) ++count;
    }
    return count;
  }

  static constexpr uint32_t Capacity() noexcept { return MaxTasks; }

 private:
  struct TaskSlot {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
    uint64_t period_ms = 0;
    uint64_t next_fire_ms = 0;  ///< Absolute deadline on clock_.
    uint32_t id = 0;
    bool active = false;
  };

  struct Due {
    TimerTaskFn fn = nullptr;
    void* ctx = nullptr;
  };

  void ScheduleLoop() {
    while (running_.load(std::memory_order_acquire)) {
      (void)RunDue();

      // Sleep for half the shortest remaining time, clamped to [1ms, 10ms].
      const uint64_t remaining = MsUntilNextDue();
      uint64_t sleep_ms = (remaining == UINT64_MAX) ? 10U : (remaining / 2U);
      if (sleep_ms < 1U) sleep_ms = 1U;
      if (sleep_ms > 10U) sleep_ms = 10U;

      std::unique_lock<std::mutex> lock(wake_mutex_);
      wake_cv_.wait_for(lock, std::chrono::milliseconds(sleep_ms), [this] {
        return !running_.load(std::memory_order_acquire);
      });
    }
  }

  const Clock& clock_;
  TaskSlot slots_[MaxTasks];
  uint32_t next_id_ = 1;
  std::atomic<bool> running_{false};
  std::thread worker_;
  mutable std::mutex mutex_;  ///< Guards slots_ and next_id_.
  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;
};

}  // namespace dlcore

#endif  // DLCORE_TIMER_HPP_
