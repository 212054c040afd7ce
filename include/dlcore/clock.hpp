/**
 * @file clock.hpp
 * @brief Injectable monotonic time source.
 *
 * Every "now" comparison in dlcore (breaker recovery windows, retry
 * timers, timer deadlines, job timestamps) reads a Clock. Production code
 * uses SteadyClock; tests drive a ManualClock forward explicitly.
 */

#ifndef DLCORE_CLOCK_HPP_
#define DLCORE_CLOCK_HPP_

#include "dlcore/platform.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>

namespace dlcore {

/**
 * @brief Monotonic millisecond clock interface.
 */
class Clock {
 public:
  virtual ~Clock() = default;

  /// Milliseconds since an arbitrary fixed origin. Never decreases.
  virtual uint64_t NowMs() const noexcept = 0;
};

/**
 * @brief Clock backed by std::chrono::steady_clock.
 */
class SteadyClock final : public Clock {
 public:
  uint64_t NowMs() const noexcept override {
    const auto dur = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(dur).count());
  }
};

/**
 * @brief Clock that only moves when told to. Thread-safe.
 */
class ManualClock final : public Clock {
 public:
  explicit ManualClock(uint64_t start_ms = 0) noexcept : now_ms_(start_ms) {}

  uint64_t NowMs() const noexcept override {
    return now_ms_.load(std::memory_order_acquire);
  }

  void Advance(uint64_t delta_ms) noexcept {
    now_ms_.fetch_add(delta_ms, std::memory_order_acq_rel);
  }

  /// Jump to an absolute time. Ignored if @p now_ms lies in the past.
  void Set(uint64_t now_ms) noexcept {
    uint64_t cur = now_ms_.load(std::memory_order_acquire);
    while (now_ms > cur &&
           !now_ms_.compare_exchange_weak(cur, now_ms,
                                          std::memory_order_acq_rel)) {
    }
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

}  // namespace dlcore

#endif  // DLCORE_CLOCK_HPP_
