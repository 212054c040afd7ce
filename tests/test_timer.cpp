/**
 * @file test_timer.cpp
 * @brief Tests for timer.hpp
 */

#include "dlcore/timer.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <chrono>
#include <thread>

namespace {

void Count(void* ctx) { static_cast<std::atomic<int>*>(ctx)->fetch_add(1); }

}  // namespace

// ============================================================================
// Task management
// ============================================================================

TEST_CASE("TimerScheduler Add and Remove", "[timer]") {
  dlcore::ManualClock clock;
  dlcore::TimerScheduler<4> sched(clock);

  auto result = sched.Add(100, [](void*) {}, nullptr);
  REQUIRE(result.has_value());
  REQUIRE(result.value().value() > 0);
  REQUIRE(sched.TaskCount() == 1U);

  REQUIRE(sched.Remove(result.value()).has_value());
  REQUIRE(sched.TaskCount() == 0U);

  auto again = sched.Remove(result.value());
  REQUIRE(!again.has_value());
  REQUIRE(again.get_error() == dlcore::TimerError::kNotRunning);
}

TEST_CASE("TimerScheduler rejects zero period and null callback", "[timer]") {
  dlcore::ManualClock clock;
  dlcore::TimerScheduler<4> sched(clock);
  auto zero = sched.Add(0, [](void*) {});
  REQUIRE(!zero.has_value());
  REQUIRE(zero.get_error() == dlcore::TimerError::kInvalidPeriod);

  auto null_fn = sched.Add(10, nullptr);
  REQUIRE(!null_fn.has_value());
  REQUIRE(null_fn.get_error() == dlcore::TimerError::kInvalidPeriod);
}

TEST_CASE("TimerScheduler slots full", "[timer]") {
  dlcore::ManualClock clock;
  dlcore::TimerScheduler<2> sched(clock);
  REQUIRE(sched.Add(100, [](void*) {}).has_value());
  REQUIRE(sched.Add(100, [](void*) {}).has_value());
  auto r3 = sched.Add(100, [](void*) {});
  REQUIRE(!r3.has_value());
  REQUIRE(r3.get_error() == dlcore::TimerError::kSlotsFull);
  REQUIRE(dlcore::TimerScheduler<2>::Capacity() == 2U);
}

// ============================================================================
// RunDue on a manual clock
// ============================================================================

TEST_CASE("TimerScheduler RunDue fires only after the period", "[timer]") {
  dlcore::ManualClock clock(1000);
  dlcore::TimerScheduler<4> sched(clock);
  std::atomic<int> fired{0};
  REQUIRE(sched.Add(5000, &Count, &fired).has_value());

  REQUIRE(sched.RunDue() == 0U);
  clock.Advance(4999);
  REQUIRE(sched.RunDue() == 0U);
  REQUIRE(sched.MsUntilNextDue() == 1U);

  clock.Advance(1);
  REQUIRE(sched.RunDue() == 1U);
  REQUIRE(fired.load() == 1);

  // Same instant: not due again.
  REQUIRE(sched.RunDue() == 0U);
}

TEST_CASE("TimerScheduler missed periods fire once", "[timer]") {
  dlcore::ManualClock clock;
  dlcore::TimerScheduler<4> sched(clock);
  std::atomic<int> fired{0};
  REQUIRE(sched.Add(100, &Count, &fired).has_value());

  clock.Advance(1050);
  REQUIRE(sched.RunDue() == 1U);
  REQUIRE(fired.load() == 1);
  REQUIRE(sched.MsUntilNextDue() == 50U);
}

TEST_CASE("TimerScheduler independent periods", "[timer]") {
  dlcore::ManualClock clock;
  dlcore::TimerScheduler<4> sched(clock);
  std::atomic<int> fast{0};
  std::atomic<int> slow{0};
  REQUIRE(sched.Add(10, &Count, &fast).has_value());
  REQUIRE(sched.Add(30, &Count, &slow).has_value());

  for (int i = 0; i < 6; ++i) {
    clock.Advance(10);
    (void)sched.RunDue();
  }
  REQUIRE(fast.load() == 6);
  REQUIRE(slow.load() == 2);
}

TEST_CASE("TimerScheduler callback may remove its own task", "[timer]") {
  struct Ctx {
    dlcore::TimerScheduler<4>* sched = nullptr;
    dlcore::TimerTaskId id;
    int calls = 0;
  };
  dlcore::ManualClock clock;
  dlcore::TimerScheduler<4> sched(clock);
  Ctx ctx;
  ctx.sched = &sched;
  auto added = sched.Add(10, [](void* p) {
    auto* c = static_cast<Ctx*>(p);
    ++c->calls;
    (void)c->sched->Remove(c->id);
  }, &ctx);
  REQUIRE(added.has_value());
  ctx.id = added.value();

  clock.Advance(10);
  REQUIRE(sched.RunDue() == 1U);
  clock.Advance(10);
  REQUIRE(sched.RunDue() == 0U);
  REQUIRE(ctx.calls == 1);
  REQUIRE(sched.TaskCount() == 0U);
}

// ============================================================================
// Background thread
// ============================================================================

TEST_CASE("TimerScheduler Start/Stop", "[timer]") {
  dlcore::SteadyClock clock;
  dlcore::TimerScheduler<4> sched(clock);
  REQUIRE(sched.Start().has_value());
  REQUIRE(sched.IsRunning());

  auto start2 = sched.Start();
  REQUIRE(!start2.has_value());
  REQUIRE(start2.get_error() == dlcore::TimerError::kAlreadyRunning);

  sched.Stop();
  REQUIRE(!sched.IsRunning());
  sched.Stop();
}

TEST_CASE("TimerScheduler background thread fires callbacks", "[timer]") {
  dlcore::SteadyClock clock;
  dlcore::TimerScheduler<4> sched(clock);
  std::atomic<int> counter{0};
  REQUIRE(sched.Add(10, &Count, &counter).has_value());

  REQUIRE(sched.Start().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(100));
  sched.Stop();

  REQUIRE(counter.load() > 0);
}
