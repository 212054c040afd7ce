/**
 * @file test_retry_scheduler.cpp
 * @brief Tests for retry_scheduler.hpp
 */

#include "dlcore/retry_scheduler.hpp"

#include <catch2/catch.hpp>

using dlcore::FailureCode;
using dlcore::JobId;
using dlcore::JobStatus;
using dlcore::RetryDecision;

namespace {

struct RetryFixture {
  dlcore::ManualClock clock{100000};
  dlcore::InMemoryJobStore store;
  dlcore::JobEventFeed feed;
  dlcore::JobQueue queue{store, feed, clock};
  dlcore::RetryScheduler retry{queue, clock, Config()};

  static dlcore::RetrySchedulerConfig Config() {
    dlcore::RetrySchedulerConfig cfg;
    cfg.policy.base_delay_ms = 10000;
    cfg.policy.max_delay_ms = 3600000;
    return cfg;
  }

  JobId Add(uint32_t max_retries = 3) {
    dlcore::NewJob req;
    req.dependency = "peer-source";
    req.max_retries = max_retries;
    req.source_descriptor = "user/file.flac";
    return queue.Enqueue(req).value();
  }

  /// Claim and fail the job on its current attempt.
  void FailOnce(JobId id, FailureCode code = FailureCode::kTimeout) {
    auto claimed = queue.Claim(id, queue.Get(id).value().status);
    REQUIRE(claimed.has_value());
    REQUIRE(queue.Fail(id, claimed.value().attempt, code, "boom").has_value());
  }
};

}  // namespace

TEST_CASE("ComputeBackoffMs doubles and saturates", "[retry]") {
  dlcore::RetryPolicy policy;
  policy.base_delay_ms = 10000;
  policy.max_delay_ms = 60000;
  REQUIRE(dlcore::ComputeBackoffMs(policy, 0) == 10000U);
  REQUIRE(dlcore::ComputeBackoffMs(policy, 1) == 20000U);
  REQUIRE(dlcore::ComputeBackoffMs(policy, 2) == 40000U);
  REQUIRE(dlcore::ComputeBackoffMs(policy, 3) == 60000U);
  REQUIRE(dlcore::ComputeBackoffMs(policy, 200) == 60000U);

  uint64_t previous = 0;
  for (uint32_t n = 0; n < 80; ++n) {
    const uint64_t d = dlcore::ComputeBackoffMs(policy, n);
    REQUIRE(d >= previous);
    REQUIRE(d <= policy.max_delay_ms);
    previous = d;
  }

  policy.base_delay_ms = 0;
  REQUIRE(dlcore::ComputeBackoffMs(policy, 5) == 0U);
}

TEST_CASE("RetryScheduler backoff scenario: 10s, 20s, then exhausted",
          "[retry]") {
  RetryFixture f;
  const JobId id = f.Add(3);

  f.FailOnce(id);
  uint64_t now = f.clock.NowMs();
  auto d1 = f.retry.OnJobFailed(id);
  REQUIRE(d1.has_value());
  REQUIRE(d1.value() == RetryDecision::kScheduled);
  auto job = f.queue.Get(id).value();
  REQUIRE(job.status == JobStatus::kWaiting);
  REQUIRE(job.retry_count == 1U);
  REQUIRE(job.next_retry_at.has_value());
  REQUIRE(job.next_retry_at.value() == now + 10000U);
  REQUIRE(job.source_descriptor.empty());

  f.clock.Advance(10000);
  f.FailOnce(id);
  now = f.clock.NowMs();
  REQUIRE(f.retry.OnJobFailed(id).value() == RetryDecision::kScheduled);
  job = f.queue.Get(id).value();
  REQUIRE(job.retry_count == 2U);
  REQUIRE(job.next_retry_at.value() == now + 20000U);

  f.clock.Advance(20000);
  f.FailOnce(id);
  REQUIRE(f.retry.OnJobFailed(id).value() == RetryDecision::kExhausted);
  job = f.queue.Get(id).value();
  REQUIRE(job.status == JobStatus::kFailed);
  REQUIRE(job.retry_count == 3U);
  REQUIRE_FALSE(job.next_retry_at.has_value());

  // Terminal: a further decision changes nothing.
  REQUIRE(f.retry.OnJobFailed(id).value() == RetryDecision::kExhausted);
  REQUIRE(f.queue.Get(id).value().retry_count == 3U);

  auto stats = f.retry.Stats();
  REQUIRE(stats.scheduled == 2U);
  REQUIRE(stats.exhausted == 1U);
}

TEST_CASE("RetryScheduler permanent failure zeroes the budget", "[retry]") {
  RetryFixture f;
  const JobId id = f.Add(5);
  f.FailOnce(id, FailureCode::kSourceNotFound);

  REQUIRE(f.retry.OnJobFailed(id).value() == RetryDecision::kPermanent);
  auto job = f.queue.Get(id).value();
  REQUIRE(job.status == JobStatus::kFailed);
  REQUIRE(job.retry_count == 5U);
  REQUIRE(f.retry.Stats().permanent == 1U);
}

TEST_CASE("RetryScheduler zero budget fails terminally at once", "[retry]") {
  RetryFixture f;
  const JobId id = f.Add(0);
  f.FailOnce(id);
  REQUIRE(f.retry.OnJobFailed(id).value() == RetryDecision::kExhausted);
  REQUIRE(f.queue.Get(id).value().status == JobStatus::kFailed);
}

TEST_CASE("RetryScheduler rejects jobs that are not FAILED", "[retry]") {
  RetryFixture f;
  const JobId id = f.Add();
  auto r = f.retry.OnJobFailed(id);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == dlcore::JobError::kInvalidTransition);

  auto missing = f.retry.OnJobFailed(JobId(777));
  REQUIRE(!missing.has_value());
  REQUIRE(missing.get_error() == dlcore::JobError::kNotFound);
}

TEST_CASE("RetryScheduler Sweep activates due timers and schedules orphans",
          "[retry]") {
  RetryFixture f;
  const JobId waiting = f.Add();
  f.FailOnce(waiting);
  REQUIRE(f.retry.OnJobFailed(waiting).value() == RetryDecision::kScheduled);

  // Failed while no scheduler looked at it.
  const JobId orphan = f.Add();
  f.FailOnce(orphan);

  // Spent budget: excluded from sweeps.
  const JobId spent = f.Add(1);
  f.FailOnce(spent);
  REQUIRE(f.retry.OnJobFailed(spent).value() == RetryDecision::kExhausted);

  REQUIRE(f.retry.Sweep() == 1U);
  REQUIRE(f.queue.Get(orphan).value().status == JobStatus::kWaiting);
  REQUIRE(f.queue.Get(waiting).value().next_retry_at.has_value());

  f.clock.Advance(10000);
  REQUIRE(f.retry.Sweep() == 2U);
  REQUIRE_FALSE(f.queue.Get(waiting).value().next_retry_at.has_value());
  REQUIRE_FALSE(f.queue.Get(orphan).value().next_retry_at.has_value());
  REQUIRE(f.queue.Get(spent).value().status == JobStatus::kFailed);

  auto stats = f.retry.Stats();
  REQUIRE(stats.sweeps == 2U);
  REQUIRE(stats.activated == 2U);
  REQUIRE(stats.last_sweep_activated == 2U);
  REQUIRE(stats.last_sweep_scheduled == 0U);
}

TEST_CASE("RetryScheduler Sweep honours max_per_sweep", "[retry]") {
  RetryFixture f;
  dlcore::RetrySchedulerConfig cfg = RetryFixture::Config();
  cfg.max_per_sweep = 2;
  dlcore::RetryScheduler limited(f.queue, f.clock, cfg);

  for (int i = 0; i < 5; ++i) f.FailOnce(f.Add());
  REQUIRE(limited.Sweep() == 2U);
  REQUIRE(limited.Sweep() == 2U);
  REQUIRE(limited.Sweep() == 1U);
  REQUIRE(limited.Sweep() == 0U);
}

TEST_CASE("RetryScheduler SetPolicy changes later delays", "[retry]") {
  RetryFixture f;
  REQUIRE(f.retry.ComputeDelayMs(1) == 20000U);
  dlcore::RetryPolicy fast;
  fast.base_delay_ms = 100;
  fast.max_delay_ms = 150;
  f.retry.SetPolicy(fast);
  REQUIRE(f.retry.ComputeDelayMs(0) == 100U);
  REQUIRE(f.retry.ComputeDelayMs(1) == 150U);
}
