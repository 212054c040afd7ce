/**
 * @file test_download_system.cpp
 * @brief End-to-end tests for download_system.hpp driven by a ManualClock.
 */

#include "dlcore/download_system.hpp"

#include "fake_provider.hpp"

#include <catch2/catch.hpp>

#include <vector>

using dlcore::BreakerState;
using dlcore::FailureCode;
using dlcore::JobId;
using dlcore::JobStatus;

namespace {

dlcore::SystemConfig TestConfig() {
  dlcore::SystemConfig cfg;
  cfg.dispatcher.max_concurrent = 2;
  cfg.dispatcher.tick_interval_ms = 1000;
  cfg.retry.policy.base_delay_ms = 10000;
  cfg.retry.policy.max_delay_ms = 60000;
  cfg.retry_sweep_interval_ms = 500;
  cfg.breaker.failure_threshold = 2;
  cfg.breaker.recovery_timeout_ms = 30000;
  cfg.event_history = 128;
  return cfg;
}

struct SystemFixture {
  explicit SystemFixture(const dlcore::SystemConfig& cfg = TestConfig())
      : system(clock, cfg) {
    REQUIRE(system.RegisterProvider("peer-source", &provider));
    auto report = system.StartWorkers();
    REQUIRE(report.started == 2U);
    REQUIRE(report.failed == 0U);
  }

  JobId Add(const char* track, JobStatus initial = JobStatus::kWaiting) {
    dlcore::NewJob req = system.MakeJob(track, "peer-source");
    req.source_descriptor = std::string("user/") + track;
    req.target_location = "/music";
    req.initial_status = initial;
    auto id = system.Enqueue(req);
    REQUIRE(id.has_value());
    return id.value();
  }

  /// Advance past one dispatch period and fire whatever is due.
  void Step(uint64_t ms = 1000) {
    clock.Advance(ms);
    (void)system.RunDueTasks();
  }

  dlcore::DownloadJob Job(JobId id) { return system.GetJob(id).value(); }

  dlcore::ManualClock clock{100000};
  dlcore::test::FakeProvider provider;
  dlcore::DownloadSystem system;
};

}  // namespace

TEST_CASE("DownloadSystem starts both workers healthy", "[system]") {
  SystemFixture f;
  REQUIRE(f.system.IsHealthy());

  auto status = f.system.WorkerStatus();
  REQUIRE(status.workers.size() == 2U);
  REQUIRE(status.running == 2U);
  REQUIRE(status.healthy);
  REQUIRE(status.workers[0].category == dlcore::WorkerCategory::kDownload);
  REQUIRE(status.workers[0].depends_on.empty());
  REQUIRE(status.workers[1].depends_on.size() == 1U);
  REQUIRE(status.workers[1].depends_on[0] ==
          dlcore::WorkerName(dlcore::kRetryWorkerName));

  f.system.Stop();
  REQUIRE_FALSE(f.system.IsHealthy());
  REQUIRE(f.system.WorkerStatus().running == 0U);
}

TEST_CASE("DownloadSystem dispatches and completes on the timer", "[system]") {
  SystemFixture f;
  const JobId id = f.Add("track-1");
  REQUIRE(f.Job(id).max_retries == TestConfig().default_max_retries);

  // Nothing runs until the dispatch period elapses.
  f.clock.Advance(500);
  (void)f.system.RunDueTasks();
  REQUIRE(f.Job(id).status == JobStatus::kWaiting);

  f.Step(500);
  REQUIRE(f.Job(id).status == JobStatus::kDownloading);
  const auto request = f.provider.LastFor(id);
  REQUIRE(request.source_descriptor == "user/track-1");

  request.sink->OnTransferCompleted(id, request.attempt, 2048, "/music/t1.flac");
  REQUIRE(f.Job(id).status == JobStatus::kCompleted);
  REQUIRE(f.system.QueueStatistics().Count(JobStatus::kCompleted) == 1U);

  // The feed saw the whole lifecycle.
  auto poll = f.system.Events().Poll(0, 64);
  REQUIRE_FALSE(poll.gap);
  REQUIRE(poll.events.front().kind == dlcore::JobEventKind::kCreated);
  bool saw_downloading = false;
  for (const auto& ev : poll.events) {
    if (ev.kind == dlcore::JobEventKind::kStatusChanged &&
        ev.new_status == JobStatus::kDownloading) {
      saw_downloading = true;
    }
  }
  REQUIRE(saw_downloading);
  REQUIRE(poll.events.back().new_status == JobStatus::kCompleted);
}

TEST_CASE("DownloadSystem honors the concurrency cap", "[system]") {
  SystemFixture f;
  const JobId a = f.Add("a");
  const JobId b = f.Add("b");
  const JobId c = f.Add("c");

  f.Step();
  REQUIRE(f.system.QueueStatistics().Count(JobStatus::kDownloading) == 2U);
  REQUIRE(f.Job(c).status == JobStatus::kWaiting);

  const auto req_a = f.provider.LastFor(a);
  req_a.sink->OnTransferCompleted(a, req_a.attempt, 1, "/music/a");
  f.Step();
  REQUIRE(f.Job(c).status == JobStatus::kDownloading);
  REQUIRE(f.Job(b).status == JobStatus::kDownloading);
}

TEST_CASE("DownloadSystem retries a transient failure after backoff", "[system]") {
  SystemFixture f;
  const JobId id = f.Add("flaky");
  f.Step();
  const auto first = f.provider.LastFor(id);

  dlcore::TransferFailure failure;
  failure.code = FailureCode::kTimeout;
  failure.message = "peer went quiet";
  first.sink->OnTransferFailed(id, first.attempt, failure);

  auto job = f.Job(id);
  REQUIRE(job.status == JobStatus::kWaiting);
  REQUIRE(job.retry_count == 1U);
  REQUIRE(job.next_retry_at.has_value());

  // Still inside the 10 s window.
  f.Step(5000);
  REQUIRE(f.provider.Requests().size() == 1U);

  f.Step(5000);
  REQUIRE(f.Job(id).status == JobStatus::kDownloading);
  REQUIRE(f.provider.Requests().size() == 2U);
  const auto second = f.provider.LastFor(id);
  REQUIRE(second.attempt != first.attempt);

  second.sink->OnTransferCompleted(id, second.attempt, 10, "/music/flaky");
  REQUIRE(f.Job(id).status == JobStatus::kCompleted);
}

TEST_CASE("DownloadSystem open breaker holds new jobs", "[system]") {
  SystemFixture f;
  f.system.Breakers().RecordFailure("peer-source");
  f.system.Breakers().RecordFailure("peer-source");
  REQUIRE(f.system.Breakers().StateOf("peer-source") == BreakerState::kOpen);

  // A PENDING request is demoted while the dependency is down.
  const JobId id = f.Add("held", JobStatus::kPending);
  REQUIRE(f.Job(id).status == JobStatus::kWaiting);

  f.Step();
  REQUIRE(f.provider.Requests().empty());
  REQUIRE(f.Job(id).retry_count == 0U);

  // After the recovery timeout the first transfer is the probe.
  f.Step(30000);
  REQUIRE(f.Job(id).status == JobStatus::kDownloading);
  auto snap = f.system.BreakerSnapshot("peer-source");
  REQUIRE(snap.has_value());
  REQUIRE(snap.value().state == BreakerState::kHalfOpen);

  const auto request = f.provider.LastFor(id);
  request.sink->OnTransferCompleted(id, request.attempt, 1, "/music/held");
  REQUIRE(f.system.Breakers().StateOf("peer-source") == BreakerState::kClosed);
}

TEST_CASE("DownloadSystem keeps PENDING when the breaker is closed", "[system]") {
  SystemFixture f;
  const JobId id = f.Add("eager", JobStatus::kPending);
  REQUIRE(f.Job(id).status == JobStatus::kPending);
}

TEST_CASE("DownloadSystem global pause", "[system]") {
  SystemFixture f;
  f.system.PauseDispatching();
  REQUIRE(f.system.IsDispatchingPaused());
  const JobId id = f.Add("later");
  f.Step();
  REQUIRE(f.Job(id).status == JobStatus::kWaiting);

  f.system.ResumeDispatching();
  f.Step();
  REQUIRE(f.Job(id).status == JobStatus::kDownloading);
}

TEST_CASE("DownloadSystem cancel aborts the transfer", "[system]") {
  SystemFixture f;
  const JobId id = f.Add("unwanted");
  f.Step();
  REQUIRE(f.Job(id).status == JobStatus::kDownloading);

  REQUIRE(f.system.Cancel(id).has_value());
  REQUIRE(f.Job(id).status == JobStatus::kCancelled);
  REQUIRE(f.provider.Cancels().size() == 1U);
}

TEST_CASE("DownloadSystem batch commands", "[system]") {
  SystemFixture f;
  const JobId a = f.Add("a");
  const JobId b = f.Add("b");
  const JobId idle = f.Add("idle");
  f.Step();
  REQUIRE(f.Job(a).status == JobStatus::kDownloading);
  REQUIRE(f.Job(b).status == JobStatus::kDownloading);
  std::vector<JobId> ids = {a, b, idle, JobId(9999)};

  // A WAITING job cannot be paused.
  auto paused = f.system.PauseMany(ids);
  REQUIRE(paused.succeeded == 2U);
  REQUIRE(paused.failed == 2U);
  REQUIRE(f.Job(a).status == JobStatus::kPaused);
  REQUIRE(f.Job(idle).status == JobStatus::kWaiting);
  REQUIRE(f.provider.Cancels().size() == 2U);

  auto resumed = f.system.ResumeMany({a, b});
  REQUIRE(resumed.succeeded == 2U);
  REQUIRE(f.Job(b).status == JobStatus::kQueued);

  // Manual retry only applies to FAILED jobs.
  auto retried = f.system.RetryMany({a, b});
  REQUIRE(retried.succeeded == 0U);
  REQUIRE(retried.failed == 2U);
}

TEST_CASE("DownloadSystem applies per-dependency breaker overrides", "[system]") {
  dlcore::SystemConfig cfg = TestConfig();
  dlcore::BreakerOverride entry;
  entry.name = dlcore::DependencyName("peer-source");
  entry.config.failure_threshold = 1;
  entry.config.recovery_timeout_ms = 5000;
  cfg.breaker_overrides.push_back(entry);

  SystemFixture f(cfg);
  f.system.Breakers().RecordFailure("peer-source");
  auto snap = f.system.BreakerSnapshot("peer-source");
  REQUIRE(snap.has_value());
  REQUIRE(snap.value().failure_threshold == 1U);
  REQUIRE(snap.value().state == BreakerState::kOpen);
}

TEST_CASE("DownloadSystem worker restart through the facade", "[system]") {
  SystemFixture f;
  const dlcore::WorkerName dispatcher(dlcore::kDispatchWorkerName);
  REQUIRE(f.system.StopWorker(dispatcher).has_value());
  REQUIRE_FALSE(f.system.IsHealthy());

  // With the dispatch task removed nothing is started.
  const JobId id = f.Add("idle");
  f.Step();
  REQUIRE(f.Job(id).status == JobStatus::kWaiting);

  REQUIRE(f.system.StartWorker(dispatcher).has_value());
  REQUIRE(f.system.IsHealthy());
  f.Step();
  REQUIRE(f.Job(id).status == JobStatus::kDownloading);
}
