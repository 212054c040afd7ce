/**
 * @file test_download_job.cpp
 * @brief Tests for download_job.hpp
 */

#include "dlcore/download_job.hpp"

#include <catch2/catch.hpp>

#include <string>

using dlcore::JobStatus;

TEST_CASE("CanTransition follows the state machine", "[download_job]") {
  REQUIRE(dlcore::CanTransition(JobStatus::kWaiting, JobStatus::kQueued));
  REQUIRE(dlcore::CanTransition(JobStatus::kWaiting, JobStatus::kPending));
  REQUIRE(dlcore::CanTransition(JobStatus::kPending, JobStatus::kQueued));
  REQUIRE(dlcore::CanTransition(JobStatus::kQueued, JobStatus::kDownloading));
  REQUIRE(dlcore::CanTransition(JobStatus::kQueued, JobStatus::kPaused));
  REQUIRE(dlcore::CanTransition(JobStatus::kDownloading, JobStatus::kCompleted));
  REQUIRE(dlcore::CanTransition(JobStatus::kDownloading, JobStatus::kStalled));
  REQUIRE(dlcore::CanTransition(JobStatus::kPaused, JobStatus::kQueued));
  REQUIRE(dlcore::CanTransition(JobStatus::kStalled, JobStatus::kDownloading));
  REQUIRE(dlcore::CanTransition(JobStatus::kStalled, JobStatus::kFailed));
  REQUIRE(dlcore::CanTransition(JobStatus::kFailed, JobStatus::kWaiting));
}

TEST_CASE("CanTransition rejects illegal edges", "[download_job]") {
  REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kWaiting, JobStatus::kDownloading));
  REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kPaused, JobStatus::kCancelled));
  REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kPaused, JobStatus::kDownloading));
  REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kStalled, JobStatus::kCancelled));
  REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kFailed, JobStatus::kQueued));

  for (uint32_t i = 0; i < dlcore::kJobStatusCount; ++i) {
    const auto to = static_cast<JobStatus>(i);
    REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kCompleted, to));
    REQUIRE_FALSE(dlcore::CanTransition(JobStatus::kCancelled, to));
  }
}

TEST_CASE("IsTerminal", "[download_job]") {
  REQUIRE(dlcore::IsTerminal(JobStatus::kCompleted));
  REQUIRE(dlcore::IsTerminal(JobStatus::kCancelled));
  REQUIRE_FALSE(dlcore::IsTerminal(JobStatus::kFailed));
  REQUIRE_FALSE(dlcore::IsTerminal(JobStatus::kPaused));
}

TEST_CASE("FailureCode retryability", "[download_job]") {
  REQUIRE(dlcore::IsRetryable(dlcore::FailureCode::kTimeout));
  REQUIRE(dlcore::IsRetryable(dlcore::FailureCode::kPeerOffline));
  REQUIRE(dlcore::IsRetryable(dlcore::FailureCode::kStalled));
  REQUIRE(dlcore::IsRetryable(dlcore::FailureCode::kUnknown));
  REQUIRE_FALSE(dlcore::IsRetryable(dlcore::FailureCode::kSourceNotFound));
  REQUIRE_FALSE(dlcore::IsRetryable(dlcore::FailureCode::kInvalidSource));
  REQUIRE_FALSE(dlcore::IsRetryable(dlcore::FailureCode::kSourceBlocked));
  REQUIRE_FALSE(dlcore::IsRetryable(dlcore::FailureCode::kDiskFull));
}

TEST_CASE("Status and code names", "[download_job]") {
  REQUIRE(std::string(dlcore::JobStatusName(JobStatus::kDownloading)) ==
          "DOWNLOADING");
  REQUIRE(std::string(dlcore::FailureCodeName(
              dlcore::FailureCode::kSourceBlocked)) == "source_blocked");
  REQUIRE(std::string(dlcore::ProviderKindName(dlcore::ProviderKind::kPeer)) ==
          "peer");
  REQUIRE(std::string(dlcore::JobErrorName(
              dlcore::JobError::kStaleAttempt)) == "stale_attempt");
}

TEST_CASE("IsDispatchEligible honours status and retry window", "[download_job]") {
  dlcore::DownloadJob job;
  job.status = JobStatus::kWaiting;
  REQUIRE(dlcore::IsDispatchEligible(job, 0));

  job.next_retry_at = 1000U;
  REQUIRE_FALSE(dlcore::IsDispatchEligible(job, 999));
  REQUIRE(dlcore::IsDispatchEligible(job, 1000));

  job.next_retry_at.reset();
  job.status = JobStatus::kStalled;
  REQUIRE(dlcore::IsDispatchEligible(job, 0));
  job.status = JobStatus::kPaused;
  REQUIRE_FALSE(dlcore::IsDispatchEligible(job, 0));
  job.status = JobStatus::kDownloading;
  REQUIRE_FALSE(dlcore::IsDispatchEligible(job, 0));
}

TEST_CASE("DispatchOrderLess: priority first, then FIFO", "[download_job]") {
  dlcore::DownloadJob high;
  high.priority = 5;
  high.queue_seq = 10;
  dlcore::DownloadJob low_early;
  low_early.priority = 0;
  low_early.queue_seq = 1;
  dlcore::DownloadJob low_late;
  low_late.priority = 0;
  low_late.queue_seq = 2;

  REQUIRE(dlcore::DispatchOrderLess(high, low_early));
  REQUIRE_FALSE(dlcore::DispatchOrderLess(low_early, high));
  REQUIRE(dlcore::DispatchOrderLess(low_early, low_late));
  REQUIRE_FALSE(dlcore::DispatchOrderLess(low_late, low_early));
}
