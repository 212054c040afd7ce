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
 * @file simulated_provider.hpp
 * @brief In-process TransferProvider that fakes transfers on a worker thread.
 *
 * Every transfer advances by a fixed chunk per step. Every fail_every-th
 * transfer fails with a timeout halfway through, which exercises the retry
 * and circuit breaker paths.
 */

#ifndef DLCORE_EXAMPLES_SIMULATED_PROVIDER_HPP_
#define DLCORE_EXAMPLES_SIMULATED_PROVIDER_HPP_

#include "dlcore/log.hpp"
#include "dlcore/transfer_provider.hpp"

#include <atomic>
#include <chrono>
#include <cinttypes>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace demo {

struct SimulatedProviderConfig {
  uint64_t transfer_bytes = 4U * 1024U * 1024U;
  uint64_t chunk_bytes = 512U * 1024U;
  uint32_t step_ms = 200;
  uint32_t fail_every = 4;  ///< 0 disables injected failures.
};

class SimulatedProvider final : public dlcore::TransferProvider {
 public:
  explicit SimulatedProvider(
      const SimulatedProviderConfig& config = SimulatedProviderConfig())
      : config_(config) {}

  ~SimulatedProvider() override { Stop(); }

  SimulatedProvider(const SimulatedProvider&) = delete;
  SimulatedProvider& operator=(const SimulatedProvider&) = delete;

  void Start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this]() { Run(); });
  }

  void Stop() {
    if (!running_.exchange(false)) return;
    cv_.notify_all();
    if (thread_.joinable()) thread_.join();
  }

  dlcore::expected<dlcore::ExternalId, dlcore::TransferFailure> Submit(
      const dlcore::TransferRequest& request) override {
    using R = dlcore::expected<dlcore::ExternalId, dlcore::TransferFailure>;
    if (!running_.load(std::memory_order_acquire)) {
      dlcore::TransferFailure failure;
      failure.code = dlcore::FailureCode::kProviderUnavailable;
      failure.message = "provider stopped";
      return R::error(failure);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    ++submitted_;
    Transfer t;
    t.external_id = dlcore::ExternalId(
        dlcore::TruncateToCapacity, "sim-" + std::to_string(submitted_));
    t.job_id = request.job_id;
    t.attempt = request.attempt;
    t.sink = request.sink;
    t.final_path = request.target_location + "/" + request.track_reference;
    t.doomed = config_.fail_every != 0U && (submitted_ % config_.fail_every) == 0U;
    transfers_.push_back(t);
    DLCORE_LOG_DEBUG("SimProvider", "job %" PRIu64 " -> %s",
                     request.job_id.value(), t.external_id.c_str());
    return R::success(t.external_id);
  }

  dlcore::expected<void, dlcore::TransferFailure> Cancel(
      const dlcore::ExternalId& external_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < transfers_.size(); ++i) {
      if (transfers_[i].external_id == external_id) {
        transfers_.erase(transfers_.begin() + static_cast<std::ptrdiff_t>(i));
        break;
      }
    }
    // Unknown ids are already gone, which is what the caller wants.
    return dlcore::expected<void, dlcore::TransferFailure>::success();
  }

  uint32_t InFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(transfers_.size());
  }

 private:
  struct Transfer {
    dlcore::ExternalId external_id;
    dlcore::JobId job_id;
    uint32_t attempt = 0;
    dlcore::TransferSink* sink = nullptr;
    std::string final_path;
    uint64_t bytes = 0;
    bool doomed = false;
  };

  enum class Outcome : uint8_t { kProgress, kCompleted, kFailed };

  struct Notice {
    Transfer transfer;
    Outcome outcome = Outcome::kProgress;
  };

  void Run() {
    std::vector<Notice> notices;
    while (running_.load(std::memory_order_acquire)) {
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, std::chrono::milliseconds(config_.step_ms), [this]() {
          return !running_.load(std::memory_order_acquire);
        });
        if (!running_.load(std::memory_order_acquire)) break;
        Advance(notices);
      }
      // Sink callbacks take the queue lock; never call them under ours.
      for (const Notice& n : notices) Deliver(n);
      notices.clear();
    }
  }

  void Advance(std::vector<Notice>& notices) {
    size_t i = 0;
    while (i < transfers_.size()) {
      Transfer& t = transfers_[i];
      t.bytes += config_.chunk_bytes;
      if (t.bytes > config_.transfer_bytes) t.bytes = config_.transfer_bytes;

      Notice n;
      n.transfer = t;
      if (t.doomed && t.bytes * 2U >= config_.transfer_bytes) {
        n.outcome = Outcome::kFailed;
      } else if (t.bytes >= config_.transfer_bytes) {
        n.outcome = Outcome::kCompleted;
      }
      notices.push_back(n);
      if (n.outcome == Outcome::kProgress) {
        ++i;
      } else {
        transfers_.erase(transfers_.begin() + static_cast<std::ptrdiff_t>(i));
      }
    }
  }

  void Deliver(const Notice& n) {
    const Transfer& t = n.transfer;
    switch (n.outcome) {
      case Outcome::kProgress:
        t.sink->OnTransferProgress(t.job_id, t.attempt, t.bytes,
                                   config_.transfer_bytes);
        break;
      case Outcome::kCompleted:
        t.sink->OnTransferCompleted(t.job_id, t.attempt, t.bytes, t.final_path);
        break;
      case Outcome::kFailed: {
        dlcore::TransferFailure failure;
        failure.code = dlcore::FailureCode::kTimeout;
        failure.message = "peer stopped responding";
        t.sink->OnTransferFailed(t.job_id, t.attempt, failure);
        break;
      }
    }
  }

  SimulatedProviderConfig config_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<Transfer> transfers_;
  uint64_t submitted_ = 0;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace demo

#endif  // DLCORE_EXAMPLES_SIMULATED_PROVIDER_HPP_
