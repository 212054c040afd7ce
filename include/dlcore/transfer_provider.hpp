/**
 * @file transfer_provider.hpp
 * @brief Seams to the external transfer backends.
 *
 * A TransferProvider accepts a request and reports back asynchronously
 * through the TransferSink carried in the request. Every callback carries the
 * attempt number it was submitted with; the sink drops callbacks whose
 * attempt is no longer current.
 *
 * ProviderRegistry and InMemoryBlocklist do not own what they reference.
 */

#ifndef DLCORE_TRANSFER_PROVIDER_HPP_
#define DLCORE_TRANSFER_PROVIDER_HPP_

#include "dlcore/download_job.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_set>

namespace dlcore {

struct TransferFailure {
  FailureCode code = FailureCode::kUnknown;
  std::string message;
};

class TransferSink;

struct TransferRequest {
  JobId job_id;
  uint32_t attempt = 0;
  std::string track_reference;
  std::string source_descriptor;
  std::string target_location;
  DependencyName dependency;
  TransferSink* sink = nullptr;
};

// ============================================================================
// TransferSink
// ============================================================================

class TransferSink {
 public:
  virtual ~TransferSink() = default;

  virtual void OnTransferProgress(JobId job_id, uint32_t attempt,
                                  uint64_t bytes_transferred,
                                  uint64_t bytes_total) = 0;
  virtual void OnTransferCompleted(JobId job_id, uint32_t attempt,
                                   uint64_t bytes_transferred,
                                   const std::string& final_path) = 0;
  virtual void OnTransferFailed(JobId job_id, uint32_t attempt,
                                const TransferFailure& failure) = 0;
};

// ============================================================================
// TransferProvider
// ============================================================================

class TransferProvider {
 public:
  virtual ~TransferProvider() = default;

  /**
   * @brief Start a transfer. Must not block on the transfer itself.
   * @return The provider's identifier for the transfer.
   */
  virtual expected<ExternalId, TransferFailure> Submit(
      const TransferRequest& request) = 0;

  /// Abort a transfer started by Submit().
  virtual expected<void, TransferFailure> Cancel(
      const ExternalId& external_id) = 0;

  /**
   * @brief Cheap reachability check used for half-open probes. Only called
   *        when SupportsProbe() is true; otherwise the first transfer after
   *        the recovery window is the probe.
   */
  virtual bool Probe() { return true; }
  virtual bool SupportsProbe() const { return false; }
};

// ============================================================================
// ProviderRegistry
// ============================================================================

class ProviderRegistry final {
 public:
  static constexpr uint32_t kMaxProviders = 16U;

  ProviderRegistry() = default;
  ProviderRegistry(const ProviderRegistry&) = delete;
  ProviderRegistry& operator=(const ProviderRegistry&) = delete;

  /**
   * @brief Bind @p provider to @p name, replacing an earlier binding.
   * @return false if @p provider is null, @p name empty or the table full.
   */
  bool Register(const DependencyName& name, TransferProvider* provider) {
    if (provider == nullptr || name.empty()) return false;
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (Entry& entry : entries_) {
      if (entry.name == name) {
        entry.provider = provider;
        return true;
      }
    }
    return entries_.push_back(Entry{name, provider});
  }

  bool Unregister(const DependencyName& name) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (uint32_t i = 0U; i < entries_.size(); ++i) {
      if (entries_[i].name == name) {
        entries_.erase_unordered(i);
        return true;
      }
    }
    return false;
  }

  /// nullptr when nothing is registered under @p name.
  TransferProvider* Find(const DependencyName& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const Entry& entry : entries_) {
      if (entry.name == name) return entry.provider;
    }
    return nullptr;
  }

  uint32_t Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return static_cast<uint32_t>(entries_.size());
  }

 private:
  struct Entry {
    DependencyName name;
    TransferProvider* provider = nullptr;
  };

  mutable std::shared_mutex mutex_;
  FixedVector<Entry, kMaxProviders> entries_;
};

// ============================================================================
// SourceBlocklist
// ============================================================================

class SourceBlocklist {
 public:
  virtual ~SourceBlocklist() = default;
  virtual bool IsBlocked(const std::string& source_descriptor) const = 0;
};

/// Exact-match blocklist.
class InMemoryBlocklist final : public SourceBlocklist {
 public:
  void Block(const std::string& source_descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    (void)blocked_.insert(source_descriptor);
  }

  bool Unblock(const std::string& source_descriptor) {
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_.erase(source_descriptor) > 0U;
  }

  bool IsBlocked(const std::string& source_descriptor) const override {
    if (source_descriptor.empty()) return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return blocked_.count(source_descriptor) > 0U;
  }

  uint32_t Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(blocked_.size());
  }

 private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> blocked_;
};

}  // namespace dlcore

#endif  // DLCORE_TRANSFER_PROVIDER_HPP_
