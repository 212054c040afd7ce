/**
 * @file shutdown.hpp
 * @brief SIGINT/SIGTERM handling for the daemon main loop.
 *
 * The signal handler only stores an atomic flag and writes one byte to a
 * self-pipe, both async-signal-safe. WaitFor() polls the pipe with a timeout
 * so the main loop can do periodic work (status printing) between waits.
 *
 * Only one ShutdownSignal may be active per process; a second instance is
 * constructed invalid and every call on it reports kAlreadyInstantiated.
 */

#ifndef DLCORE_SHUTDOWN_HPP_
#define DLCORE_SHUTDOWN_HPP_

#include "dlcore/platform.hpp"
#include "dlcore/vocabulary.hpp"

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstdint>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace dlcore {

enum class ShutdownError : uint8_t {
  kPipeCreationFailed = 0,
  kSignalInstallFailed,
  kAlreadyInstantiated
};

class ShutdownSignal;

namespace detail {

inline ShutdownSignal*& ActiveShutdownSignal() {
  static ShutdownSignal* ptr = nullptr;
  return ptr;
}

}  // namespace detail

// ============================================================================
// ShutdownSignal
// ============================================================================

class ShutdownSignal final {
 public:
  ShutdownSignal() noexcept : requested_(false), valid_(false) {
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    if (detail::ActiveShutdownSignal() != nullptr) return;
    if (::pipe(pipe_fd_) != 0) {
      pipe_fd_[0] = -1;
      pipe_fd_[1] = -1;
      return;
    }
    // A full pipe must never block the signal handler.
    (void)::fcntl(pipe_fd_[1], F_SETFL, ::fcntl(pipe_fd_[1], F_GETFL) | O_NONBLOCK);
    detail::ActiveShutdownSignal() = this;
    valid_ = true;
  }

  ~ShutdownSignal() {
    if (detail::ActiveShutdownSignal() == this) {
      detail::ActiveShutdownSignal() = nullptr;
    }
    if (pipe_fd_[0] >= 0) ::close(pipe_fd_[0]);
    if (pipe_fd_[1] >= 0) ::close(pipe_fd_[1]);
  }

  ShutdownSignal(const ShutdownSignal&) = delete;
  ShutdownSignal& operator=(const ShutdownSignal&) = delete;

  bool IsValid() const noexcept { return valid_; }

  /// Route SIGINT and SIGTERM to this instance.
  expected<void, ShutdownError> Install() noexcept {
    if (!valid_) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kAlreadyInstantiated);
    }
    struct sigaction sa;
    sa.sa_handler = &ShutdownSignal::Handler;
    ::sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    if (::sigaction(SIGINT, &sa, nullptr) != 0 ||
        ::sigaction(SIGTERM, &sa, nullptr) != 0) {
      return expected<void, ShutdownError>::error(
          ShutdownError::kSignalInstallFailed);
    }
    return expected<void, ShutdownError>::success();
  }

  /// Request shutdown from code. @p signo 0 means no signal.
  void Trigger(int signo = 0) noexcept {
    bool expected_val = false;
    if (requested_.compare_exchange_strong(expected_val, true)) {
      signo_.store(signo, std::memory_order_relaxed);
      Wake();
    }
  }

  /**
   * @brief Wait up to @p timeout_ms for a shutdown request.
   * @return true if shutdown was requested.
   */
  bool WaitFor(uint32_t timeout_ms) noexcept {
    if (requested_.load(std::memory_order_acquire)) return true;
    if (pipe_fd_[0] < 0) return false;
    struct pollfd pfd;
    pfd.fd = pipe_fd_[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    const int rc = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
    if (rc > 0 && (pfd.revents & POLLIN) != 0) {
      uint8_t buf = 0;
      (void)::read(pipe_fd_[0], &buf, 1);
    }
    return requested_.load(std::memory_order_acquire);
  }

  bool IsRequested() const noexcept {
    return requested_.load(std::memory_order_acquire);
  }

  /// Signal that caused the request, 0 if triggered from code or not yet.
  int SignalNumber() const noexcept {
    return signo_.load(std::memory_order_relaxed);
  }

 private:
  static void Handler(int signo) {
    ShutdownSignal* self = detail::ActiveShutdownSignal();
    if (self == nullptr) return;
    const int saved_errno = errno;
    self->signo_.store(signo, std::memory_order_relaxed);
    self->requested_.store(true, std::memory_order_release);
    self->Wake();
    errno = saved_errno;
  }

  void Wake() noexcept {
    if (pipe_fd_[1] < 0) return;
    const uint8_t byte = 1;
    (void)::write(pipe_fd_[1], &byte, 1);
  }

  std::atomic<bool> requested_;
  std::atomic<int> signo_{0};
  int pipe_fd_[2];
  bool valid_;
};

}  // namespace dlcore

#endif  // DLCORE_SHUTDOWN_HPP_
