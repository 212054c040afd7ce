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
 * @file main.cpp
 * @brief Download daemon: the full dlcore stack against a simulated provider.
 *
 * Usage:
 *   download_daemon [config.ini|.json|.yaml] [-o section.key=value]...
 *                   [--jobs N] [--run-seconds S]
 *
 * Prints a status line every second until SIGINT/SIGTERM or --run-seconds.
 */

#include "dlcore/config.hpp"
#include "dlcore/download_system.hpp"
#include "dlcore/log.hpp"
#include "dlcore/shutdown.hpp"

#include "simulated_provider.hpp"

#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

namespace {

constexpr char kDependency[] = "peer-source";

struct Options {
  const char* config_path = nullptr;
  std::vector<const char*> overrides;
  uint32_t jobs = 12;
  uint32_t run_seconds = 0;  ///< 0 runs until a signal.
};

bool ParseUint(const char* text, uint32_t& out) {
  char* end = nullptr;
  const unsigned long val = std::strtoul(text, &end, 10);
  if (end == text || *end != '\0' || val > UINT32_MAX) return false;
  out = static_cast<uint32_t>(val);
  return true;
}

bool ParseArgs(int argc, char* argv[], Options& opts) {
  for (int i = 1; i < argc; ++i) {
    const char* arg = argv[i];
    const bool has_value = (i + 1 < argc);
    if (std::strcmp(arg, "-o") == 0 && has_value) {
      opts.overrides.push_back(argv[++i]);
    } else if (std::strcmp(arg, "--jobs") == 0 && has_value) {
      if (!ParseUint(argv[++i], opts.jobs)) return false;
    } else if (std::strcmp(arg, "--run-seconds") == 0 && has_value) {
      if (!ParseUint(argv[++i], opts.run_seconds)) return false;
    } else if (arg[0] != '-' && opts.config_path == nullptr) {
      opts.config_path = arg;
    } else {
      return false;
    }
  }
  return true;
}

void PrintUsage(const char* prog) {
  std::fprintf(stderr,
               "usage: %s [config-file] [-o section.key=value]... "
               "[--jobs N] [--run-seconds S]\n",
               prog);
}

void PrintStatus(dlcore::DownloadSystem& system, uint32_t in_flight) {
  const dlcore::QueueStats stats = system.QueueStatistics();
  const char* breaker = "closed";
  auto snap = system.BreakerSnapshot(kDependency);
  if (snap.has_value()) breaker = dlcore::BreakerStateName(snap.value().state);
  std::printf("[status] %s | done=%u failed=%u | %s=%s in_flight=%u | %s%s\n",
              stats.Summary().c_str(), stats.Count(dlcore::JobStatus::kCompleted),
              stats.Count(dlcore::JobStatus::kFailed), kDependency, breaker,
              in_flight, system.IsHealthy() ? "healthy" : "DEGRADED",
              system.IsDispatchingPaused() ? " (paused)" : "");
  (void)std::fflush(stdout);
}

}  // namespace

int main(int argc, char* argv[]) {
  Options opts;
  if (!ParseArgs(argc, argv, opts)) {
    PrintUsage(argv[0]);
    return 2;
  }

  dlcore::log::Init(dlcore::log::Level::kInfo);

#ifdef DLCORE_CONFIG_HAS_FILE_BACKEND
  dlcore::MultiConfig store;
  if (opts.config_path != nullptr) {
    auto loaded = store.LoadFile(opts.config_path);
    if (!loaded.has_value()) {
      DLCORE_LOG_ERROR("Daemon", "cannot load %s (error %u)", opts.config_path,
                       static_cast<unsigned>(loaded.get_error()));
      return 1;
    }
  }
#else
  dlcore::ConfigStore store;
  if (opts.config_path != nullptr) {
    DLCORE_LOG_ERROR("Daemon", "built without config file support; use -o");
    return 1;
  }
#endif

  for (const char* assignment : opts.overrides) {
    if (!store.ApplyOverride(assignment).has_value()) {
      DLCORE_LOG_ERROR("Daemon", "bad override '%s' (want section.key=value)",
                       assignment);
      return 1;
    }
  }

  auto cfg = dlcore::LoadSystemConfig(store);
  if (!cfg.has_value()) return 1;
  dlcore::log::SetLevel(cfg.value().log_level);
  DLCORE_LOG_INFO("Daemon", "max_concurrent=%u tick=%ums retry_base=%" PRIu64 "ms",
                  cfg.value().dispatcher.max_concurrent,
                  cfg.value().dispatcher.tick_interval_ms,
                  cfg.value().retry.policy.base_delay_ms);

  dlcore::ShutdownSignal shutdown;
  auto installed = shutdown.Install();
  if (!installed.has_value()) {
    DLCORE_LOG_ERROR("Daemon", "signal handlers not installed");
    return 1;
  }

  dlcore::SteadyClock clock;
  dlcore::DownloadSystem system(clock, cfg.value());

  demo::SimulatedProvider provider;
  provider.Start();
  if (!system.RegisterProvider(kDependency, &provider)) {
    DLCORE_LOG_ERROR("Daemon", "provider registry full");
    return 1;
  }

  auto started = system.Start();
  if (!started.has_value()) {
    DLCORE_LOG_ERROR("Daemon", "timer threads failed to start");
    return 1;
  }
  if (started.value().failed != 0U) {
    DLCORE_LOG_WARN("Daemon", "%u workers failed to start", started.value().failed);
  }

  for (uint32_t i = 0; i < opts.jobs; ++i) {
    dlcore::NewJob job =
        system.MakeJob("track-" + std::to_string(i + 1U), kDependency);
    job.provider_kind = dlcore::ProviderKind::kPeer;
    job.priority = static_cast<int32_t>(i % 3U);
    job.source_descriptor = "peer" + std::to_string(i % 5U) + "/album/track.flac";
    job.target_location = "/tmp/dlcore-demo";
    auto id = system.Enqueue(job);
    if (!id.has_value()) {
      DLCORE_LOG_WARN("Daemon", "enqueue failed: %s",
                      dlcore::JobErrorName(id.get_error()));
    }
  }
  DLCORE_LOG_INFO("Daemon", "%u jobs queued", opts.jobs);

  uint32_t elapsed_s = 0;
  while (!shutdown.WaitFor(1000)) {
    PrintStatus(system, provider.InFlight());
    ++elapsed_s;
    if (opts.run_seconds != 0U && elapsed_s >= opts.run_seconds) break;
  }
  if (shutdown.IsRequested()) {
    DLCORE_LOG_INFO("Daemon", "signal %d received, stopping", shutdown.SignalNumber());
  }

  system.Stop();
  provider.Stop();
  PrintStatus(system, provider.InFlight());

  dlcore::log::Shutdown();
  return 0;
}
