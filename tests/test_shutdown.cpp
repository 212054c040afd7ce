/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "dlcore/shutdown.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <csignal>
#include <thread>

TEST_CASE("ShutdownSignal Trigger and WaitFor", "[shutdown]") {
  dlcore::ShutdownSignal sig;
  REQUIRE(sig.IsValid());
  REQUIRE_FALSE(sig.IsRequested());
  REQUIRE_FALSE(sig.WaitFor(10));

  sig.Trigger();
  REQUIRE(sig.IsRequested());
  REQUIRE(sig.WaitFor(0));
  REQUIRE(sig.SignalNumber() == 0);

  // Only the first request is recorded.
  sig.Trigger(SIGTERM);
  REQUIRE(sig.SignalNumber() == 0);
}

TEST_CASE("ShutdownSignal WaitFor times out", "[shutdown]") {
  dlcore::ShutdownSignal sig;
  const auto start = std::chrono::steady_clock::now();
  REQUIRE_FALSE(sig.WaitFor(50));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  REQUIRE(elapsed >= std::chrono::milliseconds(40));
}

TEST_CASE("ShutdownSignal wakes a waiting thread", "[shutdown]") {
  dlcore::ShutdownSignal sig;
  std::thread trigger([&sig]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    sig.Trigger(SIGINT);
  });
  REQUIRE(sig.WaitFor(5000));
  trigger.join();
  REQUIRE(sig.SignalNumber() == SIGINT);
}

TEST_CASE("ShutdownSignal second instance is invalid", "[shutdown]") {
  dlcore::ShutdownSignal first;
  REQUIRE(first.IsValid());
  {
    dlcore::ShutdownSignal second;
    REQUIRE_FALSE(second.IsValid());
    auto r = second.Install();
    REQUIRE(!r.has_value());
    REQUIRE(r.get_error() == dlcore::ShutdownError::kAlreadyInstantiated);
  }
  // The invalid instance must not unregister the active one.
  dlcore::ShutdownSignal third;
  REQUIRE_FALSE(third.IsValid());
}

TEST_CASE("ShutdownSignal Install routes SIGTERM", "[shutdown]") {
  dlcore::ShutdownSignal sig;
  REQUIRE(sig.Install().has_value());
  REQUIRE(std::raise(SIGTERM) == 0);
  REQUIRE(sig.WaitFor(1000));
  REQUIRE(sig.SignalNumber() == SIGTERM);
}
