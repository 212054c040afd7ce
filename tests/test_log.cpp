/**
 * @file test_log.cpp
 * @brief Tests for log.hpp
 */

#include "dlcore/log.hpp"

#include <catch2/catch.hpp>

#include <string>
#include <vector>

namespace {

struct Captured {
  std::vector<std::string> lines;
  std::vector<dlcore::log::Level> levels;
};

void CaptureSink(dlcore::log::Level level, const char* category,
                 const char* message, void* ctx) {
  auto* out = static_cast<Captured*>(ctx);
  out->levels.push_back(level);
  out->lines.push_back(std::string(category) + ": " + message);
}

}  // namespace

TEST_CASE("Log level defaults", "[log]") {
#ifdef NDEBUG
  REQUIRE(dlcore::log::GetLevel() == dlcore::log::Level::kInfo);
#else
  REQUIRE(dlcore::log::GetLevel() == dlcore::log::Level::kDebug);
#endif
}

TEST_CASE("Log Init and Shutdown", "[log]") {
  const auto prev = dlcore::log::GetLevel();
  REQUIRE(!dlcore::log::IsInitialized());
  dlcore::log::Init(dlcore::log::Level::kWarn);
  REQUIRE(dlcore::log::IsInitialized());
  REQUIRE(dlcore::log::GetLevel() == dlcore::log::Level::kWarn);
  dlcore::log::Shutdown();
  REQUIRE(!dlcore::log::IsInitialized());
  dlcore::log::SetLevel(prev);
}

TEST_CASE("Log ParseLevel", "[log]") {
  REQUIRE(dlcore::log::ParseLevel("debug").value() == dlcore::log::Level::kDebug);
  REQUIRE(dlcore::log::ParseLevel("INFO").value() == dlcore::log::Level::kInfo);
  REQUIRE(dlcore::log::ParseLevel("warning").value() == dlcore::log::Level::kWarn);
  REQUIRE(dlcore::log::ParseLevel("off").value() == dlcore::log::Level::kOff);
  REQUIRE(!dlcore::log::ParseLevel("loud").has_value());
  REQUIRE(!dlcore::log::ParseLevel(nullptr).has_value());
  REQUIRE(std::string(dlcore::log::LevelName(dlcore::log::Level::kError)) == "ERROR");
}

TEST_CASE("Log sink receives formatted messages", "[log]") {
  const auto prev = dlcore::log::GetLevel();
  Captured captured;
  dlcore::log::SetSink(&CaptureSink, &captured);
  dlcore::log::SetLevel(dlcore::log::Level::kDebug);

  DLCORE_LOG_INFO("Dispatcher", "dispatched %u jobs", 3U);
  DLCORE_LOG_WARN("Breaker", "'%s' open", "peer-source");

  dlcore::log::SetSink(nullptr);
  dlcore::log::SetLevel(prev);

  REQUIRE(captured.lines.size() == 2U);
  REQUIRE(captured.lines[0] == "Dispatcher: dispatched 3 jobs");
  REQUIRE(captured.levels[1] == dlcore::log::Level::kWarn);
  REQUIRE(captured.lines[1] == "Breaker: 'peer-source' open");
}

TEST_CASE("Log runtime level filtering", "[log]") {
  const auto prev = dlcore::log::GetLevel();
  Captured captured;
  dlcore::log::SetSink(&CaptureSink, &captured);

  dlcore::log::SetLevel(dlcore::log::Level::kWarn);
  DLCORE_LOG_DEBUG("Test", "debug filtered");
  DLCORE_LOG_INFO("Test", "info filtered");
  DLCORE_LOG_WARN("Test", "warn passes");
  DLCORE_LOG_ERROR("Test", "error passes");

  dlcore::log::SetLevel(dlcore::log::Level::kOff);
  DLCORE_LOG_ERROR("Test", "nothing passes");

  dlcore::log::SetSink(nullptr);
  dlcore::log::SetLevel(prev);

  REQUIRE(captured.lines.size() == 2U);
  REQUIRE(captured.levels[0] == dlcore::log::Level::kWarn);
  REQUIRE(captured.levels[1] == dlcore::log::Level::kError);
}

TEST_CASE("Log truncates very long messages", "[log]") {
  const auto prev = dlcore::log::GetLevel();
  Captured captured;
  dlcore::log::SetSink(&CaptureSink, &captured);
  dlcore::log::SetLevel(dlcore::log::Level::kDebug);

  const std::string long_msg(2000, 'x');
  DLCORE_LOG_INFO("T", "%s", long_msg.c_str());

  dlcore::log::SetSink(nullptr);
  dlcore::log::SetLevel(prev);

  REQUIRE(captured.lines.size() == 1U);
  REQUIRE(captured.lines[0].size() < long_msg.size());
}

TEST_CASE("Log default stderr sink does not crash", "[log]") {
  const auto prev = dlcore::log::GetLevel();
  dlcore::log::SetLevel(dlcore::log::Level::kDebug);
  DLCORE_LOG_DEBUG("Test", "debug %d", 1);
  DLCORE_LOG_INFO("Test", "");
  dlcore::log::SetLevel(prev);
  REQUIRE(true);
}
