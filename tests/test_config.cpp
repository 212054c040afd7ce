/**
 * @file test_config.cpp
 * @brief Tests for config.hpp
 */

#include "dlcore/config.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstring>

using dlcore::ConfigError;

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore Set and typed getters", "[config]") {
  dlcore::ConfigStore store;
  REQUIRE(store.Set("dispatcher", "max_concurrent_downloads", "7").has_value());
  REQUIRE(store.Set("dispatcher", "paused", "Yes").has_value());
  REQUIRE(store.EntryCount() == 2U);

  REQUIRE(store.GetUint("dispatcher", "max_concurrent_downloads", 0).value() == 7U);
  REQUIRE(store.GetUint("dispatcher", "missing", 42).value() == 42U);
  REQUIRE(store.GetBool("dispatcher", "paused", false).value());
  REQUIRE(std::strcmp(store.GetString("x", "y", "fallback"), "fallback") == 0);

  // Case-insensitive lookup, later writes replace earlier ones.
  REQUIRE(store.Set("Dispatcher", "MAX_CONCURRENT_DOWNLOADS", "9").has_value());
  REQUIRE(store.EntryCount() == 2U);
  REQUIRE(store.GetUint("dispatcher", "max_concurrent_downloads", 0).value() == 9U);

  REQUIRE(store.HasSection("DISPATCHER"));
  REQUIRE(store.HasKey("dispatcher", "paused"));
  REQUIRE_FALSE(store.HasKey("dispatcher", "nope"));

  auto empty_key = store.Set("s", "", "v");
  REQUIRE(!empty_key.has_value());
  REQUIRE(empty_key.get_error() == ConfigError::kInvalidValue);
}

TEST_CASE("ConfigStore GetUint is strict", "[config]") {
  dlcore::ConfigStore store;
  REQUIRE(store.Set("a", "neg", "-1").has_value());
  REQUIRE(store.Set("a", "junk", "12abc").has_value());
  REQUIRE(store.Set("a", "big", "500").has_value());
  REQUIRE(store.Set("a", "padded", " 15 ").has_value());

  REQUIRE(store.GetUint("a", "neg", 0).get_error() == ConfigError::kInvalidValue);
  REQUIRE(store.GetUint("a", "junk", 0).get_error() == ConfigError::kInvalidValue);
  REQUIRE(store.GetUint("a", "big", 0, 1, 256).get_error() ==
          ConfigError::kInvalidValue);
  REQUIRE(store.GetUint("a", "padded", 0).value() == 15U);
}

TEST_CASE("ConfigStore GetBool spellings", "[config]") {
  dlcore::ConfigStore store;
  const char* truthy[] = {"true", "YES", "on", "1"};
  const char* falsy[] = {"false", "No", "OFF", "0"};
  for (const char* v : truthy) {
    REQUIRE(store.Set("b", "k", v).has_value());
    REQUIRE(store.GetBool("b", "k", false).value());
  }
  for (const char* v : falsy) {
    REQUIRE(store.Set("b", "k", v).has_value());
    REQUIRE_FALSE(store.GetBool("b", "k", true).value());
  }
  REQUIRE(store.Set("b", "k", "maybe").has_value());
  REQUIRE(store.GetBool("b", "k", true).get_error() == ConfigError::kInvalidValue);
}

TEST_CASE("ConfigStore ApplyOverride", "[config]") {
  dlcore::ConfigStore store;
  REQUIRE(store.ApplyOverride("retry.base_delay_s=10").has_value());
  REQUIRE(store.GetUint("retry", "base_delay_s", 0).value() == 10U);

  REQUIRE(store.ApplyOverride("breaker.peer-source.failure_threshold=2").has_value());
  REQUIRE(store.GetUint("breaker.peer-source", "failure_threshold", 0).value() == 2U);

  REQUIRE(store.ApplyOverride("log.level=").has_value());
  REQUIRE(std::strcmp(store.GetString("log", "level", "x"), "") == 0);

  REQUIRE(store.ApplyOverride("noequals").get_error() == ConfigError::kParseError);
  REQUIRE(store.ApplyOverride("nodot=1").get_error() == ConfigError::kParseError);
  REQUIRE(store.ApplyOverride(".key=1").get_error() == ConfigError::kParseError);
  REQUIRE(store.ApplyOverride("section.=1").get_error() == ConfigError::kParseError);
}

TEST_CASE("ConfigStore SectionsWithPrefix", "[config]") {
  dlcore::ConfigStore store;
  REQUIRE(store.Set("breaker", "failure_threshold", "5").has_value());
  REQUIRE(store.Set("breaker.peer", "failure_threshold", "2").has_value());
  REQUIRE(store.Set("breaker.peer", "recovery_timeout_s", "9").has_value());
  REQUIRE(store.Set("breaker.usenet", "failure_threshold", "4").has_value());

  auto sections = store.SectionsWithPrefix("breaker.");
  REQUIRE(sections.size() == 2U);
  REQUIRE(sections[0] == "breaker.peer");
  REQUIRE(sections[1] == "breaker.usenet");
}

// ============================================================================
// LoadSystemConfig
// ============================================================================

TEST_CASE("LoadSystemConfig defaults", "[config]") {
  dlcore::ConfigStore store;
  auto cfg = dlcore::LoadSystemConfig(store);
  REQUIRE(cfg.has_value());
  const dlcore::SystemConfig& c = cfg.value();
  REQUIRE(c.dispatcher.max_concurrent == 3U);
  REQUIRE(c.dispatcher.tick_interval_ms == 5000U);
  REQUIRE_FALSE(c.dispatcher.start_paused);
  REQUIRE(c.retry.policy.base_delay_ms == 60000U);
  REQUIRE(c.retry.policy.max_delay_ms == 3600000U);
  REQUIRE(c.retry.max_per_sweep == 50U);
  REQUIRE(c.retry_sweep_interval_ms == 30000U);
  REQUIRE(c.default_max_retries == 3U);
  REQUIRE(c.breaker.failure_threshold == 5U);
  REQUIRE(c.breaker.recovery_timeout_ms == 60000U);
  REQUIRE(c.breaker_overrides.empty());
  REQUIRE(c.orchestrator.auto_recovery);
  REQUIRE(c.orchestrator.max_restarts == 3U);
  REQUIRE(c.supervise_interval_ms == 5000U);
  REQUIRE(c.event_history == 256U);
  REQUIRE(c.log_level == dlcore::log::Level::kInfo);
}

TEST_CASE("LoadSystemConfig reads every section", "[config]") {
  dlcore::ConfigStore store;
  const char* overrides[] = {
      "dispatcher.max_concurrent_downloads=8",
      "dispatcher.tick_interval_ms=250",
      "dispatcher.paused=true",
      "retry.base_delay_s=10",
      "retry.max_delay_s=600",
      "retry.sweep_interval_ms=1000",
      "retry.max_per_sweep=20",
      "retry.default_max_retries=5",
      "breaker.failure_threshold=3",
      "breaker.recovery_timeout_s=30",
      "breaker.peer-source.failure_threshold=2",
      "orchestrator.auto_recovery=off",
      "orchestrator.max_restarts=1",
      "orchestrator.supervise_interval_ms=2000",
      "events.history=32",
      "log.level=warning",
  };
  for (const char* o : overrides) REQUIRE(store.ApplyOverride(o).has_value());

  auto cfg = dlcore::LoadSystemConfig(store);
  REQUIRE(cfg.has_value());
  const dlcore::SystemConfig& c = cfg.value();
  REQUIRE(c.dispatcher.max_concurrent == 8U);
  REQUIRE(c.dispatcher.tick_interval_ms == 250U);
  REQUIRE(c.dispatcher.start_paused);
  REQUIRE(c.retry.policy.base_delay_ms == 10000U);
  REQUIRE(c.retry.policy.max_delay_ms == 600000U);
  REQUIRE(c.retry_sweep_interval_ms == 1000U);
  REQUIRE(c.retry.max_per_sweep == 20U);
  REQUIRE(c.default_max_retries == 5U);
  REQUIRE(c.breaker.failure_threshold == 3U);
  REQUIRE(c.breaker.recovery_timeout_ms == 30000U);
  REQUIRE_FALSE(c.orchestrator.auto_recovery);
  REQUIRE(c.orchestrator.max_restarts == 1U);
  REQUIRE(c.supervise_interval_ms == 2000U);
  REQUIRE(c.event_history == 32U);
  REQUIRE(c.log_level == dlcore::log::Level::kWarn);

  REQUIRE(c.breaker_overrides.size() == 1U);
  REQUIRE(c.breaker_overrides[0].name == dlcore::DependencyName("peer-source"));
  REQUIRE(c.breaker_overrides[0].config.failure_threshold == 2U);
  // Unset override keys inherit the [breaker] defaults.
  REQUIRE(c.breaker_overrides[0].config.recovery_timeout_ms == 30000U);
}

TEST_CASE("LoadSystemConfig rejects invalid values", "[config]") {
  const char* bad[] = {
      "dispatcher.max_concurrent_downloads=0",
      "dispatcher.max_concurrent_downloads=257",
      "dispatcher.tick_interval_ms=0",
      "dispatcher.paused=sometimes",
      "retry.max_per_sweep=0",
      "breaker.failure_threshold=0",
      "breaker.peer.failure_threshold=x",
      "events.history=0",
      "log.level=chatty",
  };
  for (const char* assignment : bad) {
    dlcore::ConfigStore store;
    REQUIRE(store.ApplyOverride(assignment).has_value());
    auto cfg = dlcore::LoadSystemConfig(store);
    INFO(assignment);
    REQUIRE(!cfg.has_value());
    REQUIRE(cfg.get_error() == ConfigError::kInvalidValue);
  }

  dlcore::ConfigStore inverted;
  REQUIRE(inverted.ApplyOverride("retry.base_delay_s=100").has_value());
  REQUIRE(inverted.ApplyOverride("retry.max_delay_s=50").has_value());
  REQUIRE(!dlcore::LoadSystemConfig(inverted).has_value());
}

// ============================================================================
// Backend tags
// ============================================================================

TEST_CASE("Backend MatchesExtension", "[config][tag]") {
  REQUIRE(dlcore::IniBackend::MatchesExtension("ini"));
  REQUIRE(dlcore::IniBackend::MatchesExtension("CONF"));
  REQUIRE_FALSE(dlcore::IniBackend::MatchesExtension("json"));
  REQUIRE(dlcore::JsonBackend::MatchesExtension("json"));
  REQUIRE(dlcore::YamlBackend::MatchesExtension("yml"));
  REQUIRE(dlcore::YamlBackend::MatchesExtension("YAML"));
}

// ============================================================================
// INI backend
// ============================================================================

#ifdef DLCORE_CONFIG_INI_ENABLED

using IniCfg = dlcore::Config<dlcore::IniBackend>;

TEST_CASE("INI LoadBuffer feeds LoadSystemConfig", "[config][ini]") {
  const char* ini_data =
      "[dispatcher]\n"
      "max_concurrent_downloads = 4\n"
      "[breaker.peer-source]\n"
      "failure_threshold = 2\n"
      "[log]\n"
      "level = debug\n";

  IniCfg cfg;
  auto loaded = cfg.LoadBuffer(ini_data,
                               static_cast<uint32_t>(std::strlen(ini_data)),
                               dlcore::ConfigFormat::kIni);
  REQUIRE(loaded.has_value());

  auto sys = dlcore::LoadSystemConfig(cfg);
  REQUIRE(sys.has_value());
  REQUIRE(sys.value().dispatcher.max_concurrent == 4U);
  REQUIRE(sys.value().breaker_overrides.size() == 1U);
  REQUIRE(sys.value().log_level == dlcore::log::Level::kDebug);
}

TEST_CASE("INI LoadFile from disk with overrides on top", "[config][ini]") {
  const char* path = "/tmp/__dlcore_test_config__.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "[retry]\nbase_delay_s = 30\nmax_delay_s = 300\n");
  std::fclose(f);

  IniCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.ApplyOverride("retry.base_delay_s=5").has_value());
  auto sys = dlcore::LoadSystemConfig(cfg);
  REQUIRE(sys.has_value());
  REQUIRE(sys.value().retry.policy.base_delay_ms == 5000U);
  REQUIRE(sys.value().retry.policy.max_delay_ms == 300000U);

  std::remove(path);
}

TEST_CASE("INI LoadFile nonexistent", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadFile("/nonexistent/dlcore.ini");
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kFileNotFound);
}

TEST_CASE("INI rejects an unsupported format", "[config][ini]") {
  IniCfg cfg;
  auto r = cfg.LoadBuffer("{}", 2, dlcore::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kFormatNotSupported);
}

#endif  // DLCORE_CONFIG_INI_ENABLED

// ============================================================================
// JSON backend
// ============================================================================

#ifdef DLCORE_CONFIG_JSON_ENABLED

using JsonCfg = dlcore::Config<dlcore::JsonBackend>;

TEST_CASE("JSON nested objects become dotted sections", "[config][json]") {
  const char* json_data = R"({
    "dispatcher": { "max_concurrent_downloads": 6, "paused": true },
    "breaker": {
      "failure_threshold": 4,
      "peer-source": { "failure_threshold": 1, "recovery_timeout_s": 5 }
    },
    "log": { "level": "error" }
  })";

  JsonCfg cfg;
  auto loaded = cfg.LoadBuffer(json_data,
                               static_cast<uint32_t>(std::strlen(json_data)),
                               dlcore::ConfigFormat::kJson);
  REQUIRE(loaded.has_value());
  REQUIRE(std::strcmp(cfg.GetString("dispatcher", "paused"), "true") == 0);

  auto sys = dlcore::LoadSystemConfig(cfg);
  REQUIRE(sys.has_value());
  REQUIRE(sys.value().dispatcher.max_concurrent == 6U);
  REQUIRE(sys.value().dispatcher.start_paused);
  REQUIRE(sys.value().breaker.failure_threshold == 4U);
  REQUIRE(sys.value().breaker_overrides.size() == 1U);
  REQUIRE(sys.value().breaker_overrides[0].config.recovery_timeout_ms == 5000U);
  REQUIRE(sys.value().log_level == dlcore::log::Level::kError);
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* bad = "{ not json";
  JsonCfg cfg;
  auto r = cfg.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                          dlcore::ConfigFormat::kJson);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == ConfigError::kParseError);
}

TEST_CASE("JSON LoadFile auto-detects the extension", "[config][json]") {
  const char* path = "/tmp/__dlcore_test_config__.json";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "{\"events\": {\"history\": 64}}");
  std::fclose(f);

  JsonCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetUint("events", "history", 0).value() == 64U);
  std::remove(path);
}

#endif  // DLCORE_CONFIG_JSON_ENABLED

// ============================================================================
// YAML backend
// ============================================================================

#ifdef DLCORE_CONFIG_YAML_ENABLED

using YamlCfg = dlcore::Config<dlcore::YamlBackend>;

TEST_CASE("YAML nested mappings become dotted sections", "[config][yaml]") {
  const char* yaml_data =
      "retry:\n"
      "  base_delay_s: 10\n"
      "  max_delay_s: 80\n"
      "breaker:\n"
      "  usenet:\n"
      "    failure_threshold: 7\n";

  YamlCfg cfg;
  auto loaded = cfg.LoadBuffer(yaml_data,
                               static_cast<uint32_t>(std::strlen(yaml_data)),
                               dlcore::ConfigFormat::kYaml);
  REQUIRE(loaded.has_value());

  auto sys = dlcore::LoadSystemConfig(cfg);
  REQUIRE(sys.has_value());
  REQUIRE(sys.value().retry.policy.base_delay_ms == 10000U);
  REQUIRE(sys.value().retry.policy.max_delay_ms == 80000U);
  REQUIRE(sys.value().breaker_overrides.size() == 1U);
  REQUIRE(sys.value().breaker_overrides[0].name == dlcore::DependencyName("usenet"));
  REQUIRE(sys.value().breaker_overrides[0].config.failure_threshold == 7U);
}

TEST_CASE("YAML LoadFile auto-detects yml", "[config][yaml]") {
  const char* path = "/tmp/__dlcore_test_config__.yml";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  std::fprintf(f, "orchestrator:\n  max_restarts: 9\n");
  std::fclose(f);

  YamlCfg cfg;
  REQUIRE(cfg.LoadFile(path).has_value());
  REQUIRE(cfg.GetUint("orchestrator", "max_restarts", 0).value() == 9U);
  std::remove(path);
}

#endif  // DLCORE_CONFIG_YAML_ENABLED
