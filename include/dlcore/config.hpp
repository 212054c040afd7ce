/**
 * @file config.hpp
 * @brief Configuration store with pluggable file formats, and the mapping
 *        from flat section/key entries to SystemConfig.
 *
 * All formats are flattened to (section, key) -> string. Nested objects in
 * JSON and YAML join their names with '.', so
 *
 *   {"breaker": {"peer-source": {"failure_threshold": 3}}}
 *
 * and the INI section [breaker.peer-source] produce the same entry.
 * Command-line overrides use the same naming: "breaker.peer-source.failure_threshold=3".
 *
 * File backends are opt-in at build time:
 *   DLCORE_CONFIG_INI_ENABLED   inih
 *   DLCORE_CONFIG_JSON_ENABLED  nlohmann/json
 *   DLCORE_CONFIG_YAML_ENABLED  fkYAML
 */

#ifndef DLCORE_CONFIG_HPP_
#define DLCORE_CONFIG_HPP_

#include "dlcore/circuit_breaker.hpp"
#include "dlcore/log.hpp"
#include "dlcore/platform.hpp"
#include "dlcore/queue_dispatcher.hpp"
#include "dlcore/retry_scheduler.hpp"
#include "dlcore/vocabulary.hpp"
#include "dlcore/worker_orchestrator.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <tuple>
#include <vector>

#ifdef DLCORE_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef DLCORE_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef DLCORE_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace dlcore {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) return false;
    ++a; ++b;
  }
  return *a == *b;
}

}  // namespace detail

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "conf");
  }
};

struct JsonBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kJson;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "json");
  }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// ConfigStore
// ============================================================================

#ifndef DLCORE_CONFIG_MAX_FILE_SIZE
#define DLCORE_CONFIG_MAX_FILE_SIZE 16384U
#endif

/**
 * @brief Flat, case-insensitive (section, key) -> value table.
 *
 * Later writes to the same key replace earlier ones, so a file can be
 * loaded first and command-line overrides applied on top.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 256;
  static constexpr uint32_t kMaxNameLen = 64;
  static constexpr uint32_t kMaxValueLen = 256;

  expected<void, ConfigError> Set(const char* section, const char* key,
                                  const char* value) {
    DLCORE_ASSERT(section != nullptr && key != nullptr && value != nullptr);
    if (key[0] == '\0' || std::strlen(section) >= kMaxNameLen ||
        std::strlen(key) >= kMaxNameLen) {
      return expected<void, ConfigError>::error(ConfigError::kInvalidValue);
    }
    if (!AddEntry(section, key, value)) {
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    }
    return expected<void, ConfigError>::success();
  }

  /**
   * @brief Apply "section.key=value". The key is the part after the last
   *        '.' before '=', so sections may themselves contain dots.
   */
  expected<void, ConfigError> ApplyOverride(const char* assignment) {
    DLCORE_ASSERT(assignment != nullptr);
    const char* eq = std::strchr(assignment, '=');
    if (eq == nullptr) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    const char* dot = nullptr;
    for (const char* p = assignment; p < eq; ++p) {
      if (*p == '.') dot = p;
    }
    if (dot == nullptr || dot == assignment || dot + 1 == eq) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    const std::string section(assignment, static_cast<size_t>(dot - assignment));
    const std::string key(dot + 1, static_cast<size_t>(eq - dot - 1));
    return Set(section.c_str(), key.c_str(), eq + 1);
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  /**
   * @brief Strictly parsed unsigned value.
   * @return @p default_val if absent, kInvalidValue if the text is not a
   *         decimal integer within [min_val, max_val].
   */
  expected<uint64_t, ConfigError> GetUint(const char* section, const char* key,
                                          uint64_t default_val,
                                          uint64_t min_val = 0U,
                                          uint64_t max_val = UINT64_MAX) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return expected<uint64_t, ConfigError>::success(default_val);
    const char* text = e->value;
    while (*text == ' ') ++text;
    if (*text < '0' || *text > '9') {
      return expected<uint64_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    char* end = nullptr;
    errno = 0;
    const unsigned long long val = std::strtoull(text, &end, 10);
    while (end != nullptr && *end == ' ') ++end;
    if (errno != 0 || end == nullptr || *end != '\0' || val < min_val ||
        val > max_val) {
      return expected<uint64_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<uint64_t, ConfigError>::success(static_cast<uint64_t>(val));
  }

  /// Accepts true/false, yes/no, on/off, 1/0.
  expected<bool, ConfigError> GetBool(const char* section, const char* key,
                                      bool default_val) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return expected<bool, ConfigError>::success(default_val);
    const char* v = e->value;
    if (detail::CaseEqual(v, "true") || detail::CaseEqual(v, "yes") ||
        detail::CaseEqual(v, "on") || detail::CaseEqual(v, "1")) {
      return expected<bool, ConfigError>::success(true);
    }
    if (detail::CaseEqual(v, "false") || detail::CaseEqual(v, "no") ||
        detail::CaseEqual(v, "off") || detail::CaseEqual(v, "0")) {
      return expected<bool, ConfigError>::success(false);
    }
    return expected<bool, ConfigError>::error(ConfigError::kInvalidValue);
  }

  bool HasSection(const char* section) const {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) return true;
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return FindEntry(section, key) != nullptr;
  }

  /// Distinct section names starting with @p prefix, in first-seen order.
  std::vector<std::string> SectionsWithPrefix(const char* prefix) const {
    std::vector<std::string> out;
    const size_t len = std::strlen(prefix);
    for (uint32_t i = 0; i < count_; ++i) {
      const char* sec = entries_[i].section;
      if (std::strncmp(sec, prefix, len) != 0) continue;
      bool seen = false;
      for (const std::string& s : out) {
        if (detail::CaseEqual(s.c_str(), sec)) {
          seen = true;
          break;
        }
      }
      if (!seen) out.emplace_back(sec);
    }
    return out;
  }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  struct Entry {
    char section[kMaxNameLen];
    char key[kMaxNameLen];
    char value[kMaxValueLen];
  };

  bool AddEntry(const char* section, const char* key, const char* value) {
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        SafeCopy(entries_[i].value, value, kMaxValueLen);
        return true;
      }
    }
    if (count_ >= kMaxEntries) return false;
    Entry& e = entries_[count_];
    SafeCopy(e.section, section, kMaxNameLen);
    SafeCopy(e.key, key, kMaxNameLen);
    SafeCopy(e.value, value, kMaxValueLen);
    ++count_;
    return true;
  }

  static expected<uint32_t, ConfigError> ReadFileToBuffer(
      const char* path, char* buf, uint32_t buf_size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr)
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    const size_t bytes = std::fread(buf, 1, buf_size - 1, f);
    const bool truncated = (bytes == buf_size - 1) && std::fgetc(f) != EOF;
    std::fclose(f);
    if (truncated)
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

  const Entry* FindEntry(const char* section, const char* key) const {
    DLCORE_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key))
        return &entries_[i];
    }
    return nullptr;
  }

  static void SafeCopy(char* dst, const char* src, uint32_t dst_size) noexcept {
    if (src == nullptr) { dst[0] = '\0'; return; }
    uint32_t i = 0;
    while (i < (dst_size - 1U) && src[i] != '\0') { dst[i] = src[i]; ++i; }
    dst[i] = '\0';
  }

  static const char* GetExtension(const char* path) noexcept {
    const char* dot = nullptr;
    for (const char* p = path; *p != '\0'; ++p) {
      if (*p == '.') dot = p;
      if (*p == '/') dot = nullptr;
    }
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

  /// Section name for a nested object: parent + "." + child.
  static std::string JoinSection(const std::string& parent,
                                 const std::string& child) {
    return parent.empty() ? child : parent + "." + child;
  }

  Entry entries_[kMaxEntries];
  uint32_t count_ = 0;

  template <typename> friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/** Backend not compiled in. */
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*,
                                                  uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef DLCORE_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    const int result = ini_parse(path, Handler, &store);
    if (result == -1)
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (result != 0) {
      DLCORE_LOG_WARN("Config", "%s: INI error on line %d", path, result);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data, uint32_t) {
    if (ini_parse_string(data, Handler, &store) != 0)
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

 private:
  static int Handler(void* user, const char* section, const char* name,
                     const char* value) {
    auto* s = static_cast<ConfigStore*>(user);
    return s->AddEntry(section ? section : "", name ? name : "",
                       value ? value : "") ? 1 : 0;
  }
};
#endif

#ifdef DLCORE_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    char buf[DLCORE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data,
                                                  uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object())
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    if (!Flatten(store, "", root))
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section,
                      const nlohmann::json& object) {
    for (auto it = object.begin(); it != object.end(); ++it) {
      if (it->is_object()) {
        if (!Flatten(store, ConfigStore::JoinSection(section, it.key()), *it))
          return false;
        continue;
      }
      char val[ConfigStore::kMaxValueLen];
      ToStr(*it, val, sizeof(val));
      if (!store.AddEntry(section.c_str(), it.key().c_str(), val)) return false;
    }
    return true;
  }

  static void ToStr(const nlohmann::json& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      ConfigStore::SafeCopy(b, n.get_ref<const std::string&>().c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get<bool>() ? "true" : "false", sz);
    } else if (n.is_number_unsigned()) {
      std::snprintf(b, sz, "%llu",
                    static_cast<unsigned long long>(n.get<uint64_t>()));
    } else if (n.is_number_integer()) {
      std::snprintf(b, sz, "%lld", static_cast<long long>(n.get<int64_t>()));
    } else if (n.is_number_float()) {
      std::snprintf(b, sz, "%g", n.get<double>());
    } else {
      const std::string s = n.dump();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    }
  }
};
#endif

#ifdef DLCORE_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store,
                                                const char* path) {
    char buf[DLCORE_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFileToBuffer(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store,
                                                  const char* data,
                                                  uint32_t size) {
    const std::string text(data, size);
    auto root = fkyaml::node::deserialize(text);
    if (root.is_null() || !root.is_mapping())
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    if (!Flatten(store, "", root))
      return expected<void, ConfigError>::error(ConfigError::kBufferFull);
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Flatten(ConfigStore& store, const std::string& section,
                      fkyaml::node& mapping) {
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
      const std::string key = it.key().get_value<std::string>();
      fkyaml::node& child = *it;
      if (child.is_mapping()) {
        if (!Flatten(store, ConfigStore::JoinSection(section, key), child))
          return false;
        continue;
      }
      char val[ConfigStore::kMaxValueLen];
      ToStr(child, val, sizeof(val));
      if (!store.AddEntry(section.c_str(), key.c_str(), val)) return false;
    }
    return true;
  }

  static void ToStr(const fkyaml::node& n, char* b, uint32_t sz) {
    if (n.is_string()) {
      const std::string s = n.get_value<std::string>();
      ConfigStore::SafeCopy(b, s.c_str(), sz);
    } else if (n.is_boolean()) {
      ConfigStore::SafeCopy(b, n.get_value<bool>() ? "true" : "false", sz);
    } else if (n.is_integer()) {
      std::snprintf(b, sz, "%lld",
                    static_cast<long long>(n.get_value<int64_t>()));
    } else if (n.is_float_number()) {
      std::snprintf(b, sz, "%g", n.get_value<double>());
    } else {
      b[0] = '\0';
    }
  }
};
#endif

// ============================================================================
// Config<Backends...>
// ============================================================================

template <typename... Backends>
class Config final : public ConfigStore {
  static_assert(sizeof...(Backends) > 0, "Config requires at least one backend");

 public:
  Config() = default;

  expected<void, ConfigError> LoadFile(
      const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    DLCORE_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    auto r = DispatchFile<Backends...>(path, format);
    if (r.has_value()) {
      DLCORE_LOG_INFO("Config", "loaded %s (%u entries)", path, EntryCount());
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size,
                                          ConfigFormat format) {
    DLCORE_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path,
                                            ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchFile<Rest...>(path, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size,
                                              ConfigFormat format) {
    if (First::kFormat == format)
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0)
      return DispatchBuffer<Rest...>(data, size, format);
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = GetExtension(path);
    if (ext == nullptr) return Head::kFormat;
    return DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) return DetectExt<Rest...>(ext);
    return Head::kFormat;
  }

  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;
};

#if defined(DLCORE_CONFIG_INI_ENABLED) || defined(DLCORE_CONFIG_JSON_ENABLED) || \
    defined(DLCORE_CONFIG_YAML_ENABLED)
#define DLCORE_CONFIG_HAS_FILE_BACKEND 1

/// Every backend compiled into this build.
using MultiConfig = Config<
#ifdef DLCORE_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(DLCORE_CONFIG_INI_ENABLED) && \
    (defined(DLCORE_CONFIG_JSON_ENABLED) || defined(DLCORE_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef DLCORE_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(DLCORE_CONFIG_JSON_ENABLED) && defined(DLCORE_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef DLCORE_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

// ============================================================================
// SystemConfig
// ============================================================================

struct BreakerOverride {
  DependencyName name;
  BreakerConfig config;
};

/// Every tunable of a DownloadSystem, defaults included.
struct SystemConfig {
  DispatcherConfig dispatcher;
  RetrySchedulerConfig retry;
  uint32_t retry_sweep_interval_ms = 30000;
  uint32_t default_max_retries = 3;
  BreakerConfig breaker;
  std::vector<BreakerOverride> breaker_overrides;
  OrchestratorConfig orchestrator;
  uint32_t supervise_interval_ms = 5000;
  uint32_t event_history = 256;
  log::Level log_level = log::Level::kInfo;
};

namespace detail {

static constexpr uint64_t kMaxIntervalMs = 86400000ULL;   // one day
static constexpr uint64_t kMaxDelaySeconds = 604800ULL;   // one week

template <typename T>
bool ReadUint(const ConfigStore& store, const char* section, const char* key,
              uint64_t min_val, uint64_t max_val, T& out) {
  auto r = store.GetUint(section, key, static_cast<uint64_t>(out), min_val,
                         max_val);
  if (!r.has_value()) {
    DLCORE_LOG_ERROR("Config", "%s.%s='%s' is not an integer in [%llu, %llu]",
                     section, key, store.GetString(section, key),
                     static_cast<unsigned long long>(min_val),
                     static_cast<unsigned long long>(max_val));
    return false;
  }
  out = static_cast<T>(r.value());
  return true;
}

inline bool ReadBool(const ConfigStore& store, const char* section,
                     const char* key, bool& out) {
  auto r = store.GetBool(section, key, out);
  if (!r.has_value()) {
    DLCORE_LOG_ERROR("Config", "%s.%s='%s' is not a boolean", section, key,
                     store.GetString(section, key));
    return false;
  }
  out = r.value();
  return true;
}

inline bool ReadBreaker(const ConfigStore& store, const char* section,
                        BreakerConfig& out) {
  uint64_t timeout_s = out.recovery_timeout_ms / 1000U;
  if (!ReadUint(store, section, "failure_threshold", 1U, 100000U,
                out.failure_threshold) ||
      !ReadUint(store, section, "recovery_timeout_s", 0U, kMaxDelaySeconds,
                timeout_s)) {
    return false;
  }
  out.recovery_timeout_ms = timeout_s * 1000U;
  return true;
}

}  // namespace detail

/**
 * @brief Build a SystemConfig from @p store; absent keys keep their defaults.
 * @return kInvalidValue on the first malformed or out-of-range value.
 */
inline expected<SystemConfig, ConfigError> LoadSystemConfig(
    const ConfigStore& store) {
  using R = expected<SystemConfig, ConfigError>;
  using detail::ReadBool;
  using detail::ReadUint;
  using detail::kMaxDelaySeconds;
  using detail::kMaxIntervalMs;

  SystemConfig cfg;
  bool ok =
      ReadUint(store, "dispatcher", "max_concurrent_downloads", 1U,
               kMaxConcurrentLimit, cfg.dispatcher.max_concurrent) &&
      ReadUint(store, "dispatcher", "tick_interval_ms", 1U, kMaxIntervalMs,
               cfg.dispatcher.tick_interval_ms) &&
      ReadBool(store, "dispatcher", "paused", cfg.dispatcher.start_paused) &&
      ReadUint(store, "retry", "sweep_interval_ms", 1U, kMaxIntervalMs,
               cfg.retry_sweep_interval_ms) &&
      ReadUint(store, "retry", "max_per_sweep", 1U, 100000U,
               cfg.retry.max_per_sweep) &&
      ReadUint(store, "retry", "default_max_retries", 0U, 1000U,
               cfg.default_max_retries) &&
      ReadBool(store, "orchestrator", "auto_recovery",
               cfg.orchestrator.auto_recovery) &&
      ReadUint(store, "orchestrator", "max_restarts", 0U, 1000U,
               cfg.orchestrator.max_restarts) &&
      ReadUint(store, "orchestrator", "supervise_interval_ms", 1U,
               kMaxIntervalMs, cfg.supervise_interval_ms) &&
      ReadUint(store, "events", "history", 1U, 1000000U, cfg.event_history) &&
      detail::ReadBreaker(store, "breaker", cfg.breaker);
  if (!ok) return R::error(ConfigError::kInvalidValue);

  uint64_t base_s = cfg.retry.policy.base_delay_ms / 1000U;
  uint64_t max_s = cfg.retry.policy.max_delay_ms / 1000U;
  if (!ReadUint(store, "retry", "base_delay_s", 0U, kMaxDelaySeconds, base_s) ||
      !ReadUint(store, "retry", "max_delay_s", 0U, kMaxDelaySeconds, max_s)) {
    return R::error(ConfigError::kInvalidValue);
  }
  if (max_s < base_s) {
    DLCORE_LOG_ERROR("Config", "retry.max_delay_s (%llu) < retry.base_delay_s (%llu)",
                     static_cast<unsigned long long>(max_s),
                     static_cast<unsigned long long>(base_s));
    return R::error(ConfigError::kInvalidValue);
  }
  cfg.retry.policy.base_delay_ms = base_s * 1000U;
  cfg.retry.policy.max_delay_ms = max_s * 1000U;

  const char* level_text = store.GetString("log", "level", "");
  if (level_text[0] != '\0') {
    optional<log::Level> level = log::ParseLevel(level_text);
    if (!level.has_value()) {
      DLCORE_LOG_ERROR("Config", "log.level='%s' is not a log level", level_text);
      return R::error(ConfigError::kInvalidValue);
    }
    cfg.log_level = level.value();
  }

  static constexpr char kBreakerPrefix[] = "breaker.";
  for (const std::string& section : store.SectionsWithPrefix(kBreakerPrefix)) {
    const std::string name = section.substr(sizeof(kBreakerPrefix) - 1U);
    if (name.empty() || name.size() > DependencyName::capacity()) {
      DLCORE_LOG_ERROR("Config", "[%s]: bad dependency name", section.c_str());
      return R::error(ConfigError::kInvalidValue);
    }
    BreakerOverride entry;
    entry.name = DependencyName(TruncateToCapacity, name);
    entry.config = cfg.breaker;
    if (!detail::ReadBreaker(store, section.c_str(), entry.config)) {
      return R::error(ConfigError::kInvalidValue);
    }
    cfg.breaker_overrides.push_back(entry);
  }
  return R::success(std::move(cfg));
}

}  // namespace dlcore

#endif  // DLCORE_CONFIG_HPP_
