/**
 * @file config.hpp
 * @brief Multi-format configuration store and WorkerPool config loading.
 *
 * Backends are selected at compile time (CMake opt-in):
 *   - IniBackend  : inih          (OFFLOAD_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (OFFLOAD_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (OFFLOAD_CONFIG_YAML_ENABLED)
 *
 * Every format is flattened to "section + key = value". Top-level scalars
 * land in the "" section.
 *
 * Recognised keys:
 * @code
 *   [pool]
 *   name = bg
 *   workers = 4
 *   queue_capacity = 1000
 *   drain_cap = 0
 *   shutdown_timeout_ms = 2000
 *
 *   [log]
 *   level = info
 * @endcode
 *
 * Usage:
 * @code
 *   offload::MultiConfig cfg;
 *   if (cfg.LoadFile("offload.yaml")) {
 *     offload::ApplyLogConfig(cfg);
 *     auto pool_cfg = offload::LoadPoolConfig(cfg);
 *   }
 * @endcode
 */

#ifndef OFFLOAD_CONFIG_HPP_
#define OFFLOAD_CONFIG_HPP_

#include "offload/log.hpp"
#include "offload/platform.hpp"
#include "offload/pool_config.hpp"
#include "offload/vocabulary.hpp"

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <tuple>

#ifdef OFFLOAD_CONFIG_INI_ENABLED
#include "ini.h"
#endif

#ifdef OFFLOAD_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef OFFLOAD_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

#ifndef OFFLOAD_CONFIG_MAX_FILE_SIZE
#define OFFLOAD_CONFIG_MAX_FILE_SIZE 8192U
#endif

namespace offload {

enum class ConfigFormat : uint8_t {
  kAuto = 0,
  kIni,
  kJson,
  kYaml,
};

namespace detail {

inline bool CaseEqual(const char* a, const char* b) noexcept {
  while (*a != '\0' && *b != '\0') {
    const char la = (*a >= 'A' && *a <= 'Z') ? static_cast<char>(*a + 32) : *a;
    const char lb = (*b >= 'A' && *b <= 'Z') ? static_cast<char>(*b + 32) : *b;
    if (la != lb) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

inline void CopyBounded(char* dst, const char* src, uint32_t dst_size) noexcept {
  uint32_t i = 0U;
  if (src != nullptr) {
    for (; i + 1U < dst_size && src[i] != '\0'; ++i) {
      dst[i] = src[i];
    }
  }
  dst[i] = '\0';
}

/// @brief Whole-string signed integer parse; false on junk or overflow.
inline bool ParseInt64(const char* text, int64_t& out) noexcept {
  if (text == nullptr || *text == '\0') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(text, &end, 10);
  while (end != nullptr && (*end == ' ' || *end == '\t')) {
    ++end;
  }
  if (errno != 0 || end == text || (end != nullptr && *end != '\0')) {
    return false;
  }
  out = static_cast<int64_t>(v);
  return true;
}

}  // namespace detail

// ============================================================================
// Backend tags
// ============================================================================

struct IniBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kIni;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "ini") || detail::CaseEqual(ext, "cfg") ||
           detail::CaseEqual(ext, "conf");
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

/**
 * @brief Fixed-capacity section/key/value table. Lookups are
 *        case-insensitive; a later value for the same key replaces the
 *        earlier one.
 */
class ConfigStore {
 public:
  static constexpr uint32_t kMaxEntries = 128U;
  static constexpr uint32_t kMaxKeyLen = 64U;
  static constexpr uint32_t kMaxValueLen = 256U;

  /**
   * @brief Insert or replace an entry.
   * @return false if the table is full.
   */
  bool Set(const char* section, const char* key, const char* value) {
    Entry* e = Find(section, key);
    if (e == nullptr) {
      if (count_ >= kMaxEntries) {
        return false;
      }
      e = &entries_[count_++];
      detail::CopyBounded(e->section, section, kMaxKeyLen);
      detail::CopyBounded(e->key, key, kMaxKeyLen);
    }
    detail::CopyBounded(e->value, value, kMaxValueLen);
    return true;
  }

  const char* GetString(const char* section, const char* key,
                        const char* default_val = "") const {
    const Entry* e = Find(section, key);
    return (e != nullptr) ? e->value : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    const Entry* e = Find(section, key);
    int64_t v = 0;
    if (e == nullptr || !detail::ParseInt64(e->value, v)) {
      return default_val;
    }
    return static_cast<int32_t>(v);
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) {
      return default_val;
    }
    return detail::CaseEqual(e->value, "true") || detail::CaseEqual(e->value, "1") ||
           detail::CaseEqual(e->value, "yes") || detail::CaseEqual(e->value, "on");
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = Find(section, key);
    if (e == nullptr) {
      return default_val;
    }
    char* end = nullptr;
    const double v = std::strtod(e->value, &end);
    return (end == e->value) ? default_val : v;
  }

  bool HasSection(const char* section) const {
    OFFLOAD_ASSERT(section != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section)) {
        return true;
      }
    }
    return false;
  }

  bool HasKey(const char* section, const char* key) const {
    return Find(section, key) != nullptr;
  }

  uint32_t EntryCount() const noexcept { return count_; }

  void Clear() noexcept { count_ = 0U; }

 protected:
  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf,
                                                  uint32_t buf_size) {
    FILE* f = std::fopen(path, "rb");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t n = std::fread(buf, 1, buf_size - 1U, f);
    const bool truncated = (n == buf_size - 1U) && (std::fgetc(f) != EOF);
    (void)std::fclose(f);
    if (truncated) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
    }
    buf[n] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(n));
  }

  static const char* Extension(const char* path) noexcept {
    const char* dot = std::strrchr(path, '.');
    return (dot != nullptr) ? dot + 1 : nullptr;
  }

 private:
  struct Entry {
    char section[kMaxKeyLen];
    char key[kMaxKeyLen];
    char value[kMaxValueLen];
  };

  const Entry* Find(const char* section, const char* key) const {
    OFFLOAD_ASSERT(section != nullptr && key != nullptr);
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section, section) &&
          detail::CaseEqual(entries_[i].key, key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* Find(const char* section, const char* key) {
    return const_cast<Entry*>(static_cast<const ConfigStore*>(this)->Find(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_{0U};

  template <typename>
  friend struct ConfigParser;
};

// ============================================================================
// ConfigParser<Backend>
// ============================================================================

/// Backend not compiled in.
template <typename Backend>
struct ConfigParser {
  static expected<void, ConfigError> ParseFile(ConfigStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(ConfigStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef OFFLOAD_CONFIG_INI_ENABLED
template <>
struct ConfigParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) {
      return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    }
    return Check(rc);
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t /*size*/) {
    return Check(ini_parse_string(data, &OnEntry, &store));
  }

 private:
  static expected<void, ConfigError> Check(int rc) {
    if (rc != 0) {
      OFFLOAD_LOG_WARN("Config", "INI parse error at line %d", rc);
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    return static_cast<ConfigStore*>(user)->Set(section != nullptr ? section : "",
                                                name != nullptr ? name : "",
                                                value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef OFFLOAD_CONFIG_JSON_ENABLED
template <>
struct ConfigParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[OFFLOAD_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    const auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!Put(store, "", sec.key().c_str(), *sec)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!Put(store, sec.key().c_str(), kv.key().c_str(), *kv)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Put(ConfigStore& store, const char* section, const char* key,
                  const nlohmann::json& node) {
    char text[ConfigStore::kMaxValueLen];
    if (node.is_string()) {
      detail::CopyBounded(text, node.get_ref<const std::string&>().c_str(), sizeof(text));
    } else if (node.is_boolean()) {
      detail::CopyBounded(text, node.get<bool>() ? "true" : "false", sizeof(text));
    } else if (node.is_number_integer()) {
      (void)std::snprintf(text, sizeof(text), "%lld",
                          static_cast<long long>(node.get<int64_t>()));
    } else if (node.is_number_float()) {
      (void)std::snprintf(text, sizeof(text), "%g", node.get<double>());
    } else {
      detail::CopyBounded(text, node.dump().c_str(), sizeof(text));
    }
    return store.Set(section, key, text);
  }
};
#endif

#ifdef OFFLOAD_CONFIG_YAML_ENABLED
template <>
struct ConfigParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(ConfigStore& store, const char* path) {
    char buf[OFFLOAD_CONFIG_MAX_FILE_SIZE];
    auto r = ConfigStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) {
      return expected<void, ConfigError>::error(r.get_error());
    }
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(ConfigStore& store, const char* data,
                                                 uint32_t size) {
    fkyaml::node root;
    try {
      root = fkyaml::node::deserialize(std::string(data, size));
    } catch (const fkyaml::exception& e) {
      OFFLOAD_LOG_WARN("Config", "YAML parse error: %s", e.what());
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const std::string sec_name = sec.key().get_value<std::string>();
      if (!sec->is_mapping()) {
        if (!Put(store, "", sec_name.c_str(), *sec)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        const std::string key = kv.key().get_value<std::string>();
        if (!Put(store, sec_name.c_str(), key.c_str(), *kv)) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static bool Put(ConfigStore& store, const char* section, const char* key,
                  const fkyaml::node& node) {
    char text[ConfigStore::kMaxValueLen];
    text[0] = '\0';
    if (node.is_string()) {
      detail::CopyBounded(text, node.get_value<std::string>().c_str(), sizeof(text));
    } else if (node.is_boolean()) {
      detail::CopyBounded(text, node.get_value<bool>() ? "true" : "false", sizeof(text));
    } else if (node.is_integer()) {
      (void)std::snprintf(text, sizeof(text), "%lld",
                          static_cast<long long>(node.get_value<int64_t>()));
    } else if (node.is_float_number()) {
      (void)std::snprintf(text, sizeof(text), "%g", node.get_value<double>());
    }
    return store.Set(section, key, text);
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
  /// @brief Load @p path; kAuto picks the backend from the file extension.
  expected<void, ConfigError> LoadFile(const char* path,
                                       ConfigFormat format = ConfigFormat::kAuto) {
    OFFLOAD_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) {
      format = Detect<Backends...>(Extension(path));
    }
    auto r = LoadFileAs<Backends...>(path, format);
    if (!r.has_value()) {
      OFFLOAD_LOG_WARN("Config", "failed to load '%s' (error %u)", path,
                       static_cast<uint32_t>(r.get_error()));
    }
    return r;
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    OFFLOAD_ASSERT(data != nullptr);
    return LoadBufferAs<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> LoadFileAs(const char* path, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseFile(*this, path);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return LoadFileAs<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> LoadBufferAs(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format) {
      return ConfigParser<First>::ParseBuffer(*this, data, size);
    }
    if constexpr (sizeof...(Rest) > 0) {
      return LoadBufferAs<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  static ConfigFormat Detect(const char* ext) noexcept {
    if (ext != nullptr && First::MatchesExtension(ext)) {
      return First::kFormat;
    }
    if constexpr (sizeof...(Rest) > 0) {
      return Detect<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

#if defined(OFFLOAD_CONFIG_INI_ENABLED) || defined(OFFLOAD_CONFIG_JSON_ENABLED) || \
    defined(OFFLOAD_CONFIG_YAML_ENABLED)
#define OFFLOAD_CONFIG_HAS_BACKEND 1
using MultiConfig = Config<
#ifdef OFFLOAD_CONFIG_INI_ENABLED
    IniBackend
#endif
#if defined(OFFLOAD_CONFIG_INI_ENABLED) && \
    (defined(OFFLOAD_CONFIG_JSON_ENABLED) || defined(OFFLOAD_CONFIG_YAML_ENABLED))
    ,
#endif
#ifdef OFFLOAD_CONFIG_JSON_ENABLED
    JsonBackend
#endif
#if defined(OFFLOAD_CONFIG_JSON_ENABLED) && defined(OFFLOAD_CONFIG_YAML_ENABLED)
    ,
#endif
#ifdef OFFLOAD_CONFIG_YAML_ENABLED
    YamlBackend
#endif
    >;
#endif

#ifdef OFFLOAD_CONFIG_INI_ENABLED
using IniConfig = Config<IniBackend>;
#endif
#ifdef OFFLOAD_CONFIG_JSON_ENABLED
using JsonConfig = Config<JsonBackend>;
#endif
#ifdef OFFLOAD_CONFIG_YAML_ENABLED
using YamlConfig = Config<YamlBackend>;
#endif

// ============================================================================
// Pool / log settings
// ============================================================================

namespace detail {

/// Absent key leaves @p out untouched. @p min_value bounds accepted values.
inline bool ReadUint(const ConfigStore& store, const char* section, const char* key,
                     int64_t min_value, uint32_t& out) {
  if (!store.HasKey(section, key)) {
    return true;
  }
  int64_t v = 0;
  const char* text = store.GetString(section, key);
  if (!ParseInt64(text, v) || v < min_value || v > static_cast<int64_t>(UINT32_MAX)) {
    OFFLOAD_LOG_WARN("Config", "[%s] %s = '%s' is out of range", section, key, text);
    return false;
  }
  out = static_cast<uint32_t>(v);
  return true;
}

}  // namespace detail

/**
 * @brief Build a WorkerPoolConfig from @p section of @p store.
 *
 * Missing keys keep their defaults. Non-numeric values, a worker count or
 * queue capacity below 1, or negative drain cap / timeout yield
 * ConfigError::kInvalidValue.
 */
inline expected<WorkerPoolConfig, ConfigError> LoadPoolConfig(const ConfigStore& store,
                                                              const char* section = "pool") {
  WorkerPoolConfig cfg;
  if (store.HasKey(section, "name")) {
    cfg.name = store.GetString(section, "name");
  }
  const bool ok = detail::ReadUint(store, section, "workers", 1, cfg.worker_num) &&
                  detail::ReadUint(store, section, "queue_capacity", 1, cfg.queue_capacity) &&
                  detail::ReadUint(store, section, "drain_cap", 0, cfg.drain_cap) &&
                  detail::ReadUint(store, section, "shutdown_timeout_ms", 0,
                                   cfg.shutdown_timeout_ms);
  if (!ok) {
    return expected<WorkerPoolConfig, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<WorkerPoolConfig, ConfigError>::success(cfg);
}

/**
 * @brief Apply "level" from @p section to the logger, if present.
 * @return false if the key is absent.
 */
inline bool ApplyLogConfig(const ConfigStore& store, const char* section = "log") {
  if (!store.HasKey(section, "level")) {
    return false;
  }
  log::SetLevel(log::ParseLevel(store.GetString(section, "level")));
  return true;
}

}  // namespace offload

#endif  // OFFLOAD_CONFIG_HPP_
