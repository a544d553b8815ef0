/**
 * @file config.hpp
 * @brief Settings store, format backends and the driver configuration loader.
 *
 * Design:
 *   - SettingsStore : flat "section + key = value" table with typed getters
 *   - Backend tags  : IniBackend / JsonBackend / YamlBackend
 *   - SettingsParser<Backend> : one specialization per enabled format
 *   - Settings<Backends...>   : compile-time composed reader (file or buffer)
 *   - LoadDriverConfig()      : settings -> validated DriverConfig
 *
 * Backends are opt-in (CMake options):
 *   - IniBackend  : inih          (IODRV_CONFIG_INI_ENABLED)
 *   - JsonBackend : nlohmann/json (IODRV_CONFIG_JSON_ENABLED)
 *   - YamlBackend : fkYAML        (IODRV_CONFIG_YAML_ENABLED)
 *
 * Command-line overrides use the same flat model, with the first dash
 * separating section from key:
 *   --storage-driver-threads=8   ->  [storage] driver-threads = 8
 *   --load-batch-size=64         ->  [load]    batch-size = 64
 *
 * Usage:
 * @code
 *   iodrv::Settings<iodrv::IniBackend> settings;
 *   settings.LoadFile("driver.ini");
 *   settings.ApplyArgs(argc, argv);
 *   auto cfg = iodrv::LoadDriverConfig(settings);
 * @endcode
 */

#ifndef IODRV_CONFIG_HPP_
#define IODRV_CONFIG_HPP_

#include "iodrv/log.hpp"
#include "iodrv/platform.hpp"
#include "iodrv/vocabulary.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <string>
#include <thread>
#include <tuple>

#ifdef IODRV_CONFIG_INI_ENABLED
#include <ini.h>
#endif

#ifdef IODRV_CONFIG_JSON_ENABLED
#include <nlohmann/json.hpp>
#endif

#ifdef IODRV_CONFIG_YAML_ENABLED
#include <fkYAML/node.hpp>
#endif

namespace iodrv {

// ============================================================================
// Errors and formats
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kKeyNotFound,
  kInvalidValue
};

inline const char* ConfigErrorName(ConfigError err) noexcept {
  switch (err) {
    case ConfigError::kFileNotFound:       return "file not found";
    case ConfigError::kParseError:         return "parse error";
    case ConfigError::kFormatNotSupported: return "format not supported";
    case ConfigError::kBufferFull:         return "too many entries";
    case ConfigError::kKeyNotFound:        return "key not found";
    case ConfigError::kInvalidValue:       return "invalid value";
  }
  return "unknown";
}

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
    if (la != lb) return false;
    ++a;
    ++b;
  }
  return *a == *b;
}

inline const char* FileExtension(const char* path) noexcept {
  const char* dot = std::strrchr(path, '.');
  const char* slash = std::strrchr(path, '/');
  if (dot == nullptr || (slash != nullptr && dot < slash)) return nullptr;
  return dot + 1;
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
  static bool MatchesExtension(const char* ext) noexcept { return detail::CaseEqual(ext, "json"); }
};

struct YamlBackend {
  static constexpr ConfigFormat kFormat = ConfigFormat::kYaml;
  static bool MatchesExtension(const char* ext) noexcept {
    return detail::CaseEqual(ext, "yaml") || detail::CaseEqual(ext, "yml");
  }
};

// ============================================================================
// SettingsStore
// ============================================================================

#ifndef IODRV_CONFIG_MAX_FILE_SIZE
#define IODRV_CONFIG_MAX_FILE_SIZE 8192U
#endif

/**
 * @brief Fixed-capacity section/key/value table.
 *
 * Lookups are case-insensitive. Setting an existing key overwrites it, so
 * later sources (files loaded later, command-line overrides) win.
 */
class SettingsStore {
 public:
  static constexpr uint32_t kMaxEntries = 64U;
  static constexpr uint32_t kMaxNameLen = 48U;
  static constexpr uint32_t kMaxValueLen = 128U;

  const char* GetString(const char* section, const char* key, const char* default_val = "") const {
    const Entry* e = FindEntry(section, key);
    return (e != nullptr) ? e->value.c_str() : default_val;
  }

  int32_t GetInt(const char* section, const char* key, int32_t default_val = 0) const {
    auto r = FindInt(section, key);
    return r.has_value() ? r.value() : default_val;
  }

  bool GetBool(const char* section, const char* key, bool default_val = false) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    const char* v = e->value.c_str();
    return detail::CaseEqual(v, "true") || detail::CaseEqual(v, "1") ||
           detail::CaseEqual(v, "yes") || detail::CaseEqual(v, "on");
  }

  double GetDouble(const char* section, const char* key, double default_val = 0.0) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) return default_val;
    char* end = nullptr;
    const double val = std::strtod(e->value.c_str(), &end);
    return (end == e->value.c_str()) ? default_val : val;
  }

  /**
   * @brief Strict integer lookup.
   * @return kKeyNotFound if absent, kInvalidValue if not a whole integer.
   */
  expected<int32_t, ConfigError> FindInt(const char* section, const char* key) const {
    const Entry* e = FindEntry(section, key);
    if (e == nullptr) {
      return expected<int32_t, ConfigError>::error(ConfigError::kKeyNotFound);
    }
    const char* begin = e->value.c_str();
    char* end = nullptr;
    const long val = std::strtol(begin, &end, 10);
    if (end == begin || *end != '\0' || val > INT32_MAX || val < INT32_MIN) {
      return expected<int32_t, ConfigError>::error(ConfigError::kInvalidValue);
    }
    return expected<int32_t, ConfigError>::success(static_cast<int32_t>(val));
  }

  /// @brief Insert or overwrite one value. Returns false when the table is full.
  bool Set(const char* section, const char* key, const char* value) {
    IODRV_ASSERT(section != nullptr && key != nullptr);
    Entry* e = FindMutable(section, key);
    if (e != nullptr) {
      e->value.assign(TruncateToCapacity, value);
      return true;
    }
    if (count_ >= kMaxEntries) return false;
    Entry& slot = entries_[count_];
    slot.section.assign(TruncateToCapacity, section);
    slot.key.assign(TruncateToCapacity, key);
    slot.value.assign(TruncateToCapacity, value);
    ++count_;
    return true;
  }

  /**
   * @brief Apply "--section-key=value" overrides.
   *
   * Arguments not starting with "--" are skipped.
   * @return Number of overrides applied, or kParseError on a malformed flag.
   */
  expected<uint32_t, ConfigError> ApplyArgs(int argc, const char* const* argv) {
    uint32_t applied = 0U;
    for (int i = 1; i < argc; ++i) {
      const char* arg = argv[i];
      if (arg == nullptr || std::strncmp(arg, "--", 2) != 0) continue;
      const char* name = arg + 2;
      const char* eq = std::strchr(name, '=');
      const char* dash = std::strchr(name, '-');
      if (eq == nullptr || dash == nullptr || dash > eq || dash == name || dash + 1 == eq) {
        IODRV_LOG_WARN("Config", "malformed override: %s", arg);
        return expected<uint32_t, ConfigError>::error(ConfigError::kParseError);
      }
      const std::string section(name, static_cast<size_t>(dash - name));
      const std::string key(dash + 1, static_cast<size_t>(eq - dash - 1));
      if (!Set(section.c_str(), key.c_str(), eq + 1)) {
        return expected<uint32_t, ConfigError>::error(ConfigError::kBufferFull);
      }
      ++applied;
    }
    return expected<uint32_t, ConfigError>::success(applied);
  }

  bool HasKey(const char* section, const char* key) const { return FindEntry(section, key) != nullptr; }

  uint32_t EntryCount() const noexcept { return count_; }

 protected:
  struct Entry {
    FixedString<kMaxNameLen> section;
    FixedString<kMaxNameLen> key;
    FixedString<kMaxValueLen> value;
  };

  static expected<uint32_t, ConfigError> ReadFile(const char* path, char* buf, uint32_t size) {
    FILE* f = std::fopen(path, "r");
    if (f == nullptr) {
      return expected<uint32_t, ConfigError>::error(ConfigError::kFileNotFound);
    }
    const size_t bytes = std::fread(buf, 1, size - 1U, f);
    (void)std::fclose(f);
    buf[bytes] = '\0';
    return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(bytes));
  }

 private:
  const Entry* FindEntry(const char* section, const char* key) const {
    for (uint32_t i = 0U; i < count_; ++i) {
      if (detail::CaseEqual(entries_[i].section.c_str(), section) &&
          detail::CaseEqual(entries_[i].key.c_str(), key)) {
        return &entries_[i];
      }
    }
    return nullptr;
  }

  Entry* FindMutable(const char* section, const char* key) {
    return const_cast<Entry*>(static_cast<const SettingsStore*>(this)->FindEntry(section, key));
  }

  Entry entries_[kMaxEntries];
  uint32_t count_{0U};

  template <typename>
  friend struct SettingsParser;
};

// ============================================================================
// SettingsParser<Backend>
// ============================================================================

/** Backends compiled out report kFormatNotSupported. */
template <typename Backend>
struct SettingsParser {
  static expected<void, ConfigError> ParseFile(SettingsStore&, const char*) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
  static expected<void, ConfigError> ParseBuffer(SettingsStore&, const char*, uint32_t) {
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }
};

#ifdef IODRV_CONFIG_INI_ENABLED
template <>
struct SettingsParser<IniBackend> {
  static expected<void, ConfigError> ParseFile(SettingsStore& store, const char* path) {
    const int rc = ini_parse(path, &OnEntry, &store);
    if (rc == -1) return expected<void, ConfigError>::error(ConfigError::kFileNotFound);
    if (rc != 0) return expected<void, ConfigError>::error(ConfigError::kParseError);
    return expected<void, ConfigError>::success();
  }

  static expected<void, ConfigError> ParseBuffer(SettingsStore& store, const char* data,
                                                 uint32_t /*size*/) {
    if (ini_parse_string(data, &OnEntry, &store) != 0) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static int OnEntry(void* user, const char* section, const char* name, const char* value) {
    auto* store = static_cast<SettingsStore*>(user);
    return store->Set(section != nullptr ? section : "", name != nullptr ? name : "",
                      value != nullptr ? value : "")
               ? 1
               : 0;
  }
};
#endif

#ifdef IODRV_CONFIG_JSON_ENABLED
template <>
struct SettingsParser<JsonBackend> {
  static expected<void, ConfigError> ParseFile(SettingsStore& store, const char* path) {
    char buf[IODRV_CONFIG_MAX_FILE_SIZE];
    auto r = SettingsStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(SettingsStore& store, const char* data,
                                                 uint32_t size) {
    auto root = nlohmann::json::parse(data, data + size, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      if (!sec->is_object()) {
        if (!store.Set("", sec.key().c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        if (!store.Set(sec.key().c_str(), kv.key().c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const nlohmann::json& node) {
    if (node.is_string()) return node.get<std::string>();
    return node.dump();
  }
};
#endif

#ifdef IODRV_CONFIG_YAML_ENABLED
template <>
struct SettingsParser<YamlBackend> {
  static expected<void, ConfigError> ParseFile(SettingsStore& store, const char* path) {
    char buf[IODRV_CONFIG_MAX_FILE_SIZE];
    auto r = SettingsStore::ReadFile(path, buf, sizeof(buf));
    if (!r.has_value()) return expected<void, ConfigError>::error(r.get_error());
    return ParseBuffer(store, buf, r.value());
  }

  static expected<void, ConfigError> ParseBuffer(SettingsStore& store, const char* data,
                                                 uint32_t size) {
    auto root = fkyaml::node::deserialize(std::string(data, size));
    if (!root.is_mapping()) {
      return expected<void, ConfigError>::error(ConfigError::kParseError);
    }
    for (auto sec = root.begin(); sec != root.end(); ++sec) {
      const auto section = sec.key().get_value<std::string>();
      if (!sec->is_mapping()) {
        if (!store.Set("", section.c_str(), Scalar(*sec).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
        continue;
      }
      for (auto kv = sec->begin(); kv != sec->end(); ++kv) {
        const auto key = kv.key().get_value<std::string>();
        if (!store.Set(section.c_str(), key.c_str(), Scalar(*kv).c_str())) {
          return expected<void, ConfigError>::error(ConfigError::kBufferFull);
        }
      }
    }
    return expected<void, ConfigError>::success();
  }

 private:
  static std::string Scalar(const fkyaml::node& node) {
    if (node.is_string()) return node.get_value<std::string>();
    if (node.is_boolean()) return node.get_value<bool>() ? "true" : "false";
    if (node.is_integer()) return std::to_string(node.get_value<int64_t>());
    if (node.is_float_number()) return std::to_string(node.get_value<double>());
    return std::string();
  }
};
#endif

// ============================================================================
// Settings<Backends...>
// ============================================================================

template <typename... Backends>
class Settings final : public SettingsStore {
  static_assert(sizeof...(Backends) > 0, "Settings requires at least one backend");

 public:
  expected<void, ConfigError> LoadFile(const char* path, ConfigFormat format = ConfigFormat::kAuto) {
    IODRV_ASSERT(path != nullptr);
    if (format == ConfigFormat::kAuto) format = DetectFormat(path);
    return DispatchFile<Backends...>(path, format);
  }

  expected<void, ConfigError> LoadBuffer(const char* data, uint32_t size, ConfigFormat format) {
    IODRV_ASSERT(data != nullptr);
    return DispatchBuffer<Backends...>(data, size, format);
  }

 private:
  using Head = typename std::tuple_element<0, std::tuple<Backends...>>::type;

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchFile(const char* path, ConfigFormat format) {
    if (First::kFormat == format) return SettingsParser<First>::ParseFile(*this, path);
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchFile<Rest...>(path, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  template <typename First, typename... Rest>
  expected<void, ConfigError> DispatchBuffer(const char* data, uint32_t size, ConfigFormat format) {
    if (First::kFormat == format) return SettingsParser<First>::ParseBuffer(*this, data, size);
    if constexpr (sizeof...(Rest) > 0) {
      return DispatchBuffer<Rest...>(data, size, format);
    }
    return expected<void, ConfigError>::error(ConfigError::kFormatNotSupported);
  }

  ConfigFormat DetectFormat(const char* path) const noexcept {
    const char* ext = detail::FileExtension(path);
    return (ext == nullptr) ? Head::kFormat : DetectExt<Backends...>(ext);
  }

  template <typename First, typename... Rest>
  ConfigFormat DetectExt(const char* ext) const noexcept {
    if (First::MatchesExtension(ext)) return First::kFormat;
    if constexpr (sizeof...(Rest) > 0) {
      return DetectExt<Rest...>(ext);
    }
    return Head::kFormat;
  }
};

// ============================================================================
// DriverConfig
// ============================================================================

/// Above this many potentially buffered operations the driver warns about memory.
static constexpr uint64_t kBatchModeInputOpCountLimit = 1000000U;

/**
 * @brief Capacity parameters of a storage driver.
 *
 * input_queue_capacity * batch_size is the number of operations that may
 * sit in the driver at once; it should fit output_queue_capacity (results
 * handling downstream) and stay below kBatchModeInputOpCountLimit.
 */
struct DriverConfig {
  FixedString<32> name{"driver"};
  uint32_t worker_count{1U};
  uint32_t input_queue_capacity{1000U};
  uint32_t output_queue_capacity{1000000U};
  uint32_t batch_size{4096U};
};

namespace detail {

inline expected<uint32_t, ConfigError> ReadPositive(const SettingsStore& store, const char* section,
                                                    const char* key, uint32_t default_val) {
  auto r = store.FindInt(section, key);
  if (!r.has_value()) {
    if (r.get_error() == ConfigError::kKeyNotFound) {
      return expected<uint32_t, ConfigError>::success(default_val);
    }
    IODRV_LOG_ERROR("Config", "%s-%s: \"%s\" is not an integer", section, key,
                    store.GetString(section, key));
    return expected<uint32_t, ConfigError>::error(r.get_error());
  }
  if (r.value() <= 0) {
    IODRV_LOG_ERROR("Config", "%s-%s: %d must be positive", section, key, r.value());
    return expected<uint32_t, ConfigError>::error(ConfigError::kInvalidValue);
  }
  return expected<uint32_t, ConfigError>::success(static_cast<uint32_t>(r.value()));
}

}  // namespace detail

/**
 * @brief Build a DriverConfig from settings.
 *
 * Keys (missing keys take the DriverConfig defaults; worker count defaults
 * to the hardware concurrency):
 *   [storage] driver-name, driver-threads, driver-limit-queue-input,
 *             driver-limit-queue-output
 *   [load]    batch-size
 */
inline expected<DriverConfig, ConfigError> LoadDriverConfig(const SettingsStore& store) {
  DriverConfig cfg;
  const uint32_t hw = std::thread::hardware_concurrency();

  auto threads = detail::ReadPositive(store, "storage", "driver-threads", hw > 0U ? hw : 1U);
  if (!threads.has_value()) return expected<DriverConfig, ConfigError>::error(threads.get_error());
  auto in_queue = detail::ReadPositive(store, "storage", "driver-limit-queue-input",
                                       cfg.input_queue_capacity);
  if (!in_queue.has_value()) return expected<DriverConfig, ConfigError>::error(in_queue.get_error());
  auto out_queue = detail::ReadPositive(store, "storage", "driver-limit-queue-output",
                                        cfg.output_queue_capacity);
  if (!out_queue.has_value()) return expected<DriverConfig, ConfigError>::error(out_queue.get_error());
  auto batch = detail::ReadPositive(store, "load", "batch-size", cfg.batch_size);
  if (!batch.has_value()) return expected<DriverConfig, ConfigError>::error(batch.get_error());

  cfg.name.assign(TruncateToCapacity, store.GetString("storage", "driver-name", "driver"));
  cfg.worker_count = threads.value();
  cfg.input_queue_capacity = in_queue.value();
  cfg.output_queue_capacity = out_queue.value();
  cfg.batch_size = batch.value();
  return expected<DriverConfig, ConfigError>::success(cfg);
}

}  // namespace iodrv

#endif  // IODRV_CONFIG_HPP_
