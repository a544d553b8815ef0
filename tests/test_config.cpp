/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - settings store, format backends, driver config.
 */

#include "iodrv/config.hpp"

#include <catch2/catch.hpp>

#include <cstdio>
#include <cstring>
#include <thread>

// ============================================================================
// SettingsStore
// ============================================================================

TEST_CASE("SettingsStore typed getters", "[config]") {
  iodrv::SettingsStore store;
  REQUIRE(store.Set("storage", "driver-threads", "8"));
  REQUIRE(store.Set("storage", "driver-name", "s3"));
  REQUIRE(store.Set("flags", "verbose", "yes"));
  REQUIRE(store.Set("flags", "quiet", "off"));
  REQUIRE(store.Set("load", "rate", "12.5"));

  REQUIRE(store.GetInt("storage", "driver-threads") == 8);
  REQUIRE(store.GetInt("Storage", "DRIVER-THREADS") == 8);
  REQUIRE(std::strcmp(store.GetString("storage", "driver-name"), "s3") == 0);
  REQUIRE(std::strcmp(store.GetString("x", "y", "default"), "default") == 0);
  REQUIRE(store.GetBool("flags", "verbose"));
  REQUIRE_FALSE(store.GetBool("flags", "quiet", true));
  REQUIRE(store.GetBool("flags", "missing", true));
  REQUIRE(store.GetDouble("load", "rate") == 12.5);
  REQUIRE(store.GetInt("x", "y", 42) == 42);
  REQUIRE(store.HasKey("storage", "driver-name"));
  REQUIRE(store.EntryCount() == 5U);

  REQUIRE(store.Set("storage", "driver-threads", "16"));
  REQUIRE(store.GetInt("storage", "driver-threads") == 16);
  REQUIRE(store.EntryCount() == 5U);
}

TEST_CASE("SettingsStore strict integer lookup", "[config]") {
  iodrv::SettingsStore store;
  REQUIRE(store.Set("load", "batch-size", "64k"));

  auto missing = store.FindInt("load", "limit");
  REQUIRE(missing.get_error() == iodrv::ConfigError::kKeyNotFound);

  auto bad = store.FindInt("load", "batch-size");
  REQUIRE(bad.get_error() == iodrv::ConfigError::kInvalidValue);
  REQUIRE(store.GetInt("load", "batch-size", 7) == 7);
}

TEST_CASE("SettingsStore table capacity", "[config]") {
  iodrv::SettingsStore store;
  char key[16];
  for (uint32_t i = 0U; i < iodrv::SettingsStore::kMaxEntries; ++i) {
    (void)std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v"));
  }
  REQUIRE_FALSE(store.Set("s", "one-more", "v"));
  REQUIRE(store.Set("s", "k0", "overwrite"));
}

TEST_CASE("SettingsStore command-line overrides", "[config]") {
  iodrv::SettingsStore store;

  SECTION("section is split at the first dash") {
    const char* argv[] = {"prog", "--storage-driver-threads=4", "positional",
                          "--load-batch-size=32"};
    auto r = store.ApplyArgs(4, argv);
    REQUIRE(r.has_value());
    REQUIRE(r.value() == 2U);
    REQUIRE(store.GetInt("storage", "driver-threads") == 4);
    REQUIRE(store.GetInt("load", "batch-size") == 32);
  }

  SECTION("malformed flags are rejected") {
    const char* no_value[] = {"prog", "--storage-driver-threads"};
    REQUIRE(store.ApplyArgs(2, no_value).get_error() == iodrv::ConfigError::kParseError);

    const char* no_key[] = {"prog", "--storage=1"};
    REQUIRE(store.ApplyArgs(2, no_key).get_error() == iodrv::ConfigError::kParseError);
  }
}

// ============================================================================
// LoadDriverConfig
// ============================================================================

TEST_CASE("LoadDriverConfig defaults", "[config][driver]") {
  iodrv::SettingsStore store;
  auto r = iodrv::LoadDriverConfig(store);
  REQUIRE(r.has_value());

  const uint32_t hw = std::thread::hardware_concurrency();
  REQUIRE(r.value().worker_count == (hw > 0U ? hw : 1U));
  REQUIRE(r.value().input_queue_capacity == 1000U);
  REQUIRE(r.value().output_queue_capacity == 1000000U);
  REQUIRE(r.value().batch_size == 4096U);
  REQUIRE(r.value().name == "driver");
}

TEST_CASE("LoadDriverConfig reads storage and load sections", "[config][driver]") {
  iodrv::SettingsStore store;
  REQUIRE(store.Set("storage", "driver-name", "fs"));
  REQUIRE(store.Set("storage", "driver-threads", "2"));
  REQUIRE(store.Set("storage", "driver-limit-queue-input", "10"));
  REQUIRE(store.Set("storage", "driver-limit-queue-output", "40"));
  REQUIRE(store.Set("load", "batch-size", "4"));

  auto r = iodrv::LoadDriverConfig(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().name == "fs");
  REQUIRE(r.value().worker_count == 2U);
  REQUIRE(r.value().input_queue_capacity == 10U);
  REQUIRE(r.value().output_queue_capacity == 40U);
  REQUIRE(r.value().batch_size == 4U);
}

TEST_CASE("LoadDriverConfig rejects invalid values", "[config][driver]") {
  iodrv::SettingsStore store;

  SECTION("zero") {
    REQUIRE(store.Set("load", "batch-size", "0"));
    REQUIRE(iodrv::LoadDriverConfig(store).get_error() == iodrv::ConfigError::kInvalidValue);
  }

  SECTION("negative") {
    REQUIRE(store.Set("storage", "driver-threads", "-1"));
    REQUIRE(iodrv::LoadDriverConfig(store).get_error() == iodrv::ConfigError::kInvalidValue);
  }

  SECTION("not a number") {
    REQUIRE(store.Set("storage", "driver-limit-queue-input", "lots"));
    REQUIRE(iodrv::LoadDriverConfig(store).get_error() == iodrv::ConfigError::kInvalidValue);
  }
}

// ============================================================================
// INI Backend Tests
// ============================================================================

#ifdef IODRV_CONFIG_INI_ENABLED

using IniSettings = iodrv::Settings<iodrv::IniBackend>;

TEST_CASE("INI LoadBuffer into driver config", "[config][ini]") {
  const char* ini_data =
      "[storage]\n"
      "driver-name = s3\n"
      "driver-threads = 3\n"
      "[load]\n"
      "batch-size = 128\n";

  IniSettings settings;
  auto result = settings.LoadBuffer(ini_data, static_cast<uint32_t>(std::strlen(ini_data)),
                                    iodrv::ConfigFormat::kIni);
  REQUIRE(result.has_value());

  auto cfg = iodrv::LoadDriverConfig(settings);
  REQUIRE(cfg.has_value());
  REQUIRE(cfg.value().name == "s3");
  REQUIRE(cfg.value().worker_count == 3U);
  REQUIRE(cfg.value().batch_size == 128U);
}

TEST_CASE("INI LoadFile", "[config][ini]") {
  const char* path = "/tmp/iodrv_test_config.ini";
  FILE* f = std::fopen(path, "w");
  REQUIRE(f != nullptr);
  (void)std::fputs("[storage]\ndriver-limit-queue-input = 77\n", f);
  (void)std::fclose(f);

  IniSettings settings;
  REQUIRE(settings.LoadFile(path).has_value());
  REQUIRE(settings.GetInt("storage", "driver-limit-queue-input") == 77);
  (void)std::remove(path);
}

TEST_CASE("INI missing file", "[config][ini]") {
  IniSettings settings;
  auto r = settings.LoadFile("/nonexistent/iodrv.ini");
  REQUIRE(r.get_error() == iodrv::ConfigError::kFileNotFound);
}

#endif  // IODRV_CONFIG_INI_ENABLED

// ============================================================================
// JSON Backend Tests
// ============================================================================

#ifdef IODRV_CONFIG_JSON_ENABLED

using JsonSettings = iodrv::Settings<iodrv::JsonBackend>;

TEST_CASE("JSON LoadBuffer sections", "[config][json]") {
  const char* json_data =
      R"({"storage": {"driver-name": "fs", "driver-threads": 6}, "load": {"batch-size": 16}})";

  JsonSettings settings;
  auto result = settings.LoadBuffer(json_data, static_cast<uint32_t>(std::strlen(json_data)),
                                    iodrv::ConfigFormat::kJson);
  REQUIRE(result.has_value());
  REQUIRE(std::strcmp(settings.GetString("storage", "driver-name"), "fs") == 0);
  REQUIRE(settings.GetInt("storage", "driver-threads") == 6);
  REQUIRE(settings.GetInt("load", "batch-size") == 16);
}

TEST_CASE("JSON parse error", "[config][json]") {
  const char* bad = "{ not json";
  JsonSettings settings;
  auto r = settings.LoadBuffer(bad, static_cast<uint32_t>(std::strlen(bad)),
                               iodrv::ConfigFormat::kJson);
  REQUIRE(r.get_error() == iodrv::ConfigError::kParseError);
}

#endif  // IODRV_CONFIG_JSON_ENABLED

// ============================================================================
// YAML Backend Tests
// ============================================================================

#ifdef IODRV_CONFIG_YAML_ENABLED

using YamlSettings = iodrv::Settings<iodrv::YamlBackend>;

TEST_CASE("YAML LoadBuffer sections", "[config][yaml]") {
  const char* yaml_data =
      "storage:\n"
      "  driver-threads: 5\n"
      "  driver-name: swift\n"
      "load:\n"
      "  batch-size: 256\n";

  YamlSettings settings;
  auto result = settings.LoadBuffer(yaml_data, static_cast<uint32_t>(std::strlen(yaml_data)),
                                    iodrv::ConfigFormat::kYaml);
  REQUIRE(result.has_value());
  REQUIRE(settings.GetInt("storage", "driver-threads") == 5);
  REQUIRE(std::strcmp(settings.GetString("storage", "driver-name"), "swift") == 0);
  REQUIRE(settings.GetInt("load", "batch-size") == 256);
}

#endif  // IODRV_CONFIG_YAML_ENABLED

// ============================================================================
// Format dispatch
// ============================================================================

TEST_CASE("Settings rejects a format it was not composed with", "[config]") {
  iodrv::Settings<iodrv::IniBackend> settings;
  const char* json_data = "{}";
  auto r = settings.LoadBuffer(json_data, 2U, iodrv::ConfigFormat::kJson);
  REQUIRE(r.get_error() == iodrv::ConfigError::kFormatNotSupported);
}
