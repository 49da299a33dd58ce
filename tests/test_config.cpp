/**
 * @file test_config.cpp
 * @brief Tests for config.hpp - multi-format reader and bus option loading.
 */

#include "ebus/config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include <unistd.h>

namespace {

std::string WriteTemp(const char* suffix, const char* text) {
  char path[64];
  std::snprintf(path, sizeof(path), "/tmp/ebus_cfg_XXXXXX%s", suffix);
  const int fd = ::mkstemps(path, static_cast<int>(std::strlen(suffix)));
  REQUIRE(fd >= 0);
  const size_t len = std::strlen(text);
  REQUIRE(::write(fd, text, len) == static_cast<ssize_t>(len));
  ::close(fd);
  return path;
}

}  // namespace

// ============================================================================
// ConfigStore
// ============================================================================

TEST_CASE("ConfigStore typed getters", "[config]") {
  ebus::ConfigStore store;
  REQUIRE(store.Set("net", "port", "5090"));
  REQUIRE(store.Set("net", "ratio", "0.25"));
  REQUIRE(store.Set("net", "name", "bus0"));
  REQUIRE(store.Set("flags", "debug", "yes"));
  REQUIRE(store.Set("flags", "quiet", "off"));

  REQUIRE(store.GetInt("net", "port") == 5090);
  REQUIRE(store.GetInt("NET", "PORT") == 5090);
  REQUIRE(store.GetDouble("net", "ratio") == 0.25);
  REQUIRE(std::strcmp(store.GetString("net", "name"), "bus0") == 0);
  REQUIRE(store.GetBool("flags", "debug"));
  REQUIRE_FALSE(store.GetBool("flags", "quiet", true));

  REQUIRE(store.GetInt("net", "name", 7) == 7);
  REQUIRE_FALSE(store.FindInt("net", "ratio").has_value());
  REQUIRE(std::strcmp(store.GetString("x", "y", "dflt"), "dflt") == 0);
  REQUIRE(store.HasSection("flags"));
  REQUIRE_FALSE(store.HasSection("missing"));
  REQUIRE(store.EntryCount() == 5U);

  REQUIRE(store.Set("net", "port", "6000"));
  REQUIRE(store.GetInt("net", "port") == 6000);
  REQUIRE(store.EntryCount() == 5U);
}

TEST_CASE("ConfigStore entry limit", "[config]") {
  ebus::ConfigStore store;
  char key[32];
  for (uint32_t i = 0; i < EBUS_CONFIG_MAX_ENTRIES; ++i) {
    std::snprintf(key, sizeof(key), "k%u", i);
    REQUIRE(store.Set("s", key, "v"));
  }
  REQUIRE_FALSE(store.Set("s", "overflow", "v"));
  REQUIRE(store.Set("s", "k0", "updated"));
}

// ============================================================================
// Bus options
// ============================================================================

TEST_CASE("LoadBusOptions defaults", "[config][options]") {
  ebus::ConfigStore store;
  auto r = ebus::LoadBusOptions(store);
  REQUIRE(r.has_value());
  REQUIRE(r.value().address == "session");
  REQUIRE(r.value().mode == ebus::OpenMode::kBus);
  REQUIRE(r.value().call_timeout_ms == -1);
  REQUIRE(r.value().idle_poll_ms == 4000);
  REQUIRE(r.value().log_level == ebus::log::Level::kInfo);
}

TEST_CASE("LoadBusOptions reads every key", "[config][options]") {
  ebus::ConfigStore store;
  store.Set("bus", "address", "unix:path=/tmp/ebus.sock");
  store.Set("bus", "mode", "PEER");
  store.Set("bus", "call_timeout_ms", "2500");
  store.Set("reactor", "idle_poll_ms", "100");
  store.Set("log", "level", "warning");

  auto r = ebus::LoadBusOptions(store);
  REQUIRE(r.has_value());
  const ebus::BusOptions& opts = r.value();
  REQUIRE(opts.address == "unix:path=/tmp/ebus.sock");
  REQUIRE(opts.mode == ebus::OpenMode::kPeer);
  REQUIRE(opts.call_timeout_ms == 2500);
  REQUIRE(opts.ReactorConfig().idle_poll_ms == 100);
  REQUIRE(opts.log_level == ebus::log::Level::kWarn);

  auto prev = ebus::log::GetLevel();
  ebus::ApplyLogLevel(opts);
  REQUIRE(ebus::log::GetLevel() == ebus::log::Level::kWarn);
  ebus::log::SetLevel(prev);
}

TEST_CASE("LoadBusOptions rejects bad values", "[config][options]") {
  SECTION("mode") {
    ebus::ConfigStore store;
    store.Set("bus", "mode", "mesh");
    auto r = ebus::LoadBusOptions(store);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == ebus::ConfigError::kParseError);
  }
  SECTION("timeout") {
    ebus::ConfigStore store;
    store.Set("bus", "call_timeout_ms", "soon");
    auto r = ebus::LoadBusOptions(store);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == ebus::ConfigError::kParseError);
  }
  SECTION("level") {
    ebus::ConfigStore store;
    store.Set("log", "level", "chatty");
    auto r = ebus::LoadBusOptions(store);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.get_error() == ebus::ConfigError::kParseError);
  }
}

TEST_CASE("ParseLogLevel names", "[config][options]") {
  REQUIRE(ebus::ParseLogLevel("debug").value() == ebus::log::Level::kDebug);
  REQUIRE(ebus::ParseLogLevel("INFO").value() == ebus::log::Level::kInfo);
  REQUIRE(ebus::ParseLogLevel("Error").value() == ebus::log::Level::kError);
  REQUIRE(ebus::ParseLogLevel("off").value() == ebus::log::Level::kOff);
  REQUIRE_FALSE(ebus::ParseLogLevel("trace").has_value());
}

// ============================================================================
// INI Backend
// ============================================================================

#ifdef EBUS_CONFIG_INI_ENABLED

TEST_CASE("INI LoadBuffer feeds bus options", "[config][ini]") {
  ebus::IniConfig cfg;
  auto r = cfg.LoadBuffer(
      "[bus]\n"
      "address = system\n"
      "call_timeout_ms = 1000\n"
      "[log]\n"
      "level = error\n",
      ebus::ConfigFormat::kIni);
  REQUIRE(r.has_value());
  auto opts = ebus::LoadBusOptions(cfg);
  REQUIRE(opts.has_value());
  REQUIRE(opts.value().address == "system");
  REQUIRE(opts.value().call_timeout_ms == 1000);
  REQUIRE(opts.value().log_level == ebus::log::Level::kError);
}

TEST_CASE("INI LoadFile by extension", "[config][ini]") {
  const std::string path = WriteTemp(".ini", "[reactor]\nidle_poll_ms = 50\n");
  ebus::IniConfig cfg;
  REQUIRE(cfg.LoadFile(path.c_str()).has_value());
  REQUIRE(cfg.GetInt("reactor", "idle_poll_ms") == 50);
  std::remove(path.c_str());
}

#endif

// ============================================================================
// JSON Backend
// ============================================================================

#ifdef EBUS_CONFIG_JSON_ENABLED

TEST_CASE("JSON LoadBuffer flattens sections", "[config][json]") {
  ebus::JsonConfig cfg;
  auto r = cfg.LoadBuffer(
      R"({"bus": {"address": "session", "mode": "bus", "call_timeout_ms": 750},
          "reactor": {"idle_poll_ms": 20, "verbose": true},
          "name": "top"})",
      ebus::ConfigFormat::kJson);
  REQUIRE(r.has_value());
  REQUIRE(cfg.GetInt("bus", "call_timeout_ms") == 750);
  REQUIRE(cfg.GetBool("reactor", "verbose"));
  REQUIRE(std::strcmp(cfg.GetString("", "name"), "top") == 0);

  auto opts = ebus::LoadBusOptions(cfg);
  REQUIRE(opts.has_value());
  REQUIRE(opts.value().call_timeout_ms == 750);
  REQUIRE(opts.value().idle_poll_ms == 20);
}

TEST_CASE("JSON malformed input", "[config][json]") {
  ebus::JsonConfig cfg;
  auto r = cfg.LoadBuffer("{\"bus\": ", ebus::ConfigFormat::kJson);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ebus::ConfigError::kParseError);

  auto arr = cfg.LoadBuffer("[1, 2]", ebus::ConfigFormat::kJson);
  REQUIRE_FALSE(arr.has_value());
}

TEST_CASE("JSON LoadFile", "[config][json]") {
  const std::string path =
      WriteTemp(".json", R"({"log": {"level": "debug"}})");
  ebus::JsonConfig cfg;
  REQUIRE(cfg.LoadFile(path.c_str()).has_value());
  REQUIRE(std::strcmp(cfg.GetString("log", "level"), "debug") == 0);
  std::remove(path.c_str());

  auto missing = cfg.LoadFile("/nonexistent/ebus.json");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.get_error() == ebus::ConfigError::kFileNotFound);
}

TEST_CASE("Config rejects formats without a backend", "[config][json]") {
  ebus::JsonConfig cfg;
  auto r = cfg.LoadBuffer("[bus]\n", ebus::ConfigFormat::kIni);
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.get_error() == ebus::ConfigError::kFormatNotSupported);
}

#endif

// ============================================================================
// YAML Backend
// ============================================================================

#ifdef EBUS_CONFIG_YAML_ENABLED

TEST_CASE("YAML LoadBuffer flattens sections", "[config][yaml]") {
  ebus::YamlConfig cfg;
  auto r = cfg.LoadBuffer(
      "bus:\n"
      "  mode: peer\n"
      "  address: unix:path=/tmp/x\n"
      "log:\n"
      "  level: info\n",
      ebus::ConfigFormat::kYaml);
  REQUIRE(r.has_value());
  auto opts = ebus::LoadBusOptions(cfg);
  REQUIRE(opts.has_value());
  REQUIRE(opts.value().mode == ebus::OpenMode::kPeer);
  REQUIRE(opts.value().address == "unix:path=/tmp/x");
}

#endif
